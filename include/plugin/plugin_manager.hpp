#pragma once

#include "core/error.hpp"
#include "manifest/manifest.hpp"
#include "manifest/plugin_state.hpp"
#include "plugin/plugin_events.hpp"
#include "plugin/plugin_store.hpp"
#include "registry/registry_client.hpp"
#include "sandbox/sandbox.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pluginhost {

struct PluginManagerOptions {
    std::filesystem::path plugins_dir = "plugins";
    std::string host_version = "1.0.0";
    SandboxOptions sandbox;
};

/**
 * @brief Orchestrator for plugin lifecycle and execution
 *
 * Owns the installed set, drives install / uninstall / enable / disable /
 * update, persists PluginState and routes execute() to the right sandbox.
 *
 * Locking:
 * - map_mutex_ (shared_mutex) guards the id -> entry map
 * - one shared_mutex per plugin id: lifecycle operations hold it exclusively,
 *   execute() holds it shared, so an uninstall waits for in-flight calls
 * - Entry::state_mutex guards PluginState between concurrent executions
 * - Entry::persist_mutex orders state-file writes of one plugin
 *
 * Every public operation returns a Result; no exception escapes.
 */
class PluginManager {
public:
    using Listener = std::function<void(const PluginEvent&)>;

    PluginManager(PluginManagerOptions options,
                  std::shared_ptr<RegistryClient> registry,
                  WorkerFactory worker_factory,
                  HostServices services);
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    /**
     * @brief Startup recovery: load every persisted plugin and re-create its sandbox
     *
     * One plugin failing never stops the others. Plugins persisted as enabled
     * are re-enabled.
     * @return number of plugins registered
     */
    Result<size_t> load_installed();

    /// Resolve, download, extract, validate, initialize, persist. No residue on failure.
    Result<PluginState> install(const std::string& id, const std::optional<std::string>& version = std::nullopt);

    /// Idempotent: an unknown id succeeds without doing anything
    Status uninstall(const std::string& id);

    /// Failure is persisted (status=error) and returned
    Result<PluginState> enable(const std::string& id);

    /// Plugin cleanup failures are logged and swallowed
    Status disable(const std::string& id);

    /**
     * @brief Uninstall followed by install. NOT atomic: if the install fails
     *        the plugin stays removed and the error says so.
     */
    Result<PluginState> update(const std::string& id, const std::optional<std::string>& version = std::nullopt);

    Result<nlohmann::json> execute(const std::string& id, const std::string& method,
                                   const nlohmann::json& args);

    /// Manifests ordered by id
    [[nodiscard]] std::vector<PluginManifest> list_installed() const;

    [[nodiscard]] Result<PluginState> get_state(const std::string& id) const;

    Result<std::vector<PluginSummary>> search_registry(const std::string& query,
                                                       const SearchOptions& options = {});

    /// defaultConfig shallow-merged with persisted overrides
    [[nodiscard]] Result<nlohmann::json> get_plugin_config(const std::string& id) const;

    /// Shallow-merge `patch` (null removes an override); returns the effective config
    Result<nlohmann::json> set_plugin_config(const std::string& id, const nlohmann::json& patch);

    void add_listener(Listener listener);

    /// Most recent events, oldest first
    [[nodiscard]] std::vector<PluginEvent> recent_events() const;

    /// Terminate every sandbox; persisted state is left as is
    void shutdown();

    [[nodiscard]] const PluginStore& store() const { return store_; }

    /// Per-id lock slots currently alive (one per id with an operation in flight)
    [[nodiscard]] size_t id_lock_count() const;

private:
    struct Entry {
        PluginManifest manifest;
        std::unique_ptr<Sandbox> sandbox;   // replaced only under the id's exclusive lock

        mutable std::mutex state_mutex;
        PluginState state;

        std::mutex persist_mutex;   // acquired before state_mutex, never after
    };

    std::shared_ptr<std::shared_mutex> id_lock(const std::string& id);
    std::shared_ptr<Entry> find(const std::string& id) const;

    // Bodies run with the id's exclusive lock held
    PluginState install_locked(const std::string& id, const std::optional<std::string>& version);
    bool uninstall_locked(const std::string& id);
    PluginState enable_locked(const std::string& id, Entry& entry);
    void disable_locked(const std::string& id, Entry& entry);

    std::unique_ptr<Sandbox> start_sandbox(const PluginManifest& manifest, const nlohmann::json& config);
    void persist(const PluginState& state) const;
    bool persist_quietly(const PluginState& state) const;
    bool persist_entry(Entry& entry) const;

    static nlohmann::json effective_config(const PluginManifest& manifest, const PluginState& state);
    static void check_config_types(const PluginManifest& manifest, const nlohmann::json& patch);

    void emit(PluginEventType type, const std::string& plugin_id, nlohmann::json data = nlohmann::json::object());

    PluginManagerOptions options_;
    std::shared_ptr<RegistryClient> registry_;
    WorkerFactory worker_factory_;
    HostServices services_;
    PluginStore store_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    // Slots live only while some operation holds them
    mutable std::mutex id_locks_mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::shared_mutex>> id_locks_;

    mutable std::mutex events_mutex_;
    std::deque<PluginEvent> recent_events_;
    std::vector<Listener> listeners_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace pluginhost
