#pragma once

#include "manifest/manifest.hpp"
#include "sandbox/correlation_id.hpp"
#include "sandbox/host_api_broker.hpp"
#include "sandbox/pending_requests.hpp"
#include "sandbox/permission_gate.hpp"
#include "sandbox/worker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pluginhost {

/**
 * @brief Sandbox lifecycle
 *
 * - UNINITIALIZED → INITIALIZING: initialize()
 * - INITIALIZING  → READY:        worker answered READY
 * - INITIALIZING  → TERMINATED:   spawn failure, bad entry point, init timeout
 * - READY         → TERMINATED:   terminate() or worker crash
 */
enum class SandboxState { UNINITIALIZED, INITIALIZING, READY, TERMINATED };

[[nodiscard]] const char* sandbox_state_to_string(SandboxState state);

struct SandboxOptions {
    std::filesystem::path worker_executable;
    std::chrono::milliseconds rpc_timeout{30000};
    std::chrono::milliseconds init_timeout{10000};
    std::chrono::milliseconds api_call_timeout{10000};
    uint32_t memory_limit_mb = 512;
    uint32_t cpu_limit_seconds = 0;
    // Fail initialization unless the worker reports every OS-level layer
    bool require_confinement = false;
};

/**
 * @brief Host-side handle for one plugin's isolated worker
 *
 * Owns the worker boundary, a frozen permission snapshot and the in-flight
 * request table. Threads:
 * - worker reader (inside IWorker): routes RESPONSE / API_CALL / EVENT / LOG
 * - dispatcher: serves API_CALLs so collaborator latency never blocks routing
 * - reaper: expires pending requests past their deadline
 */
class Sandbox {
public:
    using EventCallback = std::function<void(const std::string& plugin_id,
                                             const std::string& event,
                                             const nlohmann::json& data)>;

    Sandbox(PluginManifest manifest,
            SandboxOptions options,
            WorkerFactory worker_factory,
            HostServices services,
            EventCallback on_event = {});
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /**
     * @brief Spawn the worker and load the plugin's entry module
     * @throws PluginError(SANDBOX_INIT_FAILURE); the sandbox is TERMINATED afterwards
     */
    void initialize(const std::filesystem::path& plugin_dir, const nlohmann::json& config);

    /**
     * @brief Send {id, method, args} to the plugin
     *
     * The future resolves with the plugin's result or holds a PluginError
     * (TIMEOUT, WORKER_TERMINATED, PLUGIN_ERROR, PERMISSION_DENIED, ...).
     * @throws PluginError(NOT_AVAILABLE) if the sandbox is not READY
     */
    [[nodiscard]] std::future<nlohmann::json> execute(const std::string& method,
                                                      const nlohmann::json& args);

    /// execute() and wait; rethrows the call's PluginError
    nlohmann::json call(const std::string& method, const nlohmann::json& args);

    /// Kill the worker and reject every pending call with WORKER_TERMINATED
    void terminate();

    [[nodiscard]] SandboxState state() const;
    [[nodiscard]] size_t pending_count() const { return pending_.size(); }
    [[nodiscard]] std::optional<uint64_t> memory_usage() const;
    [[nodiscard]] const std::string& plugin_id() const { return manifest_.id; }
    [[nodiscard]] const PermissionGrants& permissions() const { return manifest_.permissions; }
    [[nodiscard]] std::string exit_reason() const;
    /// Worker's READY report of its OS-level layers (empty object before READY)
    [[nodiscard]] nlohmann::json confinement() const;

private:
    void on_message(protocol::Message msg);
    void on_worker_exit(const std::string& reason);
    void on_ready(const nlohmann::json& payload);
    void on_response(const nlohmann::json& payload);
    void on_log(const nlohmann::json& payload) const;

    void start_threads();
    void stop_threads();
    void reaper_loop(std::stop_token stoken);
    void dispatcher_loop(std::stop_token stoken);

    PluginManifest manifest_;
    SandboxOptions options_;
    WorkerFactory worker_factory_;
    HostServices services_;
    EventCallback on_event_;

    // Built by initialize() once the plugin root is known
    std::shared_ptr<const PermissionSnapshot> snapshot_;
    std::unique_ptr<HostApiBroker> broker_;

    mutable std::mutex state_mutex_;
    SandboxState state_ = SandboxState::UNINITIALIZED;
    std::shared_ptr<IWorker> worker_;
    std::string exit_reason_;
    nlohmann::json confinement_ = nlohmann::json::object();
    std::optional<std::promise<nlohmann::json>> ready_promise_;

    PendingRequestTable pending_;
    CorrelationIdGenerator ids_;

    // API_CALL queue served by the dispatcher thread
    std::mutex api_mutex_;
    std::condition_variable_any api_cv_;
    std::deque<nlohmann::json> api_queue_;

    std::mutex reaper_mutex_;
    std::condition_variable_any reaper_cv_;

    std::jthread reaper_;
    std::jthread dispatcher_;
};

} // namespace pluginhost
