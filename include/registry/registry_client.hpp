#pragma once

#include "registry/registry_transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pluginhost {

/**
 * @brief Cached view of the plugin catalog
 *
 * Summaries are cached by id in catalog (sync) order. Every read runs
 * ensure_sync() first, which re-syncs only when the cache is older than the
 * freshness window. A failed sync is logged and the stale cache is served.
 */
class RegistryClient {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using SyncListener = std::function<void(size_t plugin_count)>;

    struct Options {
        std::chrono::seconds freshness_window{std::chrono::hours(24)};
        size_t max_results = 50;
    };

    RegistryClient(std::shared_ptr<IRegistryTransport> transport,
                   Options options,
                   Clock clock = {});

    /// Case-insensitive match on name/description/tags, then category/type filter
    [[nodiscard]] std::vector<PluginSummary> search(const std::string& query,
                                                    const SearchOptions& options = {});

    /// Cache first, then the transport; nullopt when unknown or unreachable
    [[nodiscard]] std::optional<PluginSummary> get_plugin(const std::string& id);

    /// Throws PluginError(REGISTRY_ERROR | NOT_FOUND)
    [[nodiscard]] std::vector<PluginVersionInfo> get_versions(const std::string& id);

    /// Throws PluginError(REGISTRY_ERROR | NOT_FOUND)
    [[nodiscard]] std::string download(const std::string& id, const std::string& version);

    /**
     * @brief Pick the version to install
     *
     * With `requested`, it must be listed by the registry. Without it, the
     * highest release (non-prerelease) version wins.
     * @throws PluginError(NOT_FOUND | REGISTRY_ERROR)
     */
    [[nodiscard]] PluginVersionInfo resolve_version(const std::string& id,
                                                    const std::optional<std::string>& requested);

    /// Sync now regardless of age. Returns false if the sync failed.
    bool refresh();

    void ensure_sync();

    void set_sync_listener(SyncListener listener);

    [[nodiscard]] size_t cache_size() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_sync() const;
    [[nodiscard]] const Options& options() const { return options_; }

private:
    bool sync();

    std::shared_ptr<IRegistryTransport> transport_;
    Options options_;
    Clock clock_;

    std::mutex sync_mutex_;                 // one sync at a time
    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, PluginSummary> cache_;
    std::vector<std::string> order_;
    std::optional<std::chrono::system_clock::time_point> last_sync_;
    SyncListener listener_;
};

} // namespace pluginhost
