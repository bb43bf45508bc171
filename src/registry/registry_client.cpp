#include "registry/registry_client.hpp"
#include "core/semver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pluginhost {

RegistryClient::RegistryClient(std::shared_ptr<IRegistryTransport> transport,
                               Options options,
                               Clock clock)
    : transport_(std::move(transport)),
      options_(options),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

// ============================================================================
// Sync
// ============================================================================

void RegistryClient::ensure_sync() {
    std::lock_guard<std::mutex> sync_lock(sync_mutex_);
    {
        std::shared_lock lock(cache_mutex_);
        if (last_sync_ && clock_() - *last_sync_ <= options_.freshness_window) return;
    }
    sync();
}

bool RegistryClient::refresh() {
    std::lock_guard<std::mutex> sync_lock(sync_mutex_);
    return sync();
}

bool RegistryClient::sync() {
    std::vector<PluginSummary> catalog;
    try {
        catalog = transport_->search("", SearchFilter{});
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Registry sync failed, serving cached catalog ({} entries): {}",
            cache_size(), e.what()));
        return false;
    }

    std::unordered_map<std::string, PluginSummary> cache;
    std::vector<std::string> order;
    order.reserve(catalog.size());
    for (auto& summary : catalog) {
        if (cache.contains(summary.id)) continue;
        order.push_back(summary.id);
        cache.emplace(summary.id, std::move(summary));
    }

    SyncListener listener;
    const size_t count = order.size();
    {
        std::unique_lock lock(cache_mutex_);
        cache_ = std::move(cache);
        order_ = std::move(order);
        last_sync_ = clock_();
        listener = listener_;
    }

    utils::log::info(std::format("Registry synced: {} plugin(s)", count));
    if (listener) listener(count);
    return true;
}

void RegistryClient::set_sync_listener(SyncListener listener) {
    std::unique_lock lock(cache_mutex_);
    listener_ = std::move(listener);
}

size_t RegistryClient::cache_size() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

std::optional<std::chrono::system_clock::time_point> RegistryClient::last_sync() const {
    std::shared_lock lock(cache_mutex_);
    return last_sync_;
}

// ============================================================================
// Reads
// ============================================================================

std::vector<PluginSummary> RegistryClient::search(const std::string& query, const SearchOptions& options) {
    ensure_sync();

    const size_t limit = std::min(options.limit.value_or(options_.max_results), options_.max_results);
    std::vector<PluginSummary> out;
    if (limit == 0) return out;

    std::shared_lock lock(cache_mutex_);
    for (const auto& id : order_) {
        const auto& s = cache_.at(id);

        if (!query.empty()) {
            const bool hit = utils::icontains(s.name, query) || utils::icontains(s.description, query) ||
                std::any_of(s.tags.begin(), s.tags.end(),
                    [&](const std::string& tag) { return utils::icontains(tag, query); });
            if (!hit) continue;
        }
        if (options.category &&
            std::find(s.categories.begin(), s.categories.end(), *options.category) == s.categories.end()) {
            continue;
        }
        if (options.type && s.type != *options.type) continue;

        out.push_back(s);
        if (out.size() >= limit) break;
    }
    return out;
}

std::optional<PluginSummary> RegistryClient::get_plugin(const std::string& id) {
    ensure_sync();
    {
        std::shared_lock lock(cache_mutex_);
        if (const auto it = cache_.find(id); it != cache_.end()) return it->second;
    }

    try {
        return transport_->get_plugin(id);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Registry lookup of '{}' failed: {}", id, e.what()));
        return std::nullopt;
    }
}

std::vector<PluginVersionInfo> RegistryClient::get_versions(const std::string& id) {
    try {
        return transport_->get_versions(id);
    } catch (const PluginError& e) {
        if (e.kind() == ErrorKind::NOT_FOUND) throw;
        throw PluginError(ErrorKind::REGISTRY_ERROR, e.what());
    } catch (const std::exception& e) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("versions of '{}': {}", id, e.what()));
    }
}

std::string RegistryClient::download(const std::string& id, const std::string& version) {
    try {
        return transport_->download(id, version);
    } catch (const PluginError& e) {
        if (e.kind() == ErrorKind::NOT_FOUND) throw;
        throw PluginError(ErrorKind::REGISTRY_ERROR, e.what());
    } catch (const std::exception& e) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("download of {}@{}: {}", id, version, e.what()));
    }
}

PluginVersionInfo RegistryClient::resolve_version(const std::string& id,
                                                  const std::optional<std::string>& requested) {
    const auto versions = get_versions(id);

    if (requested) {
        const auto it = std::find_if(versions.begin(), versions.end(),
            [&](const PluginVersionInfo& v) { return v.version == *requested; });
        if (it == versions.end()) {
            throw PluginError(ErrorKind::NOT_FOUND,
                std::format("version {} of '{}' is not published", *requested, id));
        }
        return *it;
    }

    const PluginVersionInfo* best = nullptr;
    std::optional<Version> best_version;
    for (const auto& info : versions) {
        const auto parsed = Version::parse(info.version);
        if (!parsed || !parsed->prerelease.empty()) continue;
        if (!best_version || *parsed > *best_version) {
            best_version = parsed;
            best = &info;
        }
    }
    if (!best) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("no installable release of '{}'", id));
    }
    return *best;
}

} // namespace pluginhost
