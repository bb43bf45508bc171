#include "plugin/plugin_manager.hpp"
#include "core/crypto.hpp"
#include "core/utils.hpp"
#include "plugin/package_archive.hpp"

#include <algorithm>
#include <format>

namespace pluginhost {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kInitializeHook = "initialize";
constexpr const char* kCleanupHook = "cleanup";
constexpr const char* kConfigChangedHook = "configChanged";

// Run fn and fold any exception into the Result envelope
template<typename T, typename Fn>
Result<T> guarded(const char* operation, const std::string& id, Fn&& fn) {
    try {
        return Result<T>::ok(fn());
    } catch (const PluginError& e) {
        return Result<T>::error(e);
    } catch (const std::exception& e) {
        utils::log::error(std::format("{} '{}': unexpected failure: {}", operation, id, e.what()));
        return Result<T>::error(ErrorKind::INTERNAL_ERROR, e.what());
    }
}

void throw_if_error(const Status& status) {
    if (status.is_error()) throw PluginError(status.error_kind(), status.error_message());
}

PluginState default_state(const std::string& id, const std::string& version) {
    PluginState state;
    state.id = id;
    state.status = PluginStatus::INSTALLED;
    state.version = version;
    state.installed_at = utils::now_iso8601();
    return state;
}

bool json_has_type(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    return true;    // unknown schema types are not enforced
}

} // anonymous namespace

PluginManager::PluginManager(PluginManagerOptions options,
                             std::shared_ptr<RegistryClient> registry,
                             WorkerFactory worker_factory,
                             HostServices services)
    : options_(std::move(options)),
      registry_(std::move(registry)),
      worker_factory_(std::move(worker_factory)),
      services_(std::move(services)),
      store_(options_.plugins_dir) {
    if (registry_) {
        registry_->set_sync_listener([this](size_t count) {
            emit(PluginEventType::REGISTRY_UPDATED, "", {{"count", count}});
        });
    }
}

PluginManager::~PluginManager() {
    if (registry_) registry_->set_sync_listener({});
    shutdown();
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<std::shared_mutex> PluginManager::id_lock(const std::string& id) {
    std::lock_guard<std::mutex> lock(id_locks_mutex_);
    auto& slot = id_locks_[id];
    if (auto existing = slot.lock()) return existing;

    // The last holder removes the slot, so ids that come and go leave nothing behind
    std::shared_ptr<std::shared_mutex> fresh(new std::shared_mutex(), [this, id](std::shared_mutex* mutex) {
        delete mutex;
        std::lock_guard<std::mutex> lock(id_locks_mutex_);
        const auto it = id_locks_.find(id);
        if (it != id_locks_.end() && it->second.expired()) id_locks_.erase(it);
    });
    slot = fresh;
    return fresh;
}

size_t PluginManager::id_lock_count() const {
    std::lock_guard<std::mutex> lock(id_locks_mutex_);
    return id_locks_.size();
}

std::shared_ptr<PluginManager::Entry> PluginManager::find(const std::string& id) const {
    std::shared_lock lock(map_mutex_);
    const auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

json PluginManager::effective_config(const PluginManifest& manifest, const PluginState& state) {
    json out = manifest.default_config.is_object() ? manifest.default_config : json::object();
    if (state.config.is_object()) {
        for (const auto& [key, value] : state.config.items()) {
            out[key] = value;
        }
    }
    return out;
}

void PluginManager::check_config_types(const PluginManifest& manifest, const json& patch) {
    const json& schema = manifest.config_schema;
    if (!schema.is_object()) return;

    const auto props_it = schema.find("properties");
    const json& props = (props_it != schema.end() && props_it->is_object()) ? *props_it : schema;

    for (const auto& [key, value] : patch.items()) {
        if (value.is_null()) continue;
        const auto decl = props.find(key);
        if (decl == props.end() || !decl->is_object()) continue;
        const auto type = decl->find("type");
        if (type == decl->end() || !type->is_string()) continue;
        if (!json_has_type(value, type->get<std::string>())) {
            throw PluginError(ErrorKind::VALIDATION,
                std::format("config key '{}' must be of type {}", key, type->get<std::string>()));
        }
    }
}

void PluginManager::persist(const PluginState& state) const {
    throw_if_error(store_.save_state(state));
}

bool PluginManager::persist_quietly(const PluginState& state) const {
    const auto saved = store_.save_state(state);
    if (saved.is_error()) {
        utils::log::error(std::format("Plugin '{}': failed to persist state: {}", state.id, saved.error_message()));
        return false;
    }
    return true;
}

bool PluginManager::persist_entry(Entry& entry) const {
    // The copy is taken under persist_mutex, so a write never replaces a newer one
    std::lock_guard<std::mutex> persist_lock(entry.persist_mutex);
    PluginState snapshot;
    {
        std::lock_guard<std::mutex> state_lock(entry.state_mutex);
        snapshot = entry.state;
    }
    return persist_quietly(snapshot);
}

std::unique_ptr<Sandbox> PluginManager::start_sandbox(const PluginManifest& manifest, const json& config) {
    auto sandbox = std::make_unique<Sandbox>(manifest, options_.sandbox, worker_factory_, services_,
        [this](const std::string& plugin_id, const std::string& event, const json& data) {
            emit(PluginEventType::PLUGIN_EVENT, plugin_id, {{"event", event}, {"data", data}});
        });

    utils::Timer timer;
    sandbox->initialize(store_.plugin_dir(manifest.id), config);
    utils::log::debug(std::format("Plugin '{}': sandbox started in {} ms", manifest.id, timer.elapsed_ms().count()));
    return sandbox;
}

void PluginManager::emit(PluginEventType type, const std::string& plugin_id, json data) {
    PluginEvent event{type, plugin_id, std::move(data), std::chrono::system_clock::now()};

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        recent_events_.push_back(event);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Listener for {} threw: {}", plugin_event_type_to_string(type), e.what()));
        }
    }
}

void PluginManager::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    listeners_.push_back(std::move(listener));
}

std::vector<PluginEvent> PluginManager::recent_events() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

// ============================================================================
// Startup recovery
// ============================================================================

Result<size_t> PluginManager::load_installed() {
    return guarded<size_t>("load_installed", options_.plugins_dir.string(), [&]() -> size_t {
        std::error_code ec;
        fs::create_directories(options_.plugins_dir, ec);
        if (ec) {
            throw PluginError(ErrorKind::IO_ERROR,
                std::format("cannot create plugins directory '{}': {}", options_.plugins_dir.string(), ec.message()));
        }
        // Leftovers from an install interrupted by a crash
        store_.discard(options_.plugins_dir / ".staging");

        size_t loaded = 0;
        for (const auto& id : store_.list_plugin_ids()) {
            auto lock = id_lock(id);
            std::unique_lock guard(*lock);
            if (find(id)) continue;

            auto manifest = store_.load_manifest(id, options_.host_version);
            if (manifest.is_error()) {
                utils::log::error(std::format("Plugin '{}': not loaded, manifest invalid: {}", id, manifest.error_message()));
                continue;
            }
            if (manifest.value().id != id) {
                utils::log::error(std::format("Plugin '{}': not loaded, manifest declares id '{}'", id, manifest.value().id));
                continue;
            }

            auto entry = std::make_shared<Entry>();
            entry->manifest = manifest.value();

            auto stored = store_.load_state(id);
            if (stored.is_error()) {
                utils::log::warn(std::format("Plugin '{}': state unreadable ({}), resetting to installed",
                    id, stored.error_message()));
                entry->state = default_state(id, entry->manifest.version);
                persist_quietly(entry->state);
            } else if (!stored.value()) {
                entry->state = default_state(id, entry->manifest.version);
                persist_quietly(entry->state);
            } else {
                entry->state = std::move(*stored.value());
            }

            const bool was_enabled = entry->state.status == PluginStatus::ENABLED;
            try {
                entry->sandbox = start_sandbox(entry->manifest, effective_config(entry->manifest, entry->state));
            } catch (const PluginError& e) {
                utils::log::error(std::format("Plugin '{}': sandbox failed to start: {}", id, e.what()));
                std::lock_guard<std::mutex> state_lock(entry->state_mutex);
                entry->state.status = PluginStatus::ERROR;
                entry->state.enabled_at.reset();
                entry->state.last_error = e.what();
                persist_quietly(entry->state);
            }

            {
                std::unique_lock map_lock(map_mutex_);
                entries_[id] = entry;
            }
            ++loaded;

            if (was_enabled && entry->sandbox) {
                {
                    std::lock_guard<std::mutex> state_lock(entry->state_mutex);
                    entry->state.status = PluginStatus::LOADING;
                }
                try {
                    enable_locked(id, *entry);
                } catch (const PluginError& e) {
                    utils::log::warn(std::format("Plugin '{}': re-enable at startup failed: {}", id, e.what()));
                }
            }
        }

        utils::log::info(std::format("Loaded {} installed plugin(s) from {}", loaded, options_.plugins_dir.string()));
        return loaded;
    });
}

// ============================================================================
// Install / uninstall / update
// ============================================================================

PluginState PluginManager::install_locked(const std::string& id, const std::optional<std::string>& version) {
    if (!is_valid_plugin_id(id)) {
        throw PluginError(ErrorKind::VALIDATION, std::format("'{}' is not a valid plugin id", id));
    }
    if (find(id) || store_.exists(id)) {
        throw PluginError(ErrorKind::VALIDATION, std::format("plugin '{}' is already installed; use update", id));
    }
    if (!registry_) {
        throw PluginError(ErrorKind::NOT_AVAILABLE, "no plugin registry is configured");
    }

    if (!registry_->get_plugin(id)) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' not found in registry", id));
    }
    const auto info = registry_->resolve_version(id, version);
    const std::string package = registry_->download(id, info.version);
    if (info.sha256 && !crypto::digest_equals(crypto::sha256_hex(package), *info.sha256)) {
        throw PluginError(ErrorKind::VALIDATION,
            std::format("package {}@{} does not match its published checksum", id, info.version));
    }

    auto staging = store_.create_staging(id);
    if (staging.is_error()) throw PluginError(staging.error_kind(), staging.error_message());
    const fs::path staging_dir = staging.value();

    PluginManifest manifest;
    try {
        throw_if_error(PackageArchive::extract(package, staging_dir));

        auto loaded = load_manifest_file(staging_dir.string(), options_.host_version);
        if (loaded.is_error()) throw PluginError(loaded.error_kind(), loaded.error_message());
        manifest = loaded.value();

        if (manifest.id != id) {
            throw PluginError(ErrorKind::VALIDATION,
                std::format("package for '{}' declares id '{}'", id, manifest.id));
        }
        if (manifest.version != info.version) {
            throw PluginError(ErrorKind::VALIDATION,
                std::format("package {}@{} declares version {}", id, info.version, manifest.version));
        }
        throw_if_error(store_.promote(staging_dir, id));
    } catch (const PluginError&) {
        store_.discard(staging_dir);
        throw;
    }

    // The plugin directory exists from here on; remove it on any failure
    PluginState state = default_state(id, manifest.version);
    std::unique_ptr<Sandbox> sandbox;
    try {
        sandbox = start_sandbox(manifest, effective_config(manifest, state));
        persist(state);
    } catch (const PluginError&) {
        if (sandbox) sandbox->terminate();
        store_.discard(store_.plugin_dir(id));
        throw;
    }

    auto entry = std::make_shared<Entry>();
    entry->manifest = std::move(manifest);
    entry->sandbox = std::move(sandbox);
    entry->state = state;
    {
        std::unique_lock lock(map_mutex_);
        entries_[id] = std::move(entry);
    }

    utils::log::info(std::format("Plugin '{}' v{} installed", id, state.version));
    emit(PluginEventType::INSTALLED, id, {{"version", state.version}});
    return state;
}

Result<PluginState> PluginManager::install(const std::string& id, const std::optional<std::string>& version) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    auto result = guarded<PluginState>("install", id, [&] { return install_locked(id, version); });
    if (result.is_error()) {
        utils::log::error(std::format("Plugin '{}': install failed: {}", id, result.error_message()));
        emit(PluginEventType::INSTALL_FAILED, id, {
            {"kind", error_kind_to_string(result.error_kind())},
            {"message", result.error_message()},
        });
    }
    return result;
}

bool PluginManager::uninstall_locked(const std::string& id) {
    auto entry = find(id);
    if (!entry) {
        // A directory whose plugin failed to load at startup
        if (!is_valid_plugin_id(id) || !store_.exists(id)) return false;
        throw_if_error(store_.remove_plugin_dir(id));
        return true;
    }

    bool enabled = false;
    {
        std::lock_guard<std::mutex> state_lock(entry->state_mutex);
        enabled = entry->state.status == PluginStatus::ENABLED;
    }
    if (enabled) {
        disable_locked(id, *entry);
    }

    if (entry->sandbox) entry->sandbox->terminate();
    const auto removed = store_.remove_plugin_dir(id);
    {
        std::unique_lock lock(map_mutex_);
        entries_.erase(id);
    }
    if (services_.ui) services_.ui->remove_plugin(id);

    if (removed.is_error()) {
        // Never leave a state file behind that would resurrect the plugin
        const auto deleted = store_.delete_state(id);
        if (deleted.is_error()) {
            utils::log::error(std::format("Plugin '{}': {}", id, deleted.error_message()));
        }
        throw PluginError(removed.error_kind(), removed.error_message());
    }
    return true;
}

Status PluginManager::uninstall(const std::string& id) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    auto result = guarded<bool>("uninstall", id, [&] { return uninstall_locked(id); });
    if (result.is_error()) {
        utils::log::error(std::format("Plugin '{}': uninstall incomplete: {}", id, result.error_message()));
        emit(PluginEventType::UNINSTALL_FAILED, id, {
            {"kind", error_kind_to_string(result.error_kind())},
            {"message", result.error_message()},
        });
        return Status::error(result.error_kind(), result.error_message());
    }
    if (result.value()) {
        utils::log::info(std::format("Plugin '{}' uninstalled", id));
        emit(PluginEventType::UNINSTALLED, id);
    }
    return ok_status();
}

Result<PluginState> PluginManager::update(const std::string& id, const std::optional<std::string>& version) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    std::string previous;
    auto removed = guarded<bool>("update", id, [&] {
        auto entry = find(id);
        if (!entry) {
            throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
        }
        {
            std::lock_guard<std::mutex> state_lock(entry->state_mutex);
            previous = entry->state.version;
        }
        return uninstall_locked(id);
    });
    if (removed.is_error()) {
        return Result<PluginState>::error(removed.error_kind(), removed.error_message());
    }
    emit(PluginEventType::UNINSTALLED, id, {{"reason", "update"}});

    auto installed = guarded<PluginState>("update", id, [&] { return install_locked(id, version); });
    if (installed.is_error()) {
        utils::log::warn(std::format("Plugin '{}': plugin_update_failed after removing v{}: {}",
            id, previous, installed.error_message()));
        emit(PluginEventType::INSTALL_FAILED, id, {
            {"kind", error_kind_to_string(installed.error_kind())},
            {"message", installed.error_message()},
            {"update", true},
        });
        return Result<PluginState>::error(installed.error_kind(),
            std::format("update of '{}' failed after v{} was uninstalled; the plugin is no longer installed: {}",
                id, previous, installed.error_message()));
    }

    utils::log::info(std::format("Plugin '{}' updated v{} -> v{}", id, previous, installed.value().version));
    emit(PluginEventType::UPDATED, id, {{"from", previous}, {"to", installed.value().version}});
    return installed;
}

// ============================================================================
// Enable / disable
// ============================================================================

PluginState PluginManager::enable_locked(const std::string& id, Entry& entry) {
    {
        std::lock_guard<std::mutex> state_lock(entry.state_mutex);
        if (entry.state.status == PluginStatus::ENABLED && entry.sandbox &&
            entry.sandbox->state() == SandboxState::READY) {
            return entry.state;
        }
    }

    try {
        json config;
        {
            std::lock_guard<std::mutex> state_lock(entry.state_mutex);
            config = effective_config(entry.manifest, entry.state);
        }

        if (!entry.sandbox || entry.sandbox->state() != SandboxState::READY) {
            if (entry.sandbox) {
                utils::log::info(std::format("Plugin '{}': re-creating sandbox ({})", id, entry.sandbox->exit_reason()));
                entry.sandbox->terminate();
            }
            entry.sandbox.reset();
            entry.sandbox = start_sandbox(entry.manifest, config);
        }

        entry.sandbox->call(kInitializeHook, {{"config", config}});
    } catch (const PluginError& e) {
        PluginState snapshot;
        {
            std::lock_guard<std::mutex> state_lock(entry.state_mutex);
            entry.state.status = PluginStatus::ERROR;
            entry.state.enabled_at.reset();
            entry.state.last_error = e.what();
            snapshot = entry.state;
        }
        persist_quietly(snapshot);
        utils::log::error(std::format("Plugin '{}': enable failed: {}", id, e.what()));
        emit(PluginEventType::ENABLE_FAILED, id, {
            {"kind", error_kind_to_string(e.kind())},
            {"message", e.what()},
        });
        throw;
    }

    PluginState snapshot;
    {
        std::lock_guard<std::mutex> state_lock(entry.state_mutex);
        entry.state.status = PluginStatus::ENABLED;
        entry.state.enabled_at = utils::now_iso8601();
        snapshot = entry.state;
    }
    persist(snapshot);

    utils::log::info(std::format("Plugin '{}' enabled", id));
    emit(PluginEventType::ENABLED, id);
    return snapshot;
}

Result<PluginState> PluginManager::enable(const std::string& id) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    return guarded<PluginState>("enable", id, [&] {
        auto entry = find(id);
        if (!entry) {
            throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
        }
        return enable_locked(id, *entry);
    });
}

void PluginManager::disable_locked(const std::string& id, Entry& entry) {
    if (entry.sandbox && entry.sandbox->state() == SandboxState::READY) {
        try {
            entry.sandbox->call(kCleanupHook, json::object());
        } catch (const PluginError& e) {
            utils::log::warn(std::format("Plugin '{}': cleanup failed, disabling anyway: {}", id, e.what()));
        }
    }

    PluginState snapshot;
    {
        std::lock_guard<std::mutex> state_lock(entry.state_mutex);
        entry.state.status = PluginStatus::DISABLED;
        entry.state.enabled_at.reset();
        snapshot = entry.state;
    }
    persist_quietly(snapshot);

    utils::log::info(std::format("Plugin '{}' disabled", id));
    emit(PluginEventType::DISABLED, id);
}

Status PluginManager::disable(const std::string& id) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    auto result = guarded<bool>("disable", id, [&] {
        auto entry = find(id);
        if (!entry) {
            throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
        }
        disable_locked(id, *entry);
        return true;
    });
    if (result.is_error()) return Status::error(result.error_kind(), result.error_message());
    return ok_status();
}

// ============================================================================
// Execution
// ============================================================================

Result<json> PluginManager::execute(const std::string& id, const std::string& method, const json& args) {
    auto lock = id_lock(id);
    std::shared_lock guard(*lock);

    return guarded<json>("execute", id, [&]() -> json {
        auto entry = find(id);
        if (!entry) {
            throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
        }
        {
            std::lock_guard<std::mutex> state_lock(entry->state_mutex);
            if (entry->state.status != PluginStatus::ENABLED) {
                throw PluginError(ErrorKind::NOT_AVAILABLE, std::format("plugin '{}' is not enabled (status: {})",
                    id, plugin_status_to_string(entry->state.status)));
            }
        }
        if (method.empty()) {
            throw PluginError(ErrorKind::VALIDATION, "method name is required");
        }

        Sandbox* sandbox = entry->sandbox.get();
        utils::Timer timer;
        try {
            if (!sandbox || sandbox->state() != SandboxState::READY) {
                throw PluginError(ErrorKind::WORKER_TERMINATED, std::format("plugin worker is not running ({})",
                    sandbox ? sandbox->exit_reason() : "no sandbox"));
            }

            json result = sandbox->call(method, args);

            const auto memory = sandbox->memory_usage();
            {
                std::lock_guard<std::mutex> state_lock(entry->state_mutex);
                entry->state.metrics.execution_count++;
                entry->state.metrics.load_time_ms =
                    static_cast<double>(timer.elapsed<std::chrono::microseconds>().count()) / 1000.0;
                if (memory) entry->state.metrics.memory_usage = *memory;
            }
            persist_entry(*entry);
            return result;
        } catch (const PluginError& e) {
            {
                std::lock_guard<std::mutex> state_lock(entry->state_mutex);
                entry->state.metrics.error_count++;
                entry->state.last_error = e.what();
                if (!sandbox || sandbox->state() == SandboxState::TERMINATED) {
                    entry->state.status = PluginStatus::ERROR;
                    entry->state.enabled_at.reset();
                }
            }
            persist_entry(*entry);
            utils::log::warn(std::format("Plugin '{}': {} failed: [{}] {}",
                id, method, error_kind_to_string(e.kind()), e.what()));
            throw;
        }
    });
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PluginManifest> PluginManager::list_installed() const {
    std::vector<PluginManifest> out;
    {
        std::shared_lock lock(map_mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry->manifest);
        }
    }
    std::sort(out.begin(), out.end(),
        [](const PluginManifest& a, const PluginManifest& b) { return a.id < b.id; });
    return out;
}

Result<PluginState> PluginManager::get_state(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return Result<PluginState>::error(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
    }
    std::lock_guard<std::mutex> state_lock(entry->state_mutex);
    return Result<PluginState>::ok(entry->state);
}

Result<std::vector<PluginSummary>> PluginManager::search_registry(const std::string& query,
                                                                  const SearchOptions& options) {
    return guarded<std::vector<PluginSummary>>("search_registry", query, [&] {
        if (!registry_) {
            throw PluginError(ErrorKind::NOT_AVAILABLE, "no plugin registry is configured");
        }
        return registry_->search(query, options);
    });
}

// ============================================================================
// Configuration
// ============================================================================

Result<json> PluginManager::get_plugin_config(const std::string& id) const {
    auto entry = find(id);
    if (!entry) {
        return Result<json>::error(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
    }
    std::lock_guard<std::mutex> state_lock(entry->state_mutex);
    return Result<json>::ok(effective_config(entry->manifest, entry->state));
}

Result<json> PluginManager::set_plugin_config(const std::string& id, const json& patch) {
    auto lock = id_lock(id);
    std::unique_lock guard(*lock);

    return guarded<json>("set_plugin_config", id, [&]() -> json {
        auto entry = find(id);
        if (!entry) {
            throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' is not installed", id));
        }
        if (!patch.is_object()) {
            throw PluginError(ErrorKind::VALIDATION, "config patch must be a JSON object");
        }
        check_config_types(entry->manifest, patch);

        PluginState updated;
        {
            std::lock_guard<std::mutex> state_lock(entry->state_mutex);
            updated = entry->state;
        }
        for (const auto& [key, value] : patch.items()) {
            if (value.is_null()) {
                updated.config.erase(key);
            } else {
                updated.config[key] = value;
            }
        }
        persist(updated);

        json effective;
        bool enabled = false;
        {
            std::lock_guard<std::mutex> state_lock(entry->state_mutex);
            entry->state.config = updated.config;
            effective = effective_config(entry->manifest, entry->state);
            enabled = entry->state.status == PluginStatus::ENABLED;
        }

        if (enabled && entry->sandbox && entry->sandbox->state() == SandboxState::READY) {
            try {
                entry->sandbox->call(kConfigChangedHook, {{"config", effective}});
            } catch (const PluginError& e) {
                utils::log::warn(std::format("Plugin '{}': config change notification failed: {}", id, e.what()));
            }
        }
        return effective;
    });
}

// ============================================================================
// Shutdown
// ============================================================================

void PluginManager::shutdown() {
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> all;
    {
        std::shared_lock lock(map_mutex_);
        all.assign(entries_.begin(), entries_.end());
    }

    size_t stopped = 0;
    for (const auto& [id, entry] : all) {
        auto lock = id_lock(id);
        std::unique_lock guard(*lock);
        if (entry->sandbox && entry->sandbox->state() != SandboxState::TERMINATED) {
            entry->sandbox->terminate();
            ++stopped;
        }
    }
    if (stopped > 0) {
        utils::log::info(std::format("Plugin manager shut down ({} sandbox(es) terminated)", stopped));
    }
}

} // namespace pluginhost
