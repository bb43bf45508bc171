#include "plugin/plugin_loader.hpp"
#include "core/utils.hpp"

#include <dlfcn.h>
#include <format>

namespace pluginhost {

// ============================================================================
// LoadedModule
// ============================================================================

LoadedModule::LoadedModule(std::string path, void* handle)
    : path_(std::move(path)), handle_(handle) {}

LoadedModule::~LoadedModule() {
    release();
}

void LoadedModule::release() {
    // Destroy plugin instance before dlclose
    if (plugin) {
        if (plugin->destroy) plugin->destroy(plugin->instance);
        plugin = nullptr;
    }
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

LoadedModule::LoadedModule(LoadedModule&& other) noexcept
    : path_(std::move(other.path_)),
      handle_(other.handle_),
      plugin(other.plugin) {
    other.handle_ = nullptr;
    other.plugin = nullptr;
}

LoadedModule& LoadedModule::operator=(LoadedModule&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        handle_ = other.handle_;
        plugin = other.plugin;
        other.handle_ = nullptr;
        other.plugin = nullptr;
    }
    return *this;
}

void* LoadedModule::resolve(const char* symbol) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, symbol);
}

// ============================================================================
// Loading
// ============================================================================

Result<std::unique_ptr<LoadedModule>> load_plugin_module(const std::filesystem::path& path,
                                                         const std::string& expected_id) {
    using R = Result<std::unique_ptr<LoadedModule>>;

    // dlopen the shared library
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("cannot load entry module '{}': {}", path.string(), err ? err : "unknown error"));
    }

    auto module = std::make_unique<LoadedModule>(path.string(), handle);

    // Resolve factory: HostedPlugin* pluginhost_create_plugin()
    const auto factory = reinterpret_cast<PluginFactoryFn>(module->resolve("pluginhost_create_plugin"));
    if (!factory) {
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("entry module '{}' does not export pluginhost_create_plugin", path.string()));
    }

    HostedPlugin* hp = factory();
    if (!hp) {
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("entry module '{}': factory returned null", path.string()));
    }
    module->plugin = hp;

    if (!hp->get_info || !hp->call || !hp->free_string) {
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("entry module '{}': incomplete plugin vtable", path.string()));
    }

    // Validate API version and identity
    const auto info = hp->get_info(hp->instance);
    if (info.api_version != PLUGINHOST_PLUGIN_API_VERSION) {
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("entry module '{}': API version mismatch (got {}, expected {})",
                path.string(), info.api_version, PLUGINHOST_PLUGIN_API_VERSION));
    }
    const std::string reported_id = info.id ? info.id : "";
    if (reported_id != expected_id) {
        return R::error(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("entry module reports id '{}', manifest id is '{}'", reported_id, expected_id));
    }

    utils::log::info(std::format("Plugin module loaded: {} v{} ({})",
        info.name ? info.name : reported_id, info.version ? info.version : "?", path.string()));
    return R::ok(std::move(module));
}

} // namespace pluginhost
