#pragma once

#include <cstddef>
#include <cstdint>

// C ABI between plugin_host_worker and a plugin's entry module (dlopen/dlsym).
// Plugins export a factory returning a vtable; all data crosses as JSON text.

extern "C" {

constexpr uint32_t PLUGINHOST_PLUGIN_API_VERSION = 1;

// Return codes of HostedPlugin::call and PluginHostApi::invoke
constexpr int PLUGINHOST_OK = 0;
constexpr int PLUGINHOST_ERROR = 1;             // *out_json = {"kind", "message"} or a message string
constexpr int PLUGINHOST_METHOD_NOT_FOUND = 2;

// Plugin metadata
struct PluginInfo {
    const char* id;         // Must match the manifest id
    const char* name;
    const char* version;
    uint32_t api_version;   // Must match PLUGINHOST_PLUGIN_API_VERSION
};

// Host API table handed to every call. Each entry is permission-gated by the worker.
struct PluginHostApi {
    void* context;
    // api: "readFile", "fetch", "executeModel", ... ; *out_json owned by the host, release with free_string
    int (*invoke)(void* context, const char* api, const char* args_json, char** out_json);
    void (*free_string)(void* context, char* str);
    void (*log)(void* context, const char* level, const char* message);
};

// Plugin vtable
struct HostedPlugin {
    void* instance;
    PluginInfo (*get_info)(void* instance);
    // *out_json is allocated by the plugin and released with free_string
    int (*call)(void* instance, const PluginHostApi* host, const char* method,
                const char* args_json, char** out_json);
    void (*free_string)(void* instance, char* str);
    void (*destroy)(void* instance);
};

// Factory function signature (plugins export this)
// "pluginhost_create_plugin" -> HostedPlugin*
using PluginFactoryFn = HostedPlugin* (*)();

} // extern "C"
