#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace pluginhost {

enum class PluginEventType {
    INSTALLED,
    INSTALL_FAILED,
    UNINSTALLED,
    UNINSTALL_FAILED,
    ENABLED,
    ENABLE_FAILED,
    DISABLED,
    UPDATED,
    PLUGIN_EVENT,       // emitted by plugin code via the emit API
    REGISTRY_UPDATED,
};

[[nodiscard]] inline const char* plugin_event_type_to_string(PluginEventType type) {
    switch (type) {
        case PluginEventType::INSTALLED:         return "plugin_installed";
        case PluginEventType::INSTALL_FAILED:    return "plugin_install_failed";
        case PluginEventType::UNINSTALLED:       return "plugin_uninstalled";
        case PluginEventType::UNINSTALL_FAILED:  return "plugin_uninstall_failed";
        case PluginEventType::ENABLED:           return "plugin_enabled";
        case PluginEventType::ENABLE_FAILED:     return "plugin_enable_failed";
        case PluginEventType::DISABLED:          return "plugin_disabled";
        case PluginEventType::UPDATED:           return "plugin_updated";
        case PluginEventType::PLUGIN_EVENT:      return "plugin_event";
        case PluginEventType::REGISTRY_UPDATED:  return "registry_updated";
    }
    return "unknown";
}

/**
 * @brief Structured event emitted by the PluginManager
 */
struct PluginEvent {
    PluginEventType type;
    std::string plugin_id;      // empty for registry_updated
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace pluginhost
