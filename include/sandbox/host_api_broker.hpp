#pragma once

#include "sandbox/host_services.hpp"
#include "sandbox/permission_gate.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pluginhost {

/**
 * @brief Host-side handler for API_CALL messages forwarded by a worker
 *
 * Re-checks every call against the host's own frozen snapshot before it
 * reaches a collaborator, so a compromised worker cannot widen its grants.
 * Served here: fetch, createAgent, executeAgent, executeModel, storeMemory,
 * searchMemory, addCommand, addMenuItem, addPanel, showNotification.
 * fetch connects to the URL as parsed by the gate, never to the raw string.
 */
class HostApiBroker {
public:
    HostApiBroker(std::string plugin_id,
                  std::shared_ptr<const PermissionSnapshot> snapshot,
                  HostServices services,
                  std::chrono::milliseconds call_timeout = std::chrono::milliseconds{10000});

    /// Throws PluginError (PERMISSION_DENIED, VALIDATION, NOT_AVAILABLE, ...)
    nlohmann::json dispatch(const std::string& api, const nlohmann::json& args) const;

    [[nodiscard]] static bool is_host_api(const std::string& api);

    /// Permission a host API call needs; the worker gates with it before forwarding
    [[nodiscard]] static PermissionRequirement requirement_for(const std::string& api,
                                                               const nlohmann::json& args);

private:
    std::string plugin_id_;
    PermissionGate gate_;
    HostServices services_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace pluginhost
