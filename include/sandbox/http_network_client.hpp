#pragma once

#include "sandbox/host_services.hpp"

namespace pluginhost {

/**
 * @brief INetworkClient over cpp-httplib
 *
 * Connects to exactly the origin carried by the request. Redirects are not
 * followed since they could leave the plugin's domain allow-list.
 */
class HttpNetworkClient : public INetworkClient {
public:
    nlohmann::json fetch(const std::string& plugin_id, const FetchRequest& request) override;
};

} // namespace pluginhost
