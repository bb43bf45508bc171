#pragma once

#include "registry/registry_transport.hpp"

#include <httplib.h>

#include <chrono>
#include <string>

namespace pluginhost {

/**
 * @brief REST catalog client (cpp-httplib)
 *
 *   GET /api/plugins?q=&category=&type=
 *   GET /api/plugins/{id}
 *   GET /api/plugins/{id}/versions
 *   GET /api/plugins/{id}/versions/{version}/download
 */
class HttpRegistryTransport : public IRegistryTransport {
public:
    explicit HttpRegistryTransport(std::string base_url,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds{15000});

    [[nodiscard]] std::vector<PluginSummary> search(const std::string& query,
                                                    const SearchFilter& filter) override;
    [[nodiscard]] std::optional<PluginSummary> get_plugin(const std::string& id) override;
    [[nodiscard]] std::vector<PluginVersionInfo> get_versions(const std::string& id) override;
    [[nodiscard]] std::string download(const std::string& id, const std::string& version) override;

    [[nodiscard]] const std::string& base_url() const { return base_url_; }

private:
    struct Response {
        int status = 0;
        std::string body;
    };

    Response get(const std::string& target, const httplib::Params& params = {}) const;

    std::string base_url_;
    std::string origin_;
    std::string prefix_;        // path part of base_url without trailing '/'
    std::chrono::milliseconds timeout_;
};

} // namespace pluginhost
