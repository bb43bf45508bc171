#include "sandbox/http_network_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>

namespace pluginhost {

using json = nlohmann::json;

json HttpNetworkClient::fetch(const std::string& plugin_id, const FetchRequest& request) {
    httplib::Client client(request.url.origin());
    // Connect and read share the budget so the whole call fits the API deadline
    const auto half = request.timeout / 2;
    client.set_connection_timeout(half);
    client.set_read_timeout(half);
    client.set_write_timeout(half);
    client.set_follow_location(false);

    httplib::Headers headers;
    for (const auto& [name, value] : request.headers) {
        headers.emplace(name, value);
    }

    const std::string& target = request.url.target;
    const std::string& method = request.method;
    httplib::Result res;
    if (method == "get") {
        res = client.Get(target, headers);
    } else if (method == "post") {
        res = client.Post(target, headers, request.body, request.content_type);
    } else if (method == "put") {
        res = client.Put(target, headers, request.body, request.content_type);
    } else if (method == "patch") {
        res = client.Patch(target, headers, request.body, request.content_type);
    } else if (method == "delete") {
        res = client.Delete(target, headers, request.body, request.content_type);
    } else if (method == "head") {
        res = client.Head(target, headers);
    } else {
        throw PluginError(ErrorKind::VALIDATION, std::format("fetch: unsupported method '{}'", method));
    }

    if (!res) {
        throw PluginError(ErrorKind::IO_ERROR, std::format("fetch {}{} failed: {}",
            request.url.origin(), target, httplib::to_string(res.error())));
    }
    utils::log::debug(std::format("[plugin:{}] fetch {} {}{} -> {}",
        plugin_id, method, request.url.origin(), target, res->status));

    json response_headers = json::object();
    for (const auto& [name, value] : res->headers) {
        response_headers[name] = value;
    }
    return json{{"status", res->status}, {"body", res->body}, {"headers", response_headers}};
}

} // namespace pluginhost
