#include "registry/http_registry_transport.hpp"
#include "core/url.hpp"
#include "core/semver.hpp"
#include "core/utils.hpp"
#include "manifest/manifest.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <format>

namespace pluginhost {

using json = nlohmann::json;

namespace {

std::vector<PluginSummary> parse_summaries(const std::string& body) {
    const json doc = json::parse(body, nullptr, false);
    // Either a bare array or {"plugins": [...]}
    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object() && doc.contains("plugins") && doc["plugins"].is_array()) {
        list = &doc["plugins"];
    }
    if (!list) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, "registry returned a malformed plugin list");
    }

    std::vector<PluginSummary> out;
    for (const auto& raw : *list) {
        auto summary = summary_from_json(raw);
        if (summary.is_error()) {
            utils::log::warn(std::format("Registry: skipping catalog entry: {}", summary.error_message()));
            continue;
        }
        out.push_back(std::move(summary.value()));
    }
    return out;
}

} // anonymous namespace

HttpRegistryTransport::HttpRegistryTransport(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {
    const auto url = utils::parse_url(base_url_);
    if (!url) {
        throw PluginError(ErrorKind::VALIDATION, std::format("registry URL '{}' is not a plain http(s) URL", base_url_));
    }
    origin_ = url->origin();
    prefix_ = url->target;
    if (const auto q = prefix_.find('?'); q != std::string::npos) prefix_.erase(q);
    while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
}

HttpRegistryTransport::Response HttpRegistryTransport::get(const std::string& target,
                                                           const httplib::Params& params) const {
    httplib::Client client(origin_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);
    client.set_follow_location(true);

    const std::string path = prefix_ + target;
    auto res = client.Get(path, params, httplib::Headers{});
    if (!res) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("GET {}{} failed: {}", origin_, path, httplib::to_string(res.error())));
    }
    return Response{res->status, res->body};
}

std::vector<PluginSummary> HttpRegistryTransport::search(const std::string& query, const SearchFilter& filter) {
    httplib::Params params;
    if (!query.empty()) params.emplace("q", query);
    if (filter.category) params.emplace("category", *filter.category);
    if (filter.type) params.emplace("type", *filter.type);

    const auto res = get("/api/plugins", params);
    if (res.status != httplib::StatusCode::OK_200) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("registry search returned HTTP {}", res.status));
    }
    return parse_summaries(res.body);
}

std::optional<PluginSummary> HttpRegistryTransport::get_plugin(const std::string& id) {
    // Ids and versions travel unescaped in the path, so only well-formed ones are sent
    if (!is_valid_plugin_id(id)) return std::nullopt;
    const auto res = get(std::format("/api/plugins/{}", id));
    if (res.status == httplib::StatusCode::NotFound_404) return std::nullopt;
    if (res.status != httplib::StatusCode::OK_200) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("registry lookup of '{}' returned HTTP {}", id, res.status));
    }

    auto summary = summary_from_json(json::parse(res.body, nullptr, false));
    if (summary.is_error()) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("registry entry for '{}' is malformed: {}", id, summary.error_message()));
    }
    return summary.value();
}

std::vector<PluginVersionInfo> HttpRegistryTransport::get_versions(const std::string& id) {
    if (!is_valid_plugin_id(id)) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' not found in registry", id));
    }
    const auto res = get(std::format("/api/plugins/{}/versions", id));
    if (res.status == httplib::StatusCode::NotFound_404) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' not found in registry", id));
    }
    if (res.status != httplib::StatusCode::OK_200) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("registry versions of '{}' returned HTTP {}", id, res.status));
    }

    const json doc = json::parse(res.body, nullptr, false);
    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object() && doc.contains("versions") && doc["versions"].is_array()) {
        list = &doc["versions"];
    }
    if (!list) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("malformed version list for '{}'", id));
    }

    std::vector<PluginVersionInfo> out;
    for (const auto& raw : *list) {
        auto info = version_info_from_json(raw);
        if (info.is_ok()) out.push_back(std::move(info.value()));
    }
    return out;
}

std::string HttpRegistryTransport::download(const std::string& id, const std::string& version) {
    if (!is_valid_plugin_id(id) || !Version::parse(version)) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("package {}@{} not found in registry", id, version));
    }
    const auto res = get(std::format("/api/plugins/{}/versions/{}/download",
        id, version));
    if (res.status == httplib::StatusCode::NotFound_404) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("package {}@{} not found in registry", id, version));
    }
    if (res.status != httplib::StatusCode::OK_200) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("download of {}@{} returned HTTP {}", id, version, res.status));
    }
    return res.body;
}

} // namespace pluginhost
