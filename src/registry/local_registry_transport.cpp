#include "registry/local_registry_transport.hpp"
#include "core/utils.hpp"
#include "manifest/manifest.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace pluginhost {

using json = nlohmann::json;
namespace fs = std::filesystem;

LocalRegistryTransport::LocalRegistryTransport(fs::path root)
    : root_(std::move(root)) {}

json LocalRegistryTransport::load_catalog() const {
    const fs::path path = root_ / "catalog.json";
    std::ifstream in(path);
    if (!in) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("cannot open {}", path.string()));
    }
    json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("plugins") || !doc["plugins"].is_array()) {
        throw PluginError(ErrorKind::REGISTRY_ERROR, std::format("{} is malformed", path.string()));
    }
    return doc;
}

const json* LocalRegistryTransport::find_entry(const json& catalog, const std::string& id) const {
    for (const auto& entry : catalog["plugins"]) {
        if (entry.is_object() && entry.value("id", std::string()) == id) return &entry;
    }
    return nullptr;
}

std::vector<PluginSummary> LocalRegistryTransport::search(const std::string& query, const SearchFilter& filter) {
    const json catalog = load_catalog();

    std::vector<PluginSummary> out;
    for (const auto& raw : catalog["plugins"]) {
        auto summary = summary_from_json(raw);
        if (summary.is_error()) {
            utils::log::warn(std::format("Local registry: skipping entry: {}", summary.error_message()));
            continue;
        }
        const auto& s = summary.value();

        if (!query.empty()) {
            const bool hit = utils::icontains(s.name, query) || utils::icontains(s.description, query) ||
                std::any_of(s.tags.begin(), s.tags.end(),
                    [&](const std::string& tag) { return utils::icontains(tag, query); });
            if (!hit) continue;
        }
        if (filter.category &&
            std::find(s.categories.begin(), s.categories.end(), *filter.category) == s.categories.end()) {
            continue;
        }
        if (filter.type && s.type != *filter.type) continue;

        out.push_back(std::move(summary.value()));
    }
    return out;
}

std::optional<PluginSummary> LocalRegistryTransport::get_plugin(const std::string& id) {
    const json catalog = load_catalog();
    const json* entry = find_entry(catalog, id);
    if (!entry) return std::nullopt;

    auto summary = summary_from_json(*entry);
    if (summary.is_error()) {
        throw PluginError(ErrorKind::REGISTRY_ERROR,
            std::format("catalog entry for '{}' is malformed: {}", id, summary.error_message()));
    }
    return summary.value();
}

std::vector<PluginVersionInfo> LocalRegistryTransport::get_versions(const std::string& id) {
    const json catalog = load_catalog();
    const json* entry = find_entry(catalog, id);
    if (!entry) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("plugin '{}' not found in registry", id));
    }

    std::vector<PluginVersionInfo> out;
    if (const auto it = entry->find("versions"); it != entry->end() && it->is_array()) {
        for (const auto& raw : *it) {
            auto info = version_info_from_json(raw);
            if (info.is_ok()) out.push_back(std::move(info.value()));
        }
    } else if (const auto v = entry->find("version"); v != entry->end() && v->is_string()) {
        out.push_back(PluginVersionInfo{v->get<std::string>(), std::nullopt, std::nullopt, std::nullopt});
    }
    return out;
}

std::string LocalRegistryTransport::download(const std::string& id, const std::string& version) {
    // The file name is built from both parts; keep them inside packages/
    if (!is_valid_plugin_id(id) || version.empty() ||
        version.find('/') != std::string::npos || version.find("..") != std::string::npos) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("package {}@{} not found in registry", id, version));
    }

    const fs::path path = root_ / "packages" / std::format("{}-{}.pkg", id, version);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PluginError(ErrorKind::NOT_FOUND, std::format("package {}@{} not found in registry", id, version));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace pluginhost
