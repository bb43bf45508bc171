#include "registry/registry_types.hpp"

#include <format>

namespace pluginhost {

using json = nlohmann::json;

namespace {

std::string required_string(const json& raw, const char* key, const char* what) {
    const auto it = raw.find(key);
    if (it == raw.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw PluginError(ErrorKind::VALIDATION,
            std::format("{}: '{}' is required and must be a non-empty string", what, key));
    }
    return it->get<std::string>();
}

std::string string_or_empty(const json& raw, const char* key) {
    const auto it = raw.find(key);
    return (it != raw.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::optional<std::string> optional_string(const json& raw, const char* key) {
    const auto it = raw.find(key);
    if (it == raw.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> string_list(const json& raw, const char* key) {
    std::vector<std::string> out;
    const auto it = raw.find(key);
    if (it == raw.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

} // anonymous namespace

json summary_to_json(const PluginSummary& summary) {
    json out = {
        {"id", summary.id},
        {"name", summary.name},
        {"description", summary.description},
        {"version", summary.version},
        {"type", summary.type},
        {"categories", summary.categories},
        {"tags", summary.tags},
    };
    if (summary.author) out["author"] = *summary.author;
    if (summary.downloads) out["downloads"] = *summary.downloads;
    if (summary.rating) out["rating"] = *summary.rating;
    return out;
}

Result<PluginSummary> summary_from_json(const json& raw) {
    if (!raw.is_object()) {
        return Result<PluginSummary>::error(ErrorKind::VALIDATION, "catalog entry must be an object");
    }
    try {
        PluginSummary s;
        s.id = required_string(raw, "id", "catalog entry");
        s.name = required_string(raw, "name", "catalog entry");
        s.description = string_or_empty(raw, "description");
        s.version = string_or_empty(raw, "version");
        s.type = string_or_empty(raw, "type");
        s.author = optional_string(raw, "author");
        s.categories = string_list(raw, "categories");
        s.tags = string_list(raw, "tags");
        if (const auto it = raw.find("downloads"); it != raw.end() && it->is_number_unsigned()) {
            s.downloads = it->get<uint64_t>();
        }
        if (const auto it = raw.find("rating"); it != raw.end() && it->is_number()) {
            s.rating = it->get<double>();
        }
        return Result<PluginSummary>::ok(std::move(s));
    } catch (const PluginError& e) {
        return Result<PluginSummary>::error(e);
    }
}

json version_info_to_json(const PluginVersionInfo& info) {
    json out = {{"version", info.version}};
    if (info.published_at) out["publishedAt"] = *info.published_at;
    if (info.sha256) out["sha256"] = *info.sha256;
    if (info.size) out["size"] = *info.size;
    return out;
}

Result<PluginVersionInfo> version_info_from_json(const json& raw) {
    // A bare string is accepted as a version with no metadata
    if (raw.is_string()) {
        PluginVersionInfo info;
        info.version = raw.get<std::string>();
        return Result<PluginVersionInfo>::ok(std::move(info));
    }
    if (!raw.is_object()) {
        return Result<PluginVersionInfo>::error(ErrorKind::VALIDATION, "version entry must be an object");
    }
    try {
        PluginVersionInfo info;
        info.version = required_string(raw, "version", "version entry");
        info.published_at = optional_string(raw, "publishedAt");
        info.sha256 = optional_string(raw, "sha256");
        if (const auto it = raw.find("size"); it != raw.end() && it->is_number_unsigned()) {
            info.size = it->get<uint64_t>();
        }
        return Result<PluginVersionInfo>::ok(std::move(info));
    } catch (const PluginError& e) {
        return Result<PluginVersionInfo>::error(e);
    }
}

} // namespace pluginhost
