#include "manifest/manifest.hpp"
#include "core/semver.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>

namespace pluginhost {

using json = nlohmann::json;

const char* plugin_type_to_string(PluginType type) {
    switch (type) {
        case PluginType::TOOL:        return "tool";
        case PluginType::AGENT:       return "agent";
        case PluginType::UI:          return "ui";
        case PluginType::INTEGRATION: return "integration";
        case PluginType::WORKFLOW:    return "workflow";
    }
    return "tool";
}

std::optional<PluginType> parse_plugin_type(std::string_view s) {
    if (s == "tool") return PluginType::TOOL;
    if (s == "agent") return PluginType::AGENT;
    if (s == "ui") return PluginType::UI;
    if (s == "integration") return PluginType::INTEGRATION;
    if (s == "workflow") return PluginType::WORKFLOW;
    return std::nullopt;
}

bool is_valid_plugin_id(std::string_view id) {
    if (id.empty() || id.size() > 128) return false;
    const auto allowed_first = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    };
    if (!allowed_first(id[0])) return false;
    for (const char c : id.substr(1)) {
        if (!allowed_first(c) && c != '.' && c != '_' && c != '-') return false;
    }
    return true;
}

namespace {

// "agent" / "model" are accepted spellings of the "agents" / "models" categories
std::string normalize_capability(std::string_view tag) {
    std::string_view category = tag;
    std::string_view rest;
    if (const auto colon = tag.find(':'); colon != std::string_view::npos) {
        category = tag.substr(0, colon);
        rest = tag.substr(colon);
    }
    if (category == "agent") category = "agents";
    else if (category == "model") category = "models";
    return std::string(category) + std::string(rest);
}

[[noreturn]] void fail(const std::string& message) {
    throw PluginError(ErrorKind::VALIDATION, message);
}

const json* optional_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::string required_string(const json& obj, const char* key) {
    const auto* v = optional_field(obj, key);
    if (!v) fail(std::format("missing required field '{}'", key));
    if (!v->is_string()) fail(std::format("field '{}' must be a string", key));
    return v->get<std::string>();
}

std::optional<std::string> optional_string(const json& obj, const char* key) {
    const auto* v = optional_field(obj, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) fail(std::format("field '{}' must be a string", key));
    return v->get<std::string>();
}

std::vector<std::string> string_array(const json& obj, const char* key, const std::string& where) {
    std::vector<std::string> out;
    const auto* v = optional_field(obj, key);
    if (!v) return out;
    if (!v->is_array()) fail(std::format("field '{}{}' must be an array of strings", where, key));
    out.reserve(v->size());
    for (const auto& elem : *v) {
        if (!elem.is_string()) fail(std::format("field '{}{}' must be an array of strings", where, key));
        out.push_back(elem.get<std::string>());
    }
    return out;
}

bool optional_bool(const json& obj, const char* key, const std::string& where) {
    const auto* v = optional_field(obj, key);
    if (!v) return false;
    if (!v->is_boolean()) fail(std::format("field '{}{}' must be a boolean", where, key));
    return v->get<bool>();
}

const json* permission_category(const json& perms, const char* name, const char* alias) {
    const json* v = optional_field(perms, name);
    if (!v && alias) v = optional_field(perms, alias);
    if (v && !v->is_object()) fail(std::format("permissions.{} must be an object", name));
    return v;
}

PermissionGrants parse_permissions(const json& raw) {
    PermissionGrants grants;
    const auto* perms = optional_field(raw, "permissions");
    if (!perms) return grants;
    if (!perms->is_object()) fail("field 'permissions' must be an object");

    if (const auto* fs = permission_category(*perms, "filesystem", nullptr)) {
        grants.filesystem.read = string_array(*fs, "read", "permissions.filesystem.");
        grants.filesystem.write = string_array(*fs, "write", "permissions.filesystem.");
    }
    if (const auto* net = permission_category(*perms, "network", nullptr)) {
        grants.network.domains = string_array(*net, "domains", "permissions.network.");
        grants.network.external = optional_bool(*net, "external", "permissions.network.");
    }
    if (const auto* agents = permission_category(*perms, "agents", "agent")) {
        grants.agents.create = optional_bool(*agents, "create", "permissions.agents.");
        grants.agents.execute = optional_bool(*agents, "execute", "permissions.agents.");
        grants.agents.manage = optional_bool(*agents, "manage", "permissions.agents.");
    }
    if (const auto* models = permission_category(*perms, "models", "model")) {
        grants.models.access = string_array(*models, "access", "permissions.models.");
        grants.models.execute = optional_bool(*models, "execute", "permissions.models.");
    }
    if (const auto* ui = permission_category(*perms, "ui", nullptr)) {
        grants.ui.panels = optional_bool(*ui, "panels", "permissions.ui.");
        grants.ui.menus = optional_bool(*ui, "menus", "permissions.ui.");
        grants.ui.commands = optional_bool(*ui, "commands", "permissions.ui.");
        grants.ui.notifications = optional_bool(*ui, "notifications", "permissions.ui.");
    }
    if (const auto* memory = permission_category(*perms, "memory", nullptr)) {
        grants.memory.read = optional_bool(*memory, "read", "permissions.memory.");
        grants.memory.write = optional_bool(*memory, "write", "permissions.memory.");
    }
    return grants;
}

/// Every non-empty grant must be covered by a declared capability
void check_grants_within_capabilities(const PermissionGrants& g,
                                      const std::vector<std::string>& caps) {
    const auto require = [&caps](bool granted, std::string_view tag, std::string_view grant) {
        if (granted && !capabilities_imply(caps, tag)) {
            fail(std::format("permission '{}' is not covered by a declared capability ('{}')",
                grant, tag));
        }
    };

    require(!g.filesystem.read.empty(), "filesystem:read", "filesystem.read");
    require(!g.filesystem.write.empty(), "filesystem:write", "filesystem.write");
    require(!g.network.domains.empty() || g.network.external, "network:fetch", "network");
    require(g.agents.create, "agents:create", "agents.create");
    require(g.agents.execute, "agents:execute", "agents.execute");
    require(g.agents.manage, "agents:manage", "agents.manage");
    require(!g.models.access.empty(), "models:access", "models.access");
    require(g.models.execute, "models:execute", "models.execute");
    require(g.ui.panels, "ui:panels", "ui.panels");
    require(g.ui.menus, "ui:menus", "ui.menus");
    require(g.ui.commands, "ui:commands", "ui.commands");
    require(g.ui.notifications, "ui:notifications", "ui.notifications");
    require(g.memory.read, "memory:read", "memory.read");
    require(g.memory.write, "memory:write", "memory.write");
}

void check_entry_path(const std::string& field, const std::string& value) {
    if (value.empty()) fail(std::format("entry point '{}' must not be empty", field));
    const std::filesystem::path p(value);
    if (p.is_absolute() || value.front() == '/') {
        fail(std::format("entry point '{}' must be a relative path", field));
    }
    for (const auto& part : p) {
        if (part == "..") fail(std::format("entry point '{}' must not contain '..'", field));
    }
}

void check_url(const char* field, const std::optional<std::string>& value) {
    if (!value) return;
    if (!value->starts_with("http://") && !value->starts_with("https://")) {
        fail(std::format("field '{}' must be an http(s) URL", field));
    }
}

const json* optional_object(const json& raw, const char* key) {
    const auto* v = optional_field(raw, key);
    if (v && !v->is_object()) fail(std::format("field '{}' must be an object", key));
    return v;
}

PluginManifest parse_manifest(const json& raw, const std::string& host_version) {
    if (!raw.is_object()) fail("manifest must be a JSON object");

    PluginManifest m;
    m.id = required_string(raw, "id");
    if (!is_valid_plugin_id(m.id)) {
        fail(std::format("invalid plugin id '{}'", m.id));
    }
    m.name = required_string(raw, "name");
    if (m.name.empty()) fail("field 'name' must not be empty");

    m.version = required_string(raw, "version");
    if (!Version::parse(m.version)) {
        fail(std::format("field 'version' is not a valid semantic version: '{}'", m.version));
    }
    m.description = required_string(raw, "description");
    m.author = optional_string(raw, "author");
    m.homepage = optional_string(raw, "homepage");
    m.repository = optional_string(raw, "repository");
    m.license = optional_string(raw, "license");
    check_url("homepage", m.homepage);
    check_url("repository", m.repository);

    const auto type_str = required_string(raw, "type");
    const auto type = parse_plugin_type(type_str);
    if (!type) {
        fail(std::format("field 'type' must be one of tool|agent|ui|integration|workflow, got '{}'",
            type_str));
    }
    m.type = *type;
    m.categories = string_array(raw, "categories", "");
    m.tags = string_array(raw, "tags", "");

    // Engine compatibility fails closed
    const auto* engine = optional_object(raw, "engine");
    if (!engine) fail("missing required field 'engine'");
    auto host_range = optional_string(*engine, "host");
    if (!host_range) host_range = optional_string(*engine, "puffer");
    if (!host_range) fail("missing required field 'engine.host'");
    m.engine_host = *host_range;

    const auto range = VersionRange::parse(m.engine_host);
    if (!range) fail(std::format("field 'engine.host' is not a valid version range: '{}'", m.engine_host));
    const auto running = Version::parse(host_version);
    if (!running) fail(std::format("host version '{}' is not a valid semantic version", host_version));
    if (!range->satisfied_by(*running)) {
        fail(std::format("plugin requires host '{}', running {}", m.engine_host, host_version));
    }

    if (const auto* deps = optional_object(raw, "dependencies")) {
        for (const auto& [dep_id, dep_range] : deps->items()) {
            if (!is_valid_plugin_id(dep_id)) fail(std::format("invalid dependency id '{}'", dep_id));
            if (!dep_range.is_string() || !VersionRange::parse(dep_range.get<std::string>())) {
                fail(std::format("dependency '{}' must map to a valid version range", dep_id));
            }
            m.dependencies.emplace(dep_id, dep_range.get<std::string>());
        }
    }

    if (!optional_field(raw, "capabilities")) fail("missing required field 'capabilities'");
    m.capabilities = string_array(raw, "capabilities", "");
    m.permissions = parse_permissions(raw);
    check_grants_within_capabilities(m.permissions, m.capabilities);

    m.main = required_string(raw, "main");
    check_entry_path("main", m.main);
    m.worker = optional_string(raw, "worker");
    if (m.worker) check_entry_path("worker", *m.worker);
    m.ui = optional_string(raw, "ui");
    if (m.ui) check_entry_path("ui", *m.ui);

    if (const auto* schema = optional_object(raw, "configSchema")) m.config_schema = *schema;
    if (const auto* defaults = optional_object(raw, "defaultConfig")) m.default_config = *defaults;
    if (const auto* metadata = optional_object(raw, "metadata")) m.metadata = *metadata;

    return m;
}

} // anonymous namespace

bool capabilities_imply(const std::vector<std::string>& capabilities, std::string_view tag) {
    const std::string wanted = normalize_capability(tag);
    const auto colon = wanted.find(':');
    const std::string category = wanted.substr(0, colon);

    for (const auto& cap : capabilities) {
        const std::string c = normalize_capability(cap);
        if (c == wanted || c == category) return true;
    }
    return false;
}

Result<PluginManifest> validate_manifest(const json& raw, const std::string& host_version) {
    try {
        return Result<PluginManifest>::ok(parse_manifest(raw, host_version));
    } catch (const PluginError& e) {
        return Result<PluginManifest>::error(e);
    } catch (const json::exception& e) {
        return Result<PluginManifest>::error(ErrorKind::VALIDATION,
            std::format("malformed manifest: {}", e.what()));
    }
}

json permissions_to_json(const PermissionGrants& p) {
    return {
        {"filesystem", {{"read", p.filesystem.read}, {"write", p.filesystem.write}}},
        {"network", {{"domains", p.network.domains}, {"external", p.network.external}}},
        {"agents", {{"create", p.agents.create}, {"execute", p.agents.execute},
                    {"manage", p.agents.manage}}},
        {"models", {{"access", p.models.access}, {"execute", p.models.execute}}},
        {"ui", {{"panels", p.ui.panels}, {"menus", p.ui.menus},
                {"commands", p.ui.commands}, {"notifications", p.ui.notifications}}},
        {"memory", {{"read", p.memory.read}, {"write", p.memory.write}}},
    };
}

Result<PermissionGrants> permissions_from_json(const json& raw) {
    try {
        return Result<PermissionGrants>::ok(parse_permissions(json{{"permissions", raw}}));
    } catch (const PluginError& e) {
        return Result<PermissionGrants>::error(e);
    }
}

json to_json(const PluginManifest& m) {
    json out = {
        {"id", m.id},
        {"name", m.name},
        {"version", m.version},
        {"description", m.description},
        {"type", plugin_type_to_string(m.type)},
        {"categories", m.categories},
        {"tags", m.tags},
        {"engine", {{"host", m.engine_host}}},
        {"dependencies", m.dependencies},
        {"capabilities", m.capabilities},
        {"permissions", permissions_to_json(m.permissions)},
        {"main", m.main},
        {"defaultConfig", m.default_config},
    };

    if (m.author) out["author"] = *m.author;
    if (m.homepage) out["homepage"] = *m.homepage;
    if (m.repository) out["repository"] = *m.repository;
    if (m.license) out["license"] = *m.license;
    if (m.worker) out["worker"] = *m.worker;
    if (m.ui) out["ui"] = *m.ui;
    if (!m.config_schema.is_null()) out["configSchema"] = m.config_schema;
    if (!m.metadata.is_null()) out["metadata"] = m.metadata;
    return out;
}

Result<PluginManifest> load_manifest_file(const std::string& plugin_dir,
                                          const std::string& host_version) {
    const auto path = std::filesystem::path(plugin_dir) / kManifestFileName;
    std::ifstream in(path);
    if (!in) {
        return Result<PluginManifest>::error(ErrorKind::IO_ERROR,
            std::format("cannot open {}", path.string()));
    }

    json raw = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (raw.is_discarded()) {
        return Result<PluginManifest>::error(ErrorKind::VALIDATION,
            std::format("{} is not valid JSON", path.string()));
    }
    return validate_manifest(raw, host_version);
}

} // namespace pluginhost
