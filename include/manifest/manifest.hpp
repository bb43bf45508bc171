#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pluginhost {

/// File name of the manifest descriptor inside a plugin directory
inline constexpr const char* kManifestFileName = "manifest.json";

enum class PluginType { TOOL, AGENT, UI, INTEGRATION, WORKFLOW };

[[nodiscard]] const char* plugin_type_to_string(PluginType type);
[[nodiscard]] std::optional<PluginType> parse_plugin_type(std::string_view s);

// ============================================================================
// Permission grants (absent field = denied)
// ============================================================================

struct FilesystemPermissions {
    std::vector<std::string> read;      // glob patterns relative to the plugin dir
    std::vector<std::string> write;
    bool operator==(const FilesystemPermissions&) const = default;
};

struct NetworkPermissions {
    std::vector<std::string> domains;   // exact or suffix-matched hosts
    bool external = false;
    bool operator==(const NetworkPermissions&) const = default;
};

struct AgentPermissions {
    bool create = false;
    bool execute = false;
    bool manage = false;
    bool operator==(const AgentPermissions&) const = default;
};

struct ModelPermissions {
    std::vector<std::string> access;    // model ids, "*" = any
    bool execute = false;
    bool operator==(const ModelPermissions&) const = default;
};

struct UiPermissions {
    bool panels = false;
    bool menus = false;
    bool commands = false;
    bool notifications = false;
    bool operator==(const UiPermissions&) const = default;
};

struct MemoryPermissions {
    bool read = false;
    bool write = false;
    bool operator==(const MemoryPermissions&) const = default;
};

struct PermissionGrants {
    FilesystemPermissions filesystem;
    NetworkPermissions network;
    AgentPermissions agents;
    ModelPermissions models;
    UiPermissions ui;
    MemoryPermissions memory;
    bool operator==(const PermissionGrants&) const = default;
};

// ============================================================================
// PluginManifest
// ============================================================================

/**
 * @brief Validated, immutable description of a plugin package
 *
 * Produced only by validate_manifest(); every permission sub-object has its
 * defaults spelled out so that absence of a grant means denial.
 */
struct PluginManifest {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    std::optional<std::string> author;
    std::optional<std::string> homepage;
    std::optional<std::string> repository;
    std::optional<std::string> license;

    PluginType type = PluginType::TOOL;
    std::vector<std::string> categories;
    std::vector<std::string> tags;

    std::string engine_host;                            // semver range
    std::map<std::string, std::string> dependencies;    // id -> range

    std::vector<std::string> capabilities;
    PermissionGrants permissions;

    std::string main;
    std::optional<std::string> worker;
    std::optional<std::string> ui;

    nlohmann::json config_schema;                       // null when absent
    nlohmann::json default_config = nlohmann::json::object();
    nlohmann::json metadata;                            // null when absent

    bool operator==(const PluginManifest&) const = default;
};

/**
 * @brief Validate a raw manifest document
 * @param raw Parsed manifest.json
 * @param host_version Running host version, matched against engine.host
 * @return Manifest, or VALIDATION error naming the first offending field
 */
[[nodiscard]] Result<PluginManifest> validate_manifest(const nlohmann::json& raw,
                                                       const std::string& host_version);

/// Normalized JSON form; validate_manifest(to_json(m)) yields m
[[nodiscard]] nlohmann::json to_json(const PluginManifest& manifest);

/**
 * @brief Read and validate <plugin_dir>/manifest.json
 *
 * Missing or unreadable file -> IO_ERROR, malformed JSON -> VALIDATION.
 */
[[nodiscard]] Result<PluginManifest> load_manifest_file(const std::string& plugin_dir,
                                                        const std::string& host_version);

/// Normalized JSON form of a grant set (every field spelled out)
[[nodiscard]] nlohmann::json permissions_to_json(const PermissionGrants& grants);

/// Parse a "permissions" object; absent fields default to denied
[[nodiscard]] Result<PermissionGrants> permissions_from_json(const nlohmann::json& raw);

/// Plugin ids: [a-z0-9][a-z0-9._-]{0,127}
[[nodiscard]] bool is_valid_plugin_id(std::string_view id);

/// Does the declared capability set imply the given capability tag?
/// A category tag ("filesystem") implies all of its sub-tags.
[[nodiscard]] bool capabilities_imply(const std::vector<std::string>& capabilities,
                                      std::string_view tag);

} // namespace pluginhost
