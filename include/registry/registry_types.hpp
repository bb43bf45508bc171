#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pluginhost {

/// Catalog metadata for one plugin
struct PluginSummary {
    std::string id;
    std::string name;
    std::string description;
    std::string version;                    // latest published
    std::string type;
    std::optional<std::string> author;
    std::vector<std::string> categories;
    std::vector<std::string> tags;
    std::optional<uint64_t> downloads;
    std::optional<double> rating;

    bool operator==(const PluginSummary&) const = default;
};

struct PluginVersionInfo {
    std::string version;
    std::optional<std::string> published_at;
    std::optional<std::string> sha256;      // hex digest of the package bytes
    std::optional<uint64_t> size;

    bool operator==(const PluginVersionInfo&) const = default;
};

/// Transport-level filter (no limit; the client enforces it)
struct SearchFilter {
    std::optional<std::string> category;
    std::optional<std::string> type;
};

struct SearchOptions {
    std::optional<std::string> category;
    std::optional<std::string> type;
    std::optional<size_t> limit;            // clamped to the configured maximum; 0 = no results
};

// JSON (camelCase keys, same as the registry wire format)
[[nodiscard]] nlohmann::json summary_to_json(const PluginSummary& summary);
[[nodiscard]] Result<PluginSummary> summary_from_json(const nlohmann::json& raw);
[[nodiscard]] nlohmann::json version_info_to_json(const PluginVersionInfo& info);
[[nodiscard]] Result<PluginVersionInfo> version_info_from_json(const nlohmann::json& raw);

} // namespace pluginhost
