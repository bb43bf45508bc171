#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pluginhost {

/// File name of the persisted state descriptor inside a plugin directory
inline constexpr const char* kStateFileName = "state.json";

/**
 * @brief Lifecycle status of an installed plugin
 *
 * Transitions (per plugin id):
 * - (none)    → INSTALLED:  install
 * - INSTALLED → ENABLED:    enable
 * - ENABLED   → DISABLED:   disable
 * - DISABLED  → ENABLED:    enable
 * - ENABLED   → ERROR:      enable failure
 * - ERROR     → ENABLED | ERROR: enable retry
 * - any       → (none):     uninstall
 */
enum class PluginStatus { INSTALLED, ENABLED, DISABLED, ERROR, LOADING };

[[nodiscard]] const char* plugin_status_to_string(PluginStatus status);
[[nodiscard]] std::optional<PluginStatus> parse_plugin_status(std::string_view s);

struct PluginMetrics {
    std::optional<double> load_time_ms;     // duration of the last successful call
    std::optional<uint64_t> memory_usage;   // worker resident set, bytes
    uint64_t execution_count = 0;
    uint64_t error_count = 0;
    bool operator==(const PluginMetrics&) const = default;
};

/**
 * @brief Mutable per-plugin state, persisted as state.json
 *
 * Owned by the PluginManager; sandboxes never touch it.
 */
struct PluginState {
    std::string id;
    PluginStatus status = PluginStatus::INSTALLED;
    std::string version;
    std::string installed_at;                   // ISO-8601 UTC
    std::optional<std::string> enabled_at;      // present only while enabled
    std::optional<std::string> last_error;
    nlohmann::json config = nlohmann::json::object();   // overrides over defaultConfig
    PluginMetrics metrics;
    bool operator==(const PluginState&) const = default;
};

[[nodiscard]] nlohmann::json state_to_json(const PluginState& state);

/**
 * @brief Validate a persisted state document
 *
 * - Not an object, missing fields, or id != expected_id → VALIDATION
 * - Unknown status → a default INSTALLED state for the same id (and version
 *   when readable) so corrupted state never blocks host startup
 */
[[nodiscard]] Result<PluginState> validate_state(const nlohmann::json& raw,
                                                 const std::string& expected_id);

} // namespace pluginhost
