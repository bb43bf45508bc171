#include "manifest/plugin_state.hpp"
#include "core/utils.hpp"

#include <format>

namespace pluginhost {

using json = nlohmann::json;

const char* plugin_status_to_string(PluginStatus status) {
    switch (status) {
        case PluginStatus::INSTALLED: return "installed";
        case PluginStatus::ENABLED:   return "enabled";
        case PluginStatus::DISABLED:  return "disabled";
        case PluginStatus::ERROR:     return "error";
        case PluginStatus::LOADING:   return "loading";
    }
    return "installed";
}

std::optional<PluginStatus> parse_plugin_status(std::string_view s) {
    if (s == "installed") return PluginStatus::INSTALLED;
    if (s == "enabled") return PluginStatus::ENABLED;
    if (s == "disabled") return PluginStatus::DISABLED;
    if (s == "error") return PluginStatus::ERROR;
    if (s == "loading") return PluginStatus::LOADING;
    return std::nullopt;
}

json state_to_json(const PluginState& state) {
    json metrics = {
        {"executionCount", state.metrics.execution_count},
        {"errorCount", state.metrics.error_count},
    };
    if (state.metrics.load_time_ms) metrics["loadTime"] = *state.metrics.load_time_ms;
    if (state.metrics.memory_usage) metrics["memoryUsage"] = *state.metrics.memory_usage;

    json out = {
        {"id", state.id},
        {"status", plugin_status_to_string(state.status)},
        {"version", state.version},
        {"installedAt", state.installed_at},
        {"config", state.config},
        {"metrics", std::move(metrics)},
    };
    if (state.enabled_at) out["enabledAt"] = *state.enabled_at;
    if (state.last_error) out["lastError"] = *state.last_error;
    return out;
}

namespace {

Result<PluginState> invalid(const std::string& id, const std::string& message) {
    return Result<PluginState>::error(ErrorKind::VALIDATION,
        std::format("invalid state for plugin '{}': {}", id, message));
}

bool is_string_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    return it != obj.end() && it->is_string();
}

std::optional<uint64_t> read_counter(const json& metrics, const char* key) {
    const auto it = metrics.find(key);
    if (it == metrics.end()) return uint64_t{0};
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(it->get<int64_t>());
    }
    return std::nullopt;
}

} // anonymous namespace

Result<PluginState> validate_state(const json& raw, const std::string& expected_id) {
    if (!raw.is_object()) return invalid(expected_id, "state must be a JSON object");

    if (!is_string_field(raw, "id")) return invalid(expected_id, "missing 'id'");
    const auto id = raw["id"].get<std::string>();
    if (id != expected_id) {
        return invalid(expected_id, std::format("references unknown plugin '{}'", id));
    }

    if (!is_string_field(raw, "status")) return invalid(id, "missing 'status'");
    const auto status_str = raw["status"].get<std::string>();
    const auto status = parse_plugin_status(status_str);
    if (!status) {
        utils::log::warn(std::format("Plugin '{}': unknown status '{}' in state, resetting to installed",
            id, status_str));
        PluginState reset;
        reset.id = id;
        if (is_string_field(raw, "version")) reset.version = raw["version"].get<std::string>();
        if (is_string_field(raw, "installedAt")) reset.installed_at = raw["installedAt"].get<std::string>();
        if (reset.installed_at.empty()) reset.installed_at = utils::now_iso8601();
        return Result<PluginState>::ok(std::move(reset));
    }

    if (!is_string_field(raw, "version")) return invalid(id, "missing 'version'");
    if (!is_string_field(raw, "installedAt")) return invalid(id, "missing 'installedAt'");

    PluginState state;
    state.id = id;
    state.status = *status;
    state.version = raw["version"].get<std::string>();
    state.installed_at = raw["installedAt"].get<std::string>();

    if (const auto it = raw.find("enabledAt"); it != raw.end() && !it->is_null()) {
        if (!it->is_string()) return invalid(id, "'enabledAt' must be a string");
        state.enabled_at = it->get<std::string>();
    }
    if (const auto it = raw.find("lastError"); it != raw.end() && !it->is_null()) {
        if (!it->is_string()) return invalid(id, "'lastError' must be a string");
        state.last_error = it->get<std::string>();
    }
    if (const auto it = raw.find("config"); it != raw.end() && !it->is_null()) {
        if (!it->is_object()) return invalid(id, "'config' must be an object");
        state.config = *it;
    }

    if (const auto it = raw.find("metrics"); it != raw.end() && !it->is_null()) {
        if (!it->is_object()) return invalid(id, "'metrics' must be an object");
        const auto& m = *it;

        const auto executions = read_counter(m, "executionCount");
        const auto errors = read_counter(m, "errorCount");
        if (!executions || !errors) return invalid(id, "metrics counters must be non-negative integers");
        state.metrics.execution_count = *executions;
        state.metrics.error_count = *errors;

        if (const auto lt = m.find("loadTime"); lt != m.end() && !lt->is_null()) {
            if (!lt->is_number()) return invalid(id, "'metrics.loadTime' must be a number");
            state.metrics.load_time_ms = lt->get<double>();
        }
        if (const auto mu = m.find("memoryUsage"); mu != m.end() && !mu->is_null()) {
            if (!mu->is_number_integer() || mu->get<int64_t>() < 0) {
                return invalid(id, "'metrics.memoryUsage' must be a non-negative integer");
            }
            state.metrics.memory_usage = mu->get<uint64_t>();
        }
    }

    // enabledAt is meaningful only while enabled
    if (state.status != PluginStatus::ENABLED) state.enabled_at.reset();

    return Result<PluginState>::ok(std::move(state));
}

} // namespace pluginhost
