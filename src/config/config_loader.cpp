#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace pluginhost {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/// Read a non-negative integer that must fit in uint32_t
uint32_t toml_u32(const toml::table& tbl, const std::string_view key, uint32_t fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto* v = node.as_integer();
    if (!v) {
        throw std::runtime_error(std::format("'{}' must be an integer", key));
    }
    const int64_t raw = v->get();
    if (raw < 0 || raw > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::runtime_error(std::format("'{}' out of range: {}", key, raw));
    }
    return static_cast<uint32_t>(raw);
}

std::string toml_string(const toml::table& tbl, const std::string_view key, const std::string& fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto* v = node.as_string();
    if (!v) {
        throw std::runtime_error(std::format("'{}' must be a string", key));
    }
    return v->get();
}

bool toml_bool(const toml::table& tbl, const std::string_view key, bool fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const auto* v = node.as_boolean();
    if (!v) {
        throw std::runtime_error(std::format("'{}' must be true or false", key));
    }
    return v->get();
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

HostSection ConfigLoader::extract_host(const toml::table& root) {
    HostSection cfg;
    const auto* host = root["host"].as_table();
    if (!host) return cfg;
    const auto& h = *host;

    cfg.version = toml_string(h, "version", cfg.version);
    cfg.plugins_dir = toml_string(h, "plugins_dir", cfg.plugins_dir);
    return cfg;
}

SandboxConfig ConfigLoader::extract_sandbox(const toml::table& root) {
    SandboxConfig cfg;
    const auto* sandbox = root["sandbox"].as_table();
    if (!sandbox) return cfg;
    const auto& s = *sandbox;

    cfg.worker_executable = toml_string(s, "worker_executable", cfg.worker_executable);
    cfg.rpc_timeout_ms = toml_u32(s, "rpc_timeout_ms", cfg.rpc_timeout_ms);
    cfg.init_timeout_ms = toml_u32(s, "init_timeout_ms", cfg.init_timeout_ms);
    cfg.api_call_timeout_ms = toml_u32(s, "api_call_timeout_ms", cfg.api_call_timeout_ms);
    cfg.memory_limit_mb = toml_u32(s, "memory_limit_mb", cfg.memory_limit_mb);
    cfg.cpu_limit_seconds = toml_u32(s, "cpu_limit_seconds", cfg.cpu_limit_seconds);
    cfg.require_confinement = toml_bool(s, "require_confinement", cfg.require_confinement);
    return cfg;
}

RegistryConfig ConfigLoader::extract_registry(const toml::table& root) {
    RegistryConfig cfg;
    const auto* registry = root["registry"].as_table();
    if (!registry) return cfg;
    const auto& r = *registry;

    cfg.url = toml_string(r, "url", cfg.url);
    cfg.local_path = toml_string(r, "local_path", cfg.local_path);
    cfg.freshness_hours = toml_u32(r, "freshness_hours", cfg.freshness_hours);
    cfg.max_search_results = toml_u32(r, "max_search_results", cfg.max_search_results);
    cfg.timeout_ms = toml_u32(r, "timeout_ms", cfg.timeout_ms);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

HostConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    HostConfig config;
    config.host = extract_host(root);
    config.sandbox = extract_sandbox(root);
    config.registry = extract_registry(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(HostConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string msg = "Config validation failed:";
        for (const auto& e : errors) {
            msg += "\n  - " + e;
        }
        return LoadResult::error(std::move(msg));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        utils::log::warn(std::format("Config file '{}' not found, using defaults", config_path));
        return LoadResult::ok(HostConfig{});
    }

    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const HostConfig& config) {
    std::vector<std::string> errors;

    if (config.host.plugins_dir.empty()) {
        errors.emplace_back("host.plugins_dir must not be empty");
    }
    if (config.sandbox.worker_executable.empty()) {
        errors.emplace_back("sandbox.worker_executable must not be empty");
    }
    if (config.sandbox.rpc_timeout_ms == 0) {
        errors.emplace_back("sandbox.rpc_timeout_ms must be > 0");
    }
    if (config.sandbox.init_timeout_ms == 0) {
        errors.emplace_back("sandbox.init_timeout_ms must be > 0");
    }
    if (config.sandbox.api_call_timeout_ms == 0) {
        errors.emplace_back("sandbox.api_call_timeout_ms must be > 0");
    }
    if (config.registry.freshness_hours == 0) {
        errors.emplace_back("registry.freshness_hours must be > 0");
    }
    if (config.registry.local_path.empty() && config.registry.url.empty()) {
        errors.emplace_back("registry.url or registry.local_path must be set");
    }

    const std::string level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" &&
        level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace pluginhost
