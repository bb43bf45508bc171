#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <string>

namespace pluginhost::api_args {

// Argument extraction for plugin-facing API calls; bad input -> VALIDATION

inline std::string require_string(const nlohmann::json& args, const char* key, const std::string& api) {
    if (!args.is_object()) {
        throw PluginError(ErrorKind::VALIDATION, std::format("{}: arguments must be an object", api));
    }
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        throw PluginError(ErrorKind::VALIDATION,
            std::format("{}: '{}' is required and must be a string", api, key));
    }
    return it->get<std::string>();
}

inline std::string optional_string(const nlohmann::json& args, const char* key,
                                   const std::string& api, const std::string& fallback) {
    if (!args.is_object()) return fallback;
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw PluginError(ErrorKind::VALIDATION, std::format("{}: '{}' must be a string", api, key));
    }
    return it->get<std::string>();
}

/// Member value or `fallback` (default: empty object) when absent
inline nlohmann::json value_or(const nlohmann::json& args, const char* key,
                               nlohmann::json fallback = nlohmann::json::object()) {
    if (!args.is_object()) return fallback;
    const auto it = args.find(key);
    if (it == args.end() || it->is_null()) return fallback;
    return *it;
}

/// Member that must be present and a JSON object
inline nlohmann::json require_object(const nlohmann::json& args, const char* key, const std::string& api) {
    const auto it = args.is_object() ? args.find(key) : args.end();
    if (!args.is_object() || it == args.end() || !it->is_object()) {
        throw PluginError(ErrorKind::VALIDATION,
            std::format("{}: '{}' is required and must be an object", api, key));
    }
    return *it;
}

} // namespace pluginhost::api_args
