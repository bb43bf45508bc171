#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pluginhost {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        HostConfig config;

        static LoadResult ok(HostConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to plugin_host.toml
     * @return LoadResult with parsed config or error. A missing file is not
     *         an error: defaults are returned and a warning is logged.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check semantic constraints on an extracted config
     * @return List of human-readable problems (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const HostConfig& config);

private:
    static HostConfig extract_all_sections(const toml::table& root);
    static HostSection extract_host(const toml::table& root);
    static SandboxConfig extract_sandbox(const toml::table& root);
    static RegistryConfig extract_registry(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(HostConfig config);
};

} // namespace pluginhost
