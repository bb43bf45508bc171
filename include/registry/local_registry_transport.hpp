#pragma once

#include "registry/registry_transport.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace pluginhost {

/**
 * @brief Directory-backed catalog (offline installs, tests)
 *
 *   <root>/catalog.json                {"plugins": [{summary..., "versions": [...]}]}
 *   <root>/packages/<id>-<version>.pkg package bytes
 *
 * catalog.json is re-read on every call.
 */
class LocalRegistryTransport : public IRegistryTransport {
public:
    explicit LocalRegistryTransport(std::filesystem::path root);

    [[nodiscard]] std::vector<PluginSummary> search(const std::string& query,
                                                    const SearchFilter& filter) override;
    [[nodiscard]] std::optional<PluginSummary> get_plugin(const std::string& id) override;
    [[nodiscard]] std::vector<PluginVersionInfo> get_versions(const std::string& id) override;
    [[nodiscard]] std::string download(const std::string& id, const std::string& version) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    [[nodiscard]] nlohmann::json load_catalog() const;
    [[nodiscard]] const nlohmann::json* find_entry(const nlohmann::json& catalog, const std::string& id) const;

    std::filesystem::path root_;
};

} // namespace pluginhost
