#pragma once

#include "registry/registry_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pluginhost {

/**
 * @brief Catalog transport collaborator
 *
 * The only four operations the rest of the subsystem needs. Failures throw
 * PluginError(REGISTRY_ERROR); an unknown id/version throws NOT_FOUND.
 */
class IRegistryTransport {
public:
    virtual ~IRegistryTransport() = default;

    /// Empty query and filter = the whole catalog
    [[nodiscard]] virtual std::vector<PluginSummary> search(const std::string& query,
                                                            const SearchFilter& filter) = 0;

    /// nullopt when the catalog has no such plugin
    [[nodiscard]] virtual std::optional<PluginSummary> get_plugin(const std::string& id) = 0;

    [[nodiscard]] virtual std::vector<PluginVersionInfo> get_versions(const std::string& id) = 0;

    /// Raw package bytes
    [[nodiscard]] virtual std::string download(const std::string& id, const std::string& version) = 0;
};

} // namespace pluginhost
