#pragma once

#include "config/config_types.hpp"
#include "host/ui_registry.hpp"
#include "plugin/plugin_manager.hpp"
#include "registry/registry_client.hpp"
#include "sandbox/host_services.hpp"
#include "sandbox/worker.hpp"

#include <filesystem>
#include <memory>

namespace pluginhost {

/**
 * @brief Composition root: everything the host needs, built once from HostConfig
 *
 * Owns the registry transport and client, the collaborator handles, the
 * worker factory and the PluginManager. Agent, model and memory collaborators
 * are left unset unless the embedding application provides them.
 */
class HostContext {
public:
    /**
     * @param config       Parsed configuration
     * @param services     Collaborators supplied by the embedder; a missing UI
     *                     bridge is replaced by a UiRegistry
     * @param worker_factory Empty = ProcessWorker
     */
    explicit HostContext(const HostConfig& config,
                         HostServices services = {},
                         WorkerFactory worker_factory = {});
    ~HostContext();

    HostContext(const HostContext&) = delete;
    HostContext& operator=(const HostContext&) = delete;

    [[nodiscard]] PluginManager& manager() { return *manager_; }
    [[nodiscard]] const std::shared_ptr<RegistryClient>& registry() const { return registry_; }
    [[nodiscard]] const HostServices& services() const { return services_; }

    /// Null when the embedder supplied its own IUiBridge
    [[nodiscard]] const std::shared_ptr<UiRegistry>& ui_registry() const { return ui_registry_; }

    /**
     * @brief Resolve a configured worker path
     *
     * Absolute paths are kept; relative ones are taken against the directory
     * of the running executable (so the worker is found beside plugin_host).
     */
    [[nodiscard]] static std::filesystem::path resolve_worker_executable(const std::string& configured);

    [[nodiscard]] static SandboxOptions sandbox_options(const SandboxConfig& config);

private:
    std::shared_ptr<IRegistryTransport> make_transport(const RegistryConfig& config) const;

    std::shared_ptr<UiRegistry> ui_registry_;
    HostServices services_;
    std::shared_ptr<RegistryClient> registry_;
    std::unique_ptr<PluginManager> manager_;
};

} // namespace pluginhost
