#include "host/host_context.hpp"
#include "core/utils.hpp"
#include "registry/http_registry_transport.hpp"
#include "registry/local_registry_transport.hpp"
#include "sandbox/http_network_client.hpp"
#include "sandbox/process_worker.hpp"

#include <format>
#include <system_error>

namespace pluginhost {

namespace fs = std::filesystem;

HostContext::HostContext(const HostConfig& config,
                         HostServices services,
                         WorkerFactory worker_factory)
    : services_(std::move(services)) {
    if (!services_.ui) {
        ui_registry_ = std::make_shared<UiRegistry>();
        services_.ui = ui_registry_;
    }
    if (!services_.network) {
        services_.network = std::make_shared<HttpNetworkClient>();
    }

    RegistryClient::Options registry_options;
    registry_options.freshness_window = std::chrono::hours(config.registry.freshness_hours);
    registry_options.max_results = config.registry.max_search_results;
    registry_ = std::make_shared<RegistryClient>(make_transport(config.registry), registry_options);

    PluginManagerOptions options;
    options.plugins_dir = config.host.plugins_dir;
    options.host_version = config.host.version;
    options.sandbox = sandbox_options(config.sandbox);

    const std::string worker_path = options.sandbox.worker_executable.string();

    if (!worker_factory) {
        worker_factory = make_process_worker_factory();
    }

    manager_ = std::make_unique<PluginManager>(std::move(options), registry_,
                                               std::move(worker_factory), services_);

    utils::log::info(std::format("Host context ready (host v{}, plugins in {}, worker {})",
        config.host.version, config.host.plugins_dir, worker_path));
}

HostContext::~HostContext() {
    // Sandboxes go before the collaborators they call into
    manager_.reset();
}

std::shared_ptr<IRegistryTransport> HostContext::make_transport(const RegistryConfig& config) const {
    if (!config.local_path.empty()) {
        utils::log::info(std::format("Registry: local catalog at {}", config.local_path));
        return std::make_shared<LocalRegistryTransport>(config.local_path);
    }
    utils::log::info(std::format("Registry: {}", config.url));
    return std::make_shared<HttpRegistryTransport>(config.url, std::chrono::milliseconds{config.timeout_ms});
}

SandboxOptions HostContext::sandbox_options(const SandboxConfig& config) {
    SandboxOptions options;
    options.worker_executable = resolve_worker_executable(config.worker_executable);
    options.rpc_timeout = std::chrono::milliseconds{config.rpc_timeout_ms};
    options.init_timeout = std::chrono::milliseconds{config.init_timeout_ms};
    options.api_call_timeout = std::chrono::milliseconds{config.api_call_timeout_ms};
    options.memory_limit_mb = config.memory_limit_mb;
    options.cpu_limit_seconds = config.cpu_limit_seconds;
    options.require_confinement = config.require_confinement;
    return options;
}

fs::path HostContext::resolve_worker_executable(const std::string& configured) {
    const fs::path path(configured);
    if (path.is_absolute()) return path;

    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        utils::log::warn(std::format("Cannot locate own executable ({}); worker path '{}' used as is",
            ec.message(), configured));
        return path;
    }
    return self.parent_path() / path;
}

} // namespace pluginhost
