#pragma once

#include "plugin/plugin_loader.hpp"
#include "sandbox/correlation_id.hpp"
#include "sandbox/pending_requests.hpp"
#include "sandbox/permission_gate.hpp"
#include "sandbox/protocol.hpp"
#include "worker/confinement.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pluginhost {

/**
 * @brief Plugin-side execution loop (runs inside plugin_host_worker)
 *
 * The main thread reads frames from the host. INIT loads the entry module;
 * REQUESTs are queued to a small pool of call threads so a slow or blocked
 * plugin call never stops API_RESULT routing. Plugin code reaches the host
 * only through the PluginHostApi table built here, and every entry of that
 * table goes through the PermissionGate first.
 */
class PluginWorker {
public:
    PluginWorker(int fd, std::string plugin_id, size_t call_threads = 4);
    ~PluginWorker();

    PluginWorker(const PluginWorker&) = delete;
    PluginWorker& operator=(const PluginWorker&) = delete;

    /// Serve until SHUTDOWN or channel close. Returns the process exit code.
    int run();

    // Entry points of the C host API table (context = this)
    nlohmann::json invoke_api(const std::string& api, const nlohmann::json& args);
    void plugin_log(const std::string& level, const std::string& message);

private:
    bool handle_init(const nlohmann::json& payload);
    void handle_request(const nlohmann::json& payload);
    void handle_api_result(const nlohmann::json& payload);

    nlohmann::json read_file(const nlohmann::json& args) const;
    nlohmann::json write_file(const nlohmann::json& args) const;
    nlohmann::json emit(const nlohmann::json& args);
    nlohmann::json forward_to_host(const std::string& api, const nlohmann::json& args);

    /// Run one plugin method; nullopt if the plugin does not implement it.
    /// Throws PluginError when the plugin reports a failure.
    std::optional<nlohmann::json> call_plugin(const std::string& method, const nlohmann::json& args);

    bool send(const protocol::Message& msg);
    void call_loop(std::stop_token stoken);
    void stop_call_threads();

    int fd_;
    std::string plugin_id_;
    size_t call_thread_count_;
    std::mutex write_mutex_;

    // Set once by INIT, read-only afterwards
    std::unique_ptr<LoadedModule> module_;
    std::unique_ptr<PermissionGate> gate_;
    nlohmann::json manifest_;
    std::chrono::milliseconds api_call_timeout_{10000};
    ConfinementReport confinement_;

    mutable std::mutex config_mutex_;
    nlohmann::json config_ = nlohmann::json::object();

    // Host API calls awaiting API_RESULT
    PendingRequestTable api_pending_;
    CorrelationIdGenerator api_ids_;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<nlohmann::json> queue_;
    std::vector<std::jthread> call_threads_;
};

} // namespace pluginhost
