#include "worker/plugin_worker.hpp"
#include "core/utils.hpp"
#include "manifest/manifest.hpp"
#include "sandbox/api_args.hpp"
#include "sandbox/host_api_broker.hpp"
#include "worker/confinement.hpp"

#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace pluginhost {

using json = nlohmann::json;
using protocol::Message;
using protocol::MessageType;

namespace {

// Lifecycle hooks a plugin may leave unimplemented
bool is_lifecycle_hook(const std::string& method) {
    return method == "initialize" || method == "cleanup" || method == "configChanged";
}

char* dup_string(const std::string& s) {
    auto* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

std::string error_text(ErrorKind kind, const std::string& message) {
    return json{{"kind", error_kind_to_string(kind)}, {"message", message}}.dump();
}

// ---- PluginHostApi entries (no exception may cross into plugin code) -------

int host_invoke(void* context, const char* api, const char* args_json, char** out_json) {
    auto* worker = static_cast<PluginWorker*>(context);
    std::string out;
    int rc = PLUGINHOST_OK;
    try {
        json args = json::object();
        if (args_json && *args_json) args = json::parse(args_json);
        out = worker->invoke_api(api ? api : "", args).dump();
    } catch (const PluginError& e) {
        out = error_text(e.kind(), e.what());
        rc = PLUGINHOST_ERROR;
    } catch (const json::exception& e) {
        out = error_text(ErrorKind::VALIDATION, std::format("malformed arguments: {}", e.what()));
        rc = PLUGINHOST_ERROR;
    } catch (const std::exception& e) {
        out = error_text(ErrorKind::INTERNAL_ERROR, e.what());
        rc = PLUGINHOST_ERROR;
    }
    if (out_json) *out_json = dup_string(out);
    return rc;
}

void host_free_string(void*, char* str) {
    std::free(str);
}

void host_log(void* context, const char* level, const char* message) {
    static_cast<PluginWorker*>(context)->plugin_log(level ? level : "info", message ? message : "");
}

PluginError plugin_failure(const std::string& method, const std::string& raw) {
    if (!raw.empty()) {
        const json parsed = json::parse(raw, nullptr, false);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
            const std::string kind = parsed.value("kind", std::string("plugin_error"));
            return PluginError(error_kind_from_string(kind), parsed["message"].get<std::string>());
        }
        if (parsed.is_string()) return PluginError(ErrorKind::PLUGIN_ERROR, parsed.get<std::string>());
        return PluginError(ErrorKind::PLUGIN_ERROR, raw);
    }
    return PluginError(ErrorKind::PLUGIN_ERROR, std::format("method '{}' failed", method));
}

} // anonymous namespace

PluginWorker::PluginWorker(int fd, std::string plugin_id, size_t call_threads)
    : fd_(fd),
      plugin_id_(std::move(plugin_id)),
      call_thread_count_(call_threads == 0 ? 1 : call_threads) {}

PluginWorker::~PluginWorker() {
    stop_call_threads();
}

// ============================================================================
// Main loop
// ============================================================================

int PluginWorker::run() {
    int exit_code = 0;
    bool running = true;

    while (running) {
        Message msg;
        const auto status = protocol::read_frame(fd_, msg);
        if (status == protocol::ReadStatus::CLOSED) {
            utils::log::debug(std::format("[worker:{}] host channel closed", plugin_id_));
            break;
        }
        if (status == protocol::ReadStatus::MALFORMED) {
            utils::log::error(std::format("[worker:{}] malformed frame from host", plugin_id_));
            exit_code = 1;
            break;
        }

        switch (msg.type) {
            case MessageType::INIT:
                if (!handle_init(msg.payload)) exit_code = 1;
                break;

            case MessageType::REQUEST: {
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    queue_.push_back(std::move(msg.payload));
                }
                queue_cv_.notify_one();
                break;
            }

            case MessageType::API_RESULT:
                handle_api_result(msg.payload);
                break;

            case MessageType::SHUTDOWN:
                running = false;
                break;

            default:
                utils::log::warn(std::format("[worker:{}] unexpected {} message",
                    plugin_id_, protocol::message_type_to_string(msg.type)));
                break;
        }
    }

    // Release call threads blocked on the host before joining them
    api_pending_.fail_all(ErrorKind::WORKER_TERMINATED, "worker shutting down");
    stop_call_threads();
    module_.reset();
    return exit_code;
}

bool PluginWorker::send(const Message& msg) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return protocol::write_frame(fd_, msg);
}

// ============================================================================
// INIT
// ============================================================================

bool PluginWorker::handle_init(const json& payload) {
    if (module_) {
        utils::log::warn(std::format("[worker:{}] duplicate INIT ignored", plugin_id_));
        return true;
    }

    try {
        using namespace api_args;
        const std::string id = require_string(payload, "pluginId", "INIT");
        if (id != plugin_id_) {
            throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
                std::format("INIT for '{}' sent to worker for '{}'", id, plugin_id_));
        }

        const std::string dir = require_string(payload, "pluginDir", "INIT");
        const std::string main = require_string(payload, "main", "INIT");

        auto grants = permissions_from_json(value_or(payload, "permissions"));
        if (grants.is_error()) {
            throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
                std::format("bad permission grants: {}", grants.error_message()));
        }
        gate_ = std::make_unique<PermissionGate>(
            std::make_shared<const PermissionSnapshot>(grants.value(), dir));

        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_ = value_or(payload, "config");
        }
        manifest_ = value_or(payload, "manifest");
        if (const auto it = payload.find("apiCallTimeoutMs"); it != payload.end() && it->is_number_integer()) {
            if (it->get<int64_t>() > 0) api_call_timeout_ = std::chrono::milliseconds(it->get<int64_t>());
        }

        const auto entry = gate_->resolve_inside_root(main);

        // Before the module loads and before any call thread exists
        confinement_ = confine_worker(gate_->snapshot().root());
        if (!confinement_.complete()) {
            const std::string missing = utils::join(confinement_.notes, "; ");
            if (payload.value("requireConfinement", false)) {
                throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
                    std::format("worker confinement incomplete: {}", missing));
            }
            utils::log::warn(std::format("[worker:{}] partial confinement: {}", plugin_id_, missing));
        }

        auto loaded = load_plugin_module(entry, plugin_id_);
        if (loaded.is_error()) {
            throw PluginError(loaded.error_kind(), loaded.error_message());
        }
        module_ = std::move(loaded.value());
    } catch (const PluginError& e) {
        utils::log::error(std::format("[worker:{}] init failed: {}", plugin_id_, e.what()));
        const auto kind = e.kind() == ErrorKind::PATH_TRAVERSAL ? ErrorKind::SANDBOX_INIT_FAILURE : e.kind();
        if (!send({MessageType::READY, protocol::make_error("", kind, e.what())})) {
            utils::log::error(std::format("[worker:{}] could not report init failure", plugin_id_));
        }
        return false;
    }

    for (size_t i = 0; i < call_thread_count_; ++i) {
        call_threads_.emplace_back([this](std::stop_token st) { call_loop(st); });
    }

    const auto info = module_->plugin->get_info(module_->plugin->instance);
    const json ready = {
        {"ok", true},
        {"name", info.name ? info.name : plugin_id_},
        {"version", info.version ? info.version : ""},
        {"confinement", confinement_.to_json()},
    };
    return send({MessageType::READY, ready});
}

// ============================================================================
// REQUEST handling (call threads)
// ============================================================================

void PluginWorker::call_loop(std::stop_token stoken) {
    while (true) {
        json request;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, stoken, [this] { return !queue_.empty(); });
            if (stoken.stop_requested()) return;
            request = std::move(queue_.front());
            queue_.pop_front();
        }
        handle_request(request);
    }
}

void PluginWorker::stop_call_threads() {
    for (auto& t : call_threads_) t.request_stop();
    for (auto& t : call_threads_) {
        if (t.joinable()) t.join();
    }
    call_threads_.clear();
}

void PluginWorker::handle_request(const json& payload) {
    const std::string id = payload.is_object() ? payload.value("id", std::string()) : std::string();
    const std::string method = payload.is_object() ? payload.value("method", std::string()) : std::string();
    const json args = api_args::value_or(payload, "args");

    json response;
    try {
        if (id.empty() || method.empty()) {
            throw PluginError(ErrorKind::VALIDATION, "request needs an id and a method");
        }
        if (method == "configChanged") {
            if (const auto it = args.find("config"); args.is_object() && it != args.end() && it->is_object()) {
                std::lock_guard<std::mutex> lock(config_mutex_);
                config_ = *it;
            }
        }

        auto result = call_plugin(method, args);
        if (!result) {
            if (!is_lifecycle_hook(method)) {
                throw PluginError(ErrorKind::NOT_FOUND,
                    std::format("plugin '{}' does not implement '{}'", plugin_id_, method));
            }
            result = json();
        }
        response = protocol::make_result(id, std::move(*result));
    } catch (const PluginError& e) {
        response = protocol::make_error(id, e.kind(), e.what());
    } catch (const std::exception& e) {
        response = protocol::make_error(id, ErrorKind::INTERNAL_ERROR, e.what());
    }

    if (!send({MessageType::RESPONSE, response})) {
        utils::log::warn(std::format("[worker:{}] could not deliver response for '{}'", plugin_id_, method));
    }
}

std::optional<json> PluginWorker::call_plugin(const std::string& method, const json& args) {
    if (!module_) {
        throw PluginError(ErrorKind::NOT_AVAILABLE, "plugin module is not loaded");
    }
    HostedPlugin* plugin = module_->plugin;

    PluginHostApi host{this, &host_invoke, &host_free_string, &host_log};

    char* out = nullptr;
    const std::string args_text = args.dump();
    const int rc = plugin->call(plugin->instance, &host, method.c_str(), args_text.c_str(), &out);

    std::string raw = out ? out : "";
    if (out) plugin->free_string(plugin->instance, out);

    switch (rc) {
        case PLUGINHOST_OK: {
            if (raw.empty()) return json();
            json parsed = json::parse(raw, nullptr, false);
            if (parsed.is_discarded()) {
                throw PluginError(ErrorKind::PLUGIN_ERROR,
                    std::format("method '{}' returned malformed JSON", method));
            }
            return parsed;
        }
        case PLUGINHOST_METHOD_NOT_FOUND:
            return std::nullopt;
        default:
            throw plugin_failure(method, raw);
    }
}

// ============================================================================
// Plugin-facing API
// ============================================================================

json PluginWorker::invoke_api(const std::string& api, const json& args) {
    if (!gate_) {
        throw PluginError(ErrorKind::NOT_AVAILABLE, "worker is not initialized");
    }

    if (api == "readFile") return read_file(args);
    if (api == "writeFile") return write_file(args);
    if (api == "emit") return emit(args);
    if (api == "getConfig") {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return config_;
    }
    if (api == "getManifest") return manifest_;
    if (HostApiBroker::is_host_api(api)) return forward_to_host(api, args);

    throw PluginError(ErrorKind::VALIDATION, std::format("unknown API '{}'", api));
}

void PluginWorker::plugin_log(const std::string& level, const std::string& message) {
    if (!send({MessageType::LOG, {{"level", level}, {"message", message}}})) {
        utils::log::info(std::format("[plugin:{}] {}", plugin_id_, message));
    }
}

json PluginWorker::read_file(const json& args) const {
    const std::string path = api_args::require_string(args, "path", "readFile");
    return gate_->guard(permission::FileRead{path}, [&](const Clearance& clearance) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(clearance.resolved_path, ec)) {
            throw PluginError(ErrorKind::IO_ERROR, std::format("readFile: no such file '{}'", path));
        }
        std::ifstream in(clearance.resolved_path, std::ios::binary);
        if (!in) {
            throw PluginError(ErrorKind::IO_ERROR, std::format("readFile: cannot open '{}'", path));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return json(ss.str());
    });
}

json PluginWorker::write_file(const json& args) const {
    const std::string path = api_args::require_string(args, "path", "writeFile");
    const std::string content = api_args::require_string(args, "content", "writeFile");
    return gate_->guard(permission::FileWrite{path}, [&](const Clearance& clearance) {
        std::error_code ec;
        std::filesystem::create_directories(clearance.resolved_path.parent_path(), ec);
        if (ec) {
            throw PluginError(ErrorKind::IO_ERROR,
                std::format("writeFile: cannot create parent of '{}': {}", path, ec.message()));
        }
        std::ofstream out(clearance.resolved_path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw PluginError(ErrorKind::IO_ERROR, std::format("writeFile: cannot write '{}'", path));
        }
        return json{{"path", path}, {"bytesWritten", content.size()}};
    });
}

json PluginWorker::emit(const json& args) {
    const std::string event = api_args::require_string(args, "event", "emit");
    const json data = args.contains("data") ? args["data"] : json();
    if (!send({MessageType::EVENT, {{"event", event}, {"data", data}}})) {
        throw PluginError(ErrorKind::WORKER_TERMINATED, "host channel closed");
    }
    return json{{"emitted", true}};
}

json PluginWorker::forward_to_host(const std::string& api, const json& args) {
    // Gated here and again by the host's own snapshot
    gate_->check(HostApiBroker::requirement_for(api, args));

    const std::string id = api_ids_.next();
    auto future = api_pending_.insert(id, api, api_call_timeout_);
    if (!send({MessageType::API_CALL, {{"id", id}, {"api", api}, {"args", args}}})) {
        api_pending_.fail(id, ErrorKind::WORKER_TERMINATED, "host channel closed");
    }

    if (future.wait_for(api_call_timeout_) != std::future_status::ready) {
        api_pending_.fail(id, ErrorKind::TIMEOUT,
            std::format("host API '{}' timed out after {} ms", api, api_call_timeout_.count()));
    }
    return future.get();
}

void PluginWorker::handle_api_result(const json& payload) {
    const std::string id = payload.is_object() ? payload.value("id", std::string()) : std::string();
    bool matched = false;
    if (payload.is_object() && payload.value("ok", false)) {
        matched = api_pending_.complete(id, payload.contains("result") ? payload["result"] : json());
    } else {
        const auto err = protocol::decode_error(payload);
        matched = api_pending_.fail(id, err.kind(), err.what());
    }
    if (!matched) {
        utils::log::debug(std::format("[worker:{}] dropped API_RESULT for unknown call {}", plugin_id_, id));
    }
}

} // namespace pluginhost
