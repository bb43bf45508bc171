#include "sandbox/sandbox.hpp"
#include "core/utils.hpp"

#include <format>

namespace pluginhost {

using json = nlohmann::json;
using protocol::Message;
using protocol::MessageType;

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "uninitialized";
        case SandboxState::INITIALIZING:  return "initializing";
        case SandboxState::READY:         return "ready";
        case SandboxState::TERMINATED:    return "terminated";
    }
    return "unknown";
}

namespace {

constexpr auto kReaperInterval = std::chrono::milliseconds(20);

std::string string_member(const json& obj, const char* key) {
    if (!obj.is_object()) return {};
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // anonymous namespace

Sandbox::Sandbox(PluginManifest manifest,
                 SandboxOptions options,
                 WorkerFactory worker_factory,
                 HostServices services,
                 EventCallback on_event)
    : manifest_(std::move(manifest)),
      options_(std::move(options)),
      worker_factory_(std::move(worker_factory)),
      services_(std::move(services)),
      on_event_(std::move(on_event)) {}

Sandbox::~Sandbox() {
    terminate();
}

// ============================================================================
// Initialization
// ============================================================================

void Sandbox::initialize(const std::filesystem::path& plugin_dir, const json& config) {
    std::future<json> ready;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SandboxState::UNINITIALIZED) {
            throw PluginError(ErrorKind::INTERNAL_ERROR,
                std::format("sandbox for '{}' is already {}", manifest_.id, sandbox_state_to_string(state_)));
        }
        state_ = SandboxState::INITIALIZING;
        ready_promise_.emplace();
        ready = ready_promise_->get_future();
    }

    const auto fail = [this](const std::string& message) {
        terminate();
        utils::log::error(std::format("Plugin '{}': sandbox initialization failed: {}", manifest_.id, message));
        throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE, message);
    };

    snapshot_ = std::make_shared<const PermissionSnapshot>(manifest_.permissions, plugin_dir);
    broker_ = std::make_unique<HostApiBroker>(manifest_.id, snapshot_, services_, options_.api_call_timeout);

    std::shared_ptr<IWorker> worker;
    try {
        worker = worker_factory_ ? std::shared_ptr<IWorker>(worker_factory_()) : nullptr;
        if (!worker) fail("no worker available");
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            worker_ = worker;
        }

        WorkerSpec spec;
        spec.plugin_id = manifest_.id;
        spec.plugin_dir = snapshot_->root();
        spec.executable = options_.worker_executable;
        spec.memory_limit_mb = options_.memory_limit_mb;
        spec.cpu_limit_seconds = options_.cpu_limit_seconds;

        worker->start(spec,
            [this](Message msg) { on_message(std::move(msg)); },
            [this](const std::string& reason) { on_worker_exit(reason); });
    } catch (const PluginError& e) {
        if (e.kind() == ErrorKind::SANDBOX_INIT_FAILURE && state() == SandboxState::TERMINATED) throw;
        fail(e.what());
    } catch (const std::exception& e) {
        fail(std::format("worker spawn failed: {}", e.what()));
    }

    start_threads();

    const json init = {
        {"pluginId", manifest_.id},
        {"pluginDir", snapshot_->root().string()},
        {"main", manifest_.main},
        {"permissions", permissions_to_json(manifest_.permissions)},
        {"config", config},
        {"manifest", to_json(manifest_)},
        {"apiCallTimeoutMs", options_.api_call_timeout.count()},
        {"requireConfinement", options_.require_confinement},
    };
    if (!worker->send({MessageType::INIT, init})) {
        fail("could not deliver INIT to worker");
    }

    if (ready.wait_for(options_.init_timeout) != std::future_status::ready) {
        fail(std::format("plugin did not become ready within {} ms", options_.init_timeout.count()));
    }

    json info;
    try {
        info = ready.get();
    } catch (const PluginError& e) {
        fail(e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SandboxState::INITIALIZING) {
            // Worker died between READY and here
            const auto reason = exit_reason_;
            state_ = SandboxState::TERMINATED;
            throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
                std::format("worker terminated during initialization: {}", reason));
        }
        state_ = SandboxState::READY;
        if (const auto it = info.find("confinement"); it != info.end() && it->is_object()) {
            confinement_ = *it;
        }
    }

    utils::log::info(std::format("Plugin '{}': sandbox ready ({} v{})", manifest_.id,
        string_member(info, "name"), string_member(info, "version")));
    const json report = confinement();
    if (!report.value("filesystem", false) || !report.value("network", false)) {
        utils::log::warn(std::format("Plugin '{}': worker runs without full OS confinement {}",
            manifest_.id, report.dump()));
    }
}

// ============================================================================
// RPC
// ============================================================================

std::future<json> Sandbox::execute(const std::string& method, const json& args) {
    std::shared_ptr<IWorker> worker;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SandboxState::READY || !worker_) {
            throw PluginError(ErrorKind::NOT_AVAILABLE,
                std::format("sandbox for '{}' is {}", manifest_.id, sandbox_state_to_string(state_)));
        }
        worker = worker_;
    }

    const std::string id = ids_.next();
    auto future = pending_.insert(id, method, options_.rpc_timeout);

    const json request = {{"id", id}, {"method", method}, {"args", args}};
    if (!worker->send({MessageType::REQUEST, request})) {
        pending_.fail(id, ErrorKind::WORKER_TERMINATED, "worker channel closed");
    }
    return future;
}

json Sandbox::call(const std::string& method, const json& args) {
    auto future = execute(method, args);
    return future.get();
}

// ============================================================================
// Termination
// ============================================================================

void Sandbox::terminate() {
    std::shared_ptr<IWorker> worker;
    std::optional<std::promise<json>> ready;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SandboxState::UNINITIALIZED) {
            state_ = SandboxState::TERMINATED;
            return;
        }
        if (state_ == SandboxState::TERMINATED && !worker_) return;
        state_ = SandboxState::TERMINATED;
        worker = std::move(worker_);
        worker_.reset();
        ready = std::move(ready_promise_);
        ready_promise_.reset();
        if (exit_reason_.empty()) exit_reason_ = "terminated by host";
    }

    stop_threads();
    if (worker) worker->terminate();

    if (ready) {
        ready->set_exception(std::make_exception_ptr(
            PluginError(ErrorKind::SANDBOX_INIT_FAILURE, "sandbox terminated during initialization")));
    }

    const size_t rejected = pending_.fail_all(ErrorKind::WORKER_TERMINATED,
        std::format("sandbox for '{}' was terminated", manifest_.id));
    if (rejected > 0) {
        utils::log::warn(std::format("Plugin '{}': rejected {} pending call(s) on terminate",
            manifest_.id, rejected));
    }
    utils::log::debug(std::format("Plugin '{}': sandbox terminated", manifest_.id));
}

void Sandbox::on_worker_exit(const std::string& reason) {
    std::optional<std::promise<json>> ready;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exit_reason_ = reason;
        if (state_ == SandboxState::TERMINATED) return;
        state_ = SandboxState::TERMINATED;
        ready = std::move(ready_promise_);
        ready_promise_.reset();
    }

    if (ready) {
        ready->set_exception(std::make_exception_ptr(PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("worker exited during initialization: {}", reason))));
    }
    pending_.fail_all(ErrorKind::WORKER_TERMINATED,
        std::format("plugin worker terminated: {}", reason));
}

SandboxState Sandbox::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<uint64_t> Sandbox::memory_usage() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!worker_) return std::nullopt;
    return worker_->memory_usage();
}

std::string Sandbox::exit_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_reason_;
}

json Sandbox::confinement() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return confinement_;
}

// ============================================================================
// Inbound message routing (worker reader thread)
// ============================================================================

void Sandbox::on_message(Message msg) {
    switch (msg.type) {
        case MessageType::READY:
            on_ready(msg.payload);
            break;

        case MessageType::RESPONSE:
            on_response(msg.payload);
            break;

        case MessageType::API_CALL: {
            {
                std::lock_guard<std::mutex> lock(api_mutex_);
                api_queue_.push_back(std::move(msg.payload));
            }
            api_cv_.notify_one();
            break;
        }

        case MessageType::EVENT:
            if (on_event_) {
                const std::string event = string_member(msg.payload, "event");
                if (event.empty()) {
                    utils::log::warn(std::format("Plugin '{}': EVENT without a name ignored", manifest_.id));
                    break;
                }
                const auto it = msg.payload.find("data");
                on_event_(manifest_.id, event, it != msg.payload.end() ? *it : json());
            }
            break;

        case MessageType::LOG:
            on_log(msg.payload);
            break;

        default:
            utils::log::warn(std::format("Plugin '{}': unexpected {} message from worker",
                manifest_.id, protocol::message_type_to_string(msg.type)));
            break;
    }
}

void Sandbox::on_ready(const json& payload) {
    std::optional<std::promise<json>> ready;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ready = std::move(ready_promise_);
        ready_promise_.reset();
    }
    if (!ready) {
        utils::log::warn(std::format("Plugin '{}': unexpected READY ignored", manifest_.id));
        return;
    }

    const auto ok = payload.find("ok");
    if (ok != payload.end() && ok->is_boolean() && ok->get<bool>()) {
        ready->set_value(payload);
    } else {
        ready->set_exception(std::make_exception_ptr(protocol::decode_error(payload)));
    }
}

void Sandbox::on_response(const json& payload) {
    const std::string id = string_member(payload, "id");
    if (id.empty()) {
        utils::log::warn(std::format("Plugin '{}': RESPONSE without id ignored", manifest_.id));
        return;
    }

    const auto ok = payload.find("ok");
    bool matched = false;
    if (ok != payload.end() && ok->is_boolean() && ok->get<bool>()) {
        const auto result = payload.find("result");
        matched = pending_.complete(id, result != payload.end() ? *result : json());
    } else {
        const auto err = protocol::decode_error(payload);
        matched = pending_.fail(id, err.kind(), err.what());
    }

    if (!matched) {
        utils::log::debug(std::format("Plugin '{}': dropped response for unknown or expired call {}",
            manifest_.id, id));
    }
}

void Sandbox::on_log(const json& payload) const {
    const std::string level = string_member(payload, "level");
    const std::string line = std::format("[plugin:{}] {}", manifest_.id, string_member(payload, "message"));
    switch (utils::log::parse_level(level)) {
        case utils::log::Level::DEBUG: utils::log::debug(line); break;
        case utils::log::Level::INFO:  utils::log::info(line); break;
        case utils::log::Level::WARN:  utils::log::warn(line); break;
        case utils::log::Level::ERROR: utils::log::error(line); break;
    }
}

// ============================================================================
// Background threads
// ============================================================================

void Sandbox::start_threads() {
    reaper_ = std::jthread([this](std::stop_token st) { reaper_loop(st); });
    dispatcher_ = std::jthread([this](std::stop_token st) { dispatcher_loop(st); });
}

void Sandbox::stop_threads() {
    reaper_.request_stop();
    dispatcher_.request_stop();
    if (reaper_.joinable() && reaper_.get_id() != std::this_thread::get_id()) reaper_.join();
    if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) dispatcher_.join();
}

void Sandbox::reaper_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(reaper_mutex_);
            reaper_cv_.wait_for(lock, stoken, kReaperInterval, [] { return false; });
        }
        const size_t expired = pending_.expire(PendingRequestTable::Clock::now());
        if (expired > 0) {
            utils::log::warn(std::format("Plugin '{}': {} call(s) timed out", manifest_.id, expired));
        }
    }
}

void Sandbox::dispatcher_loop(std::stop_token stoken) {
    while (true) {
        json call;
        {
            std::unique_lock<std::mutex> lock(api_mutex_);
            api_cv_.wait(lock, stoken, [this] { return !api_queue_.empty(); });
            if (stoken.stop_requested()) return;
            call = std::move(api_queue_.front());
            api_queue_.pop_front();
        }

        const std::string id = string_member(call, "id");
        const std::string api = string_member(call, "api");
        const auto args_it = call.is_object() ? call.find("args") : call.end();
        const json args = (call.is_object() && args_it != call.end()) ? *args_it : json::object();

        json reply;
        try {
            reply = protocol::make_result(id, broker_->dispatch(api, args));
        } catch (const PluginError& e) {
            utils::log::debug(std::format("Plugin '{}': host API '{}' rejected: {}", manifest_.id, api, e.what()));
            reply = protocol::make_error(id, e.kind(), e.what());
        } catch (const std::exception& e) {
            utils::log::error(std::format("Plugin '{}': host API '{}' failed: {}", manifest_.id, api, e.what()));
            reply = protocol::make_error(id, ErrorKind::INTERNAL_ERROR, e.what());
        }

        std::shared_ptr<IWorker> worker;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            worker = worker_;
        }
        if (!worker || !worker->send({MessageType::API_RESULT, reply})) {
            utils::log::warn(std::format("Plugin '{}': could not deliver result of '{}'", manifest_.id, api));
        }
    }
}

} // namespace pluginhost
