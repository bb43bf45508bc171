#pragma once

#include "sandbox/protocol.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pluginhost {

struct WorkerSpec {
    std::string plugin_id;
    std::filesystem::path plugin_dir;
    std::filesystem::path executable;       // plugin_host_worker
    uint32_t memory_limit_mb = 512;         // 0 = unlimited
    uint32_t cpu_limit_seconds = 0;         // 0 = unlimited
};

/**
 * @brief Host side of the worker boundary (typed message channel)
 *
 * Implementations deliver inbound messages and the exit notification from
 * their own reader thread. terminate() is idempotent and suppresses the
 * exit callback for an intentional shutdown.
 */
class IWorker {
public:
    using MessageHandler = std::function<void(protocol::Message)>;
    using ExitHandler = std::function<void(const std::string& reason)>;

    virtual ~IWorker() = default;

    /// Spawn the worker. Throws PluginError(SANDBOX_INIT_FAILURE).
    virtual void start(const WorkerSpec& spec, MessageHandler on_message, ExitHandler on_exit) = 0;

    /// Send one message. Returns false if the channel is closed.
    [[nodiscard]] virtual bool send(const protocol::Message& msg) = 0;

    virtual void terminate() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Resident set size in bytes, if it can be sampled
    [[nodiscard]] virtual std::optional<uint64_t> memory_usage() const = 0;
};

using WorkerFactory = std::function<std::unique_ptr<IWorker>()>;

} // namespace pluginhost
