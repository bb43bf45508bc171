#pragma once

#include "sandbox/worker.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace pluginhost {

/**
 * @brief Worker running in a separate OS process
 *
 * fork+exec of plugin_host_worker over an AF_UNIX socketpair. The child
 * dies with the host (PR_SET_PDEATHSIG) and runs under RLIMIT_AS / RLIMIT_CPU.
 */
class ProcessWorker : public IWorker {
public:
    ProcessWorker() = default;
    ~ProcessWorker() override;

    ProcessWorker(const ProcessWorker&) = delete;
    ProcessWorker& operator=(const ProcessWorker&) = delete;

    void start(const WorkerSpec& spec, MessageHandler on_message, ExitHandler on_exit) override;
    [[nodiscard]] bool send(const protocol::Message& msg) override;
    void terminate() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::optional<uint64_t> memory_usage() const override;

    [[nodiscard]] pid_t pid() const { return pid_.load(); }

private:
    void reader_loop();

    /// waitpid with a grace period; returns a description of how the child ended
    std::string reap(std::chrono::milliseconds grace);

    std::string plugin_id_;
    MessageHandler on_message_;
    ExitHandler on_exit_;

    std::atomic<pid_t> pid_{-1};
    int fd_ = -1;
    std::mutex write_mutex_;
    std::mutex reap_mutex_;
    bool reaped_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::jthread reader_;
};

/// Factory producing ProcessWorker instances
[[nodiscard]] WorkerFactory make_process_worker_factory();

} // namespace pluginhost
