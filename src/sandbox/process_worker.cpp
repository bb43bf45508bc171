#include "sandbox/process_worker.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <vector>

namespace pluginhost {

namespace {

constexpr int kChildChannelFd = 3;

// Runs between fork and exec: async-signal-safe calls only
[[noreturn]] void exec_child(int channel_fd, const WorkerSpec& spec, char* const argv[]) {
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() == 1) {
        ::_exit(127);
    }
    // Set-uid helpers the plugin might exec gain nothing
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        ::_exit(127);
    }

    if (spec.memory_limit_mb > 0) {
        const rlim_t bytes = static_cast<rlim_t>(spec.memory_limit_mb) * 1024 * 1024;
        struct rlimit mem_limit { bytes, bytes };
        ::setrlimit(RLIMIT_AS, &mem_limit);
    }
    if (spec.cpu_limit_seconds > 0) {
        const rlim_t secs = spec.cpu_limit_seconds;
        struct rlimit cpu_limit { secs, secs };
        ::setrlimit(RLIMIT_CPU, &cpu_limit);
    }

    if (channel_fd == kChildChannelFd) {
        // dup2 onto itself keeps FD_CLOEXEC; clear it explicitly
        const int flags = ::fcntl(channel_fd, F_GETFD);
        ::fcntl(channel_fd, F_SETFD, flags & ~FD_CLOEXEC);
    } else if (::dup2(channel_fd, kChildChannelFd) < 0) {
        ::_exit(127);
    }

    ::execv(argv[0], argv);
    ::_exit(127);
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return std::format("exited with status {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return std::format("killed by signal {}", WTERMSIG(status));
    return "ended";
}

} // anonymous namespace

ProcessWorker::~ProcessWorker() {
    terminate();
}

void ProcessWorker::start(const WorkerSpec& spec, MessageHandler on_message, ExitHandler on_exit) {
    if (running_.load()) {
        throw PluginError(ErrorKind::INTERNAL_ERROR, "worker already started");
    }

    plugin_id_ = spec.plugin_id;
    on_message_ = std::move(on_message);
    on_exit_ = std::move(on_exit);

    if (::access(spec.executable.c_str(), X_OK) != 0) {
        throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("worker executable '{}' not usable: {}",
                spec.executable.string(), std::strerror(errno)));
    }

    int sockets[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockets) != 0) {
        throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("socketpair failed: {}", std::strerror(errno)));
    }

    // argv must be built before fork
    std::string exe = spec.executable.string();
    std::string fd_flag = "--fd";
    std::string fd_value = std::to_string(kChildChannelFd);
    std::string id_flag = "--plugin";
    std::string id_value = spec.plugin_id;
    std::vector<char*> argv = {exe.data(), fd_flag.data(), fd_value.data(),
                               id_flag.data(), id_value.data(), nullptr};

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(sockets[0]);
        ::close(sockets[1]);
        throw PluginError(ErrorKind::SANDBOX_INIT_FAILURE,
            std::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        ::close(sockets[0]);
        exec_child(sockets[1], spec, argv.data());
    }

    ::close(sockets[1]);
    fd_ = sockets[0];
    pid_.store(pid);
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        reaped_ = false;
    }
    stopping_.store(false);
    running_.store(true);

    reader_ = std::jthread([this](std::stop_token) { reader_loop(); });

    utils::log::debug(std::format("Plugin '{}': worker process {} started", plugin_id_, pid));
}

bool ProcessWorker::send(const protocol::Message& msg) {
    if (!running_.load()) return false;
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ < 0) return false;
    return protocol::write_frame(fd_, msg);
}

void ProcessWorker::reader_loop() {
    std::string reason = "worker closed the channel";
    while (true) {
        protocol::Message msg;
        const auto status = protocol::read_frame(fd_, msg);
        if (status == protocol::ReadStatus::MALFORMED) {
            reason = "worker sent a malformed frame";
            break;
        }
        if (status == protocol::ReadStatus::CLOSED) break;
        if (on_message_) on_message_(std::move(msg));
    }

    running_.store(false);
    if (stopping_.load()) return;

    const auto how = reap(std::chrono::milliseconds(500));
    if (!how.empty()) reason += std::format(" ({})", how);

    utils::log::warn(std::format("Plugin '{}': worker terminated unexpectedly: {}", plugin_id_, reason));
    if (on_exit_) on_exit_(reason);
}

std::string ProcessWorker::reap(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    const pid_t pid = pid_.load();
    if (reaped_ || pid <= 0) return {};

    const auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (true) {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            reaped_ = true;
            return describe_status(status);
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            reaped_ = true;
            return {};
        }
        if (std::chrono::steady_clock::now() >= deadline) return {};
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ProcessWorker::terminate() {
    const pid_t pid = pid_.load();
    if (pid <= 0) return;
    if (stopping_.exchange(true)) return;

    // Ask politely first, then force
    if (running_.load()) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        (void)protocol::write_frame(fd_, {protocol::MessageType::SHUTDOWN, nlohmann::json::object()});
    }
    if (reap(std::chrono::milliseconds(200)).empty()) {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        if (!reaped_) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, nullptr, 0) < 0) {
                if (errno != EINTR) break;
            }
            reaped_ = true;
        }
    }

    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    running_.store(false);
    utils::log::debug(std::format("Plugin '{}': worker process {} stopped", plugin_id_, pid));
}

bool ProcessWorker::is_running() const {
    return running_.load();
}

std::optional<uint64_t> ProcessWorker::memory_usage() const {
    const pid_t pid = pid_.load();
    if (pid <= 0 || !running_.load()) return std::nullopt;

    std::ifstream statm(std::format("/proc/{}/statm", pid));
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) return std::nullopt;

    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0) return std::nullopt;
    return resident_pages * static_cast<uint64_t>(page_size);
}

WorkerFactory make_process_worker_factory() {
    return [] { return std::make_unique<ProcessWorker>(); };
}

} // namespace pluginhost
