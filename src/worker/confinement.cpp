#include "worker/confinement.hpp"

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>

namespace pluginhost {

namespace {

// ============================================================================
// Landlock
// ============================================================================

constexpr uint64_t kFileAccess = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
                                 LANDLOCK_ACCESS_FS_READ_FILE;

constexpr uint64_t kReadOnly = LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

constexpr uint64_t kReadExec = kReadOnly | LANDLOCK_ACCESS_FS_EXECUTE;

constexpr uint64_t kPluginDirAccess = kReadOnly | LANDLOCK_ACCESS_FS_WRITE_FILE |
                                      LANDLOCK_ACCESS_FS_REMOVE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR |
                                      LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG;

// Trees a dynamically linked plugin needs to finish loading
constexpr const char* kSystemReadExec[] = {"/usr", "/lib", "/lib64", "/lib32"};
constexpr const char* kSystemReadOnly[] = {
    "/etc/ld.so.cache", "/etc/ld.so.conf", "/etc/ld.so.conf.d", "/etc/localtime",
    "/dev/urandom",
};

int landlock_abi_version() {
    const long abi = ::syscall(__NR_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : static_cast<int>(abi);
}

uint64_t handled_access(int abi) {
    uint64_t handled = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
                       LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR |
                       LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
                       LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR |
                       LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_SOCK |
                       LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
                       LANDLOCK_ACCESS_FS_MAKE_SYM;
    if (abi >= 2) handled |= LANDLOCK_ACCESS_FS_REFER;
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) handled |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
    return handled;
}

/// false only on a real failure; a path that does not exist is skipped
bool allow_path(int ruleset_fd, const char* path, uint64_t access, uint64_t handled, std::string& error) {
    const int fd = ::open(path, O_PATH | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) return true;
        error = std::format("open {}: {}", path, std::strerror(errno));
        return false;
    }

    struct stat st{};
    if (::fstat(fd, &st) == 0 && !S_ISDIR(st.st_mode)) {
        access &= kFileAccess;
    }

    struct landlock_path_beneath_attr rule{};
    rule.allowed_access = access & handled;
    rule.parent_fd = fd;
    const long rc = ::syscall(__NR_landlock_add_rule, ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &rule, 0);
    const int saved = errno;
    ::close(fd);
    if (rc != 0) {
        error = std::format("landlock rule for {}: {}", path, std::strerror(saved));
        return false;
    }
    return true;
}

void restrict_filesystem(const std::filesystem::path& plugin_dir, ConfinementReport& report) {
    report.landlock_abi = landlock_abi_version();
    if (report.landlock_abi <= 0) {
        report.notes.push_back(std::format("landlock unavailable: {}", std::strerror(errno)));
        return;
    }

    const uint64_t handled = handled_access(report.landlock_abi);
    struct landlock_ruleset_attr attr{};
    attr.handled_access_fs = handled;
    const long ruleset = ::syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0);
    if (ruleset < 0) {
        report.notes.push_back(std::format("landlock ruleset: {}", std::strerror(errno)));
        return;
    }
    const int ruleset_fd = static_cast<int>(ruleset);

    std::string error;
    bool ok = true;
    for (const char* path : kSystemReadExec) {
        ok = ok && allow_path(ruleset_fd, path, kReadExec, handled, error);
    }
    for (const char* path : kSystemReadOnly) {
        ok = ok && allow_path(ruleset_fd, path, kReadOnly, handled, error);
    }
    ok = ok && allow_path(ruleset_fd, "/dev/null", kReadOnly | LANDLOCK_ACCESS_FS_WRITE_FILE, handled, error);

    uint64_t plugin_access = kPluginDirAccess;
    if (report.landlock_abi >= 2) plugin_access |= LANDLOCK_ACCESS_FS_REFER;
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (report.landlock_abi >= 3) plugin_access |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
    const std::string dir = plugin_dir.string();
    ok = ok && allow_path(ruleset_fd, dir.c_str(), plugin_access, handled, error);

    if (ok && ::syscall(__NR_landlock_restrict_self, ruleset_fd, 0) != 0) {
        error = std::format("landlock restrict_self: {}", std::strerror(errno));
        ok = false;
    }
    ::close(ruleset_fd);

    if (!ok) {
        report.notes.push_back(error);
        return;
    }
    report.filesystem = true;
}

// ============================================================================
// seccomp
// ============================================================================

#if defined(__x86_64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
constexpr uint32_t kAuditArch = 0;
#endif

void restrict_syscalls(ConfinementReport& report) {
    if constexpr (kAuditArch == 0) {
        report.notes.push_back("seccomp filter not built for this architecture");
        return;
    }

    std::vector<sock_filter> filter;
    filter.reserve(32);

    filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                      static_cast<uint32_t>(offsetof(struct seccomp_data, arch))});
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 1, 0, kAuditArch});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_KILL_PROCESS});

    filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                      static_cast<uint32_t>(offsetof(struct seccomp_data, nr))});
#if defined(__x86_64__)
    // x32 syscall numbers alias the 64-bit table
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JGE | BPF_K), 0, 1, 0x40000000u});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_KILL_PROCESS});
#endif

    auto deny_syscall = [&filter](long syscall_number, int err) {
        filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 0, 1,
                          static_cast<uint32_t>(syscall_number)});
        filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0,
                          SECCOMP_RET_ERRNO | (static_cast<uint32_t>(err) & SECCOMP_RET_DATA)});
    };

    deny_syscall(__NR_ptrace, EPERM);
    deny_syscall(__NR_process_vm_readv, EPERM);
    deny_syscall(__NR_process_vm_writev, EPERM);
#if defined(__NR_io_uring_setup)
    deny_syscall(__NR_io_uring_setup, EPERM);
#endif

    // socket(domain, ...): only AF_UNIX; checked last since it reloads the accumulator
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 0, 4,
                      static_cast<uint32_t>(__NR_socket)});
    filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                      static_cast<uint32_t>(offsetof(struct seccomp_data, args[0]))});
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 0, 1, static_cast<uint32_t>(AF_UNIX)});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ALLOW});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0,
                      SECCOMP_RET_ERRNO | (static_cast<uint32_t>(EAFNOSUPPORT) & SECCOMP_RET_DATA)});

    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ALLOW});

    struct sock_fprog program {
        static_cast<unsigned short>(filter.size()), filter.data()
    };

    if (::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program) != 0) {
        report.notes.push_back(std::format("seccomp filter: {}", std::strerror(errno)));
        return;
    }
    report.network = true;
}

} // anonymous namespace

nlohmann::json ConfinementReport::to_json() const {
    return {
        {"noNewPrivs", no_new_privs},
        {"filesystem", filesystem},
        {"network", network},
        {"landlockAbi", landlock_abi},
        {"notes", notes},
    };
}

ConfinementReport confine_worker(const std::filesystem::path& plugin_dir) {
    ConfinementReport report;

    // Already set by the host before exec; required again for seccomp without CAP_SYS_ADMIN
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        report.notes.push_back(std::format("no_new_privs: {}", std::strerror(errno)));
        return report;
    }
    report.no_new_privs = true;

    restrict_filesystem(plugin_dir, report);
    restrict_syscalls(report);
    return report;
}

} // namespace pluginhost
