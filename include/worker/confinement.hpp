#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace pluginhost {

/**
 * @brief OS-level layers applied to the worker before plugin code loads
 *
 * no_new_privs: PR_SET_NO_NEW_PRIVS (set-uid binaries lose their bits).
 * filesystem:   Landlock ruleset; the plugin directory is writable, the
 *               system library trees are read-only, everything else denied.
 * network:      seccomp filter; socket() outside AF_UNIX fails with
 *               EAFNOSUPPORT, ptrace and io_uring fail with EPERM.
 *
 * A layer the kernel does not offer is reported as false with a note, it
 * never aborts the worker on its own.
 */
struct ConfinementReport {
    bool no_new_privs = false;
    bool filesystem = false;
    bool network = false;
    int landlock_abi = 0;
    std::vector<std::string> notes;

    [[nodiscard]] bool complete() const { return no_new_privs && filesystem && network; }
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Apply every available layer to the calling thread and its future threads.
/// Must run before any other thread is started.
ConfinementReport confine_worker(const std::filesystem::path& plugin_dir);

} // namespace pluginhost
