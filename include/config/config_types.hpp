#pragma once

#include <cstdint>
#include <string>

namespace pluginhost {

// ============================================================================
// Host Config
// ============================================================================

struct HostSection {
    std::string version = "1.0.0";      // Checked against manifest engine.host
    std::string plugins_dir = "plugins";
};

// ============================================================================
// Sandbox Config
// ============================================================================

struct SandboxConfig {
    std::string worker_executable = "plugin_host_worker";
    uint32_t rpc_timeout_ms = 30000;
    uint32_t init_timeout_ms = 10000;
    uint32_t api_call_timeout_ms = 10000;
    uint32_t memory_limit_mb = 512;
    uint32_t cpu_limit_seconds = 0;     // 0 = unlimited
    bool require_confinement = false;   // refuse workers lacking Landlock/seccomp
};

// ============================================================================
// Registry Config
// ============================================================================

struct RegistryConfig {
    std::string url = "https://registry.puffer.ai";
    std::string local_path;             // Non-empty: directory-backed catalog
    uint32_t freshness_hours = 24;
    uint32_t max_search_results = 50;
    uint32_t timeout_ms = 15000;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// HostConfig - Complete parsed configuration
// ============================================================================

struct HostConfig {
    HostSection host;
    SandboxConfig sandbox;
    RegistryConfig registry;
    LoggingConfig logging;
};

} // namespace pluginhost
