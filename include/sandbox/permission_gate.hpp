#pragma once

#include "core/error.hpp"
#include "core/url.hpp"
#include "manifest/manifest.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pluginhost {

/**
 * @brief Frozen copy of a plugin's grants, taken once at sandbox construction
 *
 * Immutable after construction and shared read-only between threads. The
 * plugin root is canonicalized up front so every path check compares against
 * the same directory.
 */
class PermissionSnapshot {
public:
    PermissionSnapshot(PermissionGrants grants, const std::filesystem::path& plugin_root);

    [[nodiscard]] const PermissionGrants& grants() const { return grants_; }
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    const PermissionGrants grants_;
    const std::filesystem::path root_;
};

// ============================================================================
// Permission requirements (one alternative per gated capability)
// ============================================================================

namespace permission {

struct FileRead { std::string path; };
struct FileWrite { std::string path; };
struct NetworkFetch { std::string url; };
struct AgentCreate {};
struct AgentExecute {};
struct AgentManage {};
struct ModelExecute { std::string model_id; };
struct MemoryRead {};
struct MemoryWrite {};
struct UiPanel {};
struct UiMenu {};
struct UiCommand {};
struct UiNotification {};
struct Ungated {};      // getConfig, getManifest, emit

} // namespace permission

using PermissionRequirement = std::variant<
    permission::Ungated,
    permission::FileRead, permission::FileWrite,
    permission::NetworkFetch,
    permission::AgentCreate, permission::AgentExecute, permission::AgentManage,
    permission::ModelExecute,
    permission::MemoryRead, permission::MemoryWrite,
    permission::UiPanel, permission::UiMenu, permission::UiCommand, permission::UiNotification>;

/// Outcome of a successful check: the resolved path for file access, the
/// parsed URL for network access. Callers act on these, never on the raw input.
struct Clearance {
    std::filesystem::path resolved_path;
    std::optional<utils::Url> url;
};

/**
 * @brief Single choke point for every sandbox-exposed capability
 *
 * check() throws PluginError:
 * - PATH_TRAVERSAL     file path escapes the plugin root (checked first)
 * - PERMISSION_DENIED  grant missing or not matching
 *
 * guard() wraps an operation so it only runs after a successful check.
 */
class PermissionGate {
public:
    explicit PermissionGate(std::shared_ptr<const PermissionSnapshot> snapshot);

    Clearance check(const PermissionRequirement& requirement) const;

    template<typename Fn>
    decltype(auto) guard(const PermissionRequirement& requirement, Fn&& fn) const {
        const Clearance clearance = check(requirement);
        return std::forward<Fn>(fn)(clearance);
    }

    [[nodiscard]] const PermissionSnapshot& snapshot() const { return *snapshot_; }

    /// Canonical absolute path for a plugin-relative request, or PATH_TRAVERSAL
    [[nodiscard]] std::filesystem::path resolve_inside_root(std::string_view requested) const;

    /// Glob match with FNM_PATHNAME; a trailing "**" matches any depth
    [[nodiscard]] static bool path_matches(const std::string& pattern, const std::string& relative);

    /// host == domain, or host ends with "." + domain
    [[nodiscard]] static bool domain_matches(const std::string& host, const std::string& domain);

private:
    Clearance check_file(std::string_view requested, const std::vector<std::string>& patterns,
                         const char* access) const;
    Clearance check_network(const std::string& url) const;

    std::shared_ptr<const PermissionSnapshot> snapshot_;
};

} // namespace pluginhost
