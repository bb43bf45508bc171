#include "sandbox/permission_gate.hpp"
#include "core/utils.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <format>

namespace pluginhost {

namespace fs = std::filesystem;

namespace {

fs::path canonical_root(const fs::path& root) {
    std::error_code ec;
    auto abs = fs::absolute(root, ec);
    if (ec) abs = root;
    auto canon = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal();
    return canon;
}

[[noreturn]] void deny(const std::string& message) {
    throw PluginError(ErrorKind::PERMISSION_DENIED, message);
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

// ============================================================================
// PermissionSnapshot
// ============================================================================

PermissionSnapshot::PermissionSnapshot(PermissionGrants grants, const fs::path& plugin_root)
    : grants_(std::move(grants)), root_(canonical_root(plugin_root)) {}

// ============================================================================
// PermissionGate
// ============================================================================

PermissionGate::PermissionGate(std::shared_ptr<const PermissionSnapshot> snapshot)
    : snapshot_(std::move(snapshot)) {
    if (!snapshot_) {
        throw PluginError(ErrorKind::INTERNAL_ERROR, "PermissionGate requires a snapshot");
    }
}

Clearance PermissionGate::check(const PermissionRequirement& requirement) const {
    const auto& g = snapshot_->grants();

    return std::visit(overloaded{
        [](const permission::Ungated&) { return Clearance{}; },
        [&](const permission::FileRead& r) {
            return check_file(r.path, g.filesystem.read, "read");
        },
        [&](const permission::FileWrite& r) {
            return check_file(r.path, g.filesystem.write, "write");
        },
        [&](const permission::NetworkFetch& r) {
            return check_network(r.url);
        },
        [&](const permission::AgentCreate&) {
            if (!g.agents.create) deny("agents.create permission not granted");
            return Clearance{};
        },
        [&](const permission::AgentExecute&) {
            if (!g.agents.execute) deny("agents.execute permission not granted");
            return Clearance{};
        },
        [&](const permission::AgentManage&) {
            if (!g.agents.manage) deny("agents.manage permission not granted");
            return Clearance{};
        },
        [&](const permission::ModelExecute& r) {
            if (!g.models.execute) deny("models.execute permission not granted");
            const auto& access = g.models.access;
            const bool listed = std::any_of(access.begin(), access.end(),
                [&r](const std::string& m) { return m == "*" || m == r.model_id; });
            if (!listed) deny(std::format("model '{}' not in models.access", r.model_id));
            return Clearance{};
        },
        [&](const permission::MemoryRead&) {
            if (!g.memory.read) deny("memory.read permission not granted");
            return Clearance{};
        },
        [&](const permission::MemoryWrite&) {
            if (!g.memory.write) deny("memory.write permission not granted");
            return Clearance{};
        },
        [&](const permission::UiPanel&) {
            if (!g.ui.panels) deny("ui.panels permission not granted");
            return Clearance{};
        },
        [&](const permission::UiMenu&) {
            if (!g.ui.menus) deny("ui.menus permission not granted");
            return Clearance{};
        },
        [&](const permission::UiCommand&) {
            if (!g.ui.commands) deny("ui.commands permission not granted");
            return Clearance{};
        },
        [&](const permission::UiNotification&) {
            if (!g.ui.notifications) deny("ui.notifications permission not granted");
            return Clearance{};
        },
    }, requirement);
}

fs::path PermissionGate::resolve_inside_root(std::string_view requested) const {
    const auto& root = snapshot_->root();
    if (requested.empty()) {
        throw PluginError(ErrorKind::VALIDATION, "path must not be empty");
    }

    const fs::path req{std::string(requested)};
    const fs::path candidate = req.is_absolute() ? req : root / req;

    // Resolves symlinks along the existing prefix, normalizes the rest
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) resolved = candidate.lexically_normal();

    const fs::path rel = resolved.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        throw PluginError(ErrorKind::PATH_TRAVERSAL,
            std::format("path '{}' escapes the plugin directory", requested));
    }
    return resolved;
}

Clearance PermissionGate::check_file(std::string_view requested,
                                     const std::vector<std::string>& patterns,
                                     const char* access) const {
    // Traversal is a security violation and is reported regardless of grants
    fs::path resolved = resolve_inside_root(requested);

    if (patterns.empty()) {
        deny(std::format("filesystem.{} permission not granted", access));
    }

    const std::string relative = resolved.lexically_relative(snapshot_->root()).generic_string();
    const bool matched = std::any_of(patterns.begin(), patterns.end(),
        [&relative](const std::string& p) { return path_matches(p, relative); });
    if (!matched) {
        deny(std::format("filesystem.{} not granted for '{}'", access, relative));
    }
    return Clearance{std::move(resolved)};
}

Clearance PermissionGate::check_network(const std::string& url) const {
    const auto& net = snapshot_->grants().network;
    if (!net.external) deny("network.external permission not granted");

    auto parsed = utils::parse_url(url);
    if (!parsed) deny(std::format("only plain http(s) URLs without credentials are allowed: '{}'", url));

    const std::string& host = parsed->host;
    const bool allowed = std::any_of(net.domains.begin(), net.domains.end(),
        [&host](const std::string& d) { return domain_matches(host, d); });
    if (!allowed) deny(std::format("domain '{}' not in network.domains", host));

    Clearance clearance;
    clearance.url = std::move(parsed);
    return clearance;
}

bool PermissionGate::path_matches(const std::string& pattern, const std::string& relative) {
    std::string p = pattern;
    if (p.starts_with("./")) p.erase(0, 2);
    if (p.empty()) return false;

    if (utils::ends_with(p, "**")) {
        // "data/**": without FNM_PATHNAME, '*' also matches '/'
        p.resize(p.size() - 2);
        p += '*';
        return ::fnmatch(p.c_str(), relative.c_str(), 0) == 0;
    }
    return ::fnmatch(p.c_str(), relative.c_str(), FNM_PATHNAME) == 0;
}

bool PermissionGate::domain_matches(const std::string& host, const std::string& domain) {
    std::string d = utils::to_lower(domain);
    if (d.starts_with("*.")) d.erase(0, 2);
    if (d.empty() || host.empty()) return false;
    if (host == d) return true;
    return utils::ends_with(host, "." + d);
}

} // namespace pluginhost
