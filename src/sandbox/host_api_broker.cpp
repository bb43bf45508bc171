#include "sandbox/host_api_broker.hpp"
#include "sandbox/api_args.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>
#include <unordered_map>

namespace pluginhost {

using json = nlohmann::json;

namespace {

struct CallContext {
    const std::string& plugin_id;
    const Clearance& clearance;
    std::chrono::milliseconds timeout;
};

struct HostApi {
    // Permission needed for this call (may depend on arguments)
    std::function<PermissionRequirement(const json& args)> requirement;
    std::function<json(const HostServices&, const CallContext&, const json& args)> invoke;
};

template<typename T>
T& require_service(const std::shared_ptr<T>& service, const char* name) {
    if (!service) {
        throw PluginError(ErrorKind::NOT_AVAILABLE, std::format("{} is not available on this host", name));
    }
    return *service;
}

const std::unordered_map<std::string, HostApi>& host_api_table() {
    using namespace api_args;
    static const std::unordered_map<std::string, HostApi> table = {
        {"fetch", {
            [](const json& args) -> PermissionRequirement {
                return permission::NetworkFetch{require_string(args, "url", "fetch")};
            },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                if (!ctx.clearance.url) {
                    throw PluginError(ErrorKind::INTERNAL_ERROR, "fetch cleared without a parsed URL");
                }
                FetchRequest request;
                request.url = *ctx.clearance.url;
                request.method = utils::to_lower(optional_string(args, "method", "fetch", "GET"));
                request.body = optional_string(args, "body", "fetch", "");
                request.timeout = ctx.timeout;
                const json header_args = value_or(args, "headers");
                if (header_args.is_object()) {
                    for (const auto& [name, value] : header_args.items()) {
                        if (!value.is_string()) continue;
                        if (utils::to_lower(name) == "content-type") {
                            request.content_type = value.get<std::string>();
                        } else {
                            request.headers.emplace_back(name, value.get<std::string>());
                        }
                    }
                }
                return require_service(s.network, "network client").fetch(ctx.plugin_id, request);
            }}},
        {"createAgent", {
            [](const json&) -> PermissionRequirement { return permission::AgentCreate{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                return require_service(s.agents, "agent runtime")
                    .create_agent(ctx.plugin_id, require_object(args, "config", "createAgent"));
            }}},
        {"executeAgent", {
            [](const json&) -> PermissionRequirement { return permission::AgentExecute{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                return require_service(s.agents, "agent runtime")
                    .execute_agent(ctx.plugin_id, require_string(args, "agentId", "executeAgent"),
                                   value_or(args, "task"));
            }}},
        {"executeModel", {
            [](const json& args) -> PermissionRequirement {
                return permission::ModelExecute{require_string(args, "modelId", "executeModel")};
            },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                return require_service(s.models, "model manager")
                    .execute_model(ctx.plugin_id, require_string(args, "modelId", "executeModel"),
                                   require_string(args, "prompt", "executeModel"),
                                   value_or(args, "options"));
            }}},
        {"storeMemory", {
            [](const json&) -> PermissionRequirement { return permission::MemoryWrite{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                return require_service(s.memory, "memory engine")
                    .store(ctx.plugin_id, require_string(args, "content", "storeMemory"),
                           optional_string(args, "type", "storeMemory", "note"),
                           value_or(args, "metadata"));
            }}},
        {"searchMemory", {
            [](const json&) -> PermissionRequirement { return permission::MemoryRead{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                return require_service(s.memory, "memory engine")
                    .search(ctx.plugin_id, require_string(args, "query", "searchMemory"),
                            value_or(args, "options"));
            }}},
        {"addCommand", {
            [](const json&) -> PermissionRequirement { return permission::UiCommand{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                require_service(s.ui, "UI bridge").add_command(ctx.plugin_id, require_object(args, "command", "addCommand"));
                return json{{"registered", true}};
            }}},
        {"addMenuItem", {
            [](const json&) -> PermissionRequirement { return permission::UiMenu{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                require_service(s.ui, "UI bridge").add_menu_item(ctx.plugin_id, require_object(args, "item", "addMenuItem"));
                return json{{"registered", true}};
            }}},
        {"addPanel", {
            [](const json&) -> PermissionRequirement { return permission::UiPanel{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                require_service(s.ui, "UI bridge").add_panel(ctx.plugin_id, require_object(args, "panel", "addPanel"));
                return json{{"registered", true}};
            }}},
        {"showNotification", {
            [](const json&) -> PermissionRequirement { return permission::UiNotification{}; },
            [](const HostServices& s, const CallContext& ctx, const json& args) {
                require_service(s.ui, "UI bridge")
                    .show_notification(ctx.plugin_id, require_object(args, "notification", "showNotification"));
                return json{{"shown", true}};
            }}},
    };
    return table;
}

} // anonymous namespace

HostApiBroker::HostApiBroker(std::string plugin_id,
                             std::shared_ptr<const PermissionSnapshot> snapshot,
                             HostServices services,
                             std::chrono::milliseconds call_timeout)
    : plugin_id_(std::move(plugin_id)),
      gate_(std::move(snapshot)),
      services_(std::move(services)),
      call_timeout_(call_timeout) {}

bool HostApiBroker::is_host_api(const std::string& api) {
    return host_api_table().contains(api);
}

PermissionRequirement HostApiBroker::requirement_for(const std::string& api, const json& args) {
    const auto& table = host_api_table();
    const auto it = table.find(api);
    if (it == table.end()) {
        throw PluginError(ErrorKind::VALIDATION, std::format("unknown host API '{}'", api));
    }
    return it->second.requirement(args);
}

json HostApiBroker::dispatch(const std::string& api, const json& args) const {
    const auto& table = host_api_table();
    const auto it = table.find(api);
    if (it == table.end()) {
        throw PluginError(ErrorKind::VALIDATION, std::format("unknown host API '{}'", api));
    }

    const auto& entry = it->second;
    return gate_.guard(entry.requirement(args), [&](const Clearance& clearance) {
        return entry.invoke(services_, CallContext{plugin_id_, clearance, call_timeout_}, args);
    });
}

} // namespace pluginhost
