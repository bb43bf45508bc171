#pragma once

#include "core/url.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pluginhost {

// ============================================================================
// External collaborators reached through the plugin-facing API
// ============================================================================

class IAgentRuntime {
public:
    virtual ~IAgentRuntime() = default;

    /// Returns {"agentId": ...}
    virtual nlohmann::json create_agent(const std::string& plugin_id,
                                        const nlohmann::json& config) = 0;

    virtual nlohmann::json execute_agent(const std::string& plugin_id,
                                         const std::string& agent_id,
                                         const nlohmann::json& task) = 0;
};

class IModelManager {
public:
    virtual ~IModelManager() = default;

    virtual nlohmann::json execute_model(const std::string& plugin_id,
                                         const std::string& model_id,
                                         const std::string& prompt,
                                         const nlohmann::json& options) = 0;
};

class IMemoryEngine {
public:
    virtual ~IMemoryEngine() = default;

    virtual nlohmann::json store(const std::string& plugin_id,
                                 const std::string& content,
                                 const std::string& type,
                                 const nlohmann::json& metadata) = 0;

    virtual nlohmann::json search(const std::string& plugin_id,
                                  const std::string& query,
                                  const nlohmann::json& options) = 0;
};

class IUiBridge {
public:
    virtual ~IUiBridge() = default;

    virtual void add_command(const std::string& plugin_id, const nlohmann::json& command) = 0;
    virtual void add_menu_item(const std::string& plugin_id, const nlohmann::json& item) = 0;
    virtual void add_panel(const std::string& plugin_id, const nlohmann::json& panel) = 0;
    virtual void show_notification(const std::string& plugin_id, const nlohmann::json& notification) = 0;

    /// Drop everything a plugin registered (called on uninstall)
    virtual void remove_plugin(const std::string& plugin_id) = 0;
};

/// Outbound request already cleared by the permission gate
struct FetchRequest {
    std::string method = "get";     // get, post, put, patch, delete, head
    utils::Url url;                 // exactly what the gate approved
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::milliseconds timeout{10000};
};

/// Plugin network access; runs in the host because workers have no sockets
class INetworkClient {
public:
    virtual ~INetworkClient() = default;

    /// Returns {"status", "headers", "body"}; transport failures throw IO_ERROR
    virtual nlohmann::json fetch(const std::string& plugin_id, const FetchRequest& request) = 0;
};

/// Collaborator handles; an unset handle answers NOT_AVAILABLE
struct HostServices {
    std::shared_ptr<IAgentRuntime> agents;
    std::shared_ptr<IModelManager> models;
    std::shared_ptr<IMemoryEngine> memory;
    std::shared_ptr<IUiBridge> ui;
    std::shared_ptr<INetworkClient> network;
};

} // namespace pluginhost
