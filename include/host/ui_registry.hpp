#pragma once

#include "sandbox/host_services.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pluginhost {

/**
 * @brief In-process IUiBridge: records what each plugin contributed to the UI
 *
 * Commands, menu items and panels accumulate per plugin until the plugin is
 * uninstalled. Notifications are kept as a bounded history.
 */
class UiRegistry : public IUiBridge {
public:
    struct Contributions {
        std::vector<nlohmann::json> commands;
        std::vector<nlohmann::json> menu_items;
        std::vector<nlohmann::json> panels;
        std::vector<nlohmann::json> notifications;
    };

    void add_command(const std::string& plugin_id, const nlohmann::json& command) override;
    void add_menu_item(const std::string& plugin_id, const nlohmann::json& item) override;
    void add_panel(const std::string& plugin_id, const nlohmann::json& panel) override;
    void show_notification(const std::string& plugin_id, const nlohmann::json& notification) override;
    void remove_plugin(const std::string& plugin_id) override;

    /// Empty contributions for an unknown plugin
    [[nodiscard]] Contributions contributions(const std::string& plugin_id) const;

    [[nodiscard]] std::vector<std::string> plugin_ids() const;

    /// {"<id>": {"commands": [...], "menuItems": [...], "panels": [...], "notifications": [...]}}
    [[nodiscard]] nlohmann::json to_json() const;

private:
    static constexpr size_t kMaxNotifications = 50;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Contributions> by_plugin_;
};

} // namespace pluginhost
