#include "host/ui_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace pluginhost {

void UiRegistry::add_command(const std::string& plugin_id, const nlohmann::json& command) {
    std::unique_lock lock(mutex_);
    by_plugin_[plugin_id].commands.push_back(command);
}

void UiRegistry::add_menu_item(const std::string& plugin_id, const nlohmann::json& item) {
    std::unique_lock lock(mutex_);
    by_plugin_[plugin_id].menu_items.push_back(item);
}

void UiRegistry::add_panel(const std::string& plugin_id, const nlohmann::json& panel) {
    std::unique_lock lock(mutex_);
    by_plugin_[plugin_id].panels.push_back(panel);
}

void UiRegistry::show_notification(const std::string& plugin_id, const nlohmann::json& notification) {
    {
        std::unique_lock lock(mutex_);
        auto& list = by_plugin_[plugin_id].notifications;
        list.push_back(notification);
        if (list.size() > kMaxNotifications) {
            list.erase(list.begin());
        }
    }
    utils::log::info(std::format("[plugin:{}] notification: {}", plugin_id, notification.dump()));
}

void UiRegistry::remove_plugin(const std::string& plugin_id) {
    std::unique_lock lock(mutex_);
    by_plugin_.erase(plugin_id);
}

UiRegistry::Contributions UiRegistry::contributions(const std::string& plugin_id) const {
    std::shared_lock lock(mutex_);
    const auto it = by_plugin_.find(plugin_id);
    return it == by_plugin_.end() ? Contributions{} : it->second;
}

std::vector<std::string> UiRegistry::plugin_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(by_plugin_.size());
    for (const auto& [id, _] : by_plugin_) {
        ids.push_back(id);
    }
    return ids;
}

nlohmann::json UiRegistry::to_json() const {
    std::shared_lock lock(mutex_);
    auto out = nlohmann::json::object();
    for (const auto& [id, c] : by_plugin_) {
        out[id] = {
            {"commands", c.commands},
            {"menuItems", c.menu_items},
            {"panels", c.panels},
            {"notifications", c.notifications},
        };
    }
    return out;
}

} // namespace pluginhost
