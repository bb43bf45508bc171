#include <catch2/catch_test_macros.hpp>
#include "host/ui_registry.hpp"

using namespace pluginhost;
using json = nlohmann::json;

TEST_CASE("UiRegistry: contributions are tracked per plugin", "[ui]") {
    UiRegistry ui;
    ui.add_command("notes", {{"id", "notes.new"}});
    ui.add_menu_item("notes", {{"label", "New note"}});
    ui.add_panel("weather", {{"id", "forecast"}});

    CHECK(ui.plugin_ids() == std::vector<std::string>{"notes", "weather"});
    CHECK(ui.contributions("notes").commands.size() == 1);
    CHECK(ui.contributions("notes").menu_items.size() == 1);
    CHECK(ui.contributions("notes").panels.empty());
    CHECK(ui.contributions("ghost").commands.empty());

    const json snapshot = ui.to_json();
    CHECK(snapshot["notes"]["commands"][0]["id"] == "notes.new");
    CHECK(snapshot["weather"]["panels"][0]["id"] == "forecast");
    CHECK(snapshot["weather"]["menuItems"].empty());

    ui.remove_plugin("notes");
    CHECK(ui.plugin_ids() == std::vector<std::string>{"weather"});
    CHECK(ui.contributions("notes").commands.empty());
}

TEST_CASE("UiRegistry: notification history is bounded", "[ui]") {
    UiRegistry ui;
    for (int i = 0; i < 60; ++i) {
        ui.show_notification("notes", {{"n", i}});
    }
    const auto notifications = ui.contributions("notes").notifications;
    REQUIRE(notifications.size() == 50);
    CHECK(notifications.front()["n"] == 10);
    CHECK(notifications.back()["n"] == 59);
}
