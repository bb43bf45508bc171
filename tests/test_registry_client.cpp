#include <catch2/catch_test_macros.hpp>
#include "registry/local_registry_transport.hpp"
#include "registry/registry_client.hpp"
#include "mocks/mock_registry_transport.hpp"
#include "mocks/test_support.hpp"

#include <nlohmann/json.hpp>

using namespace pluginhost;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

PluginSummary summary(const std::string& id, const std::string& name, const std::string& type = "tool",
                      std::vector<std::string> categories = {}, std::vector<std::string> tags = {}) {
    PluginSummary s;
    s.id = id;
    s.name = name;
    s.description = name + " plugin";
    s.version = "1.0.0";
    s.type = type;
    s.categories = std::move(categories);
    s.tags = std::move(tags);
    return s;
}

PluginVersionInfo version(const std::string& v) {
    return PluginVersionInfo{v, std::nullopt, std::nullopt, std::nullopt};
}

// Manually advanced clock shared with the client
struct FakeClock {
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::now());

    RegistryClient::Clock fn() const {
        return [now = now] { return *now; };
    }
    void advance(std::chrono::seconds by) { *now += by; }
};

struct Fixture {
    std::shared_ptr<test::MockRegistryTransport> transport = std::make_shared<test::MockRegistryTransport>();
    FakeClock clock;
    RegistryClient client{transport, RegistryClient::Options{std::chrono::hours(24), 50}, clock.fn()};

    Fixture() {
        transport->add_plugin(summary("notes", "Notes", "tool", {"productivity"}, {"markdown"}));
        transport->add_plugin(summary("weather", "Weather", "tool", {"utilities"}, {"forecast"}));
        transport->add_plugin(summary("theme-dark", "Dark Theme", "ui", {"appearance"}));
    }
};

} // namespace

TEST_CASE("RegistryClient: first read syncs, fresh cache is reused", "[registry]") {
    Fixture fx;
    CHECK_FALSE(fx.client.last_sync().has_value());

    CHECK(fx.client.search("").size() == 3);
    CHECK(fx.transport->search_calls == 1);
    CHECK(fx.client.cache_size() == 3);

    fx.clock.advance(std::chrono::hours(23));
    (void)fx.client.search("notes");
    (void)fx.client.get_plugin("weather");
    CHECK(fx.transport->search_calls == 1);

    fx.clock.advance(std::chrono::hours(2));
    (void)fx.client.search("");
    CHECK(fx.transport->search_calls == 2);
}

TEST_CASE("RegistryClient: search matches name, description and tags case-insensitively", "[registry]") {
    Fixture fx;
    CHECK(fx.client.search("NOTES").size() == 1);
    CHECK(fx.client.search("forecast").front().id == "weather");
    CHECK(fx.client.search("theme plugin").front().id == "theme-dark");
    CHECK(fx.client.search("nothing like this").empty());
}

TEST_CASE("RegistryClient: search filters by category and type", "[registry]") {
    Fixture fx;

    SearchOptions by_category;
    by_category.category = "utilities";
    const auto utilities = fx.client.search("", by_category);
    REQUIRE(utilities.size() == 1);
    CHECK(utilities[0].id == "weather");

    SearchOptions by_type;
    by_type.type = "ui";
    const auto ui = fx.client.search("", by_type);
    REQUIRE(ui.size() == 1);
    CHECK(ui[0].id == "theme-dark");
}

TEST_CASE("RegistryClient: result limit is clamped", "[registry]") {
    auto transport = std::make_shared<test::MockRegistryTransport>();
    for (int i = 0; i < 80; ++i) {
        transport->add_plugin(summary("plugin-" + std::to_string(i), "Plugin " + std::to_string(i)));
    }
    RegistryClient client(transport, RegistryClient::Options{std::chrono::hours(24), 50});

    CHECK(client.search("").size() == 50);

    SearchOptions options;
    options.limit = 500;
    CHECK(client.search("", options).size() == 50);

    options.limit = 5;
    const auto five = client.search("", options);
    REQUIRE(five.size() == 5);
    CHECK(five[0].id == "plugin-0");     // catalog order

    options.limit = 0;
    CHECK(client.search("", options).empty());
}

TEST_CASE("RegistryClient: failed sync serves the stale cache", "[registry]") {
    Fixture fx;
    REQUIRE(fx.client.search("").size() == 3);
    const auto synced_at = fx.client.last_sync();

    fx.transport->fail_search = true;
    fx.clock.advance(std::chrono::hours(48));
    CHECK(fx.client.search("").size() == 3);
    CHECK(fx.client.last_sync() == synced_at);

    // Still stale, so the next read retries
    (void)fx.client.search("");
    CHECK(fx.transport->search_calls == 3);

    fx.transport->fail_search = false;
    CHECK(fx.client.refresh());
    CHECK(fx.client.last_sync() != synced_at);
}

TEST_CASE("RegistryClient: sync replaces the cache and notifies", "[registry]") {
    Fixture fx;
    std::vector<size_t> notified;
    fx.client.set_sync_listener([&](size_t count) { notified.push_back(count); });

    REQUIRE(fx.client.refresh());
    fx.transport->clear_catalog();
    fx.transport->add_plugin(summary("solo", "Solo"));
    REQUIRE(fx.client.refresh());

    CHECK(notified == std::vector<size_t>{3, 1});
    CHECK(fx.client.cache_size() == 1);
    CHECK(fx.client.search("notes").empty());
}

TEST_CASE("RegistryClient: get_plugin falls back to the transport", "[registry]") {
    Fixture fx;
    REQUIRE(fx.client.refresh());

    CHECK(fx.client.get_plugin("notes")->name == "Notes");
    CHECK(fx.transport->get_plugin_calls == 0);

    fx.transport->add_plugin(summary("late", "Late Arrival"));
    CHECK(fx.client.get_plugin("late").has_value());
    CHECK(fx.transport->get_plugin_calls == 1);

    CHECK_FALSE(fx.client.get_plugin("missing").has_value());

    fx.transport->fail_lookup = true;
    CHECK_FALSE(fx.client.get_plugin("also-missing").has_value());
}

TEST_CASE("RegistryClient: resolve_version", "[registry]") {
    Fixture fx;
    fx.transport->add_version("notes", version("1.2.0"), "a");
    fx.transport->add_version("notes", version("1.10.0"), "b");
    fx.transport->add_version("notes", version("2.0.0-beta.1"), "c");
    fx.transport->add_version("notes", version("not-a-version"), "d");

    SECTION("highest release wins") {
        CHECK(fx.client.resolve_version("notes", std::nullopt).version == "1.10.0");
    }
    SECTION("explicit versions must be published") {
        CHECK(fx.client.resolve_version("notes", "2.0.0-beta.1").version == "2.0.0-beta.1");
        try {
            (void)fx.client.resolve_version("notes", "9.9.9");
            FAIL("expected NOT_FOUND");
        } catch (const PluginError& e) {
            CHECK(e.kind() == ErrorKind::NOT_FOUND);
        }
    }
    SECTION("unknown plugin") {
        try {
            (void)fx.client.resolve_version("ghost", std::nullopt);
            FAIL("expected NOT_FOUND");
        } catch (const PluginError& e) {
            CHECK(e.kind() == ErrorKind::NOT_FOUND);
        }
    }
    SECTION("transport failures are registry errors") {
        fx.transport->fail_versions = true;
        try {
            (void)fx.client.resolve_version("notes", std::nullopt);
            FAIL("expected REGISTRY_ERROR");
        } catch (const PluginError& e) {
            CHECK(e.kind() == ErrorKind::REGISTRY_ERROR);
        }
    }
}

TEST_CASE("LocalRegistryTransport: catalog directory", "[registry]") {
    test::TmpDir root("local_registry");
    root.file("catalog.json", json{{"plugins", {
        {{"id", "notes"}, {"name", "Notes"}, {"description", "Markdown notes"}, {"type", "tool"},
         {"versions", {{{"version", "1.0.0"}}, {{"version", "1.1.0"}, {"sha256", "abc"}}}}},
        {{"id", "weather"}, {"name", "Weather"}, {"version", "0.3.0"}, {"type", "tool"}},
        {{"name", "no id, skipped"}},
    }}}.dump());
    root.file("packages/notes-1.1.0.pkg", "package-bytes");

    LocalRegistryTransport transport(root.path);

    CHECK(transport.search("", {}).size() == 2);
    CHECK(transport.search("markdown", {}).size() == 1);

    const auto versions = transport.get_versions("notes");
    REQUIRE(versions.size() == 2);
    CHECK(versions[1].sha256 == "abc");
    CHECK(transport.get_versions("weather").front().version == "0.3.0");

    CHECK(transport.download("notes", "1.1.0") == "package-bytes");
    CHECK_THROWS_AS(transport.download("notes", "../../etc"), PluginError);
    CHECK_THROWS_AS(transport.download("notes", "1.0.0"), PluginError);
    CHECK_THROWS_AS(transport.get_versions("ghost"), PluginError);
}
