#include <catch2/catch_test_macros.hpp>
#include "core/crypto.hpp"
#include "host/ui_registry.hpp"
#include "plugin/plugin_manager.hpp"
#include "mocks/mock_registry_transport.hpp"
#include "mocks/mock_worker.hpp"
#include "mocks/test_support.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <format>
#include <thread>

using namespace pluginhost;
using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

json notes_manifest(const std::string& version = "1.0.0") {
    json m = test::minimal_manifest("notes", version);
    m["capabilities"] = {"ui:commands"};
    m["permissions"] = {{"ui", {{"commands", true}}}};
    m["defaultConfig"] = {{"theme", "light"}, {"fontSize", 12}};
    m["configSchema"] = {{"properties", {{"fontSize", {{"type", "number"}}}}}};
    return m;
}

PluginSummary notes_summary() {
    PluginSummary s;
    s.id = "notes";
    s.name = "Notes";
    s.description = "Markdown notes";
    s.version = "1.1.0";
    s.type = "tool";
    return s;
}

void publish(test::MockRegistryTransport& transport, const std::string& id, const std::string& version,
             const std::string& package, bool with_checksum = true) {
    PluginVersionInfo info;
    info.version = version;
    if (with_checksum) info.sha256 = crypto::sha256_hex(package);
    transport.add_version(id, info, package);
}

struct Fixture {
    test::TmpDir root{"plugin_manager"};
    std::shared_ptr<test::MockRegistryTransport> transport = std::make_shared<test::MockRegistryTransport>();
    std::shared_ptr<RegistryClient> registry =
        std::make_shared<RegistryClient>(transport, RegistryClient::Options{});
    test::MockWorkerFactory workers;
    std::shared_ptr<UiRegistry> ui = std::make_shared<UiRegistry>();

    std::mutex calls_mutex;
    std::vector<std::pair<std::string, json>> calls;
    std::atomic<bool> fail_initialize{false};
    std::atomic<bool> fail_cleanup{false};

    std::unique_ptr<PluginManager> manager;
    std::vector<PluginEvent> events;

    Fixture() {
        transport->add_plugin(notes_summary());
        publish(*transport, "notes", "1.0.0", test::make_package(notes_manifest("1.0.0")));
        publish(*transport, "notes", "1.1.0", test::make_package(notes_manifest("1.1.0")));

        workers.script->handler = [this](const std::string& method, const json& args) -> std::optional<json> {
            {
                std::lock_guard<std::mutex> lock(calls_mutex);
                calls.emplace_back(method, args);
            }
            if (method == "initialize" && fail_initialize) {
                throw PluginError(ErrorKind::PLUGIN_ERROR, "database file is locked");
            }
            if (method == "cleanup" && fail_cleanup) {
                throw PluginError(ErrorKind::PLUGIN_ERROR, "cleanup exploded");
            }
            if (method == "echo") return args;
            if (method == "boom") throw PluginError(ErrorKind::PLUGIN_ERROR, "boom");
            return json::object();
        };
        manager = make_manager();
    }

    ~Fixture() { manager.reset(); }

    std::unique_ptr<PluginManager> make_manager() {
        PluginManagerOptions options;
        options.plugins_dir = root.path / "plugins";
        options.host_version = "1.0.0";
        options.sandbox.rpc_timeout = 2000ms;
        options.sandbox.init_timeout = 500ms;

        HostServices services;
        services.ui = ui;
        auto m = std::make_unique<PluginManager>(options, registry, workers.factory(), services);
        m->add_listener([this](const PluginEvent& e) { events.push_back(e); });
        return m;
    }

    fs::path plugins_dir() const { return root.path / "plugins"; }

    json last_call(const std::string& method) {
        std::lock_guard<std::mutex> lock(calls_mutex);
        for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
            if (it->first == method) return it->second;
        }
        return nullptr;
    }

    size_t count_events(PluginEventType type) const {
        size_t n = 0;
        for (const auto& e : events) n += (e.type == type);
        return n;
    }

    bool staging_is_empty() const {
        std::error_code ec;
        const auto staging = plugins_dir() / ".staging";
        return !fs::exists(staging, ec) || fs::is_empty(staging, ec);
    }

    json persisted_state(const std::string& id) const {
        return json::parse(test::read_file(plugins_dir() / id / "state.json"));
    }
};

} // namespace

// ============================================================================
// Install
// ============================================================================

TEST_CASE("PluginManager: install lays out the plugin and starts its sandbox", "[manager]") {
    Fixture fx;
    const auto installed = fx.manager->install("notes", "1.0.0");
    REQUIRE(installed.is_ok());
    CHECK(installed.value().status == PluginStatus::INSTALLED);
    CHECK(installed.value().version == "1.0.0");
    CHECK_FALSE(installed.value().installed_at.empty());

    CHECK(fs::exists(fx.plugins_dir() / "notes" / "manifest.json"));
    CHECK(fs::exists(fx.plugins_dir() / "notes" / "libnotes.so"));
    CHECK(fx.persisted_state("notes")["status"] == "installed");
    CHECK(fx.staging_is_empty());

    CHECK(fx.workers.script->started == 1);
    REQUIRE(fx.workers.script->init_payloads.size() == 1);
    CHECK(fx.workers.script->init_payloads[0]["config"]["theme"] == "light");
    CHECK(fx.workers.script->count("initialize") == 0);

    const auto listed = fx.manager->list_installed();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].id == "notes");
    CHECK(fx.count_events(PluginEventType::INSTALLED) == 1);
}

TEST_CASE("PluginManager: install without a version takes the latest release", "[manager]") {
    Fixture fx;
    const auto installed = fx.manager->install("notes");
    REQUIRE(installed.is_ok());
    CHECK(installed.value().version == "1.1.0");
}

TEST_CASE("PluginManager: install rejects duplicates and unknown plugins", "[manager]") {
    Fixture fx;

    SECTION("already installed") {
        REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
        const auto again = fx.manager->install("notes", "1.1.0");
        CHECK(again.error_kind() == ErrorKind::VALIDATION);
        CHECK(fx.manager->get_state("notes").value().version == "1.0.0");
    }

    SECTION("not in the registry") {
        const auto missing = fx.manager->install("ghost");
        CHECK(missing.error_kind() == ErrorKind::NOT_FOUND);
        CHECK_FALSE(fs::exists(fx.plugins_dir() / "ghost"));
        REQUIRE(fx.count_events(PluginEventType::INSTALL_FAILED) == 1);
        CHECK(fx.events.back().data["kind"] == "not_found");
    }

    SECTION("unpublished version") {
        CHECK(fx.manager->install("notes", "7.0.0").error_kind() == ErrorKind::NOT_FOUND);
    }

    SECTION("bad id") {
        CHECK(fx.manager->install("../etc").error_kind() == ErrorKind::VALIDATION);
    }
}

TEST_CASE("PluginManager: failed installs leave no residue", "[manager]") {
    Fixture fx;
    ErrorKind expected = ErrorKind::NONE;

    SECTION("checksum mismatch") {
        PluginVersionInfo info;
        info.version = "2.0.0";
        info.sha256 = std::string(64, '0');
        fx.transport->add_version("notes", info, test::make_package(notes_manifest("2.0.0")));
        expected = ErrorKind::VALIDATION;
    }
    SECTION("package declares another id") {
        publish(*fx.transport, "notes", "2.0.0", test::make_package(test::minimal_manifest("other", "2.0.0")));
        expected = ErrorKind::VALIDATION;
    }
    SECTION("package declares another version") {
        publish(*fx.transport, "notes", "2.0.0", test::make_package(notes_manifest("1.9.0")));
        expected = ErrorKind::VALIDATION;
    }
    SECTION("corrupt package") {
        publish(*fx.transport, "notes", "2.0.0", "garbage bytes");
        expected = ErrorKind::VALIDATION;
    }
    SECTION("download fails") {
        publish(*fx.transport, "notes", "2.0.0", test::make_package(notes_manifest("2.0.0")));
        fx.transport->fail_download = true;
        expected = ErrorKind::REGISTRY_ERROR;
    }
    SECTION("sandbox does not start") {
        publish(*fx.transport, "notes", "2.0.0", test::make_package(notes_manifest("2.0.0")));
        fx.workers.script->ready_error = "cannot load libnotes.so";
        expected = ErrorKind::SANDBOX_INIT_FAILURE;
    }

    const auto result = fx.manager->install("notes", "2.0.0");
    CHECK(result.error_kind() == expected);
    CHECK_FALSE(fs::exists(fx.plugins_dir() / "notes"));
    CHECK(fx.staging_is_empty());
    CHECK(fx.manager->list_installed().empty());
    CHECK(fx.manager->get_state("notes").error_kind() == ErrorKind::NOT_FOUND);
}

// ============================================================================
// Enable / disable / execute
// ============================================================================

TEST_CASE("PluginManager: enable initializes the plugin with its config", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    const auto enabled = fx.manager->enable("notes");
    REQUIRE(enabled.is_ok());
    CHECK(enabled.value().status == PluginStatus::ENABLED);
    CHECK(enabled.value().enabled_at.has_value());
    CHECK(fx.last_call("initialize")["config"]["fontSize"] == 12);
    CHECK(fx.persisted_state("notes")["status"] == "enabled");
    CHECK(fx.count_events(PluginEventType::ENABLED) == 1);

    // Already enabled: no second initialize
    REQUIRE(fx.manager->enable("notes").is_ok());
    CHECK(fx.workers.script->count("initialize") == 1);

    CHECK(fx.manager->enable("ghost").error_kind() == ErrorKind::NOT_FOUND);
}

TEST_CASE("PluginManager: enable failure is persisted and retryable", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    fx.fail_initialize = true;
    const auto failed = fx.manager->enable("notes");
    CHECK(failed.error_kind() == ErrorKind::PLUGIN_ERROR);

    const auto state = fx.manager->get_state("notes").value();
    CHECK(state.status == PluginStatus::ERROR);
    CHECK(state.last_error.value_or("").find("database file is locked") != std::string::npos);
    CHECK_FALSE(state.enabled_at.has_value());
    CHECK(fx.persisted_state("notes")["status"] == "error");
    CHECK(fx.count_events(PluginEventType::ENABLE_FAILED) == 1);

    fx.fail_initialize = false;
    const auto retried = fx.manager->enable("notes");
    REQUIRE(retried.is_ok());
    CHECK(retried.value().status == PluginStatus::ENABLED);
}

TEST_CASE("PluginManager: execute routes calls to enabled plugins", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    CHECK(fx.manager->execute("notes", "echo", json::object()).error_kind() == ErrorKind::NOT_AVAILABLE);
    CHECK(fx.manager->execute("ghost", "echo", json::object()).error_kind() == ErrorKind::NOT_FOUND);

    REQUIRE(fx.manager->enable("notes").is_ok());
    const auto result = fx.manager->execute("notes", "echo", {{"text", "hello"}});
    REQUIRE(result.is_ok());
    CHECK(result.value()["text"] == "hello");

    CHECK(fx.manager->execute("notes", "", json::object()).error_kind() == ErrorKind::VALIDATION);

    const auto failed = fx.manager->execute("notes", "boom", json::object());
    CHECK(failed.error_kind() == ErrorKind::PLUGIN_ERROR);

    const auto state = fx.manager->get_state("notes").value();
    CHECK(state.status == PluginStatus::ENABLED);
    CHECK(state.metrics.execution_count == 1);
    CHECK(state.metrics.error_count == 1);
    CHECK(state.metrics.load_time_ms.has_value());
    CHECK(state.metrics.memory_usage == 4096u);
    CHECK(fx.persisted_state("notes")["metrics"]["executionCount"] == 1);
}

TEST_CASE("PluginManager: concurrent executions of one plugin", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());

    std::atomic<int> failures{0};
    std::atomic<bool> done{false};
    std::atomic<int> regressions{0};

    // The state file is replaced by rename, so every read sees a whole document
    std::thread watcher([&] {
        const fs::path path = fx.plugins_dir() / "notes" / "state.json";
        uint64_t last = 0;
        while (!done) {
            const json doc = json::parse(test::read_file(path), nullptr, false);
            if (doc.is_discarded()) continue;
            const auto count = doc["metrics"]["executionCount"].get<uint64_t>();
            if (count < last) regressions++;
            last = count;
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                const auto r = fx.manager->execute("notes", "echo", {{"n", t * 100 + i}});
                if (r.is_error() || r.value()["n"] != t * 100 + i) failures++;
            }
        });
    }
    for (auto& th : threads) th.join();
    done = true;
    watcher.join();

    CHECK(failures == 0);
    CHECK(regressions == 0);
    CHECK(fx.manager->get_state("notes").value().metrics.execution_count == 400);
    CHECK(fx.persisted_state("notes")["metrics"]["executionCount"] == 400);
}

TEST_CASE("PluginManager: disable runs cleanup and blocks execution", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());

    SECTION("clean shutdown") {
        REQUIRE(fx.manager->disable("notes").is_ok());
        CHECK(fx.workers.script->count("cleanup") == 1);
    }
    SECTION("cleanup failure still disables") {
        fx.fail_cleanup = true;
        REQUIRE(fx.manager->disable("notes").is_ok());
    }

    const auto state = fx.manager->get_state("notes").value();
    CHECK(state.status == PluginStatus::DISABLED);
    CHECK_FALSE(state.enabled_at.has_value());
    CHECK(fx.persisted_state("notes")["status"] == "disabled");
    CHECK(fx.manager->execute("notes", "echo", json::object()).error_kind() == ErrorKind::NOT_AVAILABLE);
    CHECK(fx.count_events(PluginEventType::DISABLED) == 1);

    // Enable again from disabled
    REQUIRE(fx.manager->enable("notes").is_ok());
    CHECK(fx.manager->execute("notes", "echo", {{"x", 1}}).is_ok());
}

TEST_CASE("PluginManager: a crashed worker is reported and recovered by enable", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());

    fx.workers.last().crash("worker killed by signal 9");

    const auto result = fx.manager->execute("notes", "echo", json::object());
    CHECK(result.error_kind() == ErrorKind::WORKER_TERMINATED);
    CHECK(fx.manager->get_state("notes").value().status == PluginStatus::ERROR);

    const auto recovered = fx.manager->enable("notes");
    REQUIRE(recovered.is_ok());
    CHECK(fx.workers.script->started == 2);
    CHECK(fx.manager->execute("notes", "echo", {{"ok", true}}).is_ok());
}

// ============================================================================
// Uninstall / update
// ============================================================================

TEST_CASE("PluginManager: uninstall removes everything", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());
    fx.ui->add_command("notes", {{"id", "notes.new"}});

    REQUIRE(fx.manager->uninstall("notes").is_ok());
    CHECK(fx.workers.script->count("cleanup") == 1);
    CHECK(fx.workers.script->terminated >= 1);
    CHECK_FALSE(fs::exists(fx.plugins_dir() / "notes"));
    CHECK(fx.manager->list_installed().empty());
    CHECK(fx.ui->contributions("notes").commands.empty());
    CHECK(fx.count_events(PluginEventType::UNINSTALLED) == 1);

    // Idempotent and silent for unknown ids
    CHECK(fx.manager->uninstall("notes").is_ok());
    CHECK(fx.count_events(PluginEventType::UNINSTALLED) == 1);

    // Reinstall works after uninstall
    CHECK(fx.manager->install("notes", "1.0.0").is_ok());
}

TEST_CASE("PluginManager: per-id locks do not outlive their operations", "[manager]") {
    Fixture fx;
    CHECK(fx.manager->id_lock_count() == 0);

    for (int i = 0; i < 100; ++i) {
        const std::string id = std::format("ghost-{}", i);
        CHECK(fx.manager->execute(id, "echo", json::object()).error_kind() == ErrorKind::NOT_FOUND);
        CHECK(fx.manager->enable(id).is_error());
        CHECK(fx.manager->uninstall(id).is_ok());
    }
    CHECK(fx.manager->id_lock_count() == 0);

    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());
    REQUIRE(fx.manager->execute("notes", "echo", json::object()).is_ok());
    REQUIRE(fx.manager->uninstall("notes").is_ok());
    CHECK(fx.manager->id_lock_count() == 0);
}

TEST_CASE("PluginManager: update reinstalls at the new version", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());

    const auto updated = fx.manager->update("notes", "1.1.0");
    REQUIRE(updated.is_ok());
    CHECK(updated.value().version == "1.1.0");
    CHECK(updated.value().status == PluginStatus::INSTALLED);
    CHECK(fx.manager->list_installed().front().version == "1.1.0");

    REQUIRE(fx.count_events(PluginEventType::UPDATED) == 1);
    CHECK(fx.events.back().data["from"] == "1.0.0");
    CHECK(fx.events.back().data["to"] == "1.1.0");
}

TEST_CASE("PluginManager: a failed update leaves the plugin uninstalled", "[manager]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    fx.transport->fail_download = true;
    const auto updated = fx.manager->update("notes", "1.1.0");
    CHECK(updated.error_kind() == ErrorKind::REGISTRY_ERROR);
    CHECK(updated.error_message().find("no longer installed") != std::string::npos);
    CHECK(fx.manager->get_state("notes").error_kind() == ErrorKind::NOT_FOUND);
    CHECK_FALSE(fs::exists(fx.plugins_dir() / "notes"));

    CHECK(fx.manager->update("ghost").error_kind() == ErrorKind::NOT_FOUND);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("PluginManager: plugin configuration overrides", "[manager][config]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    const auto defaults = fx.manager->get_plugin_config("notes");
    REQUIRE(defaults.is_ok());
    CHECK(defaults.value() == json{{"theme", "light"}, {"fontSize", 12}});

    const auto merged = fx.manager->set_plugin_config("notes", {{"theme", "dark"}});
    REQUIRE(merged.is_ok());
    CHECK(merged.value()["theme"] == "dark");
    CHECK(merged.value()["fontSize"] == 12);
    CHECK(fx.persisted_state("notes")["config"] == json{{"theme", "dark"}});

    CHECK(fx.manager->set_plugin_config("notes", {{"fontSize", "huge"}}).error_kind() == ErrorKind::VALIDATION);
    CHECK(fx.manager->set_plugin_config("notes", json::array()).error_kind() == ErrorKind::VALIDATION);
    CHECK(fx.manager->get_plugin_config("notes").value()["fontSize"] == 12);

    const auto reset = fx.manager->set_plugin_config("notes", {{"theme", nullptr}});
    REQUIRE(reset.is_ok());
    CHECK(reset.value()["theme"] == "light");

    CHECK(fx.manager->get_plugin_config("ghost").error_kind() == ErrorKind::NOT_FOUND);
}

TEST_CASE("PluginManager: enabled plugins are told about config changes", "[manager][config]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());

    REQUIRE(fx.manager->set_plugin_config("notes", {{"fontSize", 14}}).is_ok());
    CHECK(fx.workers.script->count("configChanged") == 0);

    REQUIRE(fx.manager->enable("notes").is_ok());
    CHECK(fx.last_call("initialize")["config"]["fontSize"] == 14);

    REQUIRE(fx.manager->set_plugin_config("notes", {{"fontSize", 16}}).is_ok());
    CHECK(fx.workers.script->count("configChanged") == 1);
    CHECK(fx.last_call("configChanged")["config"]["fontSize"] == 16);
}

// ============================================================================
// Startup recovery
// ============================================================================

TEST_CASE("PluginManager: load_installed restores persisted plugins", "[manager][recovery]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    REQUIRE(fx.manager->enable("notes").is_ok());
    REQUIRE(fx.manager->set_plugin_config("notes", {{"theme", "dark"}}).is_ok());
    fx.manager.reset();

    // Debris from an interrupted install and an unloadable plugin
    fx.root.file("plugins/.staging/notes-dead/manifest.json", "{}");
    fx.root.file("plugins/broken/manifest.json", R"({"id": "broken"})");

    fx.events.clear();
    fx.manager = fx.make_manager();
    const auto loaded = fx.manager->load_installed();
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value() == 1);
    CHECK_FALSE(fs::exists(fx.plugins_dir() / ".staging"));

    const auto state = fx.manager->get_state("notes");
    REQUIRE(state.is_ok());
    CHECK(state.value().status == PluginStatus::ENABLED);
    CHECK(fx.workers.script->count("initialize") == 2);
    CHECK(fx.last_call("initialize")["config"]["theme"] == "dark");
    CHECK(fx.manager->execute("notes", "echo", {{"a", 1}}).is_ok());

    // A broken plugin can still be uninstalled
    REQUIRE(fx.manager->uninstall("broken").is_ok());
    CHECK_FALSE(fs::exists(fx.plugins_dir() / "broken"));
}

TEST_CASE("PluginManager: load_installed with unreadable state resets to installed", "[manager][recovery]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    fx.manager.reset();
    fx.root.file("plugins/notes/state.json", "{ truncated");

    fx.manager = fx.make_manager();
    REQUIRE(fx.manager->load_installed().value() == 1);
    const auto state = fx.manager->get_state("notes").value();
    CHECK(state.status == PluginStatus::INSTALLED);
    CHECK(state.version == "1.0.0");
    CHECK(fx.persisted_state("notes")["status"] == "installed");
}

// ============================================================================
// Events
// ============================================================================

TEST_CASE("PluginManager: plugin and registry events reach listeners", "[manager][events]") {
    Fixture fx;
    REQUIRE(fx.manager->install("notes", "1.0.0").is_ok());
    // install() synced the registry on its first lookup
    CHECK(fx.count_events(PluginEventType::REGISTRY_UPDATED) == 1);

    fx.workers.last().deliver(protocol::MessageType::EVENT, {{"event", "note_saved"}, {"data", {{"id", 7}}}});
    REQUIRE(fx.count_events(PluginEventType::PLUGIN_EVENT) == 1);
    const auto& event = fx.events.back();
    CHECK(event.plugin_id == "notes");
    CHECK(event.data["event"] == "note_saved");
    CHECK(event.data["data"]["id"] == 7);

    const auto recent = fx.manager->recent_events();
    REQUIRE_FALSE(recent.empty());
    CHECK(recent.back().type == PluginEventType::PLUGIN_EVENT);
}

TEST_CASE("PluginManager: registry search", "[manager]") {
    Fixture fx;
    const auto found = fx.manager->search_registry("notes");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().size() == 1);
    CHECK(found.value()[0].id == "notes");

    PluginManager offline(PluginManagerOptions{fx.root.path / "offline", "1.0.0", {}}, nullptr,
                          fx.workers.factory(), HostServices{});
    CHECK(offline.search_registry("notes").error_kind() == ErrorKind::NOT_AVAILABLE);
    CHECK(offline.install("notes").error_kind() == ErrorKind::NOT_AVAILABLE);
}
