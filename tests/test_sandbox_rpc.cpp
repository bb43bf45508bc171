#include <catch2/catch_test_macros.hpp>
#include "host/ui_registry.hpp"
#include "sandbox/sandbox.hpp"
#include "mocks/mock_worker.hpp"
#include "mocks/test_support.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace pluginhost;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

PluginManifest sandbox_manifest() {
    json raw = test::minimal_manifest("notes");
    raw["capabilities"] = {"ui:commands", "filesystem:read", "network:fetch"};
    raw["permissions"] = {
        {"ui", {{"commands", true}}},
        {"filesystem", {{"read", {"*.md"}}}},
        {"network", {{"domains", {"example.com"}}, {"external", true}}},
    };
    return validate_manifest(raw, "1.0.0").value();
}

// Records what the broker asked for instead of touching the network
struct RecordingNetworkClient : INetworkClient {
    std::mutex mutex;
    std::vector<FetchRequest> requests;

    json fetch(const std::string&, const FetchRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
        return json{{"status", 204}, {"body", ""}, {"headers", json::object()}};
    }
};

SandboxOptions fast_options() {
    SandboxOptions options;
    options.rpc_timeout = 2000ms;
    options.init_timeout = 500ms;
    return options;
}

ErrorKind error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const PluginError& e) {
        return e.kind();
    }
    return ErrorKind::NONE;
}

struct Fixture {
    test::TmpDir dir;
    test::MockWorkerFactory workers;
    std::shared_ptr<UiRegistry> ui = std::make_shared<UiRegistry>();
    std::shared_ptr<RecordingNetworkClient> network = std::make_shared<RecordingNetworkClient>();
    std::vector<std::pair<std::string, json>> events;
    std::mutex events_mutex;

    std::unique_ptr<Sandbox> make(SandboxOptions options = fast_options()) {
        HostServices services;
        services.ui = ui;
        services.network = network;
        return std::make_unique<Sandbox>(sandbox_manifest(), options, workers.factory(), services,
            [this](const std::string&, const std::string& event, const json& data) {
                std::lock_guard<std::mutex> lock(events_mutex);
                events.emplace_back(event, data);
            });
    }
};

} // namespace

TEST_CASE("Sandbox: initialize sends INIT and becomes ready", "[sandbox]") {
    Fixture fx;
    auto sandbox = fx.make();
    CHECK(sandbox->state() == SandboxState::UNINITIALIZED);

    sandbox->initialize(fx.dir.path, {{"theme", "dark"}});
    CHECK(sandbox->state() == SandboxState::READY);

    REQUIRE(fx.workers.script->init_payloads.size() == 1);
    const auto& init = fx.workers.script->init_payloads[0];
    CHECK(init["pluginId"] == "notes");
    CHECK(init["main"] == "libnotes.so");
    CHECK(init["config"]["theme"] == "dark");
    CHECK(init["permissions"]["ui"]["commands"] == true);
    CHECK(init["permissions"]["network"]["external"] == true);
    CHECK(fx.workers.last().spec().plugin_id == "notes");
}

TEST_CASE("Sandbox: calls before initialization are not available", "[sandbox]") {
    Fixture fx;
    auto sandbox = fx.make();
    CHECK(error_of([&] { (void)sandbox->call("echo", json::object()); }) == ErrorKind::NOT_AVAILABLE);
}

TEST_CASE("Sandbox: initialization failures terminate the sandbox", "[sandbox]") {
    Fixture fx;

    SECTION("worker fails to start") {
        fx.workers.script->fail_start = true;
    }
    SECTION("plugin reports an init error") {
        fx.workers.script->ready_error = "entry module missing";
    }
    SECTION("worker never answers") {
        fx.workers.script->never_ready = true;
    }

    auto options = fast_options();
    options.init_timeout = 100ms;
    auto sandbox = fx.make(options);
    CHECK(error_of([&] { sandbox->initialize(fx.dir.path, json::object()); }) == ErrorKind::SANDBOX_INIT_FAILURE);
    CHECK(sandbox->state() == SandboxState::TERMINATED);
    CHECK(error_of([&] { (void)sandbox->call("echo", json::object()); }) == ErrorKind::NOT_AVAILABLE);
}

TEST_CASE("Sandbox: results and plugin errors are routed to the caller", "[sandbox]") {
    Fixture fx;
    fx.workers.script->handler = [](const std::string& method, const json& args) -> std::optional<json> {
        if (method == "echo") return args;
        if (method == "fail") throw PluginError(ErrorKind::PLUGIN_ERROR, "boom");
        throw PluginError(ErrorKind::NOT_FOUND, "no such method");
    };
    auto sandbox = fx.make();
    sandbox->initialize(fx.dir.path, json::object());

    CHECK(sandbox->call("echo", {{"n", 7}})["n"] == 7);
    CHECK(error_of([&] { (void)sandbox->call("fail", json::object()); }) == ErrorKind::PLUGIN_ERROR);
    CHECK(error_of([&] { (void)sandbox->call("missing", json::object()); }) == ErrorKind::NOT_FOUND);
    CHECK(sandbox->pending_count() == 0);
}

TEST_CASE("Sandbox: concurrent calls each receive their own result", "[sandbox]") {
    Fixture fx;
    fx.workers.script->handler = [](const std::string&, const json& args) -> std::optional<json> {
        return args;
    };
    auto sandbox = fx.make();
    sandbox->initialize(fx.dir.path, json::object());

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                const json result = sandbox->call("echo", {{"t", t}, {"i", i}});
                if (result["t"] != t || result["i"] != i) mismatches++;
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(mismatches == 0);
    CHECK(sandbox->pending_count() == 0);
}

TEST_CASE("Sandbox: unanswered calls time out", "[sandbox]") {
    Fixture fx;
    fx.workers.script->handler = [](const std::string&, const json&) -> std::optional<json> {
        return std::nullopt;
    };
    auto options = fast_options();
    options.rpc_timeout = 100ms;
    auto sandbox = fx.make(options);
    sandbox->initialize(fx.dir.path, json::object());

    const auto started = std::chrono::steady_clock::now();
    CHECK(error_of([&] { (void)sandbox->call("hang", json::object()); }) == ErrorKind::TIMEOUT);
    CHECK(std::chrono::steady_clock::now() - started < 2s);
    CHECK(sandbox->pending_count() == 0);
    CHECK(sandbox->state() == SandboxState::READY);
}

TEST_CASE("Sandbox: terminate rejects pending calls", "[sandbox]") {
    Fixture fx;
    fx.workers.script->handler = [](const std::string&, const json&) -> std::optional<json> {
        return std::nullopt;
    };
    auto options = fast_options();
    options.rpc_timeout = 60000ms;
    auto sandbox = fx.make(options);
    sandbox->initialize(fx.dir.path, json::object());

    auto first = sandbox->execute("hang", json::object());
    auto second = sandbox->execute("hang", json::object());
    CHECK(sandbox->pending_count() == 2);

    sandbox->terminate();
    CHECK(sandbox->state() == SandboxState::TERMINATED);
    CHECK(error_of([&] { first.get(); }) == ErrorKind::WORKER_TERMINATED);
    CHECK(error_of([&] { second.get(); }) == ErrorKind::WORKER_TERMINATED);
    CHECK(fx.workers.script->terminated == 1);

    // Idempotent
    sandbox->terminate();
    CHECK(error_of([&] { (void)sandbox->execute("echo", json::object()); }) == ErrorKind::NOT_AVAILABLE);
}

TEST_CASE("Sandbox: a worker crash rejects pending calls", "[sandbox]") {
    Fixture fx;
    fx.workers.script->handler = [](const std::string&, const json&) -> std::optional<json> {
        return std::nullopt;
    };
    auto options = fast_options();
    options.rpc_timeout = 60000ms;
    auto sandbox = fx.make(options);
    sandbox->initialize(fx.dir.path, json::object());

    auto pending = sandbox->execute("hang", json::object());
    fx.workers.last().crash("worker exited with status 3");

    CHECK(error_of([&] { pending.get(); }) == ErrorKind::WORKER_TERMINATED);
    CHECK(sandbox->state() == SandboxState::TERMINATED);
    CHECK(sandbox->exit_reason() == "worker exited with status 3");
}

TEST_CASE("Sandbox: host API calls are gated with the frozen snapshot", "[sandbox]") {
    Fixture fx;
    auto sandbox = fx.make();
    sandbox->initialize(fx.dir.path, json::object());
    auto& worker = fx.workers.last();

    worker.emit_api_call("c1", "addCommand", {{"command", {{"id", "notes.new"}}}});
    const auto granted = fx.workers.script->wait_api_result("c1");
    REQUIRE(granted.has_value());
    CHECK((*granted)["ok"] == true);
    REQUIRE(fx.ui->contributions("notes").commands.size() == 1);
    CHECK(fx.ui->contributions("notes").commands[0]["id"] == "notes.new");

    worker.emit_api_call("c2", "addPanel", {{"panel", {{"id", "side"}}}});
    const auto denied = fx.workers.script->wait_api_result("c2");
    REQUIRE(denied.has_value());
    CHECK((*denied)["ok"] == false);
    CHECK((*denied)["error"]["kind"] == "permission_denied");
    CHECK(fx.ui->contributions("notes").panels.empty());

    worker.emit_api_call("c3", "createAgent", {{"config", json::object()}});
    const auto no_agents = fx.workers.script->wait_api_result("c3");
    REQUIRE(no_agents.has_value());
    CHECK((*no_agents)["error"]["kind"] == "permission_denied");

    worker.emit_api_call("c4", "rm -rf", json::object());
    const auto unknown = fx.workers.script->wait_api_result("c4");
    REQUIRE(unknown.has_value());
    CHECK((*unknown)["error"]["kind"] == "validation_error");
}

TEST_CASE("Sandbox: fetch runs host-side against the gate-approved URL", "[sandbox][security]") {
    Fixture fx;
    auto options = fast_options();
    options.api_call_timeout = 1500ms;
    auto sandbox = fx.make(options);
    sandbox->initialize(fx.dir.path, json::object());
    auto& worker = fx.workers.last();

    worker.emit_api_call("f1", "fetch", {
        {"url", "HTTPS://Example.com:8443/a?b=1#frag"},
        {"method", "POST"},
        {"body", "{}"},
        {"headers", {{"Content-Type", "text/plain"}, {"X-Trace", "7"}}},
    });
    const auto fetched = fx.workers.script->wait_api_result("f1");
    REQUIRE(fetched.has_value());
    CHECK((*fetched)["ok"] == true);
    CHECK((*fetched)["result"]["status"] == 204);

    {
        std::lock_guard<std::mutex> lock(fx.network->mutex);
        REQUIRE(fx.network->requests.size() == 1);
        const auto& request = fx.network->requests[0];
        CHECK(request.url.origin() == "https://example.com:8443");
        CHECK(request.url.target == "/a?b=1");
        CHECK(request.method == "post");
        CHECK(request.content_type == "text/plain");
        CHECK(request.headers.size() == 1);
        CHECK(request.timeout == 1500ms);
    }

    // Never reaches the client: credentials, foreign host, other scheme
    worker.emit_api_call("f2", "fetch", {{"url", "https://example.com@evil.io/"}});
    worker.emit_api_call("f3", "fetch", {{"url", "http://x\\@example.com/"}});
    worker.emit_api_call("f4", "fetch", {{"url", "https://evil.io/example.com"}});
    worker.emit_api_call("f5", "fetch", {{"url", "file:///etc/passwd"}});
    for (const char* id : {"f2", "f3", "f4", "f5"}) {
        const auto denied = fx.workers.script->wait_api_result(id);
        REQUIRE(denied.has_value());
        CHECK((*denied)["error"]["kind"] == "permission_denied");
    }

    std::lock_guard<std::mutex> lock(fx.network->mutex);
    CHECK(fx.network->requests.size() == 1);
}

TEST_CASE("Sandbox: plugin events reach the event callback", "[sandbox]") {
    Fixture fx;
    auto sandbox = fx.make();
    sandbox->initialize(fx.dir.path, json::object());

    fx.workers.last().deliver(protocol::MessageType::EVENT, {{"event", "note_saved"}, {"data", {{"n", 1}}}});
    fx.workers.last().deliver(protocol::MessageType::EVENT, {{"data", 2}});     // unnamed, ignored

    std::lock_guard<std::mutex> lock(fx.events_mutex);
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events[0].first == "note_saved");
    CHECK(fx.events[0].second["n"] == 1);
}
