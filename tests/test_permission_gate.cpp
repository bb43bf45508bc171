#include <catch2/catch_test_macros.hpp>
#include "sandbox/permission_gate.hpp"
#include "core/url.hpp"
#include "mocks/test_support.hpp"

#include <filesystem>

using namespace pluginhost;
namespace fs = std::filesystem;

namespace {

PermissionGate make_gate(const PermissionGrants& grants, const fs::path& root) {
    return PermissionGate(std::make_shared<const PermissionSnapshot>(grants, root));
}

template<typename Fn>
ErrorKind error_of(Fn&& fn) {
    try {
        fn();
    } catch (const PluginError& e) {
        return e.kind();
    }
    return ErrorKind::NONE;
}

} // namespace

TEST_CASE("PermissionGate: absent grants deny every gated capability", "[permission]") {
    test::TmpDir dir;
    const auto gate = make_gate(PermissionGrants{}, dir.path);

    CHECK(error_of([&] { gate.check(permission::FileRead{"a.txt"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::FileWrite{"a.txt"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://example.com"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::AgentCreate{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::AgentExecute{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::ModelExecute{"m"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::MemoryRead{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::MemoryWrite{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::UiPanel{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::UiMenu{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::UiCommand{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::UiNotification{}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::Ungated{}); }) == ErrorKind::NONE);
}

TEST_CASE("PermissionGate: file access is matched against glob patterns", "[permission]") {
    test::TmpDir dir;
    PermissionGrants grants;
    grants.filesystem.read = {"*.md", "data/**"};
    grants.filesystem.write = {"out/*.txt"};
    const auto gate = make_gate(grants, dir.path);

    const auto cleared = gate.check(permission::FileRead{"README.md"});
    CHECK(cleared.resolved_path == fs::weakly_canonical(dir.path) / "README.md");

    CHECK(error_of([&] { gate.check(permission::FileRead{"data/a/b/c.json"}); }) == ErrorKind::NONE);
    CHECK(error_of([&] { gate.check(permission::FileRead{"docs/guide.md"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::FileRead{"secret.key"}); }) == ErrorKind::PERMISSION_DENIED);

    CHECK(error_of([&] { gate.check(permission::FileWrite{"out/result.txt"}); }) == ErrorKind::NONE);
    CHECK(error_of([&] { gate.check(permission::FileWrite{"out/deep/result.txt"}); }) == ErrorKind::PERMISSION_DENIED);
    CHECK(error_of([&] { gate.check(permission::FileWrite{"README.md"}); }) == ErrorKind::PERMISSION_DENIED);
}

TEST_CASE("PermissionGate: traversal is reported before grants", "[permission]") {
    test::TmpDir dir;

    SECTION("without any file grant") {
        const auto gate = make_gate(PermissionGrants{}, dir.path);
        CHECK(error_of([&] { gate.check(permission::FileRead{"../outside.txt"}); }) == ErrorKind::PATH_TRAVERSAL);
        CHECK(error_of([&] { gate.check(permission::FileWrite{"/etc/passwd"}); }) == ErrorKind::PATH_TRAVERSAL);
    }

    SECTION("with a grant that would match") {
        PermissionGrants grants;
        grants.filesystem.read = {"**"};
        const auto gate = make_gate(grants, dir.path);
        CHECK(error_of([&] { gate.check(permission::FileRead{"a/../../etc/passwd"}); }) == ErrorKind::PATH_TRAVERSAL);
        CHECK(error_of([&] { gate.check(permission::FileRead{"a/../inside.txt"}); }) == ErrorKind::NONE);
    }
}

TEST_CASE("PermissionGate: symlinks leaving the plugin directory are traversal", "[permission]") {
    test::TmpDir dir;
    test::TmpDir outside;
    outside.file("secret.txt", "top secret");
    fs::create_directory_symlink(outside.path, dir.path / "link");

    PermissionGrants grants;
    grants.filesystem.read = {"**"};
    const auto gate = make_gate(grants, dir.path);

    CHECK(error_of([&] { gate.check(permission::FileRead{"link/secret.txt"}); }) == ErrorKind::PATH_TRAVERSAL);
}

TEST_CASE("PermissionGate: network needs external access and a listed domain", "[permission]") {
    test::TmpDir dir;
    PermissionGrants grants;
    grants.network.domains = {"example.com"};

    SECTION("domains without external are denied") {
        const auto gate = make_gate(grants, dir.path);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://example.com/x"}); }) == ErrorKind::PERMISSION_DENIED);
    }

    SECTION("external with allow-list") {
        grants.network.external = true;
        const auto gate = make_gate(grants, dir.path);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://example.com/x"}); }) == ErrorKind::NONE);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"http://api.example.com:8080/v1"}); }) == ErrorKind::NONE);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://EXAMPLE.com"}); }) == ErrorKind::NONE);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://badexample.com"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://example.com.evil.io"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://user@evil.io/example.com"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"ftp://example.com/file"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"file:///etc/passwd"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"http://x\\@example.com/"}); }) == ErrorKind::PERMISSION_DENIED);
        CHECK(error_of([&] { gate.check(permission::NetworkFetch{"https://example.com@evil.io/"}); }) == ErrorKind::PERMISSION_DENIED);
    }

    SECTION("clearance carries the parsed URL the fetch must use") {
        grants.network.external = true;
        const auto gate = make_gate(grants, dir.path);
        const auto clearance = gate.guard(permission::NetworkFetch{"HTTPS://EXAMPLE.com/x?y#z"},
                                          [](const Clearance& c) { return c; });
        REQUIRE(clearance.url.has_value());
        CHECK(clearance.url->scheme == "https");
        CHECK(clearance.url->host == "example.com");
        CHECK(clearance.url->port == 443);
        CHECK(clearance.url->target == "/x?y");
    }
}

TEST_CASE("PermissionGate: model execution needs the model listed", "[permission]") {
    test::TmpDir dir;
    PermissionGrants grants;
    grants.models.execute = true;
    grants.models.access = {"small"};
    auto gate = make_gate(grants, dir.path);

    CHECK(error_of([&] { gate.check(permission::ModelExecute{"small"}); }) == ErrorKind::NONE);
    CHECK(error_of([&] { gate.check(permission::ModelExecute{"large"}); }) == ErrorKind::PERMISSION_DENIED);

    grants.models.access = {"*"};
    gate = make_gate(grants, dir.path);
    CHECK(error_of([&] { gate.check(permission::ModelExecute{"large"}); }) == ErrorKind::NONE);

    grants.models.execute = false;
    gate = make_gate(grants, dir.path);
    CHECK(error_of([&] { gate.check(permission::ModelExecute{"large"}); }) == ErrorKind::PERMISSION_DENIED);
}

TEST_CASE("PermissionGate: guard runs the operation only after a successful check", "[permission]") {
    test::TmpDir dir;
    PermissionGrants grants;
    grants.ui.commands = true;
    const auto gate = make_gate(grants, dir.path);

    int runs = 0;
    const int value = gate.guard(permission::UiCommand{}, [&](const Clearance&) { return ++runs; });
    CHECK(value == 1);

    CHECK(error_of([&] { gate.guard(permission::UiPanel{}, [&](const Clearance&) { return ++runs; }); })
          == ErrorKind::PERMISSION_DENIED);
    CHECK(runs == 1);
}

TEST_CASE("PermissionGate: snapshot is frozen at construction", "[permission]") {
    test::TmpDir dir;
    PermissionGrants grants;
    grants.memory.read = true;
    const auto snapshot = std::make_shared<const PermissionSnapshot>(grants, dir.path);
    const PermissionGate gate(snapshot);

    grants.memory.read = false;     // the caller's copy, not the snapshot
    CHECK(error_of([&] { gate.check(permission::MemoryRead{}); }) == ErrorKind::NONE);
    CHECK(snapshot->grants().memory.read);
}

TEST_CASE("PermissionGate: helpers", "[permission]") {
    CHECK(PermissionGate::domain_matches("a.b.example.com", "example.com"));
    CHECK(PermissionGate::domain_matches("example.com", "*.example.com"));
    CHECK_FALSE(PermissionGate::domain_matches("notexample.com", "example.com"));

    CHECK(PermissionGate::path_matches("./*.md", "a.md"));
    CHECK_FALSE(PermissionGate::path_matches("*.md", "dir/a.md"));
    CHECK(PermissionGate::path_matches("dir/**", "dir/x/y.md"));
}

TEST_CASE("parse_url: strict http(s) parsing", "[permission][url]") {
    const auto upper = utils::parse_url("HTTPS://Sub.Example.com/path");
    REQUIRE(upper.has_value());
    CHECK(upper->scheme == "https");
    CHECK(upper->host == "sub.example.com");
    CHECK(upper->origin() == "https://sub.example.com:443");

    const auto v6 = utils::parse_url("http://[::1]:8080/");
    REQUIRE(v6.has_value());
    CHECK(v6->host == "::1");
    CHECK(v6->port == 8080);
    CHECK(v6->origin() == "http://[::1]:8080");

    const auto bare = utils::parse_url("http://example.com?q=1");
    REQUIRE(bare.has_value());
    CHECK(bare->target == "/?q=1");

    CHECK_FALSE(utils::parse_url("https://user@example.com/").has_value());
    CHECK_FALSE(utils::parse_url("http://x\\@example.com/").has_value());
    CHECK_FALSE(utils::parse_url("mailto:someone@example.com").has_value());
    CHECK_FALSE(utils::parse_url("http://example.com:0/").has_value());
    CHECK_FALSE(utils::parse_url("http://example.com:70000/").has_value());
    CHECK_FALSE(utils::parse_url("http://example.com:80x/").has_value());
    CHECK_FALSE(utils::parse_url("http:///path").has_value());
    CHECK_FALSE(utils::parse_url("http://exa mple.com/").has_value());
}
