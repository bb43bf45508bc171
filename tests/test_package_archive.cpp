#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "plugin/package_archive.hpp"
#include "mocks/test_support.hpp"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <filesystem>

using namespace pluginhost;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Compress a hand-written package index, bypassing build()'s path checks
std::string raw_package(const json& index) {
    const std::string text = index.dump();
    uLongf size = compressBound(static_cast<uLong>(text.size()));
    std::string out(size, '\0');
    REQUIRE(compress2(reinterpret_cast<Bytef*>(out.data()), &size,
        reinterpret_cast<const Bytef*>(text.data()), static_cast<uLong>(text.size()), Z_BEST_SPEED) == Z_OK);
    out.resize(size);
    return out;
}

json file_entry(const std::string& path, const std::string& data) {
    return {{"path", path}, {"mode", 0644}, {"data", base64::encode(data)}};
}

} // namespace

TEST_CASE("PackageArchive: entry path safety", "[package]") {
    CHECK(PackageArchive::is_safe_entry_path("manifest.json"));
    CHECK(PackageArchive::is_safe_entry_path("assets/icons/app.png"));

    CHECK_FALSE(PackageArchive::is_safe_entry_path(""));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("/etc/passwd"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("../escape.so"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("lib/../../escape.so"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("lib/./x.so"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("lib//x.so"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("lib\\x.so"));
    CHECK_FALSE(PackageArchive::is_safe_entry_path("lib/"));
}

TEST_CASE("PackageArchive: build then read preserves entries", "[package]") {
    std::vector<PackageEntry> entries = {
        {"manifest.json", 0644, R"({"id":"notes"})"},
        {"lib/libnotes.so", 0755, std::string("\x7f" "ELF\0\x01\x02", 7)},
    };
    const auto bytes = PackageArchive::build(entries);
    REQUIRE(bytes.is_ok());

    const auto read = PackageArchive::read(bytes.value());
    REQUIRE(read.is_ok());
    REQUIRE(read.value().size() == 2);
    CHECK(read.value()[1].path == "lib/libnotes.so");
    CHECK(read.value()[1].mode == 0755);
    CHECK(read.value()[1].data.size() == 7);
    CHECK(read.value()[1].data == entries[1].data);
}

TEST_CASE("PackageArchive: build rejects unsafe or duplicate paths", "[package]") {
    CHECK(PackageArchive::build({{"../x", 0644, "x"}}).error_kind() == ErrorKind::VALIDATION);
    CHECK(PackageArchive::build({{"a", 0644, "1"}, {"a", 0644, "2"}}).error_kind() == ErrorKind::VALIDATION);
}

TEST_CASE("PackageArchive: malformed packages are validation errors", "[package]") {
    SECTION("not zlib") {
        CHECK(PackageArchive::read("definitely not compressed").error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("truncated stream") {
        const auto bytes = PackageArchive::build({{"manifest.json", 0644, std::string(4096, 'x')}}).value();
        CHECK(PackageArchive::read(bytes.substr(0, bytes.size() / 2)).error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("index is not an object") {
        CHECK(PackageArchive::read(raw_package(json::array())).error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("unknown format") {
        const json index = {{"format", 2}, {"files", json::array()}};
        CHECK(PackageArchive::read(raw_package(index)).error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("bad base64") {
        const json index = {{"format", 1}, {"files", {{{"path", "a"}, {"data", "%%%"}}}}};
        CHECK(PackageArchive::read(raw_package(index)).error_kind() == ErrorKind::VALIDATION);
    }
    SECTION("mode out of range") {
        const json index = {{"format", 1}, {"files", {{{"path", "a"}, {"mode", 4095}, {"data", ""}}}}};
        CHECK(PackageArchive::read(raw_package(index)).error_kind() == ErrorKind::VALIDATION);
    }
}

TEST_CASE("PackageArchive: traversal entry writes nothing", "[package][security]") {
    test::TmpDir tmp("pkg_traversal");
    const auto dest = tmp.path / "out";
    const json index = {{"format", 1}, {"files", {
        file_entry("manifest.json", "{}"),
        file_entry("../escaped.txt", "owned"),
    }}};

    const auto status = PackageArchive::extract(raw_package(index), dest);
    CHECK(status.error_kind() == ErrorKind::VALIDATION);
    CHECK_FALSE(fs::exists(tmp.path / "escaped.txt"));
    CHECK_FALSE(fs::exists(dest / "manifest.json"));
}

TEST_CASE("PackageArchive: extract writes files with their modes", "[package]") {
    test::TmpDir tmp("pkg_extract");
    const auto bytes = PackageArchive::build({
        {"manifest.json", 0644, "{}"},
        {"bin/run.sh", 0755, "#!/bin/sh\n"},
    });
    REQUIRE(bytes.is_ok());

    const auto dest = tmp.path / "plugin";
    REQUIRE(PackageArchive::extract(bytes.value(), dest).is_ok());
    CHECK(test::read_file(dest / "manifest.json") == "{}");
    CHECK(test::read_file(dest / "bin/run.sh") == "#!/bin/sh\n");

    const auto perms = fs::status(dest / "bin/run.sh").permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
}

TEST_CASE("PackageArchive: pack collects a directory tree", "[package]") {
    test::TmpDir src("pkg_src");
    src.file("manifest.json", R"({"id":"notes"})");
    src.file("lib/libnotes.so", "module");
    src.file("assets/readme.md", "# Notes");

    SECTION("entries are sorted by path") {
        const auto packed = PackageArchive::pack(src.path);
        REQUIRE(packed.is_ok());
        const auto entries = PackageArchive::read(packed.value());
        REQUIRE(entries.is_ok());
        REQUIRE(entries.value().size() == 3);
        CHECK(entries.value()[0].path == "assets/readme.md");
        CHECK(entries.value()[1].path == "lib/libnotes.so");
        CHECK(entries.value()[2].path == "manifest.json");
    }

    SECTION("pack output extracts to the same content") {
        test::TmpDir dst("pkg_dst");
        REQUIRE(PackageArchive::extract(PackageArchive::pack(src.path).value(), dst.path).is_ok());
        CHECK(test::read_file(dst.path / "lib/libnotes.so") == "module");
        CHECK(test::read_file(dst.path / "assets/readme.md") == "# Notes");
    }

    SECTION("missing directory") {
        CHECK(PackageArchive::pack(src.path / "nope").error_kind() == ErrorKind::NOT_FOUND);
    }
}
