#include "plugin/package_archive.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace pluginhost {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// zlib
// ============================================================================

Result<std::string> PackageArchive::deflate_bytes(std::string_view data) {
    z_stream zs{};
    if (deflateInit(&zs, Z_BEST_COMPRESSION) != Z_OK) {
        return Result<std::string>::error(ErrorKind::INTERNAL_ERROR, "deflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string compressed;
    compressed.resize(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_out = reinterpret_cast<Bytef*>(compressed.data());
    zs.avail_out = static_cast<uInt>(compressed.size());

    const int ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        return Result<std::string>::error(ErrorKind::INTERNAL_ERROR,
            std::format("deflate failed ({})", ret));
    }
    compressed.resize(zs.total_out);
    return Result<std::string>::ok(std::move(compressed));
}

Result<std::string> PackageArchive::inflate_bytes(std::string_view data) {
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        return Result<std::string>::error(ErrorKind::INTERNAL_ERROR, "inflateInit failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[64 * 1024];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return Result<std::string>::error(ErrorKind::VALIDATION,
                std::format("package is not a valid zlib stream ({})", zs.msg ? zs.msg : "corrupt data"));
        }
        out.append(chunk, sizeof(chunk) - zs.avail_out);
        if (out.size() > kMaxUnpackedBytes) {
            inflateEnd(&zs);
            return Result<std::string>::error(ErrorKind::VALIDATION, "package exceeds maximum unpacked size");
        }
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            return Result<std::string>::error(ErrorKind::VALIDATION, "package stream is truncated");
        }
    }
    inflateEnd(&zs);
    return Result<std::string>::ok(std::move(out));
}

// ============================================================================
// Entries
// ============================================================================

bool PackageArchive::is_safe_entry_path(std::string_view path) {
    if (path.empty() || path.size() > 4096) return false;
    if (path.front() == '/' || path.find('\\') != std::string_view::npos) return false;
    if (path.find('\0') != std::string_view::npos) return false;

    for (const auto& part : utils::split(std::string(path), '/')) {
        if (part.empty() || part == "." || part == "..") return false;
    }
    return path.back() != '/';
}

Result<std::vector<PackageEntry>> PackageArchive::read(std::string_view bytes) {
    using R = Result<std::vector<PackageEntry>>;

    auto inflated = inflate_bytes(bytes);
    if (inflated.is_error()) return R::error(inflated.error_kind(), inflated.error_message());

    const json doc = json::parse(inflated.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return R::error(ErrorKind::VALIDATION, "package index is not a JSON object");
    }
    if (!doc.contains("format") || !doc["format"].is_number_integer() ||
        doc["format"].get<int>() != kFormatVersion) {
        return R::error(ErrorKind::VALIDATION, "unsupported package format");
    }
    if (!doc.contains("files") || !doc["files"].is_array()) {
        return R::error(ErrorKind::VALIDATION, "package has no file list");
    }

    std::vector<PackageEntry> entries;
    std::set<std::string> seen;
    for (const auto& file : doc["files"]) {
        if (!file.is_object() || !file.contains("path") || !file["path"].is_string() ||
            !file.contains("data") || !file["data"].is_string()) {
            return R::error(ErrorKind::VALIDATION, "package entry needs 'path' and 'data' strings");
        }

        PackageEntry entry;
        entry.path = file["path"].get<std::string>();
        if (!is_safe_entry_path(entry.path)) {
            return R::error(ErrorKind::VALIDATION, std::format("unsafe package path '{}'", entry.path));
        }
        if (!seen.insert(entry.path).second) {
            return R::error(ErrorKind::VALIDATION, std::format("duplicate package path '{}'", entry.path));
        }

        if (file.contains("mode")) {
            if (!file["mode"].is_number_unsigned() || file["mode"].get<uint64_t>() > 0777) {
                return R::error(ErrorKind::VALIDATION, std::format("bad mode for '{}'", entry.path));
            }
            entry.mode = file["mode"].get<uint32_t>();
        }

        const auto decoded = base64::decode(file["data"].get<std::string>());
        if (!decoded) {
            return R::error(ErrorKind::VALIDATION, std::format("bad base64 data for '{}'", entry.path));
        }
        entry.data.assign(decoded->begin(), decoded->end());
        entries.push_back(std::move(entry));
    }

    return R::ok(std::move(entries));
}

Result<std::string> PackageArchive::build(const std::vector<PackageEntry>& entries) {
    json files = json::array();
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (!is_safe_entry_path(entry.path) || !seen.insert(entry.path).second) {
            return Result<std::string>::error(ErrorKind::VALIDATION,
                std::format("bad package path '{}'", entry.path));
        }
        files.push_back({
            {"path", entry.path},
            {"mode", entry.mode & 0777},
            {"data", base64::encode(entry.data)},
        });
    }
    const json doc = {{"format", kFormatVersion}, {"files", files}};
    return deflate_bytes(doc.dump());
}

// ============================================================================
// Filesystem
// ============================================================================

Status PackageArchive::extract(std::string_view bytes, const fs::path& dir) {
    auto entries = read(bytes);
    if (entries.is_error()) return Status::error(entries.error_kind(), entries.error_message());

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Status::error(ErrorKind::IO_ERROR,
            std::format("cannot create '{}': {}", dir.string(), ec.message()));
    }

    for (const auto& entry : entries.value()) {
        const fs::path target = dir / fs::path(entry.path);
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Status::error(ErrorKind::IO_ERROR,
                std::format("cannot create '{}': {}", target.parent_path().string(), ec.message()));
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(entry.data.data(), static_cast<std::streamsize>(entry.data.size()));
        out.close();
        if (!out) {
            return Status::error(ErrorKind::IO_ERROR, std::format("cannot write '{}'", target.string()));
        }

        fs::permissions(target, static_cast<fs::perms>(entry.mode & 0777), fs::perm_options::replace, ec);
        if (ec) {
            return Status::error(ErrorKind::IO_ERROR,
                std::format("cannot set mode of '{}': {}", target.string(), ec.message()));
        }
    }

    utils::log::debug(std::format("Extracted {} file(s) into {}", entries.value().size(), dir.string()));
    return ok_status();
}

Result<std::string> PackageArchive::pack(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<std::string>::error(ErrorKind::NOT_FOUND,
            std::format("'{}' is not a directory", dir.string()));
    }

    std::vector<PackageEntry> entries;
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_symlink(ec)) {
            utils::log::warn(std::format("pack: skipping symlink {}", it->path().string()));
            continue;
        }
        if (!it->is_regular_file(ec)) continue;

        std::ifstream in(it->path(), std::ios::binary);
        if (!in) {
            return Result<std::string>::error(ErrorKind::IO_ERROR,
                std::format("cannot read '{}'", it->path().string()));
        }
        std::ostringstream ss;
        ss << in.rdbuf();

        PackageEntry entry;
        entry.path = it->path().lexically_relative(dir).generic_string();
        entry.mode = static_cast<uint32_t>(it->status(ec).permissions()) & 0777;
        entry.data = ss.str();
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return Result<std::string>::error(ErrorKind::IO_ERROR,
            std::format("cannot walk '{}': {}", dir.string(), ec.message()));
    }

    std::sort(entries.begin(), entries.end(),
        [](const PackageEntry& a, const PackageEntry& b) { return a.path < b.path; });
    return build(entries);
}

} // namespace pluginhost
