#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pluginhost {

struct PackageEntry {
    std::string path;       // relative, '/'-separated
    uint32_t mode = 0644;
    std::string data;
};

/**
 * @brief Plugin package codec
 *
 * Package bytes are a zlib stream of
 *   {"format": 1, "files": [{"path", "mode", "data" (base64)}]}
 *
 * Every entry path is checked before anything touches the disk: relative,
 * no ".." component, no duplicates. Bad input -> VALIDATION.
 */
class PackageArchive {
public:
    static constexpr int kFormatVersion = 1;
    static constexpr size_t kMaxUnpackedBytes = 256 * 1024 * 1024;

    /// Decode and validate a package
    [[nodiscard]] static Result<std::vector<PackageEntry>> read(std::string_view bytes);

    /// Encode entries (paths are validated the same way read() does)
    [[nodiscard]] static Result<std::string> build(const std::vector<PackageEntry>& entries);

    /// Write every entry under `dir` (created if missing). Errors: VALIDATION, IO_ERROR
    [[nodiscard]] static Status extract(std::string_view bytes, const std::filesystem::path& dir);

    /// Package every regular file below `dir`. Errors: NOT_FOUND, IO_ERROR
    [[nodiscard]] static Result<std::string> pack(const std::filesystem::path& dir);

    [[nodiscard]] static bool is_safe_entry_path(std::string_view path);

private:
    static Result<std::string> deflate_bytes(std::string_view data);
    static Result<std::string> inflate_bytes(std::string_view data);
};

} // namespace pluginhost
