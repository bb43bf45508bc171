#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pluginhost::crypto {

/// Cryptographically secure random bytes (OpenSSL RAND_bytes). Throws on failure.
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t byte_count);

/// SHA-256 digest of data
[[nodiscard]] std::vector<uint8_t> sha256(const uint8_t* data, size_t len);
[[nodiscard]] std::vector<uint8_t> sha256(std::string_view data);

/// Lowercase hex SHA-256 digest
[[nodiscard]] std::string sha256_hex(const uint8_t* data, size_t len);
[[nodiscard]] std::string sha256_hex(std::string_view data);

[[nodiscard]] std::string to_hex(const std::vector<uint8_t>& bytes);

/// Constant-time comparison of two hex digests (case-insensitive)
[[nodiscard]] bool digest_equals(std::string_view a, std::string_view b);

} // namespace pluginhost::crypto
