#include "core/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cctype>
#include <format>
#include <stdexcept>

namespace pluginhost::crypto {

std::vector<uint8_t> random_bytes(size_t byte_count) {
    std::vector<uint8_t> bytes(byte_count);
    if (byte_count == 0) return bytes;
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

std::vector<uint8_t> sha256(const uint8_t* data, size_t len) {
    std::vector<uint8_t> result(SHA256_DIGEST_LENGTH);
    SHA256(data, len, result.data());
    return result;
}

std::vector<uint8_t> sha256(std::string_view data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out += std::format("{:02x}", b);
    }
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    return to_hex(sha256(data, len));
}

std::string sha256_hex(std::string_view data) {
    return to_hex(sha256(data));
}

bool digest_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    std::string la(a), lb(b);
    for (auto& c : la) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (auto& c : lb) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return CRYPTO_memcmp(la.data(), lb.data(), la.size()) == 0;
}

} // namespace pluginhost::crypto
