#include "sandbox/correlation_id.hpp"
#include "core/crypto.hpp"

#include <algorithm>
#include <vector>

namespace pluginhost {

CorrelationIdGenerator::CorrelationIdGenerator() {
    const auto seed = crypto::random_bytes(secret_.size());
    std::copy(seed.begin(), seed.end(), secret_.begin());
}

std::string CorrelationIdGenerator::next() {
    const uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
    const auto nonce = crypto::random_bytes(16);

    std::vector<uint8_t> material;
    material.reserve(secret_.size() + sizeof(n) + nonce.size());
    material.insert(material.end(), secret_.begin(), secret_.end());
    for (int shift = 56; shift >= 0; shift -= 8) {
        material.push_back(static_cast<uint8_t>((n >> shift) & 0xFF));
    }
    material.insert(material.end(), nonce.begin(), nonce.end());

    return crypto::sha256_hex(material.data(), material.size());
}

} // namespace pluginhost
