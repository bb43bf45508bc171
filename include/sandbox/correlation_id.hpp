#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace pluginhost {

/**
 * @brief Unguessable, collision-free RPC correlation ids
 *
 * id = hex(SHA-256(secret || counter || 16 fresh random bytes)).
 * The monotonic counter guarantees uniqueness under concurrent calls;
 * the per-generator secret and fresh randomness make ids unpredictable.
 */
class CorrelationIdGenerator {
public:
    CorrelationIdGenerator();

    [[nodiscard]] std::string next();

    [[nodiscard]] uint64_t issued() const { return counter_.load(std::memory_order_relaxed); }

private:
    std::array<uint8_t, 32> secret_{};
    std::atomic<uint64_t> counter_{0};
};

} // namespace pluginhost
