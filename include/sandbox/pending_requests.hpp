#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pluginhost {

/**
 * @brief In-flight request table: correlation id -> pending result
 *
 * Inserted by the calling thread, resolved by the message reader thread,
 * expired by the timeout reaper. Every exit path removes the entry, so a
 * late response for an expired id is simply dropped.
 */
class PendingRequestTable {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Register a pending request
     * @throws PluginError(INTERNAL_ERROR) on duplicate id
     */
    [[nodiscard]] std::future<nlohmann::json> insert(const std::string& id,
                                                     const std::string& method,
                                                     std::chrono::milliseconds timeout);

    /// Resolve with a result. Returns false if the id is unknown (expired/stale).
    bool complete(const std::string& id, nlohmann::json result);

    /// Reject one request. Returns false if the id is unknown.
    bool fail(const std::string& id, ErrorKind kind, const std::string& message);

    /// Reject every request whose deadline is <= now with TIMEOUT
    size_t expire(Clock::time_point now);

    /// Reject everything (worker terminated or crashed)
    size_t fail_all(ErrorKind kind, const std::string& message);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::optional<Clock::time_point> next_deadline() const;

private:
    struct Entry {
        std::promise<nlohmann::json> promise;
        std::string method;
        std::chrono::milliseconds timeout;
        Clock::time_point deadline;
    };

    static void reject(Entry& entry, ErrorKind kind, const std::string& message);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace pluginhost
