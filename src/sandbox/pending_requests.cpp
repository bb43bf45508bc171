#include "sandbox/pending_requests.hpp"

#include <format>
#include <vector>

namespace pluginhost {

std::future<nlohmann::json> PendingRequestTable::insert(const std::string& id,
                                                        const std::string& method,
                                                        std::chrono::milliseconds timeout) {
    Entry entry;
    entry.method = method;
    entry.timeout = timeout;
    entry.deadline = Clock::now() + timeout;
    auto future = entry.promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = entries_.emplace(id, std::move(entry));
    if (!inserted) {
        throw PluginError(ErrorKind::INTERNAL_ERROR,
            std::format("duplicate correlation id '{}'", id));
    }
    return future;
}

bool PendingRequestTable::complete(const std::string& id, nlohmann::json result) {
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        entry.emplace(std::move(it->second));
        entries_.erase(it);
    }
    entry->promise.set_value(std::move(result));
    return true;
}

bool PendingRequestTable::fail(const std::string& id, ErrorKind kind, const std::string& message) {
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        entry.emplace(std::move(it->second));
        entries_.erase(it);
    }
    reject(*entry, kind, message);
    return true;
}

size_t PendingRequestTable::expire(Clock::time_point now) {
    std::vector<Entry> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(std::move(it->second));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& entry : expired) {
        reject(entry, ErrorKind::TIMEOUT,
            std::format("call '{}' timed out after {} ms", entry.method, entry.timeout.count()));
    }
    return expired.size();
}

size_t PendingRequestTable::fail_all(ErrorKind kind, const std::string& message) {
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
    }
    for (auto& [id, entry] : drained) {
        reject(entry, kind, message);
    }
    return drained.size();
}

size_t PendingRequestTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingRequestTable::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(id);
}

std::optional<PendingRequestTable::Clock::time_point> PendingRequestTable::next_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, entry] : entries_) {
        if (!earliest || entry.deadline < *earliest) earliest = entry.deadline;
    }
    return earliest;
}

void PendingRequestTable::reject(Entry& entry, ErrorKind kind, const std::string& message) {
    entry.promise.set_exception(std::make_exception_ptr(PluginError(kind, message)));
}

} // namespace pluginhost
