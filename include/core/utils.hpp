#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace pluginhost::utils {

// ============================================================================
// Random Identifiers
// ============================================================================

/// Short random hex token (not for security purposes; see crypto.hpp)
inline std::string random_token(size_t bytes = 8) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint32_t> dis(0, 255);

    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; ++i) {
        out += std::format("{:02x}", dis(gen));
    }
    return out;
}

// ============================================================================
// Time Utilities
// ============================================================================

/// ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.000Z
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

inline std::string now_iso8601() {
    return format_timestamp(now());
}

// ============================================================================
// Numeric Parsing (std::from_chars: no exceptions, no locale)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

/// Case-insensitive substring test
[[nodiscard]] inline bool icontains(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

[[nodiscard]] inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

/// Parse "debug" / "info" / "warn" / "error"; unknown strings fall back to INFO
inline Level parse_level(const std::string& s) {
    const std::string lower = to_lower(s);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return Level::INFO;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace pluginhost::utils
