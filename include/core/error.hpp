#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace pluginhost {

/**
 * @brief Stable error kinds surfaced by every public operation
 */
enum class ErrorKind {
    NONE,
    VALIDATION,
    PERMISSION_DENIED,
    PATH_TRAVERSAL,
    TIMEOUT,
    SANDBOX_INIT_FAILURE,
    NOT_FOUND,
    NOT_AVAILABLE,
    PLUGIN_ERROR,
    WORKER_TERMINATED,
    REGISTRY_ERROR,
    IO_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                 return "none";
        case ErrorKind::VALIDATION:           return "validation_error";
        case ErrorKind::PERMISSION_DENIED:    return "permission_denied";
        case ErrorKind::PATH_TRAVERSAL:       return "path_traversal";
        case ErrorKind::TIMEOUT:              return "timeout";
        case ErrorKind::SANDBOX_INIT_FAILURE: return "sandbox_init_failure";
        case ErrorKind::NOT_FOUND:            return "not_found";
        case ErrorKind::NOT_AVAILABLE:        return "not_available";
        case ErrorKind::PLUGIN_ERROR:         return "plugin_error";
        case ErrorKind::WORKER_TERMINATED:    return "worker_terminated";
        case ErrorKind::REGISTRY_ERROR:       return "registry_error";
        case ErrorKind::IO_ERROR:             return "io_error";
        case ErrorKind::INTERNAL_ERROR:       return "internal_error";
    }
    return "internal_error";
}

/// Inverse of error_kind_to_string. Unknown strings map to PLUGIN_ERROR
/// (errors crossing the worker boundary are untrusted).
[[nodiscard]] inline ErrorKind error_kind_from_string(const std::string& s) {
    static constexpr ErrorKind kAll[] = {
        ErrorKind::VALIDATION, ErrorKind::PERMISSION_DENIED, ErrorKind::PATH_TRAVERSAL,
        ErrorKind::TIMEOUT, ErrorKind::SANDBOX_INIT_FAILURE, ErrorKind::NOT_FOUND,
        ErrorKind::NOT_AVAILABLE, ErrorKind::PLUGIN_ERROR, ErrorKind::WORKER_TERMINATED,
        ErrorKind::REGISTRY_ERROR, ErrorKind::IO_ERROR, ErrorKind::INTERNAL_ERROR,
    };
    for (const auto kind : kAll) {
        if (s == error_kind_to_string(kind)) return kind;
    }
    return ErrorKind::PLUGIN_ERROR;
}

/**
 * @brief Exception used inside the subsystem; converted to Result at the
 *        public PluginManager boundary.
 */
class PluginError : public std::runtime_error {
public:
    PluginError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorKind kind, std::string message) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        return r;
    }

    static Result error(const PluginError& e) {
        return error(e.kind(), e.what());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
};

/// Result of an operation with no payload
using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok(std::monostate{}); }

} // namespace pluginhost
