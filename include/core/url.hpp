#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pluginhost::utils {

/**
 * @brief Parsed absolute http(s) URL
 *
 * Scheme and host are lowercased, the port is always filled in (explicit or
 * the scheme default) and the target always starts with '/'. The fragment is
 * dropped since it never goes on the wire.
 */
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;       // IPv6 literals without brackets
    int port = 0;
    std::string target;     // path + query

    /// "scheme://host:port", IPv6 bracketed; what an HTTP client connects to
    [[nodiscard]] std::string origin() const;
};

/**
 * @brief Strict parse; nullopt for anything but a plain http(s) URL
 *
 * Rejected: other schemes, empty host, userinfo ("user@host"), backslashes
 * or whitespace in the authority, a port outside 1..65535, host characters
 * other than letters, digits, '.', '-' and '_'.
 */
[[nodiscard]] std::optional<Url> parse_url(std::string_view url);

} // namespace pluginhost::utils
