#include "core/url.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pluginhost::utils {

namespace {

bool is_host_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
}

bool is_ipv6_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == ':' || c == '.';
}

} // anonymous namespace

std::string Url::origin() const {
    if (host.find(':') != std::string::npos) {
        return std::format("{}://[{}]:{}", scheme, host, port);
    }
    return std::format("{}://{}:{}", scheme, host, port);
}

std::optional<Url> parse_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;

    Url out;
    out.scheme = to_lower(std::string(url.substr(0, scheme_end)));
    if (out.scheme == "https") {
        out.port = 443;
    } else if (out.scheme == "http") {
        out.port = 80;
    } else {
        return std::nullopt;
    }

    const std::string_view rest = url.substr(scheme_end + 3);
    const auto authority_end = rest.find_first_of("/?#");
    const std::string_view authority = rest.substr(0, authority_end);

    if (authority.empty()) return std::nullopt;
    const bool bad_char = std::any_of(authority.begin(), authority.end(), [](char c) {
        return c == '@' || c == '\\' || static_cast<unsigned char>(c) <= 0x20 || c == 0x7f;
    });
    if (bad_char) return std::nullopt;

    std::string_view host;
    std::string_view port;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        const std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port = after.substr(1);
        }
        out.host = to_lower(std::string(host));
        if (out.host.empty() || !std::all_of(out.host.begin(), out.host.end(), is_ipv6_char)) {
            return std::nullopt;
        }
    } else {
        const auto colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) port = authority.substr(colon + 1);
        out.host = to_lower(std::string(host));
        if (out.host.empty() || !std::all_of(out.host.begin(), out.host.end(), is_host_char)) {
            return std::nullopt;
        }
    }

    if (!port.empty()) {
        const auto parsed = try_parse_int<int>(port);
        if (!parsed || *parsed < 1 || *parsed > 65535) return std::nullopt;
        out.port = *parsed;
    }

    out.target = authority_end == std::string_view::npos ? std::string("/")
                                                         : std::string(rest.substr(authority_end));
    if (const auto hash = out.target.find('#'); hash != std::string::npos) {
        out.target.erase(hash);
    }
    if (out.target.empty() || out.target.front() != '/') out.target.insert(0, "/");
    return out;
}

} // namespace pluginhost::utils
