#include "core/semver.hpp"
#include "core/utils.hpp"

#include <format>
#include <sstream>

namespace pluginhost {

namespace {

bool is_numeric(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                        (c >= 'A' && c <= 'Z') || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::optional<uint64_t> parse_component(std::string_view s) {
    if (!is_numeric(s)) return std::nullopt;
    if (s.size() > 1 && s[0] == '0') return std::nullopt;  // no leading zeros
    return utils::try_parse_int<uint64_t>(s);
}

std::optional<std::vector<std::string>> parse_identifiers(std::string_view s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t dot = s.find('.', start);
        const auto part = s.substr(start, dot == std::string_view::npos ? s.size() - start : dot - start);
        if (!is_identifier(part)) return std::nullopt;
        out.emplace_back(part);
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return out;
}

std::string_view strip_v(std::string_view s) {
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s.remove_prefix(1);
    return s;
}

std::strong_ordering compare_identifier(const std::string& a, const std::string& b) {
    const bool an = is_numeric(a);
    const bool bn = is_numeric(b);
    if (an && bn) {
        if (a.size() != b.size()) return a.size() <=> b.size();
        return a.compare(b) <=> 0;
    }
    if (an) return std::strong_ordering::less;     // numeric < alphanumeric
    if (bn) return std::strong_ordering::greater;
    return a.compare(b) <=> 0;
}

bool is_wildcard(std::string_view s) {
    return s == "x" || s == "X" || s == "*";
}

} // anonymous namespace

// ============================================================================
// Version
// ============================================================================

std::optional<Version> Version::parse(std::string_view text) {
    std::string trimmed = utils::trim(std::string(text));
    std::string_view s = strip_v(trimmed);
    if (s.empty()) return std::nullopt;

    Version v;

    const size_t plus = s.find('+');
    if (plus != std::string_view::npos) {
        const auto build = s.substr(plus + 1);
        if (!parse_identifiers(build)) return std::nullopt;
        v.build = std::string(build);
        s = s.substr(0, plus);
    }

    const size_t dash = s.find('-');
    if (dash != std::string_view::npos) {
        auto pre = parse_identifiers(s.substr(dash + 1));
        if (!pre) return std::nullopt;
        for (const auto& id : *pre) {
            if (is_numeric(id) && id.size() > 1 && id[0] == '0') return std::nullopt;
        }
        v.prerelease = std::move(*pre);
        s = s.substr(0, dash);
    }

    const auto parts = utils::split(std::string(s), '.');
    if (parts.size() != 3 || s.back() == '.') return std::nullopt;

    const auto major = parse_component(parts[0]);
    const auto minor = parse_component(parts[1]);
    const auto patch = parse_component(parts[2]);
    if (!major || !minor || !patch) return std::nullopt;

    v.major = *major;
    v.minor = *minor;
    v.patch = *patch;
    return v;
}

std::string Version::to_string() const {
    std::string out = std::format("{}.{}.{}", major, minor, patch);
    if (!prerelease.empty()) {
        out += '-';
        for (size_t i = 0; i < prerelease.size(); ++i) {
            if (i > 0) out += '.';
            out += prerelease[i];
        }
    }
    if (!build.empty()) {
        out += '+';
        out += build;
    }
    return out;
}

std::strong_ordering operator<=>(const Version& a, const Version& b) {
    if (auto c = a.major <=> b.major; c != 0) return c;
    if (auto c = a.minor <=> b.minor; c != 0) return c;
    if (auto c = a.patch <=> b.patch; c != 0) return c;

    // A release has higher precedence than any of its prereleases
    if (a.prerelease.empty() && b.prerelease.empty()) return std::strong_ordering::equal;
    if (a.prerelease.empty()) return std::strong_ordering::greater;
    if (b.prerelease.empty()) return std::strong_ordering::less;

    const size_t n = std::min(a.prerelease.size(), b.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        if (auto c = compare_identifier(a.prerelease[i], b.prerelease[i]); c != 0) return c;
    }
    return a.prerelease.size() <=> b.prerelease.size();
}

// ============================================================================
// VersionRange
// ============================================================================

std::optional<VersionRange::Partial> VersionRange::parse_partial(std::string_view text) {
    std::string_view s = strip_v(text);
    if (s.empty()) return std::nullopt;

    Partial p;
    if (is_wildcard(s)) return p;

    std::string core(s);
    const size_t plus = core.find('+');
    if (plus != std::string::npos) core.resize(plus);  // build metadata is ignored in ranges

    const size_t dash = core.find('-');
    if (dash != std::string::npos) {
        auto pre = parse_identifiers(std::string_view(core).substr(dash + 1));
        if (!pre) return std::nullopt;
        p.prerelease = std::move(*pre);
        core.resize(dash);
    }

    const auto parts = utils::split(core, '.');
    if (parts.empty() || parts.size() > 3 || core.empty() || core.back() == '.') {
        return std::nullopt;
    }

    bool wildcard_seen = false;
    std::optional<uint64_t>* slots[3] = {&p.major, &p.minor, &p.patch};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wildcard_seen = true;
            continue;
        }
        if (wildcard_seen) return std::nullopt;  // "1.x.3" is malformed
        const auto value = parse_component(parts[i]);
        if (!value) return std::nullopt;
        *slots[i] = value;
    }

    if (!p.prerelease.empty() && !p.patch) return std::nullopt;
    return p;
}

bool VersionRange::desugar(std::string_view token, std::vector<Comparator>& out) {
    static constexpr std::string_view kOps[] = {">=", "<=", ">", "<", "=", "^", "~"};

    std::string_view op;
    for (const auto candidate : kOps) {
        if (token.substr(0, candidate.size()) == candidate) {
            op = candidate;
            break;
        }
    }
    token.remove_prefix(op.size());

    const auto partial = parse_partial(token);
    if (!partial) return false;
    const auto& p = *partial;

    auto make = [&p](uint64_t major, uint64_t minor, uint64_t patch, bool with_pre) {
        Version v;
        v.major = major;
        v.minor = minor;
        v.patch = patch;
        if (with_pre) v.prerelease = p.prerelease;
        return v;
    };
    // Matches nothing: 0.0.0-0 is the lowest possible version
    auto impossible = [&out, &make] {
        Version floor = make(0, 0, 0, false);
        floor.prerelease = {"0"};
        out.push_back({Op::LT, floor});
    };

    const bool full = p.major && p.minor && p.patch;
    const uint64_t major = p.major.value_or(0);
    const uint64_t minor = p.minor.value_or(0);
    const uint64_t patch = p.patch.value_or(0);

    if (op.empty() || op == "=") {
        if (full) {
            out.push_back({Op::EQ, make(major, minor, patch, true)});
        } else if (p.major && !p.minor) {
            out.push_back({Op::GTE, make(major, 0, 0, false)});
            out.push_back({Op::LT, make(major + 1, 0, 0, false)});
        } else if (p.major) {
            out.push_back({Op::GTE, make(major, minor, 0, false)});
            out.push_back({Op::LT, make(major, minor + 1, 0, false)});
        }
        // bare wildcard: no constraint
        return true;
    }

    if (op == ">") {
        if (!p.major) impossible();
        else if (!p.minor) out.push_back({Op::GTE, make(major + 1, 0, 0, false)});
        else if (!p.patch) out.push_back({Op::GTE, make(major, minor + 1, 0, false)});
        else out.push_back({Op::GT, make(major, minor, patch, true)});
        return true;
    }

    if (op == ">=") {
        if (p.major) out.push_back({Op::GTE, make(major, minor, patch, full)});
        return true;
    }

    if (op == "<") {
        if (!p.major) impossible();
        else out.push_back({Op::LT, make(major, minor, patch, full)});
        return true;
    }

    if (op == "<=") {
        if (!p.major) return true;
        if (!p.minor) out.push_back({Op::LT, make(major + 1, 0, 0, false)});
        else if (!p.patch) out.push_back({Op::LT, make(major, minor + 1, 0, false)});
        else out.push_back({Op::LTE, make(major, minor, patch, true)});
        return true;
    }

    if (op == "~") {
        if (!p.major) return true;
        out.push_back({Op::GTE, make(major, minor, patch, full)});
        if (!p.minor) out.push_back({Op::LT, make(major + 1, 0, 0, false)});
        else out.push_back({Op::LT, make(major, minor + 1, 0, false)});
        return true;
    }

    // "^": allow changes that do not modify the left-most non-zero component
    if (!p.major) return true;
    out.push_back({Op::GTE, make(major, minor, patch, full)});
    if (major > 0 || !p.minor) {
        out.push_back({Op::LT, make(major + 1, 0, 0, false)});
    } else if (minor > 0 || !p.patch) {
        out.push_back({Op::LT, make(0, minor + 1, 0, false)});
    } else {
        out.push_back({Op::LT, make(0, 0, patch + 1, false)});
    }
    return true;
}

bool VersionRange::desugar_hyphen(std::string_view lo, std::string_view hi,
                                  std::vector<Comparator>& out) {
    const auto low = parse_partial(lo);
    const auto high = parse_partial(hi);
    if (!low || !high) return false;

    if (low->major) {
        Version v;
        v.major = *low->major;
        v.minor = low->minor.value_or(0);
        v.patch = low->patch.value_or(0);
        if (low->patch) v.prerelease = low->prerelease;
        out.push_back({Op::GTE, v});
    }

    if (high->major) {
        Version v;
        v.major = *high->major;
        if (!high->minor) {
            v.major += 1;
            out.push_back({Op::LT, v});
        } else if (!high->patch) {
            v.minor = *high->minor + 1;
            out.push_back({Op::LT, v});
        } else {
            v.minor = *high->minor;
            v.patch = *high->patch;
            v.prerelease = high->prerelease;
            out.push_back({Op::LTE, v});
        }
    }
    return true;
}

std::optional<VersionRange> VersionRange::parse(std::string_view text) {
    VersionRange range;
    range.text_ = utils::trim(std::string(text));

    // Split on "||"
    std::vector<std::string> alternatives;
    {
        const std::string& s = range.text_;
        size_t start = 0;
        while (true) {
            const size_t pos = s.find("||", start);
            alternatives.push_back(utils::trim(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start)));
            if (pos == std::string::npos) break;
            start = pos + 2;
        }
    }

    for (const auto& alt : alternatives) {
        // Tokenize on whitespace, re-attaching dangling operators (">= 1.2.3")
        std::vector<std::string> tokens;
        std::istringstream iss(alt);
        std::string tok;
        std::string pending_op;
        while (iss >> tok) {
            if (tok == ">" || tok == ">=" || tok == "<" || tok == "<=" ||
                tok == "=" || tok == "^" || tok == "~") {
                if (!pending_op.empty()) return std::nullopt;
                pending_op = tok;
                continue;
            }
            tokens.push_back(pending_op + tok);
            pending_op.clear();
        }
        if (!pending_op.empty()) return std::nullopt;

        std::vector<Comparator> set;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i + 2 < tokens.size() && tokens[i + 1] == "-") {
                if (!desugar_hyphen(tokens[i], tokens[i + 2], set)) return std::nullopt;
                i += 2;
                continue;
            }
            if (tokens[i] == "-") return std::nullopt;
            if (!desugar(tokens[i], set)) return std::nullopt;
        }
        range.sets_.push_back(std::move(set));
    }

    return range;
}

bool VersionRange::test(const Comparator& c, const Version& v) {
    const auto cmp = v <=> c.version;
    switch (c.op) {
        case Op::EQ:  return cmp == 0;
        case Op::GT:  return cmp > 0;
        case Op::GTE: return cmp >= 0;
        case Op::LT:  return cmp < 0;
        case Op::LTE: return cmp <= 0;
    }
    return false;
}

bool VersionRange::satisfied_by(const Version& v) const {
    for (const auto& set : sets_) {
        bool all = true;
        for (const auto& c : set) {
            if (!test(c, v)) {
                all = false;
                break;
            }
        }
        if (all) return true;
    }
    return false;
}

bool version_satisfies(std::string_view version, std::string_view range) {
    const auto v = Version::parse(version);
    const auto r = VersionRange::parse(range);
    return v && r && r->satisfied_by(*v);
}

} // namespace pluginhost
