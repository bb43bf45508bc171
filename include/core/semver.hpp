#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pluginhost {

/**
 * @brief Semantic version (semver 2.0.0)
 *
 * Precedence ignores build metadata. A version with a prerelease tag
 * sorts before the same version without one.
 */
struct Version {
    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::string build;

    /// Parse "MAJOR.MINOR.PATCH[-pre][+build]"; a leading 'v' is accepted
    [[nodiscard]] static std::optional<Version> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    friend std::strong_ordering operator<=>(const Version& a, const Version& b);
    friend bool operator==(const Version& a, const Version& b) {
        return (a <=> b) == std::strong_ordering::equal;
    }
};

/**
 * @brief npm-style version range
 *
 * Supported syntax:
 * - "*", "x", ""            any version
 * - "1.2.3", "=1.2.3"       exact
 * - ">1.2.3" ">=1.2" "<2" "<=1.2.3"
 * - "^1.2.3", "~1.2.3"      caret / tilde
 * - "1.x", "1.2.x", "1"     x-ranges
 * - "1.2.3 - 2.0.0"         hyphen range
 * - space-separated AND, "||" OR
 */
class VersionRange {
public:
    [[nodiscard]] static std::optional<VersionRange> parse(std::string_view text);

    [[nodiscard]] bool satisfied_by(const Version& v) const;

    [[nodiscard]] const std::string& text() const { return text_; }

private:
    enum class Op { EQ, GT, GTE, LT, LTE };

    struct Comparator {
        Op op;
        Version version;
    };

    // Partially specified version used while desugaring ("1", "1.2", "1.x")
    struct Partial {
        std::optional<uint64_t> major;
        std::optional<uint64_t> minor;
        std::optional<uint64_t> patch;
        std::vector<std::string> prerelease;
    };

    static std::optional<Partial> parse_partial(std::string_view text);
    static bool desugar(std::string_view token, std::vector<Comparator>& out);
    static bool desugar_hyphen(std::string_view lo, std::string_view hi,
                               std::vector<Comparator>& out);
    static bool test(const Comparator& c, const Version& v);

    std::string text_;
    std::vector<std::vector<Comparator>> sets_;  // OR of AND-sets
};

/// Convenience: does version string satisfy range string? Malformed input → false.
[[nodiscard]] bool version_satisfies(std::string_view version, std::string_view range);

} // namespace pluginhost
