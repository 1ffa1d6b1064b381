#pragma once

/**
 * @file semver.hpp
 * @brief Semantic versions and version ranges
 *
 * Version follows Semantic Versioning 2.0.0. Build metadata is kept for
 * round-tripping but never takes part in precedence.
 *
 * A VersionRange is a comma-separated list of constraints that must all
 * hold. A constraint without an operator, or a truncated version such as
 * "2.4", means ">= 2.4.0". The integer 0 means any version.
 */

#include "pgxnmeta/common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pgxnmeta::semver {

class Version
{
public:
    Version() = default;
    Version(std::uint64_t major, std::uint64_t minor, std::uint64_t patch)
        : m_major(major)
        , m_minor(minor)
        , m_patch(patch)
    {}

    /**
     * Parse a complete MAJOR.MINOR.PATCH[-pre][+build] string.
     * @return Version or SemanticViolation
     */
    [[nodiscard]] static pgxnmeta::Result<Version> parse(std::string_view text);

    /**
     * Parse a possibly truncated version ("2", "2.4"), padding with zeros.
     */
    [[nodiscard]] static pgxnmeta::Result<Version> parse_lenient(std::string_view text);

    [[nodiscard]] std::uint64_t major() const noexcept { return m_major; }
    [[nodiscard]] std::uint64_t minor() const noexcept { return m_minor; }
    [[nodiscard]] std::uint64_t patch() const noexcept { return m_patch; }
    [[nodiscard]] const std::vector<std::string>& pre_release() const noexcept { return m_pre; }
    [[nodiscard]] const std::vector<std::string>& build() const noexcept { return m_build; }

    /// Precedence comparison: negative, zero or positive. Ignores build metadata.
    [[nodiscard]] int compare(const Version& other) const noexcept;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Version&) const = default;

private:
    std::uint64_t m_major = 0;
    std::uint64_t m_minor = 0;
    std::uint64_t m_patch = 0;
    std::vector<std::string> m_pre;
    std::vector<std::string> m_build;
};

enum class Comparator {
    kLess,
    kLessEqual,
    kGreater,
    kGreaterEqual,
    kEqual,
    kNotEqual
};

[[nodiscard]] std::string_view comparator_symbol(Comparator op) noexcept;

struct Constraint
{
    Comparator op = Comparator::kGreaterEqual;
    Version version;

    [[nodiscard]] bool satisfied_by(const Version& candidate) const noexcept;

    bool operator==(const Constraint&) const = default;
};

class VersionRange
{
public:
    /// Matches any version.
    VersionRange() = default;

    /**
     * Parse the textual form, e.g. ">= 1.2, != 1.5.2, < 2.0".
     * @return VersionRange or SemanticViolation
     */
    [[nodiscard]] static pgxnmeta::Result<VersionRange> parse(std::string_view text);

    /**
     * Parse a JSON version range: a string, or the integer 0.
     */
    [[nodiscard]] static pgxnmeta::Result<VersionRange> from_json(const nlohmann::json& value);

    [[nodiscard]] bool satisfies(const Version& candidate) const noexcept;

    [[nodiscard]] const std::vector<Constraint>& constraints() const noexcept
    {
        return m_constraints;
    }

    /// The range as written in the source document.
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }

    /// JSON form: the original text, or 0 for the any-version shorthand.
    [[nodiscard]] nlohmann::json to_json() const;

    /// Normalized form, e.g. ">= 1.2.0, != 1.5.2, < 2.0.0".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const VersionRange&) const = default;

private:
    std::string m_text = "0";
    std::vector<Constraint> m_constraints{Constraint{}};
};

}  // namespace pgxnmeta::semver
