#pragma once

/**
 * @file purl.hpp
 * @brief Package URLs: pkg:<type>/<namespace>/<name>@<version>?<qualifiers>#<subpath>
 *
 * The version segment is percent-decoded and parsed as a VersionRange, so a
 * dependency may name e.g. "pkg:pgxn/theory/pair@%3E%3D%200.1.7".
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/semver.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pgxnmeta::purl {

/// Reserved type for distributions published on PGXN. Requires a namespace.
constexpr std::string_view kPgxnType = "pgxn";
/// Reserved type for PostgreSQL core and contrib.
constexpr std::string_view kPostgresType = "postgres";

class Purl
{
public:
    /**
     * Parse a purl string.
     * @return Purl or SemanticViolation
     */
    [[nodiscard]] static pgxnmeta::Result<Purl> parse(std::string_view text);

    /// Lowercased package type.
    [[nodiscard]] const std::string& type() const noexcept { return m_type; }
    /// Decoded namespace segments joined by '/', empty when absent.
    [[nodiscard]] const std::string& namespace_name() const noexcept { return m_namespace; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::optional<semver::VersionRange>& version() const noexcept
    {
        return m_version;
    }
    [[nodiscard]] const std::map<std::string, std::string>& qualifiers() const noexcept
    {
        return m_qualifiers;
    }
    [[nodiscard]] const std::string& subpath() const noexcept { return m_subpath; }

    [[nodiscard]] bool is_pgxn() const noexcept { return m_type == kPgxnType; }
    [[nodiscard]] bool is_postgres() const noexcept { return m_type == kPostgresType; }

    /// Canonical string form with every component percent-encoded.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Purl&) const = default;

private:
    std::string m_type;
    std::string m_namespace;
    std::string m_name;
    std::optional<semver::VersionRange> m_version;
    std::map<std::string, std::string> m_qualifiers;
    std::string m_subpath;
};

/// Percent-encode everything except RFC 3986 unreserved characters.
[[nodiscard]] std::string percent_encode(std::string_view text);

/**
 * Decode %XX escapes.
 * @return Decoded text or SemanticViolation for a truncated or non-hex escape
 */
[[nodiscard]] pgxnmeta::Result<std::string> percent_decode(std::string_view text);

}  // namespace pgxnmeta::purl
