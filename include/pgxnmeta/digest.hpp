#pragma once

/**
 * @file digest.hpp
 * @brief Content digest sets (sha1, sha256, sha512) and verification
 */

#include "pgxnmeta/common.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/**
 * @brief Non-empty set of hex digests keyed by algorithm
 *
 * Stored as written; comparisons against computed digests ignore case.
 */
class Digests
{
public:
    /**
     * Build from a {"sha1": ..., "sha256": ..., "sha512": ...} object.
     * At least one algorithm is required and unknown keys are rejected.
     * @return Digests or SemanticViolation (path relative to the object)
     */
    [[nodiscard]] static pgxnmeta::Result<Digests> from_json(const nlohmann::json& object);

    /**
     * Build from individual hex strings.
     */
    [[nodiscard]] static pgxnmeta::Result<Digests> make(std::optional<std::string> sha1,
                                                       std::optional<std::string> sha256,
                                                       std::optional<std::string> sha512);

    [[nodiscard]] const std::optional<std::string>& sha1() const noexcept { return m_sha1; }
    [[nodiscard]] const std::optional<std::string>& sha256() const noexcept { return m_sha256; }
    [[nodiscard]] const std::optional<std::string>& sha512() const noexcept { return m_sha512; }

    /**
     * Check every algorithm present against content.
     * @return Empty on success, DigestMismatch naming each failing algorithm
     */
    [[nodiscard]] pgxnmeta::VoidResult verify(std::string_view content) const;

    /// Preferred algorithm: sha512, then sha256, then sha1.
    [[nodiscard]] std::string_view strongest() const noexcept;

    /// Hex digest for strongest().
    [[nodiscard]] const std::string& strongest_hex() const noexcept;

    /// True when sha1 is the only algorithm present.
    [[nodiscard]] bool is_weak() const noexcept;

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const Digests&) const = default;

private:
    Digests() = default;

    std::optional<std::string> m_sha1;
    std::optional<std::string> m_sha256;
    std::optional<std::string> m_sha512;
};

}  // namespace pgxnmeta
