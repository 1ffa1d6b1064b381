#pragma once

/**
 * @file primitives.hpp
 * @brief Grammars for the constrained string types used in META.json
 *
 * Each check returns SemanticViolation with a message naming the value.
 * Callers attach the JSON pointer of the field.
 */

#include "pgxnmeta/common.hpp"

#include <string_view>

namespace pgxnmeta::primitive {

/**
 * Term: at least two characters, no slash, backslash, control or space.
 */
[[nodiscard]] pgxnmeta::VoidResult validate_term(std::string_view value);

/**
 * Tag: 2 to 255 characters, no slash, backslash or control characters.
 */
[[nodiscard]] pgxnmeta::VoidResult validate_tag(std::string_view value);

/**
 * Path: relative, '/'-separated, no ".." segment anywhere and no "."
 * segment except as the first one ("./README" is fine, "a/./b" is not).
 */
[[nodiscard]] pgxnmeta::VoidResult validate_path(std::string_view value);

/**
 * Glob: the path rules applied to every segment without wildcard
 * characters. A leading '/' anchors the pattern at the distribution root.
 */
[[nodiscard]] pgxnmeta::VoidResult validate_glob(std::string_view value);

/**
 * Platform: "any" or OS[-VERSION][-ARCH] from the known OS and
 * architecture lists, e.g. "linux-amd64", "darwin-23.5-arm64".
 */
[[nodiscard]] pgxnmeta::VoidResult validate_platform(std::string_view value);

/**
 * Hex digest of the right length for the algorithm (sha1, sha256, sha512).
 */
[[nodiscard]] pgxnmeta::VoidResult validate_digest_hex(std::string_view algorithm,
                                                       std::string_view hex);

/// Expected hex length for a digest algorithm, or 0 if unknown.
[[nodiscard]] std::size_t digest_hex_length(std::string_view algorithm) noexcept;

[[nodiscard]] pgxnmeta::VoidResult validate_email(std::string_view value);

[[nodiscard]] pgxnmeta::VoidResult validate_uri(std::string_view value);

/**
 * RFC 3339 date-time, e.g. "2024-09-13T17:32:55Z".
 */
[[nodiscard]] pgxnmeta::VoidResult validate_timestamp(std::string_view value);

}  // namespace pgxnmeta::primitive
