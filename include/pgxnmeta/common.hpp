#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error types, digests, Base64URL, JSON file I/O
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/**
 * @brief One failed schema rule
 */
struct Violation
{
    std::string location;     ///< JSON pointer into the document ("" is the root)
    std::string description;  ///< Human-readable rule description
    std::string keyword;      ///< Schema keyword that failed

    bool operator==(const Violation&) const = default;
};

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;                   ///< Machine-readable error kind
    std::string message;                ///< Human-readable error message
    std::string path;                   ///< JSON pointer of the offending field, if any
    std::vector<Violation> violations;  ///< Every schema violation, in engine order

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    [[nodiscard]] static Error at(std::string code, std::string path, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message), .path = std::move(path)};
    }

    /// Render code, message, path and violations, one per line.
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Producer-defined `x_`/`X_` properties preserved on every object.
using CustomProps = std::map<std::string, nlohmann::json>;

namespace errc {

constexpr const char* kSchemaViolation = "SchemaViolation";
constexpr const char* kSemanticViolation = "SemanticViolation";
constexpr const char* kUnsupportedSpecVersion = "UnsupportedSpecVersion";
constexpr const char* kConversionFailure = "ConversionFailure";
constexpr const char* kMergeViolation = "MergeViolation";
constexpr const char* kDigestMismatch = "DigestMismatch";
constexpr const char* kPayloadDecodeError = "PayloadDecodeError";
constexpr const char* kSchemaRegistrationFailed = "SchemaRegistrationFailed";
constexpr const char* kIOError = "IOError";
constexpr const char* kParseError = "ParseError";

}  // namespace errc

}  // namespace pgxnmeta

namespace pgxnmeta::common {

// ============================================================================
// Digests
// ============================================================================

/**
 * Compute SHA-1 hash of data
 * @return Hex-encoded hash string (40 characters)
 */
[[nodiscard]] std::string sha1(std::string_view data);

/**
 * Compute SHA-256 hash of data
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-512 hash of data
 * @return Hex-encoded hash string (128 characters)
 */
[[nodiscard]] std::string sha512(std::string_view data);

/**
 * Compare two hex strings case-insensitively without an early exit.
 * Only the lengths are compared in variable time.
 */
[[nodiscard]] bool constant_time_hex_equal(std::string_view lhs, std::string_view rhs) noexcept;

// ============================================================================
// Base64URL (RFC 4648 section 5)
// ============================================================================

/**
 * Encode bytes as unpadded Base64URL
 */
[[nodiscard]] std::string base64url_encode(std::string_view data);

/**
 * Decode an unpadded (or correctly padded) Base64URL string
 * @return Decoded bytes or PayloadDecodeError
 */
[[nodiscard]] pgxnmeta::Result<std::string> base64url_decode(std::string_view encoded);

// ============================================================================
// JSON helpers
// ============================================================================

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] pgxnmeta::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Read a file's bytes
 */
[[nodiscard]] pgxnmeta::Result<std::string> read_file_bytes(const std::filesystem::path& path);

/// True for keys matching `^[xX]_.`
[[nodiscard]] bool is_custom_key(std::string_view key) noexcept;

/// Collect the custom properties of a JSON object.
[[nodiscard]] pgxnmeta::CustomProps custom_props(const nlohmann::json& object);

/// Write custom properties back into a JSON object.
void put_custom_props(nlohmann::json& object, const pgxnmeta::CustomProps& props);

/// Append a reference token to a JSON pointer, escaping `~` and `/`.
[[nodiscard]] std::string pointer_append(std::string_view base, std::string_view token);

}  // namespace pgxnmeta::common
