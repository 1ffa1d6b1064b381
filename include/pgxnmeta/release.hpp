#pragma once

/**
 * @file release.hpp
 * @brief Release metadata: a distribution plus PGXN's signed provenance
 *
 * Generation 2 releases carry a "certs" object whose "pgxn" member is a JWS
 * (general or flattened JSON serialization). The JWS payload is an opaque
 * Base64URL string; decoding it is a second validation pass that yields the
 * typed ReleasePayload. Generation 1 releases carry user/date/sha1 at the top
 * level and are upgraded into an unsigned flattened JWS.
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/digest.hpp"
#include "pgxnmeta/distribution.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/**
 * @brief Decoded JWS payload: who released what, when, and its digests
 */
struct ReleasePayload
{
    std::string user;
    std::string date;
    std::string uri;
    Digests digests;
    CustomProps custom;

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const ReleasePayload&) const = default;
};

struct JwsSignature
{
    std::optional<std::string> protected_header;
    std::optional<nlohmann::json> header;
    std::string signature;
    /// Members other than protected, header and signature.
    CustomProps other;

    bool operator==(const JwsSignature&) const = default;
};

struct GeneralJws
{
    std::string payload;
    std::vector<JwsSignature> signatures;
    CustomProps other;

    bool operator==(const GeneralJws&) const = default;
};

struct FlattenedJws
{
    std::string payload;
    JwsSignature signature;
    CustomProps other;

    bool operator==(const FlattenedJws&) const = default;
};

/// Discriminated on "signatures" (general) versus "signature" (flattened).
using Jws = std::variant<GeneralJws, FlattenedJws>;

/// Base64URL payload string of either serialization.
[[nodiscard]] const std::string& jws_payload(const Jws& jws) noexcept;

[[nodiscard]] nlohmann::json jws_to_json(const Jws& jws);

/**
 * Pass 1: validate the JWS envelope and decode its shape.
 * The payload stays an opaque string.
 *
 * @return Jws or SchemaViolation
 */
[[nodiscard]] pgxnmeta::Result<Jws> decode_envelope(const nlohmann::json& envelope,
                                                    const schema::SchemaRegistry& registry);

/**
 * Pass 2: Base64URL-decode the payload, parse it as JSON, validate it
 * against the release payload schema and build the typed payload.
 *
 * @return ReleasePayload, PayloadDecodeError (Base64URL or JSON stage),
 *         SchemaViolation or SemanticViolation (payload contents)
 */
[[nodiscard]] pgxnmeta::Result<ReleasePayload> decode_payload(const Jws& jws,
                                                              const schema::SchemaRegistry& registry);

struct Certs
{
    Jws pgxn;
    CustomProps custom;

    bool operator==(const Certs&) const = default;
};

class Release
{
public:
    /**
     * Build from a release document of either generation.
     *
     * @return Release, or UnsupportedSpecVersion, SchemaViolation,
     *         SemanticViolation, PayloadDecodeError or ConversionFailure
     */
    [[nodiscard]] static pgxnmeta::Result<Release> try_from(const nlohmann::json& document,
                                                            const schema::SchemaRegistry& registry);

    [[nodiscard]] static pgxnmeta::Result<Release> try_from(const nlohmann::json& document);

    [[nodiscard]] static pgxnmeta::Result<Release>
    load_file(const std::filesystem::path& path, const schema::SchemaRegistry& registry);

    [[nodiscard]] const Distribution& distribution() const noexcept { return m_distribution; }
    [[nodiscard]] const Certs& certs() const noexcept { return m_certs; }
    [[nodiscard]] const ReleasePayload& payload() const noexcept { return m_payload; }

    /// True when at least one JWS signature is non-empty.
    [[nodiscard]] bool is_signed() const noexcept;

    /// Verify archive bytes against the payload digests.
    [[nodiscard]] pgxnmeta::VoidResult verify_archive(std::string_view content) const
    {
        return m_payload.digests.verify(content);
    }

    /// Serialize as a generation 2 release document.
    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const Release&) const = default;

private:
    Release(Distribution distribution, Certs certs, ReleasePayload payload)
        : m_distribution(std::move(distribution))
        , m_certs(std::move(certs))
        , m_payload(std::move(payload))
    {}

    Distribution m_distribution;
    Certs m_certs;
    ReleasePayload m_payload;
};

}  // namespace pgxnmeta
