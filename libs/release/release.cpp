/**
 * @file release.cpp
 * @brief Release construction, JWS envelope and payload decoding
 */

#include "pgxnmeta/release.hpp"

#include "pgxnmeta/convert.hpp"
#include "pgxnmeta/legacy.hpp"
#include "pgxnmeta/primitives.hpp"
#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <array>
#include <format>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using nlohmann::json;

constexpr std::string_view kEnvelopePath = "/certs/pgxn";
constexpr std::string_view kPayloadPath = "/certs/pgxn/payload";

// Provenance members of a generation 1 release document.
constexpr std::array<std::string_view, 3> kLegacyReleaseKeys = {"user", "date", "sha1"};

/// Members of obj whose names are not listed in known.
template <std::size_t N>
[[nodiscard]] CustomProps other_members(const json& obj, const std::array<std::string_view, N>& known)
{
    CustomProps out;
    for (const auto& [key, value] : obj.items()) {
        if (std::ranges::find(known, std::string_view(key)) == known.end()) {
            out.emplace(key, value);
        }
    }
    return out;
}

[[nodiscard]] JwsSignature read_signature(const json& obj)
{
    JwsSignature sig;
    if (const auto it = obj.find("protected"); it != obj.end()) {
        sig.protected_header = it->get<std::string>();
    }
    if (const auto it = obj.find("header"); it != obj.end()) {
        sig.header = *it;
    }
    sig.signature = obj.at("signature").get<std::string>();
    sig.other = other_members(obj, std::array<std::string_view, 4>{"protected", "header", "signature", "payload"});
    return sig;
}

[[nodiscard]] json signature_to_json(const JwsSignature& sig)
{
    json out = json::object();
    for (const auto& [key, value] : sig.other) {
        out[key] = value;
    }
    if (sig.protected_header) {
        out["protected"] = *sig.protected_header;
    }
    if (sig.header) {
        out["header"] = *sig.header;
    }
    out["signature"] = sig.signature;
    return out;
}

/// Attach the field path of the envelope or payload to an error.
[[nodiscard]] Error located(Error error, std::string_view base)
{
    error.path = std::string(base) + error.path;
    return error;
}

/**
 * Typed payload from JSON that already passed the payload schema.
 */
[[nodiscard]] Result<ReleasePayload> read_payload(const json& object)
{
    try {
        auto digests = Digests::from_json(object.at("digests"));
        if (!digests) {
            return std::unexpected(located(digests.error(), "/digests"));
        }
        ReleasePayload payload{
            .user = object.at("user").get<std::string>(),
            .date = object.at("date").get<std::string>(),
            .uri = object.at("uri").get<std::string>(),
            .digests = std::move(*digests),
            .custom = common::custom_props(object),
        };
        for (const auto& [path, valid] : {
                 std::pair{"/user", primitive::validate_term(payload.user)},
                 std::pair{"/date", primitive::validate_timestamp(payload.date)},
                 std::pair{"/uri", primitive::validate_path(payload.uri)},
             }) {
            if (!valid) {
                return std::unexpected(located(valid.error(), path));
            }
        }
        return payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(errc::kSemanticViolation,
                                           std::format("unexpected payload shape: {}", ex.what())));
    }
}

/// Run both JWS passes and attach document paths to any failure.
[[nodiscard]] Result<std::pair<Certs, ReleasePayload>> read_certs(const json& certs,
                                                                  const schema::SchemaRegistry& registry)
{
    auto jws = decode_envelope(certs.at("pgxn"), registry);
    if (!jws) {
        return std::unexpected(located(jws.error(), kEnvelopePath));
    }
    auto payload = decode_payload(*jws, registry);
    if (!payload) {
        return std::unexpected(located(payload.error(), kPayloadPath));
    }
    return std::pair{Certs{.pgxn = std::move(*jws), .custom = common::custom_props(certs)},
                     std::move(*payload)};
}

[[nodiscard]] Result<Release> legacy_release_from(const json& document,
                                                  const schema::SchemaRegistry& registry,
                                                  auto make)
{
    if (auto valid = schema::require_valid(registry, "v1/release", document, "legacy release"); !valid) {
        return std::unexpected(valid.error());
    }

    json dist_doc = document;
    for (const auto key : kLegacyReleaseKeys) {
        dist_doc.erase(std::string(key));
    }
    auto legacy = LegacyDistribution::try_from(dist_doc, registry);
    if (!legacy) {
        return std::unexpected(legacy.error());
    }
    auto dist = upgrade(*legacy, registry);
    if (!dist) {
        return std::unexpected(dist.error());
    }

    const std::string& name = dist->name();
    const std::string version = dist->version().to_string();
    json payload_doc = {
        {"user", document.at("user")},
        {"date", document.at("date")},
        {"uri", std::format("dist/{0}/{1}/{0}-{1}.zip", name, version)},
        {"digests", {{"sha1", document.at("sha1")}}},
    };
    if (auto valid = schema::require_valid(registry, "v2/payload", payload_doc, "release payload"); !valid) {
        return std::unexpected(valid.error());
    }
    auto payload = read_payload(payload_doc);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    // Generation 1 releases were never signed.
    FlattenedJws jws{
        .payload = common::base64url_encode(payload_doc.dump()),
        .signature = JwsSignature{.signature = ""},
        .other = {},
    };
    spdlog::debug("upgraded legacy release {} {} as unsigned", name, version);
    return make(std::move(*dist), Certs{.pgxn = std::move(jws), .custom = {}}, std::move(*payload));
}

}  // namespace

nlohmann::json ReleasePayload::to_json() const
{
    json out = {{"user", user}, {"date", date}, {"uri", uri}, {"digests", digests.to_json()}};
    common::put_custom_props(out, custom);
    return out;
}

const std::string& jws_payload(const Jws& jws) noexcept
{
    return std::visit([](const auto& value) -> const std::string& { return value.payload; }, jws);
}

json jws_to_json(const Jws& jws)
{
    if (const auto* general = std::get_if<GeneralJws>(&jws)) {
        json out = json::object();
        for (const auto& [key, value] : general->other) {
            out[key] = value;
        }
        json signatures = json::array();
        for (const auto& sig : general->signatures) {
            signatures.push_back(signature_to_json(sig));
        }
        out["payload"] = general->payload;
        out["signatures"] = std::move(signatures);
        return out;
    }
    const auto& flat = std::get<FlattenedJws>(jws);
    json out = signature_to_json(flat.signature);
    for (const auto& [key, value] : flat.other) {
        out[key] = value;
    }
    out["payload"] = flat.payload;
    return out;
}

pgxnmeta::Result<Jws> decode_envelope(const json& envelope, const schema::SchemaRegistry& registry)
{
    if (auto valid = schema::require_valid(registry, "v2/jws", envelope, "JWS envelope"); !valid) {
        return std::unexpected(valid.error());
    }

    try {
        if (envelope.contains("signatures")) {
            GeneralJws general;
            general.payload = envelope.at("payload").get<std::string>();
            for (const auto& item : envelope.at("signatures")) {
                general.signatures.push_back(read_signature(item));
            }
            general.other = other_members(envelope, std::array<std::string_view, 2>{"payload", "signatures"});
            return general;
        }
        FlattenedJws flat{
            .payload = envelope.at("payload").get<std::string>(),
            .signature = read_signature(envelope),
            .other = {},
        };
        return flat;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(errc::kSchemaViolation,
                                           std::format("unexpected JWS shape: {}", ex.what())));
    }
}

pgxnmeta::Result<ReleasePayload> decode_payload(const Jws& jws, const schema::SchemaRegistry& registry)
{
    auto bytes = common::base64url_decode(jws_payload(jws));
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    json payload = json::parse(*bytes, nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(
            Error::make(errc::kPayloadDecodeError, "JWS payload does not decode to valid JSON"));
    }

    if (auto valid = schema::require_valid(registry, "v2/payload", payload, "release payload"); !valid) {
        return std::unexpected(valid.error());
    }
    return read_payload(payload);
}

pgxnmeta::Result<Release> Release::try_from(const json& document, const schema::SchemaRegistry& registry)
{
    auto generation = detect_generation(document);
    if (!generation) {
        return std::unexpected(generation.error());
    }

    const auto make = [](Distribution dist, Certs certs, ReleasePayload payload) {
        return Release(std::move(dist), std::move(certs), std::move(payload));
    };
    if (*generation == Generation::kV1) {
        return legacy_release_from(document, registry, make);
    }

    if (auto valid = schema::require_valid(registry, "v2/release", document, "release"); !valid) {
        return std::unexpected(valid.error());
    }

    json dist_doc = document;
    dist_doc.erase("certs");
    auto dist = Distribution::try_from(dist_doc, registry);
    if (!dist) {
        return std::unexpected(dist.error());
    }

    auto certs = read_certs(document.at("certs"), registry);
    if (!certs) {
        return std::unexpected(certs.error());
    }
    if (certs->second.digests.is_weak()) {
        spdlog::warn("release {} {} is certified by sha1 only", dist->name(), dist->version().to_string());
    }
    return make(std::move(*dist), std::move(certs->first), std::move(certs->second));
}

pgxnmeta::Result<Release> Release::try_from(const json& document)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return try_from(document, **registry);
}

pgxnmeta::Result<Release> Release::load_file(const std::filesystem::path& path,
                                             const schema::SchemaRegistry& registry)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return try_from(*document, registry);
}

bool Release::is_signed() const noexcept
{
    if (const auto* general = std::get_if<GeneralJws>(&m_certs.pgxn)) {
        return std::ranges::any_of(general->signatures,
                                   [](const JwsSignature& sig) { return !sig.signature.empty(); });
    }
    return !std::get<FlattenedJws>(m_certs.pgxn).signature.signature.empty();
}

json Release::to_json() const
{
    json out = m_distribution.to_json();
    json certs = {{"pgxn", jws_to_json(m_certs.pgxn)}};
    common::put_custom_props(certs, m_certs.custom);
    out["certs"] = std::move(certs);
    return out;
}

}  // namespace pgxnmeta
