/**
 * @file digest.cpp
 * @brief Digest set construction and constant-time verification
 */

#include "pgxnmeta/digest.hpp"

#include "pgxnmeta/primitives.hpp"

#include <array>
#include <format>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using HashFn = std::string (*)(std::string_view);

struct Algorithm
{
    std::string_view name;
    std::optional<std::string> Digests::*member;
    HashFn hash;
};

}  // namespace

pgxnmeta::Result<Digests> Digests::make(std::optional<std::string> sha1,
                                        std::optional<std::string> sha256,
                                        std::optional<std::string> sha512)
{
    if (!sha1 && !sha256 && !sha512) {
        return std::unexpected(Error::make(errc::kSemanticViolation,
                                           "digest set needs at least one of sha1, sha256, sha512"));
    }
    Digests digests;
    digests.m_sha1 = std::move(sha1);
    digests.m_sha256 = std::move(sha256);
    digests.m_sha512 = std::move(sha512);

    for (const auto& [name, value] : {std::pair{"sha1", &digests.m_sha1},
                                      std::pair{"sha256", &digests.m_sha256},
                                      std::pair{"sha512", &digests.m_sha512}}) {
        if (!*value) {
            continue;
        }
        if (auto valid = primitive::validate_digest_hex(name, **value); !valid) {
            return std::unexpected(
                Error::at(errc::kSemanticViolation, std::format("/{}", name), valid.error().message));
        }
    }

    if (digests.is_weak()) {
        spdlog::warn("digest set has only sha1; prefer sha256 or sha512");
    }
    return digests;
}

pgxnmeta::Result<Digests> Digests::from_json(const nlohmann::json& object)
{
    if (!object.is_object()) {
        return std::unexpected(
            Error::make(errc::kSemanticViolation, "digests must be a JSON object"));
    }

    std::optional<std::string> sha1;
    std::optional<std::string> sha256;
    std::optional<std::string> sha512;
    for (const auto& [key, value] : object.items()) {
        if (!value.is_string()) {
            return std::unexpected(Error::at(errc::kSemanticViolation,
                                             common::pointer_append("", key),
                                             std::format("{} digest must be a string", key)));
        }
        if (key == "sha1") {
            sha1 = value.get<std::string>();
        } else if (key == "sha256") {
            sha256 = value.get<std::string>();
        } else if (key == "sha512") {
            sha512 = value.get<std::string>();
        } else {
            return std::unexpected(Error::at(errc::kSemanticViolation,
                                             common::pointer_append("", key),
                                             std::format("unknown digest algorithm '{}'", key)));
        }
    }
    return make(std::move(sha1), std::move(sha256), std::move(sha512));
}

pgxnmeta::VoidResult Digests::verify(std::string_view content) const
{
    const std::array<Algorithm, 3> algorithms{{
        {"sha1", &Digests::m_sha1, &common::sha1},
        {"sha256", &Digests::m_sha256, &common::sha256},
        {"sha512", &Digests::m_sha512, &common::sha512},
    }};

    std::string failed;
    for (const auto& algorithm : algorithms) {
        const auto& expected = this->*algorithm.member;
        if (!expected) {
            continue;
        }
        // Every present algorithm is computed, even after a failure.
        if (!common::constant_time_hex_equal(algorithm.hash(content), *expected)) {
            if (!failed.empty()) {
                failed += ", ";
            }
            failed += algorithm.name;
        }
    }
    if (!failed.empty()) {
        return std::unexpected(
            Error::make(errc::kDigestMismatch, std::format("digest mismatch: {}", failed)));
    }
    return {};
}

std::string_view Digests::strongest() const noexcept
{
    if (m_sha512) {
        return "sha512";
    }
    if (m_sha256) {
        return "sha256";
    }
    return "sha1";
}

const std::string& Digests::strongest_hex() const noexcept
{
    if (m_sha512) {
        return *m_sha512;
    }
    if (m_sha256) {
        return *m_sha256;
    }
    return *m_sha1;
}

bool Digests::is_weak() const noexcept
{
    return m_sha1.has_value() && !m_sha256 && !m_sha512;
}

nlohmann::json Digests::to_json() const
{
    nlohmann::json out = nlohmann::json::object();
    if (m_sha1) {
        out["sha1"] = *m_sha1;
    }
    if (m_sha256) {
        out["sha256"] = *m_sha256;
    }
    if (m_sha512) {
        out["sha512"] = *m_sha512;
    }
    return out;
}

}  // namespace pgxnmeta
