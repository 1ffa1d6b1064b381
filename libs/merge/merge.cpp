/**
 * @file merge.cpp
 * @brief Release field merging and JSON merge patch application
 */

#include "pgxnmeta/merge.hpp"

#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <array>
#include <format>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using nlohmann::json;

// Top-level properties owned by the distribution part of a release.
constexpr std::array<std::string_view, 14> kDistributionKeys = {
    "name", "version", "abstract", "description", "producer", "license", "maintainers",
    "meta-spec", "classifications", "contents", "ignore", "dependencies", "resources", "artifacts",
};

/// Distribution properties and custom keys, which belong to the distribution.
[[nodiscard]] bool distribution_owned(std::string_view key) noexcept
{
    return common::is_custom_key(key) || std::ranges::find(kDistributionKeys, key) != kDistributionKeys.end();
}

[[nodiscard]] Error merge_error(std::string message)
{
    return Error::make(errc::kMergeViolation, std::move(message));
}

/**
 * The base document followed by every patch, in order.
 */
[[nodiscard]] Result<json> apply_patches(json base, const std::vector<json>& documents)
{
    for (std::size_t i = 1; i < documents.size(); ++i) {
        if (!documents[i].is_object()) {
            return std::unexpected(merge_error(std::format("patch {} is not a JSON object", i)));
        }
        base.merge_patch(documents[i]);
    }
    return base;
}

}  // namespace

pgxnmeta::Result<Release> merge(const Distribution& distribution,
                                const json& release_fields,
                                const schema::SchemaRegistry& registry)
{
    if (!release_fields.is_object()) {
        return std::unexpected(merge_error("release fields must be a JSON object"));
    }

    json merged = distribution.to_json();
    for (const auto& [key, value] : release_fields.items()) {
        if (distribution_owned(key)) {
            spdlog::warn("ignoring release field '{}': distribution value is authoritative", key);
            continue;
        }
        merged[key] = value;
    }

    if (auto valid = schema::require_valid(registry, "v2/release", merged, "merged release"); !valid) {
        Error error = std::move(valid.error());
        error.code = errc::kMergeViolation;
        return std::unexpected(std::move(error));
    }
    return Release::try_from(merged, registry);
}

pgxnmeta::Result<Release> merge(const Distribution& distribution, const json& release_fields)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return merge(distribution, release_fields, **registry);
}

pgxnmeta::Result<Distribution> merge_distribution_patches(const std::vector<json>& documents,
                                                          const schema::SchemaRegistry& registry)
{
    if (documents.empty()) {
        return std::unexpected(merge_error("no distribution documents to merge"));
    }

    // Patches are written against the current generation.
    auto base = Distribution::load(documents.front(), registry);
    if (!base) {
        return std::unexpected(base.error());
    }
    auto merged = apply_patches(base->to_json(), documents);
    if (!merged) {
        return std::unexpected(merged.error());
    }
    return Distribution::try_from(*merged, registry);
}

pgxnmeta::Result<Release> merge_release_patches(const std::vector<json>& documents,
                                                const schema::SchemaRegistry& registry)
{
    if (documents.empty()) {
        return std::unexpected(merge_error("no release documents to merge"));
    }
    auto generation = detect_generation(documents.front());
    if (!generation) {
        return std::unexpected(generation.error());
    }
    if (*generation != Generation::kV2) {
        return std::unexpected(Error::at(errc::kUnsupportedSpecVersion,
                                         "/meta-spec/version",
                                         "release patches require a generation 2 base document"));
    }
    auto merged = apply_patches(documents.front(), documents);
    if (!merged) {
        return std::unexpected(merged.error());
    }
    return Release::try_from(*merged, registry);
}

}  // namespace pgxnmeta
