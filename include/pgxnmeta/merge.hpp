#pragma once

/**
 * @file merge.hpp
 * @brief Combining distribution metadata with service-authored release fields
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/distribution.hpp"
#include "pgxnmeta/release.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/**
 * Add release fields (typically "certs") to a distribution.
 *
 * Distribution fields are authoritative: a release field naming a
 * distribution property or a custom key is ignored with a warning, whether or
 * not the distribution sets it. The merged document is re-validated against the
 * release schema as a whole before the Release is constructed.
 *
 * @return Release, MergeViolation (composite fails the release schema) or
 *         any Release::try_from() error
 */
[[nodiscard]] pgxnmeta::Result<Release> merge(const Distribution& distribution,
                                              const nlohmann::json& release_fields,
                                              const schema::SchemaRegistry& registry);

[[nodiscard]] pgxnmeta::Result<Release> merge(const Distribution& distribution,
                                              const nlohmann::json& release_fields);

/**
 * Apply RFC 7396 merge patches to a distribution document.
 *
 * The first document is the base and is upgraded when it is generation 1;
 * each following document is applied in order as a JSON merge patch.
 */
[[nodiscard]] pgxnmeta::Result<Distribution>
merge_distribution_patches(const std::vector<nlohmann::json>& documents,
                           const schema::SchemaRegistry& registry);

/**
 * Same as merge_distribution_patches() for release documents. The base must
 * be generation 2.
 */
[[nodiscard]] pgxnmeta::Result<Release>
merge_release_patches(const std::vector<nlohmann::json>& documents,
                      const schema::SchemaRegistry& registry);

}  // namespace pgxnmeta
