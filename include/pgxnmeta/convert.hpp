#pragma once

/**
 * @file convert.hpp
 * @brief Generation 1 to generation 2 distribution upgrade
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/distribution.hpp"
#include "pgxnmeta/legacy.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/// Canonical meta-spec URL written into upgraded documents.
inline constexpr std::string_view kMetaSpecV2Url = "https://rfcs.pgxn.org/0003-meta-spec-v2.html";

/**
 * Upgrade a generation 1 distribution.
 *
 * Maintainer strings must carry an email ("Name <email>" or a bare address)
 * and license names must have an SPDX equivalent. Each provided extension
 * gets a synthesized "<name>.control" control file. The result is
 * constructed through Distribution::try_from(), so it always satisfies the
 * generation 2 schema.
 *
 * @return Distribution or ConversionFailure
 */
[[nodiscard]] pgxnmeta::Result<Distribution> upgrade(const LegacyDistribution& legacy,
                                                     const schema::SchemaRegistry& registry);

[[nodiscard]] pgxnmeta::Result<Distribution> upgrade(const LegacyDistribution& legacy);

/**
 * The generation 2 document upgrade() constructs from.
 * @return JSON document or ConversionFailure
 */
[[nodiscard]] pgxnmeta::Result<nlohmann::json> upgrade_document(const LegacyDistribution& legacy);

/**
 * Map a generation 1 license value to an SPDX license expression.
 * @return Expression or ConversionFailure
 */
[[nodiscard]] pgxnmeta::Result<std::string> upgrade_license(const LegacyLicense& license);

}  // namespace pgxnmeta
