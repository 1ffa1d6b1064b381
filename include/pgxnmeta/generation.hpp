#pragma once

/**
 * @file generation.hpp
 * @brief META.json generation (meta-spec major version) detection
 */

#include "pgxnmeta/common.hpp"

#include <nlohmann/json.hpp>

namespace pgxnmeta {

enum class Generation {
    kV1 = 1,
    kV2 = 2
};

/**
 * Read meta-spec.version and map its major component to a generation.
 * @return Generation or UnsupportedSpecVersion
 */
[[nodiscard]] pgxnmeta::Result<Generation> detect_generation(const nlohmann::json& document);

}  // namespace pgxnmeta
