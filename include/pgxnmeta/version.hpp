#pragma once

/**
 * @file version.hpp
 * @brief pgxn_meta version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace pgxnmeta {

/// Library and CLI version string
constexpr const char* kVersion = "0.6.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Newest meta-spec generation this build understands
constexpr int kLatestGeneration = 2;

}  // namespace pgxnmeta
