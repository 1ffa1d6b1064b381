#pragma once

/**
 * @file license.hpp
 * @brief SPDX license expressions
 *
 * An expression is a single identifier or identifiers combined with AND, OR
 * and WITH, optionally grouped with parentheses. Identifiers are matched
 * case-insensitively against the embedded SPDX license and exception lists;
 * "LicenseRef-" and "DocumentRef-...:LicenseRef-" references are accepted
 * as user-defined licenses.
 */

#include "pgxnmeta/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pgxnmeta::license {

[[nodiscard]] bool is_license_id(std::string_view id) noexcept;

[[nodiscard]] bool is_exception_id(std::string_view id) noexcept;

/**
 * Validate an SPDX license expression.
 * @return Empty on success, SemanticViolation otherwise
 */
[[nodiscard]] pgxnmeta::VoidResult validate_expression(std::string_view expression);

/**
 * Licenses named in a valid expression, in order of appearance, without
 * exceptions or the "+" suffix.
 */
[[nodiscard]] pgxnmeta::Result<std::vector<std::string>> license_ids(std::string_view expression);

}  // namespace pgxnmeta::license
