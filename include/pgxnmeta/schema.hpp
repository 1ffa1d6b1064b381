#pragma once

/**
 * @file schema.hpp
 * @brief Compiled JSON Schema registry for META.json generations 1 and 2
 *
 * All schema documents are registered at once and cross-linked through
 * their "$id" URIs. After construction a registry is immutable and may be
 * shared between threads.
 */

#include "pgxnmeta/common.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace valijson {
class Schema;
}  // namespace valijson

namespace pgxnmeta::schema {

/// Base URI of every registered schema "$id".
constexpr std::string_view kIdPrefix = "https://pgxn.org/meta/";
constexpr std::string_view kIdSuffix = ".schema.json";

/**
 * @brief Result of validating one document
 */
struct ValidationOutcome
{
    std::vector<Violation> violations;  ///< Engine traversal order

    [[nodiscard]] bool valid() const noexcept { return violations.empty(); }
};

class SchemaRegistry
{
public:
    ~SchemaRegistry();

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    /**
     * Compile and cross-link a complete set of schema documents.
     *
     * Every document needs a string "$id". Any duplicate id, malformed
     * schema or "$ref" to an unregistered id fails the whole set.
     *
     * @return Shared registry or SchemaRegistrationFailed
     */
    [[nodiscard]] static pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>>
    create(std::vector<nlohmann::json> documents);

    /**
     * Load every "*.schema.json" under dir/v1 and dir/v2 and register them.
     */
    [[nodiscard]] static pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>>
    load(const std::filesystem::path& dir);

    /**
     * Validate a document against a registered schema.
     *
     * @param key Full "$id" or short form such as "v2/distribution"
     * @return Outcome, or SchemaRegistrationFailed for an unknown key
     */
    [[nodiscard]] pgxnmeta::Result<ValidationOutcome> validate(std::string_view key,
                                                               const nlohmann::json& document) const;

    /// True if the key (full or short form) names a registered schema.
    [[nodiscard]] bool contains(std::string_view key) const;

    /// Registered "$id" values in sorted order.
    [[nodiscard]] std::vector<std::string> ids() const;

private:
    SchemaRegistry() = default;

    std::map<std::string, std::unique_ptr<valijson::Schema>, std::less<>> m_schemas;
};

/**
 * Expand "v2/distribution" to "https://pgxn.org/meta/v2/distribution.schema.json".
 * Full ids are returned unchanged.
 */
[[nodiscard]] std::string resolve_key(std::string_view key);

/**
 * Registry loaded once per process from PGXNMETA_SCHEMA_DIR, or from the
 * directory given to set_default_schema_dir() before the first call.
 */
[[nodiscard]] pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>> default_registry();

/**
 * Override the default schema directory. Has no effect once
 * default_registry() has run.
 */
void set_default_schema_dir(std::filesystem::path dir);

/**
 * Validate and turn a failed outcome into a SchemaViolation error.
 * Unknown keys are reported as SchemaRegistrationFailed.
 */
[[nodiscard]] pgxnmeta::VoidResult require_valid(const SchemaRegistry& registry,
                                                 std::string_view key,
                                                 const nlohmann::json& document,
                                                 std::string_view what);

}  // namespace pgxnmeta::schema
