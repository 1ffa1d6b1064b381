/**
 * @file schema_registry.cpp
 * @brief JSON Schema registration and validation using valijson
 */

#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>
#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validation_results.hpp>
#include <valijson/validator.hpp>

#ifndef PGXNMETA_SCHEMA_DIR
#define PGXNMETA_SCHEMA_DIR "schemas"
#endif

namespace pgxnmeta::schema {

namespace {

constexpr std::array<std::string_view, 2> kGenerationDirs = {"v1", "v2"};

void normalize_ref(nlohmann::json& value)
{
    if (!value.is_string()) {
        return;
    }
    std::string ref = value.get<std::string>();
    constexpr std::string_view kPrefix = "#/$defs/";
    if (ref.starts_with(kPrefix)) {
        value = "#/definitions/" + ref.substr(kPrefix.size());
    }
}

/**
 * @brief Rewrite 2019-09 "$defs" to draft-07 "definitions" for valijson
 */
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }

        std::vector<std::string> keys;
        keys.reserve(schema.size());
        for (const auto& item : schema.items()) {
            keys.push_back(item.key());
        }
        for (const auto& key : keys) {
            nlohmann::json& value = schema.at(key);
            if (key == "$ref") {
                normalize_ref(value);
                continue;
            }
            normalize_schema_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
    }
}

[[nodiscard]] pgxnmeta::Error registration_error(std::string message)
{
    return pgxnmeta::Error::make(errc::kSchemaRegistrationFailed, std::move(message));
}

/**
 * @brief Turn valijson's context ("<root>", "[maintainers]", "[0]") into a JSON pointer
 */
[[nodiscard]] std::string context_to_pointer(const std::vector<std::string>& context)
{
    std::string pointer;
    for (const auto& part : context) {
        if (part == "<root>") {
            continue;
        }
        std::string_view token = part;
        if (token.size() >= 2 && token.front() == '[' && token.back() == ']') {
            token = token.substr(1, token.size() - 2);
        }
        pointer = common::pointer_append(pointer, token);
    }
    return pointer;
}

[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle)
{
    const auto it = std::ranges::search(haystack, needle, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
    return !it.empty();
}

/**
 * @brief Guess the failing keyword from valijson's description text
 *
 * valijson does not report the keyword itself. First match wins, so the
 * more specific phrases come first.
 */
[[nodiscard]] std::string keyword_for(std::string_view description)
{
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 21> kPhrases{{
        {"associated with pattern", "patternProperties"},
        {"'pattern'", "pattern"},
        {"regex", "pattern"},
        {"uniqueItems", "uniqueItems"},
        {"uniqueness", "uniqueItems"},
        {"'not'", "not"},
        {"oneOf", "oneOf"},
        {"exactly one", "oneOf"},
        {"anyOf", "anyOf"},
        {"child schema", "allOf"},
        {"additionalProperties", "additionalProperties"},
        {"additional propert", "additionalProperties"},
        {"pattern propert", "patternProperties"},
        {"associated with property", "properties"},
        {"property name", "propertyNames"},
        {"required property", "required"},
        {"enum", "enum"},
        {"type", "type"},
        {"item #", "items"},
        {"less than", "maximum"},
        {"greater than", "minimum"},
    }};

    if (icontains(description, "characters in length")) {
        return icontains(description, "more than") ? "maxLength" : "minLength";
    }
    if (icontains(description, "properties")
        && (icontains(description, "fewer than") || icontains(description, "more than"))
        && !icontains(description, "additional")) {
        return icontains(description, "more than") ? "maxProperties" : "minProperties";
    }
    if (icontains(description, "elements") || icontains(description, "items")) {
        if (icontains(description, "fewer than")) {
            return "minItems";
        }
        if (icontains(description, "more than")) {
            return "maxItems";
        }
    }
    for (const auto& [phrase, keyword] : kPhrases) {
        if (icontains(description, phrase)) {
            return std::string(keyword);
        }
    }
    return "schema";
}

[[nodiscard]] std::vector<Violation> collect_violations(valijson::ValidationResults& results)
{
    std::vector<Violation> violations;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        violations.push_back(Violation{
            .location = context_to_pointer(error.context),
            .description = error.description,
            .keyword = keyword_for(error.description),
        });
    }
    return violations;
}

struct DefaultDirState
{
    std::mutex mutex;
    std::filesystem::path dir = PGXNMETA_SCHEMA_DIR;
};

[[nodiscard]] DefaultDirState& default_dir_state()
{
    static DefaultDirState state;
    return state;
}

}  // namespace

SchemaRegistry::~SchemaRegistry() = default;

std::string resolve_key(std::string_view key)
{
    if (key.starts_with(kIdPrefix)) {
        return std::string(key);
    }
    return std::format("{}{}{}", kIdPrefix, key, kIdSuffix);
}

pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>>
SchemaRegistry::create(std::vector<nlohmann::json> documents)
{
    std::map<std::string, nlohmann::json, std::less<>> by_id;
    for (auto& document : documents) {
        if (!document.is_object() || !document.contains("$id") || !document.at("$id").is_string()) {
            return std::unexpected(registration_error("schema document has no string \"$id\""));
        }
        std::string id = document.at("$id").get<std::string>();
        normalize_schema_defs(document);
        if (!by_id.emplace(id, std::move(document)).second) {
            return std::unexpected(registration_error(std::format("duplicate schema id '{}'", id)));
        }
    }

    const auto fetch_doc = [&by_id](const std::string& uri) -> const nlohmann::json* {
        const auto it = by_id.find(uri);
        if (it == by_id.end()) {
            return nullptr;
        }
        return &it->second;
    };
    // Documents stay owned by by_id.
    const auto free_doc = [](const nlohmann::json* schema_ptr) { (void)schema_ptr; };

    std::shared_ptr<SchemaRegistry> registry(new SchemaRegistry());
    for (const auto& [id, document] : by_id) {
        auto compiled = std::make_unique<valijson::Schema>();
        try {
            valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
            valijson::adapters::NlohmannJsonAdapter schema_adapter(document);
            parser.populateSchema(schema_adapter, *compiled, fetch_doc, free_doc);
        } catch (const std::exception& ex) {
            return std::unexpected(
                registration_error(std::format("failed to build schema '{}': {}", id, ex.what())));
        }
        registry->m_schemas.emplace(id, std::move(compiled));
    }

    spdlog::debug("registered {} schemas", registry->m_schemas.size());
    return std::shared_ptr<const SchemaRegistry>(std::move(registry));
}

pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>>
SchemaRegistry::load(const std::filesystem::path& dir)
{
    std::vector<nlohmann::json> documents;
    for (const auto generation : kGenerationDirs) {
        const auto subdir = dir / generation;
        std::error_code ec;
        if (!std::filesystem::is_directory(subdir, ec)) {
            return std::unexpected(registration_error(
                std::format("schema directory not found: {}", subdir.string())));
        }

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(subdir, ec)) {
            const auto name = entry.path().filename().string();
            if (entry.is_regular_file() && name.ends_with(kIdSuffix)) {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            return std::unexpected(registration_error(
                std::format("failed to list {}: {}", subdir.string(), ec.message())));
        }
        std::ranges::sort(files);

        for (const auto& file : files) {
            auto document = common::read_json_file(file);
            if (!document) {
                return std::unexpected(registration_error(document.error().message));
            }
            documents.push_back(std::move(*document));
        }
        spdlog::debug("loaded {} schema files from {}", files.size(), subdir.string());
    }
    return create(std::move(documents));
}

pgxnmeta::Result<ValidationOutcome> SchemaRegistry::validate(std::string_view key,
                                                             const nlohmann::json& document) const
{
    const auto it = m_schemas.find(resolve_key(key));
    if (it == m_schemas.end()) {
        return std::unexpected(registration_error(std::format("unknown schema '{}'", key)));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(document);

    ValidationOutcome outcome;
    if (!validator.validate(*it->second, target_adapter, &results)) {
        outcome.violations = collect_violations(results);
        if (outcome.violations.empty()) {
            outcome.violations.push_back(Violation{.location = "",
                                                   .description = "Schema validation failed.",
                                                   .keyword = "schema"});
        }
    }
    return outcome;
}

bool SchemaRegistry::contains(std::string_view key) const
{
    return m_schemas.contains(resolve_key(key));
}

std::vector<std::string> SchemaRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(m_schemas.size());
    for (const auto& [id, schema] : m_schemas) {
        out.push_back(id);
    }
    return out;
}

void set_default_schema_dir(std::filesystem::path dir)
{
    auto& state = default_dir_state();
    std::lock_guard lock(state.mutex);
    state.dir = std::move(dir);
}

pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>> default_registry()
{
    static std::once_flag once;
    static pgxnmeta::Result<std::shared_ptr<const SchemaRegistry>> registry =
        std::unexpected(registration_error("schema registry not initialized"));

    std::call_once(once, [] {
        std::filesystem::path dir;
        {
            auto& state = default_dir_state();
            std::lock_guard lock(state.mutex);
            dir = state.dir;
        }
        spdlog::debug("loading schemas from {}", dir.string());
        registry = SchemaRegistry::load(dir);
    });
    return registry;
}

pgxnmeta::VoidResult require_valid(const SchemaRegistry& registry,
                                   std::string_view key,
                                   const nlohmann::json& document,
                                   std::string_view what)
{
    auto outcome = registry.validate(key, document);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (outcome->valid()) {
        return {};
    }
    const auto count = outcome->violations.size();
    pgxnmeta::Error error = pgxnmeta::Error::make(
        errc::kSchemaViolation,
        std::format("{} failed schema validation with {} violation{}", what, count,
                    count == 1 ? "" : "s"));
    error.violations = std::move(outcome->violations);
    return std::unexpected(std::move(error));
}

}  // namespace pgxnmeta::schema
