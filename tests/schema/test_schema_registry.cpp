/**
 * @file test_schema_registry.cpp
 * @brief Tests for schema registration and document validation
 */

#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace pgxnmeta::schema::test {

namespace {

using nlohmann::json;

[[nodiscard]] const SchemaRegistry& registry()
{
    static const auto loaded = SchemaRegistry::load(PGXNMETA_SCHEMA_DIR);
    if (!loaded) {
        throw std::runtime_error(loaded.error().describe());
    }
    return **loaded;
}

[[nodiscard]] json pair_distribution()
{
    return json::parse(R"({
        "name": "pair",
        "abstract": "A key/value pair data type",
        "version": "0.1.8",
        "maintainers": [{"name": "theory", "email": "theory@pgxn.org"}],
        "license": "PostgreSQL",
        "contents": {"extensions": {"pair": {"sql": "sql/pair.sql", "control": "pair.control"}}},
        "meta-spec": {"version": "2.0.0"}
    })");
}

[[nodiscard]] json id_schema(std::string_view name, json body)
{
    body["$schema"] = "http://json-schema.org/draft-07/schema#";
    body["$id"] = std::format("https://example.org/{}.schema.json", name);
    return body;
}

[[nodiscard]] bool has_keyword(const ValidationOutcome& outcome, std::string_view keyword)
{
    return std::ranges::any_of(outcome.violations,
                               [keyword](const Violation& v) { return v.keyword == keyword; });
}

struct KeywordCase
{
    std::string_view keyword;
    json schema;
    json document;
};

}  // namespace

TEST(SchemaRegistry, LoadsBothGenerations)
{
    EXPECT_TRUE(registry().contains("v1/distribution"));
    EXPECT_TRUE(registry().contains("v2/distribution"));
    EXPECT_TRUE(registry().contains("https://pgxn.org/meta/v2/release.schema.json"));
    EXPECT_FALSE(registry().contains("v3/distribution"));

    const auto ids = registry().ids();
    EXPECT_TRUE(std::ranges::is_sorted(ids));
    EXPECT_GT(ids.size(), 40U);
}

TEST(SchemaRegistry, ResolvesShortKeys)
{
    EXPECT_EQ(resolve_key("v2/term"), "https://pgxn.org/meta/v2/term.schema.json");
    EXPECT_EQ(resolve_key("https://pgxn.org/meta/v1/license.schema.json"),
              "https://pgxn.org/meta/v1/license.schema.json");
}

TEST(SchemaRegistry, ValidDistributionHasNoViolations)
{
    auto outcome = registry().validate("v2/distribution", pair_distribution());
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();
    EXPECT_TRUE(outcome->valid());
}

TEST(SchemaRegistry, ViolationsCarryLocation)
{
    json doc = pair_distribution();
    doc["maintainers"][0]["email"] = 42;
    auto outcome = registry().validate("v2/distribution", doc);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->valid());
    const bool located = std::ranges::any_of(outcome->violations, [](const Violation& v) {
        return v.location == "/maintainers/0/email";
    });
    EXPECT_TRUE(located);
}

TEST(SchemaRegistry, MissingRequiredProperty)
{
    json doc = pair_distribution();
    doc.erase("license");
    auto outcome = registry().validate("v2/distribution", doc);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->valid());
    const bool required = std::ranges::any_of(outcome->violations, [](const Violation& v) {
        return v.keyword == "required";
    });
    EXPECT_TRUE(required);
}

TEST(SchemaRegistry, TermSchemaRejectsShortAndSlashed)
{
    for (const char* bad : {"x", "a/b", "has space"}) {
        auto outcome = registry().validate("v2/term", json(bad));
        ASSERT_TRUE(outcome.has_value());
        EXPECT_FALSE(outcome->valid()) << bad;
    }
    auto outcome = registry().validate("v2/term", json("pair"));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->valid());
}

TEST(SchemaRegistry, UnknownKeyIsRegistrationError)
{
    auto outcome = registry().validate("v9/nothing", json::object());
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, errc::kSchemaRegistrationFailed);
}

TEST(SchemaRegistry, RequireValidReportsSchemaViolation)
{
    auto result = require_valid(registry(), "v2/distribution", json::object(), "distribution");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, errc::kSchemaViolation);
    EXPECT_FALSE(result.error().violations.empty());
    EXPECT_TRUE(result.error().message.starts_with("distribution failed schema validation"));
}

TEST(SchemaRegistry, CreateCrossLinksById)
{
    std::vector<json> docs{
        id_schema("name", json{{"type", "string"}, {"minLength", 2}}),
        id_schema("person", json{{"type", "object"},
                                 {"required", {"name"}},
                                 {"properties", {{"name", {{"$ref", "https://example.org/name.schema.json"}}}}}}),
    };
    auto created = SchemaRegistry::create(std::move(docs));
    ASSERT_TRUE(created.has_value()) << created.error().describe();

    const auto& reg = **created;
    auto ok = reg.validate("https://example.org/person.schema.json", json{{"name", "theory"}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->valid());
    auto bad = reg.validate("https://example.org/person.schema.json", json{{"name", "t"}});
    ASSERT_TRUE(bad.has_value());
    EXPECT_FALSE(bad->valid());
}

TEST(SchemaRegistry, CreateRejectsDanglingReference)
{
    std::vector<json> docs{
        id_schema("broken", json{{"$ref", "https://example.org/missing.schema.json"}}),
    };
    auto created = SchemaRegistry::create(std::move(docs));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, errc::kSchemaRegistrationFailed);
}

TEST(SchemaRegistry, CreateRejectsDuplicateAndMissingIds)
{
    std::vector<json> dupes{
        id_schema("same", json{{"type", "string"}}),
        id_schema("same", json{{"type", "integer"}}),
    };
    auto duplicated = SchemaRegistry::create(std::move(dupes));
    ASSERT_FALSE(duplicated.has_value());
    EXPECT_NE(duplicated.error().message.find("duplicate"), std::string::npos);

    auto anonymous = SchemaRegistry::create({json{{"type", "string"}}});
    ASSERT_FALSE(anonymous.has_value());
    EXPECT_EQ(anonymous.error().code, errc::kSchemaRegistrationFailed);
}

TEST(SchemaRegistry, LoadFailsForMissingDirectory)
{
    auto loaded = SchemaRegistry::load("/nonexistent/pgxnmeta/schemas");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, errc::kSchemaRegistrationFailed);
}

TEST(SchemaRegistry, ViolationKeywordsMatchFailingConstraint)
{
    const std::vector<KeywordCase> cases{
        {"type", json{{"type", "string"}}, json(42)},
        {"required", json{{"type", "object"}, {"required", {"name"}}}, json::object()},
        {"pattern", json{{"type", "string"}, {"pattern", "^[a-z]+$"}}, json("ABC")},
        {"enum", json{{"enum", {"a", "b"}}}, json("c")},
        {"minLength", json{{"type", "string"}, {"minLength", 2}}, json("x")},
        {"maxLength", json{{"type", "string"}, {"maxLength", 3}}, json("long")},
        {"minItems", json{{"type", "array"}, {"minItems", 1}}, json::array()},
        {"maxItems", json{{"type", "array"}, {"maxItems", 1}}, json::array({1, 2})},
        {"uniqueItems", json{{"type", "array"}, {"uniqueItems", true}}, json::array({1, 1})},
        {"minProperties", json{{"type", "object"}, {"minProperties", 1}}, json::object()},
        {"items", json{{"type", "array"}, {"items", {{"type", "string"}}}}, json::array({1})},
        {"properties",
         json{{"type", "object"}, {"properties", {{"name", {{"type", "string"}}}}}},
         json{{"name", 1}}},
        {"patternProperties",
         json{{"type", "object"}, {"patternProperties", {{"^x_", {{"type", "string"}}}}}},
         json{{"x_note", 1}}},
        {"additionalProperties",
         json{{"type", "object"}, {"properties", {{"a", json::object()}}}, {"additionalProperties", false}},
         json{{"b", 1}}},
        {"not", json{{"not", {{"type", "string"}}}}, json("a")},
        {"anyOf", json{{"anyOf", {{{"type", "string"}}, {{"type", "integer"}}}}}, json(true)},
        {"oneOf", json{{"oneOf", {{{"type", "string"}}, {{"type", "integer"}}}}}, json(true)},
        {"allOf", json{{"allOf", {{{"type", "string"}}, {{"minLength", 3}}}}}, json("ab")},
    };

    std::vector<json> docs;
    for (const auto& c : cases) {
        docs.push_back(id_schema(std::format("keyword-{}", c.keyword), c.schema));
    }
    auto created = SchemaRegistry::create(std::move(docs));
    ASSERT_TRUE(created.has_value()) << created.error().describe();

    for (const auto& c : cases) {
        SCOPED_TRACE(std::string(c.keyword));
        auto outcome = (*created)->validate(std::format("https://example.org/keyword-{}.schema.json", c.keyword),
                                            c.document);
        ASSERT_TRUE(outcome.has_value());
        ASSERT_FALSE(outcome->valid());
        EXPECT_TRUE(has_keyword(*outcome, c.keyword));
    }
}

TEST(SchemaRegistry, SharedRegistryValidatesConcurrently)
{
    const SchemaRegistry& shared = registry();
    json invalid = pair_distribution();
    invalid["maintainers"][0]["email"] = 42;
    invalid.erase("license");

    const auto expected_valid = shared.validate("v2/distribution", pair_distribution());
    const auto expected_invalid = shared.validate("v2/distribution", invalid);
    ASSERT_TRUE(expected_valid.has_value());
    ASSERT_TRUE(expected_invalid.has_value());
    ASSERT_FALSE(expected_invalid->valid());

    constexpr std::size_t kThreads = 8;
    constexpr int kRounds = 25;
    std::vector<int> mismatches(kThreads, 0);
    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&, t] {
                const json valid = pair_distribution();
                for (int round = 0; round < kRounds; ++round) {
                    auto ok = shared.validate("v2/distribution", valid);
                    auto bad = shared.validate("v2/distribution", invalid);
                    if (!ok || !bad || ok->violations != expected_valid->violations
                        || bad->violations != expected_invalid->violations) {
                        ++mismatches[t];
                    }
                }
            });
        }
    }
    for (std::size_t t = 0; t < kThreads; ++t) {
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
    }
}

TEST(SchemaRegistry, DefaultRegistryIsLoadedOnce)
{
    set_default_schema_dir(PGXNMETA_SCHEMA_DIR);

    constexpr std::size_t kThreads = 8;
    std::vector<const SchemaRegistry*> seen(kThreads, nullptr);
    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&seen, t] {
                if (auto loaded = default_registry()) {
                    seen[t] = loaded->get();
                }
            });
        }
    }

    ASSERT_NE(seen.front(), nullptr);
    for (const auto* each : seen) {
        EXPECT_EQ(each, seen.front());
    }

    // Later overrides do not reload.
    set_default_schema_dir("/nonexistent/pgxnmeta/schemas");
    auto again = default_registry();
    ASSERT_TRUE(again.has_value()) << again.error().describe();
    EXPECT_EQ(again->get(), seen.front());
    EXPECT_TRUE((*again)->contains("v2/release"));
}

}  // namespace pgxnmeta::schema::test
