/**
 * @file test_distribution.cpp
 * @brief Generation 2 distribution construction, rules and serialization
 */

#include "pgxnmeta/distribution.hpp"
#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace pgxnmeta::test {

namespace {

using nlohmann::json;

[[nodiscard]] const schema::SchemaRegistry& registry()
{
    static const auto loaded = schema::SchemaRegistry::load(PGXNMETA_SCHEMA_DIR);
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

[[nodiscard]] json full_distribution()
{
    return json::parse(R"({
        "name": "pgtap",
        "abstract": "Unit testing for PostgreSQL",
        "description": "pgTAP is a suite of database functions for writing TAP-emitting unit tests.",
        "version": "1.3.4-beta.1",
        "producer": "pgxn_meta 0.6.0",
        "maintainers": [
            {"name": "David E. Wheeler", "email": "david@justatheory.com", "x_role": "lead"},
            {"name": "pgTAP List", "url": "https://groups.google.com/group/pgtap"}
        ],
        "license": "PostgreSQL OR MIT",
        "contents": {
            "extensions": {
                "pgtap": {"sql": "sql/pgtap.sql", "control": "pgtap.control", "doc": "doc/pgtap.mmd", "tle": true}
            },
            "modules": {
                "pgtap_hook": {"type": "hook", "lib": "src/pgtap_hook", "preload": "server"}
            },
            "apps": {
                "pg_prove": {"bin": "bin/pg_prove", "lang": "perl", "abstract": "Run pgTAP tests"}
            },
            "x_contents": 1
        },
        "classifications": {"tags": ["testing", "tap"], "categories": ["Debugging"]},
        "ignore": ["build/", "*.o"],
        "dependencies": {
            "platforms": ["linux", "darwin-23.5.0-arm64"],
            "postgres": {"version": ">= 12, < 18", "with": ["xml"]},
            "pipeline": "pgxs",
            "packages": {
                "run": {"requires": {"pkg:pgxn/theory/semver": ">= 0.32.1", "pkg:postgres/plpgsql": 0}},
                "test": {"recommends": {"pkg:generic/perl": ">= 5.10"}}
            },
            "variations": [
                {
                    "where": {"platforms": ["darwin"]},
                    "dependencies": {"packages": {"build": {"requires": {"pkg:generic/xcode": "15.0"}}}}
                }
            ]
        },
        "resources": {
            "homepage": "https://pgtap.org/",
            "repository": "https://github.com/theory/pgtap",
            "badges": [{"src": "https://img.shields.io/badge/ci-ok-green", "alt": "CI"}]
        },
        "artifacts": [
            {
                "url": "https://github.com/theory/pgtap/releases/download/v1.3.4/pgtap-1.3.4.zip",
                "type": "source",
                "sha256": "90d98b8bb793cdfb4e4c67d6c03e276b085d173c35026c661aef479fac570275"
            }
        ],
        "meta-spec": {"version": "2.0.0", "url": "https://rfcs.pgxn.org/0003-meta-spec-v2.html"},
        "x_release_notes": ["first", "second"]
    })");
}

[[nodiscard]] bool has_violation_at(const Error& error, std::string_view location)
{
    return std::ranges::any_of(error.violations,
                               [location](const Violation& v) { return v.location == location; });
}

}  // namespace

TEST(Distribution, BuildsMinimalDocument)
{
    auto dist = Distribution::try_from(pair_distribution(), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();

    EXPECT_EQ(dist->name(), "pair");
    EXPECT_EQ(dist->version().to_string(), "0.1.8");
    EXPECT_EQ(dist->license(), "PostgreSQL");
    ASSERT_EQ(dist->maintainers().size(), 1U);
    EXPECT_EQ(dist->maintainers().front().email, "theory@pgxn.org");
    ASSERT_TRUE(dist->contents().extensions.contains("pair"));
    EXPECT_EQ(dist->contents().extensions.at("pair").sql, "sql/pair.sql");
    EXPECT_EQ(dist->meta_spec().version.major(), 2U);
    EXPECT_FALSE(dist->dependencies().has_value());
}

TEST(Distribution, BuildsFullDocument)
{
    auto dist = Distribution::try_from(full_distribution(), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();

    EXPECT_EQ(dist->producer(), "pgxn_meta 0.6.0");
    EXPECT_EQ(dist->maintainers().at(0).custom.at("x_role"), "lead");
    EXPECT_FALSE(dist->maintainers().at(1).email.has_value());

    const auto& module = dist->contents().modules.at("pgtap_hook");
    EXPECT_EQ(module.type, ModuleType::kHook);
    EXPECT_EQ(module.preload, Preload::kServer);
    EXPECT_EQ(dist->contents().extensions.at("pgtap").tle, true);
    EXPECT_TRUE(dist->contents().custom.contains("x_contents"));

    ASSERT_TRUE(dist->dependencies().has_value());
    const auto& deps = *dist->dependencies();
    EXPECT_EQ(deps.pipeline, "pgxs");
    ASSERT_TRUE(deps.postgres.has_value());
    EXPECT_TRUE(deps.postgres->version.satisfies(semver::Version(16, 2, 0)));
    EXPECT_FALSE(deps.postgres->version.satisfies(semver::Version(18, 0, 0)));
    const auto& run = deps.packages->phases.at("run").relations.at("requires");
    EXPECT_EQ(run.size(), 2U);
    ASSERT_EQ(deps.variations.size(), 1U);
    EXPECT_EQ(deps.variations.front().where.platforms, std::vector<std::string>{"darwin"});

    ASSERT_EQ(dist->artifacts().size(), 1U);
    auto digests = dist->artifacts().front().digests();
    ASSERT_TRUE(digests.has_value());
    EXPECT_EQ(digests->strongest(), "sha256");
    EXPECT_TRUE(dist->custom().contains("x_release_notes"));
}

TEST(Distribution, RoundTripsThroughJson)
{
    for (const auto& document : {pair_distribution(), full_distribution()}) {
        auto dist = Distribution::try_from(document, registry());
        ASSERT_TRUE(dist.has_value()) << dist.error().describe();
        const json written = dist->to_json();
        EXPECT_EQ(written, document);

        auto again = Distribution::try_from(written, registry());
        ASSERT_TRUE(again.has_value()) << again.error().describe();
        EXPECT_EQ(*again, *dist);
    }
}

TEST(Distribution, MaintainerNeedsEmailOrUrl)
{
    json doc = pair_distribution();
    doc["maintainers"] = json::array({{{"name", "theory"}}});
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSemanticViolation);
    EXPECT_EQ(dist.error().path, "/maintainers/0");
}

TEST(Distribution, RejectsParentDirectoryPaths)
{
    json doc = pair_distribution();
    doc["contents"]["extensions"]["pair"]["sql"] = "sql/../../etc/passwd";
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSemanticViolation);
    EXPECT_EQ(dist.error().path, "/contents/extensions/pair/sql");
}

TEST(Distribution, RejectsUnknownLicense)
{
    json doc = pair_distribution();
    doc["license"] = "PostgreSQL OR Nonsense-1.0";
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSemanticViolation);
    EXPECT_EQ(dist.error().path, "/license");
}

TEST(Distribution, AcceptsLicenseExceptions)
{
    for (const char* license : {"GPL-2.0-only WITH Linux-syscall-note", "Elastic-2.0"}) {
        json doc = pair_distribution();
        doc["license"] = license;
        auto dist = Distribution::try_from(doc, registry());
        ASSERT_TRUE(dist.has_value()) << dist.error().describe();
        EXPECT_EQ(dist->license(), license);
    }
}

TEST(Distribution, RejectsPgxnPurlWithoutUser)
{
    json doc = pair_distribution();
    doc["dependencies"] = json::parse(R"({"packages": {"run": {"requires": {"pkg:pgxn/semver": "1.0"}}}})");
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSemanticViolation);
    EXPECT_EQ(dist.error().path, "/dependencies/packages/run/requires/pkg:pgxn~1semver");
}

TEST(Distribution, RejectsInvalidVersion)
{
    json doc = pair_distribution();
    doc["version"] = "1.2";
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().path, "/version");
}

TEST(Distribution, SchemaFailureCarriesEveryViolation)
{
    json doc = pair_distribution();
    doc.erase("abstract");
    doc["maintainers"][0]["email"] = "not an email";
    doc["contents"]["extensions"]["pair"].erase("control");
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSchemaViolation);
    EXPECT_GE(dist.error().violations.size(), 3U);
    EXPECT_TRUE(has_violation_at(dist.error(), "/maintainers/0/email"));
    EXPECT_TRUE(has_violation_at(dist.error(), "/contents/extensions/pair"));
}

TEST(Distribution, RejectsNestedVariations)
{
    json doc = pair_distribution();
    doc["dependencies"] = json::parse(R"({
        "variations": [{
            "where": {"platforms": ["linux"]},
            "dependencies": {"variations": [{"where": {"platforms": ["darwin"]}, "dependencies": {"pipeline": "pgxs"}}]}
        }]
    })");
    EXPECT_FALSE(Distribution::try_from(doc, registry()).has_value());
}

TEST(Distribution, RejectsEmptyContents)
{
    json doc = pair_distribution();
    doc["contents"] = json::object();
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSchemaViolation);
}

TEST(Distribution, RejectsOtherGenerations)
{
    json doc = pair_distribution();
    doc["meta-spec"]["version"] = "1.0.0";
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kUnsupportedSpecVersion);

    doc["meta-spec"]["version"] = "3.0.0";
    dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kUnsupportedSpecVersion);

    doc.erase("meta-spec");
    dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kUnsupportedSpecVersion);
}

TEST(Distribution, ArtifactDigestsMustBeHex)
{
    json doc = full_distribution();
    doc["artifacts"][0]["sha256"] = std::string(64, 'z');
    auto dist = Distribution::try_from(doc, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSchemaViolation);
}

}  // namespace pgxnmeta::test
