/**
 * @file test_merge.cpp
 * @brief Release field merging and merge patch application
 */

#include "pgxnmeta/merge.hpp"
#include "pgxnmeta/schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace pgxnmeta;
using nlohmann::json;

namespace {

constexpr std::string_view kPayload =
    "eyJ1c2VyIjoidGhlb3J5IiwiZGF0ZSI6IjIwMjQtMDktMTNUMTc6MzI6NTVaIiwidXJpIjoiZGlzdC9wYWlyLzAuMS43L3BhaXItMC4x"
    "LjcuemlwIiwiZGlnZXN0cyI6eyJzaGE1MTIiOiJiMzUzYjVhODJiM2I1NGU5NWY0YTI4NTllN2EyYmQwNjQ4YWJjYjM1YTdjMzYxMmIx"
    "MjZjMmM3NTQzOGZjMmY4ZThlZTFmMTllNjFmMzBmYTU0ZDdiYjY0YmNmMjE3ZWQxMjY0NzIyYjQ5N2JjYjYxM2Y4MmQ3ODc1MTUxNWI2"
    "NyJ9fQ";
constexpr std::string_view kSignature =
    "DtEhU3ljbEg8L38VWAfUAqOyKAM6-Xx-F4GawxaepmXFCgfTjDxw5djxLa8ISlSApmWQxfKTUJqPP3-Kg6NU1Q";

const schema::SchemaRegistry& registry()
{
    static const auto loaded = schema::SchemaRegistry::load(PGXNMETA_SCHEMA_DIR);
    if (!loaded) {
        throw std::runtime_error(loaded.error().describe());
    }
    return **loaded;
}

json pair_document()
{
    return json::parse(R"({
        "name": "pair",
        "abstract": "A key/value pair data type",
        "version": "0.1.7",
        "maintainers": [{"name": "theory", "email": "theory@pgxn.org"}],
        "license": "PostgreSQL",
        "contents": {"extensions": {"pair": {"sql": "sql/pair.sql", "control": "pair.control"}}},
        "classifications": {"tags": ["pair", "key value"]},
        "meta-spec": {"version": "2.0.0"}
    })");
}

json certs()
{
    return json{{"pgxn", {{"payload", kPayload}, {"signature", kSignature}}}};
}

Distribution pair()
{
    auto dist = Distribution::try_from(pair_document(), registry());
    if (!dist) {
        throw std::runtime_error(dist.error().describe());
    }
    return std::move(*dist);
}

}  // namespace

TEST(Merge, AddsCertsToDistribution) {
    auto release = merge(pair(), json{{"certs", certs()}}, registry());
    ASSERT_TRUE(release.has_value()) << release.error().describe();
    EXPECT_EQ(release->distribution(), pair());
    EXPECT_TRUE(release->is_signed());
    EXPECT_EQ(release->payload().user, "theory");
}

TEST(Merge, DistributionFieldsWin) {
    auto release = merge(pair(), json{{"certs", certs()}, {"name", "impostor"}, {"version", "9.9.9"}}, registry());
    ASSERT_TRUE(release.has_value()) << release.error().describe();
    EXPECT_EQ(release->distribution().name(), "pair");
    EXPECT_EQ(release->distribution().version().to_string(), "0.1.7");
}

TEST(Merge, ReleaseFieldsCannotAddDistributionProperties) {
    const json fields{
        {"certs", certs()},
        {"description", "injected"},
        {"producer", "someone else"},
        {"resources", {{"homepage", "https://example.com"}}},
        {"x_extra", true},
    };
    auto release = merge(pair(), fields, registry());
    ASSERT_TRUE(release.has_value()) << release.error().describe();
    EXPECT_EQ(release->distribution(), pair());
    EXPECT_FALSE(release->distribution().description().has_value());
    EXPECT_FALSE(release->to_json().contains("x_extra"));
}

TEST(Merge, MissingCertsIsMergeViolation) {
    auto release = merge(pair(), json::object(), registry());
    ASSERT_FALSE(release.has_value());
    EXPECT_EQ(release.error().code, errc::kMergeViolation);
    EXPECT_FALSE(release.error().violations.empty());

    auto unknown = merge(pair(), json{{"certs", certs()}, {"bogus", 1}}, registry());
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, errc::kMergeViolation);
}

TEST(Merge, ReleaseFieldsMustBeObject) {
    auto release = merge(pair(), json::array(), registry());
    ASSERT_FALSE(release.has_value());
    EXPECT_EQ(release.error().code, errc::kMergeViolation);
}

TEST(Merge, InvalidPayloadKeepsItsOwnError) {
    json bad = certs();
    bad["pgxn"]["payload"] = "bm90IGpzb24";
    auto release = merge(pair(), json{{"certs", bad}}, registry());
    ASSERT_FALSE(release.has_value());
    EXPECT_EQ(release.error().code, errc::kPayloadDecodeError);
}

TEST(MergePatches, AppliesDistributionPatchesInOrder) {
    const std::vector<json> docs{
        pair_document(),
        json{{"abstract", "Ordered pairs"}, {"classifications", nullptr}},
        json{{"abstract", "Key/value pairs"}, {"producer", "pgxn_meta"}},
    };
    auto dist = merge_distribution_patches(docs, registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    EXPECT_EQ(dist->abstract(), "Key/value pairs");
    EXPECT_EQ(dist->producer(), "pgxn_meta");
    EXPECT_FALSE(dist->classifications().has_value());
}

TEST(MergePatches, UpgradesLegacyBase) {
    const json legacy = json::parse(R"({
        "name": "pair",
        "abstract": "A key/value pair data type",
        "version": "0.1.7",
        "maintainer": "David E. Wheeler <david@justatheory.com>",
        "license": "postgresql",
        "provides": {"pair": {"file": "sql/pair.sql", "version": "0.1.7"}},
        "meta-spec": {"version": "1.0.0"}
    })");
    const std::vector<json> docs{legacy, json{{"license", "PostgreSQL OR MIT"}}};
    auto dist = merge_distribution_patches(docs, registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    EXPECT_EQ(dist->license(), "PostgreSQL OR MIT");
    EXPECT_EQ(dist->meta_spec().version.major(), 2U);
}

TEST(MergePatches, PatchedDocumentMustStayValid) {
    const std::vector<json> docs{pair_document(), json{{"license", nullptr}}};
    auto dist = merge_distribution_patches(docs, registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kSchemaViolation);

    EXPECT_FALSE(merge_distribution_patches({}, registry()).has_value());

    const std::vector<json> scalar{pair_document(), json("nope")};
    auto rejected = merge_distribution_patches(scalar, registry());
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, errc::kMergeViolation);
}

TEST(MergePatches, AppliesReleasePatches) {
    json base = pair_document();
    base["certs"] = certs();
    const std::vector<json> docs{base, json{{"description", "Adds a pair type"}}};
    auto release = merge_release_patches(docs, registry());
    ASSERT_TRUE(release.has_value()) << release.error().describe();
    EXPECT_EQ(release->distribution().description(), "Adds a pair type");
    EXPECT_TRUE(release->is_signed());
}

TEST(MergePatches, ReleasePatchesNeedCurrentGeneration) {
    json base = pair_document();
    base["meta-spec"]["version"] = "1.0.0";
    const std::vector<json> docs{base, json{{"description", "x"}}};
    auto release = merge_release_patches(docs, registry());
    ASSERT_FALSE(release.has_value());
    EXPECT_EQ(release.error().code, errc::kUnsupportedSpecVersion);
}
