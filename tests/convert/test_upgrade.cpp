/**
 * @file test_upgrade.cpp
 * @brief Generation 1 to generation 2 upgrade
 */

#include "pgxnmeta/convert.hpp"
#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace pgxnmeta::convert::test {

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

[[nodiscard]] json legacy_pair()
{
    return json::parse(R"({
        "name": "pair",
        "abstract": "A key/value pair data type",
        "description": "This library contains a single PostgreSQL extension, a key/value pair data type called pair.",
        "version": "0.1.7",
        "maintainer": "David E. Wheeler <david@justatheory.com>",
        "license": "postgresql",
        "provides": {
            "pair": {
                "abstract": "A key/value pair data type",
                "file": "sql/pair.sql",
                "docfile": "doc/pair.md",
                "version": "0.1.7"
            }
        },
        "resources": {"repository": {"web": "https://github.com/theory/kv-pair/"}},
        "generated_by": "David E. Wheeler",
        "meta-spec": {"version": "1.0.0", "url": "https://pgxn.org/meta/spec.txt"},
        "tags": ["ordered pair", "pair", "key value"],
        "no_index": {"file": ["README.md", "test"], "directory": "test"},
        "release_status": "stable",
        "x_origin": "pgxn"
    })");
}

[[nodiscard]] LegacyDistribution legacy(const json& document)
{
    auto dist = LegacyDistribution::try_from(document, registry());
    if (!dist) {
        throw std::runtime_error(dist.error().describe());
    }
    return std::move(*dist);
}

}  // namespace

TEST(Upgrade, PairDistribution)
{
    auto dist = upgrade(legacy(legacy_pair()), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();

    EXPECT_EQ(dist->name(), "pair");
    EXPECT_EQ(dist->version().to_string(), "0.1.7");
    EXPECT_EQ(dist->license(), "PostgreSQL");
    EXPECT_EQ(dist->producer(), "David E. Wheeler");
    EXPECT_TRUE(dist->description().has_value());

    ASSERT_EQ(dist->maintainers().size(), 1U);
    EXPECT_EQ(dist->maintainers().front().name, "David E. Wheeler");
    EXPECT_EQ(dist->maintainers().front().email, "david@justatheory.com");

    const auto& ext = dist->contents().extensions.at("pair");
    EXPECT_EQ(ext.sql, "sql/pair.sql");
    EXPECT_EQ(ext.control, "pair.control");
    EXPECT_EQ(ext.doc, "doc/pair.md");
    EXPECT_EQ(ext.abstract, "A key/value pair data type");

    EXPECT_EQ(dist->meta_spec().version.to_string(), "2.0.0");
    EXPECT_EQ(dist->meta_spec().url, std::string(kMetaSpecV2Url));
    ASSERT_TRUE(dist->classifications().has_value());
    EXPECT_EQ(dist->classifications()->tags.size(), 3U);
    EXPECT_EQ(dist->ignore(), (std::vector<std::string>{"README.md", "test"}));
    EXPECT_TRUE(dist->custom().contains("x_origin"));
}

TEST(Upgrade, DocumentSatisfiesCurrentSchema)
{
    auto document = upgrade_document(legacy(legacy_pair()));
    ASSERT_TRUE(document.has_value());
    auto outcome = registry().validate("v2/distribution", *document);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->valid());
    EXPECT_FALSE(document->contains("resources"));
}

TEST(Upgrade, MultipleMaintainers)
{
    json doc = legacy_pair();
    doc["maintainer"] = json::array({"Josh Berkus <josh@pgexperts.com>", "theory@pgxn.org"});
    auto dist = upgrade(legacy(doc), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    ASSERT_EQ(dist->maintainers().size(), 2U);
    EXPECT_EQ(dist->maintainers()[0].name, "Josh Berkus");
    EXPECT_EQ(dist->maintainers()[1].name, "theory@pgxn.org");
    EXPECT_EQ(dist->maintainers()[1].email, "theory@pgxn.org");
}

TEST(Upgrade, MaintainerWithoutEmailFails)
{
    json doc = legacy_pair();
    doc["maintainer"] = json::array({"theory@pgxn.org", "David E. Wheeler"});
    auto dist = upgrade(legacy(doc), registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kConversionFailure);
    EXPECT_EQ(dist.error().path, "/maintainer/1");
}

TEST(Upgrade, LicenseNames)
{
    EXPECT_EQ(upgrade_license(LegacyLicense{std::string("perl_5")}).value_or(""),
              "Artistic-1.0-Perl OR GPL-1.0-or-later");
    EXPECT_EQ(upgrade_license(LegacyLicense{std::string("bsd")}).value_or(""), "BSD-3-Clause");
    EXPECT_EQ(upgrade_license(LegacyLicense{std::vector<std::string>{"mit", "gpl_3"}}).value_or(""),
              "MIT OR GPL-3.0-only");

    auto restricted = upgrade_license(LegacyLicense{std::string("restricted")});
    ASSERT_FALSE(restricted.has_value());
    EXPECT_EQ(restricted.error().code, errc::kConversionFailure);

    auto listed = upgrade_license(LegacyLicense{std::vector<std::string>{"mit", "open_source"}});
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().path, "/license/1");
}

TEST(Upgrade, LicenseObjects)
{
    using Map = std::map<std::string, std::string>;
    const LegacyLicense postgres = Map{{"PostgreSQL", "https://www.postgresql.org/about/licence"}};
    EXPECT_EQ(upgrade_license(postgres).value_or(""), "PostgreSQL");

    const LegacyLicense diffix = Map{{"restricted", "https://github.com/diffix/pg_diffix/blob/master/LICENSE.md"}};
    EXPECT_EQ(upgrade_license(diffix).value_or(""), "BUSL-1.1");

    auto unknown = upgrade_license(LegacyLicense{Map{{"restricted", "https://example.com/LICENSE"}}});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, errc::kConversionFailure);
    EXPECT_EQ(unknown.error().path, "/license/restricted");
}

TEST(Upgrade, UnconvertibleLicenseFailsUpgrade)
{
    json doc = legacy_pair();
    doc["license"] = "unknown";
    auto dist = upgrade(legacy(doc), registry());
    ASSERT_FALSE(dist.has_value());
    EXPECT_EQ(dist.error().code, errc::kConversionFailure);
    EXPECT_EQ(dist.error().path, "/license");
}

TEST(Upgrade, TagsAreDeduplicatedAndCapped)
{
    json doc = legacy_pair();
    json tags = json::array();
    for (int i = 0; i < 40; ++i) {
        tags.push_back(std::format("tag{:02}", i));
    }
    doc["tags"] = tags;
    auto dist = upgrade(legacy(doc), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    ASSERT_EQ(dist->classifications()->tags.size(), 32U);
    EXPECT_EQ(dist->classifications()->tags.back(), "tag31");
}

TEST(Upgrade, NonCanonicalMetaSpecUrlIsDropped)
{
    json doc = legacy_pair();
    doc["meta-spec"] = json{{"version", "1.0.0"}, {"x_seen", true}};
    auto document = upgrade_document(legacy(doc));
    ASSERT_TRUE(document.has_value());
    EXPECT_FALSE(document->at("meta-spec").contains("url"));
    EXPECT_TRUE(document->at("meta-spec").at("x_seen").get<bool>());
}

TEST(Upgrade, LoadUpgradesLegacyDocuments)
{
    auto dist = Distribution::load(legacy_pair(), registry());
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    EXPECT_EQ(dist->meta_spec().version.major(), 2U);

    auto direct = upgrade(legacy(legacy_pair()), registry());
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(*dist, *direct);
}

TEST(Upgrade, LoadFileReadsFromDisk)
{
    const auto path = std::filesystem::temp_directory_path() / "pgxnmeta_upgrade_META.json";
    {
        std::ofstream out(path);
        out << legacy_pair().dump(2);
    }
    auto dist = Distribution::load_file(path, registry());
    std::filesystem::remove(path);
    ASSERT_TRUE(dist.has_value()) << dist.error().describe();
    EXPECT_EQ(dist->name(), "pair");

    auto missing = Distribution::load_file("/nonexistent/META.json", registry());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, errc::kIOError);
}

}  // namespace pgxnmeta::convert::test
