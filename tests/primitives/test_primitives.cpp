/**
 * @file test_primitives.cpp
 * @brief Term, tag, platform, digest, email, URI and timestamp grammars
 */

#include "pgxnmeta/primitives.hpp"

#include <string>

#include <gtest/gtest.h>

namespace pgxnmeta::primitive::test {

TEST(Term, AcceptsIdentifiers)
{
    EXPECT_TRUE(validate_term("pair").has_value());
    EXPECT_TRUE(validate_term("pg_partman").has_value());
    EXPECT_TRUE(validate_term("foo.bar").has_value());
    EXPECT_TRUE(validate_term("ab").has_value());
}

TEST(Term, RejectsForbiddenCharacters)
{
    for (const char* text : {"", "a", "a/b", "a\\b", "a b", "a\nb"}) {
        EXPECT_FALSE(validate_term(text).has_value()) << text;
    }
}

TEST(Tag, AllowsSpacesButNotSlashes)
{
    EXPECT_TRUE(validate_tag("key value").has_value());
    EXPECT_FALSE(validate_tag("a/b").has_value());
    EXPECT_FALSE(validate_tag("x").has_value());
    EXPECT_TRUE(validate_tag(std::string(255, 'a')).has_value());
    EXPECT_FALSE(validate_tag(std::string(256, 'a')).has_value());
}

TEST(Platform, AcceptsOsVersionAndArch)
{
    for (const char* text : {"any", "linux", "linux-amd64", "darwin-23.5", "darwin-23.5-arm64", "musllinux-arm64",
                             "windows-386"}) {
        EXPECT_TRUE(validate_platform(text).has_value()) << text;
    }
}

TEST(Platform, RejectsUnknownComponents)
{
    for (const char* text : {"", "beos", "linux-z80", "any-amd64", "linux-1.-amd64", "linux-amd64-extra",
                             "darwin-23.5-arm64-x"}) {
        EXPECT_FALSE(validate_platform(text).has_value()) << text;
    }
}

TEST(DigestHex, LengthPerAlgorithm)
{
    EXPECT_EQ(digest_hex_length("sha1"), 40U);
    EXPECT_EQ(digest_hex_length("sha256"), 64U);
    EXPECT_EQ(digest_hex_length("sha512"), 128U);
    EXPECT_EQ(digest_hex_length("md5"), 0U);

    EXPECT_TRUE(validate_digest_hex("sha1", std::string(40, 'A')).has_value());
    EXPECT_FALSE(validate_digest_hex("sha1", std::string(64, 'a')).has_value());
    EXPECT_FALSE(validate_digest_hex("sha256", std::string(63, 'a') + "g").has_value());
    EXPECT_FALSE(validate_digest_hex("md5", std::string(32, 'a')).has_value());
}

TEST(Email, Shape)
{
    EXPECT_TRUE(validate_email("theory@pgxn.org").has_value());
    EXPECT_FALSE(validate_email("theory").has_value());
    EXPECT_FALSE(validate_email("@pgxn.org").has_value());
    EXPECT_FALSE(validate_email("the ory@pgxn.org").has_value());
    EXPECT_FALSE(validate_email("theory@pgxn..org").has_value());
}

TEST(Uri, RequiresScheme)
{
    EXPECT_TRUE(validate_uri("https://pgxn.org/dist/pair/").has_value());
    EXPECT_TRUE(validate_uri("mailto:theory@pgxn.org").has_value());
    EXPECT_FALSE(validate_uri("pgxn.org").has_value());
    EXPECT_FALSE(validate_uri("1http://x").has_value());
    EXPECT_FALSE(validate_uri("https://pgxn .org").has_value());
}

TEST(Timestamp, Rfc3339)
{
    EXPECT_TRUE(validate_timestamp("2024-09-13T17:32:55Z").has_value());
    EXPECT_TRUE(validate_timestamp("2024-02-29T00:00:00.123+09:00").has_value());
    EXPECT_FALSE(validate_timestamp("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(validate_timestamp("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(validate_timestamp("2024-09-13 17:32:55Z").has_value());
    EXPECT_FALSE(validate_timestamp("2024-09-13T17:32:55").has_value());
}

}  // namespace pgxnmeta::primitive::test
