/**
 * @file test_path.cpp
 * @brief Relative path and glob safety
 */

#include "pgxnmeta/primitives.hpp"

#include <gtest/gtest.h>

using namespace pgxnmeta::primitive;

TEST(Path, AcceptsRelativePaths) {
    EXPECT_TRUE(validate_path("sql/pair.sql").has_value());
    EXPECT_TRUE(validate_path("README.md").has_value());
    EXPECT_TRUE(validate_path("./README").has_value());
    EXPECT_TRUE(validate_path("doc/").has_value());
}

TEST(Path, RejectsParentSegments) {
    EXPECT_FALSE(validate_path("a/../b").has_value());
    EXPECT_FALSE(validate_path("../a").has_value());
    EXPECT_FALSE(validate_path("a/..").has_value());
}

TEST(Path, RejectsCurrentDirAfterFirstSegment) {
    EXPECT_FALSE(validate_path("a/./b").has_value());
    EXPECT_FALSE(validate_path("a/.").has_value());
}

TEST(Path, RejectsAbsoluteAndMalformed) {
    EXPECT_FALSE(validate_path("/etc/passwd").has_value());
    EXPECT_FALSE(validate_path("").has_value());
    EXPECT_FALSE(validate_path("a\\b").has_value());
    EXPECT_FALSE(validate_path("a//b").has_value());
    EXPECT_FALSE(validate_path("a\tb").has_value());
}

TEST(Path, ErrorNamesTheReason) {
    auto result = validate_path("a/../b");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, pgxnmeta::errc::kSemanticViolation);
    EXPECT_NE(result.error().message.find("parent"), std::string::npos);
}

TEST(Glob, AcceptsWildcards) {
    EXPECT_TRUE(validate_glob("*.o").has_value());
    EXPECT_TRUE(validate_glob("**/*.sql").has_value());
    EXPECT_TRUE(validate_glob("test/[a-z]*").has_value());
    EXPECT_TRUE(validate_glob("/build").has_value());
    EXPECT_TRUE(validate_glob("./*.md").has_value());
}

TEST(Glob, AppliesPathRulesToLiteralSegments) {
    EXPECT_FALSE(validate_glob("../*.sql").has_value());
    EXPECT_FALSE(validate_glob("src/./*.c").has_value());
    EXPECT_FALSE(validate_glob("/").has_value());
    EXPECT_FALSE(validate_glob("").has_value());
}
