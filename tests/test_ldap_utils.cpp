/**
 * @file test_ldap_utils.cpp
 * @brief Unit tests for filter/DN escaping, DN explosion and string helpers
 */

#include <gtest/gtest.h>
#include <adldap/utils/ldap_utils.h>
#include <adldap/utils/string_utils.h>

using namespace adldap::utils;

// ============================================================================
// escapeFilterValue
// ============================================================================

TEST(EscapeFilterValueTest, Metacharacters) {
    EXPECT_EQ(escapeFilterValue("admin*)(uid=*"), R"(admin\2a\29\28uid=\2a)");
    EXPECT_EQ(escapeFilterValue("C:\\temp"), R"(C:\5ctemp)");
}

TEST(EscapeFilterValueTest, ControlCharacters) {
    EXPECT_EQ(escapeFilterValue(std::string("a\0b", 3)), R"(a\00b)");
    EXPECT_EQ(escapeFilterValue("line\nbreak"), R"(line\0abreak)");
    EXPECT_EQ(escapeFilterValue("\x7f"), R"(\7f)");
}

TEST(EscapeFilterValueTest, PlainAndUtf8Untouched) {
    EXPECT_EQ(escapeFilterValue("John Doe"), "John Doe");
    EXPECT_EQ(escapeFilterValue("Jos\xc3\xa9"), "Jos\xc3\xa9");
    EXPECT_EQ(escapeFilterValue(""), "");
}

// ============================================================================
// escapeDnComponent
// ============================================================================

TEST(EscapeDnComponentTest, SpecialCharacters) {
    EXPECT_EQ(escapeDnComponent("Doe, John"), R"(Doe\, John)");
    EXPECT_EQ(escapeDnComponent("a+b=c"), R"(a\+b\=c)");
}

TEST(EscapeDnComponentTest, LeadingAndTrailing) {
    EXPECT_EQ(escapeDnComponent(" Leading"), R"(\ Leading)");
    EXPECT_EQ(escapeDnComponent("#hash"), R"(\#hash)");
    EXPECT_EQ(escapeDnComponent("Trailing "), R"(Trailing\ )");
}

// ============================================================================
// explodeDn
// ============================================================================

TEST(ExplodeDnTest, RemovesAttributePrefixes) {
    auto parts = explodeDn("CN=Group,CN=Schema,CN=Configuration,DC=corp,DC=local");

    ASSERT_EQ(parts.size(), 5u);
    EXPECT_EQ(parts[0], "Group");
    EXPECT_EQ(parts[1], "Schema");
    EXPECT_EQ(parts[4], "local");
}

TEST(ExplodeDnTest, KeepsAttributePrefixes) {
    auto parts = explodeDn("CN=Group,DC=corp", false);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "CN=Group");
    EXPECT_EQ(parts[1], "DC=corp");
}

TEST(ExplodeDnTest, EscapedComma) {
    auto parts = explodeDn(R"(CN=Doe\, John,OU=Users,DC=corp)");

    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "Doe, John");
    EXPECT_EQ(parts[1], "Users");
}

TEST(ExplodeDnTest, HexEscapedComma) {
    auto parts = explodeDn(R"(CN=Doe\2C John,DC=corp)");

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "Doe, John");
}

TEST(ExplodeDnTest, WhitespaceAroundComponents) {
    auto parts = explodeDn("CN=A , OU = B");

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "A");
    EXPECT_EQ(parts[1], "B");
}

TEST(ExplodeDnTest, Empty) {
    EXPECT_TRUE(explodeDn("").empty());
    EXPECT_TRUE(explodeDn("   ").empty());
}

// ============================================================================
// String utilities
// ============================================================================

TEST(StringUtilsTest, ToLowerAndIequals) {
    EXPECT_EQ(toLower("sAMAccountName"), "samaccountname");
    EXPECT_TRUE(iequals("objectCategory", "OBJECTCATEGORY"));
    EXPECT_FALSE(iequals("cn", "cn2"));
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  value \t"), "value");
    EXPECT_EQ(trim("   "), "");
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = split("cn,mail,", ',');

    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "cn");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(split("", ',').size(), 1u);
    EXPECT_EQ(join({"OU=a", "OU=b"}, ","), "OU=a,OU=b");
}
