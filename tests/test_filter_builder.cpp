/**
 * @file test_filter_builder.cpp
 * @brief Unit tests for the LDAP filter builder
 */

#include <gtest/gtest.h>
#include <adldap/query/builder.h>

using namespace adldap::query;

class FilterBuilderTest : public ::testing::Test {
protected:
    Builder builder_;
};

// ============================================================================
// Single Clauses
// ============================================================================

TEST_F(FilterBuilderTest, Empty_RendersEmptyString) {
    EXPECT_EQ(builder_.render(), "");
    EXPECT_FALSE(builder_.hasPredicates());
}

TEST_F(FilterBuilderTest, Equals_RendersBareClause) {
    builder_.where("cn", "bob");
    EXPECT_EQ(builder_.render(), "(cn=bob)");
}

TEST_F(FilterBuilderTest, Contains_WrapsValueInWildcards) {
    builder_.whereContains("cn", "bob");
    EXPECT_EQ(builder_.render(), "(cn=*bob*)");
}

TEST_F(FilterBuilderTest, StartsWith_TrailingWildcard) {
    builder_.whereStartsWith("cn", "bo");
    EXPECT_EQ(builder_.render(), "(cn=bo*)");
}

TEST_F(FilterBuilderTest, EndsWith_LeadingWildcard) {
    builder_.whereEndsWith("cn", "ob");
    EXPECT_EQ(builder_.render(), "(cn=*ob)");
}

TEST_F(FilterBuilderTest, Has_IgnoresValue) {
    builder_.where("mail", Operator::HAS, "ignored");
    EXPECT_EQ(builder_.render(), "(mail=*)");
}

TEST_F(FilterBuilderTest, AddWildcard_DefaultsToObjectClass) {
    builder_.addWildcard();
    EXPECT_EQ(builder_.render(), "(objectclass=*)");
}

TEST_F(FilterBuilderTest, NotEquals_NegatesClause) {
    builder_.where("cn", Operator::NOT_EQUALS, "bob");
    EXPECT_EQ(builder_.render(), "(!(cn=bob))");
}

TEST_F(FilterBuilderTest, Comparisons_RenderOperators) {
    EXPECT_EQ(Builder::renderClause({"whencreated", Operator::GREATER_THAN_OR_EQUALS, "20240101000000.0Z", Boolean::AND}),
              "(whencreated>=20240101000000.0Z)");
    EXPECT_EQ(Builder::renderClause({"logoncount", Operator::LESS_THAN_OR_EQUALS, "5", Boolean::AND}),
              "(logoncount<=5)");
    EXPECT_EQ(Builder::renderClause({"cn", Operator::APPROXIMATELY_EQUALS, "jon", Boolean::OR}),
              "(cn~=jon)");
}

// ============================================================================
// Grouping
// ============================================================================

TEST_F(FilterBuilderTest, AndChain_SingleGroup) {
    builder_.where("a", "1").where("b", "2").where("c", "3");
    EXPECT_EQ(builder_.render(), "(&(a=1)(b=2)(c=3))");
}

TEST_F(FilterBuilderTest, OrChain_SingleGroup) {
    builder_.where("a", "1").orWhere("b", "2").orWhere("c", "3");
    EXPECT_EQ(builder_.render(), "(|(a=1)(b=2)(c=3))");
}

TEST_F(FilterBuilderTest, OrAfterAnd_WrapsAndGroup) {
    builder_.where("a", "1").where("b", "2").orWhere("c", "3");
    EXPECT_EQ(builder_.render(), "(|(&(a=1)(b=2))(c=3))");
}

TEST_F(FilterBuilderTest, AndAfterOr_WrapsOrGroup) {
    builder_.where("a", "1").orWhere("b", "2").where("c", "3");
    EXPECT_EQ(builder_.render(), "(&(|(a=1)(b=2))(c=3))");
}

TEST_F(FilterBuilderTest, Alternating_NestsInInsertionOrder) {
    builder_.where("a", "1").orWhere("b", "2").where("c", "3").orWhereStartsWith("d", "x");
    EXPECT_EQ(builder_.render(), "(|(&(|(a=1)(b=2))(c=3))(d=x*))");
}

TEST_F(FilterBuilderTest, FirstPredicateBoolean_Ignored) {
    builder_.orWhere("a", "1").where("b", "2");
    EXPECT_EQ(builder_.render(), "(&(a=1)(b=2))");
}

TEST_F(FilterBuilderTest, Render_Idempotent) {
    builder_.where("a", "1").orWhereContains("b", "x(y)").where("c", "3");
    std::string first = builder_.render();
    EXPECT_EQ(builder_.render(), first);
    EXPECT_EQ(builder_.getPredicates().size(), 3u);
}

// ============================================================================
// Escaping
// ============================================================================

TEST_F(FilterBuilderTest, Value_MetacharactersEscaped) {
    builder_.where("cn", "a*b(c)\\d");
    EXPECT_EQ(builder_.render(), R"((cn=a\2ab\28c\29\5cd))");
}

TEST_F(FilterBuilderTest, Value_InjectionAttemptMatchedLiterally) {
    builder_.whereStartsWith("uid", "admin*)(uid=*");
    EXPECT_EQ(builder_.render(), R"((uid=admin\2a\29\28uid=\2a*))");
}

TEST_F(FilterBuilderTest, Value_NulEscaped) {
    builder_.where("cn", std::string("a\0b", 3));
    EXPECT_EQ(builder_.render(), R"((cn=a\00b))");
}

TEST_F(FilterBuilderTest, Field_Escaped) {
    builder_.where("c)n", "x");
    EXPECT_EQ(builder_.render(), R"((c\29n=x))");
}

// ============================================================================
// Select / Clear
// ============================================================================

TEST_F(FilterBuilderTest, Select_DeduplicatesCaseInsensitive) {
    builder_.select(std::vector<std::string>{"cn", "mail", "CN"}).select("Mail").select("sn");

    ASSERT_EQ(builder_.getSelects().size(), 3u);
    EXPECT_EQ(builder_.getSelects()[0], "cn");
    EXPECT_EQ(builder_.getSelects()[1], "mail");
    EXPECT_EQ(builder_.getSelects()[2], "sn");
}

TEST_F(FilterBuilderTest, Clear_RemovesEverything) {
    builder_.where("a", "1").select("cn");
    builder_.clear();

    EXPECT_EQ(builder_.render(), "");
    EXPECT_TRUE(builder_.getSelects().empty());
}

// ============================================================================
// Operator Tokens
// ============================================================================

TEST(OperatorTest, FromString_KnownTokens) {
    EXPECT_EQ(operatorFromString("="), Operator::EQUALS);
    EXPECT_EQ(operatorFromString("!"), Operator::NOT_EQUALS);
    EXPECT_EQ(operatorFromString("*"), Operator::WILDCARD);
    EXPECT_EQ(operatorFromString(">="), Operator::GREATER_THAN_OR_EQUALS);
    EXPECT_EQ(operatorFromString("<="), Operator::LESS_THAN_OR_EQUALS);
    EXPECT_EQ(operatorFromString("~="), Operator::APPROXIMATELY_EQUALS);
    EXPECT_EQ(operatorFromString("starts_with"), Operator::STARTS_WITH);
    EXPECT_EQ(operatorFromString("ENDS_WITH"), Operator::ENDS_WITH);
    EXPECT_EQ(operatorFromString("contains"), Operator::CONTAINS);
    EXPECT_EQ(operatorFromString("has"), Operator::HAS);
}

TEST(OperatorTest, FromString_UnknownToken) {
    EXPECT_FALSE(operatorFromString("like").has_value());
    EXPECT_FALSE(operatorFromString("").has_value());
}

TEST(OperatorTest, ToString_RoundTripsTokens) {
    for (const char* token : {"=", "!", "*", ">=", "<=", "~=", "starts_with", "ends_with", "contains", "has"}) {
        auto op = operatorFromString(token);
        ASSERT_TRUE(op.has_value()) << token;
        EXPECT_EQ(toString(*op), token);
    }
}
