/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <fdr/utils/string_utils.h>

#include <climits>

using namespace fdr::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_AllUppercase) {
    EXPECT_EQ(toLower("FRONTEND_PORT"), "frontend_port");
}

TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

// toUpper tests
TEST_F(StringUtilsTest, ToUpper_Mixed) {
    EXPECT_EQ(toUpper("openRouter"), "OPENROUTER");
}

TEST_F(StringUtilsTest, ToUpper_WithNumbers) {
    EXPECT_EQ(toUpper("test123"), "TEST123");
}

// trim tests
TEST_F(StringUtilsTest, Trim_LeadingSpaces) {
    EXPECT_EQ(trim("   hello"), "hello");
}

TEST_F(StringUtilsTest, Trim_TrailingSpaces) {
    EXPECT_EQ(trim("hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_Empty) {
    EXPECT_EQ(trim(""), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndCarriageReturn) {
    EXPECT_EQ(trim("\t FRONTEND_PORT=3000\r\n"), "FRONTEND_PORT=3000");
}

// splitFirst tests
TEST_F(StringUtilsTest, SplitFirst_SplitsOnFirstOccurrenceOnly) {
    auto kv = splitFirst("KEY=a=b", '=');
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "KEY");
    EXPECT_EQ(kv->second, "a=b");
}

TEST_F(StringUtilsTest, SplitFirst_EmptyValue) {
    auto kv = splitFirst("KEY=", '=');
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "KEY");
    EXPECT_EQ(kv->second, "");
}

TEST_F(StringUtilsTest, SplitFirst_NoDelimiter) {
    EXPECT_FALSE(splitFirst("KEY", '=').has_value());
}

// startsWith / endsWith tests
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("# comment", "#"));
    EXPECT_FALSE(startsWith("", "#"));
    EXPECT_TRUE(startsWith("abc", ""));
}

TEST_F(StringUtilsTest, EndsWith) {
    EXPECT_TRUE(endsWith("GRAFANA_PORT", "_PORT"));
    EXPECT_FALSE(endsWith("GRAFANA_PORTS", "_PORT"));
    EXPECT_FALSE(endsWith("PORT", "_PORT"));
}

// parseInt tests
TEST_F(StringUtilsTest, ParseInt_Valid) {
    EXPECT_EQ(parseInt("3000"), 3000);
    EXPECT_EQ(parseInt("0"), 0);
}

TEST_F(StringUtilsTest, ParseInt_RejectsSigns) {
    EXPECT_FALSE(parseInt("+3000").has_value());
    EXPECT_FALSE(parseInt("-12").has_value());
    EXPECT_FALSE(parseInt("-").has_value());
}

TEST_F(StringUtilsTest, ParseInt_RejectsTrailingGarbage) {
    EXPECT_FALSE(parseInt("3000abc").has_value());
    EXPECT_FALSE(parseInt("30.5").has_value());
    EXPECT_FALSE(parseInt("3000 ").has_value());
}

TEST_F(StringUtilsTest, ParseInt_RejectsLeadingWhitespace) {
    EXPECT_FALSE(parseInt(" 3000").has_value());
}

TEST_F(StringUtilsTest, ParseInt_RejectsEmpty) {
    EXPECT_FALSE(parseInt("").has_value());
}

TEST_F(StringUtilsTest, ParseInt_RejectsOutOfRange) {
    EXPECT_FALSE(parseInt("99999999999999999999").has_value());
    EXPECT_EQ(parseInt(std::to_string(INT_MAX)), INT_MAX);
}
