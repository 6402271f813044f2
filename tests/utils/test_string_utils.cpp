/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <bras/utils/string_utils.h>

using namespace bras::utils;

class StringUtilsTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// toLower tests
TEST_F(StringUtilsTest, ToLower_Mixed) {
    EXPECT_EQ(toLower("HeLLo WoRLd"), "hello world");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToLower_WithNumbers) {
    EXPECT_EQ(toLower("TRUE1"), "true1");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\n\t"), "hello");
}

// digitsOnly tests
TEST_F(StringUtilsTest, DigitsOnly_Punctuated) {
    EXPECT_EQ(digitsOnly("984.844.854-39"), "98484485439");
}

TEST_F(StringUtilsTest, DigitsOnly_NoDigits) {
    EXPECT_EQ(digitsOnly("invalid_str"), "");
}

TEST_F(StringUtilsTest, DigitsOnly_KeepsOrder) {
    EXPECT_EQ(digitsOnly("a1b2c3"), "123");
}

TEST_F(StringUtilsTest, DigitsOnly_IgnoresNonAscii) {
    // U+0663 ARABIC-INDIC DIGIT THREE is not an ASCII digit
    EXPECT_EQ(digitsOnly("1\xD9\xA3" "2"), "12");
}

// padLeft tests
TEST_F(StringUtilsTest, PadLeft_Shorter) {
    EXPECT_EQ(padLeft("1678346063", 11), "01678346063");
}

TEST_F(StringUtilsTest, PadLeft_ExactWidth) {
    EXPECT_EQ(padLeft("98484485439", 11), "98484485439");
}

TEST_F(StringUtilsTest, PadLeft_Longer) {
    EXPECT_EQ(padLeft("984844854390", 11), "984844854390");
}

TEST_F(StringUtilsTest, PadLeft_CustomFill) {
    EXPECT_EQ(padLeft("7", 3, ' '), "  7");
}

// allSameChar tests
TEST_F(StringUtilsTest, AllSameChar_Repeated) {
    EXPECT_TRUE(allSameChar("11111111111"));
    EXPECT_TRUE(allSameChar("x"));
}

TEST_F(StringUtilsTest, AllSameChar_Mixed) {
    EXPECT_FALSE(allSameChar("11111111112"));
}

TEST_F(StringUtilsTest, AllSameChar_Empty) {
    EXPECT_FALSE(allSameChar(""));
}
