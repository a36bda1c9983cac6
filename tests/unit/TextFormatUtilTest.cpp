/**
 * @file TextFormatUtilTest.cpp
 * @brief Unit tests for the record format string helpers
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <usergen/util/textFormatUtil.hpp>

using namespace UserGen::util;

// =============================================================================
// trim / splitFields / joinFields
// =============================================================================

TEST(TrimTest, StripsBothEnds) {
    EXPECT_EQ(trim("  Anna \t"), "Anna");
    EXPECT_EQ(trim("\r\n1234:Anna\r"), "1234:Anna");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(TrimTest, StripsUnicodeWhitespace) {
    // NBSP, EM SPACE, IDEOGRAPHIC SPACE, NEL and a C0 separator
    EXPECT_EQ(trim("\xC2\xA0" "Anna\xE2\x80\x83"), "Anna");
    EXPECT_EQ(trim("\xE3\x80\x80\xC2\x85\x1F" "Novak"), "Novak");
    EXPECT_EQ(trim("\xC2\xA0\xE2\x80\x8A"), "");
    // inner whitespace stays
    EXPECT_EQ(trim("Jan\xC2\xA0" "Marek"), "Jan\xC2\xA0" "Marek");
}

TEST(TrimTest, MultiByteLettersAreNotWhitespace) {
    EXPECT_EQ(trim(" \xC5\xA0tefan "), "\xC5\xA0tefan");
    EXPECT_EQ(trim("\xC3\xBD"), "\xC3\xBD");
}

TEST(SplitFieldsTest, SplitsOnEveryColonAndTrims) {
    std::vector<std::string> expected{"1234", "Jozef", "Miloslav", "Hurban", "Legal"};
    EXPECT_EQ(splitFields("1234: Jozef :Miloslav:  Hurban:Legal"), expected);
}

TEST(SplitFieldsTest, KeepsEmptyPieces) {
    std::vector<std::string> expected{"4563", "Jozef", "", "Murgas", "Development"};
    EXPECT_EQ(splitFields("4563:Jozef::Murgas:Development"), expected);

    std::vector<std::string> edges{"", "a", ""};
    EXPECT_EQ(splitFields(":a:"), edges);
}

TEST(SplitFieldsTest, NoSeparator) {
    EXPECT_EQ(splitFields("9999"), std::vector<std::string>{"9999"});
    EXPECT_EQ(splitFields(""), std::vector<std::string>{""});
}

TEST(JoinFieldsTest, JoinsTail) {
    std::vector<std::string> parts{"9999", "Anna", "Marketing", "Sales", "HR", "Global"};
    EXPECT_EQ(joinFields(parts, 4), "HR:Global");
    EXPECT_EQ(joinFields(parts, 5), "Global");
    EXPECT_EQ(joinFields(parts, 6), "");
}

// =============================================================================
// isAllDigits / toLowerAscii
// =============================================================================

TEST(IsAllDigitsTest, AsciiDigitsOnly) {
    EXPECT_TRUE(isAllDigits("1234"));
    EXPECT_TRUE(isAllDigits("0"));
    EXPECT_TRUE(isAllDigits("123456789012345678901234567890"));
    EXPECT_FALSE(isAllDigits(""));
    EXPECT_FALSE(isAllDigits("abc"));
    EXPECT_FALSE(isAllDigits("12a"));
    EXPECT_FALSE(isAllDigits("-12"));
    EXPECT_FALSE(isAllDigits("1 2"));
}

TEST(ToLowerUtf8Test, AsciiAndLatinExtended) {
    EXPECT_EQ(toLowerUtf8("JMHurban"), "jmhurban");
    EXPECT_EQ(toLowerUtf8("abc123"), "abc123");
    // "ŠŤASTNÝ" -> "šťastný"
    EXPECT_EQ(toLowerUtf8("\xC5\xA0\xC5\xA4" "ASTN\xC3\x9D"), "\xC5\xA1\xC5\xA5" "astn\xC3\xBD");
    // Greek and Cyrillic capitals
    EXPECT_EQ(toLowerUtf8("\xCE\xA9\xD0\x96"), "\xCF\x89\xD0\xB6");
}

TEST(ToLowerUtf8Test, IllFormedBytesAreCopied) {
    EXPECT_EQ(toLowerUtf8("A\xFF" "B"), "a\xFF" "b");
    EXPECT_EQ(toLowerUtf8(""), "");
}

// =============================================================================
// UTF-8 helpers
// =============================================================================

TEST(Utf8PrefixTest, CountsCodePoints) {
    EXPECT_EQ(utf8Prefix("hufnagelxtra", 8), "hufnagel");
    EXPECT_EQ(utf8Prefix("abc", 8), "abc");
    EXPECT_EQ(utf8Prefix("", 1), "");
    EXPECT_EQ(utf8Prefix("\xC5\xA0tefan", 1), "\xC5\xA0");
    EXPECT_EQ(utf8Prefix("\xE2\x82\xAC" "x", 1), "\xE2\x82\xAC");
}

TEST(Utf8PrefixTest, TruncatedSequenceDoesNotOverrun) {
    EXPECT_EQ(utf8Prefix("\xE2\x82", 1), "\xE2\x82");
}

TEST(Utf8LengthTest, Counts) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("\xC5\xA0tef"), 4u);
    EXPECT_EQ(utf8Length(""), 0u);
}

TEST(IsValidUtf8Test, AcceptsWellFormed) {
    size_t bad = 0;
    std::string ok = "1234:Jo\xC5\xBE" "ef:\xE2\x82\xAC:\xF0\x9F\x98\x80";
    EXPECT_TRUE(isValidUtf8(ok.data(), ok.size(), bad));
    EXPECT_TRUE(isValidUtf8("", 0, bad));
}

TEST(IsValidUtf8Test, RejectsMalformed) {
    size_t bad = 0;

    std::string latin1 = "Jos\xE9";
    EXPECT_FALSE(isValidUtf8(latin1.data(), latin1.size(), bad));
    EXPECT_EQ(bad, 3u);

    std::string overlong = "\xC0\xAF";
    EXPECT_FALSE(isValidUtf8(overlong.data(), overlong.size(), bad));

    std::string surrogate = "\xED\xA0\x80";
    EXPECT_FALSE(isValidUtf8(surrogate.data(), surrogate.size(), bad));

    std::string tooHigh = "\xF4\x90\x80\x80";
    EXPECT_FALSE(isValidUtf8(tooHigh.data(), tooHigh.size(), bad));

    std::string cut = "ab\xE2\x82";
    EXPECT_FALSE(isValidUtf8(cut.data(), cut.size(), bad));
    EXPECT_EQ(bad, 2u);
}

// =============================================================================
// splitLines
// =============================================================================

TEST(SplitLinesTest, AllTerminators) {
    std::vector<std::string> expected{"a", "b", "c", "d"};
    EXPECT_EQ(splitLines("a\nb\r\nc\rd"), expected);
}

TEST(SplitLinesTest, TrailingTerminatorAddsNoLine) {
    EXPECT_EQ(splitLines("a\n"), std::vector<std::string>{"a"});
    EXPECT_EQ(splitLines("a"), std::vector<std::string>{"a"});
    EXPECT_TRUE(splitLines("").empty());
}

TEST(SplitLinesTest, KeepsEmptyLines) {
    std::vector<std::string> expected{"", "", "   "};
    EXPECT_EQ(splitLines("\n\n   \n"), expected);
}
