/**
 * @file test_unicode.cpp
 * @brief Unit tests for the UTF-8 helpers shared by the lexer and detector
 */

#include <gtest/gtest.h>
#include <utils/unicode.hpp>
#include <utils/format_utils.hpp>
#include <string>
#include <vector>

using namespace Glossa;

// ============================================================================
// Conversion
// ============================================================================

TEST(UnicodeTest, Utf8RoundTrip) {
    std::string text = "Moscú Москва موسكو 😀";
    EXPECT_EQ(utf32_to_utf8(utf8_to_utf32(text)), text);
}

TEST(UnicodeTest, InvalidStartByteSkipped) {
    std::string bad = "a\xFF" "b";
    EXPECT_EQ(utf8_to_utf32(bad), U"ab");
}

TEST(UnicodeTest, CodepointLength) {
    EXPECT_EQ(codepoint_length("dog"), 3u);
    EXPECT_EQ(codepoint_length("Москва"), 6u);
    EXPECT_EQ(codepoint_length(""), 0u);
}

// ============================================================================
// Case and normalization
// ============================================================================

TEST(UnicodeTest, LowercaseAcrossScripts) {
    EXPECT_EQ(to_lower("DOG"), "dog");
    EXPECT_EQ(to_lower("МОСКВА"), "москва");
    EXPECT_EQ(to_lower("ÉGYPTE"), "égypte");
    // Arabic has no case.
    EXPECT_EQ(to_lower("موسكو"), "موسكو");
}

TEST(UnicodeTest, CaseInsensitiveEquality) {
    EXPECT_TRUE(iequals("Moscow", "MOSCOW"));
    EXPECT_TRUE(iequals("Москва", "москва"));
    EXPECT_FALSE(iequals("Moscow", "Moscou"));
}

TEST(UnicodeTest, NormalizeComposesCombiningMarks) {
    // e + combining acute -> é
    EXPECT_EQ(normalize("caf\x65\xCC\x81"), "café");
    // и + combining breve -> й
    EXPECT_EQ(normalize("\xD0\xB8\xCC\x86"), "й");
}

TEST(UnicodeTest, NormalizeMapsExoticSpaces) {
    EXPECT_EQ(normalize("a\xC2\xA0" "b"), "a b");
    EXPECT_EQ(normalize("\xEF\xBB\xBF" "dog"), "dog");
}

// ============================================================================
// Trimming and splitting
// ============================================================================

TEST(UnicodeTest, TrimUnicodeWhitespace) {
    EXPECT_EQ(trim("  dog \t\n"), "dog");
    EXPECT_EQ(trim("\xE3\x80\x80" "dog" "\xE3\x80\x80"), "dog");
    EXPECT_EQ(trim("   "), "");
}

TEST(UnicodeTest, StripEdgePunctuation) {
    size_t leading = 0;
    EXPECT_EQ(strip_edge_punctuation("¿Qué?", &leading), "Qué");
    EXPECT_EQ(leading, 2u);
    EXPECT_EQ(strip_edge_punctuation("«Paris»"), "Paris");
    EXPECT_EQ(strip_edge_punctuation("dog."), "dog");
    EXPECT_EQ(strip_edge_punctuation("..."), "");
}

TEST(UnicodeTest, SplitWords) {
    std::vector<std::string> words = split_words("  Dogs are\tmammals\n");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "Dogs");
    EXPECT_EQ(words[2], "mammals");
}

TEST(UnicodeTest, AffixesAndJoin) {
    EXPECT_TRUE(starts_with("discourse:detail", "discourse:"));
    EXPECT_FALSE(starts_with("dis", "discourse:"));
    EXPECT_TRUE(ends_with("what?", "?"));
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ", "), "");
}

TEST(UnicodeTest, SentenceTerminators) {
    EXPECT_TRUE(is_sentence_end(U'.'));
    EXPECT_TRUE(is_sentence_end(0x061F));
    EXPECT_FALSE(is_sentence_end(U','));
}

// ============================================================================
// Number formatting
// ============================================================================

TEST(FormatUtilsTest, FixedAndPercent) {
    EXPECT_EQ(format_fixed(0.95, 2), "0.95");
    EXPECT_EQ(format_fixed(2.0, 1), "2.0");
    EXPECT_EQ(format_percent(0.87), "87%");
}
