#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace Glossa {

/**
 * @brief Thread-safe UTF-8 to UTF-32 conversion.
 *
 * Invalid start bytes are skipped; truncated sequences end early.
 */
inline std::u32string utf8_to_utf32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; } // Invalid start byte

        for (size_t j = 1; j < len; ++j) {
            if (i + j >= s.size()) { len = j; break; }
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { len = j; break; } // Unexpected byte
            cp = (cp << 6) | (cc & 0x3F);
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

/**
 * @brief Append one codepoint to a UTF-8 string.
 */
inline void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/**
 * @brief Thread-safe UTF-32 to UTF-8 conversion.
 */
inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) append_utf8(out, cp);
    return out;
}

// =============================================================================
// Character classes used by the lexer and language detector
// =============================================================================

bool is_space(char32_t cp);
bool is_letter(char32_t cp);
bool is_digit(char32_t cp);

/**
 * @brief Punctuation stripped from token edges: ASCII, Arabic, CJK,
 *        Spanish inverted marks and typographic quotes.
 */
bool is_edge_punctuation(char32_t cp);

/**
 * @brief Sentence terminators: . ! ? and their Arabic, Urdu and CJK forms.
 */
bool is_sentence_end(char32_t cp);

char32_t to_lower(char32_t cp);
char32_t to_upper(char32_t cp);

// =============================================================================
// String helpers (UTF-8 in, UTF-8 out)
// =============================================================================

/**
 * @brief Lowercase Latin, Greek and Cyrillic letters; other scripts pass through.
 */
std::string to_lower(std::string_view s);

/**
 * @brief Case-insensitive equality under to_lower().
 */
bool iequals(std::string_view a, std::string_view b);

/**
 * @brief Compose the combining sequences that occur in the supported
 *        languages (Latin accents, Cyrillic й/ё) and map exotic spaces to ' '.
 */
std::string normalize(std::string_view s);

/**
 * @brief Trim Unicode whitespace from both ends.
 */
std::string_view trim(std::string_view s);

/**
 * @brief Strip edge punctuation.
 * @param s Input word
 * @param leading_bytes Receives the number of bytes removed from the front
 */
std::string strip_edge_punctuation(std::string_view s, size_t* leading_bytes = nullptr);

/**
 * @brief Split on Unicode whitespace.
 */
std::vector<std::string> split_words(std::string_view s);

/**
 * @brief Number of codepoints in a UTF-8 string.
 */
size_t codepoint_length(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

} // namespace Glossa
