/**
 * @file unicode.cpp
 * @brief Codepoint classification and case mapping for the five supported scripts
 */

#include <utils/unicode.hpp>

namespace Glossa {

bool is_space(char32_t cp) {
    switch (cp) {
        case U' ': case U'\t': case U'\n': case U'\r': case U'\v': case U'\f':
        case 0x00A0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_digit(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') ||
           (cp >= 0x0660 && cp <= 0x0669) ||   // Arabic-Indic
           (cp >= 0x06F0 && cp <= 0x06F9);     // Extended Arabic-Indic
}

bool is_letter(char32_t cp) {
    if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z')) return true;
    if (cp < 0xC0) return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    if (cp <= 0x24F) return cp != 0xD7 && cp != 0xF7;                 // Latin-1, Extended-A/B
    if (cp >= 0x370 && cp <= 0x3FF) return cp != 0x37E && cp != 0x387; // Greek
    if (cp >= 0x400 && cp <= 0x52F) return !(cp >= 0x482 && cp <= 0x489); // Cyrillic
    if (cp >= 0x531 && cp <= 0x587) return true;                       // Armenian
    if (cp >= 0x5D0 && cp <= 0x5EA) return true;                       // Hebrew
    if (cp >= 0x620 && cp <= 0x64A) return true;                       // Arabic letters
    if (cp >= 0x66E && cp <= 0x6D3) return cp != 0x6D4;
    if (cp >= 0x6FA && cp <= 0x6FF) return true;
    if (cp >= 0x750 && cp <= 0x77F) return true;                       // Arabic Supplement
    if (cp >= 0x8A0 && cp <= 0x8FF) return true;                       // Arabic Extended-A
    if (cp >= 0x1E00 && cp <= 0x1EFF) return true;                     // Latin Extended Additional
    if (cp >= 0x2DE0 && cp <= 0x2DFF) return true;                     // Cyrillic Extended-A
    if (cp >= 0x3040 && cp <= 0x30FF) return true;                     // Kana
    if (cp >= 0x3400 && cp <= 0x9FFF) return true;                     // CJK
    if (cp >= 0xA640 && cp <= 0xA69F) return true;                     // Cyrillic Extended-B
    if (cp >= 0xAC00 && cp <= 0xD7AF) return true;                     // Hangul
    if (cp >= 0xFB50 && cp <= 0xFDFF) return true;                     // Arabic Presentation-A
    if (cp >= 0xFE70 && cp <= 0xFEFF) return cp != 0xFEFF;             // Arabic Presentation-B
    return false;
}

bool is_edge_punctuation(char32_t cp) {
    switch (cp) {
        // ASCII
        case U'.': case U',': case U'!': case U'?': case U';': case U':':
        case U'"': case U'\'': case U'(': case U')': case U'[': case U']':
        case U'{': case U'}': case U'`':
        // Spanish inverted marks, guillemets
        case 0x00BF: case 0x00A1: case 0x00AB: case 0x00BB:
        // Typographic quotes, ellipsis
        case 0x2018: case 0x2019: case 0x201A: case 0x201C: case 0x201D: case 0x201E:
        case 0x2026:
        // Arabic comma, semicolon, question mark, full stop; Urdu full stop
        case 0x060C: case 0x061B: case 0x061F: case 0x06D4:
        // CJK
        case 0x3001: case 0x3002: case 0x300C: case 0x300D: case 0x300E: case 0x300F:
        case 0xFF01: case 0xFF08: case 0xFF09: case 0xFF0C: case 0xFF1A: case 0xFF1B:
        case 0xFF1F:
            return true;
        default:
            return false;
    }
}

bool is_sentence_end(char32_t cp) {
    switch (cp) {
        case U'.': case U'!': case U'?':
        case 0x061F:  // ؟
        case 0x06D4:  // ۔
        case 0x3002:  // 。
        case 0xFF01:  // ！
        case 0xFF1F:  // ？
            return true;
        default:
            return false;
    }
}

char32_t to_lower(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 32;
    if (cp < 0xC0) return cp;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;         // Latin-1
    if (cp >= 0x100 && cp <= 0x17F) {                                   // Latin Extended-A
        if (cp == 0x130) return U'i';
        if (cp == 0x178) return 0xFF;
        bool odd_lower = (cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E);
        if (odd_lower) return (cp % 2 == 1) ? cp + 1 : cp;
        if (cp == 0x138 || cp == 0x149 || cp == 0x17F) return cp;
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 32;      // Greek
    if (cp >= 0x410 && cp <= 0x42F) return cp + 32;                     // Cyrillic А-Я
    if (cp >= 0x400 && cp <= 0x40F) return cp + 80;                     // Cyrillic Ѐ-Џ
    if ((cp >= 0x460 && cp <= 0x481) || (cp >= 0x48A && cp <= 0x4BF) ||
        (cp >= 0x4D0 && cp <= 0x52F)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if (cp >= 0x1E00 && cp <= 0x1EFF && cp % 2 == 0) return cp + 1;     // Latin Extended Additional
    return cp;
}

char32_t to_upper(char32_t cp) {
    if (cp >= U'a' && cp <= U'z') return cp - 32;
    if (cp < 0xE0) return cp;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 32;
    if (cp >= 0x3B1 && cp <= 0x3CB && cp != 0x3C2) return cp - 32;
    if (cp >= 0x430 && cp <= 0x44F) return cp - 32;
    if (cp >= 0x450 && cp <= 0x45F) return cp - 80;
    return cp;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : utf8_to_utf32(s)) append_utf8(out, to_lower(cp));
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return to_lower(a) == to_lower(b);
}

static char32_t compose(char32_t base, char32_t mark) {
    struct Pair { char32_t base; char32_t mark; char32_t composed; };
    static const Pair table[] = {
        {U'a', 0x300, 0xE0}, {U'a', 0x301, 0xE1}, {U'a', 0x302, 0xE2}, {U'a', 0x308, 0xE4},
        {U'c', 0x327, 0xE7},
        {U'e', 0x300, 0xE8}, {U'e', 0x301, 0xE9}, {U'e', 0x302, 0xEA}, {U'e', 0x308, 0xEB},
        {U'i', 0x301, 0xED}, {U'i', 0x302, 0xEE}, {U'i', 0x308, 0xEF},
        {U'n', 0x303, 0xF1},
        {U'o', 0x301, 0xF3}, {U'o', 0x302, 0xF4},
        {U'u', 0x300, 0xF9}, {U'u', 0x301, 0xFA}, {U'u', 0x302, 0xFB}, {U'u', 0x308, 0xFC},
        {U'A', 0x300, 0xC0}, {U'A', 0x301, 0xC1}, {U'C', 0x327, 0xC7},
        {U'E', 0x300, 0xC8}, {U'E', 0x301, 0xC9}, {U'E', 0x302, 0xCA},
        {U'N', 0x303, 0xD1}, {U'O', 0x301, 0xD3}, {U'U', 0x301, 0xDA},
        {0x438, 0x306, 0x439}, {0x418, 0x306, 0x419},   // и + breve -> й
        {0x435, 0x308, 0x451}, {0x415, 0x308, 0x401},   // е + diaeresis -> ё
    };
    for (const auto& p : table) {
        if (p.base == base && p.mark == mark) return p.composed;
    }
    return 0;
}

std::string normalize(std::string_view s) {
    std::u32string in = utf8_to_utf32(s);
    std::u32string out;
    out.reserve(in.size());
    for (char32_t cp : in) {
        if (cp >= 0x300 && cp <= 0x36F && !out.empty()) {
            if (char32_t c = compose(out.back(), cp)) {
                out.back() = c;
                continue;
            }
        }
        if (cp == 0xFEFF || cp == 0x200B) continue;     // BOM, zero-width space
        out.push_back(is_space(cp) ? U' ' : cp);
    }
    return utf32_to_utf8(out);
}

// Byte length of the UTF-8 sequence starting at s[i].
static size_t seq_len(std::string_view s, size_t i) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    size_t len = 1;
    if ((c >> 5) == 0x6) len = 2;
    else if ((c >> 4) == 0xE) len = 3;
    else if ((c >> 3) == 0x1E) len = 4;
    return (i + len <= s.size()) ? len : s.size() - i;
}

// Start offset of the codepoint that ends at byte `end`.
static size_t prev_start(std::string_view s, size_t end) {
    size_t i = end - 1;
    while (i > 0 && (static_cast<uint8_t>(s[i]) >> 6) == 0x2) --i;
    return i;
}

static char32_t decode_at(std::string_view s, size_t i, size_t len) {
    std::u32string one = utf8_to_utf32(s.substr(i, len));
    return one.empty() ? 0 : one.front();
}

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size()) {
        size_t len = seq_len(s, begin);
        if (!is_space(decode_at(s, begin, len))) break;
        begin += len;
    }
    size_t end = s.size();
    while (end > begin) {
        size_t start = prev_start(s, end);
        if (!is_space(decode_at(s, start, end - start))) break;
        end = start;
    }
    return s.substr(begin, end - begin);
}

std::string strip_edge_punctuation(std::string_view s, size_t* leading_bytes) {
    size_t begin = 0;
    while (begin < s.size()) {
        size_t len = seq_len(s, begin);
        if (!is_edge_punctuation(decode_at(s, begin, len))) break;
        begin += len;
    }
    size_t end = s.size();
    while (end > begin) {
        size_t start = prev_start(s, end);
        if (!is_edge_punctuation(decode_at(s, start, end - start))) break;
        end = start;
    }
    if (leading_bytes) *leading_bytes = begin;
    return std::string(s.substr(begin, end - begin));
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    std::string current;
    for (char32_t cp : utf8_to_utf32(s)) {
        if (is_space(cp)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            append_utf8(current, cp);
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

size_t codepoint_length(std::string_view s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<uint8_t>(c) >> 6) != 0x2) ++n;
    }
    return n;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

} // namespace Glossa
