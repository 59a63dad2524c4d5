/**
 * @file language_detect.cpp
 * @brief Language detection for mixed-language corpora
 */

#include <grammar/language_detect.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <array>

namespace Glossa {

namespace {

constexpr std::array<const char*, 27> kEnglishMarkers = {
    "the", "is", "are", "was", "were", "with", "from", "this", "that", "and", "for", "not", "but", "have",
    "has", "had", "will", "would", "can", "could", "should", "it", "they", "we", "you", "he", "she"};

constexpr std::array<const char*, 25> kFrenchMarkers = {
    "le", "la", "les", "des", "est", "dans", "avec", "une", "sur", "pour", "pas", "qui", "que",
    "sont", "ont", "fait", "plus", "mais", "aussi", "cette", "ces", "nous", "vous", "ils", "elles"};

constexpr std::array<const char*, 26> kSpanishMarkers = {
    "el", "los", "las", "está", "esta", "tiene", "por", "para", "pero", "también", "tambien", "como", "más",
    "mas", "son", "hay", "ser", "estar", "muy", "todo", "puede", "sobre", "nos", "ese", "esa", "estos"};

constexpr std::array<char32_t, 10> kFrenchDiacritics = {
    U'é', U'è', U'ê', U'ë', U'ç', U'à', U'ù', U'î', U'ô', U'œ'};

constexpr std::array<char32_t, 6> kSpanishDiacritics = {U'ñ', U'á', U'í', U'ó', U'ú', U'ü'};

template <size_t N>
bool marker(const std::array<const char*, N>& list, const std::string& word) {
    return std::any_of(list.begin(), list.end(), [&](const char* m) { return word == m; });
}

template <size_t N>
bool any_char(const std::array<char32_t, N>& list, const std::u32string& text) {
    return std::any_of(list.begin(), list.end(),
                       [&](char32_t c) { return text.find(c) != std::u32string::npos; });
}

bool is_cyrillic(char32_t c) {
    return (c >= 0x0400 && c <= 0x052F) || (c >= 0x2DE0 && c <= 0x2DFF) || (c >= 0xA640 && c <= 0xA69F);
}

bool is_arabic(char32_t c) {
    return (c >= 0x0600 && c <= 0x06FF) || (c >= 0x0750 && c <= 0x077F) || (c >= 0x08A0 && c <= 0x08FF) ||
           (c >= 0xFB50 && c <= 0xFDFF) || (c >= 0xFE70 && c <= 0xFEFF);
}

bool is_latin(char32_t c) {
    return (c >= 0x0041 && c <= 0x024F) || (c >= 0x1E00 && c <= 0x1EFF);
}

/// Trim every non-alphanumeric codepoint from both ends.
std::string trim_non_alnum(const std::string& word) {
    std::u32string cps = utf8_to_utf32(word);
    size_t b = 0, e = cps.size();
    while (b < e && !is_letter(cps[b]) && !is_digit(cps[b])) ++b;
    while (e > b && !is_letter(cps[e - 1]) && !is_digit(cps[e - 1])) --e;
    return utf32_to_utf8(cps.substr(b, e - b));
}

DetectionResult detect_latin(std::string_view text) {
    std::string lower = to_lower(text);
    std::vector<std::string> words = split_words(lower);

    float en = 0.0f, fr = 0.0f, es = 0.0f;
    for (const auto& raw : words) {
        std::string w = trim_non_alnum(raw);
        if (marker(kEnglishMarkers, w)) en += 1.0f;
        if (marker(kFrenchMarkers, w)) fr += 1.0f;
        if (marker(kSpanishMarkers, w)) es += 1.0f;
    }

    std::u32string cps = utf8_to_utf32(lower);
    if (any_char(kFrenchDiacritics, cps)) fr += 2.0f;
    if (any_char(kSpanishDiacritics, cps)) es += 2.0f;
    if (cps.find(U'¿') != std::u32string::npos || cps.find(U'¡') != std::u32string::npos) es += 3.0f;

    const float n = static_cast<float>(std::max<size_t>(words.size(), 1));
    en /= n;
    fr /= n;
    es /= n;

    if (std::max({en, fr, es}) < 0.01f) return {Language::English, 0.4f};

    DetectionResult r;
    if (en >= fr && en >= es) {
        r = {Language::English, 0.60f + std::min(en - std::max(fr, es), 0.20f)};
    } else if (fr >= en && fr >= es) {
        r = {Language::French, 0.60f + std::min(fr - std::max(en, es), 0.20f)};
    } else {
        r = {Language::Spanish, 0.60f + std::min(es - std::max(en, fr), 0.20f)};
    }
    r.confidence = std::min(r.confidence, 0.85f);
    return r;
}

} // namespace

DetectionResult detect_language(std::string_view text) {
    std::string_view trimmed = trim(text);
    if (trimmed.empty()) return {Language::English, 0.0f};

    size_t cyrillic = 0, arabic = 0, latin = 0, letters = 0;
    for (char32_t c : utf8_to_utf32(trimmed)) {
        if (!is_letter(c)) continue;
        ++letters;
        if (is_cyrillic(c)) ++cyrillic;
        else if (is_arabic(c)) ++arabic;
        else if (is_latin(c)) ++latin;
    }

    if (letters == 0) return {Language::English, 0.1f};

    const float total = static_cast<float>(letters);
    const float cyr = static_cast<float>(cyrillic) / total;
    const float ara = static_cast<float>(arabic) / total;
    const float lat = static_cast<float>(latin) / total;

    if (cyr > 0.5f) return {Language::Russian, std::min(0.70f + cyr * 0.25f, 0.95f)};
    if (ara > 0.5f) return {Language::Arabic, std::min(0.70f + ara * 0.25f, 0.95f)};
    if (lat > 0.5f) return detect_latin(trimmed);

    return {Language::English, 0.3f};
}

std::vector<std::pair<std::string, DetectionResult>> detect_per_sentence(std::string_view text) {
    std::vector<std::string> sentences;
    std::u32string current;

    auto flush = [&]() {
        std::string s(trim(utf32_to_utf8(current)));
        if (!s.empty()) sentences.push_back(std::move(s));
        current.clear();
    };

    for (char32_t c : utf8_to_utf32(text)) {
        current.push_back(c);
        if (is_sentence_end(c)) flush();
    }
    flush();

    std::vector<std::pair<std::string, DetectionResult>> out;
    out.reserve(sentences.size());
    for (auto& s : sentences) {
        DetectionResult r = detect_language(s);
        out.emplace_back(std::move(s), r);
    }
    return out;
}

} // namespace Glossa
