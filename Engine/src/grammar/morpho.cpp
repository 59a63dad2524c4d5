/**
 * @file morpho.cpp
 */

#include <grammar/morpho.hpp>
#include <utils/unicode.hpp>

#include <array>
#include <utility>

namespace Glossa {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 19> kPredicatePhrases = {{
    {"is-a", "is a"},
    {"has-a", "has"},
    {"part-of", "is part of"},
    {"contains", "contains"},
    {"located-in", "is located in"},
    {"causes", "causes"},
    {"similar-to", "is similar to"},
    {"composed-of", "is composed of"},
    {"depends-on", "depends on"},
    {"implements", "implements"},
    {"defines-fn", "defines function"},
    {"defines-struct", "defines struct"},
    {"defines-enum", "defines enum"},
    {"defines-type", "defines type"},
    {"defines-mod", "defines module"},
    {"contains-mod", "contains module"},
    {"defined-in", "is defined in"},
    {"has-method", "has method"},
    {"has-variant", "has variant"},
}};

constexpr std::array<std::pair<const char*, const char*>, 7> kIrregularPlurals = {{
    {"child", "children"},
    {"person", "people"},
    {"mouse", "mice"},
    {"datum", "data"},
    {"index", "indices"},
    {"vertex", "vertices"},
    {"matrix", "matrices"},
}};

bool is_vowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

std::string match_case(std::string_view original, const char* replacement) {
    std::u32string cps = utf8_to_utf32(original);
    if (!cps.empty() && to_lower(cps[0]) != cps[0]) return capitalize(replacement);
    return replacement;
}

} // namespace

const char* indefinite_article(std::string_view word) {
    std::string w = to_lower(trim(word));

    // Silent h.
    for (const char* p : {"honest", "hour", "heir", "honor"}) {
        if (starts_with(w, p)) return "an";
    }
    // Consonant y sound.
    for (const char* p : {"uni", "use", "user", "util"}) {
        if (starts_with(w, p)) return "a";
    }
    return (!w.empty() && is_vowel(w[0])) ? "an" : "a";
}

std::string humanize_predicate(std::string_view predicate) {
    if (starts_with(predicate, "code:")) return humanize_predicate(predicate.substr(5));

    std::string key(predicate);
    for (char& c : key) {
        if (c == '_') c = '-';
    }
    for (const auto& [label, phrase] : kPredicatePhrases) {
        if (key == label) return phrase;
    }
    for (char& c : key) {
        if (c == '-') c = ' ';
    }
    return key;
}

std::string humanize_predicate(std::string_view predicate, const Lexicon& lexicon) {
    if (lexicon.language() != Language::English && lexicon.language() != Language::Auto) {
        if (auto surface = lexicon.surface_form(predicate)) return *surface;
    }
    return humanize_predicate(predicate);
}

std::string capitalize(std::string_view s) {
    std::u32string cps = utf8_to_utf32(s);
    if (cps.empty()) return {};
    cps[0] = to_upper(cps[0]);
    return utf32_to_utf8(cps);
}

std::string pluralize(std::string_view word) {
    if (word.empty()) return {};
    std::string lower = to_lower(word);

    for (const auto& [singular, plural] : kIrregularPlurals) {
        if (lower == singular) return match_case(word, plural);
    }

    if (ends_with(lower, "s") && !ends_with(lower, "ss")) return std::string(word);

    if (ends_with(lower, "y") && lower.size() >= 2 && !is_vowel(lower[lower.size() - 2])) {
        return std::string(word.substr(0, word.size() - 1)) + "ies";
    }

    if (ends_with(lower, "s") || ends_with(lower, "x") || ends_with(lower, "z") ||
        ends_with(lower, "ch") || ends_with(lower, "sh")) {
        return std::string(word) + "es";
    }
    return std::string(word) + "s";
}

std::string code_quote(std::string_view label) {
    return "`" + std::string(label) + "`";
}

std::string join_list(const std::vector<std::string>& items, std::string_view conjunction) {
    const std::string conj(conjunction);
    switch (items.size()) {
        case 0: return {};
        case 1: return items[0];
        case 2: return items[0] + " " + conj + " " + items[1];
        default: break;
    }
    std::string out;
    for (size_t i = 0; i + 1 < items.size(); ++i) {
        out += items[i];
        out += ", ";
    }
    return out + conj + " " + items.back();
}

} // namespace Glossa
