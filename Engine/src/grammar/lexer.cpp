/**
 * @file lexer.cpp
 * @brief Tokenizer and resolution passes
 */

#include <grammar/lexer.hpp>
#include <grammar/error.hpp>
#include <utils/config.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <vsa/encode.hpp>
#include <vsa/hypervector.hpp>
#include <vsa/item_memory.hpp>

#include <algorithm>

namespace Glossa {

namespace {

size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

/// Whitespace-delimited words with their byte spans in the input.
std::vector<std::pair<std::string_view, Span>> split_with_spans(std::string_view input) {
    std::vector<std::pair<std::string_view, Span>> words;
    size_t i = 0;
    size_t word_start = std::string_view::npos;

    while (i < input.size()) {
        size_t len = std::min(utf8_length(static_cast<unsigned char>(input[i])), input.size() - i);
        std::u32string cp = utf8_to_utf32(input.substr(i, len));
        bool space = !cp.empty() && is_space(cp[0]);

        if (space && word_start != std::string_view::npos) {
            words.push_back({input.substr(word_start, i - word_start), {word_start, i}});
            word_start = std::string_view::npos;
        } else if (!space && word_start == std::string_view::npos) {
            word_start = i;
        }
        i += len;
    }
    if (word_start != std::string_view::npos) {
        words.push_back({input.substr(word_start), {word_start, input.size()}});
    }
    return words;
}

void resolve_compounds(std::vector<Token>& tokens, const SymbolRegistry& registry, size_t max_window) {
    const size_t top = std::min(max_window, tokens.size());

    for (size_t window = top; window >= 2; --window) {
        for (size_t i = 0; i + window <= tokens.size(); ++i) {
            std::vector<std::string> normalized, surface;
            for (size_t j = i; j < i + window; ++j) {
                normalized.push_back(tokens[j].normalized);
                surface.push_back(tokens[j].surface);
            }
            std::string compound = join(normalized, " ");
            auto id = registry.lookup(compound);
            if (!id) continue;

            Token merged;
            merged.surface = join(surface, " ");
            merged.normalized = std::move(compound);
            merged.span = {tokens[i].span.start, tokens[i + window - 1].span.end};
            merged.resolution = Resolution::compound(*id, window);
            merged.semantically_void = false;

            tokens[i] = std::move(merged);
            tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                         tokens.begin() + static_cast<std::ptrdiff_t>(i + window));
        }
    }
}

void resolve_fuzzy(Token& token, const VsaOps& ops, const HypervectorIndex& index, const LexerConfig& config) {
    if (codepoint_length(token.normalized) < config.fuzzy_min_length) return;

    HyperVec query = encode_token(ops, token.normalized);
    std::vector<SearchResult> results;
    try {
        results = index.search(query, config.fuzzy_k);
    } catch (const VsaError& e) {
        Logger::debug("fuzzy lookup skipped for \"" + token.normalized + "\": " + e.what());
        return;
    }

    if (!results.empty() && results.front().similarity > config.fuzzy_threshold) {
        token.resolution = Resolution::fuzzy(results.front().symbol_id, results.front().similarity);
    }
}

} // namespace

LexerConfig LexerConfig::from(const EngineConfig& config) {
    LexerConfig lc;
    lc.fuzzy_threshold = config.fuzzy_threshold;
    lc.fuzzy_k = config.fuzzy_k;
    lc.fuzzy_min_length = config.fuzzy_min_length;
    return lc;
}

std::vector<Token> tokenize(std::string_view input,
                            const SymbolRegistry* registry,
                            const VsaOps* ops,
                            const HypervectorIndex* index,
                            const Lexicon& lexicon,
                            const LexerConfig& config) {
    std::vector<Token> tokens;

    // Pass 1
    for (const auto& [word, span] : split_with_spans(input)) {
        // Strip on the raw bytes first so the span covers only the surface.
        size_t leading = 0;
        std::string raw = strip_edge_punctuation(word, &leading);
        std::string clean = strip_edge_punctuation(normalize(raw));
        if (clean.empty()) continue;

        Token t;
        t.normalized = to_lower(clean);
        t.surface = std::move(clean);
        t.span = {span.start + leading, span.start + leading + raw.size()};
        t.semantically_void = lexicon.is_void(t.normalized);
        tokens.push_back(std::move(t));
    }
    if (tokens.empty()) return tokens;

    // Pass 2
    if (registry && config.max_compound_window >= 2) {
        resolve_compounds(tokens, *registry, config.max_compound_window);
    }

    // Pass 3
    for (auto& token : tokens) {
        if (token.resolution.resolved() || token.semantically_void) continue;
        if (registry) {
            if (auto id = registry->lookup(token.normalized)) {
                token.resolution = Resolution::exact(*id);
                continue;
            }
        }
        if (ops && index) resolve_fuzzy(token, *ops, *index, config);
    }

    return tokens;
}

std::optional<std::pair<size_t, size_t>> find_relational_pattern(const std::vector<Token>& tokens,
                                                                 const RelationalPattern& pattern) {
    const size_t plen = pattern.words.size();
    if (plen == 0 || tokens.size() < plen + 2) return std::nullopt;

    for (size_t i = 1; i + plen < tokens.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < plen; ++j) {
            if (tokens[i + j].normalized != pattern.words[j]) {
                match = false;
                break;
            }
        }
        if (match) return std::make_pair(i, i + plen);
    }
    return std::nullopt;
}

} // namespace Glossa
