/**
 * @file lexer.hpp
 * @brief Tokenization with symbol resolution
 *
 * Three passes:
 *   1. whitespace split with byte spans, edge punctuation stripped
 *   2. greedy compound resolution (windows of 4 down to 2 words)
 *   3. per-token resolution: exact lookup, then hypervector fuzzy match
 */

#pragma once

#include <grammar/lexicon.hpp>
#include <grammar/symbol_registry.hpp>
#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Glossa {

class VsaOps;
class HypervectorIndex;
struct EngineConfig;

/// Byte range in the input, end exclusive.
struct Span {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
};

struct Resolution {
    enum class Kind {
        Exact,
        Fuzzy,
        Compound,
        Unresolved
    };

    Kind kind = Kind::Unresolved;
    SymbolId symbol_id = 0;
    float similarity = 0.0f;    // Fuzzy only
    size_t word_count = 1;      // Compound only

    static Resolution exact(SymbolId id) { return {Kind::Exact, id, 1.0f, 1}; }
    static Resolution fuzzy(SymbolId id, float sim) { return {Kind::Fuzzy, id, sim, 1}; }
    static Resolution compound(SymbolId id, size_t words) { return {Kind::Compound, id, 1.0f, words}; }
    static Resolution unresolved() { return {}; }

    bool resolved() const { return kind != Kind::Unresolved; }
    std::optional<SymbolId> id() const {
        return resolved() ? std::optional<SymbolId>(symbol_id) : std::nullopt;
    }
};

struct Token {
    std::string surface;        // original text, punctuation stripped
    std::string normalized;     // lowercase, NFC
    Span span;
    Resolution resolution;
    bool semantically_void = false;
};

struct LexerConfig {
    float fuzzy_threshold = 0.6f;
    size_t fuzzy_k = 3;
    size_t fuzzy_min_length = 2;    // in codepoints
    size_t max_compound_window = 4;

    static LexerConfig from(const EngineConfig& config);
};

/**
 * @brief Tokenize and resolve.
 *
 * @param registry Symbol table for compound and exact lookup; may be null
 * @param ops,index Both required for the fuzzy fallback; either may be null
 *
 * Empty input yields no tokens. Index search failures leave the token
 * unresolved and are logged at debug level.
 */
GLOSSA_API std::vector<Token> tokenize(std::string_view input,
                                       const SymbolRegistry* registry,
                                       const VsaOps* ops,
                                       const HypervectorIndex* index,
                                       const Lexicon& lexicon,
                                       const LexerConfig& config = LexerConfig());

/**
 * @brief Locate a relational pattern with at least one token on each side.
 *
 * @return (subject_end, object_start) token indices
 */
GLOSSA_API std::optional<std::pair<size_t, size_t>> find_relational_pattern(const std::vector<Token>& tokens,
                                                                            const RelationalPattern& pattern);

} // namespace Glossa
