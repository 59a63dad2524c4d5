/**
 * @file context.hpp
 * @brief What a renderer or parser may consult besides the input itself
 */

#pragma once

#include <grammar/lexer.hpp>
#include <grammar/lexicon.hpp>
#include <grammar/symbol_registry.hpp>
#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Glossa {

class VsaOps;
class HypervectorIndex;

/**
 * @brief Context for tree -> prose.
 */
struct GLOSSA_API LinContext {
    const SymbolRegistry* registry = nullptr;
    const Lexicon* lexicon = nullptr;       // overrides language
    Language language = Language::Auto;

    LinContext() = default;
    explicit LinContext(const SymbolRegistry& r) : registry(&r) {}

    /**
     * @brief Registry label for a grounded leaf, else the label as written
     */
    std::string resolve_label(const std::string& label, std::optional<SymbolId> id) const;

    const Lexicon& active_lexicon() const;
};

/**
 * @brief Context for prose -> tree.
 */
struct GLOSSA_API ParseContext {
    const SymbolRegistry* registry = nullptr;
    const VsaOps* ops = nullptr;
    const HypervectorIndex* index = nullptr;
    const Lexicon* lexicon = nullptr;       // overrides language
    Language language = Language::Auto;
    LexerConfig lexer;

    ParseContext() = default;

    static ParseContext with_engine(const SymbolRegistry& registry, const VsaOps& ops,
                                    const HypervectorIndex& index, Language language = Language::Auto) {
        ParseContext ctx;
        ctx.registry = &registry;
        ctx.ops = &ops;
        ctx.index = &index;
        ctx.language = language;
        return ctx;
    }

    /**
     * @brief Explicit lexicon, else the configured language, else detection
     */
    const Lexicon& lexicon_for(std::string_view input) const;
};

} // namespace Glossa
