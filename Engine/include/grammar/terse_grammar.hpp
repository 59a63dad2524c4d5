/**
 * @file terse_grammar.hpp
 * @brief Dense arrow notation
 *
 * Triple     -> "Dog → is-a → Mammal [0.95]"
 * Gap        -> "? Dog: no habitat data"
 * Similarity -> "Dog ~ Wolf (0.87)"
 *
 * parse() reads its own arrow notation back before falling through to the
 * prose parser.
 */

#pragma once

#include <grammar/concrete_grammar.hpp>

namespace Glossa {

class GLOSSA_API TerseGrammar : public ConcreteGrammar {
public:
    std::string name() const override { return "terse"; }
    std::string description() const override {
        return "Minimal, symbol-heavy notation optimized for information density";
    }

    std::string linearize(const SemanticTree& tree, const LinContext& ctx) const override;

    /**
     * @throws Incomplete for arrow notation with an empty or missing slot ("Dog → is-a →")
     */
    SemanticTree parse(std::string_view input, std::optional<Category> expected,
                       const ParseContext& ctx) const override;

    const std::vector<Category>& supported_categories() const override;
};

/// "ext", "graph", "vsa:0.87", ...
GLOSSA_API std::string terse_provenance(const ProvenanceTag& tag);

} // namespace Glossa
