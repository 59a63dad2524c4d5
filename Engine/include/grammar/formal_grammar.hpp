/**
 * @file formal_grammar.hpp
 * @brief Academic register with explicit confidence and provenance
 *
 * Triple     -> "The entity 'Dog' is a 'Mammal' (confidence: 0.95)."
 * Gap        -> "Knowledge gap identified for 'Dog': no habitat data available."
 * Similarity -> "'Dog' exhibits similarity to 'Wolf' (score: 0.87)."
 */

#pragma once

#include <grammar/concrete_grammar.hpp>

namespace Glossa {

class GLOSSA_API FormalGrammar : public ConcreteGrammar {
public:
    std::string name() const override { return "formal"; }
    std::string description() const override {
        return "Precise, structured, academic-style output with explicit confidence and provenance";
    }

    std::string linearize(const SemanticTree& tree, const LinContext& ctx) const override;
    const std::vector<Category>& supported_categories() const override;
};

/// "source: graph inference" and friends.
GLOSSA_API std::string formal_provenance(const ProvenanceTag& tag);

} // namespace Glossa
