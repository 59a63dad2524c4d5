/**
 * @file narrative_grammar.hpp
 * @brief Flowing prose with cycling transitions
 *
 * Triple     -> "Furthermore, Dog is a Mammal, with high confidence."
 * Gap        -> "An open question remains: regarding Dog, no habitat data."
 * Similarity -> "Dog shares a close resemblance to Wolf."
 *
 * The grammar owns a transition counter that advances on every statement and
 * resets at each section. Linearizing the same tree twice can therefore give
 * different text; that is intended. The counter is atomic, so concurrent
 * callers interleave transitions but never race.
 */

#pragma once

#include <grammar/concrete_grammar.hpp>
#include <atomic>

namespace Glossa {

class GLOSSA_API NarrativeGrammar : public ConcreteGrammar {
public:
    NarrativeGrammar() = default;

    std::string name() const override { return "narrative"; }
    std::string description() const override {
        return "Flowing, story-like prose with varied transitions for interactive sessions";
    }

    std::string linearize(const SemanticTree& tree, const LinContext& ctx) const override;
    const std::vector<Category>& supported_categories() const override;

    /// Opener for the next statement; advances the counter.
    const char* next_transition() const;
    /// Opener for a gap; reads the counter without advancing it.
    const char* next_gap_opener() const;
    void reset_transitions() const { transition_counter_.store(0, std::memory_order_relaxed); }

private:
    mutable std::atomic<size_t> transition_counter_{0};
};

/// "drawn from source material" and friends.
GLOSSA_API std::string narrative_provenance(const ProvenanceTag& tag);

/// "with high confidence" .. "speculatively"
GLOSSA_API const char* confidence_qualifier(float confidence);

/// "a striking resemblance" .. "a faint resemblance"
GLOSSA_API const char* similarity_strength(float score);

} // namespace Glossa
