/**
 * @file test_narrative_grammar.cpp
 * @brief Unit tests for the narrative register and its transition counter
 */

#include <gtest/gtest.h>
#include <grammar/narrative_grammar.hpp>
#include <grammar/error.hpp>

using namespace Glossa;

namespace {

SemanticTree is_a(const std::string& s, const std::string& o) {
    return SemanticTree::triple(SemanticTree::entity(s), SemanticTree::relation("is-a"), SemanticTree::entity(o));
}

class NarrativeGrammarTest : public ::testing::Test {
protected:
    std::string render(const SemanticTree& tree) const { return grammar.linearize(tree, ctx); }

    NarrativeGrammar grammar;
    LinContext ctx;
};

} // namespace

TEST_F(NarrativeGrammarTest, TransitionsCycle) {
    EXPECT_EQ(render(is_a("Dog", "Mammal")), "Dog is a Mammal.");
    EXPECT_EQ(render(is_a("Cat", "Mammal")), "Furthermore, Cat is a Mammal.");
    EXPECT_EQ(render(is_a("Whale", "Mammal")), "Notably, Whale is a Mammal.");

    grammar.reset_transitions();
    EXPECT_EQ(render(is_a("Dog", "Mammal")), "Dog is a Mammal.");
}

TEST_F(NarrativeGrammarTest, ConfidenceQualifiers) {
    EXPECT_EQ(render(SemanticTree::with_confidence(is_a("Dog", "Mammal"), 0.95f)),
              "Dog is a Mammal, with high confidence.");
    EXPECT_STREQ(confidence_qualifier(0.8f), "with moderate confidence");
    EXPECT_STREQ(confidence_qualifier(0.6f), "tentatively");
    EXPECT_STREQ(confidence_qualifier(0.3f), "speculatively");
}

TEST_F(NarrativeGrammarTest, ProvenancePhrases) {
    EXPECT_EQ(render(SemanticTree::with_provenance(is_a("Dog", "Mammal"),
                                                   ProvenanceTag(ProvenanceTag::Kind::Extracted))),
              "Dog is a Mammal (drawn from source material).");
    EXPECT_EQ(narrative_provenance(ProvenanceTag::vsa_inferred(0.87f)), "suggested by vector similarity at 87%");
    EXPECT_EQ(narrative_provenance(ProvenanceTag(ProvenanceTag::Kind::UserAsserted)), "as stated by the user");
}

TEST_F(NarrativeGrammarTest, SimilarityStrength) {
    EXPECT_EQ(render(SemanticTree::similarity(SemanticTree::entity("Dog"), SemanticTree::entity("Wolf"), 0.95f)),
              "Dog shares a striking resemblance to Wolf.");
    EXPECT_STREQ(similarity_strength(0.8f), "a close resemblance");
    EXPECT_STREQ(similarity_strength(0.6f), "some similarity");
    EXPECT_STREQ(similarity_strength(0.2f), "a faint resemblance");
}

TEST_F(NarrativeGrammarTest, GapOpenerFollowsCounter) {
    SemanticTree gap = SemanticTree::gap(SemanticTree::entity("Dog"), "its lifespan is unknown");
    EXPECT_EQ(render(gap), "An open question remains: regarding Dog, its lifespan is unknown.");
    // Gaps read the counter without advancing it.
    EXPECT_EQ(render(gap), "An open question remains: regarding Dog, its lifespan is unknown.");

    render(is_a("Dog", "Mammal"));
    EXPECT_EQ(render(gap), "It remains unclear: regarding Dog, its lifespan is unknown.");
}

TEST_F(NarrativeGrammarTest, PredicatesAreHumanized) {
    SemanticTree t = SemanticTree::triple(SemanticTree::entity("Paris"), SemanticTree::relation("located-in"),
                                          SemanticTree::entity("France"));
    EXPECT_EQ(render(t), "Paris is located in France.");
}

TEST_F(NarrativeGrammarTest, Disjunction) {
    EXPECT_EQ(render(SemanticTree::disjunction({SemanticTree::entity("tea"), SemanticTree::entity("coffee")})),
              "Either tea or coffee, depending on the context.");
}

TEST_F(NarrativeGrammarTest, ConjunctionFlowsAsSentences) {
    EXPECT_EQ(render(SemanticTree::conjunction({is_a("Dog", "Mammal"), is_a("Cat", "Mammal")})),
              "Dog is a Mammal. Furthermore, Cat is a Mammal.");
}

TEST_F(NarrativeGrammarTest, SectionResetsTransitions) {
    render(is_a("A", "B"));
    render(is_a("C", "D"));
    EXPECT_EQ(render(SemanticTree::section("Facts", {is_a("Dog", "Mammal"), is_a("Cat", "Mammal")})),
              "## Facts\n\nDog is a Mammal.\nFurthermore, Cat is a Mammal.\n");
}

TEST_F(NarrativeGrammarTest, CodeStructureRejected) {
    Node::DataFlow flow;
    flow.steps.push_back({"read", std::nullopt});
    try {
        render(flow);
        FAIL() << "expected LinearizationFailed";
    } catch (const LinearizationFailed& e) {
        EXPECT_EQ(e.category(), Category::DataFlow);
        EXPECT_EQ(e.grammar(), "narrative");
    }
    EXPECT_FALSE(grammar.supports(Category::CodeSignature));
}
