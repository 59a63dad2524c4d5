/**
 * @file test_semantic_tree.cpp
 * @brief Unit tests for SemanticTree construction, validation and grounding
 */

#include <gtest/gtest.h>
#include <grammar/semantic_tree.hpp>
#include <grammar/symbol_registry.hpp>
#include <grammar/error.hpp>
#include <cmath>
#include <limits>

using namespace Glossa;

namespace {

SemanticTree dog_is_mammal() {
    return SemanticTree::triple(SemanticTree::entity("Dog"),
                                SemanticTree::relation("is-a"),
                                SemanticTree::entity("Mammal"));
}

} // namespace

// ============================================================================
// Categories and access
// ============================================================================

TEST(SemanticTreeTest, CategoriesFollowNodeKind) {
    EXPECT_EQ(SemanticTree::entity("Dog").category(), Category::Entity);
    EXPECT_EQ(SemanticTree::relation("is-a").category(), Category::Relation);
    EXPECT_EQ(SemanticTree::freeform("hello").category(), Category::Freeform);
    EXPECT_EQ(dog_is_mammal().category(), Category::Statement);
    EXPECT_EQ(SemanticTree::with_confidence(dog_is_mammal(), 0.9f).category(), Category::Confidence);
    EXPECT_EQ(SemanticTree::disjunction({dog_is_mammal()}).category(), Category::Conjunction);
    EXPECT_EQ(SemanticTree().category(), Category::Freeform);
}

TEST(SemanticTreeTest, CategoryNamesRoundTrip) {
    EXPECT_STREQ(category_name(Category::DiscourseFrame), "DiscourseFrame");
    EXPECT_EQ(category_from_name("Statement"), Category::Statement);
    EXPECT_FALSE(category_from_name("Paragraph").has_value());
}

TEST(SemanticTreeTest, LeafAccessors) {
    SemanticTree e = SemanticTree::entity("Dog", 4);
    EXPECT_EQ(e.label(), "Dog");
    EXPECT_EQ(e.symbol_id(), 4u);
    EXPECT_EQ(SemanticTree::freeform("hi").label(), "hi");
    EXPECT_FALSE(SemanticTree::freeform("hi").symbol_id().has_value());
    EXPECT_FALSE(dog_is_mammal().label().has_value());
}

TEST(SemanticTreeTest, UnwrapPeelsEveryModifier) {
    SemanticTree wrapped = SemanticTree::discourse_frame(
        SemanticTree::with_provenance(SemanticTree::with_confidence(dog_is_mammal(), 0.8f),
                                      ProvenanceTag(ProvenanceTag::Kind::Extracted)),
        PointOfView::ThirdPerson, QueryFocus::Identity);
    EXPECT_TRUE(wrapped.unwrap().is<Node::Triple>());
    EXPECT_EQ(wrapped.unwrap(), dog_is_mammal());
}

TEST(SemanticTreeTest, CopiesAreDeep) {
    SemanticTree original = dog_is_mammal();
    SemanticTree copy = original;
    copy.as<Node::Triple>()->object->as<Node::EntityRef>()->label = "Animal";

    EXPECT_NE(copy, original);
    EXPECT_EQ(original.as<Node::Triple>()->object->label(), "Mammal");
}

// ============================================================================
// Validation
// ============================================================================

TEST(SemanticTreeTest, ValidTriplePasses) {
    EXPECT_NO_THROW(dog_is_mammal().validate());
    EXPECT_NO_THROW(SemanticTree::triple(SemanticTree::entity("A"), SemanticTree::freeform("sort of likes"),
                                         SemanticTree::freeform("B")).validate());
}

TEST(SemanticTreeTest, NestedStatementInSubjectRejected) {
    SemanticTree bad = SemanticTree::triple(dog_is_mammal(), SemanticTree::relation("causes"),
                                            SemanticTree::entity("X"));
    try {
        bad.validate();
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.expected(), Category::Entity);
        EXPECT_EQ(e.actual(), Category::Statement);
    }
}

TEST(SemanticTreeTest, EntityInPredicateRejected) {
    SemanticTree bad = SemanticTree::triple(SemanticTree::entity("A"), SemanticTree::entity("B"),
                                            SemanticTree::entity("C"));
    try {
        bad.validate();
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.expected(), Category::Relation);
        EXPECT_EQ(e.actual(), Category::Entity);
    }
}

TEST(SemanticTreeTest, ConfidenceOutOfRangeRejected) {
    EXPECT_THROW(SemanticTree::with_confidence(dog_is_mammal(), 1.5f).validate(), TypeMismatch);
    EXPECT_THROW(SemanticTree::with_confidence(dog_is_mammal(), -0.1f).validate(), TypeMismatch);
    EXPECT_THROW(SemanticTree::with_confidence(dog_is_mammal(),
                                               std::numeric_limits<float>::quiet_NaN()).validate(),
                 TypeMismatch);
    EXPECT_NO_THROW(SemanticTree::with_confidence(dog_is_mammal(), 0.0f).validate());
}

TEST(SemanticTreeTest, ValidationReachesNestedItems) {
    SemanticTree bad = SemanticTree::conjunction({
        dog_is_mammal(),
        SemanticTree::section("Inner", {SemanticTree::with_confidence(dog_is_mammal(), 2.0f)})});
    EXPECT_THROW(bad.validate(), TypeMismatch);
}

// ============================================================================
// Structural queries
// ============================================================================

TEST(SemanticTreeTest, NodeCountIgnoresModifiers) {
    EXPECT_EQ(SemanticTree::entity("Dog").node_count(), 1u);
    EXPECT_EQ(dog_is_mammal().node_count(), 4u);
    EXPECT_EQ(SemanticTree::with_confidence(dog_is_mammal(), 0.5f).node_count(), 4u);
    EXPECT_EQ(SemanticTree::conjunction({dog_is_mammal(), dog_is_mammal()}).node_count(), 9u);
}

TEST(SemanticTreeTest, CollectLabelsInTreeOrder) {
    SemanticTree tree = SemanticTree::conjunction({
        dog_is_mammal(),
        SemanticTree::similarity(SemanticTree::entity("Dog"), SemanticTree::entity("Wolf"), 0.9f)});
    std::vector<std::string> expected = {"Dog", "is-a", "Mammal", "Dog", "Wolf"};
    EXPECT_EQ(tree.collect_labels(), expected);
}

TEST(SemanticTreeTest, UnresolvedDiagnostics) {
    SemanticTree tree = SemanticTree::triple(SemanticTree::entity("Dog", 1),
                                             SemanticTree::relation("is-a"),
                                             SemanticTree::entity("Mammal"));
    EXPECT_EQ(tree.unresolved_count(), 2u);
    EXPECT_EQ(tree.first_unresolved(), "is-a");
    EXPECT_EQ(SemanticTree::freeform("x").unresolved_count(), 0u);
}

// ============================================================================
// Grounding
// ============================================================================

TEST(SemanticTreeTest, GroundFillsKnownLabelsOnly) {
    MemorySymbolRegistry registry;
    SymbolId dog = registry.intern("dog");
    SymbolId is_a = registry.intern("is-a");

    SemanticTree tree = dog_is_mammal();
    SemanticTree grounded = tree.ground(registry);

    const auto* t = grounded.as<Node::Triple>();
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->subject->symbol_id(), dog);
    EXPECT_EQ(t->predicate->symbol_id(), is_a);
    EXPECT_FALSE(t->object->symbol_id().has_value());

    // Original untouched.
    EXPECT_EQ(tree.unresolved_count(), 3u);
    // Idempotent.
    EXPECT_EQ(grounded.ground(registry), grounded);
}

TEST(SemanticTreeTest, GroundKeepsExistingIds) {
    MemorySymbolRegistry registry;
    registry.intern("Dog");
    SemanticTree grounded = SemanticTree::entity("Dog", 999).ground(registry);
    EXPECT_EQ(grounded.symbol_id(), 999u);
}

TEST(SemanticTreeTest, GroundStrictReportsLeftovers) {
    MemorySymbolRegistry registry;
    registry.intern("Dog");
    registry.intern("is-a");
    try {
        dog_is_mammal().ground_strict(registry);
        FAIL() << "expected GroundingIncomplete";
    } catch (const GroundingIncomplete& e) {
        EXPECT_EQ(e.unresolved_count(), 1u);
        EXPECT_EQ(e.first_unresolved(), "Mammal");
        EXPECT_EQ(e.kind(), GrammarError::Kind::GroundingIncomplete);
    }

    registry.intern("Mammal");
    EXPECT_EQ(dog_is_mammal().ground_strict(registry).unresolved_count(), 0u);
}

// ============================================================================
// Provenance and discourse names
// ============================================================================

TEST(SemanticTreeTest, ProvenanceStrings) {
    EXPECT_EQ(ProvenanceTag(ProvenanceTag::Kind::GraphInferred).to_string(), "graph-inferred");
    EXPECT_EQ(ProvenanceTag::vsa_inferred(0.87f).to_string(), "vsa-inferred(0.87)");
    EXPECT_EQ(provenance_kind_from_name("user-asserted"), ProvenanceTag::Kind::UserAsserted);
    EXPECT_FALSE(provenance_kind_from_name("rumour").has_value());
}

TEST(SemanticTreeTest, DiscourseNames) {
    EXPECT_STREQ(pov_name(PointOfView::SecondPerson), "SecondPerson");
    EXPECT_EQ(pov_from_name("FirstPerson"), PointOfView::FirstPerson);
    EXPECT_EQ(focus_from_name("Capability"), QueryFocus::Capability);
    EXPECT_FALSE(focus_from_name("Whatever").has_value());
}

TEST(SemanticTreeTest, RoleIdsAreStableAndTagged) {
    RoleSymbols a = RoleSymbols::derive();
    RoleSymbols b = RoleSymbols::derive();
    EXPECT_EQ(a.subject, b.subject);
    EXPECT_NE(a.subject, a.object);
    EXPECT_NE(a.subject & ROLE_SYMBOL_BIT, 0u);
    EXPECT_EQ(RoleSymbols::role_id("subject"), a.subject);
}
