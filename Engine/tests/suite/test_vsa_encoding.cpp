/**
 * @file test_vsa_encoding.cpp
 * @brief Role-filler encoding of whole trees: recoverability and similarity structure
 */

#include <gtest/gtest.h>
#include <grammar/semantic_tree.hpp>
#include <grammar/error.hpp>
#include <vsa/encode.hpp>
#include <vsa/item_memory.hpp>

using namespace Glossa;

namespace {

constexpr size_t DIM = 4096;

SemanticTree fact(const std::string& s, const std::string& p, const std::string& o) {
    return SemanticTree::triple(SemanticTree::entity(s), SemanticTree::relation(p), SemanticTree::entity(o));
}

class VsaEncodingTest : public ::testing::Test {
protected:
    VsaEncodingTest() : ops(DIM), index(DIM, 64), roles(RoleSymbols::derive()) {}

    HyperVec encode(const SemanticTree& tree) { return tree.to_vsa(ops, index, roles); }

    HyperVec role(SymbolId id) const { return encode_symbol(ops, id); }

    VsaOps ops;
    HypervectorIndex index;
    RoleSymbols roles;
};

} // namespace

// ============================================================================
// Recovering fillers
// ============================================================================

TEST_F(VsaEncodingTest, UnbindRecoversTripleSlots) {
    HyperVec v = encode(fact("Dog", "is-a", "Mammal"));
    ASSERT_EQ(v.dim(), DIM);

    HyperVec subject = ops.unbind(v, role(roles.subject));
    EXPECT_GT(ops.similarity(subject, encode_token(ops, "Dog")), 0.65f);
    EXPECT_LT(ops.similarity(subject, encode_token(ops, "Cat")), 0.6f);

    HyperVec object = ops.unbind(v, role(roles.object));
    EXPECT_GT(ops.similarity(object, encode_token(ops, "Mammal")), 0.65f);

    // Wrong role gives noise.
    EXPECT_LT(ops.similarity(ops.unbind(v, role(roles.predicate)), encode_token(ops, "Dog")), 0.6f);
}

TEST_F(VsaEncodingTest, GroundedLeavesUseIndexVectors) {
    SemanticTree grounded = SemanticTree::entity("Paris", 42);
    HyperVec v = encode(grounded);
    EXPECT_TRUE(index.contains(42));
    EXPECT_EQ(v, *index.get(42));
    EXPECT_EQ(v, encode_symbol(ops, 42));

    // Ungrounded leaves never touch the index.
    encode(SemanticTree::entity("Lyon"));
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(VsaEncodingTest, SearchFindsUnboundSubject) {
    for (SymbolId id = 1; id <= 40; ++id) index.get_or_create(ops, id);

    SemanticTree t = SemanticTree::triple(SemanticTree::entity("Paris", 7), SemanticTree::relation("located-in", 8),
                                          SemanticTree::entity("France", 9));
    HyperVec subject = ops.unbind(encode(t), role(roles.subject));

    auto hits = index.search(subject, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].symbol_id, 7u);
    EXPECT_GT(hits[0].similarity, 0.65f);
}

// ============================================================================
// Similarity structure
// ============================================================================

TEST_F(VsaEncodingTest, EncodingIsDeterministic) {
    EXPECT_EQ(encode(fact("Dog", "is-a", "Mammal")), encode(fact("Dog", "is-a", "Mammal")));

    HypervectorIndex other(DIM, 16);
    EXPECT_EQ(fact("Dog", "is-a", "Mammal").to_vsa(ops, other, RoleSymbols::derive()),
              encode(fact("Dog", "is-a", "Mammal")));
}

TEST_F(VsaEncodingTest, SharedSlotsMeanHigherSimilarity) {
    HyperVec base = encode(fact("Dog", "is-a", "Mammal"));
    HyperVec near = encode(fact("Dog", "is-a", "Animal"));
    HyperVec far = encode(fact("Paris", "located-in", "France"));

    float near_sim = ops.similarity(base, near);
    float far_sim = ops.similarity(base, far);
    EXPECT_GT(near_sim, 0.65f);
    EXPECT_LT(far_sim, 0.6f);
    EXPECT_GT(near_sim, far_sim);
}

TEST_F(VsaEncodingTest, RolesMakeTriplesOrderSensitive) {
    HyperVec forward = encode(fact("Cat", "chases", "Mouse"));
    HyperVec reversed = encode(fact("Mouse", "chases", "Cat"));
    // Only the predicate slot agrees.
    EXPECT_LT(ops.similarity(forward, reversed), 0.7f);
}

TEST_F(VsaEncodingTest, ModifiersAreTransparent) {
    SemanticTree t = fact("Dog", "is-a", "Mammal");
    HyperVec plain = encode(t);
    EXPECT_EQ(encode(SemanticTree::with_confidence(t, 0.4f)), plain);
    EXPECT_EQ(encode(SemanticTree::with_provenance(t, ProvenanceTag::vsa_inferred(0.9f))), plain);
    EXPECT_EQ(encode(SemanticTree::discourse_frame(t, PointOfView::FirstPerson, QueryFocus::Identity)), plain);
}

TEST_F(VsaEncodingTest, ConjunctionResemblesEachPart) {
    SemanticTree a = fact("Dog", "is-a", "Mammal");
    SemanticTree b = fact("Cat", "is-a", "Mammal");
    SemanticTree c = fact("Paris", "located-in", "France");
    HyperVec all = encode(SemanticTree::conjunction({a, b, c}));

    EXPECT_GT(ops.similarity(all, encode(a)), 0.6f);
    // a and b overlap, so they dominate the vote; c still stands out from noise.
    EXPECT_GT(ops.similarity(all, encode(c)), 0.57f);
    EXPECT_LT(ops.similarity(all, encode(fact("Rome", "capital-of", "Italy"))), 0.6f);

    EXPECT_EQ(encode(SemanticTree::conjunction({a})), encode(a));
}

TEST_F(VsaEncodingTest, CodeNodesEncode) {
    Node::CodeSignature sig;
    sig.kind = "fn";
    sig.name = "area";
    sig.params_or_fields = {"w: f64", "h: f64"};
    HyperVec v = encode(sig);
    EXPECT_GT(ops.similarity(ops.unbind(v, role(roles.subject)), encode_token(ops, "area")), 0.6f);

    Node::DataFlow flow;
    flow.steps.push_back({"read", std::string("String")});
    flow.steps.push_back({"parse", std::nullopt});
    EXPECT_EQ(encode(flow).dim(), DIM);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(VsaEncodingTest, EmptyCollectionsThrow) {
    try {
        encode(SemanticTree::conjunction({}));
        FAIL() << "expected VsaError";
    } catch (const VsaError& e) {
        EXPECT_EQ(e.reason(), VsaError::Reason::EmptyCollection);
    }
    EXPECT_THROW(encode(Node::DataFlow{}), VsaError);
    EXPECT_THROW(encode_sequence(ops, {}), VsaError);
}

TEST_F(VsaEncodingTest, IndexDimensionMustMatch) {
    HypervectorIndex small(1024, 16);
    EXPECT_THROW(SemanticTree::entity("Paris", 3).to_vsa(ops, small, roles), VsaError);
}
