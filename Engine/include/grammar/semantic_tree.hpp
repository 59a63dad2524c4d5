/**
 * @file semantic_tree.hpp
 * @brief SemanticTree: the interlingua every parser writes and every grammar reads
 *
 * One tree, many surface forms. A tree says WHAT is asserted; a concrete
 * grammar decides HOW it reads. Nodes own their children outright (no
 * back-references), so a tree copies, compares and serializes as a value.
 *
 * Node families:
 *   leaves      EntityRef, RelationRef, Freeform
 *   composites  Triple, Similarity, Gap, Inference, CodeFact, CodeModule,
 *               CodeSignature, DataFlow
 *   modifiers   WithConfidence, WithProvenance, DiscourseFrame
 *   structure   Conjunction, Section, Document
 *
 * Modifiers wrap exactly one node and are transparent to structural queries
 * (labels, node counts, grounding diagnostics, vector encoding); renderers
 * still see them.
 */

#pragma once

#include <grammar/category.hpp>
#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Glossa {

class SemanticTree;
class SymbolRegistry;
class HyperVec;
class VsaOps;
class HypervectorIndex;

// =============================================================================
// Discourse metadata
// =============================================================================

enum class PointOfView {
    FirstPerson,    // "I am ..."
    SecondPerson,   // "You are ..."
    ThirdPerson     // "X is ..."
};

/**
 * @brief What kind of information a query is after.
 */
enum class QueryFocus {
    Identity,
    Definition,
    Method,
    Cause,
    Location,
    Time,
    Confirmation,
    Capability,
    General
};

GLOSSA_API const char* pov_name(PointOfView pov);
GLOSSA_API std::optional<PointOfView> pov_from_name(std::string_view name);
GLOSSA_API const char* focus_name(QueryFocus focus);
GLOSSA_API std::optional<QueryFocus> focus_from_name(std::string_view name);

// =============================================================================
// Provenance
// =============================================================================

/**
 * @brief How a piece of knowledge was obtained, in enough detail to mention in prose.
 */
struct GLOSSA_API ProvenanceTag {
    enum class Kind {
        Extracted,
        GraphInferred,
        VsaInferred,
        Reasoned,
        AgentDerived,
        Enrichment,
        UserAsserted
    };

    Kind kind = Kind::Extracted;
    float similarity = 0.0f;   // VsaInferred only

    ProvenanceTag() = default;
    ProvenanceTag(Kind k, float sim = 0.0f) : kind(k), similarity(sim) {}

    static ProvenanceTag vsa_inferred(float sim) { return ProvenanceTag(Kind::VsaInferred, sim); }

    /**
     * @brief "extracted", "graph-inferred", "vsa-inferred(0.87)", ...
     */
    std::string to_string() const;

    bool operator==(const ProvenanceTag& o) const {
        return kind == o.kind && (kind != Kind::VsaInferred || similarity == o.similarity);
    }
    bool operator!=(const ProvenanceTag& o) const { return !(*this == o); }
};

GLOSSA_API const char* provenance_kind_name(ProvenanceTag::Kind kind);
GLOSSA_API std::optional<ProvenanceTag::Kind> provenance_kind_from_name(std::string_view name);

// =============================================================================
// Child ownership
// =============================================================================

/**
 * @brief Exclusively owned child node with value semantics.
 *
 * Copying deep-copies the subtree. Never null: a default-constructed box
 * holds an empty Freeform node.
 */
class GLOSSA_API TreeBox {
public:
    TreeBox();
    TreeBox(SemanticTree tree);
    TreeBox(const TreeBox& other);
    TreeBox(TreeBox&& other) noexcept;
    TreeBox& operator=(const TreeBox& other);
    TreeBox& operator=(TreeBox&& other) noexcept;
    ~TreeBox();

    const SemanticTree& operator*() const { return *ptr_; }
    SemanticTree& operator*() { return *ptr_; }
    const SemanticTree* operator->() const { return ptr_.get(); }
    SemanticTree* operator->() { return ptr_.get(); }

private:
    std::unique_ptr<SemanticTree> ptr_;
};

// =============================================================================
// Node kinds
// =============================================================================

namespace Node {

struct EntityRef {
    std::string label;
    std::optional<SymbolId> symbol_id;
};

struct RelationRef {
    std::string label;
    std::optional<SymbolId> symbol_id;
};

/// Text that did not parse into anything structured.
struct Freeform {
    std::string text;
};

struct Triple {
    TreeBox subject;
    TreeBox predicate;
    TreeBox object;
};

struct Similarity {
    TreeBox entity;
    TreeBox similar_to;
    float score = 0.0f;
};

/// Something unknown or missing about an entity.
struct Gap {
    TreeBox entity;
    std::string description;
};

struct Inference {
    std::string expression;
    std::string simplified;
};

struct CodeFact {
    std::string kind;
    std::string name;
    std::string detail;
};

struct CodeModule {
    std::string name;
    std::optional<std::string> role;
    std::optional<float> importance;
    std::optional<std::string> doc_summary;
    std::vector<SemanticTree> children;
};

/**
 * @brief A code item. `kind` is fn, struct, enum, trait or impl.
 *
 * params_or_fields holds parameters (fn), fields (struct), variants (enum),
 * method signatures (trait) or method names (impl). For impl, traits[0] is the
 * implemented trait and return_type the target type.
 */
struct CodeSignature {
    std::string kind;
    std::string name;
    std::optional<std::string> doc_summary;
    std::vector<std::string> params_or_fields;
    std::optional<std::string> return_type;
    std::vector<std::string> traits;
    std::optional<float> importance;
};

struct DataFlowStep {
    std::string name;
    std::optional<std::string> via_type;
};

struct DataFlow {
    std::vector<DataFlowStep> steps;
};

struct WithConfidence {
    TreeBox inner;
    float confidence = 1.0f;
};

struct WithProvenance {
    TreeBox inner;
    ProvenanceTag tag;
};

struct DiscourseFrame {
    TreeBox inner;
    PointOfView pov = PointOfView::ThirdPerson;
    QueryFocus focus = QueryFocus::General;
};

/// `is_and` false makes this a disjunction.
struct Conjunction {
    std::vector<SemanticTree> items;
    bool is_and = true;
};

struct Section {
    std::string heading;
    std::vector<SemanticTree> body;
};

struct Document {
    TreeBox overview;
    std::vector<SemanticTree> sections;
    std::vector<SemanticTree> gaps;
};

GLOSSA_API bool operator==(const EntityRef& a, const EntityRef& b);
GLOSSA_API bool operator==(const RelationRef& a, const RelationRef& b);
GLOSSA_API bool operator==(const Freeform& a, const Freeform& b);
GLOSSA_API bool operator==(const Triple& a, const Triple& b);
GLOSSA_API bool operator==(const Similarity& a, const Similarity& b);
GLOSSA_API bool operator==(const Gap& a, const Gap& b);
GLOSSA_API bool operator==(const Inference& a, const Inference& b);
GLOSSA_API bool operator==(const CodeFact& a, const CodeFact& b);
GLOSSA_API bool operator==(const CodeModule& a, const CodeModule& b);
GLOSSA_API bool operator==(const CodeSignature& a, const CodeSignature& b);
GLOSSA_API bool operator==(const DataFlowStep& a, const DataFlowStep& b);
GLOSSA_API bool operator==(const DataFlow& a, const DataFlow& b);
GLOSSA_API bool operator==(const WithConfidence& a, const WithConfidence& b);
GLOSSA_API bool operator==(const WithProvenance& a, const WithProvenance& b);
GLOSSA_API bool operator==(const DiscourseFrame& a, const DiscourseFrame& b);
GLOSSA_API bool operator==(const Conjunction& a, const Conjunction& b);
GLOSSA_API bool operator==(const Section& a, const Section& b);
GLOSSA_API bool operator==(const Document& a, const Document& b);

} // namespace Node

// =============================================================================
// Role symbols
// =============================================================================

/**
 * @brief Fixed symbols naming the structural slots of composite nodes.
 *
 * Each id is the BLAKE3 hash of a role name with ROLE_SYMBOL_BIT set, so
 * the same roles come out on every run without storage and never collide
 * with allocated symbol ids.
 */
struct GLOSSA_API RoleSymbols {
    SymbolId subject = 0;
    SymbolId predicate = 0;
    SymbolId object = 0;
    SymbolId entity = 0;
    SymbolId similar_to = 0;
    SymbolId section_heading = 0;

    static SymbolId role_id(std::string_view role_name);
    static RoleSymbols derive();
};

// =============================================================================
// SemanticTree
// =============================================================================

class GLOSSA_API SemanticTree {
public:
    using Variant = std::variant<
        Node::EntityRef, Node::RelationRef, Node::Freeform,
        Node::Triple, Node::Similarity, Node::Gap, Node::Inference, Node::CodeFact,
        Node::CodeModule, Node::CodeSignature, Node::DataFlow,
        Node::WithConfidence, Node::WithProvenance, Node::DiscourseFrame,
        Node::Conjunction, Node::Section, Node::Document>;

    SemanticTree() : node_(Node::Freeform{}) {}

    template <typename T,
              typename = std::enable_if_t<std::conjunction<
                  std::negation<std::is_same<std::decay_t<T>, SemanticTree>>,
                  std::is_constructible<Variant, T&&>>::value>>
    SemanticTree(T&& node) : node_(std::forward<T>(node)) {}

    // ---- constructors --------------------------------------------------------

    static SemanticTree entity(std::string label);
    static SemanticTree entity(std::string label, SymbolId id);
    static SemanticTree relation(std::string label);
    static SemanticTree relation(std::string label, SymbolId id);
    static SemanticTree freeform(std::string text);
    static SemanticTree triple(SemanticTree subject, SemanticTree predicate, SemanticTree object);
    static SemanticTree triple_with_confidence(SemanticTree subject, SemanticTree predicate,
                                               SemanticTree object, float confidence);
    static SemanticTree similarity(SemanticTree entity, SemanticTree similar_to, float score);
    static SemanticTree gap(SemanticTree entity, std::string description);
    static SemanticTree inference(std::string expression, std::string simplified);
    static SemanticTree code_fact(std::string kind, std::string name, std::string detail);
    static SemanticTree with_confidence(SemanticTree inner, float confidence);
    static SemanticTree with_provenance(SemanticTree inner, ProvenanceTag tag);
    static SemanticTree discourse_frame(SemanticTree inner, PointOfView pov, QueryFocus focus);
    static SemanticTree conjunction(std::vector<SemanticTree> items);
    static SemanticTree disjunction(std::vector<SemanticTree> items);
    static SemanticTree section(std::string heading, std::vector<SemanticTree> body);
    static SemanticTree document(SemanticTree overview, std::vector<SemanticTree> sections,
                                 std::vector<SemanticTree> gaps);

    // ---- access --------------------------------------------------------------

    Category category() const;

    const Variant& node() const { return node_; }
    Variant& node() { return node_; }

    template <typename T> bool is() const { return std::holds_alternative<T>(node_); }
    template <typename T> const T* as() const { return std::get_if<T>(&node_); }
    template <typename T> T* as() { return std::get_if<T>(&node_); }

    /**
     * @brief Label of a leaf (entity, relation or freeform text)
     */
    std::optional<std::string> label() const;

    /**
     * @brief Resolved id of an entity or relation leaf
     */
    std::optional<SymbolId> symbol_id() const;

    /**
     * @brief This node with any confidence/provenance/discourse wrappers peeled off
     */
    const SemanticTree& unwrap() const;

    // ---- structural queries --------------------------------------------------

    /**
     * @brief Check category constraints of every slot, depth first.
     * @throws TypeMismatch at the first violation
     */
    void validate() const;

    size_t node_count() const;

    /**
     * @brief Every entity and relation label, in tree order
     */
    std::vector<std::string> collect_labels() const;

    size_t unresolved_count() const;
    std::optional<std::string> first_unresolved() const;

    // ---- grounding -----------------------------------------------------------

    /**
     * @brief Copy of this tree with every resolvable leaf id filled in.
     *
     * Labels are looked up case-insensitively. Ids already present are kept.
     * This tree is not modified.
     */
    SemanticTree ground(const SymbolRegistry& registry) const;

    /**
     * @brief ground(), then require every entity and relation to be resolved
     * @throws GroundingIncomplete naming the first leftover label
     */
    SemanticTree ground_strict(const SymbolRegistry& registry) const;

    // ---- vector encoding -----------------------------------------------------

    /**
     * @brief Encode the tree as one hypervector by role-filler binding.
     *
     * Grounded leaves use the index's vector for their symbol; other leaves
     * and free text are hashed from their label. Composites bundle
     * bind(role, filler) for each slot.
     *
     * @throws VsaError for an empty Conjunction or DataFlow
     */
    HyperVec to_vsa(const VsaOps& ops, HypervectorIndex& index, const RoleSymbols& roles) const;

    bool operator==(const SemanticTree& o) const { return node_ == o.node_; }
    bool operator!=(const SemanticTree& o) const { return !(*this == o); }

private:
    Variant node_;
};

} // namespace Glossa
