/**
 * @file semantic_tree.cpp
 * @brief Construction, structural queries, grounding and vector encoding of SemanticTree
 */

#include <grammar/semantic_tree.hpp>
#include <grammar/symbol_registry.hpp>
#include <grammar/error.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <vsa/encode.hpp>
#include <vsa/hypervector.hpp>
#include <vsa/item_memory.hpp>
#include <utils/unicode.hpp>
#include <iomanip>
#include <sstream>

namespace Glossa {

// =============================================================================
// Enum names
// =============================================================================

const char* pov_name(PointOfView pov) {
    switch (pov) {
        case PointOfView::FirstPerson:  return "FirstPerson";
        case PointOfView::SecondPerson: return "SecondPerson";
        case PointOfView::ThirdPerson:  return "ThirdPerson";
    }
    return "ThirdPerson";
}

std::optional<PointOfView> pov_from_name(std::string_view name) {
    for (auto pov : {PointOfView::FirstPerson, PointOfView::SecondPerson, PointOfView::ThirdPerson}) {
        if (name == pov_name(pov)) return pov;
    }
    return std::nullopt;
}

const char* focus_name(QueryFocus focus) {
    switch (focus) {
        case QueryFocus::Identity:     return "Identity";
        case QueryFocus::Definition:   return "Definition";
        case QueryFocus::Method:       return "Method";
        case QueryFocus::Cause:        return "Cause";
        case QueryFocus::Location:     return "Location";
        case QueryFocus::Time:         return "Time";
        case QueryFocus::Confirmation: return "Confirmation";
        case QueryFocus::Capability:   return "Capability";
        case QueryFocus::General:      return "General";
    }
    return "General";
}

std::optional<QueryFocus> focus_from_name(std::string_view name) {
    for (auto f : {QueryFocus::Identity, QueryFocus::Definition, QueryFocus::Method, QueryFocus::Cause,
                   QueryFocus::Location, QueryFocus::Time, QueryFocus::Confirmation,
                   QueryFocus::Capability, QueryFocus::General}) {
        if (name == focus_name(f)) return f;
    }
    return std::nullopt;
}

const char* provenance_kind_name(ProvenanceTag::Kind kind) {
    switch (kind) {
        case ProvenanceTag::Kind::Extracted:     return "extracted";
        case ProvenanceTag::Kind::GraphInferred: return "graph-inferred";
        case ProvenanceTag::Kind::VsaInferred:   return "vsa-inferred";
        case ProvenanceTag::Kind::Reasoned:      return "reasoned";
        case ProvenanceTag::Kind::AgentDerived:  return "agent-derived";
        case ProvenanceTag::Kind::Enrichment:    return "enrichment";
        case ProvenanceTag::Kind::UserAsserted:  return "user-asserted";
    }
    return "extracted";
}

std::optional<ProvenanceTag::Kind> provenance_kind_from_name(std::string_view name) {
    using K = ProvenanceTag::Kind;
    for (auto k : {K::Extracted, K::GraphInferred, K::VsaInferred, K::Reasoned,
                   K::AgentDerived, K::Enrichment, K::UserAsserted}) {
        if (name == provenance_kind_name(k)) return k;
    }
    return std::nullopt;
}

std::string ProvenanceTag::to_string() const {
    if (kind != Kind::VsaInferred) return provenance_kind_name(kind);
    std::ostringstream ss;
    ss << "vsa-inferred(" << std::fixed << std::setprecision(2) << similarity << ")";
    return ss.str();
}

// =============================================================================
// TreeBox
// =============================================================================

TreeBox::TreeBox() : ptr_(std::make_unique<SemanticTree>()) {}

TreeBox::TreeBox(SemanticTree tree) : ptr_(std::make_unique<SemanticTree>(std::move(tree))) {}

TreeBox::TreeBox(const TreeBox& other)
    : ptr_(other.ptr_ ? std::make_unique<SemanticTree>(*other.ptr_) : std::make_unique<SemanticTree>()) {}

TreeBox::TreeBox(TreeBox&& other) noexcept = default;

TreeBox& TreeBox::operator=(const TreeBox& other) {
    if (this != &other) {
        ptr_ = other.ptr_ ? std::make_unique<SemanticTree>(*other.ptr_) : std::make_unique<SemanticTree>();
    }
    return *this;
}

TreeBox& TreeBox::operator=(TreeBox&& other) noexcept = default;

TreeBox::~TreeBox() = default;

// =============================================================================
// Node equality
// =============================================================================

namespace Node {

bool operator==(const EntityRef& a, const EntityRef& b) {
    return a.label == b.label && a.symbol_id == b.symbol_id;
}
bool operator==(const RelationRef& a, const RelationRef& b) {
    return a.label == b.label && a.symbol_id == b.symbol_id;
}
bool operator==(const Freeform& a, const Freeform& b) { return a.text == b.text; }
bool operator==(const Triple& a, const Triple& b) {
    return *a.subject == *b.subject && *a.predicate == *b.predicate && *a.object == *b.object;
}
bool operator==(const Similarity& a, const Similarity& b) {
    return *a.entity == *b.entity && *a.similar_to == *b.similar_to && a.score == b.score;
}
bool operator==(const Gap& a, const Gap& b) {
    return *a.entity == *b.entity && a.description == b.description;
}
bool operator==(const Inference& a, const Inference& b) {
    return a.expression == b.expression && a.simplified == b.simplified;
}
bool operator==(const CodeFact& a, const CodeFact& b) {
    return a.kind == b.kind && a.name == b.name && a.detail == b.detail;
}
bool operator==(const CodeModule& a, const CodeModule& b) {
    return a.name == b.name && a.role == b.role && a.importance == b.importance &&
           a.doc_summary == b.doc_summary && a.children == b.children;
}
bool operator==(const CodeSignature& a, const CodeSignature& b) {
    return a.kind == b.kind && a.name == b.name && a.doc_summary == b.doc_summary &&
           a.params_or_fields == b.params_or_fields && a.return_type == b.return_type &&
           a.traits == b.traits && a.importance == b.importance;
}
bool operator==(const DataFlowStep& a, const DataFlowStep& b) {
    return a.name == b.name && a.via_type == b.via_type;
}
bool operator==(const DataFlow& a, const DataFlow& b) { return a.steps == b.steps; }
bool operator==(const WithConfidence& a, const WithConfidence& b) {
    return *a.inner == *b.inner && a.confidence == b.confidence;
}
bool operator==(const WithProvenance& a, const WithProvenance& b) {
    return *a.inner == *b.inner && a.tag == b.tag;
}
bool operator==(const DiscourseFrame& a, const DiscourseFrame& b) {
    return *a.inner == *b.inner && a.pov == b.pov && a.focus == b.focus;
}
bool operator==(const Conjunction& a, const Conjunction& b) {
    return a.is_and == b.is_and && a.items == b.items;
}
bool operator==(const Section& a, const Section& b) {
    return a.heading == b.heading && a.body == b.body;
}
bool operator==(const Document& a, const Document& b) {
    return *a.overview == *b.overview && a.sections == b.sections && a.gaps == b.gaps;
}

} // namespace Node

// =============================================================================
// Traversal
// =============================================================================

namespace {

template <typename T>
constexpr bool is_modifier_v = std::is_same<T, Node::WithConfidence>::value ||
                               std::is_same<T, Node::WithProvenance>::value ||
                               std::is_same<T, Node::DiscourseFrame>::value;

/// Call fn on every direct child, in tree order. Works for const and mutable trees.
template <typename Tree, typename Fn>
void for_each_child(Tree& tree, Fn&& fn) {
    std::visit([&](auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same<T, Node::Triple>::value) {
            fn(*n.subject);
            fn(*n.predicate);
            fn(*n.object);
        } else if constexpr (std::is_same<T, Node::Similarity>::value) {
            fn(*n.entity);
            fn(*n.similar_to);
        } else if constexpr (std::is_same<T, Node::Gap>::value) {
            fn(*n.entity);
        } else if constexpr (is_modifier_v<T>) {
            fn(*n.inner);
        } else if constexpr (std::is_same<T, Node::CodeModule>::value) {
            for (auto& c : n.children) fn(c);
        } else if constexpr (std::is_same<T, Node::Conjunction>::value) {
            for (auto& c : n.items) fn(c);
        } else if constexpr (std::is_same<T, Node::Section>::value) {
            for (auto& c : n.body) fn(c);
        } else if constexpr (std::is_same<T, Node::Document>::value) {
            fn(*n.overview);
            for (auto& c : n.sections) fn(c);
            for (auto& c : n.gaps) fn(c);
        }
    }, tree.node());
}

bool is_modifier(const SemanticTree& tree) {
    return tree.is<Node::WithConfidence>() || tree.is<Node::WithProvenance>() ||
           tree.is<Node::DiscourseFrame>();
}

void ground_in_place(SemanticTree& tree, const SymbolRegistry& registry) {
    if (auto* e = tree.as<Node::EntityRef>()) {
        if (!e->symbol_id) e->symbol_id = registry.lookup(e->label);
        return;
    }
    if (auto* r = tree.as<Node::RelationRef>()) {
        if (!r->symbol_id) r->symbol_id = registry.lookup(r->label);
        return;
    }
    for_each_child(tree, [&](SemanticTree& child) { ground_in_place(child, registry); });
}

const SemanticTree* find_unresolved(const SemanticTree& tree) {
    if (auto* e = tree.as<Node::EntityRef>()) return e->symbol_id ? nullptr : &tree;
    if (auto* r = tree.as<Node::RelationRef>()) return r->symbol_id ? nullptr : &tree;
    const SemanticTree* found = nullptr;
    for_each_child(tree, [&](const SemanticTree& child) {
        if (!found) found = find_unresolved(child);
    });
    return found;
}

} // namespace

// =============================================================================
// Constructors
// =============================================================================

SemanticTree SemanticTree::entity(std::string label) {
    return Node::EntityRef{std::move(label), std::nullopt};
}

SemanticTree SemanticTree::entity(std::string label, SymbolId id) {
    return Node::EntityRef{std::move(label), id};
}

SemanticTree SemanticTree::relation(std::string label) {
    return Node::RelationRef{std::move(label), std::nullopt};
}

SemanticTree SemanticTree::relation(std::string label, SymbolId id) {
    return Node::RelationRef{std::move(label), id};
}

SemanticTree SemanticTree::freeform(std::string text) {
    return Node::Freeform{std::move(text)};
}

SemanticTree SemanticTree::triple(SemanticTree subject, SemanticTree predicate, SemanticTree object) {
    return Node::Triple{std::move(subject), std::move(predicate), std::move(object)};
}

SemanticTree SemanticTree::triple_with_confidence(SemanticTree subject, SemanticTree predicate,
                                                  SemanticTree object, float confidence) {
    return with_confidence(triple(std::move(subject), std::move(predicate), std::move(object)), confidence);
}

SemanticTree SemanticTree::similarity(SemanticTree entity, SemanticTree similar_to, float score) {
    return Node::Similarity{std::move(entity), std::move(similar_to), score};
}

SemanticTree SemanticTree::gap(SemanticTree entity, std::string description) {
    return Node::Gap{std::move(entity), std::move(description)};
}

SemanticTree SemanticTree::inference(std::string expression, std::string simplified) {
    return Node::Inference{std::move(expression), std::move(simplified)};
}

SemanticTree SemanticTree::code_fact(std::string kind, std::string name, std::string detail) {
    return Node::CodeFact{std::move(kind), std::move(name), std::move(detail)};
}

SemanticTree SemanticTree::with_confidence(SemanticTree inner, float confidence) {
    return Node::WithConfidence{std::move(inner), confidence};
}

SemanticTree SemanticTree::with_provenance(SemanticTree inner, ProvenanceTag tag) {
    return Node::WithProvenance{std::move(inner), tag};
}

SemanticTree SemanticTree::discourse_frame(SemanticTree inner, PointOfView pov, QueryFocus focus) {
    return Node::DiscourseFrame{std::move(inner), pov, focus};
}

SemanticTree SemanticTree::conjunction(std::vector<SemanticTree> items) {
    return Node::Conjunction{std::move(items), true};
}

SemanticTree SemanticTree::disjunction(std::vector<SemanticTree> items) {
    return Node::Conjunction{std::move(items), false};
}

SemanticTree SemanticTree::section(std::string heading, std::vector<SemanticTree> body) {
    return Node::Section{std::move(heading), std::move(body)};
}

SemanticTree SemanticTree::document(SemanticTree overview, std::vector<SemanticTree> sections,
                                    std::vector<SemanticTree> gaps) {
    return Node::Document{std::move(overview), std::move(sections), std::move(gaps)};
}

// =============================================================================
// Access
// =============================================================================

Category SemanticTree::category() const {
    static constexpr Category by_index[] = {
        Category::Entity, Category::Relation, Category::Freeform,
        Category::Statement, Category::Similarity, Category::Gap, Category::Inference, Category::CodeFact,
        Category::CodeModule, Category::CodeSignature, Category::DataFlow,
        Category::Confidence, Category::Provenance, Category::DiscourseFrame,
        Category::Conjunction, Category::Section, Category::Document
    };
    static_assert(sizeof(by_index) / sizeof(by_index[0]) == std::variant_size<Variant>::value,
                  "category table out of step with node variant");
    return by_index[node_.index()];
}

std::optional<std::string> SemanticTree::label() const {
    if (auto* e = as<Node::EntityRef>()) return e->label;
    if (auto* r = as<Node::RelationRef>()) return r->label;
    if (auto* f = as<Node::Freeform>()) return f->text;
    return std::nullopt;
}

std::optional<SymbolId> SemanticTree::symbol_id() const {
    if (auto* e = as<Node::EntityRef>()) return e->symbol_id;
    if (auto* r = as<Node::RelationRef>()) return r->symbol_id;
    return std::nullopt;
}

const SemanticTree& SemanticTree::unwrap() const {
    if (auto* c = as<Node::WithConfidence>()) return c->inner->unwrap();
    if (auto* p = as<Node::WithProvenance>()) return p->inner->unwrap();
    if (auto* d = as<Node::DiscourseFrame>()) return d->inner->unwrap();
    return *this;
}

// =============================================================================
// Structural queries
// =============================================================================

void SemanticTree::validate() const {
    if (auto* t = as<Node::Triple>()) {
        Category s = t->subject->category();
        if (!valid_in_statement(s)) throw TypeMismatch(Category::Entity, s);
        Category p = t->predicate->category();
        if (p != Category::Relation && p != Category::Freeform) throw TypeMismatch(Category::Relation, p);
        Category o = t->object->category();
        if (!valid_in_statement(o)) throw TypeMismatch(Category::Entity, o);
    } else if (auto* c = as<Node::WithConfidence>()) {
        // Written as a negated range test so NaN is rejected too.
        if (!(c->confidence >= 0.0f && c->confidence <= 1.0f)) {
            throw TypeMismatch(Category::Confidence, Category::Freeform);
        }
    }
    for_each_child(*this, [](const SemanticTree& child) { child.validate(); });
}

size_t SemanticTree::node_count() const {
    if (is_modifier(*this)) {
        size_t inner = 0;
        for_each_child(*this, [&](const SemanticTree& child) { inner += child.node_count(); });
        return inner;
    }
    size_t count = 1;
    for_each_child(*this, [&](const SemanticTree& child) { count += child.node_count(); });
    return count;
}

std::vector<std::string> SemanticTree::collect_labels() const {
    std::vector<std::string> out;
    struct Collector {
        std::vector<std::string>& out;
        void operator()(const SemanticTree& t) const {
            if (auto* e = t.as<Node::EntityRef>()) { out.push_back(e->label); return; }
            if (auto* r = t.as<Node::RelationRef>()) { out.push_back(r->label); return; }
            for_each_child(t, *this);
        }
    };
    Collector{out}(*this);
    return out;
}

size_t SemanticTree::unresolved_count() const {
    if (auto* e = as<Node::EntityRef>()) return e->symbol_id ? 0 : 1;
    if (auto* r = as<Node::RelationRef>()) return r->symbol_id ? 0 : 1;
    size_t count = 0;
    for_each_child(*this, [&](const SemanticTree& child) { count += child.unresolved_count(); });
    return count;
}

std::optional<std::string> SemanticTree::first_unresolved() const {
    const SemanticTree* leaf = find_unresolved(*this);
    if (!leaf) return std::nullopt;
    return leaf->label();
}

// =============================================================================
// Grounding
// =============================================================================

SemanticTree SemanticTree::ground(const SymbolRegistry& registry) const {
    SemanticTree copy = *this;
    ground_in_place(copy, registry);
    return copy;
}

SemanticTree SemanticTree::ground_strict(const SymbolRegistry& registry) const {
    SemanticTree grounded = ground(registry);
    size_t missing = grounded.unresolved_count();
    if (missing > 0) {
        throw GroundingIncomplete(missing, grounded.first_unresolved().value_or(""));
    }
    return grounded;
}

// =============================================================================
// Role symbols
// =============================================================================

SymbolId RoleSymbols::role_id(std::string_view role_name) {
    return BLAKE3Pipeline::hash64(std::string("glossa role:") + std::string(role_name)) | ROLE_SYMBOL_BIT;
}

RoleSymbols RoleSymbols::derive() {
    RoleSymbols r;
    r.subject = role_id("subject");
    r.predicate = role_id("predicate");
    r.object = role_id("object");
    r.entity = role_id("entity");
    r.similar_to = role_id("similar-to");
    r.section_heading = role_id("section-heading");
    return r;
}

// =============================================================================
// Vector encoding
// =============================================================================

namespace {

class TreeEncoder {
public:
    TreeEncoder(const VsaOps& ops, HypervectorIndex& index, const RoleSymbols& roles)
        : ops_(ops), index_(index), roles_(roles) {}

    HyperVec encode(const SemanticTree& tree) {
        if (auto* e = tree.as<Node::EntityRef>()) return leaf(e->label, e->symbol_id);
        if (auto* r = tree.as<Node::RelationRef>()) return leaf(r->label, r->symbol_id);
        if (auto* f = tree.as<Node::Freeform>()) return encode_token(ops_, f->text);

        if (auto* t = tree.as<Node::Triple>()) {
            return ops_.bundle(std::vector<HyperVec>{
                filled(roles_.subject, encode(*t->subject)),
                filled(roles_.predicate, encode(*t->predicate)),
                filled(roles_.object, encode(*t->object))});
        }
        if (auto* s = tree.as<Node::Similarity>()) {
            return ops_.bundle(std::vector<HyperVec>{
                filled(roles_.entity, encode(*s->entity)),
                filled(roles_.similar_to, encode(*s->similar_to))});
        }
        if (auto* g = tree.as<Node::Gap>()) {
            return ops_.bundle(std::vector<HyperVec>{
                filled(roles_.entity, encode(*g->entity)),
                encode_token(ops_, g->description)});
        }
        if (auto* i = tree.as<Node::Inference>()) {
            return ops_.bundle(std::vector<HyperVec>{
                encode_token(ops_, i->expression), encode_token(ops_, i->simplified)});
        }
        if (auto* c = tree.as<Node::CodeFact>()) {
            return ops_.bundle(std::vector<HyperVec>{
                filled(roles_.subject, encode_token(ops_, c->name)),
                filled(roles_.predicate, encode_token(ops_, c->kind)),
                filled(roles_.object, encode_token(ops_, c->detail))});
        }
        if (auto* m = tree.as<Node::CodeModule>()) {
            std::vector<HyperVec> parts;
            parts.push_back(filled(roles_.entity, encode_token(ops_, m->name)));
            for (const auto& child : m->children) parts.push_back(encode(child));
            return parts.size() == 1 ? parts.front() : ops_.bundle(parts);
        }
        if (auto* sig = tree.as<Node::CodeSignature>()) {
            std::vector<HyperVec> parts;
            parts.push_back(filled(roles_.subject, encode_token(ops_, sig->name)));
            parts.push_back(filled(roles_.predicate, encode_token(ops_, sig->kind)));
            if (!sig->params_or_fields.empty()) {
                std::vector<HyperVec> params;
                for (const auto& p : sig->params_or_fields) params.push_back(encode_token(ops_, p));
                parts.push_back(filled(roles_.object, encode_sequence(ops_, params)));
            }
            return ops_.bundle(parts);
        }
        if (auto* df = tree.as<Node::DataFlow>()) {
            if (df->steps.empty()) {
                throw VsaError(VsaError::Reason::EmptyCollection, "cannot encode an empty DataFlow");
            }
            std::vector<HyperVec> steps;
            for (const auto& step : df->steps) {
                HyperVec v = encode_token(ops_, step.name);
                if (step.via_type) v = ops_.bind(v, encode_token(ops_, *step.via_type));
                steps.push_back(std::move(v));
            }
            return encode_sequence(ops_, steps);
        }
        if (auto* c = tree.as<Node::Conjunction>()) {
            if (c->items.empty()) {
                throw VsaError(VsaError::Reason::EmptyCollection, "cannot encode an empty Conjunction");
            }
            return bundle_all(c->items);
        }
        if (auto* s = tree.as<Node::Section>()) {
            std::vector<HyperVec> parts;
            parts.push_back(filled(roles_.section_heading, encode_token(ops_, s->heading)));
            for (const auto& item : s->body) parts.push_back(encode(item));
            return parts.size() == 1 ? parts.front() : ops_.bundle(parts);
        }
        if (auto* d = tree.as<Node::Document>()) {
            std::vector<HyperVec> parts;
            parts.push_back(encode(*d->overview));
            for (const auto& s : d->sections) parts.push_back(encode(s));
            for (const auto& g : d->gaps) parts.push_back(encode(g));
            return parts.size() == 1 ? parts.front() : ops_.bundle(parts);
        }

        // Modifiers carry no content of their own.
        return encode(tree.unwrap());
    }

private:
    HyperVec leaf(const std::string& label, const std::optional<SymbolId>& id) {
        if (id) return index_.get_or_create(ops_, *id);
        return encode_token(ops_, label);
    }

    HyperVec filled(SymbolId role, const HyperVec& filler) {
        return encode_role_filler(ops_, encode_symbol(ops_, role), filler);
    }

    HyperVec bundle_all(const std::vector<SemanticTree>& items) {
        std::vector<HyperVec> parts;
        parts.reserve(items.size());
        for (const auto& item : items) parts.push_back(encode(item));
        return parts.size() == 1 ? parts.front() : ops_.bundle(parts);
    }

    const VsaOps& ops_;
    HypervectorIndex& index_;
    const RoleSymbols& roles_;
};

} // namespace

HyperVec SemanticTree::to_vsa(const VsaOps& ops, HypervectorIndex& index, const RoleSymbols& roles) const {
    return TreeEncoder(ops, index, roles).encode(*this);
}

} // namespace Glossa
