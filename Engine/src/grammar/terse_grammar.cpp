/**
 * @file terse_grammar.cpp
 */

#include <grammar/terse_grammar.hpp>
#include <grammar/error.hpp>
#include <grammar/parser.hpp>
#include <utils/format_utils.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace Glossa {

namespace {

constexpr std::string_view kArrow = "→";
constexpr std::string_view kAsciiArrow = "->";

class TerseWriter {
public:
    TerseWriter(const TerseGrammar& grammar, const LinContext& ctx) : grammar_(grammar), ctx_(ctx) {}

    std::string render(const SemanticTree& tree) const { return std::visit(*this, tree.node()); }

    std::string operator()(const Node::EntityRef& e) const { return ctx_.resolve_label(e.label, e.symbol_id); }
    std::string operator()(const Node::RelationRef& r) const { return ctx_.resolve_label(r.label, r.symbol_id); }
    std::string operator()(const Node::Freeform& f) const { return f.text; }

    std::string operator()(const Node::Triple& t) const {
        return render(*t.subject) + " → " + render(*t.predicate) + " → " + render(*t.object);
    }

    std::string operator()(const Node::Similarity& s) const {
        return render(*s.entity) + " ~ " + render(*s.similar_to) + " (" + format_fixed(s.score, 2) + ")";
    }

    std::string operator()(const Node::Gap& g) const { return "? " + render(*g.entity) + ": " + g.description; }

    std::string operator()(const Node::Inference& i) const { return i.expression + " ⇒ " + i.simplified; }

    std::string operator()(const Node::CodeFact& c) const { return c.kind + ":" + c.name + " — " + c.detail; }

    std::string operator()(const Node::CodeModule&) const { return unsupported(Category::CodeModule); }
    std::string operator()(const Node::CodeSignature&) const { return unsupported(Category::CodeSignature); }
    std::string operator()(const Node::DataFlow&) const { return unsupported(Category::DataFlow); }

    std::string operator()(const Node::WithConfidence& c) const {
        return render(*c.inner) + " [" + format_fixed(c.confidence, 2) + "]";
    }

    std::string operator()(const Node::WithProvenance& p) const {
        return render(*p.inner) + " (" + terse_provenance(p.tag) + ")";
    }

    std::string operator()(const Node::DiscourseFrame& d) const { return render(*d.inner); }

    std::string operator()(const Node::Conjunction& c) const {
        std::vector<std::string> parts;
        for (const auto& item : c.items) parts.push_back(render(item));
        return join(parts, c.is_and ? "; " : " | ");
    }

    std::string operator()(const Node::Section& s) const {
        std::string out = "── " + s.heading + " ──\n";
        for (const auto& item : s.body) out += "  " + render(item) + "\n";
        return out;
    }

    std::string operator()(const Node::Document& d) const {
        std::string out = render(*d.overview) + "\n\n";
        for (const auto& section : d.sections) out += render(section) + "\n";
        if (!d.gaps.empty()) {
            out += "── Gaps ──\n";
            for (const auto& gap : d.gaps) out += "  " + render(gap) + "\n";
        }
        return out;
    }

private:
    [[noreturn]] std::string unsupported(Category cat) const {
        throw LinearizationFailed(cat, grammar_.name(), "code structure has no terse notation");
    }

    const TerseGrammar& grammar_;
    const LinContext& ctx_;
};

std::vector<std::string> split_on(std::string_view text, std::string_view sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(trim(text.substr(start)));
            return parts;
        }
        parts.emplace_back(trim(text.substr(start, pos - start)));
        start = pos + sep.size();
    }
}

/// "Mammal [0.95]" -> ("Mammal", 0.95)
std::pair<std::string, std::optional<float>> split_trailing_confidence(const std::string& s) {
    std::string_view text = trim(s);
    size_t open = text.rfind('[');
    if (open != std::string_view::npos && ends_with(text, "]")) {
        std::string inner(text.substr(open + 1, text.size() - open - 2));
        char* end = nullptr;
        float value = std::strtof(inner.c_str(), &end);
        if (!inner.empty() && end == inner.c_str() + inner.size() && !std::isnan(value)) {
            return {std::string(trim(text.substr(0, open))), std::clamp(value, 0.0f, 1.0f)};
        }
    }
    return {std::string(text), std::nullopt};
}

std::optional<SemanticTree> parse_arrow(std::string_view input) {
    std::string_view text = trim(input);
    std::vector<std::string> parts;
    if (text.find(kArrow) != std::string_view::npos) parts = split_on(text, kArrow);
    else if (text.find(kAsciiArrow) != std::string_view::npos) parts = split_on(text, kAsciiArrow);
    else return std::nullopt;

    if (parts.size() > 3) return std::nullopt;

    auto [object, confidence] = parts.size() == 3 ? split_trailing_confidence(parts[2])
                                                  : std::make_pair(std::string(), std::optional<float>());
    // A dangling arrow is not a triple; let the prose reader have it.
    if (parts.size() < 3 || parts[0].empty() || parts[1].empty() || object.empty()) return std::nullopt;

    SemanticTree triple = SemanticTree::triple(SemanticTree::entity(parts[0]), SemanticTree::relation(parts[1]),
                                               SemanticTree::entity(object));
    if (confidence) return SemanticTree::with_confidence(std::move(triple), *confidence);
    return triple;
}

} // namespace

std::string terse_provenance(const ProvenanceTag& tag) {
    switch (tag.kind) {
        case ProvenanceTag::Kind::Extracted:     return "ext";
        case ProvenanceTag::Kind::GraphInferred: return "graph";
        case ProvenanceTag::Kind::VsaInferred:   return "vsa:" + format_fixed(tag.similarity, 2);
        case ProvenanceTag::Kind::Reasoned:      return "reas";
        case ProvenanceTag::Kind::AgentDerived:  return "agent";
        case ProvenanceTag::Kind::Enrichment:    return "enrich";
        case ProvenanceTag::Kind::UserAsserted:  return "user";
    }
    return "?";
}

std::string TerseGrammar::linearize(const SemanticTree& tree, const LinContext& ctx) const {
    return TerseWriter(*this, ctx).render(tree);
}

SemanticTree TerseGrammar::parse(std::string_view input, std::optional<Category> /*expected*/,
                                 const ParseContext& ctx) const {
    if (auto tree = parse_arrow(input)) return std::move(*tree);
    return parse_universal(input, ctx);
}

const std::vector<Category>& TerseGrammar::supported_categories() const {
    static const std::vector<Category> cats = {
        Category::Entity,     Category::Relation,   Category::Statement,   Category::Similarity,
        Category::Gap,        Category::Inference,  Category::CodeFact,    Category::Confidence,
        Category::Provenance, Category::Conjunction, Category::Section,     Category::Document,
        Category::Freeform,   Category::DiscourseFrame};
    return cats;
}

} // namespace Glossa
