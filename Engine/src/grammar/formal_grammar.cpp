/**
 * @file formal_grammar.cpp
 */

#include <grammar/formal_grammar.hpp>
#include <grammar/morpho.hpp>
#include <utils/format_utils.hpp>
#include <utils/unicode.hpp>

namespace Glossa {

namespace {

/// Put an annotation before the closing period, if there is one.
std::string annotate(const std::string& text, const std::string& note) {
    if (ends_with(text, ".")) return text.substr(0, text.size() - 1) + " " + note + ".";
    return text + " " + note;
}

void append_block(std::string& out, const std::string& text) {
    out += text;
    if (!ends_with(text, "\n")) out += '\n';
}

class FormalWriter {
public:
    explicit FormalWriter(const LinContext& ctx) : ctx_(ctx), lexicon_(ctx.active_lexicon()) {}

    std::string render(const SemanticTree& tree) const { return std::visit(*this, tree.node()); }

    std::string operator()(const Node::EntityRef& e) const {
        return "'" + ctx_.resolve_label(e.label, e.symbol_id) + "'";
    }

    std::string operator()(const Node::RelationRef& r) const {
        return humanize_predicate(ctx_.resolve_label(r.label, r.symbol_id), lexicon_);
    }

    std::string operator()(const Node::Freeform& f) const { return f.text; }

    std::string operator()(const Node::Triple& t) const {
        return "The entity " + render(*t.subject) + " " + render(*t.predicate) + " " + render(*t.object) + ".";
    }

    std::string operator()(const Node::Similarity& s) const {
        return render(*s.entity) + " exhibits similarity to " + render(*s.similar_to) +
               " (score: " + format_fixed(s.score, 2) + ").";
    }

    std::string operator()(const Node::Gap& g) const {
        return "Knowledge gap identified for " + render(*g.entity) + ": " + g.description + ".";
    }

    std::string operator()(const Node::Inference& i) const {
        return "Reasoning result: the expression `" + i.expression + "` simplifies to `" + i.simplified + "`.";
    }

    std::string operator()(const Node::CodeFact& c) const {
        return "Code structure: " + c.kind + " `" + c.name + "` — " + c.detail + ".";
    }

    std::string operator()(const Node::CodeModule& m) const {
        std::string desc = m.doc_summary ? *m.doc_summary
                         : m.role        ? *m.role
                                         : std::string("serves an unspecified role");
        std::string out = "The module `" + m.name + "` " + desc + ".";
        if (m.importance && *m.importance > 0.7f) {
            out += " (importance: " + format_fixed(*m.importance, 2) + ")";
        }
        if (!m.children.empty()) {
            out += "\nContains " + std::to_string(m.children.size()) + " items:\n";
            for (const auto& child : m.children) {
                out += "- " + render(child) + "\n";
            }
        }
        return out;
    }

    std::string operator()(const Node::CodeSignature& s) const {
        std::string out;
        if (s.importance && *s.importance > 0.7f) out += "★ ";
        out += s.kind + " `" + s.name + "` — " + s.doc_summary.value_or("no documentation") + ".";
        std::string tail;
        if (!s.params_or_fields.empty()) tail = " params: (" + join(s.params_or_fields, ", ") + ")";
        if (s.return_type) tail += (tail.empty() ? " returns `" : ", returns `") + *s.return_type + "`";
        if (!tail.empty()) out += tail + ".";
        if (!s.traits.empty()) out += " [derives: " + join(s.traits, ", ") + "]";
        return out;
    }

    std::string operator()(const Node::DataFlow& df) const {
        std::vector<std::string> parts;
        for (const auto& step : df.steps) {
            parts.push_back(step.via_type ? "`" + step.name + "` → " + *step.via_type : "`" + step.name + "`");
        }
        return "Data flow: " + join(parts, " → ");
    }

    std::string operator()(const Node::WithConfidence& c) const {
        return annotate(render(*c.inner), "(confidence: " + format_fixed(c.confidence, 2) + ")");
    }

    std::string operator()(const Node::WithProvenance& p) const {
        return annotate(render(*p.inner), "[" + formal_provenance(p.tag) + "]");
    }

    std::string operator()(const Node::DiscourseFrame& d) const { return render(*d.inner); }

    std::string operator()(const Node::Conjunction& c) const {
        std::vector<std::string> parts;
        for (const auto& item : c.items) parts.push_back(render(item));
        return join_list(parts, c.is_and ? "and" : "or");
    }

    std::string operator()(const Node::Section& s) const {
        std::string out = "## " + s.heading + "\n\n";
        for (const auto& item : s.body) append_block(out, render(item));
        return out;
    }

    std::string operator()(const Node::Document& d) const {
        std::string out;
        std::string overview = render(*d.overview);
        out += overview;
        if (!ends_with(overview, "\n")) out += "\n\n";

        for (const auto& section : d.sections) append_block(out, render(section));

        if (!d.gaps.empty()) {
            out += "\n## Knowledge Gaps\n\n";
            for (const auto& gap : d.gaps) {
                out += "- ";
                append_block(out, render(gap));
            }
        }
        return out;
    }

private:
    const LinContext& ctx_;
    const Lexicon& lexicon_;
};

} // namespace

std::string formal_provenance(const ProvenanceTag& tag) {
    switch (tag.kind) {
        case ProvenanceTag::Kind::Extracted:     return "source: extracted";
        case ProvenanceTag::Kind::GraphInferred: return "source: graph inference";
        case ProvenanceTag::Kind::VsaInferred:
            return "source: VSA inference (similarity: " + format_fixed(tag.similarity, 2) + ")";
        case ProvenanceTag::Kind::Reasoned:      return "source: symbolic reasoning";
        case ProvenanceTag::Kind::AgentDerived:  return "source: agent derivation";
        case ProvenanceTag::Kind::Enrichment:    return "source: semantic enrichment";
        case ProvenanceTag::Kind::UserAsserted:  return "source: user assertion";
    }
    return "source: unknown";
}

std::string FormalGrammar::linearize(const SemanticTree& tree, const LinContext& ctx) const {
    return FormalWriter(ctx).render(tree);
}

const std::vector<Category>& FormalGrammar::supported_categories() const {
    static const std::vector<Category> cats = {
        Category::Entity,     Category::Relation,      Category::Statement,  Category::Similarity,
        Category::Gap,        Category::Inference,     Category::CodeFact,   Category::CodeModule,
        Category::CodeSignature, Category::DataFlow,   Category::Confidence, Category::Provenance,
        Category::Conjunction, Category::Section,      Category::Document,   Category::Freeform,
        Category::DiscourseFrame};
    return cats;
}

} // namespace Glossa
