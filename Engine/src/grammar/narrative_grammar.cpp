/**
 * @file narrative_grammar.cpp
 */

#include <grammar/narrative_grammar.hpp>
#include <grammar/error.hpp>
#include <grammar/morpho.hpp>
#include <utils/format_utils.hpp>
#include <utils/unicode.hpp>

#include <array>

namespace Glossa {

namespace {

constexpr std::array<const char*, 8> kTransitions = {
    "",
    "Furthermore, ",
    "Notably, ",
    "Interestingly, ",
    "Additionally, ",
    "In turn, ",
    "Building on this, ",
    "Along similar lines, ",
};

constexpr std::array<const char*, 4> kGapOpeners = {
    "An open question remains",
    "It remains unclear",
    "Further investigation is needed",
    "A gap in our knowledge exists",
};

std::string strip_period(const std::string& s) {
    return ends_with(s, ".") ? s.substr(0, s.size() - 1) : s;
}

class NarrativeWriter {
public:
    NarrativeWriter(const NarrativeGrammar& grammar, const LinContext& ctx)
        : grammar_(grammar), ctx_(ctx), lexicon_(ctx.active_lexicon()) {}

    std::string render(const SemanticTree& tree) const { return std::visit(*this, tree.node()); }

    std::string operator()(const Node::EntityRef& e) const { return ctx_.resolve_label(e.label, e.symbol_id); }

    std::string operator()(const Node::RelationRef& r) const {
        return humanize_predicate(ctx_.resolve_label(r.label, r.symbol_id), lexicon_);
    }

    std::string operator()(const Node::Freeform& f) const { return f.text; }

    std::string operator()(const Node::Triple& t) const {
        std::string s = render(*t.subject);
        std::string p = render(*t.predicate);
        std::string o = render(*t.object);
        return std::string(grammar_.next_transition()) + s + " " + p + " " + o + ".";
    }

    std::string operator()(const Node::Similarity& s) const {
        std::string e = render(*s.entity);
        std::string other = render(*s.similar_to);
        return std::string(grammar_.next_transition()) + e + " shares " + similarity_strength(s.score) + " to " +
               other + ".";
    }

    std::string operator()(const Node::Gap& g) const {
        std::string e = render(*g.entity);
        return std::string(grammar_.next_gap_opener()) + ": regarding " + e + ", " + g.description + ".";
    }

    std::string operator()(const Node::Inference& i) const {
        return std::string(grammar_.next_transition()) + "Through symbolic reasoning, `" + i.expression +
               "` reduces to `" + i.simplified + "`.";
    }

    std::string operator()(const Node::CodeFact& c) const {
        return std::string(grammar_.next_transition()) + "The " + c.kind + " `" + c.name + "` serves as " +
               c.detail + ".";
    }

    std::string operator()(const Node::CodeModule&) const { return unsupported(Category::CodeModule); }
    std::string operator()(const Node::CodeSignature&) const { return unsupported(Category::CodeSignature); }
    std::string operator()(const Node::DataFlow&) const { return unsupported(Category::DataFlow); }

    std::string operator()(const Node::WithConfidence& c) const {
        std::string text = render(*c.inner);
        const char* q = confidence_qualifier(c.confidence);
        if (ends_with(text, ".")) return strip_period(text) + ", " + q + ".";
        return text + ", " + q;
    }

    std::string operator()(const Node::WithProvenance& p) const {
        std::string text = render(*p.inner);
        std::string prov = narrative_provenance(p.tag);
        if (ends_with(text, ".")) return strip_period(text) + " (" + prov + ").";
        return text + " (" + prov + ")";
    }

    std::string operator()(const Node::DiscourseFrame& d) const { return render(*d.inner); }

    std::string operator()(const Node::Conjunction& c) const {
        std::vector<std::string> parts;
        for (const auto& item : c.items) parts.push_back(render(item));
        if (c.is_and) return join(parts, " ");
        for (auto& p : parts) p = strip_period(p);
        return "Either " + join_list(parts, "or") + ", depending on the context.";
    }

    std::string operator()(const Node::Section& s) const {
        std::string out = "## " + s.heading + "\n\n";
        grammar_.reset_transitions();
        for (const auto& item : s.body) {
            std::string line = render(item);
            out += line;
            if (!ends_with(line, "\n")) out += '\n';
        }
        return out;
    }

    std::string operator()(const Node::Document& d) const {
        std::string out = render(*d.overview);
        if (!ends_with(out, "\n")) out += "\n\n";
        for (const auto& section : d.sections) {
            std::string text = render(section);
            out += text;
            if (!ends_with(text, "\n")) out += '\n';
        }
        if (!d.gaps.empty()) {
            out += "\n## Open Questions\n\n";
            for (const auto& gap : d.gaps) {
                std::string text = render(gap);
                out += "- " + text;
                if (!ends_with(text, "\n")) out += '\n';
            }
        }
        return out;
    }

private:
    [[noreturn]] std::string unsupported(Category cat) const {
        throw LinearizationFailed(cat, grammar_.name(), "code structure is rendered by rust-gen or formal");
    }

    const NarrativeGrammar& grammar_;
    const LinContext& ctx_;
    const Lexicon& lexicon_;
};

} // namespace

const char* NarrativeGrammar::next_transition() const {
    size_t idx = transition_counter_.fetch_add(1, std::memory_order_relaxed);
    return kTransitions[idx % kTransitions.size()];
}

const char* NarrativeGrammar::next_gap_opener() const {
    size_t idx = transition_counter_.load(std::memory_order_relaxed);
    return kGapOpeners[idx % kGapOpeners.size()];
}

std::string NarrativeGrammar::linearize(const SemanticTree& tree, const LinContext& ctx) const {
    return NarrativeWriter(*this, ctx).render(tree);
}

const std::vector<Category>& NarrativeGrammar::supported_categories() const {
    static const std::vector<Category> cats = {
        Category::Entity,     Category::Relation,    Category::Statement, Category::Similarity,
        Category::Gap,        Category::Inference,   Category::CodeFact,  Category::Confidence,
        Category::Provenance, Category::Conjunction, Category::Section,   Category::Document,
        Category::Freeform,   Category::DiscourseFrame};
    return cats;
}

std::string narrative_provenance(const ProvenanceTag& tag) {
    switch (tag.kind) {
        case ProvenanceTag::Kind::Extracted:     return "drawn from source material";
        case ProvenanceTag::Kind::GraphInferred: return "inferred from the knowledge graph";
        case ProvenanceTag::Kind::VsaInferred:
            return "suggested by vector similarity at " + format_percent(tag.similarity);
        case ProvenanceTag::Kind::Reasoned:      return "derived through symbolic reasoning";
        case ProvenanceTag::Kind::AgentDerived:  return "discovered by the agent";
        case ProvenanceTag::Kind::Enrichment:    return "identified through semantic analysis";
        case ProvenanceTag::Kind::UserAsserted:  return "as stated by the user";
    }
    return "of unknown origin";
}

const char* confidence_qualifier(float confidence) {
    if (confidence > 0.9f) return "with high confidence";
    if (confidence > 0.7f) return "with moderate confidence";
    if (confidence > 0.5f) return "tentatively";
    return "speculatively";
}

const char* similarity_strength(float score) {
    if (score > 0.9f) return "a striking resemblance";
    if (score > 0.7f) return "a close resemblance";
    if (score > 0.5f) return "some similarity";
    return "a faint resemblance";
}

} // namespace Glossa
