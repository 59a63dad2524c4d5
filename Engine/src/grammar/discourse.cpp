/**
 * @file discourse.cpp
 */

#include <grammar/discourse.hpp>
#include <grammar/error.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <tuple>

namespace Glossa {

namespace {

constexpr std::string_view kRefersTo = "refers-to";
constexpr std::string_view kSelf = "self";
constexpr std::string_view kResponseDetail = "discourse:response-detail";

const std::vector<std::string_view> kIdentityPredicates = {"is-a", "has-name", "powered-by", "named"};
const std::vector<std::string_view> kDeprioritizedPredicates = {"has-state", "has-status", "refers-to"};
const std::vector<std::string_view> kInfrastructurePredicates = {"asks-about", "is-question-word",
                                                                 "discourse-type", "has-discourse-role"};

bool one_of(std::string_view label, const std::vector<std::string_view>& set) {
    return std::find(set.begin(), set.end(), label) != set.end();
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool is_infrastructure(std::string_view predicate) {
    return one_of(predicate, kInfrastructurePredicates) || starts_with(predicate, "discourse:");
}

} // namespace

const char* response_detail_name(ResponseDetail detail) {
    switch (detail) {
        case ResponseDetail::Concise: return "concise";
        case ResponseDetail::Normal:  return "normal";
        case ResponseDetail::Full:    return "full";
    }
    return "normal";
}

bool is_metadata_label(std::string_view label) {
    static const std::string_view prefixes[] = {"desc:", "status:",  "priority:", "criteria:", "goal:",
                                                "agent:", "episode:", "summary:",  "tag:"};
    for (auto prefix : prefixes) {
        if (starts_with(label, prefix)) return true;
    }
    return false;
}

PredicateCategory categorize_predicate(std::string_view p) {
    if (p == "is-a" || p == "has-name" || p == "named" || p == "instance-of") return PredicateCategory::Identity;
    if (p == "powered-by" || p == "built-by" || p == "created-by" || p == "runs-on") return PredicateCategory::Power;
    if (p == "has-role" || p == "serves-as" || p == "role-of" || p == "works-as") return PredicateCategory::Role;
    if (p == "has-capability" || p == "can" || p == "capable-of" || contains(p, "capabilit")) {
        return PredicateCategory::Capability;
    }
    if (p == "has-state" || p == "has-status" || contains(p, "state")) return PredicateCategory::State;
    return PredicateCategory::Other;
}

QueryFocus classify_focus(std::optional<QuestionWord> word, bool capability) {
    if (capability) return QueryFocus::Capability;
    if (!word) return QueryFocus::General;
    switch (*word) {
        case QuestionWord::Who:
        case QuestionWord::What:  return QueryFocus::Identity;
        case QuestionWord::How:   return QueryFocus::Method;
        case QuestionWord::Why:   return QueryFocus::Cause;
        case QuestionWord::Where: return QueryFocus::Location;
        case QuestionWord::When:  return QueryFocus::Time;
        case QuestionWord::Which: return QueryFocus::Definition;
        case QuestionWord::YesNo: return QueryFocus::Confirmation;
    }
    return QueryFocus::General;
}

int score_predicate(std::string_view p, QueryFocus focus, const DiscourseConfig& config) {
    int base = 0;
    switch (focus) {
        case QueryFocus::Identity:
            if (one_of(p, kIdentityPredicates)) base = config.focus_bonus;
            else if (one_of(p, kDeprioritizedPredicates)) base = config.deprioritized_penalty;
            break;
        case QueryFocus::Location:
            if (p == "located-in" || p == "part-of") base = config.focus_bonus;
            break;
        case QueryFocus::Method:
            if (contains(p, "method") || contains(p, "process") || p == "has-capability") base = config.focus_bonus;
            break;
        case QueryFocus::Capability:
            if (categorize_predicate(p) == PredicateCategory::Capability) base = config.focus_bonus;
            else if (one_of(p, kDeprioritizedPredicates)) base = config.deprioritized_penalty;
            break;
        default:
            break;
    }
    return p == "is-a" ? base + config.is_a_bonus : base;
}

DiscourseContext resolve_discourse(std::string_view subject, std::optional<QuestionWord> question_word,
                                   bool capability, std::string_view original_input,
                                   const SymbolRegistry& registry, const KnowledgeGraph& graph) {
    auto subject_id = registry.lookup(subject);
    if (!subject_id) throw UnresolvedEntity(std::string(subject));

    DiscourseContext ctx;
    ctx.original_subject = std::string(subject);
    ctx.original_input = std::string(original_input);
    ctx.question_word = question_word;
    ctx.subject_id = *subject_id;
    ctx.resolved_subject = registry.label_of(*subject_id).value_or(std::string(subject));

    if (auto refers_to = registry.lookup(kRefersTo)) {
        for (const auto& t : graph.triples_from(*subject_id)) {
            if (t.predicate != *refers_to) continue;
            ctx.subject_id = t.object;
            ctx.resolved_subject = registry.label_of(t.object).value_or("sym:" + std::to_string(t.object));
            ctx.pronoun_resolved = true;
            break;
        }
    }

    if (iequals(ctx.resolved_subject, kSelf)) ctx.pov = PointOfView::FirstPerson;
    else if (ctx.pronoun_resolved) ctx.pov = PointOfView::SecondPerson;
    else ctx.pov = PointOfView::ThirdPerson;

    ctx.focus = classify_focus(question_word, capability);
    return ctx;
}

DiscourseContext resolve_discourse(const QuestionFrame& frame, std::string_view original_input,
                                   const SymbolRegistry& registry, const KnowledgeGraph& graph) {
    return resolve_discourse(frame.subject(), frame.kind, frame.capability, original_input, registry, graph);
}

ResponseDetail response_detail_for(SymbolId subject, const SymbolRegistry& registry, const KnowledgeGraph& graph) {
    auto predicate = registry.lookup(kResponseDetail);
    if (!predicate) return ResponseDetail::Normal;

    for (const auto& t : graph.triples_from(subject)) {
        if (t.predicate != *predicate) continue;
        std::string value = to_lower(registry.label_of(t.object).value_or(""));
        if (value == "concise") return ResponseDetail::Concise;
        if (value == "full") return ResponseDetail::Full;
        if (value == "normal") return ResponseDetail::Normal;
        Logger::debug("Ignoring unknown response detail '" + value + "'");
    }
    return ResponseDetail::Normal;
}

SemanticTree triple_to_tree(const GraphTriple& triple, const SymbolRegistry& registry) {
    auto label = [&](SymbolId id) { return registry.label_of(id).value_or("sym:" + std::to_string(id)); };

    SemanticTree base = SemanticTree::triple(SemanticTree::entity(label(triple.subject), triple.subject),
                                             SemanticTree::relation(label(triple.predicate), triple.predicate),
                                             SemanticTree::entity(label(triple.object), triple.object));
    if (std::fabs(triple.confidence - 1.0f) > std::numeric_limits<float>::epsilon()) {
        return SemanticTree::with_confidence(std::move(base), triple.confidence);
    }
    return base;
}

std::optional<SemanticTree> build_discourse_response(const std::vector<GraphTriple>& triples,
                                                     const DiscourseContext& ctx,
                                                     const SymbolRegistry& registry,
                                                     const KnowledgeGraph& graph,
                                                     const DiscourseConfig& config) {
    struct Ranked {
        SemanticTree tree;
        int score;
        PredicateCategory category;
    };

    std::set<std::tuple<SymbolId, SymbolId, SymbolId>> seen;
    std::vector<Ranked> ranked;

    for (const auto& t : triples) {
        if (!seen.insert({t.subject, t.predicate, t.object}).second) continue;

        auto subject = registry.label_of(t.subject);
        auto predicate = registry.label_of(t.predicate);
        auto object = registry.label_of(t.object);
        if (!subject || !predicate || !object) continue;

        if (is_infrastructure(*predicate) || *predicate == kRefersTo) continue;
        if (is_metadata_label(*subject) || is_metadata_label(*predicate) || is_metadata_label(*object)) continue;

        int score = score_predicate(*predicate, ctx.focus, config);
        if (score < 0) continue;
        ranked.push_back({triple_to_tree(t, registry), score, categorize_predicate(*predicate)});
    }

    if (ranked.empty()) return std::nullopt;

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked& a, const Ranked& b) { return a.score > b.score; });

    size_t limit = ranked.size();
    switch (response_detail_for(ctx.subject_id, registry, graph)) {
        case ResponseDetail::Concise: limit = config.concise_limit; break;
        case ResponseDetail::Normal:  limit = config.normal_limit; break;
        case ResponseDetail::Full:    break;
    }
    if (ranked.size() > limit) ranked.resize(limit);

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked& a, const Ranked& b) { return a.category < b.category; });

    std::vector<SemanticTree> items;
    items.reserve(ranked.size());
    for (auto& r : ranked) items.push_back(std::move(r.tree));

    SemanticTree inner = items.size() == 1 ? std::move(items.front()) : SemanticTree::conjunction(std::move(items));
    return SemanticTree::discourse_frame(std::move(inner), ctx.pov, ctx.focus);
}

} // namespace Glossa
