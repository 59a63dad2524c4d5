/**
 * @file discourse.hpp
 * @brief Query-aware response assembly
 *
 * Resolves pronoun subjects through `refers-to` edges, picks the point of
 * view and query focus, then filters, ranks and frames the graph triples
 * that answer the query.
 *
 *   "Who are you?" -> "you" refers-to "self" -> FirstPerson, Identity
 *                  -> is-a / has-name triples first, has-state dropped
 *                  -> DiscourseFrame{FirstPerson, Identity, Conjunction[...]}
 */

#pragma once

#include <grammar/lexicon.hpp>
#include <grammar/semantic_tree.hpp>
#include <grammar/symbol_registry.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

/**
 * @brief Tuned discourse constants.
 */
struct DiscourseConfig {
    int focus_bonus = 10;
    int deprioritized_penalty = -5;
    int is_a_bonus = 5;
    size_t concise_limit = 3;
    size_t normal_limit = 8;
};

enum class ResponseDetail {
    Concise,
    Normal,
    Full
};

GLOSSA_API const char* response_detail_name(ResponseDetail detail);

/**
 * @brief Grouping used for the final ordering of a response.
 *
 * Declaration order is presentation order.
 */
enum class PredicateCategory {
    Identity,
    Power,
    Role,
    Capability,
    Other,
    State
};

GLOSSA_API PredicateCategory categorize_predicate(std::string_view predicate_label);

/**
 * @brief Agent-internal labels (desc:, status:, goal:, ...) never shown to users
 */
GLOSSA_API bool is_metadata_label(std::string_view label);

/**
 * @brief Focus for a question word; the capability flag wins over any word
 */
GLOSSA_API QueryFocus classify_focus(std::optional<QuestionWord> word, bool capability = false);

/**
 * @brief Relevance of a predicate to a focus. Negative means drop.
 */
GLOSSA_API int score_predicate(std::string_view predicate_label, QueryFocus focus,
                               const DiscourseConfig& config = {});

struct DiscourseContext {
    std::string resolved_subject;
    SymbolId subject_id = 0;
    std::string original_subject;
    bool pronoun_resolved = false;
    PointOfView pov = PointOfView::ThirdPerson;
    QueryFocus focus = QueryFocus::General;
    std::optional<QuestionWord> question_word;
    std::string original_input;
};

/**
 * @brief Resolve subject, point of view and focus for a query.
 *
 * A `refers-to` edge from the subject is followed one hop.
 *
 * @throws UnresolvedEntity if the subject is not a known symbol
 */
GLOSSA_API DiscourseContext resolve_discourse(std::string_view subject, std::optional<QuestionWord> question_word,
                                              bool capability, std::string_view original_input,
                                              const SymbolRegistry& registry, const KnowledgeGraph& graph);

GLOSSA_API DiscourseContext resolve_discourse(const QuestionFrame& frame, std::string_view original_input,
                                              const SymbolRegistry& registry, const KnowledgeGraph& graph);

/**
 * @brief Detail level stored on the subject as `discourse:response-detail`; Normal if absent
 */
GLOSSA_API ResponseDetail response_detail_for(SymbolId subject, const SymbolRegistry& registry,
                                              const KnowledgeGraph& graph);

/**
 * @brief Graph edge as a tree: entity, relation, entity; WithConfidence unless exactly 1.0
 *
 * Labels the registry does not know render as "sym:<id>".
 */
GLOSSA_API SemanticTree triple_to_tree(const GraphTriple& triple, const SymbolRegistry& registry);

/**
 * @brief Filter, rank, truncate and frame the triples answering a query.
 *
 * @return nullopt when nothing survives filtering
 */
GLOSSA_API std::optional<SemanticTree> build_discourse_response(const std::vector<GraphTriple>& triples,
                                                                const DiscourseContext& ctx,
                                                                const SymbolRegistry& registry,
                                                                const KnowledgeGraph& graph,
                                                                const DiscourseConfig& config = {});

} // namespace Glossa
