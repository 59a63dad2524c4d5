/**
 * @file parser.cpp
 * @brief Prose parser and intent classifier
 */

#include <grammar/parser.hpp>
#include <grammar/error.hpp>
#include <grammar/lexer.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Glossa {

namespace {

constexpr float kGroundedFactor = 1.0f;
constexpr float kUngroundedFactor = 0.8f;
constexpr float kBareTripleConfidence = 0.7f;

SemanticTree token_to_entity(const Token& token) {
    if (auto id = token.resolution.id()) return SemanticTree::entity(token.surface, *id);
    return SemanticTree::entity(token.surface);
}

/// Content tokens as one entity; the first resolved id among them is inherited.
std::optional<SemanticTree> tokens_to_entity(const std::vector<Token>& tokens, size_t begin, size_t end) {
    std::vector<const Token*> content;
    for (size_t i = begin; i < end; ++i) {
        if (!tokens[i].semantically_void) content.push_back(&tokens[i]);
    }
    if (content.empty()) return std::nullopt;
    if (content.size() == 1) return token_to_entity(*content[0]);

    std::vector<std::string> words;
    std::optional<SymbolId> id;
    for (const Token* t : content) {
        words.push_back(t->surface);
        if (!id) id = t->resolution.id();
    }
    std::string label = join(words, " ");
    return id ? SemanticTree::entity(std::move(label), *id) : SemanticTree::entity(std::move(label));
}

float resolution_factor(const SemanticTree& entity) {
    return entity.symbol_id() ? kGroundedFactor : kUngroundedFactor;
}

struct FactCandidate {
    SemanticTree tree;
    std::string predicate;
    float confidence;
};

std::vector<std::vector<Token>> split_clauses(const std::vector<Token>& tokens, const Lexicon& lexicon,
                                              bool& is_and) {
    std::vector<std::vector<Token>> clauses;
    std::vector<Token> current;
    bool any_split = false;

    for (const auto& t : tokens) {
        bool a = lexicon.is_and(t.normalized);
        bool o = !a && lexicon.is_or(t.normalized);
        if (a || o) {
            // The last coordinator decides and/or.
            is_and = a;
            any_split = true;
            if (!current.empty()) clauses.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(t);
        }
    }
    if (!current.empty()) clauses.push_back(std::move(current));
    if (!any_split) clauses.clear();
    return clauses;
}

} // namespace

// =============================================================================
// ParseResult
// =============================================================================

ParseResult ParseResult::make_facts(std::vector<SemanticTree> facts) {
    ParseResult r;
    r.kind = Kind::Facts;
    r.facts = std::move(facts);
    return r;
}

ParseResult ParseResult::make_query(std::string subject, QuestionFrame frame) {
    ParseResult r;
    r.kind = Kind::Query;
    r.tree = SemanticTree::entity(subject);
    r.subject = std::move(subject);
    r.frame = std::move(frame);
    return r;
}

ParseResult ParseResult::make_command(Command command) {
    ParseResult r;
    r.kind = Kind::Command;
    r.command = std::move(command);
    return r;
}

ParseResult ParseResult::make_goal(std::string description) {
    ParseResult r;
    r.kind = Kind::Goal;
    r.description = std::move(description);
    return r;
}

ParseResult ParseResult::make_freeform(std::string text, std::vector<SemanticTree> partial) {
    ParseResult r;
    r.kind = Kind::Freeform;
    r.text = std::move(text);
    r.partial = std::move(partial);
    return r;
}

const char* parse_result_kind_name(ParseResult::Kind kind) {
    switch (kind) {
        case ParseResult::Kind::Facts:    return "facts";
        case ParseResult::Kind::Query:    return "query";
        case ParseResult::Kind::Command:  return "command";
        case ParseResult::Kind::Goal:     return "goal";
        case ParseResult::Kind::Freeform: return "freeform";
    }
    return "freeform";
}

// =============================================================================
// Facts
// =============================================================================

std::optional<SemanticTree> parse_fact(const std::vector<Token>& tokens, const Lexicon& lexicon) {
    if (tokens.empty()) return std::nullopt;

    std::vector<FactCandidate> candidates;
    for (const auto& pattern : lexicon.relational_patterns()) {
        auto split = find_relational_pattern(tokens, pattern);
        if (!split) continue;

        auto subject = tokens_to_entity(tokens, 0, split->first);
        auto object = tokens_to_entity(tokens, split->second, tokens.size());
        if (!subject || !object) continue;

        float confidence = std::min(
            std::cbrt(pattern.default_confidence * resolution_factor(*subject) * resolution_factor(*object)),
            1.0f);
        SemanticTree predicate = SemanticTree::relation(pattern.predicate_label);

        SemanticTree tree = std::fabs(confidence - 1.0f) < std::numeric_limits<float>::epsilon()
            ? SemanticTree::triple(std::move(*subject), std::move(predicate), std::move(*object))
            : SemanticTree::triple_with_confidence(std::move(*subject), std::move(predicate),
                                                   std::move(*object), confidence);
        candidates.push_back({std::move(tree), pattern.predicate_label, confidence});
    }

    if (!candidates.empty()) {
        size_t best = 0;
        size_t distinct = 1;
        for (size_t i = 1; i < candidates.size(); ++i) {
            if (candidates[i].predicate != candidates[0].predicate) ++distinct;
            // Strict: patterns are longest first, so the longer one keeps a tie.
            if (candidates[i].confidence > candidates[best].confidence) best = i;
        }
        if (distinct > 1) {
            std::vector<std::string> surface;
            for (const auto& t : tokens) surface.push_back(t.surface);
            Logger::debug(std::string(Ambiguous(join(surface, " "), distinct).what()) +
                          "; taking " + candidates[best].predicate);
        }
        return std::move(candidates[best].tree);
    }

    // Three content words and no pattern: read them as subject, predicate, object.
    std::vector<const Token*> content;
    for (const auto& t : tokens) {
        if (!t.semantically_void) content.push_back(&t);
    }
    if (content.size() == 3) {
        return SemanticTree::with_confidence(
            SemanticTree::triple(token_to_entity(*content[0]),
                                 SemanticTree::relation(content[1]->normalized),
                                 token_to_entity(*content[2])),
            kBareTripleConfidence);
    }
    return std::nullopt;
}

// =============================================================================
// Cascade
// =============================================================================

ParseResult parse_prose(std::string_view input, const ParseContext& ctx) {
    std::string_view trimmed = trim(input);
    if (trimmed.empty()) return ParseResult::make_freeform("");

    const Lexicon& lexicon = ctx.lexicon_for(trimmed);

    if (auto cmd = lexicon.match_command(trimmed)) {
        return ParseResult::make_command(*cmd);
    }
    if (auto goal = lexicon.match_goal(trimmed)) {
        return ParseResult::make_goal(*goal);
    }
    if (lexicon.looks_like_question(trimmed)) {
        QuestionFrame frame = lexicon.parse_question_frame(trimmed);
        std::string subject = frame.subject();
        return ParseResult::make_query(std::move(subject), std::move(frame));
    }

    std::vector<Token> tokens = tokenize(trimmed, ctx.registry, ctx.ops, ctx.index, lexicon, ctx.lexer);
    std::vector<SemanticTree> partial;

    bool is_and = true;
    auto clauses = split_clauses(tokens, lexicon, is_and);
    if (clauses.size() >= 2) {
        std::vector<SemanticTree> facts;
        for (const auto& clause : clauses) {
            if (auto fact = parse_fact(clause, lexicon)) facts.push_back(std::move(*fact));
        }
        if (facts.size() >= 2) {
            SemanticTree tree = is_and ? SemanticTree::conjunction(std::move(facts))
                                       : SemanticTree::disjunction(std::move(facts));
            std::vector<SemanticTree> out;
            out.push_back(std::move(tree));
            return ParseResult::make_facts(std::move(out));
        }
        partial = std::move(facts);
    }

    if (auto fact = parse_fact(tokens, lexicon)) {
        std::vector<SemanticTree> out;
        out.push_back(std::move(*fact));
        return ParseResult::make_facts(std::move(out));
    }

    return ParseResult::make_freeform(std::string(trimmed), std::move(partial));
}

SemanticTree parse_universal(std::string_view input, const ParseContext& ctx) {
    ParseResult result = parse_prose(input, ctx);
    switch (result.kind) {
        case ParseResult::Kind::Facts:
            if (result.facts.size() == 1) return std::move(result.facts.front());
            return SemanticTree::conjunction(std::move(result.facts));
        case ParseResult::Kind::Query:
            return SemanticTree::entity(result.subject);
        case ParseResult::Kind::Command:
            throw ParseFailed(std::string(input));
        case ParseResult::Kind::Goal:
            return SemanticTree::freeform(result.description);
        case ParseResult::Kind::Freeform:
            break;
    }
    return SemanticTree::freeform(result.text);
}

// =============================================================================
// Intent
// =============================================================================

const char* intent_kind_name(UserIntent::Kind kind) {
    switch (kind) {
        case UserIntent::Kind::Query:       return "query";
        case UserIntent::Kind::Assert:      return "assert";
        case UserIntent::Kind::SetGoal:     return "set-goal";
        case UserIntent::Kind::RunAgent:    return "run-agent";
        case UserIntent::Kind::ShowStatus:  return "show-status";
        case UserIntent::Kind::RenderHiero: return "render-hiero";
        case UserIntent::Kind::Help:        return "help";
        case UserIntent::Kind::Freeform:    return "freeform";
    }
    return "freeform";
}

UserIntent classify_intent(std::string_view input, const Lexicon& lexicon) {
    UserIntent intent;
    std::string_view trimmed = trim(input);
    if (trimmed.empty()) return intent;

    if (auto cmd = lexicon.match_command(trimmed)) {
        switch (cmd->kind) {
            case Command::Kind::Help:
                intent.kind = UserIntent::Kind::Help;
                break;
            case Command::Kind::ShowStatus:
                intent.kind = UserIntent::Kind::ShowStatus;
                break;
            case Command::Kind::RunAgent:
                intent.kind = UserIntent::Kind::RunAgent;
                intent.cycles = cmd->cycles;
                break;
            case Command::Kind::RenderHiero:
                intent.kind = UserIntent::Kind::RenderHiero;
                intent.entity = cmd->entity;
                break;
            case Command::Kind::SetGoal:
                intent.kind = UserIntent::Kind::SetGoal;
                intent.text = cmd->description;
                break;
        }
        return intent;
    }

    if (lexicon.looks_like_question(trimmed)) {
        QuestionFrame frame = lexicon.parse_question_frame(trimmed);
        intent.kind = UserIntent::Kind::Query;
        intent.text = frame.subject();
        intent.frame = std::move(frame);
        return intent;
    }

    if (auto goal = lexicon.match_goal(trimmed)) {
        intent.kind = UserIntent::Kind::SetGoal;
        intent.text = *goal;
        return intent;
    }

    intent.text = std::string(trimmed);
    intent.kind = lexicon.contains_assertion_pattern(trimmed) ? UserIntent::Kind::Assert
                                                              : UserIntent::Kind::Freeform;
    return intent;
}

} // namespace Glossa
