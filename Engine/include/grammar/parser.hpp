/**
 * @file parser.hpp
 * @brief Prose -> SemanticTree by a fixed priority cascade
 *
 * Commands, goals, questions, coordinated clauses, single facts, freeform.
 * The first stage that matches wins.
 */

#pragma once

#include <grammar/context.hpp>
#include <grammar/lexicon.hpp>
#include <grammar/semantic_tree.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

struct GLOSSA_API ParseResult {
    enum class Kind {
        Facts,
        Query,
        Command,
        Goal,
        Freeform
    };

    Kind kind = Kind::Freeform;

    std::vector<SemanticTree> facts;            // Facts
    std::string subject;                        // Query
    SemanticTree tree;                          // Query: entity(subject)
    std::optional<QuestionFrame> frame;         // Query
    std::optional<Command> command;             // Command
    std::string description;                    // Goal
    std::string text;                           // Freeform
    std::vector<SemanticTree> partial;          // Freeform: clauses that did parse

    static ParseResult make_facts(std::vector<SemanticTree> facts);
    static ParseResult make_query(std::string subject, QuestionFrame frame);
    static ParseResult make_command(Command command);
    static ParseResult make_goal(std::string description);
    static ParseResult make_freeform(std::string text, std::vector<SemanticTree> partial = {});
};

GLOSSA_API const char* parse_result_kind_name(ParseResult::Kind kind);

/**
 * @brief Parse prose. Never throws on unparsable input; that becomes Freeform.
 */
GLOSSA_API ParseResult parse_prose(std::string_view input, const ParseContext& ctx);

/**
 * @brief parse_prose collapsed to one tree, for renderers without a parser of their own.
 *
 * Several facts become an and-conjunction; a query becomes its subject entity.
 * @throws ParseFailed for commands, which have no tree form
 */
GLOSSA_API SemanticTree parse_universal(std::string_view input, const ParseContext& ctx);

/**
 * @brief Parse one clause already tokenized. Null when no pattern fits.
 */
GLOSSA_API std::optional<SemanticTree> parse_fact(const std::vector<Token>& tokens, const Lexicon& lexicon);

// =============================================================================
// Intent classification
// =============================================================================

struct UserIntent {
    enum class Kind {
        Query,
        Assert,
        SetGoal,
        RunAgent,
        ShowStatus,
        RenderHiero,
        Help,
        Freeform
    };

    Kind kind = Kind::Freeform;
    std::string text;                       // subject, asserted text, goal, or freeform text
    std::optional<QuestionFrame> frame;     // Query
    std::optional<size_t> cycles;           // RunAgent
    std::optional<std::string> entity;      // RenderHiero
};

GLOSSA_API const char* intent_kind_name(UserIntent::Kind kind);

/**
 * @brief Coarse classification of a user utterance.
 *
 * Order: commands, questions, goals, assertions, freeform. Questions are
 * checked before goals here, unlike parse_prose.
 */
GLOSSA_API UserIntent classify_intent(std::string_view input, const Lexicon& lexicon);

} // namespace Glossa
