/**
 * @file lexicon.hpp
 * @brief Per-language function-word tables and the lookups built on them
 *
 * A Lexicon is static data: articles, relational patterns, question words,
 * auxiliaries, goal verbs and command words for one language. Callers never
 * branch on language themselves; they ask the lexicon.
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Glossa {

enum class Language {
    English,
    Russian,
    Arabic,
    French,
    Spanish,
    Auto        // detect from the input
};

/// BCP-47 code: "en", "ru", "ar", "fr", "es", "auto".
GLOSSA_API const char* language_code(Language lang);
GLOSSA_API const char* language_name(Language lang);

/**
 * @brief Language for a BCP-47 code or English name, case-insensitive
 * @throws UnsupportedLanguage for anything else
 */
GLOSSA_API Language language_from_code(std::string_view code);

/**
 * @brief A multi-word surface pattern and the predicate it stands for.
 *
 * "is located in" -> located-in. Words are lowercase.
 */
struct RelationalPattern {
    std::vector<std::string> words;
    std::string predicate_label;
    float default_confidence = 0.85f;
};

enum class QuestionWord {
    What,
    Who,
    Where,
    When,
    How,
    Why,
    Which,
    YesNo
};

GLOSSA_API const char* question_word_name(QuestionWord q);

/**
 * @brief Structural decomposition of a question.
 *
 * "What can you do?" -> question word "what", auxiliary "can",
 * content ["you"], capability = true.
 */
struct GLOSSA_API QuestionFrame {
    std::optional<std::string> question_word;   // lowercase surface
    std::optional<QuestionWord> kind;
    std::optional<std::string> auxiliary;       // lowercase surface
    std::vector<std::string> content;           // surface forms
    bool capability = false;

    std::string subject() const;
};

/**
 * @brief A non-declarative command.
 */
struct Command {
    enum class Kind {
        Help,
        ShowStatus,
        RunAgent,       // cycles
        RenderHiero,    // entity
        SetGoal         // description
    };

    Kind kind = Kind::Help;
    std::optional<size_t> cycles;
    std::optional<std::string> entity;
    std::string description;

    static Command help() { return Command{Kind::Help, std::nullopt, std::nullopt, {}}; }
    static Command show_status() { return Command{Kind::ShowStatus, std::nullopt, std::nullopt, {}}; }
    static Command run_agent(std::optional<size_t> n) { return Command{Kind::RunAgent, n, std::nullopt, {}}; }
    static Command render(std::optional<std::string> e) {
        return Command{Kind::RenderHiero, std::nullopt, std::move(e), {}};
    }
    static Command set_goal(std::string d) {
        return Command{Kind::SetGoal, std::nullopt, std::nullopt, std::move(d)};
    }

    bool operator==(const Command& o) const {
        return kind == o.kind && cycles == o.cycles && entity == o.entity && description == o.description;
    }
};

GLOSSA_API const char* command_kind_name(Command::Kind kind);

class GLOSSA_API Lexicon {
public:
    /**
     * @brief Process-wide lexicon for a language. Auto maps to English.
     *
     * Built once on first use and never mutated afterwards.
     */
    static const Lexicon& for_language(Language lang);

    Language language() const { return language_; }

    bool is_void(std::string_view word) const;
    bool is_question_word(std::string_view word) const;
    bool is_auxiliary_verb(std::string_view word) const;
    bool is_trailing_auxiliary(std::string_view word) const;
    bool is_capability_modal(std::string_view word) const;
    bool is_goal_verb(std::string_view word) const;
    bool is_and(std::string_view word) const;
    bool is_or(std::string_view word) const;

    std::optional<QuestionWord> question_kind(std::string_view word) const;

    /**
     * @brief Relational patterns, longest first
     */
    const std::vector<RelationalPattern>& relational_patterns() const { return relational_patterns_; }

    /**
     * @brief Whether the input reads as a question: trailing question mark
     *        or a leading question word
     */
    bool looks_like_question(std::string_view input) const;

    QuestionFrame parse_question_frame(std::string_view input) const;

    std::optional<Command> match_command(std::string_view input) const;

    /**
     * @brief The trimmed input when it opens with a goal verb
     */
    std::optional<std::string> match_goal(std::string_view input) const;

    /**
     * @brief Whether any relational pattern occurs between two other words
     */
    bool contains_assertion_pattern(std::string_view input) const;

    /**
     * @brief Preferred surface words for a canonical predicate ("is-a" -> "is a")
     */
    std::optional<std::string> surface_form(std::string_view predicate_label) const;

private:
    struct QuestionEntry {
        std::vector<std::string> words;
        QuestionWord kind;
    };

    explicit Lexicon(Language lang) : language_(lang) {}

    static Lexicon english();
    static Lexicon russian();
    static Lexicon arabic();
    static Lexicon french();
    static Lexicon spanish();

    void add_pattern(std::string_view words, std::string label, float confidence);
    void add_question(std::string_view words, QuestionWord kind);
    void finish();

    Language language_;
    std::vector<std::string> void_words_;
    std::vector<RelationalPattern> relational_patterns_;
    std::vector<QuestionEntry> question_words_;
    std::vector<std::string> goal_verbs_;
    std::vector<std::pair<std::string, Command::Kind>> commands_;
    std::vector<std::string> run_words_;
    std::vector<std::string> show_words_;
    std::vector<std::string> status_words_;
    std::vector<std::string> auxiliary_verbs_;
    std::vector<std::string> trailing_auxiliaries_;
    std::vector<std::string> capability_modals_;
    std::vector<std::string> and_words_;
    std::vector<std::string> or_words_;
};

} // namespace Glossa
