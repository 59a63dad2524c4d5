/**
 * @file test_lexicon.cpp
 * @brief Unit tests for the per-language function-word tables
 */

#include <gtest/gtest.h>
#include <grammar/lexicon.hpp>
#include <grammar/error.hpp>

using namespace Glossa;

namespace {
const Lexicon& en() { return Lexicon::for_language(Language::English); }
}

// ============================================================================
// Language codes
// ============================================================================

TEST(LexiconTest, LanguageCodes) {
    EXPECT_STREQ(language_code(Language::Russian), "ru");
    EXPECT_STREQ(language_name(Language::Arabic), "Arabic");
    EXPECT_EQ(language_from_code("FR"), Language::French);
    EXPECT_EQ(language_from_code("spanish"), Language::Spanish);
    EXPECT_EQ(language_from_code(" auto "), Language::Auto);
}

TEST(LexiconTest, UnknownLanguageThrows) {
    try {
        language_from_code("tlh");
        FAIL() << "expected UnsupportedLanguage";
    } catch (const UnsupportedLanguage& e) {
        EXPECT_EQ(e.language(), "tlh");
        EXPECT_EQ(e.kind(), GrammarError::Kind::UnsupportedLanguage);
    }
}

TEST(LexiconTest, AutoMapsToEnglish) {
    EXPECT_EQ(&Lexicon::for_language(Language::Auto), &en());
    EXPECT_EQ(Lexicon::for_language(Language::Russian).language(), Language::Russian);
}

// ============================================================================
// Word classes and patterns
// ============================================================================

TEST(LexiconTest, EnglishWordClasses) {
    EXPECT_TRUE(en().is_void("the"));
    EXPECT_FALSE(en().is_void("dog"));
    EXPECT_TRUE(en().is_question_word("where"));
    EXPECT_EQ(en().question_kind("why"), QuestionWord::Why);
    EXPECT_TRUE(en().is_capability_modal("could"));
    EXPECT_TRUE(en().is_and("and"));
    EXPECT_TRUE(en().is_or("or"));
}

TEST(LexiconTest, PatternsAreLongestFirst) {
    const auto& patterns = en().relational_patterns();
    ASSERT_FALSE(patterns.empty());
    for (size_t i = 1; i < patterns.size(); ++i) {
        EXPECT_GE(patterns[i - 1].words.size(), patterns[i].words.size());
    }
    EXPECT_EQ(patterns.front().words.size(), 3u);
}

TEST(LexiconTest, SurfaceForms) {
    EXPECT_EQ(en().surface_form("is-a"), "is a");
    EXPECT_EQ(en().surface_form("located-in"), "is located in");
    EXPECT_EQ(Lexicon::for_language(Language::Russian).surface_form("located-in"), "находится в");
    EXPECT_EQ(Lexicon::for_language(Language::French).surface_form("part-of"), "fait partie de");
    EXPECT_FALSE(en().surface_form("orbits").has_value());
}

TEST(LexiconTest, AssertionPatternNeedsBothSides) {
    EXPECT_TRUE(en().contains_assertion_pattern("Dogs are mammals"));
    EXPECT_TRUE(en().contains_assertion_pattern("Paris is located in France"));
    EXPECT_FALSE(en().contains_assertion_pattern("dogs are"));
    EXPECT_FALSE(en().contains_assertion_pattern("are dogs"));
    EXPECT_FALSE(en().contains_assertion_pattern("hello world"));
}

// ============================================================================
// Questions
// ============================================================================

TEST(LexiconTest, LooksLikeQuestion) {
    EXPECT_TRUE(en().looks_like_question("Dogs?"));
    EXPECT_TRUE(en().looks_like_question("what is a dog"));
    EXPECT_FALSE(en().looks_like_question("what"));
    EXPECT_FALSE(en().looks_like_question("Dogs are mammals"));
    EXPECT_TRUE(Lexicon::for_language(Language::Arabic).looks_like_question("ما هو الكلب؟"));
}

TEST(LexiconTest, CapabilityQuestionFrame) {
    QuestionFrame frame = en().parse_question_frame("What can you do?");
    EXPECT_EQ(frame.question_word, "what");
    EXPECT_EQ(frame.kind, QuestionWord::What);
    EXPECT_EQ(frame.auxiliary, "can");
    ASSERT_EQ(frame.content.size(), 1u);
    EXPECT_EQ(frame.content[0], "you");
    EXPECT_TRUE(frame.capability);
}

TEST(LexiconTest, QuestionFrameDropsLeadingArticle) {
    QuestionFrame frame = en().parse_question_frame("What is the Eiffel Tower?");
    EXPECT_EQ(frame.auxiliary, "is");
    EXPECT_EQ(frame.subject(), "Eiffel Tower");
    EXPECT_FALSE(frame.capability);
}

TEST(LexiconTest, MultiWordQuestionWord) {
    const Lexicon& fr = Lexicon::for_language(Language::French);
    QuestionFrame frame = fr.parse_question_frame("Qu'est-ce que Paris ?");
    EXPECT_EQ(frame.question_word, "qu'est-ce que");
    EXPECT_EQ(frame.subject(), "Paris");
}

TEST(LexiconTest, QuestionWordNames) {
    EXPECT_STREQ(question_word_name(QuestionWord::YesNo), "yes-no");
    EXPECT_STREQ(question_word_name(QuestionWord::Where), "where");
}

// ============================================================================
// Commands and goals
// ============================================================================

TEST(LexiconTest, HelpAndStatusCommands) {
    EXPECT_EQ(en().match_command("help"), Command::help());
    EXPECT_EQ(en().match_command("  HELP me  "), Command::help());
    EXPECT_EQ(en().match_command("?"), Command::help());
    EXPECT_EQ(en().match_command("status"), Command::show_status());
    EXPECT_EQ(en().match_command("show goals"), Command::show_status());
}

TEST(LexiconTest, RunCommandTakesFirstNumber) {
    EXPECT_EQ(en().match_command("run 5"), Command::run_agent(5));
    EXPECT_EQ(en().match_command("run for 12 cycles"), Command::run_agent(12));
    EXPECT_EQ(en().match_command("cycle"), Command::run_agent(std::nullopt));
}

TEST(LexiconTest, CommandWordsNeedBoundary) {
    EXPECT_FALSE(en().match_command("running dogs").has_value());
    EXPECT_FALSE(en().match_command("helpful dogs").has_value());
    EXPECT_FALSE(en().match_command("Dogs are mammals").has_value());
}

TEST(LexiconTest, ShowKeepsEntityCase) {
    EXPECT_EQ(en().match_command("show Dog"), Command::render(std::string("Dog")));
    EXPECT_EQ(en().match_command("graph New York"), Command::render(std::string("New York")));
    EXPECT_EQ(en().match_command("show"), Command::render(std::nullopt));
    EXPECT_STREQ(command_kind_name(Command::Kind::RunAgent), "run-agent");
}

TEST(LexiconTest, LocalizedCommands) {
    EXPECT_EQ(Lexicon::for_language(Language::Russian).match_command("помощь"), Command::help());
    EXPECT_EQ(Lexicon::for_language(Language::Spanish).match_command("ejecutar 3"), Command::run_agent(3));
}

TEST(LexiconTest, Goals) {
    EXPECT_EQ(en().match_goal("  find all mammals "), "find all mammals");
    EXPECT_EQ(en().match_goal("Explore the ocean"), "Explore the ocean");
    EXPECT_FALSE(en().match_goal("find").has_value());
    EXPECT_FALSE(en().match_goal("finder of things").has_value());
}
