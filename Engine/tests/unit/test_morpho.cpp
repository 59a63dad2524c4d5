/**
 * @file test_morpho.cpp
 * @brief Unit tests for articles, predicate phrases, plurals and list joining
 */

#include <gtest/gtest.h>
#include <grammar/morpho.hpp>

using namespace Glossa;

TEST(MorphoTest, IndefiniteArticle) {
    EXPECT_STREQ(indefinite_article("dog"), "a");
    EXPECT_STREQ(indefinite_article("Apple"), "an");
    EXPECT_STREQ(indefinite_article("hour"), "an");
    EXPECT_STREQ(indefinite_article("honest man"), "an");
    EXPECT_STREQ(indefinite_article("university"), "a");
    EXPECT_STREQ(indefinite_article("user"), "a");
    EXPECT_STREQ(indefinite_article("umbrella"), "an");
    EXPECT_STREQ(indefinite_article(""), "a");
}

TEST(MorphoTest, KnownPredicates) {
    EXPECT_EQ(humanize_predicate("is-a"), "is a");
    EXPECT_EQ(humanize_predicate("has-a"), "has");
    EXPECT_EQ(humanize_predicate("part-of"), "is part of");
    EXPECT_EQ(humanize_predicate("located-in"), "is located in");
    EXPECT_EQ(humanize_predicate("similar-to"), "is similar to");
}

TEST(MorphoTest, CodePredicatesAndSeparators) {
    EXPECT_EQ(humanize_predicate("code:defines-fn"), "defines function");
    EXPECT_EQ(humanize_predicate("has_method"), "has method");
    EXPECT_EQ(humanize_predicate("lives-near"), "lives near");
    EXPECT_EQ(humanize_predicate("snake_case_thing"), "snake case thing");
}

TEST(MorphoTest, LexiconSurfaceOutsideEnglish) {
    EXPECT_EQ(humanize_predicate("is-a", Lexicon::for_language(Language::English)), "is a");
    EXPECT_EQ(humanize_predicate("is-a", Lexicon::for_language(Language::Russian)), "является");
    EXPECT_EQ(humanize_predicate("located-in", Lexicon::for_language(Language::French)), "est situé dans");
    // No surface form: fall back to the English phrase.
    EXPECT_EQ(humanize_predicate("orbits", Lexicon::for_language(Language::Spanish)), "orbits");
}

TEST(MorphoTest, Capitalize) {
    EXPECT_EQ(capitalize("dog"), "Dog");
    EXPECT_EQ(capitalize("москва"), "Москва");
    EXPECT_EQ(capitalize("élan"), "Élan");
    EXPECT_EQ(capitalize(""), "");
}

TEST(MorphoTest, Pluralize) {
    EXPECT_EQ(pluralize("dog"), "dogs");
    EXPECT_EQ(pluralize("city"), "cities");
    EXPECT_EQ(pluralize("day"), "days");
    EXPECT_EQ(pluralize("box"), "boxes");
    EXPECT_EQ(pluralize("church"), "churches");
    EXPECT_EQ(pluralize("class"), "classes");
    EXPECT_EQ(pluralize("cats"), "cats");
    EXPECT_EQ(pluralize(""), "");
}

TEST(MorphoTest, IrregularPluralsKeepCase) {
    EXPECT_EQ(pluralize("child"), "children");
    EXPECT_EQ(pluralize("Person"), "People");
    EXPECT_EQ(pluralize("matrix"), "matrices");
}

TEST(MorphoTest, JoinList) {
    EXPECT_EQ(join_list({}), "");
    EXPECT_EQ(join_list({"A"}), "A");
    EXPECT_EQ(join_list({"A", "B"}), "A and B");
    EXPECT_EQ(join_list({"A", "B", "C"}), "A, B, and C");
    EXPECT_EQ(join_list({"tea", "coffee"}, "or"), "tea or coffee");
}

TEST(MorphoTest, CodeQuote) {
    EXPECT_EQ(code_quote("main"), "`main`");
}
