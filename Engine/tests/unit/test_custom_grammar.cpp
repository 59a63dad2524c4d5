/**
 * @file test_custom_grammar.cpp
 * @brief Unit tests for TOML-defined grammars and template substitution
 */

#include <gtest/gtest.h>
#include <grammar/custom_grammar.hpp>
#include <grammar/error.hpp>

#include <filesystem>
#include <fstream>

using namespace Glossa;

namespace {

const char* kMythic = R"(# A grammar for storytellers
[grammar]
name = "mythic"
description = "Knowledge as mythology"

[linearization]
triple = "It is written that {subject} {predicate} {object}."
gap = 'The scrolls are silent on {entity}: {description}.'
similarity = "{entity} walks beside {similar_to}"   # trailing comment

[unrelated]
color = "blue"
)";

SemanticTree dog_is_mammal() {
    return SemanticTree::triple(SemanticTree::entity("Dog"), SemanticTree::relation("is-a"),
                                SemanticTree::entity("Mammal"));
}

std::string error_of(const char* toml) {
    try {
        CustomGrammar::from_toml(toml);
    } catch (const InvalidCustomGrammar& e) {
        return e.what();
    }
    return {};
}

} // namespace

// ============================================================================
// Templates
// ============================================================================

TEST(ApplyTemplateTest, SubstitutesKnownNames) {
    EXPECT_EQ(apply_template("{a} and {b}", {{"a", "x"}, {"b", "y"}}), "x and y");
    EXPECT_EQ(apply_template("{a}{a}", {{"a", "z"}}), "zz");
}

TEST(ApplyTemplateTest, UnknownPlaceholdersStay) {
    EXPECT_EQ(apply_template("{a} {missing}", {{"a", "x"}}), "x {missing}");
    EXPECT_EQ(apply_template("open { brace", {}), "open { brace");
    EXPECT_EQ(apply_template("", {{"a", "x"}}), "");
}

// ============================================================================
// Loading
// ============================================================================

TEST(CustomGrammarTest, LoadsNameDescriptionAndTemplates) {
    CustomGrammar g = CustomGrammar::from_toml(kMythic);
    EXPECT_EQ(g.name(), "mythic");
    EXPECT_EQ(g.description(), "Knowledge as mythology");
    EXPECT_EQ(g.template_count(), 3u);
    ASSERT_NE(g.template_for("gap"), nullptr);
    EXPECT_EQ(*g.template_for("gap"), "The scrolls are silent on {entity}: {description}.");
    EXPECT_EQ(g.template_for("color"), nullptr);
}

TEST(CustomGrammarTest, EscapesInDoubleQuotes) {
    CustomGrammar g = CustomGrammar::from_toml("[grammar]\nname = \"esc\"\n[linearization]\n"
                                               "freeform = \"line\\n\\\"{text}\\\"\"\n");
    ASSERT_NE(g.template_for("freeform"), nullptr);
    EXPECT_EQ(*g.template_for("freeform"), "line\n\"{text}\"");
}

TEST(CustomGrammarTest, MissingNameRejected) {
    EXPECT_NE(error_of("[grammar]\ndescription = \"nameless\"\n").find("missing [grammar] name"),
              std::string::npos);
    EXPECT_NE(error_of("").find("missing [grammar] name"), std::string::npos);
}

TEST(CustomGrammarTest, SyntaxErrorsCarryLineNumbers) {
    EXPECT_NE(error_of("[grammar]\nname = \"x\n").find("line 2: unterminated string"), std::string::npos);
    EXPECT_NE(error_of("[grammar\nname = \"x\"\n").find("line 1: unterminated section header"),
              std::string::npos);
    EXPECT_NE(error_of("[grammar]\nname = \"x\"\njust words\n").find("line 3: expected key = value"),
              std::string::npos);
    EXPECT_NE(error_of("[grammar]\nname = \"x\" extra\n").find("line 2"), std::string::npos);
    EXPECT_NE(error_of("[grammar]\nname = \"\\q\"\n").find("unknown escape"), std::string::npos);
}

TEST(CustomGrammarTest, FromFile) {
    auto path = std::filesystem::temp_directory_path() / "glossa_test_mythic.toml";
    {
        std::ofstream out(path);
        out << kMythic;
    }
    CustomGrammar g = CustomGrammar::from_file(path.string());
    EXPECT_EQ(g.name(), "mythic");
    std::filesystem::remove(path);

    EXPECT_THROW(CustomGrammar::from_file((std::filesystem::temp_directory_path() / "glossa_no_such.toml").string()),
                 InvalidCustomGrammar);
}

// ============================================================================
// Rendering
// ============================================================================

TEST(CustomGrammarTest, RendersThroughTemplates) {
    CustomGrammar g = CustomGrammar::from_toml(kMythic);
    LinContext ctx;

    EXPECT_EQ(g.linearize(dog_is_mammal(), ctx), "It is written that Dog is a Mammal.");
    EXPECT_EQ(g.linearize(SemanticTree::gap(SemanticTree::entity("Dog"), "its lifespan"), ctx),
              "The scrolls are silent on Dog: its lifespan.");
    EXPECT_EQ(g.linearize(SemanticTree::similarity(SemanticTree::entity("Dog"), SemanticTree::entity("Wolf"), 0.9f),
                          ctx),
              "Dog walks beside Wolf");
}

TEST(CustomGrammarTest, DefaultsWithoutTemplate) {
    CustomGrammar g = CustomGrammar::from_toml("[grammar]\nname = \"plain\"\n");
    LinContext ctx;

    EXPECT_EQ(g.linearize(dog_is_mammal(), ctx), "Dog is a Mammal.");
    EXPECT_EQ(g.linearize(SemanticTree::gap(SemanticTree::entity("Dog"), "unknown"), ctx), "Gap for Dog: unknown.");
    EXPECT_EQ(g.linearize(SemanticTree::with_confidence(dog_is_mammal(), 0.5f), ctx),
              "Dog is a Mammal. (confidence: 0.50)");
    EXPECT_EQ(g.linearize(SemanticTree::inference("x * 1", "x"), ctx), "`x * 1` simplifies to `x`.");

    Node::DataFlow flow;
    flow.steps.push_back({"read", std::string("String")});
    flow.steps.push_back({"parse", std::nullopt});
    EXPECT_EQ(g.linearize(flow, ctx), "Flow: read → String → parse");
}

TEST(CustomGrammarTest, SupportsEveryCategory) {
    CustomGrammar g = CustomGrammar::from_toml(kMythic);
    EXPECT_TRUE(g.supports(Category::CodeModule));
    EXPECT_TRUE(g.supports(Category::DiscourseFrame));
    EXPECT_TRUE(g.supports(Category::Statement));
}
