/**
 * @file test_scenarios.cpp
 * @brief Conversations and documents carried through parsing, discourse and every register
 */

#include <gtest/gtest.h>
#include <grammar/discourse.hpp>
#include <grammar/error.hpp>
#include <grammar/grammar_registry.hpp>
#include <grammar/narrative_grammar.hpp>
#include <grammar/parser.hpp>
#include <grammar/preprocess.hpp>
#include <grammar/symbol_registry.hpp>

#include <stdexcept>

using namespace Glossa;

namespace {

std::string predicate_of(const SemanticTree& tree) {
    const auto* t = tree.unwrap().as<Node::Triple>();
    return t ? t->predicate->label().value_or("") : std::string();
}

class ScenarioTest : public ::testing::Test {
protected:
    ScenarioTest() : graph(registry) {}

    /// Parse a question and answer it from the graph.
    std::optional<SemanticTree> ask(const std::string& question) const {
        ParseContext ctx;
        ctx.registry = &registry;
        ParseResult r = parse_prose(question, ctx);
        if (r.kind != ParseResult::Kind::Query || !r.frame) throw std::runtime_error("not a query: " + question);
        DiscourseContext dctx = resolve_discourse(*r.frame, question, registry, graph);
        return build_discourse_response(graph.triples_from(dctx.subject_id), dctx, registry, graph);
    }

    /// Parse an assertion and store each resulting triple in the graph as certain.
    void tell(const std::string& statement) {
        ParseContext ctx;
        ctx.registry = &registry;
        ParseResult r = parse_prose(statement, ctx);
        if (r.kind != ParseResult::Kind::Facts) throw std::runtime_error("not a fact: " + statement);
        for (const auto& fact : r.facts) store(fact.unwrap());
    }

    void store(const SemanticTree& tree) {
        if (const auto* conj = tree.as<Node::Conjunction>()) {
            for (const auto& item : conj->items) store(item.unwrap());
            return;
        }
        const auto* t = tree.as<Node::Triple>();
        if (!t) return;
        graph.assert_triple(*t->subject->label(), *t->predicate->label(), *t->object->label());
    }

    MemorySymbolRegistry registry;
    MemoryKnowledgeGraph graph;
    GrammarRegistry grammars;
};

} // namespace

// ============================================================================
// Conversations
// ============================================================================

TEST_F(ScenarioTest, WhoAreYou) {
    graph.assert_triple("self", "is-a", "Akh");
    graph.assert_triple("self", "has-name", "Glossa");
    graph.assert_triple("self", "has-state", "idle");
    graph.assert_triple("self", "powered-by", "Engine");
    graph.assert_triple("you", "refers-to", "self");

    auto answer = ask("Who are you?");
    ASSERT_TRUE(answer.has_value());
    const auto* frame = answer->as<Node::DiscourseFrame>();
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->pov, PointOfView::FirstPerson);

    LinContext lin(registry);
    EXPECT_EQ(grammars.linearize("terse", *answer, lin),
              "self → is-a → Akh; self → has-name → Glossa; self → powered-by → Engine");

    std::string formal = grammars.linearize("formal", *answer, lin);
    EXPECT_NE(formal.find("'Akh'"), std::string::npos);
    EXPECT_EQ(formal.find("idle"), std::string::npos);
}

TEST_F(ScenarioTest, TeachThenAsk) {
    tell("Paris is located in France");
    tell("Paris is a city");
    tell("France is a country");

    auto answer = ask("Where is Paris?");
    ASSERT_TRUE(answer.has_value());
    const auto* frame = answer->as<Node::DiscourseFrame>();
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->focus, QueryFocus::Location);
    EXPECT_EQ(frame->pov, PointOfView::ThirdPerson);

    // Identity predicates are presented before the rest.
    NarrativeGrammar narrative;
    LinContext lin(registry);
    EXPECT_EQ(narrative.linearize(*answer, lin),
              "Paris is a city. Furthermore, Paris is located in France.");
}

TEST_F(ScenarioTest, AskingAboutTheUnknown) {
    tell("Paris is located in France");
    EXPECT_THROW(ask("Where is Atlantis?"), UnresolvedEntity);
}

// ============================================================================
// Moving between registers
// ============================================================================

TEST_F(ScenarioTest, TerseToProse) {
    ParseContext pctx;
    SemanticTree tree = grammars.parse("terse", "Dog → is-a → Mammal [0.80]", std::nullopt, pctx);

    LinContext lin;
    EXPECT_EQ(grammars.linearize("formal", tree, lin), "The entity 'Dog' is a 'Mammal' (confidence: 0.80).");
    EXPECT_EQ(grammars.linearize("narrative", tree, lin), "Dog is a Mammal, with moderate confidence.");
    EXPECT_EQ(grammars.linearize("terse", tree, lin), "Dog → is-a → Mammal [0.80]");
}

TEST_F(ScenarioTest, ProseToTerse) {
    ParseContext pctx;
    SemanticTree tree = parse_universal("Dogs are mammals and cats are mammals", pctx);
    LinContext lin;
    std::string terse = grammars.linearize("terse", tree, lin);
    EXPECT_NE(terse.find("Dogs → is-a → mammals"), std::string::npos) << terse;
    EXPECT_NE(terse.find("; cats → is-a → mammals"), std::string::npos) << terse;
}

TEST_F(ScenarioTest, ForeignPredicatesRenderInTheirLanguage) {
    ParseContext pctx;
    SemanticTree tree = parse_universal("Paris est situé dans France", pctx);
    ASSERT_EQ(predicate_of(tree), "located-in");

    LinContext fr;
    fr.language = Language::French;
    EXPECT_NE(grammars.linearize("formal", tree, fr).find("est situé dans"), std::string::npos);

    LinContext en;
    en.language = Language::English;
    EXPECT_NE(grammars.linearize("formal", tree, en).find("is located in"), std::string::npos);
}

TEST_F(ScenarioTest, KnowledgeReport) {
    SemanticTree dog = SemanticTree::triple(SemanticTree::entity("Dog"), SemanticTree::relation("is-a"),
                                            SemanticTree::entity("Mammal"));
    SemanticTree wolf = SemanticTree::similarity(SemanticTree::entity("Dog"), SemanticTree::entity("Wolf"), 0.87f);
    SemanticTree doc = SemanticTree::document(
        SemanticTree::freeform("Report on canines."),
        {SemanticTree::section("Facts", {dog, wolf})},
        {SemanticTree::gap(SemanticTree::entity("Dog"), "lifespan unknown")});

    LinContext lin;
    EXPECT_EQ(grammars.linearize("formal", doc, lin),
              "Report on canines.\n\n"
              "## Facts\n\n"
              "The entity 'Dog' is a 'Mammal'.\n"
              "'Dog' exhibits similarity to 'Wolf' (score: 0.87).\n"
              "\n## Knowledge Gaps\n\n"
              "- Knowledge gap identified for 'Dog': lifespan unknown.\n");

    std::string narrative = grammars.linearize("narrative", doc, lin);
    EXPECT_NE(narrative.find("## Facts\n\nDog is a Mammal.\nFurthermore, Dog shares a close resemblance to Wolf.\n"),
              std::string::npos)
        << narrative;
    EXPECT_NE(narrative.find("## Open Questions"), std::string::npos);
}

// ============================================================================
// Code
// ============================================================================

TEST_F(ScenarioTest, RustSourceExplained) {
    ParseContext pctx;
    SemanticTree code = grammars.parse("rust-gen",
                                       "/// Rectangle area\n"
                                       "pub fn area(w: f64, h: f64) -> f64 { w * h }\n"
                                       "#[derive(Debug)]\n"
                                       "pub struct Marker;\n",
                                       std::nullopt, pctx);

    LinContext lin;
    EXPECT_EQ(grammars.linearize("formal", code, lin),
              "The module `parsed` serves an unspecified role.\n"
              "Contains 2 items:\n"
              "- fn `area` — Rectangle area. params: (w: f64, h: f64), returns `f64`.\n"
              "- struct `Marker` — no documentation. [derives: Debug]\n");

    EXPECT_THROW(grammars.linearize("terse", code, lin), LinearizationFailed);

    // Regenerating and re-reading gives the same items back.
    std::string regenerated = grammars.linearize("rust-gen", code, lin);
    SemanticTree again = grammars.parse("rust-gen", regenerated, std::nullopt, pctx);
    const auto* module = again.as<Node::CodeModule>();
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->name, "parsed");
    ASSERT_EQ(module->children.size(), 2u);
    EXPECT_EQ(module->children[0], code.as<Node::CodeModule>()->children[0]);
}

// ============================================================================
// Multilingual corpus
// ============================================================================

TEST_F(ScenarioTest, MultilingualCorpusMergesEntities) {
    ParseContext pctx;
    std::vector<TextChunk> chunks = {
        TextChunk{std::string("c1"), "Moscow is located in Russia", std::nullopt},
        TextChunk{std::string("c2"), "Москва находится в России", std::nullopt},
        TextChunk{std::string("c3"), "Moscou est situé dans Russie", std::string("fr")},
    };

    auto outputs = preprocess_batch(chunks, pctx);
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs[1].source_language, "ru");
    EXPECT_EQ(outputs[2].source_language, "fr");

    for (const auto& out : outputs) {
        ASSERT_FALSE(out.claims.empty()) << out.source_language;
        EXPECT_EQ(out.claims[0].predicate, "located-in");
        EXPECT_EQ(out.claims[0].claim_type, "SPATIAL");
        ASSERT_FALSE(out.entities.empty());
        EXPECT_EQ(out.entities[0].canonical_name, "Moscow") << out.source_language;
    }
}
