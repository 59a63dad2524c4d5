/**
 * @file test_preprocess.cpp
 * @brief Unit tests for chunk pre-processing and its JSON wire form
 */

#include <gtest/gtest.h>
#include <grammar/preprocess.hpp>

#include <algorithm>

using namespace Glossa;
using json = nlohmann::json;

namespace {

TextChunk chunk(std::string text, std::optional<std::string> lang = std::nullopt,
                std::optional<std::string> id = std::nullopt) {
    return TextChunk{std::move(id), std::move(text), std::move(lang)};
}

const ExtractedEntity* find_entity(const PreProcessorOutput& out, const std::string& canonical) {
    auto it = std::find_if(out.entities.begin(), out.entities.end(),
                           [&](const ExtractedEntity& e) { return e.canonical_name == canonical; });
    return it == out.entities.end() ? nullptr : &*it;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

TEST(PreprocessTest, ClaimTypes) {
    EXPECT_STREQ(predicate_to_claim_type("is-a"), "FACTUAL");
    EXPECT_STREQ(predicate_to_claim_type("implements"), "FACTUAL");
    EXPECT_STREQ(predicate_to_claim_type("causes"), "CAUSAL");
    EXPECT_STREQ(predicate_to_claim_type("located-in"), "SPATIAL");
    EXPECT_STREQ(predicate_to_claim_type("similar-to"), "RELATIONAL");
    EXPECT_STREQ(predicate_to_claim_type("part-of"), "STRUCTURAL");
    EXPECT_STREQ(predicate_to_claim_type("depends-on"), "DEPENDENCY");
    EXPECT_STREQ(predicate_to_claim_type("taught"), "OTHER");
}

TEST(PreprocessTest, EntityTypes) {
    EXPECT_STREQ(infer_entity_type("located-in", false), "PLACE");
    EXPECT_STREQ(infer_entity_type("located-in", true), "CONCEPT");
    EXPECT_STREQ(infer_entity_type("is-a", false), "CONCEPT");
}

// ============================================================================
// Chunks
// ============================================================================

TEST(PreprocessTest, SimpleFact) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("Dogs are mammals", std::nullopt, std::string("c1")), ctx);

    EXPECT_EQ(out.chunk_id, std::optional<std::string>("c1"));
    EXPECT_EQ(out.source_language, "en");
    ASSERT_EQ(out.claims.size(), 1u);

    const ExtractedClaim& claim = out.claims[0];
    EXPECT_EQ(claim.claim_text, "Dogs are mammals");
    EXPECT_EQ(claim.claim_type, "FACTUAL");
    EXPECT_EQ(claim.subject, "Dogs");
    EXPECT_EQ(claim.predicate, "is-a");
    EXPECT_EQ(claim.object, "mammals");
    EXPECT_EQ(claim.source_language, "en");
    EXPECT_NEAR(claim.confidence, 0.8165f, 1e-3f);

    ASSERT_EQ(out.entities.size(), 2u);
    EXPECT_EQ(out.entities[0].entity_type, "CONCEPT");
    EXPECT_FLOAT_EQ(out.entities[0].confidence, claim.confidence);
    ASSERT_EQ(out.trees.size(), 1u);
}

TEST(PreprocessTest, SpatialClaimMarksPlace) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("Lyon is located in France"), ctx);
    ASSERT_EQ(out.claims.size(), 1u);
    EXPECT_EQ(out.claims[0].claim_type, "SPATIAL");

    const ExtractedEntity* france = find_entity(out, "France");
    ASSERT_NE(france, nullptr);
    EXPECT_EQ(france->entity_type, "PLACE");
}

TEST(PreprocessTest, EntitiesResolveAcrossLanguages) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("Москва находится в России"), ctx);
    EXPECT_EQ(out.source_language, "ru");
    EXPECT_GT(out.detected_language_confidence, 0.7f);

    const ExtractedEntity* moscow = find_entity(out, "Moscow");
    ASSERT_NE(moscow, nullptr);
    EXPECT_EQ(moscow->name, "Москва");
    EXPECT_EQ(moscow->aliases, (std::vector<std::string>{"Москва"}));
    EXPECT_EQ(moscow->source_language, "ru");
}

TEST(PreprocessTest, DuplicateEntitiesMerge) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("Dogs are mammals and cats are mammals"), ctx);
    EXPECT_EQ(out.claims.size(), 2u);
    EXPECT_EQ(out.entities.size(), 3u);
}

TEST(PreprocessTest, LanguageHint) {
    ParseContext ctx;
    PreProcessorOutput fr = preprocess_chunk(chunk("Paris est une ville", std::string("fr")), ctx);
    EXPECT_EQ(fr.source_language, "fr");
    ASSERT_EQ(fr.claims.size(), 1u);
    EXPECT_EQ(fr.claims[0].predicate, "is-a");

    // Unknown hints fall back to detection.
    PreProcessorOutput bad = preprocess_chunk(chunk("Dogs are mammals", std::string("tlh")), ctx);
    EXPECT_EQ(bad.source_language, "en");
    EXPECT_EQ(bad.claims.size(), 1u);
}

TEST(PreprocessTest, CustomResolverAliases) {
    ParseContext ctx;
    EntityResolver resolver;
    resolver.add_alias("doggos", "Dog");
    PreProcessorOutput out = preprocess_chunk(chunk("Doggos are mammals"), ctx, resolver);
    ASSERT_NE(find_entity(out, "Dog"), nullptr);
}

TEST(PreprocessTest, NoFactsNoClaims) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("hello world"), ctx);
    EXPECT_TRUE(out.claims.empty());
    EXPECT_TRUE(out.entities.empty());
    EXPECT_TRUE(out.trees.empty());
}

TEST(PreprocessTest, BatchKeepsOrder) {
    ParseContext ctx;
    std::vector<TextChunk> chunks = {chunk("Dogs are mammals", std::nullopt, std::string("a")),
                                     chunk("hello world", std::nullopt, std::string("b")),
                                     chunk("Москва находится в России", std::nullopt, std::string("c"))};
    auto outputs = preprocess_batch(chunks, ctx);
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs[0].chunk_id, std::optional<std::string>("a"));
    EXPECT_EQ(outputs[1].chunk_id, std::optional<std::string>("b"));
    EXPECT_EQ(outputs[2].source_language, "ru");
}

TEST(PreprocessTest, MixedCorpusSplitsBySentence) {
    ParseContext ctx;
    auto outputs = preprocess_mixed_corpus("Dogs are mammals. Москва находится в России.", ctx);
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].source_language, "en");
    EXPECT_EQ(outputs[1].source_language, "ru");
    EXPECT_EQ(outputs[0].claims.size(), 1u);
}

// ============================================================================
// JSON
// ============================================================================

TEST(PreprocessJsonTest, ChunkNullsAndDefaults) {
    json j = chunk("Dogs are mammals");
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_TRUE(j["language"].is_null());
    EXPECT_EQ(j["text"], "Dogs are mammals");

    TextChunk parsed = json::parse(R"({"text": "x"})").get<TextChunk>();
    EXPECT_EQ(parsed.text, "x");
    EXPECT_FALSE(parsed.id.has_value());
    EXPECT_FALSE(parsed.language.has_value());
}

TEST(PreprocessJsonTest, RequestFromWire) {
    PreProcessRequest request = json::parse(R"({"chunks": [
        {"id": "1", "text": "Dogs are mammals", "language": "en"},
        {"text": "Москва находится в России"}
    ]})").get<PreProcessRequest>();

    ASSERT_EQ(request.chunks.size(), 2u);
    EXPECT_EQ(request.chunks[0].language, std::optional<std::string>("en"));

    ParseContext ctx;
    PreProcessResponse response = preprocess_request(request, ctx);
    json out = response;
    ASSERT_EQ(out["results"].size(), 2u);
    EXPECT_TRUE(out.contains("processing_time_ms"));

    const json& first = out["results"][0];
    EXPECT_EQ(first["chunk_id"], "1");
    EXPECT_EQ(first["claims"][0]["claim_type"], "FACTUAL");
    EXPECT_EQ(first["claims"][0]["predicate"], "is-a");
    EXPECT_EQ(first["trees"].size(), 1u);
    EXPECT_TRUE(out["results"][1]["chunk_id"].is_null());
}

TEST(PreprocessJsonTest, OutputReadsBack) {
    ParseContext ctx;
    PreProcessorOutput out = preprocess_chunk(chunk("Москва находится в России", std::nullopt, std::string("ru1")), ctx);

    PreProcessorOutput back = json(out).get<PreProcessorOutput>();
    EXPECT_EQ(back.chunk_id, out.chunk_id);
    EXPECT_EQ(back.source_language, "ru");
    ASSERT_EQ(back.claims.size(), out.claims.size());
    EXPECT_EQ(back.claims[0].predicate, "located-in");
    ASSERT_EQ(back.entities.size(), out.entities.size());
    EXPECT_EQ(back.entities[0].aliases, out.entities[0].aliases);
    ASSERT_EQ(back.trees.size(), 1u);
    EXPECT_EQ(back.trees[0], out.trees[0]);
}

TEST(PreprocessJsonTest, MissingRequiredFieldThrows) {
    EXPECT_THROW(json::parse(R"({"id": "1"})").get<TextChunk>(), json::exception);
}
