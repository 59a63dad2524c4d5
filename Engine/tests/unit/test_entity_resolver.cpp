/**
 * @file test_entity_resolver.cpp
 * @brief Unit tests for the equivalence table and entity de-duplication
 */

#include <gtest/gtest.h>
#include <grammar/entity_resolver.hpp>
#include <grammar/equivalences.hpp>

#include <set>

using namespace Glossa;

namespace {

ExtractedEntity mention(std::string name, float confidence, std::string lang = "en") {
    ExtractedEntity e;
    e.name = std::move(name);
    e.entity_type = "PLACE";
    e.confidence = confidence;
    e.source_language = std::move(lang);
    return e;
}

} // namespace

// ============================================================================
// Equivalence table
// ============================================================================

TEST(EquivalenceTest, CrossLingualLookup) {
    EXPECT_EQ(lookup_equivalence("Moscow"), std::optional<std::string>("Moscow"));
    EXPECT_EQ(lookup_equivalence("Москва"), std::optional<std::string>("Moscow"));
    EXPECT_EQ(lookup_equivalence("Moscou"), std::optional<std::string>("Moscow"));
    EXPECT_EQ(lookup_equivalence("موسكو"), std::optional<std::string>("Moscow"));
    EXPECT_EQ(lookup_equivalence("allemagne"), std::optional<std::string>("Germany"));
    EXPECT_EQ(lookup_equivalence("Atlantis"), std::nullopt);
}

TEST(EquivalenceTest, CanonicalLabelsAreUnique) {
    std::set<std::string> seen;
    for (const auto& entry : equivalence_table()) {
        EXPECT_TRUE(seen.insert(entry.canonical).second) << entry.canonical;
        EXPECT_FALSE(entry.aliases.empty()) << entry.canonical;
    }
    EXPECT_GE(equivalence_table().size(), 100u);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(EntityResolverTest, ResolvesThroughTable) {
    EntityResolver resolver;
    ResolutionResult r = resolver.resolve("Londres");
    EXPECT_TRUE(r.resolved);
    EXPECT_EQ(r.canonical, "London");
    EXPECT_EQ(r.aliases, (std::vector<std::string>{"Londres"}));

    ResolutionResult miss = resolver.resolve("Gondor");
    EXPECT_FALSE(miss.resolved);
    EXPECT_EQ(miss.canonical, "Gondor");
    EXPECT_TRUE(miss.aliases.empty());
}

TEST(EntityResolverTest, AliasesWinOverTable) {
    EntityResolver resolver;
    resolver.add_alias("Big Apple", "New York");
    resolver.add_alias("London", "London, Ontario");
    EXPECT_EQ(resolver.alias_count(), 2u);

    EXPECT_EQ(resolver.resolve("big apple").canonical, "New York");
    EXPECT_EQ(resolver.resolve("London").canonical, "London, Ontario");
}

TEST(EntityResolverTest, CaseOnlyAliasIgnored) {
    EntityResolver resolver;
    resolver.add_alias("paris", "Paris");
    EXPECT_EQ(resolver.alias_count(), 0u);
}

TEST(EntityResolverTest, ResolveEntityRecordsOriginalName) {
    EntityResolver resolver;

    ExtractedEntity ru = mention("Москва", 0.8f, "ru");
    resolver.resolve_entity(ru);
    EXPECT_EQ(ru.canonical_name, "Moscow");
    EXPECT_EQ(ru.aliases, (std::vector<std::string>{"Москва"}));

    ExtractedEntity en = mention("moscow", 0.8f);
    resolver.resolve_entity(en);
    EXPECT_EQ(en.canonical_name, "Moscow");
    EXPECT_TRUE(en.aliases.empty());
}

TEST(EntityResolverTest, UnresolvedKeepsOwnName) {
    EntityResolver resolver;
    ExtractedEntity e = mention("Gondor", 0.5f);
    resolver.resolve_entity(e);
    EXPECT_EQ(e.canonical_name, "Gondor");
    EXPECT_TRUE(e.aliases.empty());

    ExtractedEntity preset = mention("Minas Tirith", 0.5f);
    preset.canonical_name = "Gondor capital";
    resolver.resolve_entity(preset);
    EXPECT_EQ(preset.canonical_name, "Gondor capital");
}

// ============================================================================
// Merging
// ============================================================================

TEST(EntityResolverTest, MergesAcrossLanguages) {
    EntityResolver resolver;
    std::vector<ExtractedEntity> entities = {
        mention("Moscow", 0.6f),
        mention("Paris", 0.7f),
        mention("Москва", 0.9f, "ru"),
        mention("Moscou", 0.5f, "fr"),
    };

    resolver.resolve_entities(entities);

    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].canonical_name, "Moscow");
    EXPECT_EQ(entities[0].name, "Moscow");
    EXPECT_FLOAT_EQ(entities[0].confidence, 0.9f);
    EXPECT_EQ(entities[0].aliases, (std::vector<std::string>{"Москва", "Moscou"}));
    EXPECT_EQ(entities[1].canonical_name, "Paris");
}

TEST(EntityResolverTest, MergeIsCaseInsensitiveAndDedupesAliases) {
    EntityResolver resolver;
    std::vector<ExtractedEntity> entities = {
        mention("Gondor", 0.4f),
        mention("GONDOR", 0.7f),
        mention("Москва", 0.5f),
        mention("Москва", 0.6f),
    };

    resolver.resolve_entities(entities);

    ASSERT_EQ(entities.size(), 2u);
    EXPECT_EQ(entities[0].name, "Gondor");
    EXPECT_FLOAT_EQ(entities[0].confidence, 0.7f);
    EXPECT_EQ(entities[1].aliases, (std::vector<std::string>{"Москва"}));
}
