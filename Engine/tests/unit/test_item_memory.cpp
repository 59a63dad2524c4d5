/**
 * @file test_item_memory.cpp
 * @brief Unit tests for HypervectorIndex: exact store, HNSW search, batch insert
 */

#include <gtest/gtest.h>
#include <vsa/item_memory.hpp>
#include <vsa/encode.hpp>
#include <grammar/error.hpp>
#include <utils/config.hpp>
#include <thread>
#include <vector>

using namespace Glossa;

namespace {
constexpr size_t DIM = 2048;
}

TEST(HypervectorIndexTest, StartsEmpty) {
    HypervectorIndex index(DIM, 64);
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.dim(), DIM);
    EXPECT_FALSE(index.get(1).has_value());
}

TEST(HypervectorIndexTest, GetOrCreateIsIdempotent) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 64);

    HyperVec first = index.get_or_create(ops, 17);
    HyperVec second = index.get_or_create(ops, 17);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, encode_symbol(ops, 17));
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.contains(17));
}

TEST(HypervectorIndexTest, SearchFindsExactVector) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 64);
    for (SymbolId id = 1; id <= 20; ++id) index.get_or_create(ops, id);

    auto results = index.search(encode_symbol(ops, 7), 3);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.front().symbol_id, 7u);
    EXPECT_NEAR(results.front().similarity, 1.0f, 1e-4f);
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_LE(results[i].similarity, results[i - 1].similarity);
        EXPECT_LT(results[i].similarity, 0.6f);
    }
}

TEST(HypervectorIndexTest, ReinsertReplacesSearchableVector) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 64);
    for (SymbolId id = 1; id <= 10; ++id) index.get_or_create(ops, id);

    HyperVec before = *index.get(4);
    HyperVec after = ops.random(404);
    index.insert(4, after);

    EXPECT_EQ(index.size(), 10u);
    EXPECT_EQ(*index.get(4), after);

    for (const auto& hit : index.search(before, 5)) {
        EXPECT_LT(hit.similarity, 0.6f) << "stale vector still matches symbol " << hit.symbol_id;
    }
    auto fresh = index.search(after, 1);
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].symbol_id, 4u);
    EXPECT_NEAR(fresh[0].similarity, 1.0f, 1e-4f);
}

TEST(HypervectorIndexTest, SearchOnEmptyIndexReturnsNothing) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 16);
    EXPECT_TRUE(index.search(ops.random(1), 5).empty());
    EXPECT_TRUE(index.search(ops.random(1), 0).empty());
}

TEST(HypervectorIndexTest, SearchRejectsWrongDimension) {
    VsaOps small(DIM / 2);
    HypervectorIndex index(DIM, 16);
    try {
        index.search(small.random(1), 1);
        FAIL() << "expected VsaError";
    } catch (const VsaError& e) {
        EXPECT_EQ(e.reason(), VsaError::Reason::DimensionMismatch);
    }
}

TEST(HypervectorIndexTest, InsertRejectsWrongDimension) {
    VsaOps small(DIM / 2);
    HypervectorIndex index(DIM, 16);
    EXPECT_THROW(index.insert(1, small.random(1)), VsaError);
    EXPECT_TRUE(index.empty());
}

TEST(HypervectorIndexTest, GrowsPastInitialCapacity) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 16);
    for (SymbolId id = 1; id <= 100; ++id) index.get_or_create(ops, id);
    EXPECT_EQ(index.size(), 100u);

    auto results = index.search(encode_symbol(ops, 99), 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.front().symbol_id, 99u);
}

TEST(HypervectorIndexTest, BatchInsert) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 32);

    std::vector<SymbolId> ids;
    for (SymbolId id = 100; id < 300; ++id) ids.push_back(id);
    index.insert_batch(ops, ids);

    EXPECT_EQ(index.size(), ids.size());
    auto stored = index.get(150);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, encode_symbol(ops, 150));
}

TEST(HypervectorIndexTest, ConcurrentGetOrCreate) {
    VsaOps ops(DIM);
    HypervectorIndex index(DIM, 64);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]() {
            for (SymbolId id = 1; id <= 50; ++id) {
                index.get_or_create(ops, id + static_cast<SymbolId>(t) * 1000);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(index.size(), 200u);
}

TEST(HypervectorIndexTest, BuildsFromConfig) {
    EngineConfig config;
    config.dimension = 1024;
    config.index_capacity = 32;
    HypervectorIndex index(config);
    EXPECT_EQ(index.dim(), 1024u);
}
