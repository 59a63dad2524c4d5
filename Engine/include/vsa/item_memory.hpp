/**
 * @file item_memory.hpp
 * @brief HypervectorIndex: symbol -> hypervector store with HNSW similarity search
 *
 * Two structures, two locking disciplines:
 *   - exact map: striped across shards, each shard behind its own
 *     shared_mutex, so readers and writers of different symbols never meet
 *   - HNSW index: one reader/writer lock. addPoint and searchKnn both run
 *     under the shared side (hnswlib synchronizes those internally); a
 *     capacity resize or retiring a replaced point takes the exclusive side.
 */

#pragma once

#include <vsa/hypervector.hpp>
#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace hnswlib {
class L2Space;
template <typename dist_t> class HierarchicalNSW;
}

namespace Glossa {

struct EngineConfig;

struct SearchResult {
    SymbolId symbol_id;
    float similarity;   // 0 = opposite, 0.5 = unrelated, 1 = identical
};

class GLOSSA_API HypervectorIndex {
public:
    /**
     * @param dim Bits per vector; queries of any other size are rejected
     * @param max_elements Initial HNSW capacity (doubled when exhausted)
     */
    HypervectorIndex(size_t dim, size_t max_elements, size_t m = 16, size_t ef_construction = 200);
    explicit HypervectorIndex(const EngineConfig& config);
    ~HypervectorIndex();

    HypervectorIndex(const HypervectorIndex&) = delete;
    HypervectorIndex& operator=(const HypervectorIndex&) = delete;

    size_t dim() const { return dim_; }

    /**
     * @brief Stored vector for `symbol`, deriving and inserting it on first use
     */
    HyperVec get_or_create(const VsaOps& ops, SymbolId symbol);

    /**
     * @brief Store `vec` under `symbol` and add it to the ANN index
     *
     * Re-inserting a symbol replaces its vector; the old point stops
     * matching searches.
     * @throws VsaError on dimension mismatch or index failure
     */
    void insert(SymbolId symbol, const HyperVec& vec);

    /**
     * @brief Encode and insert many symbols in parallel (OpenMP)
     */
    void insert_batch(const VsaOps& ops, const std::vector<SymbolId>& symbols);

    std::optional<HyperVec> get(SymbolId symbol) const;
    bool contains(SymbolId symbol) const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * @brief k most similar stored symbols, highest similarity first
     * @throws VsaError (DimensionMismatch) if query.dim() != dim()
     */
    std::vector<SearchResult> search(const HyperVec& query, size_t k) const;

private:
    static constexpr size_t SHARD_COUNT = 64;

    template <typename K, typename V>
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<K, V> map;
    };

    template <typename K, typename V>
    using ShardedMap = std::array<Shard<K, V>, SHARD_COUNT>;

    template <typename K>
    static size_t shard_of(K key) { return static_cast<size_t>((key * 0x9E3779B97F4A7C15ull) >> 58); }

    void add_point(const HyperVec& vec, size_t internal_id);
    void retire_point(size_t internal_id);
    void ensure_capacity(size_t needed);

    size_t dim_;
    size_t ef_search_;

    ShardedMap<SymbolId, HyperVec> vectors_;
    ShardedMap<size_t, SymbolId> id_to_symbol_;
    ShardedMap<SymbolId, size_t> symbol_to_id_;
    std::atomic<size_t> next_id_{0};
    std::atomic<size_t> count_{0};

    mutable std::shared_mutex index_mutex_;
    std::unique_ptr<hnswlib::L2Space> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw_;
};

} // namespace Glossa
