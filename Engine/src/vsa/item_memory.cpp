/**
 * @file item_memory.cpp
 * @brief HypervectorIndex over hnswlib
 *
 * Bipolar vectors go into HNSW as +1/-1 floats under L2Space. For two such
 * vectors the squared L2 distance is exactly 4 * hamming, so
 *   similarity = 1 - dist / (4 * dim)
 * recovers the normalized Hamming similarity that VsaOps::similarity reports.
 */

#include <vsa/item_memory.hpp>
#include <vsa/encode.hpp>
#include <grammar/error.hpp>
#include <utils/config.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <mutex>
#include <queue>
#include <stdexcept>

namespace Glossa {

HypervectorIndex::HypervectorIndex(size_t dim, size_t max_elements, size_t m, size_t ef_construction)
    : dim_(dim), ef_search_(64) {
    if (dim == 0) {
        throw std::invalid_argument("HypervectorIndex dimension must be positive");
    }
    space_ = std::make_unique<hnswlib::L2Space>(dim);
    hnsw_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), std::max<size_t>(max_elements, 16), m, ef_construction);
    hnsw_->setEf(ef_search_);

    Logger::debug("HypervectorIndex: dim=" + std::to_string(dim) +
                  " capacity=" + std::to_string(max_elements));
}

HypervectorIndex::HypervectorIndex(const EngineConfig& config)
    : HypervectorIndex(config.dimension, config.index_capacity,
                       config.hnsw_m, config.hnsw_ef_construction) {}

HypervectorIndex::~HypervectorIndex() = default;

HyperVec HypervectorIndex::get_or_create(const VsaOps& ops, SymbolId symbol) {
    if (auto existing = get(symbol)) {
        return *existing;
    }
    HyperVec vec = encode_symbol(ops, symbol);
    insert(symbol, vec);
    return vec;
}

void HypervectorIndex::insert(SymbolId symbol, const HyperVec& vec) {
    if (vec.dim() != dim_) {
        throw VsaError::dimension_mismatch(dim_, vec.dim());
    }

    const size_t internal_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    ensure_capacity(internal_id + 1);

    {
        auto& shard = id_to_symbol_[shard_of(internal_id)];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.map[internal_id] = symbol;
    }

    add_point(vec, internal_id);

    std::optional<size_t> stale;
    {
        auto& shard = symbol_to_id_[shard_of(symbol)];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto [it, inserted] = shard.map.try_emplace(symbol, internal_id);
        if (!inserted) {
            stale = it->second;
            it->second = internal_id;
        }
    }
    if (stale) retire_point(*stale);

    auto& shard = vectors_[shard_of(symbol)];
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    if (shard.map.insert_or_assign(symbol, vec).second) {
        count_.fetch_add(1, std::memory_order_relaxed);
    }
}

void HypervectorIndex::add_point(const HyperVec& vec, size_t internal_id) {
    Eigen::VectorXf data = vec.to_bipolar();
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    try {
        hnsw_->addPoint(data.data(), internal_id);
    } catch (const std::exception& e) {
        throw VsaError(VsaError::Reason::IndexFailure, std::string("HNSW insert failed: ") + e.what());
    }
}

/// Hide a replaced vector from search. hnswlib keeps the slot.
void HypervectorIndex::retire_point(size_t internal_id) {
    {
        auto& shard = id_to_symbol_[shard_of(internal_id)];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.map.erase(internal_id);
    }
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    try {
        hnsw_->markDelete(internal_id);
    } catch (const std::exception& e) {
        throw VsaError(VsaError::Reason::IndexFailure, std::string("HNSW delete failed: ") + e.what());
    }
}

void HypervectorIndex::ensure_capacity(size_t needed) {
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        if (needed <= hnsw_->getMaxElements()) return;
    }
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    size_t capacity = hnsw_->getMaxElements();
    if (needed <= capacity) return;
    while (capacity < needed) capacity *= 2;
    Logger::info("HypervectorIndex: growing HNSW capacity to " + std::to_string(capacity));
    hnsw_->resizeIndex(capacity);
}

void HypervectorIndex::insert_batch(const VsaOps& ops, const std::vector<SymbolId>& symbols) {
    if (symbols.empty()) return;
    if (ops.dim() != dim_) {
        throw VsaError::dimension_mismatch(dim_, ops.dim());
    }

    ScopedTimer timer("HypervectorIndex::insert_batch", symbols.size());
    ensure_capacity(next_id_.load() + symbols.size());

    const long n = static_cast<long>(symbols.size());
    std::vector<HyperVec> encoded(symbols.size());

    #pragma omp parallel for schedule(dynamic, 64)
    for (long i = 0; i < n; ++i) {
        encoded[i] = encode_symbol(ops, symbols[i]);
    }

    // hnswlib addPoint is thread-safe; failures are collected and rethrown
    // outside the parallel region.
    std::atomic<bool> failed{false};
    std::string first_error;
    std::mutex error_mutex;

    #pragma omp parallel for schedule(dynamic, 64)
    for (long i = 0; i < n; ++i) {
        if (failed.load(std::memory_order_relaxed)) continue;
        try {
            insert(symbols[i], encoded[i]);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!failed.exchange(true)) first_error = e.what();
        }
    }

    if (failed.load()) {
        throw VsaError(VsaError::Reason::IndexFailure, "batch insert failed: " + first_error);
    }
}

std::optional<HyperVec> HypervectorIndex::get(SymbolId symbol) const {
    const auto& shard = vectors_[shard_of(symbol)];
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.map.find(symbol);
    if (it == shard.map.end()) return std::nullopt;
    return it->second;
}

bool HypervectorIndex::contains(SymbolId symbol) const {
    const auto& shard = vectors_[shard_of(symbol)];
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.map.count(symbol) > 0;
}

size_t HypervectorIndex::size() const {
    return count_.load(std::memory_order_relaxed);
}

std::vector<SearchResult> HypervectorIndex::search(const HyperVec& query, size_t k) const {
    if (query.dim() != dim_) {
        throw VsaError::dimension_mismatch(dim_, query.dim());
    }
    if (k == 0) return {};

    Eigen::VectorXf data = query.to_bipolar();
    std::priority_queue<std::pair<float, hnswlib::labeltype>> result_pq;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        if (hnsw_->getCurrentElementCount() == 0) return {};
        try {
            result_pq = hnsw_->searchKnn(data.data(), k);
        } catch (const std::exception& e) {
            throw VsaError(VsaError::Reason::IndexFailure, std::string("HNSW search failed: ") + e.what());
        }
    }

    const float scale = 4.0f * static_cast<float>(dim_);
    std::vector<SearchResult> results;
    results.reserve(result_pq.size());

    while (!result_pq.empty()) {
        auto [dist, internal_id] = result_pq.top();
        result_pq.pop();

        std::optional<SymbolId> symbol;
        {
            const auto& shard = id_to_symbol_[shard_of(static_cast<size_t>(internal_id))];
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            auto it = shard.map.find(static_cast<size_t>(internal_id));
            if (it != shard.map.end()) symbol = it->second;
        }
        if (!symbol) continue;

        float similarity = std::clamp(1.0f - dist / scale, 0.0f, 1.0f);

        // Racing re-inserts of one symbol can leave two live points for a moment.
        auto dup = std::find_if(results.begin(), results.end(),
                                [&](const SearchResult& r) { return r.symbol_id == *symbol; });
        if (dup != results.end()) {
            dup->similarity = std::max(dup->similarity, similarity);
        } else {
            results.push_back({*symbol, similarity});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.similarity > b.similarity; });
    return results;
}

} // namespace Glossa
