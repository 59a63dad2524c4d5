/**
 * @file hypervector.cpp
 * @brief Bipolar hypervector arithmetic
 */

#include <vsa/hypervector.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <grammar/error.hpp>
#include <algorithm>
#include <bitset>
#include <stdexcept>

namespace Glossa {

static size_t word_count(size_t dim) { return (dim + 63) / 64; }

// Clear the bits past dim in the final word so popcount and equality stay exact.
static void mask_tail(std::vector<uint64_t>& words, size_t dim) {
    size_t tail = dim & 63;
    if (tail != 0 && !words.empty()) {
        words.back() &= (1ull << tail) - 1;
    }
}

HyperVec::HyperVec(size_t dim) : dim_(dim), words_(word_count(dim), 0) {}

HyperVec HyperVec::from_bytes(size_t dim, const std::vector<uint8_t>& bytes) {
    HyperVec v(dim);
    const size_t n = std::min(bytes.size(), (dim + 7) / 8);
    for (size_t i = 0; i < n; ++i) {
        v.words_[i >> 3] |= static_cast<uint64_t>(bytes[i]) << ((i & 7) * 8);
    }
    mask_tail(v.words_, dim);
    return v;
}

size_t HyperVec::popcount() const {
    size_t total = 0;
    for (uint64_t w : words_) total += std::bitset<64>(w).count();
    return total;
}

Eigen::VectorXf HyperVec::to_bipolar() const {
    Eigen::VectorXf out(static_cast<Eigen::Index>(dim_));
    for (size_t i = 0; i < dim_; ++i) {
        out[static_cast<Eigen::Index>(i)] = bit(i) ? 1.0f : -1.0f;
    }
    return out;
}

// =============================================================================
// VsaOps
// =============================================================================

VsaOps::VsaOps(size_t dim) : dim_(dim) {
    if (dim == 0) {
        throw std::invalid_argument("hypervector dimension must be positive");
    }
}

void VsaOps::check(const HyperVec& v) const {
    if (v.dim() != dim_) {
        throw VsaError::dimension_mismatch(dim_, v.dim());
    }
}

HyperVec VsaOps::random(uint64_t seed) const {
    uint8_t le[8];
    for (int i = 0; i < 8; ++i) le[i] = static_cast<uint8_t>((seed >> (8 * i)) & 0xFF);
    return random_from_text("glossa 2026 hypervector symbol", le, sizeof(le));
}

HyperVec VsaOps::random_from_text(const char* domain, const void* data, size_t len) const {
    auto bytes = BLAKE3Pipeline::expand(domain, data, len, (dim_ + 7) / 8);
    return HyperVec::from_bytes(dim_, bytes);
}

HyperVec VsaOps::bind(const HyperVec& a, const HyperVec& b) const {
    check(a);
    check(b);
    HyperVec out(dim_);
    for (size_t i = 0; i < out.words_.size(); ++i) {
        out.words_[i] = a.words_[i] ^ b.words_[i];
    }
    return out;
}

HyperVec VsaOps::bundle(const std::vector<const HyperVec*>& vectors) const {
    if (vectors.empty()) {
        throw VsaError(VsaError::Reason::EmptyBundle, "cannot bundle zero vectors");
    }

    Eigen::VectorXf acc = Eigen::VectorXf::Zero(static_cast<Eigen::Index>(dim_));
    for (const HyperVec* v : vectors) {
        check(*v);
        acc += v->to_bipolar();
    }

    HyperVec out(dim_);
    for (size_t i = 0; i < dim_; ++i) {
        float s = acc[static_cast<Eigen::Index>(i)];
        out.set_bit(i, s > 0.0f || (s == 0.0f && i % 2 == 0));
    }
    return out;
}

HyperVec VsaOps::bundle(const std::vector<HyperVec>& vectors) const {
    std::vector<const HyperVec*> refs;
    refs.reserve(vectors.size());
    for (const auto& v : vectors) refs.push_back(&v);
    return bundle(refs);
}

HyperVec VsaOps::permute(const HyperVec& v, size_t shift) const {
    check(v);
    HyperVec out(dim_);
    shift %= dim_;
    for (size_t i = 0; i < dim_; ++i) {
        if (v.bit(i)) out.set_bit((i + shift) % dim_, true);
    }
    return out;
}

float VsaOps::similarity(const HyperVec& a, const HyperVec& b) const {
    check(a);
    check(b);
    size_t hamming = 0;
    for (size_t i = 0; i < a.words_.size(); ++i) {
        hamming += std::bitset<64>(a.words_[i] ^ b.words_[i]).count();
    }
    return 1.0f - static_cast<float>(hamming) / static_cast<float>(dim_);
}

} // namespace Glossa
