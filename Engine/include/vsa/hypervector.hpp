/**
 * @file hypervector.hpp
 * @brief Bit-packed bipolar hypervectors and the operations over them
 *
 * Bipolar encoding: bit 1 stands for +1, bit 0 for -1.
 *   bind       = XOR (self-inverse, so unbind == bind)
 *   bundle     = per-component majority vote
 *   similarity = 1 - hamming / dim, in [0, 1]; unrelated vectors sit near 0.5
 */

#pragma once

#include <export.hpp>
#include <Eigen/Core>
#include <cstdint>
#include <vector>

namespace Glossa {

class GLOSSA_API HyperVec {
public:
    HyperVec() = default;

    /**
     * @brief All-zero vector (every component -1)
     */
    explicit HyperVec(size_t dim);

    /**
     * @brief Build from packed bytes, bit i at byte i/8, position i%8
     */
    static HyperVec from_bytes(size_t dim, const std::vector<uint8_t>& bytes);

    size_t dim() const { return dim_; }
    bool empty() const { return dim_ == 0; }
    const std::vector<uint64_t>& words() const { return words_; }

    bool bit(size_t i) const { return (words_[i >> 6] >> (i & 63)) & 1ull; }
    void set_bit(size_t i, bool value) {
        if (value) words_[i >> 6] |= (1ull << (i & 63));
        else       words_[i >> 6] &= ~(1ull << (i & 63));
    }

    size_t popcount() const;

    /**
     * @brief Expand to +1/-1 floats (ANN storage and majority accumulation)
     */
    Eigen::VectorXf to_bipolar() const;

    bool operator==(const HyperVec& o) const { return dim_ == o.dim_ && words_ == o.words_; }
    bool operator!=(const HyperVec& o) const { return !(*this == o); }

private:
    friend class VsaOps;

    size_t dim_ = 0;
    std::vector<uint64_t> words_;
};

/**
 * @brief Vector-symbolic arithmetic at a fixed dimensionality.
 *
 * Every binary operation checks dimensions and throws VsaError on mismatch.
 */
class GLOSSA_API VsaOps {
public:
    explicit VsaOps(size_t dim);

    size_t dim() const { return dim_; }

    /**
     * @brief Pseudo-random vector, fully determined by the seed
     */
    HyperVec random(uint64_t seed) const;

    /**
     * @brief Pseudo-random vector determined by arbitrary bytes
     */
    HyperVec random_from_text(const char* domain, const void* data, size_t len) const;

    HyperVec bind(const HyperVec& a, const HyperVec& b) const;
    HyperVec unbind(const HyperVec& bound, const HyperVec& key) const { return bind(bound, key); }

    /**
     * @brief Majority vote; ties resolve to +1 on even component indices
     * @throws VsaError (EmptyBundle) for an empty input
     */
    HyperVec bundle(const std::vector<const HyperVec*>& vectors) const;
    HyperVec bundle(const std::vector<HyperVec>& vectors) const;

    /**
     * @brief Cyclic shift of components by `shift` positions
     */
    HyperVec permute(const HyperVec& v, size_t shift) const;

    float similarity(const HyperVec& a, const HyperVec& b) const;

private:
    void check(const HyperVec& v) const;

    size_t dim_;
};

} // namespace Glossa
