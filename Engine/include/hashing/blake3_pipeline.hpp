/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing for deterministic symbol and vector derivation
 */

#pragma once

#include <export.hpp>
#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Glossa {

/**
 * @brief BLAKE3 hashing helpers
 *
 * Everything that must be reproducible across runs without persistent state
 * (role symbols, label vectors, symbol vectors) is derived from here.
 * SAME INPUT = SAME BYTES, on every machine.
 */
class GLOSSA_API BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief First 8 bytes of the digest as a little-endian integer
     */
    static uint64_t hash64(std::string_view str);

    /**
     * @brief Extendable output: derive `out_len` bytes from a domain tag and payload
     *
     * The tag keeps derivations for different purposes (symbol vectors,
     * text vectors) apart even when payload bytes coincide.
     */
    static std::vector<uint8_t> expand(std::string_view domain, const void* payload,
                                       size_t payload_len, size_t out_len);

    /**
     * @brief Batch hash multiple inputs (parallel)
     * @param inputs Vector of input buffers
     * @return Vector of hashes (same order)
     */
    static std::vector<Hash> hash_batch(const std::vector<std::string>& inputs);

    /**
     * @brief Convert hash to hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace Glossa
