/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <sstream>
#include <iomanip>

namespace Glossa {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

uint64_t BLAKE3Pipeline::hash64(std::string_view str) {
    Hash h = hash(str);
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | h[i];
    }
    return v;
}

std::vector<uint8_t> BLAKE3Pipeline::expand(std::string_view domain, const void* payload,
                                            size_t payload_len, size_t out_len) {
    std::vector<uint8_t> out(out_len);

    blake3_hasher hasher;
    blake3_hasher_init_derive_key_raw(&hasher, domain.data(), domain.size());
    blake3_hasher_update(&hasher, payload, payload_len);
    blake3_hasher_finalize(&hasher, out.data(), out_len);

    return out;
}

std::vector<BLAKE3Pipeline::Hash> BLAKE3Pipeline::hash_batch(const std::vector<std::string>& inputs) {
    std::vector<Hash> results(inputs.size());
    const long n = static_cast<long>(inputs.size());

    #pragma omp parallel for schedule(static) if (n >= 100)
    for (long i = 0; i < n; ++i) {
        results[i] = hash(inputs[i]);
    }

    return results;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

} // namespace Glossa
