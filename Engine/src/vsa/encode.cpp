/**
 * @file encode.cpp
 * @brief Symbol, token and sequence encoders
 */

#include <vsa/encode.hpp>
#include <grammar/error.hpp>
#include <utils/unicode.hpp>

namespace Glossa {

static constexpr const char* TOKEN_DOMAIN = "glossa 2026 hypervector token trigram";

HyperVec encode_symbol(const VsaOps& ops, SymbolId symbol) {
    return ops.random(symbol);
}

HyperVec encode_token(const VsaOps& ops, std::string_view text) {
    std::u32string cps = utf8_to_utf32(to_lower(text));

    if (cps.size() < 2) {
        std::string whole = utf32_to_utf8(cps);
        return ops.random_from_text(TOKEN_DOMAIN, whole.data(), whole.size());
    }

    // "#dog#" -> "#do", "dog", "og#"
    std::u32string padded;
    padded.reserve(cps.size() + 2);
    padded.push_back(U'#');
    padded += cps;
    padded.push_back(U'#');

    std::vector<HyperVec> grams;
    grams.reserve(padded.size() - 2);
    for (size_t i = 0; i + 3 <= padded.size(); ++i) {
        std::string gram = utf32_to_utf8(padded.substr(i, 3));
        grams.push_back(ops.random_from_text(TOKEN_DOMAIN, gram.data(), gram.size()));
    }

    if (grams.size() == 1) return grams.front();
    return ops.bundle(grams);
}

HyperVec encode_role_filler(const VsaOps& ops, const HyperVec& role, const HyperVec& filler) {
    return ops.bind(role, filler);
}

HyperVec encode_sequence(const VsaOps& ops, const std::vector<HyperVec>& items) {
    if (items.empty()) {
        throw VsaError(VsaError::Reason::EmptyCollection, "cannot encode an empty sequence");
    }
    const size_t n = items.size();
    std::vector<HyperVec> shifted;
    shifted.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t shift = n - 1 - i;
        shifted.push_back(shift > 0 ? ops.permute(items[i], shift) : items[i]);
    }
    if (n == 1) return shifted.front();
    return ops.bundle(shifted);
}

} // namespace Glossa
