/**
 * @file encode.hpp
 * @brief Deterministic mappings from symbols and text into hypervector space
 */

#pragma once

#include <vsa/hypervector.hpp>
#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <string_view>
#include <vector>

namespace Glossa {

/**
 * @brief Vector for a symbol id. Same id, same vector, on every run.
 */
GLOSSA_API HyperVec encode_symbol(const VsaOps& ops, SymbolId symbol);

/**
 * @brief Vector for a piece of text, built from its character trigrams.
 *
 * The text is lowercased and padded with boundary marks before the trigrams
 * are hashed and bundled, so spellings that share most trigrams land close
 * together. Text shorter than one trigram is hashed whole.
 */
GLOSSA_API HyperVec encode_token(const VsaOps& ops, std::string_view text);

/**
 * @brief bind(role, filler)
 */
GLOSSA_API HyperVec encode_role_filler(const VsaOps& ops, const HyperVec& role, const HyperVec& filler);

/**
 * @brief Order-sensitive encoding: element i is permuted by (n - 1 - i), then bundled.
 * @throws VsaError (EmptyCollection) for an empty sequence
 */
GLOSSA_API HyperVec encode_sequence(const VsaOps& ops, const std::vector<HyperVec>& items);

} // namespace Glossa
