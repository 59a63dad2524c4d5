/**
 * @file symbol_id.hpp
 * @brief Symbol identity shared by the grammar and vector layers
 */

#pragma once

#include <cstdint>

namespace Glossa {

/// Identity of a symbol in the knowledge graph. 0 is never allocated.
using SymbolId = uint64_t;

/// Ids with this bit set are reserved for derived role symbols.
constexpr SymbolId ROLE_SYMBOL_BIT = 1ull << 63;

inline bool is_role_symbol(SymbolId id) { return (id & ROLE_SYMBOL_BIT) != 0; }

} // namespace Glossa
