/**
 * @file equivalences.hpp
 * @brief Static cross-lingual equivalence table for high-frequency terms
 *
 * Maps surface forms in English, Russian, Arabic, French and Spanish to one
 * canonical English label: countries, capitals, organizations and common
 * domain terms.
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

struct Equivalence {
    std::string canonical;
    std::vector<std::string> aliases;
};

/**
 * @brief The whole table, in declaration order. Built once, never mutated.
 */
GLOSSA_API const std::vector<Equivalence>& equivalence_table();

/**
 * @brief Canonical label for a surface form, matching the canonical label or any alias
 *
 * Case-insensitive, with an exact-case fallback for scripts the case folder
 * does not cover. The first matching entry wins.
 */
GLOSSA_API std::optional<std::string> lookup_equivalence(std::string_view surface);

} // namespace Glossa
