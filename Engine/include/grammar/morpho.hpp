/**
 * @file morpho.hpp
 * @brief Small rule-based morphology used by the prose renderers
 */

#pragma once

#include <grammar/lexicon.hpp>
#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

/// "a" or "an" for the following English word.
GLOSSA_API const char* indefinite_article(std::string_view word);

/**
 * @brief Readable phrase for a canonical predicate.
 *
 * "is-a" -> "is a", "part-of" -> "is part of", "code:defines-fn" -> "defines function".
 * Unknown labels have '-' and '_' replaced by spaces.
 */
GLOSSA_API std::string humanize_predicate(std::string_view predicate);

/// As above, preferring the lexicon's own surface words outside English.
GLOSSA_API std::string humanize_predicate(std::string_view predicate, const Lexicon& lexicon);

GLOSSA_API std::string capitalize(std::string_view s);

/// English plural with a handful of irregulars; words already ending in -s are kept.
GLOSSA_API std::string pluralize(std::string_view word);

GLOSSA_API std::string code_quote(std::string_view label);

/// "A", "A and B", "A, B, and C".
GLOSSA_API std::string join_list(const std::vector<std::string>& items, std::string_view conjunction = "and");

} // namespace Glossa
