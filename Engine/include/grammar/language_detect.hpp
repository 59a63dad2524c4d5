/**
 * @file language_detect.hpp
 * @brief Script census plus Latin word-marker heuristics
 */

#pragma once

#include <export.hpp>
#include <grammar/lexicon.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Glossa {

struct DetectionResult {
    Language language = Language::English;
    float confidence = 0.0f;
};

/**
 * @brief Most likely language of a fragment.
 *
 * Cyrillic or Arabic majorities decide outright. Latin text is split between
 * English, French and Spanish by function-word and diacritic markers. Short
 * inputs come back with low confidence; nothing here throws.
 */
GLOSSA_API DetectionResult detect_language(std::string_view text);

/**
 * @brief Split after sentence terminators (kept) and detect each sentence.
 */
GLOSSA_API std::vector<std::pair<std::string, DetectionResult>> detect_per_sentence(std::string_view text);

} // namespace Glossa
