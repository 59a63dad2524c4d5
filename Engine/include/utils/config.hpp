/**
 * @file config.hpp
 * @brief Engine configuration loaded from GLOSSA_* environment variables
 */

#pragma once

#include <utils/logger.hpp>
#include <export.hpp>
#include <string>
#include <cstddef>

namespace Glossa {

/**
 * @brief Process-level settings for the translation engine.
 *
 * Every field has a working default; load_from_env() only overrides what is set.
 */
struct GLOSSA_API EngineConfig {
    // Hypervector space
    size_t dimension = 10000;          // Bits per hypervector
    size_t index_capacity = 100000;    // HNSW max_elements (grows on demand)
    size_t hnsw_m = 16;                // HNSW graph degree
    size_t hnsw_ef_construction = 200; // HNSW build-time beam

    // Lexer fuzzy fallback
    float fuzzy_threshold = 0.6f;      // Accept ANN match only above this similarity
    size_t fuzzy_k = 3;                // Neighbours requested per token
    size_t fuzzy_min_length = 2;       // Tokens shorter than this never go fuzzy

    // Rendering
    std::string default_grammar = "formal";
    std::string language = "auto";     // BCP 47 code or "auto"

    Logger::Level log_level = Logger::Level::Warning;

    /**
     * @brief Build a config from defaults overridden by the environment.
     *
     * Reads GLOSSA_DIMENSION, GLOSSA_INDEX_CAPACITY, GLOSSA_FUZZY_THRESHOLD,
     * GLOSSA_DEFAULT_GRAMMAR, GLOSSA_LANGUAGE and GLOSSA_LOG_LEVEL.
     * @throws std::invalid_argument if a variable is set but unparsable
     */
    static EngineConfig load_from_env();

    /**
     * @brief Push log_level into the global Logger threshold.
     */
    void apply_logging() const { Logger::set_threshold(log_level); }
};

} // namespace Glossa
