/**
 * @file config.cpp
 * @brief Environment-driven engine configuration
 */

#include <utils/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace Glossa {

Logger::Level Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "off" || lower == "none") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

static size_t env_size(const char* key, size_t fallback) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw) return fallback;
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(raw, &pos);
        if (pos != std::string(raw).size() || v == 0) {
            throw std::invalid_argument(raw);
        }
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(key) + " must be a positive integer, got '" + raw + "'");
    }
}

static float env_unit_float(const char* key, float fallback) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw) return fallback;
    try {
        size_t pos = 0;
        float v = std::stof(raw, &pos);
        if (pos != std::string(raw).size() || v < 0.0f || v > 1.0f) {
            throw std::invalid_argument(raw);
        }
        return v;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(key) + " must be a number in [0,1], got '" + raw + "'");
    }
}

EngineConfig EngineConfig::load_from_env() {
    EngineConfig config;

    config.dimension = env_size("GLOSSA_DIMENSION", config.dimension);
    config.index_capacity = env_size("GLOSSA_INDEX_CAPACITY", config.index_capacity);
    config.fuzzy_threshold = env_unit_float("GLOSSA_FUZZY_THRESHOLD", config.fuzzy_threshold);

    if (const char* g = std::getenv("GLOSSA_DEFAULT_GRAMMAR"); g && *g) {
        config.default_grammar = g;
    }
    if (const char* lang = std::getenv("GLOSSA_LANGUAGE"); lang && *lang) {
        config.language = lang;
    }
    if (const char* lvl = std::getenv("GLOSSA_LOG_LEVEL"); lvl && *lvl) {
        config.log_level = Logger::parse_level(lvl);
    }

    return config;
}

} // namespace Glossa
