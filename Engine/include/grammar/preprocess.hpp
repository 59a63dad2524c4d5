/**
 * @file preprocess.hpp
 * @brief Batch extraction of entities and claims from text chunks
 *
 * Each chunk is language-detected (or uses its hint), parsed, and mapped to
 * entities and claims with a claim-type classification. Entities then go
 * through cross-lingual resolution and de-duplication.
 */

#pragma once

#include <grammar/context.hpp>
#include <grammar/entity_resolver.hpp>
#include <grammar/semantic_tree.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Glossa {

struct TextChunk {
    std::optional<std::string> id;
    std::string text;
    std::optional<std::string> language;    // BCP-47 hint; detected when absent
};

struct ExtractedClaim {
    std::string claim_text;
    std::string claim_type;     // FACTUAL, CAUSAL, SPATIAL, RELATIONAL, STRUCTURAL, DEPENDENCY, OTHER
    float confidence = 0.0f;
    std::string subject;
    std::string predicate;      // canonical label, e.g. "is-a"
    std::string object;
    std::string source_language;
};

struct PreProcessorOutput {
    std::optional<std::string> chunk_id;
    std::string source_language;
    float detected_language_confidence = 0.0f;
    std::vector<ExtractedEntity> entities;
    std::vector<ExtractedClaim> claims;
    std::vector<SemanticTree> trees;
};

struct PreProcessRequest {
    std::vector<TextChunk> chunks;
};

struct PreProcessResponse {
    std::vector<PreProcessorOutput> results;
    uint64_t processing_time_ms = 0;
};

GLOSSA_API const char* predicate_to_claim_type(std::string_view predicate);

/**
 * @brief PLACE for the object of located-in, CONCEPT otherwise
 */
GLOSSA_API const char* infer_entity_type(std::string_view predicate, bool is_subject);

GLOSSA_API PreProcessorOutput preprocess_chunk(const TextChunk& chunk, const ParseContext& ctx,
                                               const EntityResolver& resolver = EntityResolver());

/**
 * @brief One output per chunk, in input order
 */
GLOSSA_API std::vector<PreProcessorOutput> preprocess_batch(const std::vector<TextChunk>& chunks,
                                                            const ParseContext& ctx,
                                                            const EntityResolver& resolver = EntityResolver());

/**
 * @brief Split into sentences, detect each one's language, and process each as its own chunk
 */
GLOSSA_API std::vector<PreProcessorOutput> preprocess_mixed_corpus(std::string_view text, const ParseContext& ctx,
                                                                   const EntityResolver& resolver = EntityResolver());

GLOSSA_API PreProcessResponse preprocess_request(const PreProcessRequest& request, const ParseContext& ctx,
                                                 const EntityResolver& resolver = EntityResolver());

// ---- JSON --------------------------------------------------------------------

GLOSSA_API void to_json(nlohmann::json& j, const TextChunk& chunk);
GLOSSA_API void from_json(const nlohmann::json& j, TextChunk& chunk);
GLOSSA_API void to_json(nlohmann::json& j, const ExtractedEntity& entity);
GLOSSA_API void from_json(const nlohmann::json& j, ExtractedEntity& entity);
GLOSSA_API void to_json(nlohmann::json& j, const ExtractedClaim& claim);
GLOSSA_API void from_json(const nlohmann::json& j, ExtractedClaim& claim);
GLOSSA_API void to_json(nlohmann::json& j, const PreProcessorOutput& output);
GLOSSA_API void from_json(const nlohmann::json& j, PreProcessorOutput& output);
GLOSSA_API void to_json(nlohmann::json& j, const PreProcessRequest& request);
GLOSSA_API void from_json(const nlohmann::json& j, PreProcessRequest& request);
GLOSSA_API void to_json(nlohmann::json& j, const PreProcessResponse& response);

} // namespace Glossa
