/**
 * @file preprocess.cpp
 */

#include <grammar/preprocess.hpp>
#include <grammar/error.hpp>
#include <grammar/language_detect.hpp>
#include <grammar/parser.hpp>
#include <grammar/tree_json.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <utils/unicode.hpp>

namespace Glossa {

using json = nlohmann::json;

namespace {

constexpr float kExtractionConfidence = 0.90f;

void extract_from_tree(const SemanticTree& tree, const std::string& claim_text, const std::string& lang,
                       std::vector<ExtractedEntity>& entities, std::vector<ExtractedClaim>& claims) {
    if (auto* t = tree.as<Node::Triple>()) {
        std::string subject = t->subject->label().value_or("?");
        std::string predicate = t->predicate->label().value_or("?");
        std::string object = t->object->label().value_or("?");

        entities.push_back({subject, infer_entity_type(predicate, true), subject, kExtractionConfidence, {}, lang});
        entities.push_back({object, infer_entity_type(predicate, false), object, kExtractionConfidence, {}, lang});
        claims.push_back({claim_text, predicate_to_claim_type(predicate), kExtractionConfidence,
                          subject, predicate, object, lang});
        return;
    }
    if (auto* c = tree.as<Node::WithConfidence>()) {
        size_t claims_before = claims.size();
        size_t entities_before = entities.size();
        extract_from_tree(*c->inner, claim_text, lang, entities, claims);
        for (size_t i = claims_before; i < claims.size(); ++i) claims[i].confidence = c->confidence;
        for (size_t i = entities_before; i < entities.size(); ++i) entities[i].confidence = c->confidence;
        return;
    }
    if (auto* p = tree.as<Node::WithProvenance>()) {
        extract_from_tree(*p->inner, claim_text, lang, entities, claims);
        return;
    }
    if (auto* c = tree.as<Node::Conjunction>()) {
        for (const auto& item : c->items) extract_from_tree(item, claim_text, lang, entities, claims);
    }
}

/// Hinted language if it is one we know, else the detected one.
Language effective_language(const TextChunk& chunk, const DetectionResult& detection) {
    if (!chunk.language) return detection.language;
    try {
        Language hinted = language_from_code(*chunk.language);
        return hinted == Language::Auto ? detection.language : hinted;
    } catch (const UnsupportedLanguage& e) {
        Logger::warn(std::string(e.what()) + "; using detected language");
        return detection.language;
    }
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t dot = text.find('.', start);
        std::string_view piece = trim(std::string_view(text).substr(start, dot == std::string::npos
                                                                               ? std::string::npos
                                                                               : dot - start));
        if (!piece.empty()) out.emplace_back(piece);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return out;
}

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

} // namespace

const char* predicate_to_claim_type(std::string_view p) {
    if (p == "is-a" || p == "has-a" || p == "contains" || p == "implements" || p == "defines") return "FACTUAL";
    if (p == "causes") return "CAUSAL";
    if (p == "located-in") return "SPATIAL";
    if (p == "similar-to") return "RELATIONAL";
    if (p == "part-of" || p == "composed-of") return "STRUCTURAL";
    if (p == "depends-on") return "DEPENDENCY";
    return "OTHER";
}

const char* infer_entity_type(std::string_view predicate, bool is_subject) {
    if (predicate == "located-in" && !is_subject) return "PLACE";
    return "CONCEPT";
}

PreProcessorOutput preprocess_chunk(const TextChunk& chunk, const ParseContext& ctx, const EntityResolver& resolver) {
    DetectionResult detection = detect_language(chunk.text);
    Language lang = effective_language(chunk, detection);
    std::string code = language_code(lang);

    ParseContext parse_ctx = ctx;
    parse_ctx.lexicon = nullptr;
    parse_ctx.language = lang;

    PreProcessorOutput out;
    out.chunk_id = chunk.id;
    out.source_language = code;
    out.detected_language_confidence = detection.confidence;

    auto take = [&](const SemanticTree& tree, const std::string& claim_text) {
        extract_from_tree(tree, claim_text, code, out.entities, out.claims);
        out.trees.push_back(tree);
    };

    ParseResult result = parse_prose(chunk.text, parse_ctx);
    if (result.kind == ParseResult::Kind::Facts) {
        for (const auto& fact : result.facts) take(fact, chunk.text);
    } else if (result.kind == ParseResult::Kind::Freeform) {
        if (!result.partial.empty()) {
            for (const auto& tree : result.partial) take(tree, chunk.text);
        } else {
            for (const auto& sentence : split_sentences(result.text)) {
                ParseResult sub = parse_prose(sentence, parse_ctx);
                if (sub.kind != ParseResult::Kind::Facts) continue;
                for (const auto& fact : sub.facts) take(fact, sentence);
            }
        }
    }

    resolver.resolve_entities(out.entities);
    return out;
}

std::vector<PreProcessorOutput> preprocess_batch(const std::vector<TextChunk>& chunks, const ParseContext& ctx,
                                                 const EntityResolver& resolver) {
    ScopedTimer timer("Pre-processed batch", chunks.size());
    std::vector<PreProcessorOutput> outputs;
    outputs.reserve(chunks.size());
    for (const auto& chunk : chunks) outputs.push_back(preprocess_chunk(chunk, ctx, resolver));
    return outputs;
}

std::vector<PreProcessorOutput> preprocess_mixed_corpus(std::string_view text, const ParseContext& ctx,
                                                        const EntityResolver& resolver) {
    std::vector<PreProcessorOutput> outputs;
    for (auto& [sentence, detection] : detect_per_sentence(text)) {
        TextChunk chunk{std::nullopt, std::move(sentence), std::string(language_code(detection.language))};
        outputs.push_back(preprocess_chunk(chunk, ctx, resolver));
    }
    return outputs;
}

PreProcessResponse preprocess_request(const PreProcessRequest& request, const ParseContext& ctx,
                                      const EntityResolver& resolver) {
    Timer timer;
    PreProcessResponse response;
    response.results = preprocess_batch(request.chunks, ctx, resolver);
    response.processing_time_ms = timer.elapsed_whole_ms();
    return response;
}

// =============================================================================
// JSON
// =============================================================================

void to_json(json& j, const TextChunk& chunk) {
    j = {{"text", chunk.text}};
    j["id"] = chunk.id ? json(*chunk.id) : json(nullptr);
    j["language"] = chunk.language ? json(*chunk.language) : json(nullptr);
}

void from_json(const json& j, TextChunk& chunk) {
    chunk.text = j.at("text").get<std::string>();
    chunk.id = optional_field<std::string>(j, "id");
    chunk.language = optional_field<std::string>(j, "language");
}

void to_json(json& j, const ExtractedEntity& e) {
    j = {{"name", e.name},
         {"entity_type", e.entity_type},
         {"canonical_name", e.canonical_name},
         {"confidence", e.confidence},
         {"aliases", e.aliases},
         {"source_language", e.source_language}};
}

void from_json(const json& j, ExtractedEntity& e) {
    e.name = j.at("name").get<std::string>();
    e.entity_type = j.at("entity_type").get<std::string>();
    e.canonical_name = j.at("canonical_name").get<std::string>();
    e.confidence = j.at("confidence").get<float>();
    e.aliases = j.value("aliases", std::vector<std::string>{});
    e.source_language = j.at("source_language").get<std::string>();
}

void to_json(json& j, const ExtractedClaim& c) {
    j = {{"claim_text", c.claim_text},
         {"claim_type", c.claim_type},
         {"confidence", c.confidence},
         {"subject", c.subject},
         {"predicate", c.predicate},
         {"object", c.object},
         {"source_language", c.source_language}};
}

void from_json(const json& j, ExtractedClaim& c) {
    c.claim_text = j.at("claim_text").get<std::string>();
    c.claim_type = j.at("claim_type").get<std::string>();
    c.confidence = j.at("confidence").get<float>();
    c.subject = j.at("subject").get<std::string>();
    c.predicate = j.at("predicate").get<std::string>();
    c.object = j.at("object").get<std::string>();
    c.source_language = j.at("source_language").get<std::string>();
}

void to_json(json& j, const PreProcessorOutput& o) {
    json trees = json::array();
    for (const auto& tree : o.trees) trees.push_back(tree_to_json(tree));
    j = {{"chunk_id", o.chunk_id ? json(*o.chunk_id) : json(nullptr)},
         {"source_language", o.source_language},
         {"detected_language_confidence", o.detected_language_confidence},
         {"entities", o.entities},
         {"claims", o.claims},
         {"trees", trees}};
}

void from_json(const json& j, PreProcessorOutput& o) {
    o.chunk_id = optional_field<std::string>(j, "chunk_id");
    o.source_language = j.at("source_language").get<std::string>();
    o.detected_language_confidence = j.at("detected_language_confidence").get<float>();
    o.entities = j.at("entities").get<std::vector<ExtractedEntity>>();
    o.claims = j.at("claims").get<std::vector<ExtractedClaim>>();
    o.trees.clear();
    for (const auto& tree : j.value("trees", json::array())) o.trees.push_back(tree_from_json(tree));
}

void to_json(json& j, const PreProcessRequest& r) {
    j = {{"chunks", r.chunks}};
}

void from_json(const json& j, PreProcessRequest& r) {
    r.chunks = j.at("chunks").get<std::vector<TextChunk>>();
}

void to_json(json& j, const PreProcessResponse& r) {
    j = {{"results", r.results}, {"processing_time_ms", r.processing_time_ms}};
}

} // namespace Glossa
