/**
 * @file entity_resolver.hpp
 * @brief Cross-lingual entity resolution and de-duplication
 *
 * Resolution order for a surface form:
 *   1. runtime alias table (case-insensitive)
 *   2. static equivalence table
 *   3. the surface form itself, unresolved
 */

#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Glossa {

/**
 * @brief An entity mentioned in a text chunk.
 */
struct ExtractedEntity {
    std::string name;               // surface form as written
    std::string entity_type;        // CONCEPT, PLACE
    std::string canonical_name;
    float confidence = 0.0f;
    std::vector<std::string> aliases;
    std::string source_language;    // BCP-47
};

struct ResolutionResult {
    std::string canonical;
    bool resolved = false;
    std::vector<std::string> aliases;
};

class GLOSSA_API EntityResolver {
public:
    /**
     * @brief Map `surface` to `canonical`. Ignored when they differ only in case.
     */
    void add_alias(std::string_view surface, std::string canonical);

    size_t alias_count() const { return aliases_.size(); }

    ResolutionResult resolve(std::string_view surface) const;

    /**
     * @brief Set the canonical name; the original name becomes an alias when it differs
     */
    void resolve_entity(ExtractedEntity& entity) const;

    /**
     * @brief Resolve every entity, then merge those sharing a canonical name.
     *
     * Merging is case-insensitive, keeps the first occurrence's position,
     * unions alias lists and keeps the highest confidence.
     */
    void resolve_entities(std::vector<ExtractedEntity>& entities) const;

private:
    std::unordered_map<std::string, std::string> aliases_;   // lowercase surface -> canonical
};

} // namespace Glossa
