/**
 * @file entity_resolver.cpp
 */

#include <grammar/entity_resolver.hpp>
#include <grammar/equivalences.hpp>
#include <utils/unicode.hpp>

#include <algorithm>

namespace Glossa {

void EntityResolver::add_alias(std::string_view surface, std::string canonical) {
    std::string key = to_lower(surface);
    if (key == to_lower(canonical)) return;
    aliases_[std::move(key)] = std::move(canonical);
}

ResolutionResult EntityResolver::resolve(std::string_view surface) const {
    auto it = aliases_.find(to_lower(surface));
    if (it != aliases_.end()) {
        return ResolutionResult{it->second, true, {std::string(surface)}};
    }
    if (auto canonical = lookup_equivalence(surface)) {
        return ResolutionResult{std::move(*canonical), true, {std::string(surface)}};
    }
    return ResolutionResult{std::string(surface), false, {}};
}

void EntityResolver::resolve_entity(ExtractedEntity& entity) const {
    ResolutionResult result = resolve(entity.name);
    if (!result.resolved) {
        if (entity.canonical_name.empty()) entity.canonical_name = entity.name;
        return;
    }
    if (!iequals(result.canonical, entity.name)) entity.aliases.push_back(entity.name);
    entity.canonical_name = std::move(result.canonical);
}

void EntityResolver::resolve_entities(std::vector<ExtractedEntity>& entities) const {
    for (auto& entity : entities) resolve_entity(entity);

    std::unordered_map<std::string, size_t> seen;
    std::vector<ExtractedEntity> merged;
    merged.reserve(entities.size());

    for (auto& entity : entities) {
        std::string key = to_lower(entity.canonical_name);
        auto it = seen.find(key);
        if (it == seen.end()) {
            seen.emplace(std::move(key), merged.size());
            merged.push_back(std::move(entity));
            continue;
        }
        ExtractedEntity& existing = merged[it->second];
        for (const auto& alias : entity.aliases) {
            if (std::find(existing.aliases.begin(), existing.aliases.end(), alias) == existing.aliases.end()) {
                existing.aliases.push_back(alias);
            }
        }
        existing.confidence = std::max(existing.confidence, entity.confidence);
    }

    entities = std::move(merged);
}

} // namespace Glossa
