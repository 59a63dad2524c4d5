/**
 * @file category.cpp
 */

#include <grammar/category.hpp>

namespace Glossa {

static constexpr Category ALL_CATEGORIES[] = {
    Category::Entity, Category::Relation, Category::Statement, Category::Similarity,
    Category::Gap, Category::Inference, Category::CodeFact, Category::CodeModule,
    Category::CodeSignature, Category::DataFlow, Category::Conjunction, Category::Section,
    Category::Document, Category::Confidence, Category::Provenance, Category::Freeform,
    Category::DiscourseFrame,
};

const char* category_name(Category cat) {
    switch (cat) {
        case Category::Entity:         return "Entity";
        case Category::Relation:       return "Relation";
        case Category::Statement:      return "Statement";
        case Category::Similarity:     return "Similarity";
        case Category::Gap:            return "Gap";
        case Category::Inference:      return "Inference";
        case Category::CodeFact:       return "CodeFact";
        case Category::CodeModule:     return "CodeModule";
        case Category::CodeSignature:  return "CodeSignature";
        case Category::DataFlow:       return "DataFlow";
        case Category::Conjunction:    return "Conjunction";
        case Category::Section:        return "Section";
        case Category::Document:       return "Document";
        case Category::Confidence:     return "Confidence";
        case Category::Provenance:     return "Provenance";
        case Category::Freeform:       return "Freeform";
        case Category::DiscourseFrame: return "DiscourseFrame";
    }
    return "Unknown";
}

std::optional<Category> category_from_name(std::string_view name) {
    for (Category c : ALL_CATEGORIES) {
        if (name == category_name(c)) return c;
    }
    return std::nullopt;
}

} // namespace Glossa
