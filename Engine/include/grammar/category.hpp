/**
 * @file category.hpp
 * @brief Semantic categories tagging every interlingua node
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Glossa {

/**
 * @brief Semantic role of a SemanticTree node.
 *
 * Leaves are Entity, Relation and Freeform; only those may stand as the
 * subject or object of a Statement.
 */
enum class Category {
    Entity,
    Relation,
    Statement,
    Similarity,
    Gap,
    Inference,
    CodeFact,
    CodeModule,
    CodeSignature,
    DataFlow,
    Conjunction,
    Section,
    Document,
    Confidence,
    Provenance,
    Freeform,
    DiscourseFrame
};

GLOSSA_API const char* category_name(Category cat);
GLOSSA_API std::optional<Category> category_from_name(std::string_view name);

inline bool is_leaf(Category cat) {
    return cat == Category::Entity || cat == Category::Relation || cat == Category::Freeform;
}

/**
 * @brief Whether a node of this category may be a Statement's subject or object.
 */
inline bool valid_in_statement(Category cat) {
    return is_leaf(cat);
}

} // namespace Glossa
