/**
 * @file tree_json.hpp
 * @brief JSON form of SemanticTree
 *
 * Every node becomes an object with a "kind" member naming its node type
 * ("EntityRef", "Triple", ...) plus one member per field. Optional fields are
 * written as null when absent.
 */

#pragma once

#include <grammar/semantic_tree.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>

namespace Glossa {

GLOSSA_API nlohmann::json tree_to_json(const SemanticTree& tree);

/**
 * @throws ParseFailed for an unknown kind or a missing field
 */
GLOSSA_API SemanticTree tree_from_json(const nlohmann::json& j);

// nlohmann ADL hooks, so trees nest inside larger documents.
inline void to_json(nlohmann::json& j, const SemanticTree& tree) { j = tree_to_json(tree); }
inline void from_json(const nlohmann::json& j, SemanticTree& tree) { tree = tree_from_json(j); }

} // namespace Glossa
