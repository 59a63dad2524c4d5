/**
 * @file concrete_grammar.hpp
 * @brief Interface every renderer implements: tree -> prose and prose -> tree
 */

#pragma once

#include <grammar/category.hpp>
#include <grammar/context.hpp>
#include <grammar/semantic_tree.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

class GLOSSA_API ConcreteGrammar {
public:
    virtual ~ConcreteGrammar() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    /**
     * @throws LinearizationFailed for a node kind this grammar does not render
     */
    virtual std::string linearize(const SemanticTree& tree, const LinContext& ctx) const = 0;

    /**
     * @brief Prose -> tree. Defaults to the shared prose parser.
     * @param expected Category hint; grammars may ignore it
     */
    virtual SemanticTree parse(std::string_view input, std::optional<Category> expected,
                               const ParseContext& ctx) const;

    virtual const std::vector<Category>& supported_categories() const = 0;

    bool supports(Category cat) const;
};

} // namespace Glossa
