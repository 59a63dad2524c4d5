/**
 * @file concrete_grammar.cpp
 */

#include <grammar/concrete_grammar.hpp>
#include <grammar/parser.hpp>

#include <algorithm>

namespace Glossa {

SemanticTree ConcreteGrammar::parse(std::string_view input, std::optional<Category> /*expected*/,
                                    const ParseContext& ctx) const {
    return parse_universal(input, ctx);
}

bool ConcreteGrammar::supports(Category cat) const {
    const auto& cats = supported_categories();
    return std::find(cats.begin(), cats.end(), cat) != cats.end();
}

} // namespace Glossa
