/**
 * @file custom_grammar.hpp
 * @brief User-defined grammar loaded from a small TOML subset
 *
 *     [grammar]
 *     name = "mythic"
 *     description = "Knowledge as mythology"
 *
 *     [linearization]
 *     triple = "It is written that {subject} {predicate} {object}."
 *     gap = "The scrolls are silent on {entity}: {description}."
 *
 * Template keys: triple, similarity, gap, inference, code_fact, code_module,
 * code_signature, data_flow, freeform. Unknown keys and other sections are
 * ignored. Node kinds without a template use a plain default phrasing.
 */

#pragma once

#include <grammar/concrete_grammar.hpp>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Glossa {

class GLOSSA_API CustomGrammar : public ConcreteGrammar {
public:
    /**
     * @throws InvalidCustomGrammar on malformed input or a missing [grammar] name
     */
    static CustomGrammar from_toml(std::string_view toml);

    /**
     * @throws InvalidCustomGrammar if the file cannot be read or is malformed
     */
    static CustomGrammar from_file(const std::string& path);

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }

    std::string linearize(const SemanticTree& tree, const LinContext& ctx) const override;
    const std::vector<Category>& supported_categories() const override;

    const std::string* template_for(const std::string& key) const;
    size_t template_count() const { return templates_.size(); }

private:
    CustomGrammar() = default;

    std::string name_;
    std::string description_;
    std::unordered_map<std::string, std::string> templates_;
};

/**
 * @brief Replace each {name} with vars[name]; unknown placeholders stay as written.
 */
GLOSSA_API std::string apply_template(std::string_view tmpl, const std::map<std::string, std::string>& vars);

} // namespace Glossa
