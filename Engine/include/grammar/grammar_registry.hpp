/**
 * @file grammar_registry.hpp
 * @brief Named collection of concrete grammars with a default
 */

#pragma once

#include <grammar/concrete_grammar.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Glossa {

/**
 * @brief Owns every available grammar, keyed by name.
 *
 * A fresh registry holds formal, terse, narrative and rust-gen, with formal
 * as the default. Registering under an existing name replaces that grammar.
 */
class GLOSSA_API GrammarRegistry {
public:
    GrammarRegistry();

    GrammarRegistry(const GrammarRegistry&) = delete;
    GrammarRegistry& operator=(const GrammarRegistry&) = delete;
    GrammarRegistry(GrammarRegistry&&) = default;
    GrammarRegistry& operator=(GrammarRegistry&&) = default;

    void register_grammar(std::unique_ptr<ConcreteGrammar> grammar);

    /**
     * @throws UnknownGrammar
     */
    void set_default(const std::string& name);

    /**
     * @throws UnknownGrammar
     */
    const ConcreteGrammar& get(const std::string& name) const;

    const ConcreteGrammar& default_grammar() const;
    const std::string& default_name() const { return default_; }

    /// Registered names, sorted.
    std::vector<std::string> list() const;

    bool contains(const std::string& name) const { return grammars_.count(name) != 0; }

    std::string linearize(const std::string& grammar, const SemanticTree& tree, const LinContext& ctx) const;
    std::string linearize_default(const SemanticTree& tree, const LinContext& ctx) const;

    SemanticTree parse(const std::string& grammar, std::string_view input, std::optional<Category> expected,
                       const ParseContext& ctx) const;

private:
    std::map<std::string, std::unique_ptr<ConcreteGrammar>> grammars_;
    std::string default_;
};

} // namespace Glossa
