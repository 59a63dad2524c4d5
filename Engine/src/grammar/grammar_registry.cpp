/**
 * @file grammar_registry.cpp
 */

#include <grammar/grammar_registry.hpp>
#include <grammar/error.hpp>
#include <grammar/formal_grammar.hpp>
#include <grammar/narrative_grammar.hpp>
#include <grammar/rust_gen_grammar.hpp>
#include <grammar/terse_grammar.hpp>
#include <utils/logger.hpp>

namespace Glossa {

GrammarRegistry::GrammarRegistry() : default_("formal") {
    register_grammar(std::make_unique<FormalGrammar>());
    register_grammar(std::make_unique<TerseGrammar>());
    register_grammar(std::make_unique<NarrativeGrammar>());
    register_grammar(std::make_unique<RustGenGrammar>());
}

void GrammarRegistry::register_grammar(std::unique_ptr<ConcreteGrammar> grammar) {
    std::string name = grammar->name();
    if (grammars_.count(name)) Logger::debug("Replacing grammar '" + name + "'");
    grammars_[name] = std::move(grammar);
}

void GrammarRegistry::set_default(const std::string& name) {
    if (!contains(name)) throw UnknownGrammar(name);
    default_ = name;
    Logger::info("Default grammar: " + name);
}

const ConcreteGrammar& GrammarRegistry::get(const std::string& name) const {
    auto it = grammars_.find(name);
    if (it == grammars_.end()) throw UnknownGrammar(name);
    return *it->second;
}

const ConcreteGrammar& GrammarRegistry::default_grammar() const {
    return get(default_);
}

std::vector<std::string> GrammarRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(grammars_.size());
    for (const auto& [name, _] : grammars_) names.push_back(name);
    return names;
}

std::string GrammarRegistry::linearize(const std::string& grammar, const SemanticTree& tree,
                                       const LinContext& ctx) const {
    return get(grammar).linearize(tree, ctx);
}

std::string GrammarRegistry::linearize_default(const SemanticTree& tree, const LinContext& ctx) const {
    return default_grammar().linearize(tree, ctx);
}

SemanticTree GrammarRegistry::parse(const std::string& grammar, std::string_view input,
                                    std::optional<Category> expected, const ParseContext& ctx) const {
    return get(grammar).parse(input, expected, ctx);
}

} // namespace Glossa
