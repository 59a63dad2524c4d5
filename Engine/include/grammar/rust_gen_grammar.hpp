/**
 * @file rust_gen_grammar.hpp
 * @brief Rust source generation from code nodes, and Rust source -> tree
 *
 * CodeSignature kinds fn, struct, enum, trait and impl become item stubs;
 * CodeModule becomes a `pub mod` block; DataFlow becomes a pipeline comment.
 * Parsing goes through tree-sitter-rust and recovers the same node shapes.
 */

#pragma once

#include <grammar/concrete_grammar.hpp>

namespace Glossa {

class GLOSSA_API RustGenGrammar : public ConcreteGrammar {
public:
    std::string name() const override { return "rust-gen"; }
    std::string description() const override {
        return "Rust code generation grammar: linearizes code nodes into valid Rust source";
    }

    std::string linearize(const SemanticTree& tree, const LinContext& ctx) const override;

    /**
     * @brief Rust source -> CodeSignature / CodeModule
     *
     * No recognized items gives Freeform(input); one item gives that item;
     * several are wrapped in a CodeModule named "parsed".
     *
     * @throws ParseFailed when tree-sitter reports a syntax error
     */
    SemanticTree parse(std::string_view input, std::optional<Category> expected,
                       const ParseContext& ctx) const override;

    const std::vector<Category>& supported_categories() const override;
};

} // namespace Glossa
