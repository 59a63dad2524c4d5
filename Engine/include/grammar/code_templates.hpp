/**
 * @file code_templates.hpp
 * @brief Parameterised Rust code templates
 *
 * Code nodes carry no attributes, associated types or method bodies, so
 * common Rust patterns (error enums, builders, conversions) come from
 * templates instead. A template fills named parameters into Rust source;
 * expand() reads that source back through rust-gen into code nodes.
 */

#pragma once

#include <grammar/semantic_tree.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Glossa {

enum class ParamKind {
    TypeName,
    FieldList,      ///< "name: Type, name2: Type2"
    TraitName,
    ModuleName,
    VariantList,    ///< "Name(message, code, help), Other(message)"
    MethodList,     ///< "area(&self) -> f64, scale(&mut self, by: f64)"
    Text,
};

struct TemplateParam {
    std::string name;
    ParamKind kind = ParamKind::Text;
    bool required = true;
    std::optional<std::string> default_value;
    std::string description;

    static TemplateParam required_param(std::string name, ParamKind kind, std::string description);
    static TemplateParam optional_param(std::string name, ParamKind kind, std::string default_value,
                                        std::string description);
};

using TemplateArgs = std::map<std::string, std::string>;

class GLOSSA_API CodeTemplate {
public:
    /// Receives the caller's arguments with defaults filled in.
    using Generator = std::function<std::string(const TemplateArgs&)>;

    CodeTemplate(std::string name, std::string description, std::string category,
                 std::vector<TemplateParam> params, Generator generator);

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::string& category() const { return category_; }
    const std::vector<TemplateParam>& params() const { return params_; }

    /**
     * @brief Generated Rust source
     * @throws LinearizationFailed (CodeSignature, grammar "template") when a
     *         required parameter is missing
     */
    std::string instantiate(const TemplateArgs& args) const;

    /**
     * @brief instantiate(), read back into CodeSignature / CodeModule nodes
     * @throws LinearizationFailed as instantiate()
     */
    SemanticTree expand(const TemplateArgs& args) const;

private:
    std::string name_;
    std::string description_;
    std::string category_;
    std::vector<TemplateParam> params_;
    Generator generator_;
};

/**
 * @brief Templates keyed by name.
 *
 * A fresh registry holds error-type, trait-impl, builder, from-impl,
 * test-module, iterator and new-constructor. Adding under an existing name
 * replaces that template.
 */
class GLOSSA_API TemplateRegistry {
public:
    TemplateRegistry();

    void add(CodeTemplate tmpl);

    const CodeTemplate* get(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> list() const;

    std::vector<const CodeTemplate*> by_category(std::string_view category) const;

    /// Templates whose name, description or category contains any keyword, case-insensitively.
    std::vector<const CodeTemplate*> search(const std::vector<std::string>& keywords) const;

private:
    std::map<std::string, CodeTemplate> templates_;
};

/// Split on top-level commas; commas inside (), <> or "" stay put.
GLOSSA_API std::vector<std::string> split_template_list(std::string_view s);

} // namespace Glossa
