/**
 * @file code_templates.cpp
 */

#include <grammar/code_templates.hpp>
#include <grammar/context.hpp>
#include <grammar/error.hpp>
#include <grammar/rust_gen_grammar.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <utility>

namespace Glossa {

namespace {

struct Field {
    std::string name;
    std::string type;
};

/// "NotFound(item not found, my::not_found, check the ID)" -> name and arguments
std::pair<std::string, std::vector<std::string>> variant_spec(std::string_view spec) {
    size_t open = spec.find('(');
    if (open == std::string_view::npos) return {std::string(trim(spec)), {}};

    std::string name(trim(spec.substr(0, open)));
    std::string_view inner = spec.substr(open + 1);
    if (!inner.empty() && inner.back() == ')') inner.remove_suffix(1);

    std::vector<std::string> args;
    for (auto& arg : split_template_list(inner)) {
        if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"') arg = arg.substr(1, arg.size() - 2);
        if (!arg.empty()) args.push_back(std::move(arg));
    }
    return {name, args};
}

/// "name: Type, flag" -> {name, Type}, {flag, ()}
std::vector<Field> field_list(std::string_view s) {
    std::vector<Field> fields;
    for (const auto& entry : split_template_list(s)) {
        if (entry.empty()) continue;
        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            fields.push_back({entry, "()"});
        } else {
            fields.push_back({std::string(trim(std::string_view(entry).substr(0, colon))),
                              std::string(trim(std::string_view(entry).substr(colon + 1)))});
        }
    }
    return fields;
}

std::string quoted(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

const std::string& arg(const TemplateArgs& args, const std::string& name) {
    static const std::string empty;
    auto it = args.find(name);
    return it == args.end() ? empty : it->second;
}

// =============================================================================
// Generators
// =============================================================================

std::string error_type(const TemplateArgs& args) {
    const std::string& name = arg(args, "name");

    std::string out = "#[derive(Debug, thiserror::Error, miette::Diagnostic)]\n";
    out += "pub enum " + name + " {\n";
    for (const auto& spec : split_template_list(arg(args, "variants"))) {
        if (spec.empty()) continue;
        auto [variant, details] = variant_spec(spec);

        out += "    #[error(" + quoted(details.empty() ? variant : details[0]) + ")]\n";
        if (details.size() == 2) {
            out += "    #[diagnostic(code(" + details[1] + "))]\n";
        } else if (details.size() > 2) {
            out += "    #[diagnostic(code(" + details[1] + "), help(" + quoted(details[2]) + "))]\n";
        }
        out += "    " + variant + ",\n\n";
    }
    out += "}\n";

    const std::string& alias = arg(args, "result_alias");
    if (!alias.empty()) {
        out += "\npub type " + alias + "<T> = std::result::Result<T, " + name + ">;\n";
    }
    return out;
}

/// Plain method stubs, so this one goes through the rust-gen impl writer.
std::string trait_impl(const TemplateArgs& args) {
    Node::CodeSignature impl;
    impl.kind = "impl";
    impl.name = arg(args, "type_name");
    impl.return_type = impl.name;
    impl.traits.push_back(arg(args, "trait_name"));
    for (auto& method : split_template_list(arg(args, "methods"))) {
        if (!method.empty()) impl.params_or_fields.push_back(std::move(method));
    }
    return RustGenGrammar().linearize(SemanticTree(std::move(impl)), LinContext());
}

std::string builder(const TemplateArgs& args) {
    const std::string& target = arg(args, "type_name");
    const std::string builder_name = target + "Builder";
    const std::vector<Field> fields = field_list(arg(args, "fields"));

    std::string out = "#[derive(Debug, Default)]\n";
    out += "pub struct " + builder_name + " {\n";
    for (const auto& f : fields) out += "    " + f.name + ": Option<" + f.type + ">,\n";
    out += "}\n\n";

    out += "impl " + builder_name + " {\n";
    out += "    pub fn new() -> Self {\n";
    out += "        Self::default()\n";
    out += "    }\n\n";
    for (const auto& f : fields) {
        out += "    pub fn " + f.name + "(mut self, " + f.name + ": " + f.type + ") -> Self {\n";
        out += "        self." + f.name + " = Some(" + f.name + ");\n";
        out += "        self\n";
        out += "    }\n\n";
    }
    out += "    pub fn build(self) -> " + target + " {\n";
    out += "        " + target + " {\n";
    for (const auto& f : fields) {
        out += "            " + f.name + ": self." + f.name + ".expect(\"" + f.name + " is required\"),\n";
    }
    out += "        }\n";
    out += "    }\n";
    out += "}\n";
    return out;
}

std::string from_impl(const TemplateArgs& args) {
    const std::string& source = arg(args, "source");
    return "impl From<" + source + "> for " + arg(args, "target") + " {\n"
           "    fn from(value: " + source + ") -> Self {\n"
           "        " + arg(args, "body") + "\n"
           "    }\n"
           "}\n";
}

std::string test_module(const TemplateArgs& args) {
    std::string out = "#[cfg(test)]\nmod tests {\n";
    out += "    " + arg(args, "imports") + "\n\n";
    for (const auto& test : split_template_list(arg(args, "tests"))) {
        if (test.empty()) continue;
        out += "    #[test]\n";
        out += "    fn " + test + "() {\n";
        out += "        todo!()\n";
        out += "    }\n\n";
    }
    out += "}\n";
    return out;
}

std::string iterator(const TemplateArgs& args) {
    return "impl Iterator for " + arg(args, "type_name") + " {\n"
           "    type Item = " + arg(args, "item_type") + ";\n\n"
           "    fn next(&mut self) -> Option<Self::Item> {\n"
           "        todo!()\n"
           "    }\n"
           "}\n";
}

std::string new_constructor(const TemplateArgs& args) {
    const std::vector<Field> fields = field_list(arg(args, "fields"));

    std::vector<std::string> params;
    params.reserve(fields.size());
    for (const auto& f : fields) params.push_back(f.name + ": " + f.type);

    std::string out = "impl " + arg(args, "type_name") + " {\n";
    out += "    pub fn new(" + join(params, ", ") + ") -> Self {\n";
    out += "        Self {\n";
    for (const auto& f : fields) out += "            " + f.name + ",\n";
    out += "        }\n";
    out += "    }\n";
    out += "}\n";
    return out;
}

using P = TemplateParam;

std::vector<CodeTemplate> builtin_templates() {
    std::vector<CodeTemplate> out;
    out.emplace_back("error-type", "Error enum with thiserror + miette diagnostics", "error-handling",
                     std::vector<TemplateParam>{
                         P::required_param("name", ParamKind::TypeName, "Error type name"),
                         P::required_param("variants", ParamKind::VariantList,
                                           "Comma-separated variant specs: 'Name(message, code, help)' or 'Name(message)'"),
                         P::optional_param("result_alias", ParamKind::TypeName, "",
                                           "Optional result type alias name (e.g., 'MyResult')"),
                     },
                     error_type);
    out.emplace_back("trait-impl", "Implement a trait for a type with method stubs", "impl",
                     std::vector<TemplateParam>{
                         P::required_param("type_name", ParamKind::TypeName, "Type to implement for"),
                         P::required_param("trait_name", ParamKind::TraitName, "Trait to implement"),
                         P::required_param("methods", ParamKind::MethodList,
                                           "Comma-separated method signatures: 'name(&self) -> Type'"),
                     },
                     trait_impl);
    out.emplace_back("builder", "Builder pattern with fluent setters and build()", "pattern",
                     std::vector<TemplateParam>{
                         P::required_param("type_name", ParamKind::TypeName, "Type to build"),
                         P::required_param("fields", ParamKind::FieldList, "Comma-separated 'name: Type' field specs"),
                     },
                     builder);
    out.emplace_back("from-impl", "impl From<Source> for Target conversion", "impl",
                     std::vector<TemplateParam>{
                         P::required_param("source", ParamKind::TypeName, "Source type"),
                         P::required_param("target", ParamKind::TypeName, "Target type"),
                         P::optional_param("body", ParamKind::Text, "todo!()", "Conversion body expression"),
                     },
                     from_impl);
    out.emplace_back("test-module", "Test module with #[cfg(test)] and test functions", "testing",
                     std::vector<TemplateParam>{
                         P::required_param("tests", ParamKind::MethodList, "Comma-separated test function names"),
                         P::optional_param("imports", ParamKind::Text, "use super::*;",
                                           "Import statements for the test module"),
                     },
                     test_module);
    out.emplace_back("iterator", "impl Iterator for Type with Item type and next()", "impl",
                     std::vector<TemplateParam>{
                         P::required_param("type_name", ParamKind::TypeName, "Iterator type"),
                         P::required_param("item_type", ParamKind::TypeName, "Iterator::Item type"),
                     },
                     iterator);
    out.emplace_back("new-constructor", "impl Type { pub fn new(...) -> Self }", "impl",
                     std::vector<TemplateParam>{
                         P::required_param("type_name", ParamKind::TypeName, "Type name"),
                         P::required_param("fields", ParamKind::FieldList,
                                           "Comma-separated 'name: Type' constructor params"),
                     },
                     new_constructor);
    return out;
}

} // namespace

std::vector<std::string> split_template_list(std::string_view s) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    bool in_string = false;
    char prev = '\0';

    for (char c : s) {
        if (in_string) {
            if (c == '"' && prev != '\\') in_string = false;
        } else if (c == '"') {
            in_string = true;
        } else if (c == '(' || c == '<') {
            ++depth;
        } else if ((c == ')' || (c == '>' && prev != '-')) && depth > 0) {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.emplace_back(trim(current));
            current.clear();
            prev = c;
            continue;
        }
        current += c;
        prev = c;
    }
    if (!trim(current).empty()) parts.emplace_back(trim(current));
    return parts;
}

TemplateParam TemplateParam::required_param(std::string name, ParamKind kind, std::string description) {
    return TemplateParam{std::move(name), kind, true, std::nullopt, std::move(description)};
}

TemplateParam TemplateParam::optional_param(std::string name, ParamKind kind, std::string default_value,
                                            std::string description) {
    return TemplateParam{std::move(name), kind, false, std::move(default_value), std::move(description)};
}

CodeTemplate::CodeTemplate(std::string name, std::string description, std::string category,
                           std::vector<TemplateParam> params, Generator generator)
    : name_(std::move(name)), description_(std::move(description)), category_(std::move(category)),
      params_(std::move(params)), generator_(std::move(generator)) {}

std::string CodeTemplate::instantiate(const TemplateArgs& args) const {
    TemplateArgs effective;
    for (const auto& p : params_) {
        auto it = args.find(p.name);
        if (it != args.end()) {
            effective[p.name] = it->second;
        } else if (p.required) {
            throw LinearizationFailed(Category::CodeSignature, "template",
                                      "template '" + name_ + "' requires parameter '" + p.name + "' (" +
                                          p.description + ")");
        } else if (p.default_value) {
            effective[p.name] = *p.default_value;
        }
    }
    return generator_(effective);
}

SemanticTree CodeTemplate::expand(const TemplateArgs& args) const {
    return RustGenGrammar().parse(instantiate(args), Category::CodeSignature, ParseContext());
}

TemplateRegistry::TemplateRegistry() {
    for (auto& tmpl : builtin_templates()) add(std::move(tmpl));
}

void TemplateRegistry::add(CodeTemplate tmpl) {
    std::string name = tmpl.name();
    if (templates_.count(name)) Logger::debug("Replacing code template '" + name + "'");
    templates_.insert_or_assign(std::move(name), std::move(tmpl));
}

const CodeTemplate* TemplateRegistry::get(const std::string& name) const {
    auto it = templates_.find(name);
    return it == templates_.end() ? nullptr : &it->second;
}

std::vector<std::string> TemplateRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(templates_.size());
    for (const auto& [name, _] : templates_) names.push_back(name);
    return names;
}

std::vector<const CodeTemplate*> TemplateRegistry::by_category(std::string_view category) const {
    std::vector<const CodeTemplate*> out;
    for (const auto& [_, tmpl] : templates_) {
        if (tmpl.category() == category) out.push_back(&tmpl);
    }
    return out;
}

std::vector<const CodeTemplate*> TemplateRegistry::search(const std::vector<std::string>& keywords) const {
    std::vector<const CodeTemplate*> out;
    for (const auto& [_, tmpl] : templates_) {
        std::string haystack = to_lower(tmpl.name() + " " + tmpl.description() + " " + tmpl.category());
        for (const auto& keyword : keywords) {
            if (haystack.find(to_lower(keyword)) != std::string::npos) {
                out.push_back(&tmpl);
                break;
            }
        }
    }
    return out;
}

} // namespace Glossa
