/**
 * @file rust_gen_grammar.cpp
 */

#include <grammar/rust_gen_grammar.hpp>
#include <grammar/error.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <tree_sitter/api.h>

#include <cstring>
#include <memory>
#include <sstream>

extern "C" {
    const TSLanguage* tree_sitter_rust();
}

namespace Glossa {

namespace {

// =============================================================================
// Linearization
// =============================================================================

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

void push_doc(std::string& out, const std::string& prefix, const std::optional<std::string>& doc) {
    if (!doc) return;
    for (const auto& line : lines_of(*doc)) out += prefix + "/// " + line + "\n";
}

void push_derives(std::string& out, const std::string& prefix, const std::vector<std::string>& derives) {
    if (!derives.empty()) out += prefix + "#[derive(" + join(derives, ", ") + ")]\n";
}

std::string rust_fn(const Node::CodeSignature& s, const std::string& prefix) {
    std::string out;
    push_doc(out, prefix, s.doc_summary);
    std::string ret = (s.return_type && !s.return_type->empty()) ? " -> " + *s.return_type : std::string();
    out += prefix + "pub fn " + s.name + "(" + join(s.params_or_fields, ", ") + ")" + ret + " {\n";
    out += prefix + "    todo!()\n";
    out += prefix + "}\n";
    return out;
}

std::string rust_struct(const Node::CodeSignature& s, const std::string& prefix) {
    std::string out;
    push_doc(out, prefix, s.doc_summary);
    push_derives(out, prefix, s.traits);
    if (s.params_or_fields.empty()) {
        out += prefix + "pub struct " + s.name + ";\n";
        return out;
    }
    out += prefix + "pub struct " + s.name + " {\n";
    for (const auto& field : s.params_or_fields) {
        if (field.find(':') != std::string::npos) out += prefix + "    pub " + field + ",\n";
        else out += prefix + "    pub " + field + ": (),\n";
    }
    out += prefix + "}\n";
    return out;
}

std::string rust_enum(const Node::CodeSignature& s, const std::string& prefix) {
    std::string out;
    push_doc(out, prefix, s.doc_summary);
    push_derives(out, prefix, s.traits);
    out += prefix + "pub enum " + s.name + " {\n";
    for (const auto& variant : s.params_or_fields) out += prefix + "    " + variant + ",\n";
    out += prefix + "}\n";
    return out;
}

std::string rust_trait(const Node::CodeSignature& s, const std::string& prefix) {
    std::string out;
    push_doc(out, prefix, s.doc_summary);
    out += prefix + "pub trait " + s.name + " {\n";
    for (const auto& method : s.params_or_fields) out += prefix + "    " + method + ";\n";
    out += prefix + "}\n";
    return out;
}

/// `traits[0]`, when present, is the implemented trait; `return_type` then names the target.
std::string rust_impl(const Node::CodeSignature& s, const std::string& prefix) {
    std::string out;
    push_doc(out, prefix, s.doc_summary);
    if (!s.traits.empty()) {
        const std::string& target = s.return_type ? *s.return_type : s.name;
        out += prefix + "impl " + s.traits.front() + " for " + target + " {\n";
    } else {
        out += prefix + "impl " + s.name + " {\n";
    }
    // Trait impl methods take the trait's visibility.
    const std::string fn = s.traits.empty() ? "pub fn " : "fn ";
    for (const auto& method : s.params_or_fields) {
        // A bare name gets a `&self` receiver; a written signature is kept as is.
        std::string sig = starts_with(method, "fn ") ? method.substr(3) : method;
        if (sig.find('(') == std::string::npos) sig += "(&self)";
        out += prefix + "    " + fn + sig + " {\n";
        out += prefix + "        todo!()\n";
        out += prefix + "    }\n\n";
    }
    out += prefix + "}\n";
    return out;
}

std::string rust_data_flow(const Node::DataFlow& df, const std::string& prefix) {
    if (df.steps.empty()) return prefix + "// (empty pipeline)\n";

    std::vector<std::string> chain;
    for (const auto& step : df.steps) {
        chain.push_back(step.via_type ? "." + step.name + "() /* " + *step.via_type + " */"
                                      : "." + step.name + "()");
    }

    std::string out = prefix + "// Pipeline:\n";
    std::string joined = join(chain, "");
    if (joined.size() < 80) {
        out += prefix + "// input" + joined + "\n";
    } else {
        out += prefix + "// input\n";
        for (const auto& step : chain) out += prefix + "//     " + step + "\n";
    }
    return out;
}

class RustWriter {
public:
    std::string render(const SemanticTree& tree, size_t indent) const {
        const std::string prefix(indent * 4, ' ');
        const auto& node = tree.node();

        if (auto* m = std::get_if<Node::CodeModule>(&node)) {
            std::string out;
            if (m->doc_summary) out += prefix + "//! " + *m->doc_summary + "\n";
            out += prefix + "pub mod " + m->name + " {\n";
            for (const auto& child : m->children) out += render(child, indent + 1) + "\n";
            out += prefix + "}\n";
            return out;
        }
        if (auto* s = std::get_if<Node::CodeSignature>(&node)) {
            if (s->kind == "fn") return rust_fn(*s, prefix);
            if (s->kind == "struct") return rust_struct(*s, prefix);
            if (s->kind == "enum") return rust_enum(*s, prefix);
            if (s->kind == "trait") return rust_trait(*s, prefix);
            if (s->kind == "impl") return rust_impl(*s, prefix);
            throw LinearizationFailed(Category::CodeSignature, "rust-gen",
                                      "unknown code signature kind: \"" + s->kind + "\"");
        }
        if (auto* df = std::get_if<Node::DataFlow>(&node)) return rust_data_flow(*df, prefix);
        if (auto* c = std::get_if<Node::CodeFact>(&node)) {
            return prefix + "// " + c->kind + ": " + c->name + " — " + c->detail + "\n";
        }
        if (auto* s = std::get_if<Node::Section>(&node)) {
            std::string out = prefix + "// === " + s->heading + " ===\n\n";
            for (const auto& item : s->body) out += render(item, indent) + "\n";
            return out;
        }
        if (auto* d = std::get_if<Node::Document>(&node)) {
            std::string out;
            if (auto* overview = d->overview->as<Node::Freeform>()) {
                for (const auto& line : lines_of(overview->text)) out += "//! " + line + "\n";
                out += '\n';
            }
            for (const auto& section : d->sections) out += render(section, indent) + "\n";
            return out;
        }
        if (auto* f = std::get_if<Node::Freeform>(&node)) return prefix + "// " + f->text + "\n";
        if (auto* c = std::get_if<Node::Conjunction>(&node)) {
            std::string out;
            for (const auto& item : c->items) out += render(item, indent) + "\n";
            return out;
        }
        if (auto* c = std::get_if<Node::WithConfidence>(&node)) return render(*c->inner, indent);
        if (auto* p = std::get_if<Node::WithProvenance>(&node)) return render(*p->inner, indent);

        Category cat = tree.category();
        throw LinearizationFailed(cat, "rust-gen",
                                  std::string("rust-gen grammar does not handle ") + category_name(cat) +
                                      " nodes directly");
    }
};

// =============================================================================
// Parsing (tree-sitter-rust)
// =============================================================================

struct ParserDeleter {
    void operator()(TSParser* p) const { ts_parser_delete(p); }
};
struct TreeDeleter {
    void operator()(TSTree* t) const { ts_tree_delete(t); }
};

class RustSourceReader {
public:
    explicit RustSourceReader(std::string_view source) : source_(source) {}

    std::string text(TSNode node) const {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        return std::string(source_.substr(start, end - start));
    }

    std::string field_text(TSNode node, const char* field) const {
        TSNode child = ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
        return ts_node_is_null(child) ? std::string() : text(child);
    }

    TSNode field(TSNode node, const char* field) const {
        return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
    }

    /// Items of a source_file or declaration_list, with their leading docs and derives.
    std::vector<SemanticTree> items(TSNode container) const {
        std::vector<SemanticTree> out;
        std::vector<std::string> docs;
        std::vector<std::string> derives;

        uint32_t count = ts_node_named_child_count(container);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(container, i);
            const char* type = ts_node_type(child);

            if (std::strcmp(type, "line_comment") == 0) {
                std::string comment = text(child);
                if (starts_with(comment, "///") && !starts_with(comment, "////")) {
                    docs.emplace_back(trim(std::string_view(comment).substr(3)));
                }
                continue;
            }
            if (std::strcmp(type, "attribute_item") == 0) {
                collect_derives(text(child), derives);
                continue;
            }

            if (auto node = item(child, docs, derives)) out.push_back(std::move(*node));
            docs.clear();
            derives.clear();
        }
        return out;
    }

private:
    static void collect_derives(const std::string& attribute, std::vector<std::string>& out) {
        static constexpr std::string_view kOpen = "#[derive(";
        if (!starts_with(attribute, kOpen)) return;
        size_t close = attribute.rfind(")]");
        if (close == std::string::npos || close < kOpen.size()) return;
        std::string inner = attribute.substr(kOpen.size(), close - kOpen.size());
        std::istringstream in(inner);
        std::string part;
        while (std::getline(in, part, ',')) {
            std::string_view name = trim(part);
            if (!name.empty()) out.emplace_back(name);
        }
    }

    static std::optional<std::string> doc_of(const std::vector<std::string>& docs) {
        if (docs.empty()) return std::nullopt;
        return join(docs, "\n");
    }

    std::optional<SemanticTree> item(TSNode node, const std::vector<std::string>& docs,
                                     const std::vector<std::string>& derives) const {
        const char* type = ts_node_type(node);

        if (std::strcmp(type, "function_item") == 0) {
            Node::CodeSignature sig;
            sig.kind = "fn";
            sig.name = field_text(node, "name");
            sig.doc_summary = doc_of(docs);
            TSNode params = field(node, "parameters");
            if (!ts_node_is_null(params)) {
                uint32_t n = ts_node_named_child_count(params);
                for (uint32_t i = 0; i < n; ++i) {
                    TSNode p = ts_node_named_child(params, i);
                    const char* ptype = ts_node_type(p);
                    if (std::strcmp(ptype, "parameter") == 0 || std::strcmp(ptype, "self_parameter") == 0) {
                        sig.params_or_fields.push_back(text(p));
                    }
                }
            }
            std::string ret = field_text(node, "return_type");
            if (!ret.empty()) sig.return_type = ret;
            return SemanticTree(std::move(sig));
        }

        if (std::strcmp(type, "struct_item") == 0) {
            Node::CodeSignature sig;
            sig.kind = "struct";
            sig.name = field_text(node, "name");
            sig.doc_summary = doc_of(docs);
            sig.traits = derives;
            TSNode body = field(node, "body");
            if (!ts_node_is_null(body)) {
                bool tuple = std::strcmp(ts_node_type(body), "ordered_field_declaration_list") == 0;
                size_t index = 0;
                uint32_t n = ts_node_named_child_count(body);
                for (uint32_t i = 0; i < n; ++i) {
                    TSNode f = ts_node_named_child(body, i);
                    const char* ftype = ts_node_type(f);
                    if (tuple) {
                        if (std::strcmp(ftype, "visibility_modifier") == 0 ||
                            std::strcmp(ftype, "attribute_item") == 0) continue;
                        sig.params_or_fields.push_back("field_" + std::to_string(index++) + ": " + text(f));
                    } else if (std::strcmp(ftype, "field_declaration") == 0) {
                        sig.params_or_fields.push_back(field_text(f, "name") + ": " + field_text(f, "type"));
                    }
                }
            }
            return SemanticTree(std::move(sig));
        }

        if (std::strcmp(type, "enum_item") == 0) {
            Node::CodeSignature sig;
            sig.kind = "enum";
            sig.name = field_text(node, "name");
            sig.doc_summary = doc_of(docs);
            sig.traits = derives;
            TSNode body = field(node, "body");
            if (!ts_node_is_null(body)) {
                uint32_t n = ts_node_named_child_count(body);
                for (uint32_t i = 0; i < n; ++i) {
                    TSNode v = ts_node_named_child(body, i);
                    if (std::strcmp(ts_node_type(v), "enum_variant") == 0) {
                        sig.params_or_fields.push_back(field_text(v, "name"));
                    }
                }
            }
            return SemanticTree(std::move(sig));
        }

        if (std::strcmp(type, "trait_item") == 0) {
            Node::CodeSignature sig;
            sig.kind = "trait";
            sig.name = field_text(node, "name");
            sig.doc_summary = doc_of(docs);
            for (TSNode m : methods(field(node, "body"))) sig.params_or_fields.push_back(method_signature(m));
            return SemanticTree(std::move(sig));
        }

        if (std::strcmp(type, "impl_item") == 0) {
            Node::CodeSignature sig;
            sig.kind = "impl";
            sig.name = field_text(node, "type");
            std::string trait_name = field_text(node, "trait");
            if (!trait_name.empty()) {
                sig.traits.push_back(trait_name);
                sig.return_type = sig.name;
            }
            for (TSNode m : methods(field(node, "body"))) sig.params_or_fields.push_back(field_text(m, "name"));
            return SemanticTree(std::move(sig));
        }

        if (std::strcmp(type, "mod_item") == 0) {
            Node::CodeModule m;
            m.name = field_text(node, "name");
            m.doc_summary = doc_of(docs);
            TSNode body = field(node, "body");
            if (!ts_node_is_null(body)) m.children = items(body);
            return SemanticTree(std::move(m));
        }

        return std::nullopt;
    }

    std::vector<TSNode> methods(TSNode body) const {
        std::vector<TSNode> out;
        if (ts_node_is_null(body)) return out;
        uint32_t n = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < n; ++i) {
            TSNode m = ts_node_named_child(body, i);
            const char* mtype = ts_node_type(m);
            if (std::strcmp(mtype, "function_item") == 0 || std::strcmp(mtype, "function_signature_item") == 0) {
                out.push_back(m);
            }
        }
        return out;
    }

    /// "fn area(&self) -> f64", without any default body.
    std::string method_signature(TSNode m) const {
        std::string sig = "fn " + field_text(m, "name") + field_text(m, "type_parameters") +
                          field_text(m, "parameters");
        std::string ret = field_text(m, "return_type");
        if (!ret.empty()) sig += " -> " + ret;
        return sig;
    }

    std::string_view source_;
};

/// Position of the first ERROR or MISSING node, depth first.
std::optional<TSPoint> first_error(TSNode node) {
    if (ts_node_is_error(node) || ts_node_is_missing(node)) return ts_node_start_point(node);
    uint32_t n = ts_node_child_count(node);
    for (uint32_t i = 0; i < n; ++i) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_has_error(child)) continue;
        if (auto p = first_error(child)) return p;
    }
    return std::nullopt;
}

} // namespace

std::string RustGenGrammar::linearize(const SemanticTree& tree, const LinContext&) const {
    return RustWriter().render(tree, 0);
}

SemanticTree RustGenGrammar::parse(std::string_view input, std::optional<Category>, const ParseContext&) const {
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), tree_sitter_rust())) {
        throw ParseFailed("Rust parse error: tree-sitter-rust language version mismatch");
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, input.data(), static_cast<uint32_t>(input.size())));
    if (!tree) throw ParseFailed("Rust parse error: parser produced no tree");

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        std::string where;
        if (auto p = first_error(root)) {
            where = " at line " + std::to_string(p->row + 1) + ", column " + std::to_string(p->column + 1);
        }
        Logger::debug("rust-gen: syntax error" + where);
        throw ParseFailed("Rust parse error" + where);
    }

    std::vector<SemanticTree> children = RustSourceReader(input).items(root);
    if (children.empty()) return SemanticTree::freeform(std::string(input));
    if (children.size() == 1) return std::move(children.front());

    Node::CodeModule module;
    module.name = "parsed";
    module.children = std::move(children);
    return SemanticTree(std::move(module));
}

const std::vector<Category>& RustGenGrammar::supported_categories() const {
    static const std::vector<Category> cats = {Category::CodeModule, Category::CodeSignature, Category::DataFlow,
                                               Category::CodeFact,   Category::Section,       Category::Document,
                                               Category::Freeform};
    return cats;
}

} // namespace Glossa
