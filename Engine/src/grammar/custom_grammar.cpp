/**
 * @file custom_grammar.cpp
 */

#include <grammar/custom_grammar.hpp>
#include <grammar/error.hpp>
#include <grammar/morpho.hpp>
#include <utils/format_utils.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <fstream>
#include <sstream>

namespace Glossa {

namespace {

[[noreturn]] void fail_at(size_t line_no, const std::string& message) {
    throw InvalidCustomGrammar("line " + std::to_string(line_no) + ": " + message);
}

/// Value part of `key = value`, unquoted. Trailing comments are allowed after a quoted string.
std::string parse_value(std::string_view raw, size_t line_no) {
    std::string_view v = trim(raw);
    if (v.empty()) return {};

    const char quote = v.front();
    if (quote != '"' && quote != '\'') return std::string(v);

    std::string out;
    size_t i = 1;
    for (; i < v.size(); ++i) {
        char c = v[i];
        if (c == quote) break;
        if (quote == '"' && c == '\\' && i + 1 < v.size()) {
            char e = v[++i];
            switch (e) {
                case 'n':  out += '\n'; break;
                case 't':  out += '\t'; break;
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                default:   fail_at(line_no, std::string("unknown escape \\") + e);
            }
            continue;
        }
        out += c;
    }
    if (i >= v.size()) fail_at(line_no, "unterminated string");

    std::string_view rest = trim(v.substr(i + 1));
    if (!rest.empty() && rest.front() != '#') fail_at(line_no, "unexpected text after string");
    return out;
}

class CustomWriter {
public:
    CustomWriter(const CustomGrammar& grammar, const LinContext& ctx)
        : grammar_(grammar), ctx_(ctx), lexicon_(ctx.active_lexicon()) {}

    std::string render(const SemanticTree& tree) const { return std::visit(*this, tree.node()); }

    std::string operator()(const Node::EntityRef& e) const { return ctx_.resolve_label(e.label, e.symbol_id); }

    std::string operator()(const Node::RelationRef& r) const {
        return humanize_predicate(ctx_.resolve_label(r.label, r.symbol_id), lexicon_);
    }

    std::string operator()(const Node::Freeform& f) const {
        if (auto* t = grammar_.template_for("freeform")) return apply_template(*t, {{"text", f.text}});
        return f.text;
    }

    std::string operator()(const Node::Triple& t) const {
        std::string s = render(*t.subject);
        std::string p = render(*t.predicate);
        std::string o = render(*t.object);
        if (auto* tmpl = grammar_.template_for("triple")) {
            return apply_template(*tmpl, {{"subject", s}, {"predicate", p}, {"object", o}});
        }
        return s + " " + p + " " + o + ".";
    }

    std::string operator()(const Node::Similarity& s) const {
        std::string e = render(*s.entity);
        std::string other = render(*s.similar_to);
        std::string score = format_fixed(s.score, 2);
        if (auto* t = grammar_.template_for("similarity")) {
            return apply_template(*t, {{"entity", e}, {"similar_to", other}, {"score", score}});
        }
        return e + " is similar to " + other + " (" + score + ").";
    }

    std::string operator()(const Node::Gap& g) const {
        std::string e = render(*g.entity);
        if (auto* t = grammar_.template_for("gap")) {
            return apply_template(*t, {{"entity", e}, {"description", g.description}});
        }
        return "Gap for " + e + ": " + g.description + ".";
    }

    std::string operator()(const Node::Inference& i) const {
        if (auto* t = grammar_.template_for("inference")) {
            return apply_template(*t, {{"expression", i.expression}, {"simplified", i.simplified}});
        }
        return "`" + i.expression + "` simplifies to `" + i.simplified + "`.";
    }

    std::string operator()(const Node::CodeFact& c) const {
        if (auto* t = grammar_.template_for("code_fact")) {
            return apply_template(*t, {{"kind", c.kind}, {"name", c.name}, {"detail", c.detail}});
        }
        return c.kind + " `" + c.name + "`: " + c.detail + ".";
    }

    std::string operator()(const Node::CodeModule& m) const {
        std::vector<std::string> children;
        for (const auto& child : m.children) children.push_back(render(child));

        if (auto* t = grammar_.template_for("code_module")) {
            return apply_template(*t, {{"name", m.name},
                                       {"role", m.role.value_or("")},
                                       {"importance", m.importance ? format_fixed(*m.importance, 2) : ""},
                                       {"doc_summary", m.doc_summary.value_or("")},
                                       {"children", join(children, "\n")}});
        }
        std::string desc = m.doc_summary ? *m.doc_summary : m.role ? *m.role : std::string("module");
        std::string out = "Module `" + m.name + "` (" + desc + ").";
        if (!children.empty()) {
            out += '\n';
            for (const auto& line : children) out += "- " + line + "\n";
        }
        return out;
    }

    std::string operator()(const Node::CodeSignature& s) const {
        std::string params = join(s.params_or_fields, ", ");
        if (auto* t = grammar_.template_for("code_signature")) {
            return apply_template(*t, {{"kind", s.kind},
                                       {"name", s.name},
                                       {"params", params},
                                       {"return_type", s.return_type.value_or("")},
                                       {"traits", join(s.traits, ", ")}});
        }
        std::string ret = s.return_type ? " → " + *s.return_type : std::string();
        return s.kind + " `" + s.name + "`(" + params + ")" + ret + ".";
    }

    std::string operator()(const Node::DataFlow& df) const {
        std::vector<std::string> flow;
        for (const auto& step : df.steps) {
            flow.push_back(step.via_type ? step.name + " → " + *step.via_type : step.name);
        }
        std::string joined = join(flow, " → ");
        if (auto* t = grammar_.template_for("data_flow")) return apply_template(*t, {{"flow", joined}});
        return "Flow: " + joined;
    }

    std::string operator()(const Node::WithConfidence& c) const {
        return render(*c.inner) + " (confidence: " + format_fixed(c.confidence, 2) + ")";
    }

    std::string operator()(const Node::WithProvenance& p) const {
        return render(*p.inner) + " [" + p.tag.to_string() + "]";
    }

    std::string operator()(const Node::DiscourseFrame& d) const { return render(*d.inner); }

    std::string operator()(const Node::Conjunction& c) const {
        std::vector<std::string> parts;
        for (const auto& item : c.items) parts.push_back(render(item));
        return join_list(parts, c.is_and ? "and" : "or");
    }

    std::string operator()(const Node::Section& s) const {
        std::string out = "## " + s.heading + "\n\n";
        for (const auto& item : s.body) {
            std::string line = render(item);
            out += line;
            if (!ends_with(line, "\n")) out += '\n';
        }
        return out;
    }

    std::string operator()(const Node::Document& d) const {
        std::string out = render(*d.overview) + "\n\n";
        for (const auto& section : d.sections) out += render(section) + "\n";
        if (!d.gaps.empty()) {
            out += "\n## Gaps\n\n";
            for (const auto& gap : d.gaps) out += "- " + render(gap) + "\n";
        }
        return out;
    }

private:
    const CustomGrammar& grammar_;
    const LinContext& ctx_;
    const Lexicon& lexicon_;
};

} // namespace

std::string apply_template(std::string_view tmpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            size_t close = tmpl.find('}', i + 1);
            if (close != std::string_view::npos) {
                auto it = vars.find(std::string(tmpl.substr(i + 1, close - i - 1)));
                if (it != vars.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tmpl[i++];
    }
    return out;
}

CustomGrammar CustomGrammar::from_toml(std::string_view toml) {
    CustomGrammar g;
    std::string section;
    std::istringstream in{std::string(toml)};
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::string_view t = trim(line);
        if (t.empty() || t.front() == '#') continue;

        if (t.front() == '[') {
            if (t.back() != ']') fail_at(line_no, "unterminated section header");
            section = std::string(trim(t.substr(1, t.size() - 2)));
            if (section.empty()) fail_at(line_no, "empty section name");
            continue;
        }

        size_t eq = t.find('=');
        if (eq == std::string_view::npos) fail_at(line_no, "expected key = value");
        std::string key(trim(t.substr(0, eq)));
        if (key.empty()) fail_at(line_no, "missing key");
        std::string value = parse_value(t.substr(eq + 1), line_no);

        if (section == "grammar") {
            if (key == "name") g.name_ = std::move(value);
            else if (key == "description") g.description_ = std::move(value);
        } else if (section == "linearization") {
            g.templates_[key] = std::move(value);
        }
    }

    if (trim(g.name_).empty()) throw InvalidCustomGrammar("missing [grammar] name field");
    return g;
}

CustomGrammar CustomGrammar::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        Logger::error("Cannot open custom grammar: " + path);
        throw InvalidCustomGrammar("cannot read " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        CustomGrammar g = from_toml(buffer.str());
        Logger::info("Loaded custom grammar '" + g.name() + "' from " + path + " (" +
                     std::to_string(g.template_count()) + " templates)");
        return g;
    } catch (const InvalidCustomGrammar& e) {
        Logger::error(path + ": " + e.what());
        throw;
    }
}

const std::string* CustomGrammar::template_for(const std::string& key) const {
    auto it = templates_.find(key);
    return it == templates_.end() ? nullptr : &it->second;
}

std::string CustomGrammar::linearize(const SemanticTree& tree, const LinContext& ctx) const {
    return CustomWriter(*this, ctx).render(tree);
}

const std::vector<Category>& CustomGrammar::supported_categories() const {
    static const std::vector<Category> cats = {
        Category::Entity,     Category::Relation,      Category::Statement,  Category::Similarity,
        Category::Gap,        Category::Inference,     Category::CodeFact,   Category::CodeModule,
        Category::CodeSignature, Category::DataFlow,   Category::Confidence, Category::Provenance,
        Category::Conjunction, Category::Section,      Category::Document,   Category::Freeform,
        Category::DiscourseFrame};
    return cats;
}

} // namespace Glossa
