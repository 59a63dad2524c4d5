/**
 * @file tree_json.cpp
 * @brief SemanticTree <-> nlohmann::json
 */

#include <grammar/tree_json.hpp>
#include <grammar/error.hpp>

namespace Glossa {

using json = nlohmann::json;

namespace {

template <typename T>
json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T>
std::optional<T> get_opt(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

json list(const std::vector<SemanticTree>& items) {
    json arr = json::array();
    for (const auto& item : items) arr.push_back(tree_to_json(item));
    return arr;
}

std::vector<SemanticTree> list_from(const json& arr) {
    std::vector<SemanticTree> out;
    out.reserve(arr.size());
    for (const auto& item : arr) out.push_back(tree_from_json(item));
    return out;
}

json provenance_to_json(const ProvenanceTag& tag) {
    json j = {{"tag", provenance_kind_name(tag.kind)}};
    if (tag.kind == ProvenanceTag::Kind::VsaInferred) j["similarity"] = tag.similarity;
    return j;
}

ProvenanceTag provenance_from_json(const json& j) {
    std::string name = j.at("tag").get<std::string>();
    auto kind = provenance_kind_from_name(name);
    if (!kind) throw ParseFailed("unknown provenance tag: " + name);
    return ProvenanceTag(*kind, j.value("similarity", 0.0f));
}

SemanticTree decode(const json& j) {
    const std::string kind = j.at("kind").get<std::string>();

    if (kind == "EntityRef") {
        return Node::EntityRef{j.at("label").get<std::string>(), get_opt<SymbolId>(j, "symbol_id")};
    }
    if (kind == "RelationRef") {
        return Node::RelationRef{j.at("label").get<std::string>(), get_opt<SymbolId>(j, "symbol_id")};
    }
    if (kind == "Freeform") {
        return Node::Freeform{j.at("text").get<std::string>()};
    }
    if (kind == "Triple") {
        return SemanticTree::triple(decode(j.at("subject")), decode(j.at("predicate")), decode(j.at("object")));
    }
    if (kind == "Similarity") {
        return SemanticTree::similarity(decode(j.at("entity")), decode(j.at("similar_to")),
                                        j.at("score").get<float>());
    }
    if (kind == "Gap") {
        return SemanticTree::gap(decode(j.at("entity")), j.at("description").get<std::string>());
    }
    if (kind == "Inference") {
        return SemanticTree::inference(j.at("expression").get<std::string>(),
                                       j.at("simplified").get<std::string>());
    }
    if (kind == "CodeFact") {
        return SemanticTree::code_fact(j.at("code_kind").get<std::string>(), j.at("name").get<std::string>(),
                                       j.at("detail").get<std::string>());
    }
    if (kind == "CodeModule") {
        Node::CodeModule m;
        m.name = j.at("name").get<std::string>();
        m.role = get_opt<std::string>(j, "role");
        m.importance = get_opt<float>(j, "importance");
        m.doc_summary = get_opt<std::string>(j, "doc_summary");
        m.children = list_from(j.at("children"));
        return m;
    }
    if (kind == "CodeSignature") {
        Node::CodeSignature s;
        s.kind = j.at("code_kind").get<std::string>();
        s.name = j.at("name").get<std::string>();
        s.doc_summary = get_opt<std::string>(j, "doc_summary");
        s.params_or_fields = j.at("params_or_fields").get<std::vector<std::string>>();
        s.return_type = get_opt<std::string>(j, "return_type");
        s.traits = j.at("traits").get<std::vector<std::string>>();
        s.importance = get_opt<float>(j, "importance");
        return s;
    }
    if (kind == "DataFlow") {
        Node::DataFlow df;
        for (const auto& step : j.at("steps")) {
            df.steps.push_back({step.at("name").get<std::string>(), get_opt<std::string>(step, "via_type")});
        }
        return df;
    }
    if (kind == "WithConfidence") {
        return SemanticTree::with_confidence(decode(j.at("inner")), j.at("confidence").get<float>());
    }
    if (kind == "WithProvenance") {
        return SemanticTree::with_provenance(decode(j.at("inner")), provenance_from_json(j.at("provenance")));
    }
    if (kind == "DiscourseFrame") {
        auto pov = pov_from_name(j.at("pov").get<std::string>());
        auto focus = focus_from_name(j.at("focus").get<std::string>());
        if (!pov || !focus) throw ParseFailed("bad discourse frame: " + j.dump());
        return SemanticTree::discourse_frame(decode(j.at("inner")), *pov, *focus);
    }
    if (kind == "Conjunction") {
        Node::Conjunction c;
        c.items = list_from(j.at("items"));
        c.is_and = j.value("is_and", true);
        return c;
    }
    if (kind == "Section") {
        return SemanticTree::section(j.at("heading").get<std::string>(), list_from(j.at("body")));
    }
    if (kind == "Document") {
        return SemanticTree::document(decode(j.at("overview")), list_from(j.at("sections")),
                                      list_from(j.at("gaps")));
    }
    throw ParseFailed("unknown node kind: " + kind);
}

} // namespace

json tree_to_json(const SemanticTree& tree) {
    if (auto* e = tree.as<Node::EntityRef>()) {
        return {{"kind", "EntityRef"}, {"label", e->label}, {"symbol_id", opt(e->symbol_id)}};
    }
    if (auto* r = tree.as<Node::RelationRef>()) {
        return {{"kind", "RelationRef"}, {"label", r->label}, {"symbol_id", opt(r->symbol_id)}};
    }
    if (auto* f = tree.as<Node::Freeform>()) {
        return {{"kind", "Freeform"}, {"text", f->text}};
    }
    if (auto* t = tree.as<Node::Triple>()) {
        return {{"kind", "Triple"},
                {"subject", tree_to_json(*t->subject)},
                {"predicate", tree_to_json(*t->predicate)},
                {"object", tree_to_json(*t->object)}};
    }
    if (auto* s = tree.as<Node::Similarity>()) {
        return {{"kind", "Similarity"},
                {"entity", tree_to_json(*s->entity)},
                {"similar_to", tree_to_json(*s->similar_to)},
                {"score", s->score}};
    }
    if (auto* g = tree.as<Node::Gap>()) {
        return {{"kind", "Gap"}, {"entity", tree_to_json(*g->entity)}, {"description", g->description}};
    }
    if (auto* i = tree.as<Node::Inference>()) {
        return {{"kind", "Inference"}, {"expression", i->expression}, {"simplified", i->simplified}};
    }
    if (auto* c = tree.as<Node::CodeFact>()) {
        return {{"kind", "CodeFact"}, {"code_kind", c->kind}, {"name", c->name}, {"detail", c->detail}};
    }
    if (auto* m = tree.as<Node::CodeModule>()) {
        return {{"kind", "CodeModule"},
                {"name", m->name},
                {"role", opt(m->role)},
                {"importance", opt(m->importance)},
                {"doc_summary", opt(m->doc_summary)},
                {"children", list(m->children)}};
    }
    if (auto* s = tree.as<Node::CodeSignature>()) {
        return {{"kind", "CodeSignature"},
                {"code_kind", s->kind},
                {"name", s->name},
                {"doc_summary", opt(s->doc_summary)},
                {"params_or_fields", s->params_or_fields},
                {"return_type", opt(s->return_type)},
                {"traits", s->traits},
                {"importance", opt(s->importance)}};
    }
    if (auto* df = tree.as<Node::DataFlow>()) {
        json steps = json::array();
        for (const auto& step : df->steps) {
            steps.push_back({{"name", step.name}, {"via_type", opt(step.via_type)}});
        }
        return {{"kind", "DataFlow"}, {"steps", steps}};
    }
    if (auto* c = tree.as<Node::WithConfidence>()) {
        return {{"kind", "WithConfidence"}, {"inner", tree_to_json(*c->inner)}, {"confidence", c->confidence}};
    }
    if (auto* p = tree.as<Node::WithProvenance>()) {
        return {{"kind", "WithProvenance"},
                {"inner", tree_to_json(*p->inner)},
                {"provenance", provenance_to_json(p->tag)}};
    }
    if (auto* d = tree.as<Node::DiscourseFrame>()) {
        return {{"kind", "DiscourseFrame"},
                {"inner", tree_to_json(*d->inner)},
                {"pov", pov_name(d->pov)},
                {"focus", focus_name(d->focus)}};
    }
    if (auto* c = tree.as<Node::Conjunction>()) {
        return {{"kind", "Conjunction"}, {"items", list(c->items)}, {"is_and", c->is_and}};
    }
    if (auto* s = tree.as<Node::Section>()) {
        return {{"kind", "Section"}, {"heading", s->heading}, {"body", list(s->body)}};
    }
    const auto& d = std::get<Node::Document>(tree.node());
    return {{"kind", "Document"},
            {"overview", tree_to_json(*d.overview)},
            {"sections", list(d.sections)},
            {"gaps", list(d.gaps)}};
}

SemanticTree tree_from_json(const json& j) {
    try {
        return decode(j);
    } catch (const nlohmann::json::exception& e) {
        throw ParseFailed(std::string("malformed tree JSON: ") + e.what());
    }
}

} // namespace Glossa
