/**
 * @file symbol_registry.cpp
 * @brief In-memory symbol registry and knowledge graph
 */

#include <grammar/symbol_registry.hpp>
#include <utils/unicode.hpp>
#include <mutex>

namespace Glossa {

SymbolId MemorySymbolRegistry::intern(std::string_view label) {
    std::string key = to_lower(label);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_label_.find(key);
    if (it != by_label_.end()) return it->second;

    SymbolId id = next_id_++;
    by_label_.emplace(std::move(key), id);
    labels_.emplace(id, std::string(label));
    return id;
}

std::optional<SymbolId> MemorySymbolRegistry::lookup(std::string_view label) const {
    std::string key = to_lower(label);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_label_.find(key);
    if (it == by_label_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> MemorySymbolRegistry::label_of(SymbolId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = labels_.find(id);
    if (it == labels_.end()) return std::nullopt;
    return it->second;
}

size_t MemorySymbolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return labels_.size();
}

void MemoryKnowledgeGraph::add(const GraphTriple& triple) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    outgoing_[triple.subject].push_back(triple);
    incoming_[triple.object].push_back(triple);
}

GraphTriple MemoryKnowledgeGraph::assert_triple(std::string_view subject, std::string_view predicate,
                                                std::string_view object, float confidence) {
    GraphTriple t;
    t.subject = registry_.intern(subject);
    t.predicate = registry_.intern(predicate);
    t.object = registry_.intern(object);
    t.confidence = confidence;
    add(t);
    return t;
}

std::vector<GraphTriple> MemoryKnowledgeGraph::triples_from(SymbolId subject) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = outgoing_.find(subject);
    if (it == outgoing_.end()) return {};
    return it->second;
}

std::vector<GraphTriple> MemoryKnowledgeGraph::triples_to(SymbolId object) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = incoming_.find(object);
    if (it == incoming_.end()) return {};
    return it->second;
}

} // namespace Glossa
