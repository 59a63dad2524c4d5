/**
 * @file symbol_registry.hpp
 * @brief Interfaces to the knowledge store the translation layer reads from
 *
 * The store itself lives outside this library. Parsing and grounding need
 * only label <-> id lookups; discourse assembly also needs outgoing and
 * incoming edges. In-memory implementations back the CLI and the tests.
 */

#pragma once

#include <vsa/symbol_id.hpp>
#include <export.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Glossa {

/**
 * @brief Label <-> symbol lookups. Label matching is case-insensitive.
 */
class GLOSSA_API SymbolRegistry {
public:
    virtual ~SymbolRegistry() = default;

    virtual std::optional<SymbolId> lookup(std::string_view label) const = 0;
    virtual std::optional<std::string> label_of(SymbolId id) const = 0;
};

/**
 * @brief One edge of the knowledge graph.
 */
struct GraphTriple {
    SymbolId subject = 0;
    SymbolId predicate = 0;
    SymbolId object = 0;
    float confidence = 1.0f;
};

class GLOSSA_API KnowledgeGraph {
public:
    virtual ~KnowledgeGraph() = default;

    virtual std::vector<GraphTriple> triples_from(SymbolId subject) const = 0;
    virtual std::vector<GraphTriple> triples_to(SymbolId object) const = 0;
};

/**
 * @brief Thread-safe in-memory registry. Ids are allocated from 1 upwards.
 */
class GLOSSA_API MemorySymbolRegistry : public SymbolRegistry {
public:
    /**
     * @brief Id for `label`, allocating one if the label is new
     */
    SymbolId intern(std::string_view label);

    std::optional<SymbolId> lookup(std::string_view label) const override;
    std::optional<std::string> label_of(SymbolId id) const override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SymbolId> by_label_;   // lowercased label
    std::unordered_map<SymbolId, std::string> labels_;      // original spelling
    SymbolId next_id_ = 1;
};

/**
 * @brief In-memory graph keyed on an accompanying registry.
 */
class GLOSSA_API MemoryKnowledgeGraph : public KnowledgeGraph {
public:
    explicit MemoryKnowledgeGraph(MemorySymbolRegistry& registry) : registry_(registry) {}

    void add(const GraphTriple& triple);

    /**
     * @brief Intern the three labels and add the edge between them
     */
    GraphTriple assert_triple(std::string_view subject, std::string_view predicate,
                              std::string_view object, float confidence = 1.0f);

    std::vector<GraphTriple> triples_from(SymbolId subject) const override;
    std::vector<GraphTriple> triples_to(SymbolId object) const override;

    MemorySymbolRegistry& registry() { return registry_; }

private:
    MemorySymbolRegistry& registry_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<SymbolId, std::vector<GraphTriple>> outgoing_;
    std::unordered_map<SymbolId, std::vector<GraphTriple>> incoming_;
};

} // namespace Glossa
