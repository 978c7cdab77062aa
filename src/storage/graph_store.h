// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_STORAGE_GRAPH_STORE_H
#define PROVCHAIN_STORAGE_GRAPH_STORE_H

#include <rdf/term.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * Named-graph store used by the ledger.
 *
 * The store owns the triples; blocks only hold the graph identifier.
 * Implementations must be safe for concurrent readers alongside a single
 * writer.
 */
class CGraphStore {
public:
    virtual ~CGraphStore() {}

    /**
     * Persist triples under graph_id, replacing any previous content.
     * @return false and set error on failure
     */
    virtual bool StoreGraph(const std::string& graph_id, const std::vector<CTriple>& triples,
                            std::string& error) = 0;

    /**
     * Fetch all triples of a stored graph (order unspecified).
     * @return false and set error if the graph is missing or unreadable
     */
    virtual bool TriplesInGraph(const std::string& graph_id, std::vector<CTriple>& triples,
                                std::string& error) const = 0;

    virtual bool HasGraph(const std::string& graph_id) const = 0;
};

/** In-memory graph store */
class CMemoryGraphStore : public CGraphStore {
public:
    bool StoreGraph(const std::string& graph_id, const std::vector<CTriple>& triples,
                    std::string& error) override;
    bool TriplesInGraph(const std::string& graph_id, std::vector<CTriple>& triples,
                        std::string& error) const override;
    bool HasGraph(const std::string& graph_id) const override;

    size_t GetGraphCount() const;

private:
    std::map<std::string, std::vector<CTriple>> mapGraphs;
    mutable std::mutex cs_store;
};

#endif // PROVCHAIN_STORAGE_GRAPH_STORE_H
