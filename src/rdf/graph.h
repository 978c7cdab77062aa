// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_RDF_GRAPH_H
#define PROVCHAIN_RDF_GRAPH_H

#include <rdf/term.h>

#include <set>
#include <string>
#include <vector>

/**
 * An unordered set of triples. Iteration order is the triple ordering and
 * carries no meaning; duplicate triples collapse.
 */
class CGraph {
public:
    typedef std::set<CTriple>::const_iterator const_iterator;

    CGraph() {}
    explicit CGraph(const std::vector<CTriple>& triples);

    /**
     * Add a triple.
     * @return true if it was not already present
     * @throws SerializationError if the triple is not valid (non-IRI predicate,
     *         literal subject)
     */
    bool Insert(const CTriple& triple);

    bool Contains(const CTriple& triple) const { return m_triples.count(triple) != 0; }
    size_t Size() const { return m_triples.size(); }
    bool Empty() const { return m_triples.empty(); }
    void Clear() { m_triples.clear(); }

    const_iterator begin() const { return m_triples.begin(); }
    const_iterator end() const { return m_triples.end(); }

    std::vector<CTriple> GetTriples() const;

    /** Distinct blank node ids appearing as subject or object */
    std::set<std::string> BlankNodes() const;

    bool operator==(const CGraph& other) const { return m_triples == other.m_triples; }

private:
    std::set<CTriple> m_triples;
};

#endif // PROVCHAIN_RDF_GRAPH_H
