// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <rdf/graph.h>
#include <core/errors.h>

CGraph::CGraph(const std::vector<CTriple>& triples) {
    for (const CTriple& triple : triples) {
        Insert(triple);
    }
}

bool CGraph::Insert(const CTriple& triple) {
    if (!triple.IsValid()) {
        throw SerializationError("invalid triple: predicate must be an IRI and subject must not be a literal");
    }
    return m_triples.insert(triple).second;
}

std::vector<CTriple> CGraph::GetTriples() const {
    return std::vector<CTriple>(m_triples.begin(), m_triples.end());
}

std::set<std::string> CGraph::BlankNodes() const {
    std::set<std::string> result;
    for (const CTriple& triple : m_triples) {
        if (triple.subject.IsBlank()) result.insert(triple.subject.GetValue());
        if (triple.object.IsBlank()) result.insert(triple.object.GetValue());
    }
    return result;
}
