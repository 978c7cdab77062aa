// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_RDF_NTRIPLES_H
#define PROVCHAIN_RDF_NTRIPLES_H

#include <rdf/graph.h>
#include <rdf/term.h>

#include <string>
#include <vector>

/**
 * N-Triples codec used for block payloads and for the persisted form of
 * stored graphs.
 */

/**
 * Parse N-Triples text: one statement per line, '#' comments and blank
 * lines allowed.
 *
 * @param text Input document
 * @param triples Output triples in document order
 * @param error Set to "line N: reason" on failure
 * @return true on success
 */
bool ParseNTriples(const std::string& text, std::vector<CTriple>& triples, std::string& error);

/** Parse into a graph (duplicate statements collapse) */
bool ParseNTriples(const std::string& text, CGraph& graph, std::string& error);

/**
 * Serialize triples, one canonical statement per line.
 * @throws SerializationError on malformed terms
 */
std::string SerializeNTriples(const std::vector<CTriple>& triples);
std::string SerializeNTriples(const CGraph& graph);

#endif // PROVCHAIN_RDF_NTRIPLES_H
