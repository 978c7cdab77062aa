// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_COMPLEXITY_H
#define PROVCHAIN_CANON_COMPLEXITY_H

#include <rdf/graph.h>

/**
 * Blank-node topology tiers, in increasing order of difficulty.
 */
enum class GraphComplexity {
    SIMPLE,         // No blank nodes
    MODERATE,       // Blank nodes, but no blank-to-blank edges
    COMPLEX,        // Blank-to-blank edges forming chains or trees, no symmetry
    PATHOLOGICAL    // Blank-node cycle, or structurally indistinguishable blank nodes
};

const char* GetComplexityName(GraphComplexity complexity);

/**
 * Classify a graph by the shape of its blank-node subgraph. Pure and
 * always terminates.
 */
GraphComplexity ClassifyGraph(const CGraph& graph);

/**
 * True when the undirected blank-to-blank edge set has a cycle. A
 * self-loop or two edges between the same pair of blank nodes count.
 */
bool HasBlankNodeCycle(const CGraph& graph);

/**
 * True when colour refinement over the blank nodes leaves two or more of
 * them with the same colour.
 */
bool HasBlankNodeSymmetry(const CGraph& graph);

#endif // PROVCHAIN_CANON_COMPLEXITY_H
