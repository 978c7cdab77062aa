// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_CANONICALIZER_H
#define PROVCHAIN_CANON_CANONICALIZER_H

#include <canon/algorithm.h>
#include <canon/complexity.h>
#include <canon/rdfc10.h>
#include <rdf/graph.h>
#include <uint256.h>

#include <cstdint>

class CCanonicalizationCache;

/** Outcome of an adaptive canonicalization */
struct CCanonicalizationResult {
    uint256 hash;
    CanonicalizationAlgorithm algorithm;
    GraphComplexity complexity;
    int64_t execution_time_us;
    size_t triple_count;
    size_t blank_node_count;

    CCanonicalizationResult()
        : algorithm(CanonicalizationAlgorithm::CUSTOM), complexity(GraphComplexity::SIMPLE),
          execution_time_us(0), triple_count(0), blank_node_count(0) {}
};

/** Simple and moderate graphs use the custom hash, everything else RDFC-1.0 */
CanonicalizationAlgorithm SelectAlgorithm(GraphComplexity complexity);

/**
 * Classify the graph, pick an algorithm and hash it.
 *
 * A CanonicalizationTimeout from RDFC-1.0 propagates to the caller. The
 * custom algorithm is never used as a fallback.
 *
 * @param cache Optional; consulted after classification
 * @throws CanonicalizationTimeout, SerializationError
 */
CCanonicalizationResult Canonicalize(const CGraph& graph,
                                     const CCanonicalizationBudget& budget = CCanonicalizationBudget(),
                                     CCanonicalizationCache* cache = nullptr);

/**
 * Hash with a specific algorithm, as recorded in a block.
 * @throws CanonicalizationTimeout, SerializationError
 */
uint256 CanonicalizeWith(const CGraph& graph, CanonicalizationAlgorithm algorithm,
                         const CCanonicalizationBudget& budget = CCanonicalizationBudget());

#endif // PROVCHAIN_CANON_CANONICALIZER_H
