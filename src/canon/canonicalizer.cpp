// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/canonicalizer.h>
#include <canon/canon_cache.h>
#include <canon/custom.h>
#include <util/logging.h>

#include <chrono>
#include <stdexcept>

CanonicalizationAlgorithm SelectAlgorithm(GraphComplexity complexity) {
    switch (complexity) {
        case GraphComplexity::SIMPLE:
        case GraphComplexity::MODERATE:
            return CanonicalizationAlgorithm::CUSTOM;
        case GraphComplexity::COMPLEX:
        case GraphComplexity::PATHOLOGICAL:
            return CanonicalizationAlgorithm::RDFC10;
    }
    return CanonicalizationAlgorithm::RDFC10;
}

uint256 CanonicalizeWith(const CGraph& graph, CanonicalizationAlgorithm algorithm,
                         const CCanonicalizationBudget& budget) {
    switch (algorithm) {
        case CanonicalizationAlgorithm::CUSTOM:
            return CanonicalizeCustom(graph);
        case CanonicalizationAlgorithm::RDFC10:
            return CanonicalizeRDFC10(graph, budget);
    }
    throw std::invalid_argument("CanonicalizeWith: unknown algorithm");
}

CCanonicalizationResult Canonicalize(const CGraph& graph, const CCanonicalizationBudget& budget,
                                     CCanonicalizationCache* cache) {
    auto start = std::chrono::steady_clock::now();

    CCanonicalizationResult result;
    result.complexity = ClassifyGraph(graph);
    result.algorithm = SelectAlgorithm(result.complexity);
    result.triple_count = graph.Size();
    result.blank_node_count = graph.BlankNodes().size();

    bool cached = false;
    uint256 key;
    if (cache) {
        key = CCanonicalizationCache::GraphKey(graph);
        cached = cache->Lookup(key, result.algorithm, result.hash);
    }
    if (!cached) {
        result.hash = CanonicalizeWith(graph, result.algorithm, budget);
        if (cache) {
            cache->Insert(key, result.algorithm, result.hash);
        }
    }

    result.execution_time_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();

    LogPrintCanon(DEBUG, "Canonicalized %zu triples (%zu blank nodes): tier=%s algorithm=%s%s time=%lldus",
                  result.triple_count, result.blank_node_count,
                  GetComplexityName(result.complexity), GetAlgorithmName(result.algorithm),
                  cached ? " (cached)" : "", static_cast<long long>(result.execution_time_us));
    return result;
}
