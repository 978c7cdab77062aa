// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_RDFC10_H
#define PROVCHAIN_CANON_RDFC10_H

#include <rdf/graph.h>
#include <uint256.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * Work limit for the N-degree search.
 *
 * Every N-degree frame and every permutation examined costs one step.
 * Exceeding either limit raises CanonicalizationTimeout; the search is
 * never truncated silently.
 */
struct CCanonicalizationBudget {
    static constexpr uint64_t DEFAULT_MAX_PERMUTATIONS = 100000;

    uint64_t max_permutations;    // 0 = no step limit
    int64_t max_duration_ms;      // 0 = no wall-clock limit

    CCanonicalizationBudget()
        : max_permutations(DEFAULT_MAX_PERMUTATIONS), max_duration_ms(0) {}
    CCanonicalizationBudget(uint64_t permutations, int64_t duration_ms)
        : max_permutations(permutations), max_duration_ms(duration_ms) {}
};

/**
 * Issues sequential identifiers (prefix0, prefix1, ...) and remembers the
 * order in which existing identifiers were seen.
 */
class CIdentifierIssuer {
public:
    explicit CIdentifierIssuer(const std::string& prefix = "b") : m_prefix(prefix), m_counter(0) {}

    /** Existing identifier for id, or a freshly issued one */
    const std::string& Issue(const std::string& id);

    bool Has(const std::string& id) const { return m_issued.count(id) != 0; }

    /** Issued identifier, or empty if none */
    std::string Get(const std::string& id) const;

    /** Original ids in issue order */
    const std::vector<std::string>& GetIssueOrder() const { return m_order; }

private:
    std::string m_prefix;
    uint64_t m_counter;
    std::map<std::string, std::string> m_issued;
    std::vector<std::string> m_order;
};

/**
 * RDF Dataset Canonicalization (RDFC-1.0) over a single graph.
 *
 * Triples are treated as quads in the default graph. Canonical labels use
 * the prefix "c14n", temporary labels during N-degree hashing use "b".
 * Hash N-Degree Quads runs on an explicit frame stack.
 */
class CRDFC10Canonicalizer {
public:
    CRDFC10Canonicalizer(const CGraph& graph, const CCanonicalizationBudget& budget);

    /**
     * Assign canonical labels to every blank node.
     * @return map from original blank node id to canonical label
     * @throws CanonicalizationTimeout when the budget is exhausted
     */
    const std::map<std::string, std::string>& IssueCanonicalLabels();

    /** Sorted canonical N-Quads, each line terminated by '\n' */
    std::string ToNQuads();

    uint256 Hash();

    /** Budget steps consumed so far */
    uint64_t GetSteps() const { return m_steps; }

private:
    struct NDegreeFrame;

    const CGraph& m_graph;
    CCanonicalizationBudget m_budget;
    std::chrono::steady_clock::time_point m_start;
    uint64_t m_steps;
    bool m_labeled;

    std::vector<CTriple> m_triples;
    std::map<std::string, std::vector<size_t>> m_blankToQuads;
    std::map<std::string, std::string> m_firstDegree;
    CIdentifierIssuer m_canonicalIssuer;
    std::map<std::string, std::string> m_labels;

    void ChargeStep(const char* what);
    std::string HashFirstDegreeQuads(const std::string& id) const;
    std::string HashRelatedBlankNode(const std::string& related, const CTriple& quad,
                                     const CIdentifierIssuer& issuer, char position) const;
    void BuildRelatedGroups(NDegreeFrame& frame) const;
    void HashNDegreeQuads(const std::string& id, const CIdentifierIssuer& issuer,
                          std::string& hash, CIdentifierIssuer& result_issuer);
};

/**
 * Canonical RDFC-1.0 serialization of graph.
 * @throws CanonicalizationTimeout, SerializationError
 */
std::string CanonicalizeToNQuads(const CGraph& graph,
                                 const CCanonicalizationBudget& budget = CCanonicalizationBudget());

/**
 * SHA-256 of CanonicalizeToNQuads(graph).
 * @throws CanonicalizationTimeout, SerializationError
 */
uint256 CanonicalizeRDFC10(const CGraph& graph,
                           const CCanonicalizationBudget& budget = CCanonicalizationBudget());

#endif // PROVCHAIN_CANON_RDFC10_H
