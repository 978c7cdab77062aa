// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CONSENSUS_CHAIN_VERIFIER_H
#define PROVCHAIN_CONSENSUS_CHAIN_VERIFIER_H

#include <canon/rdfc10.h>
#include <consensus/chain.h>
#include <core/errors.h>
#include <primitives/block.h>

#include <cstdint>
#include <string>
#include <vector>

class CCanonWorkerPool;
class CGraphStore;

enum class ValidationMode {
    FAIL_FAST,      // Stop at the first block with a finding
    COLLECT_ALL     // Check every block and report every finding
};

struct CValidationFinding {
    uint64_t index;
    CoreErrorKind kind;
    std::string detail;

    CValidationFinding() : index(0), kind(CoreErrorKind::NONE) {}
    CValidationFinding(uint64_t idx, CoreErrorKind k, const std::string& d)
        : index(idx), kind(k), detail(d) {}
};

struct CValidationReport {
    std::vector<CValidationFinding> findings;   // In block index order
    size_t blocks_checked;

    CValidationReport() : blocks_checked(0) {}

    bool IsValid() const { return findings.empty(); }
    std::string ToString() const;
};

/**
 * Chain Integrity Validation
 *
 * Re-derives every block from the graph store: the graph is fetched,
 * canonicalized again with the algorithm recorded in the block (never
 * re-classified), and both the canonical hash and the block hash are
 * compared with the stored values. Linkage is checked against the stored
 * hash of the previous block.
 *
 * The genesis block is checked against its fixed fields only.
 *
 * Findings are never repaired here.
 */
class CChainVerifier {
public:
    /**
     * @param store Graph store holding block payloads
     * @param pool Worker pool for per-block recomputation; nullptr runs inline
     * @param budget Budget for RDFC-1.0 re-runs
     */
    CChainVerifier(const CGraphStore& store, CCanonWorkerPool* pool,
                   const CCanonicalizationBudget& budget = CCanonicalizationBudget());

    /**
     * Verify a chain snapshot.
     *
     * Per-block recomputation runs concurrently on the pool; findings are
     * reported in index order regardless of completion order.
     */
    CValidationReport VerifyChain(const CChainState::Snapshot& chain, ValidationMode mode) const;

    /**
     * Linkage checks of block against its predecessor (nullptr for index 0).
     * Appends findings; returns false if any were added.
     */
    bool CheckLinkage(const CBlock& block, uint64_t position, const CBlock* prev,
                      std::vector<CValidationFinding>& findings) const;

    /**
     * Recompute the canonical hash and block hash of block.
     * Appends findings; returns false if any were added.
     */
    bool CheckIntegrity(const CBlock& block, std::vector<CValidationFinding>& findings) const;

private:
    const CGraphStore& m_store;
    CCanonWorkerPool* m_pool;
    CCanonicalizationBudget m_budget;
};

#endif // PROVCHAIN_CONSENSUS_CHAIN_VERIFIER_H
