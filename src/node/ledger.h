// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_NODE_LEDGER_H
#define PROVCHAIN_NODE_LEDGER_H

#include <canon/canon_cache.h>
#include <canon/canonicalizer.h>
#include <canon/rdfc10.h>
#include <consensus/chain.h>
#include <consensus/chain_verifier.h>
#include <core/errors.h>
#include <node/canon_worker_pool.h>
#include <primitives/block.h>
#include <rdf/term.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

class CConfigParser;
class CGraphDB;
class CGraphStore;

/**
 * Ledger settings, usually read from provchain.conf
 */
struct CLedgerOptions {
    static constexpr size_t DEFAULT_CACHE_SIZE = 1024;

    CCanonicalizationBudget budget;
    size_t nWorkers;            // Canonicalization threads
    size_t nCacheSize;          // Canonical hash cache entries; 0 disables
    std::string datadir;

    CLedgerOptions();

    /**
     * Read canonmaxpermutations, canonmaxms, workers, canoncachesize and
     * datadir. Missing or malformed values fall back to the defaults.
     */
    static CLedgerOptions FromConfig(const CConfigParser& config);
};

/**
 * Apply loglevel, logfile and printtoconsole from the configuration and
 * open the log file.
 */
bool InitLogging(const CConfigParser& config, const std::string& datadir, std::string& error);

/**
 * The ledger core as seen by the rest of the node.
 *
 * Block payloads are stored in the graph store under one named graph per
 * block index, canonicalized on the worker pool, and appended to the chain
 * through the single serialized append path of CChainState.
 *
 * When the store is a CGraphDB, block records are persisted alongside the
 * graphs and reloaded by Initialize.
 */
class CLedger {
public:
    explicit CLedger(CGraphStore& store, const CLedgerOptions& options = CLedgerOptions());
    ~CLedger();

    CLedger(const CLedger&) = delete;
    CLedger& operator=(const CLedger&) = delete;

    /**
     * Start the worker pool and load or create the chain.
     */
    bool Initialize(CCoreError& error);

    /** Stop the worker pool. Safe to call more than once. */
    void Shutdown();

    /**
     * Canonicalize a payload, store it as the graph of block `index` and
     * build the block.
     *
     * The block is not appended. Fails with SERIALIZATION on malformed
     * payloads, STORE on store failures, CANONICALIZATION_TIMEOUT when the
     * RDFC-1.0 budget is exceeded, and CHAIN_LINK if `index` is already in
     * the chain. The graph is written only after canonicalization succeeds.
     *
     * @param rdf_payload N-Triples text
     */
    bool CreateBlock(uint64_t index, const std::string& rdf_payload, const uint256& previous_hash,
                     CBlock& block, CCoreError& error);
    bool CreateBlock(uint64_t index, const std::vector<CTriple>& triples, const uint256& previous_hash,
                     CBlock& block, CCoreError& error);

    /**
     * Append a block built by CreateBlock.
     *
     * The graph behind block.graphRef is re-hashed with the recorded
     * algorithm first; INTEGRITY if it no longer matches hashCanonical
     * (a later CreateBlock for the same index replaced it). CHAIN_LINK on
     * linkage mismatch.
     */
    bool AppendBlock(const CBlock& block, CCoreError& error);

    /**
     * Create a block on the current tip and append it. Concurrent callers
     * are serialized.
     */
    bool AddBlock(const std::string& rdf_payload, CBlock& block, CCoreError& error);
    bool AddBlock(const std::vector<CTriple>& triples, CBlock& block, CCoreError& error);

    /** Recompute and check every block */
    CValidationReport ValidateChain(ValidationMode mode = ValidationMode::COLLECT_ALL) const;

    /**
     * Adaptive canonical hash of a stored graph.
     */
    bool CanonicalHashOf(const std::string& graph_id, uint256& hash, CCoreError& error);
    bool CanonicalHashOf(const std::string& graph_id, CCanonicalizationResult& result, CCoreError& error);

    CChainState::Snapshot GetSnapshot() const { return m_chainstate.GetSnapshot(); }
    int64_t GetHeight() const { return m_chainstate.GetHeight(); }
    std::shared_ptr<const CBlock> GetTip() const { return m_chainstate.GetTip(); }

    const CLedgerOptions& GetOptions() const { return m_options; }
    const CCanonicalizationCache& GetCache() const { return m_cache; }

private:
    /** Run the adaptive selector on the worker pool */
    bool CanonicalizeOnPool(const std::vector<CTriple>& triples, CCanonicalizationResult& result,
                            CCoreError& error, uint64_t index);

    /** Re-hash the stored graph of a candidate block */
    bool CheckStoredGraph(const CBlock& block, CCoreError& error);

    CGraphStore& m_store;
    CGraphDB* m_pdb;
    CLedgerOptions m_options;
    CChainState m_chainstate;
    mutable CCanonWorkerPool m_pool;
    CCanonicalizationCache m_cache;

    // Serializes AddBlock's read-tip, create, append sequence
    std::mutex cs_writer;

    // Block graph writes against verify-and-append
    std::mutex cs_graphs;
};

#endif // PROVCHAIN_NODE_LEDGER_H
