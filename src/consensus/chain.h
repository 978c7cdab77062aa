// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CONSENSUS_CHAIN_H
#define PROVCHAIN_CONSENSUS_CHAIN_H

#include <core/errors.h>
#include <primitives/block.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations
class CGraphDB;

/**
 * Chain State Manager
 *
 * Exclusively owns the ordered block list. Appends are serialized by
 * cs_main; readers take a snapshot, which is a copy of the block pointers
 * and stays valid while the chain keeps growing.
 */
class CChainState
{
public:
    typedef std::vector<std::shared_ptr<const CBlock>> Snapshot;

private:
    Snapshot vChain;

    // Database for persisting block records (optional)
    CGraphDB* pdb;

    // Protects vChain and the check-then-append in AppendBlock
    mutable std::mutex cs_main;

public:
    CChainState();

    void SetDatabase(CGraphDB* database) { pdb = database; }

    /**
     * Install the genesis block on an empty chain. A chain that already
     * has blocks is left untouched.
     */
    bool Initialize(const CBlock& genesis, CCoreError& error);

    /**
     * Replace the in-memory chain with the block records stored in the
     * database. Records must be contiguous from index 0.
     */
    bool LoadFromDatabase(CCoreError& error);

    /**
     * Append a block to the tip.
     *
     * Fails with CHAIN_LINK if the index is not tip+1 or hashPrevBlock is
     * not the tip's hash, with INTEGRITY if hashBlock is not the hash of the
     * block's own fields, and with STORE if the record cannot be persisted.
     * Nothing is changed on failure.
     */
    bool AppendBlock(const CBlock& block, CCoreError& error);

    /** Current tip, or nullptr on an empty chain */
    std::shared_ptr<const CBlock> GetTip() const;

    /** Block at index, or nullptr */
    std::shared_ptr<const CBlock> GetBlock(uint64_t index) const;

    /**
     * Index of the tip; -1 on an empty chain
     */
    int64_t GetHeight() const;

    size_t Size() const;

    Snapshot GetSnapshot() const;
};

#endif // PROVCHAIN_CONSENSUS_CHAIN_H
