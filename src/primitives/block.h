// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_PRIMITIVES_BLOCK_H
#define PROVCHAIN_PRIMITIVES_BLOCK_H

#include <canon/algorithm.h>
#include <uint256.h>

#include <cstdint>
#include <string>

/** Named graph identifier holding the payload of block nIndex */
std::string GetBlockGraphId(uint64_t nIndex);

/**
 * A ledger block.
 *
 * The block does not carry its triples. graphRef names the graph in the
 * store, and hashCanonical is the canonical hash of that graph computed with
 * the recorded algorithm.
 */
class CBlock {
public:
    uint64_t nIndex;
    std::string strTimestamp;       // ISO-8601 UTC, YYYY-MM-DDTHH:MM:SSZ
    std::string graphRef;
    uint256 hashPrevBlock;
    uint256 hashCanonical;
    uint256 hashBlock;
    CanonicalizationAlgorithm algorithm;

    CBlock() { SetNull(); }

    void SetNull() {
        nIndex = 0;
        strTimestamp.clear();
        graphRef.clear();
        hashPrevBlock.SetNull();
        hashCanonical.SetNull();
        hashBlock.SetNull();
        algorithm = CanonicalizationAlgorithm::CUSTOM;
    }

    bool IsNull() const { return hashBlock.IsNull(); }

    /**
     * Derive the block hash from the header fields:
     * SHA256(decimal(nIndex) || strTimestamp || hex(hashCanonical) || hex(hashPrevBlock))
     */
    uint256 ComputeHash() const;

    std::string ToString() const;
};

#endif // PROVCHAIN_PRIMITIVES_BLOCK_H
