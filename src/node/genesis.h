// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_NODE_GENESIS_H
#define PROVCHAIN_NODE_GENESIS_H

#include <primitives/block.h>
#include <rdf/term.h>
#include <uint256.h>

#include <vector>

/**
 * Genesis Block Parameters
 *
 * The genesis block is fixed: index 0, an all-zero previous hash, a fixed
 * timestamp and a one-triple graph hashed with the custom algorithm. It is
 * built once when a chain is initialized and never re-derived during
 * validation.
 */
namespace Genesis {

extern const char* const TIMESTAMP;

/** N-Triples text of the genesis graph */
extern const char* const PAYLOAD;

std::vector<CTriple> GetGenesisTriples();

/**
 * Create the genesis block
 *
 * @return The genesis block with its canonical and block hashes filled in
 */
CBlock CreateGenesisBlock();

/**
 * Get the genesis block hash (computed once and cached)
 */
uint256 GetGenesisHash();

/**
 * Verify a block is the genesis block by comparing its fixed fields
 */
bool IsGenesisBlock(const CBlock& block);

} // namespace Genesis

#endif // PROVCHAIN_NODE_GENESIS_H
