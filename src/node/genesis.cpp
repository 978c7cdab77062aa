// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <node/genesis.h>
#include <canon/custom.h>
#include <rdf/graph.h>

namespace Genesis {

const char* const TIMESTAMP = "2025-01-01T00:00:00Z";

const char* const PAYLOAD =
    "<http://example.org/genesis> <http://example.org/type> \"Genesis Block\" .\n";

std::vector<CTriple> GetGenesisTriples() {
    return {CTriple(CTerm::Iri("http://example.org/genesis"),
                    CTerm::Iri("http://example.org/type"),
                    CTerm::Literal("Genesis Block"))};
}

CBlock CreateGenesisBlock() {
    CBlock genesis;
    genesis.nIndex = 0;
    genesis.strTimestamp = TIMESTAMP;
    genesis.graphRef = GetBlockGraphId(0);
    genesis.hashPrevBlock = uint256();  // All zeros (no previous block)
    genesis.algorithm = CanonicalizationAlgorithm::CUSTOM;
    genesis.hashCanonical = CanonicalizeCustom(CGraph(GetGenesisTriples()));
    genesis.hashBlock = genesis.ComputeHash();
    return genesis;
}

uint256 GetGenesisHash() {
    static const uint256 hash = CreateGenesisBlock().hashBlock;
    return hash;
}

bool IsGenesisBlock(const CBlock& block) {
    static const CBlock genesis = CreateGenesisBlock();

    if (block.nIndex != 0) return false;
    if (!block.hashPrevBlock.IsNull()) return false;
    if (block.strTimestamp != genesis.strTimestamp) return false;
    if (block.graphRef != genesis.graphRef) return false;
    if (block.algorithm != genesis.algorithm) return false;
    if (block.hashCanonical != genesis.hashCanonical) return false;
    return block.hashBlock == genesis.hashBlock;
}

} // namespace Genesis
