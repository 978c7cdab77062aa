// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <primitives/block.h>
#include <crypto/sha256.h>

#include <sstream>

std::string GetBlockGraphId(uint64_t nIndex) {
    return "http://provchain.org/block/" + std::to_string(nIndex);
}

uint256 CBlock::ComputeHash() const {
    CSHA256 hasher;
    hasher.Write(std::to_string(nIndex));
    hasher.Write(strTimestamp);
    hasher.Write(hashCanonical.GetHex());
    hasher.Write(hashPrevBlock.GetHex());
    return hasher.Finalize();
}

std::string CBlock::ToString() const {
    std::stringstream s;
    s << "CBlock(index=" << nIndex
      << ", time=" << strTimestamp
      << ", graph=" << graphRef
      << ", prev=" << hashPrevBlock.GetHex().substr(0, 16)
      << ", canonical=" << hashCanonical.GetHex().substr(0, 16)
      << ", hash=" << hashBlock.GetHex().substr(0, 16)
      << ", algorithm=" << GetAlgorithmName(algorithm)
      << ")";
    return s.str();
}
