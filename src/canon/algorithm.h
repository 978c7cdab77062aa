// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_ALGORITHM_H
#define PROVCHAIN_CANON_ALGORITHM_H

#include <cstdint>
#include <string>

/**
 * Canonicalization algorithm recorded in each block.
 *
 * The set is closed: every dispatch site switches over both values so that
 * historical blocks are always re-validated with the algorithm that built
 * them. Numeric values are persisted in block records and must not change.
 */
enum class CanonicalizationAlgorithm : uint8_t {
    CUSTOM = 0,    // Placeholder + one-hop folding hash
    RDFC10 = 1     // W3C RDF Dataset Canonicalization (RDFC-1.0)
};

const char* GetAlgorithmName(CanonicalizationAlgorithm algorithm);

/** Parse "custom" or "rdfc-1.0". Returns false on unknown names. */
bool ParseAlgorithmName(const std::string& name, CanonicalizationAlgorithm& algorithm);

/** Decode a persisted algorithm byte. Returns false on unknown values. */
bool AlgorithmFromByte(uint8_t value, CanonicalizationAlgorithm& algorithm);

#endif // PROVCHAIN_CANON_ALGORITHM_H
