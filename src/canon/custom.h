// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_CUSTOM_H
#define PROVCHAIN_CANON_CUSTOM_H

#include <rdf/graph.h>
#include <uint256.h>

/**
 * Fast canonical hash for graphs without blank-to-blank structure.
 *
 * Each triple is hashed with blank subjects replaced by "Magic_S" and blank
 * objects by "Magic_O". A triple with a blank subject folds in the hashes of
 * that node's incoming triples; a triple with a blank object folds in that
 * node's outgoing triples. Folding and the final graph hash both sort the
 * raw digests, concatenate them and hash the result, so neither depends on
 * triple order.
 *
 * Relabeling-invariant for any input, but only isomorphism-correct while
 * no two blank nodes share an identical one-hop neighbourhood.
 *
 * @throws SerializationError on malformed terms
 */
uint256 CanonicalizeCustom(const CGraph& graph);

/** SHA256(subject || predicate || object) with blank-node placeholders */
uint256 HashTripleWithPlaceholders(const CTriple& triple);

#endif // PROVCHAIN_CANON_CUSTOM_H
