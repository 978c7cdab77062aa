// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/custom.h>
#include <crypto/sha256.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace {

const char* const MAGIC_SUBJECT = "Magic_S";
const char* const MAGIC_OBJECT = "Magic_O";

/** Sort digests and hash their concatenation */
uint256 FoldSorted(std::vector<uint256>& hashes, const uint256* prefix = nullptr) {
    std::sort(hashes.begin(), hashes.end());
    CSHA256 hasher;
    if (prefix) {
        hasher.Write(*prefix);
    }
    for (const uint256& h : hashes) {
        hasher.Write(h);
    }
    return hasher.Finalize();
}

} // namespace

uint256 HashTripleWithPlaceholders(const CTriple& triple) {
    CSHA256 hasher;
    hasher.Write(triple.subject.IsBlank() ? std::string(MAGIC_SUBJECT) : triple.subject.ToNTriples());
    hasher.Write(triple.predicate.ToNTriples());
    hasher.Write(triple.object.IsBlank() ? std::string(MAGIC_OBJECT) : triple.object.ToNTriples());
    return hasher.Finalize();
}

uint256 CanonicalizeCustom(const CGraph& graph) {
    std::vector<CTriple> triples = graph.GetTriples();
    std::vector<uint256> triple_hashes;
    triple_hashes.reserve(triples.size());

    // Triple indices by blank node, split by role
    std::map<std::string, std::vector<size_t>> as_subject;
    std::map<std::string, std::vector<size_t>> as_object;

    for (size_t i = 0; i < triples.size(); i++) {
        const CTriple& t = triples[i];
        triple_hashes.push_back(HashTripleWithPlaceholders(t));
        if (t.subject.IsBlank()) as_subject[t.subject.GetValue()].push_back(i);
        if (t.object.IsBlank()) as_object[t.object.GetValue()].push_back(i);
    }

    std::vector<uint256> folded;
    folded.reserve(triples.size());
    for (size_t i = 0; i < triples.size(); i++) {
        const CTriple& t = triples[i];
        if (!t.subject.IsBlank() && !t.object.IsBlank()) {
            folded.push_back(triple_hashes[i]);
            continue;
        }

        std::vector<uint256> neighbours;
        if (t.subject.IsBlank()) {
            auto it = as_object.find(t.subject.GetValue());
            if (it != as_object.end()) {
                for (size_t j : it->second) {
                    if (j != i) neighbours.push_back(triple_hashes[j]);
                }
            }
        }
        if (t.object.IsBlank()) {
            auto it = as_subject.find(t.object.GetValue());
            if (it != as_subject.end()) {
                for (size_t j : it->second) {
                    if (j != i) neighbours.push_back(triple_hashes[j]);
                }
            }
        }
        folded.push_back(FoldSorted(neighbours, &triple_hashes[i]));
    }

    return FoldSorted(folded);
}
