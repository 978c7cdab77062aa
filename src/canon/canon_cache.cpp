// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/canon_cache.h>
#include <crypto/sha256.h>

CCanonicalizationCache::CCanonicalizationCache(size_t max_entries)
    : nMaxEntries(max_entries), nHits(0), nMisses(0) {
}

uint256 CCanonicalizationCache::GraphKey(const CGraph& graph) {
    // CGraph iterates in sorted triple order
    CSHA256 hasher;
    for (const CTriple& triple : graph) {
        hasher.Write(triple.ToNTriples());
        hasher.Write("\n");
    }
    return hasher.Finalize();
}

bool CCanonicalizationCache::Lookup(const uint256& graph_key, CanonicalizationAlgorithm algorithm, uint256& hash) {
    std::lock_guard<std::mutex> lock(cs_cache);
    auto it = mapEntries.find(CacheKey(graph_key, algorithm));
    if (it == mapEntries.end()) {
        nMisses++;
        return false;
    }
    lruEntries.splice(lruEntries.begin(), lruEntries, it->second);
    hash = it->second->second;
    nHits++;
    return true;
}

void CCanonicalizationCache::Insert(const uint256& graph_key, CanonicalizationAlgorithm algorithm, const uint256& hash) {
    if (nMaxEntries == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(cs_cache);
    CacheKey key(graph_key, algorithm);
    auto it = mapEntries.find(key);
    if (it != mapEntries.end()) {
        it->second->second = hash;
        lruEntries.splice(lruEntries.begin(), lruEntries, it->second);
        return;
    }

    lruEntries.emplace_front(key, hash);
    mapEntries[key] = lruEntries.begin();

    while (mapEntries.size() > nMaxEntries) {
        mapEntries.erase(lruEntries.back().first);
        lruEntries.pop_back();
    }
}

void CCanonicalizationCache::Clear() {
    std::lock_guard<std::mutex> lock(cs_cache);
    lruEntries.clear();
    mapEntries.clear();
}

size_t CCanonicalizationCache::Size() const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return mapEntries.size();
}

uint64_t CCanonicalizationCache::GetHits() const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return nHits;
}

uint64_t CCanonicalizationCache::GetMisses() const {
    std::lock_guard<std::mutex> lock(cs_cache);
    return nMisses;
}
