// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CANON_CANON_CACHE_H
#define PROVCHAIN_CANON_CANON_CACHE_H

#include <canon/algorithm.h>
#include <rdf/graph.h>
#include <uint256.h>

#include <list>
#include <map>
#include <mutex>
#include <utility>

/**
 * @class CCanonicalizationCache
 * @brief Bounded LRU cache of canonical hashes
 *
 * Entries are keyed by the exact labeled content of a graph (see GraphKey)
 * together with the algorithm that produced the hash. Two isomorphic graphs
 * with different blank node ids are separate entries.
 *
 * Thread-safe: all operations protected by cs_cache.
 */
class CCanonicalizationCache {
public:
    /** @param max_entries Capacity; 0 disables caching */
    explicit CCanonicalizationCache(size_t max_entries);

    /**
     * @brief Key for a graph: SHA-256 of its sorted N-Triples, blank ids included
     * @throws SerializationError on malformed terms
     */
    static uint256 GraphKey(const CGraph& graph);

    bool Lookup(const uint256& graph_key, CanonicalizationAlgorithm algorithm, uint256& hash);
    void Insert(const uint256& graph_key, CanonicalizationAlgorithm algorithm, const uint256& hash);
    void Clear();

    size_t Size() const;
    size_t GetCapacity() const { return nMaxEntries; }
    uint64_t GetHits() const;
    uint64_t GetMisses() const;

private:
    typedef std::pair<uint256, CanonicalizationAlgorithm> CacheKey;
    typedef std::list<std::pair<CacheKey, uint256>> EntryList;

    const size_t nMaxEntries;
    EntryList lruEntries;                                   ///< Most recently used first
    std::map<CacheKey, EntryList::iterator> mapEntries;
    uint64_t nHits;
    uint64_t nMisses;
    mutable std::mutex cs_cache;
};

#endif // PROVCHAIN_CANON_CANON_CACHE_H
