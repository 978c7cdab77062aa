// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <storage/graph_store.h>

bool CMemoryGraphStore::StoreGraph(const std::string& graph_id, const std::vector<CTriple>& triples,
                                   std::string& error) {
    if (graph_id.empty()) {
        error = "empty graph id";
        return false;
    }
    std::lock_guard<std::mutex> lock(cs_store);
    mapGraphs[graph_id] = triples;
    return true;
}

bool CMemoryGraphStore::TriplesInGraph(const std::string& graph_id, std::vector<CTriple>& triples,
                                       std::string& error) const {
    std::lock_guard<std::mutex> lock(cs_store);
    auto it = mapGraphs.find(graph_id);
    if (it == mapGraphs.end()) {
        error = "graph not found: " + graph_id;
        return false;
    }
    triples = it->second;
    return true;
}

bool CMemoryGraphStore::HasGraph(const std::string& graph_id) const {
    std::lock_guard<std::mutex> lock(cs_store);
    return mapGraphs.count(graph_id) != 0;
}

size_t CMemoryGraphStore::GetGraphCount() const {
    std::lock_guard<std::mutex> lock(cs_store);
    return mapGraphs.size();
}
