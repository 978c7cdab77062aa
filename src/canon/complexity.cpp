// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/complexity.h>

#include <algorithm>
#include <map>
#include <numeric>
#include <string>
#include <tuple>
#include <vector>

const char* GetComplexityName(GraphComplexity complexity) {
    switch (complexity) {
        case GraphComplexity::SIMPLE: return "simple";
        case GraphComplexity::MODERATE: return "moderate";
        case GraphComplexity::COMPLEX: return "complex";
        case GraphComplexity::PATHOLOGICAL: return "pathological";
    }
    return "unknown";
}

namespace {

bool IsBlankEdge(const CTriple& triple) {
    return triple.subject.IsBlank() && triple.object.IsBlank();
}

class CDisjointSet {
public:
    explicit CDisjointSet(size_t n) : parent(n) {
        std::iota(parent.begin(), parent.end(), 0);
    }

    size_t Find(size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }

    /** @return false if a and b were already joined */
    bool Union(size_t a, size_t b) {
        a = Find(a);
        b = Find(b);
        if (a == b) return false;
        parent[b] = a;
        return true;
    }

private:
    std::vector<size_t> parent;
};

} // namespace

bool HasBlankNodeCycle(const CGraph& graph) {
    std::map<std::string, size_t> index;
    for (const std::string& id : graph.BlankNodes()) {
        size_t next = index.size();
        index.emplace(id, next);
    }

    CDisjointSet sets(index.size());
    for (const CTriple& triple : graph) {
        if (!IsBlankEdge(triple)) continue;
        size_t s = index[triple.subject.GetValue()];
        size_t o = index[triple.object.GetValue()];
        if (s == o || !sets.Union(s, o)) {
            return true;
        }
    }
    return false;
}

bool HasBlankNodeSymmetry(const CGraph& graph) {
    std::map<std::string, size_t> index;
    for (const std::string& id : graph.BlankNodes()) {
        size_t next = index.size();
        index.emplace(id, next);
    }
    const size_t n = index.size();
    if (n < 2) return false;

    // Ground edges: (direction, predicate, ground term) per blank node.
    // Blank edges: (direction, predicate, neighbour) per blank node.
    typedef std::tuple<int, std::string, std::string> GroundEdge;
    typedef std::tuple<int, std::string, size_t> BlankEdge;
    std::vector<std::vector<GroundEdge>> ground(n);
    std::vector<std::vector<BlankEdge>> blank(n);

    for (const CTriple& triple : graph) {
        const std::string& p = triple.predicate.GetValue();
        if (IsBlankEdge(triple)) {
            size_t s = index[triple.subject.GetValue()];
            size_t o = index[triple.object.GetValue()];
            blank[s].emplace_back(0, p, o);
            blank[o].emplace_back(1, p, s);
        } else if (triple.subject.IsBlank()) {
            // Key on the structural identity of the ground term
            const CTerm& obj = triple.object;
            ground[index[triple.subject.GetValue()]].emplace_back(
                0, p, std::to_string(static_cast<int>(obj.GetType())) + obj.GetValue() + "|" +
                      obj.GetDatatype() + "|" + obj.GetLanguage());
        } else if (triple.object.IsBlank()) {
            ground[index[triple.object.GetValue()]].emplace_back(1, p, triple.subject.GetValue());
        }
    }

    // Initial colours from the ground neighbourhood
    std::vector<size_t> color(n);
    {
        std::map<std::vector<GroundEdge>, size_t> palette;
        for (size_t i = 0; i < n; i++) {
            std::sort(ground[i].begin(), ground[i].end());
            // Blank-edge shape without neighbour identity
            std::vector<GroundEdge> sig = ground[i];
            for (const BlankEdge& e : blank[i]) {
                sig.emplace_back(std::get<0>(e) + 2, std::get<1>(e), "");
            }
            std::sort(sig.begin(), sig.end());
            auto it = palette.emplace(sig, palette.size()).first;
            color[i] = it->second;
        }
    }

    // Refine until the partition stops splitting
    size_t classes = 0;
    for (size_t round = 0; round <= n; round++) {
        typedef std::pair<size_t, std::vector<std::tuple<int, std::string, size_t>>> Signature;
        std::map<Signature, size_t> palette;
        std::vector<size_t> next(n);
        for (size_t i = 0; i < n; i++) {
            Signature sig;
            sig.first = color[i];
            for (const BlankEdge& e : blank[i]) {
                sig.second.emplace_back(std::get<0>(e), std::get<1>(e), color[std::get<2>(e)]);
            }
            std::sort(sig.second.begin(), sig.second.end());
            auto it = palette.emplace(sig, palette.size()).first;
            next[i] = it->second;
        }
        color.swap(next);
        if (palette.size() == classes) break;
        classes = palette.size();
    }

    return classes < n;
}

GraphComplexity ClassifyGraph(const CGraph& graph) {
    bool has_blank = false;
    bool has_blank_edge = false;
    for (const CTriple& triple : graph) {
        if (triple.subject.IsBlank() || triple.object.IsBlank()) has_blank = true;
        if (IsBlankEdge(triple)) {
            has_blank_edge = true;
            break;
        }
    }

    if (!has_blank) return GraphComplexity::SIMPLE;
    if (!has_blank_edge) return GraphComplexity::MODERATE;
    if (HasBlankNodeCycle(graph) || HasBlankNodeSymmetry(graph)) {
        return GraphComplexity::PATHOLOGICAL;
    }
    return GraphComplexity::COMPLEX;
}
