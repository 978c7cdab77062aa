// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/rdfc10.h>
#include <core/errors.h>
#include <crypto/sha256.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <algorithm>
#include <utility>

const std::string& CIdentifierIssuer::Issue(const std::string& id) {
    auto it = m_issued.find(id);
    if (it != m_issued.end()) {
        return it->second;
    }
    m_order.push_back(id);
    return m_issued.emplace(id, m_prefix + std::to_string(m_counter++)).first->second;
}

std::string CIdentifierIssuer::Get(const std::string& id) const {
    auto it = m_issued.find(id);
    return it == m_issued.end() ? std::string() : it->second;
}

/**
 * One pending Hash N-Degree Quads invocation.
 *
 * A frame walks its related-hash groups in order. Within a group it tries
 * each permutation of the related nodes; a permutation may need child
 * frames for nodes not yet labeled, which are pushed on the stack and
 * resumed here when they finish.
 */
struct CRDFC10Canonicalizer::NDegreeFrame {
    std::string identifier;
    CIdentifierIssuer issuer;
    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    size_t group_pos;
    std::string data;

    // Current group
    bool group_started;
    std::vector<std::string> perm;
    bool perm_pending;
    std::string chosen_path;
    bool has_chosen;
    CIdentifierIssuer chosen_issuer;

    // Current permutation
    bool perm_started;
    CIdentifierIssuer issuer_copy;
    std::string path;
    std::vector<std::string> recursion_list;
    size_t recursion_pos;

    NDegreeFrame(const std::string& id, const CIdentifierIssuer& iss)
        : identifier(id), issuer(iss), group_pos(0), group_started(false),
          perm_pending(false), has_chosen(false), perm_started(false), recursion_pos(0) {}

    /** True once path can no longer beat the chosen path */
    bool PathExceedsChosen() const {
        return has_chosen && path.size() >= chosen_path.size() && path > chosen_path;
    }
};

CRDFC10Canonicalizer::CRDFC10Canonicalizer(const CGraph& graph, const CCanonicalizationBudget& budget)
    : m_graph(graph), m_budget(budget), m_steps(0), m_labeled(false), m_canonicalIssuer("c14n") {
}

void CRDFC10Canonicalizer::ChargeStep(const char* what) {
    m_steps++;
    if (m_budget.max_permutations > 0 && m_steps > m_budget.max_permutations) {
        LogPrintCanon(WARN, "RDFC-1.0 budget exhausted after %llu steps (%s)",
                      static_cast<unsigned long long>(m_steps), what);
        throw CanonicalizationTimeout(
            strprintf("N-degree search exceeded %llu steps",
                      static_cast<unsigned long long>(m_budget.max_permutations)),
            m_steps);
    }
    if (m_budget.max_duration_ms > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
        if (elapsed > m_budget.max_duration_ms) {
            LogPrintCanon(WARN, "RDFC-1.0 time budget exhausted after %lld ms (%s)",
                          static_cast<long long>(elapsed), what);
            throw CanonicalizationTimeout(
                strprintf("N-degree search exceeded %lld ms",
                          static_cast<long long>(m_budget.max_duration_ms)),
                m_steps);
        }
    }
}

std::string CRDFC10Canonicalizer::HashFirstDegreeQuads(const std::string& id) const {
    std::vector<std::string> nquads;
    auto it = m_blankToQuads.find(id);
    if (it != m_blankToQuads.end()) {
        for (size_t index : it->second) {
            const CTriple& t = m_triples[index];
            auto render = [&id](const CTerm& term) {
                if (term.IsBlank()) {
                    return std::string(term.GetValue() == id ? "_:a" : "_:z");
                }
                return term.ToNTriples();
            };
            nquads.push_back(render(t.subject) + " " + t.predicate.ToNTriples() + " " +
                             render(t.object) + " .\n");
        }
    }
    std::sort(nquads.begin(), nquads.end());

    std::string joined;
    for (const std::string& line : nquads) joined += line;
    return SHA256Hex(joined);
}

std::string CRDFC10Canonicalizer::HashRelatedBlankNode(const std::string& related, const CTriple& quad,
                                                       const CIdentifierIssuer& issuer, char position) const {
    std::string identifier;
    if (m_canonicalIssuer.Has(related)) {
        identifier = "_:" + m_canonicalIssuer.Get(related);
    } else if (issuer.Has(related)) {
        identifier = "_:" + issuer.Get(related);
    } else {
        identifier = m_firstDegree.at(related);
    }

    std::string input(1, position);
    if (position != 'g') {
        input += "<" + quad.predicate.GetValue() + ">";
    }
    input += identifier;
    return SHA256Hex(input);
}

void CRDFC10Canonicalizer::BuildRelatedGroups(NDegreeFrame& frame) const {
    std::map<std::string, std::vector<std::string>> hash_to_related;
    auto it = m_blankToQuads.find(frame.identifier);
    if (it != m_blankToQuads.end()) {
        for (size_t index : it->second) {
            const CTriple& t = m_triples[index];
            if (t.subject.IsBlank() && t.subject.GetValue() != frame.identifier) {
                hash_to_related[HashRelatedBlankNode(t.subject.GetValue(), t, frame.issuer, 's')]
                    .push_back(t.subject.GetValue());
            }
            if (t.object.IsBlank() && t.object.GetValue() != frame.identifier) {
                hash_to_related[HashRelatedBlankNode(t.object.GetValue(), t, frame.issuer, 'o')]
                    .push_back(t.object.GetValue());
            }
        }
    }
    frame.groups.assign(hash_to_related.begin(), hash_to_related.end());
}

void CRDFC10Canonicalizer::HashNDegreeQuads(const std::string& id, const CIdentifierIssuer& issuer,
                                            std::string& hash, CIdentifierIssuer& result_issuer) {
    std::vector<NDegreeFrame> stack;
    ChargeStep("frame");
    stack.emplace_back(id, issuer);
    BuildRelatedGroups(stack.back());

    std::string child_hash;
    CIdentifierIssuer child_issuer;
    bool have_child_result = false;

    while (!stack.empty()) {
        NDegreeFrame& f = stack.back();

        if (have_child_result) {
            // Resume the permutation that was waiting on this child
            have_child_result = false;
            const std::string& related = f.recursion_list[f.recursion_pos];
            f.path += "_:" + f.issuer_copy.Issue(related);
            f.path += "<" + child_hash + ">";
            f.issuer_copy = child_issuer;
            f.recursion_pos++;
            if (f.PathExceedsChosen()) {
                f.perm_started = false;
            }
            continue;
        }

        if (f.perm_started) {
            if (f.recursion_pos < f.recursion_list.size()) {
                ChargeStep("frame");
                NDegreeFrame child(f.recursion_list[f.recursion_pos], f.issuer_copy);
                BuildRelatedGroups(child);
                stack.push_back(std::move(child));   // invalidates f
                continue;
            }
            if (!f.has_chosen || f.path < f.chosen_path) {
                f.chosen_path = f.path;
                f.chosen_issuer = f.issuer_copy;
                f.has_chosen = true;
            }
            f.perm_started = false;
            continue;
        }

        if (f.group_started) {
            if (f.perm_pending) {
                ChargeStep("permutation");
                f.issuer_copy = f.issuer;
                f.path.clear();
                f.recursion_list.clear();
                f.recursion_pos = 0;

                bool skip = false;
                for (const std::string& related : f.perm) {
                    if (m_canonicalIssuer.Has(related)) {
                        f.path += "_:" + m_canonicalIssuer.Get(related);
                    } else {
                        if (!f.issuer_copy.Has(related)) {
                            f.recursion_list.push_back(related);
                        }
                        f.path += "_:" + f.issuer_copy.Issue(related);
                    }
                    if (f.PathExceedsChosen()) {
                        skip = true;
                        break;
                    }
                }
                f.perm_pending = std::next_permutation(f.perm.begin(), f.perm.end());
                f.perm_started = !skip;
                continue;
            }

            // All permutations of this group examined
            f.data += f.chosen_path;
            f.issuer = f.chosen_issuer;
            f.group_started = false;
            f.group_pos++;
            continue;
        }

        if (f.group_pos < f.groups.size()) {
            f.data += f.groups[f.group_pos].first;
            f.perm = f.groups[f.group_pos].second;
            std::sort(f.perm.begin(), f.perm.end());
            f.perm_pending = true;
            f.has_chosen = false;
            f.chosen_path.clear();
            f.group_started = true;
            continue;
        }

        // Frame complete, hand the result to the parent
        child_hash = SHA256Hex(f.data);
        child_issuer = f.issuer;
        stack.pop_back();
        have_child_result = true;
    }

    hash = child_hash;
    result_issuer = child_issuer;
}

const std::map<std::string, std::string>& CRDFC10Canonicalizer::IssueCanonicalLabels() {
    if (m_labeled) {
        return m_labels;
    }
    m_start = std::chrono::steady_clock::now();

    m_triples = m_graph.GetTriples();
    for (size_t i = 0; i < m_triples.size(); i++) {
        const CTriple& t = m_triples[i];
        if (t.subject.IsBlank()) {
            m_blankToQuads[t.subject.GetValue()].push_back(i);
        }
        if (t.object.IsBlank() && !(t.subject.IsBlank() && t.subject.GetValue() == t.object.GetValue())) {
            m_blankToQuads[t.object.GetValue()].push_back(i);
        }
    }

    // First-degree hashes
    std::map<std::string, std::vector<std::string>> hash_to_blank;
    for (const auto& entry : m_blankToQuads) {
        std::string hash = HashFirstDegreeQuads(entry.first);
        m_firstDegree[entry.first] = hash;
        hash_to_blank[hash].push_back(entry.first);
    }

    // Unique first-degree hashes get canonical labels immediately
    for (auto it = hash_to_blank.begin(); it != hash_to_blank.end();) {
        if (it->second.size() == 1) {
            m_canonicalIssuer.Issue(it->second.front());
            it = hash_to_blank.erase(it);
        } else {
            ++it;
        }
    }

    // Shared hashes are resolved through N-degree hashing
    for (const auto& entry : hash_to_blank) {
        std::vector<std::pair<std::string, CIdentifierIssuer>> hash_path_list;
        for (const std::string& id : entry.second) {
            if (m_canonicalIssuer.Has(id)) {
                continue;
            }
            CIdentifierIssuer temporary("b");
            temporary.Issue(id);
            std::string hash;
            CIdentifierIssuer result_issuer;
            HashNDegreeQuads(id, temporary, hash, result_issuer);
            hash_path_list.emplace_back(hash, result_issuer);
        }
        std::stable_sort(hash_path_list.begin(), hash_path_list.end(),
                         [](const std::pair<std::string, CIdentifierIssuer>& a,
                            const std::pair<std::string, CIdentifierIssuer>& b) {
                             return a.first < b.first;
                         });
        for (const auto& result : hash_path_list) {
            for (const std::string& existing : result.second.GetIssueOrder()) {
                m_canonicalIssuer.Issue(existing);
            }
        }
    }

    for (const std::string& id : m_canonicalIssuer.GetIssueOrder()) {
        m_labels[id] = m_canonicalIssuer.Get(id);
    }
    m_labeled = true;

    LogPrintCanon(DEBUG, "RDFC-1.0 labeled %zu blank nodes in %llu steps",
                  m_labels.size(), static_cast<unsigned long long>(m_steps));
    return m_labels;
}

std::string CRDFC10Canonicalizer::ToNQuads() {
    const std::map<std::string, std::string>& labels = IssueCanonicalLabels();

    auto relabel = [&labels](const CTerm& term) {
        if (term.IsBlank()) {
            return CTerm::Blank(labels.at(term.GetValue()));
        }
        return term;
    };

    std::vector<std::string> lines;
    lines.reserve(m_triples.size());
    for (const CTriple& t : m_triples) {
        CTriple canonical(relabel(t.subject), t.predicate, relabel(t.object));
        lines.push_back(canonical.ToNTriples() + "\n");
    }
    std::sort(lines.begin(), lines.end());

    std::string out;
    for (const std::string& line : lines) out += line;
    return out;
}

uint256 CRDFC10Canonicalizer::Hash() {
    return HashSHA256(ToNQuads());
}

std::string CanonicalizeToNQuads(const CGraph& graph, const CCanonicalizationBudget& budget) {
    CRDFC10Canonicalizer canonicalizer(graph, budget);
    return canonicalizer.ToNQuads();
}

uint256 CanonicalizeRDFC10(const CGraph& graph, const CCanonicalizationBudget& budget) {
    CRDFC10Canonicalizer canonicalizer(graph, budget);
    return canonicalizer.Hash();
}
