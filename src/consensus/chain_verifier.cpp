// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <consensus/chain_verifier.h>
#include <canon/canonicalizer.h>
#include <node/canon_worker_pool.h>
#include <node/genesis.h>
#include <rdf/graph.h>
#include <storage/graph_store.h>
#include <util/error_format.h>
#include <util/logging.h>

#include <atomic>
#include <future>
#include <limits>
#include <sstream>
#include <stdexcept>

std::string CValidationReport::ToString() const {
    std::stringstream s;
    s << "checked " << blocks_checked << " blocks, " << findings.size() << " findings";
    for (const CValidationFinding& f : findings) {
        s << "\n  block " << f.index << ": " << GetCoreErrorKindName(f.kind) << ": " << f.detail;
    }
    return s.str();
}

CChainVerifier::CChainVerifier(const CGraphStore& store, CCanonWorkerPool* pool,
                               const CCanonicalizationBudget& budget)
    : m_store(store), m_pool(pool), m_budget(budget) {
}

bool CChainVerifier::CheckLinkage(const CBlock& block, uint64_t position, const CBlock* prev,
                                  std::vector<CValidationFinding>& findings) const {
    size_t before = findings.size();

    if (block.nIndex != position) {
        findings.emplace_back(position, CoreErrorKind::CHAIN_LINK,
                              "block at position " + std::to_string(position) +
                              " carries index " + std::to_string(block.nIndex));
    }

    if (position == 0) {
        if (!Genesis::IsGenesisBlock(block)) {
            findings.emplace_back(position, CoreErrorKind::INTEGRITY,
                                  "genesis block does not match the fixed genesis parameters");
        }
    } else if (prev && block.hashPrevBlock != prev->hashBlock) {
        findings.emplace_back(position, CoreErrorKind::CHAIN_LINK,
                              "previous hash " + block.hashPrevBlock.GetHex() +
                              " does not match block " + std::to_string(position - 1) +
                              " hash " + prev->hashBlock.GetHex());
    }

    return findings.size() == before;
}

bool CChainVerifier::CheckIntegrity(const CBlock& block, std::vector<CValidationFinding>& findings) const {
    std::vector<CTriple> triples;
    std::string error;
    if (!m_store.TriplesInGraph(block.graphRef, triples, error)) {
        findings.emplace_back(block.nIndex, CoreErrorKind::STORE, error);
        return false;
    }

    uint256 canonical;
    try {
        CGraph graph(triples);
        canonical = CanonicalizeWith(graph, block.algorithm, m_budget);
    } catch (const CanonicalizationTimeout& e) {
        findings.emplace_back(block.nIndex, CoreErrorKind::CANONICALIZATION_TIMEOUT, e.what());
        return false;
    } catch (const SerializationError& e) {
        findings.emplace_back(block.nIndex, CoreErrorKind::SERIALIZATION, e.what());
        return false;
    }

    CBlock recomputed = block;
    recomputed.hashCanonical = canonical;
    uint256 block_hash = recomputed.ComputeHash();

    bool canonical_ok = (canonical == block.hashCanonical);
    bool block_ok = (block_hash == block.hashBlock);
    if (canonical_ok && block_ok) {
        return true;
    }

    std::string detail;
    if (!canonical_ok) {
        detail = "canonical hash " + canonical.GetHex() + " != recorded " + block.hashCanonical.GetHex();
    }
    if (!block_ok) {
        if (!detail.empty()) detail += "; ";
        detail += "block hash " + block_hash.GetHex() + " != recorded " + block.hashBlock.GetHex();
    }
    findings.emplace_back(block.nIndex, CoreErrorKind::INTEGRITY, detail);
    return false;
}

CValidationReport CChainVerifier::VerifyChain(const CChainState::Snapshot& chain, ValidationMode mode) const {
    CValidationReport report;
    const bool fail_fast = (mode == ValidationMode::FAIL_FAST);

    // Lowest position with a finding so far; later blocks may skip work in fail-fast mode
    std::atomic<uint64_t> first_failure{std::numeric_limits<uint64_t>::max()};
    auto note_failure = [&first_failure](uint64_t position) {
        uint64_t current = first_failure.load();
        while (position < current && !first_failure.compare_exchange_weak(current, position)) {
        }
    };

    auto check_block = [this, &chain, &note_failure, &first_failure, fail_fast](uint64_t position) {
        std::vector<CValidationFinding> findings;
        if (fail_fast && position > first_failure.load()) {
            return findings;
        }
        const CBlock& block = *chain[position];
        const CBlock* prev = position > 0 ? chain[position - 1].get() : nullptr;

        bool ok = CheckLinkage(block, position, prev, findings);
        // Genesis is never recomputed
        if (position > 0) {
            try {
                ok = CheckIntegrity(block, findings) && ok;
            } catch (const std::exception& e) {
                // Store or hashing fault: the block cannot be shown intact
                findings.emplace_back(position, CoreErrorKind::INTEGRITY,
                                      std::string("cannot recompute block: ") + e.what());
                ok = false;
            }
        }
        if (!ok) {
            note_failure(position);
        }
        return findings;
    };

    std::vector<std::future<std::vector<CValidationFinding>>> results;
    results.reserve(chain.size());
    for (uint64_t position = 0; position < chain.size(); position++) {
        if (m_pool) {
            results.push_back(m_pool->Submit([check_block, position]() { return check_block(position); }));
        } else {
            std::promise<std::vector<CValidationFinding>> inline_result;
            inline_result.set_value(check_block(position));
            results.push_back(inline_result.get_future());
        }
    }

    // Tasks reference this frame; none may still be running when it unwinds
    for (std::future<std::vector<CValidationFinding>>& result : results) {
        result.wait();
    }

    // Collect in index order
    bool stopped = false;
    for (uint64_t position = 0; position < results.size(); position++) {
        std::vector<CValidationFinding> findings = results[position].get();
        if (stopped) {
            continue;
        }
        report.blocks_checked++;
        if (findings.empty()) {
            continue;
        }
        for (const CValidationFinding& f : findings) {
            LogPrintValidation(WARN, "%s", CErrorFormatter::FormatForLog(
                CErrorFormatter::IntegrityError("block " + std::to_string(f.index),
                                                std::string(GetCoreErrorKindName(f.kind)) + ": " + f.detail)).c_str());
        }
        if (fail_fast) {
            report.findings.push_back(findings.front());
            stopped = true;
        } else {
            report.findings.insert(report.findings.end(), findings.begin(), findings.end());
        }
    }

    LogPrintValidation(INFO, "Chain validation (%s): %s",
                       fail_fast ? "fail-fast" : "collect-all", report.ToString().c_str());
    return report;
}
