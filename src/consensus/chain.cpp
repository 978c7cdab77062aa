// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <consensus/chain.h>
#include <storage/graph_db.h>
#include <util/logging.h>

CChainState::CChainState() : pdb(nullptr) {
}

bool CChainState::Initialize(const CBlock& genesis, CCoreError& error) {
    std::lock_guard<std::mutex> lock(cs_main);

    if (!vChain.empty()) {
        return true;
    }
    if (genesis.nIndex != 0 || !genesis.hashPrevBlock.IsNull()) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK, "genesis must have index 0 and a null previous hash", 0);
        return false;
    }

    if (pdb) {
        std::string db_error;
        if (!pdb->WriteBlock(genesis, db_error)) {
            error = CCoreError(CoreErrorKind::STORE, "cannot persist genesis: " + db_error, 0);
            return false;
        }
    }

    vChain.push_back(std::make_shared<const CBlock>(genesis));
    LogPrintChain(INFO, "Initialized chain with genesis %s", genesis.hashBlock.GetHex().c_str());
    return true;
}

bool CChainState::LoadFromDatabase(CCoreError& error) {
    if (!pdb) {
        error = CCoreError(CoreErrorKind::STORE, "no database attached");
        return false;
    }

    std::vector<CBlock> blocks;
    std::string db_error;
    if (!pdb->ReadBlocks(blocks, db_error)) {
        error = CCoreError(CoreErrorKind::STORE, "cannot load blocks: " + db_error);
        return false;
    }

    Snapshot loaded;
    loaded.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); i++) {
        if (blocks[i].nIndex != i) {
            error = CCoreError(CoreErrorKind::STORE,
                               "block record " + std::to_string(i) + " missing from database", i);
            return false;
        }
        loaded.push_back(std::make_shared<const CBlock>(blocks[i]));
    }

    uint64_t tip_index = 0;
    if (!loaded.empty() && (!pdb->ReadTipIndex(tip_index) || tip_index + 1 != loaded.size())) {
        LogPrintChain(WARN, "Stored tip does not match %zu loaded block records", loaded.size());
    }

    std::lock_guard<std::mutex> lock(cs_main);
    vChain.swap(loaded);
    LogPrintChain(INFO, "Loaded %zu blocks from database", vChain.size());
    return true;
}

bool CChainState::AppendBlock(const CBlock& block, CCoreError& error) {
    std::lock_guard<std::mutex> lock(cs_main);

    if (vChain.empty()) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK, "chain has no genesis block", block.nIndex);
        return false;
    }

    const CBlock& tip = *vChain.back();
    if (block.nIndex != tip.nIndex + 1) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK,
                           "expected index " + std::to_string(tip.nIndex + 1) +
                           ", got " + std::to_string(block.nIndex),
                           block.nIndex);
        LogPrintChain(WARN, "Rejected block %llu: %s",
                      static_cast<unsigned long long>(block.nIndex), error.message.c_str());
        return false;
    }
    if (block.hashPrevBlock != tip.hashBlock) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK,
                           "previous hash " + block.hashPrevBlock.GetHex() +
                           " does not match tip " + tip.hashBlock.GetHex(),
                           block.nIndex);
        LogPrintChain(WARN, "Rejected block %llu: previous hash mismatch",
                      static_cast<unsigned long long>(block.nIndex));
        return false;
    }
    if (block.hashBlock != block.ComputeHash()) {
        error = CCoreError(CoreErrorKind::INTEGRITY,
                           "block hash " + block.hashBlock.GetHex() + " does not cover the block fields",
                           block.nIndex);
        LogPrintChain(WARN, "Rejected block %llu: %s",
                      static_cast<unsigned long long>(block.nIndex), error.message.c_str());
        return false;
    }

    if (pdb) {
        std::string db_error;
        if (!pdb->WriteBlock(block, db_error)) {
            error = CCoreError(CoreErrorKind::STORE, "cannot persist block: " + db_error, block.nIndex);
            return false;
        }
    }

    vChain.push_back(std::make_shared<const CBlock>(block));
    LogPrintChain(INFO, "Appended block %llu hash=%s algorithm=%s",
                  static_cast<unsigned long long>(block.nIndex),
                  block.hashBlock.GetHex().c_str(), GetAlgorithmName(block.algorithm));
    return true;
}

std::shared_ptr<const CBlock> CChainState::GetTip() const {
    std::lock_guard<std::mutex> lock(cs_main);
    return vChain.empty() ? nullptr : vChain.back();
}

std::shared_ptr<const CBlock> CChainState::GetBlock(uint64_t index) const {
    std::lock_guard<std::mutex> lock(cs_main);
    return index < vChain.size() ? vChain[index] : nullptr;
}

int64_t CChainState::GetHeight() const {
    std::lock_guard<std::mutex> lock(cs_main);
    return static_cast<int64_t>(vChain.size()) - 1;
}

size_t CChainState::Size() const {
    std::lock_guard<std::mutex> lock(cs_main);
    return vChain.size();
}

CChainState::Snapshot CChainState::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(cs_main);
    return vChain;
}
