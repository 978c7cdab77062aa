// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <node/ledger.h>
#include <node/genesis.h>
#include <rdf/graph.h>
#include <rdf/ntriples.h>
#include <storage/graph_db.h>
#include <storage/graph_store.h>
#include <util/config.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <future>
#include <thread>

CLedgerOptions::CLedgerOptions()
    : nWorkers(std::max(1u, std::thread::hardware_concurrency())),
      nCacheSize(DEFAULT_CACHE_SIZE) {
}

CLedgerOptions CLedgerOptions::FromConfig(const CConfigParser& config) {
    CLedgerOptions options;

    int64_t max_permutations = config.GetInt64("canonmaxpermutations",
                                               static_cast<int64_t>(options.budget.max_permutations));
    if (max_permutations >= 0) {
        options.budget.max_permutations = static_cast<uint64_t>(max_permutations);
    } else {
        LogPrintConfig(WARN, "Ignoring negative canonmaxpermutations=%lld", static_cast<long long>(max_permutations));
    }

    int64_t max_ms = config.GetInt64("canonmaxms", static_cast<int64_t>(options.budget.max_duration_ms));
    if (max_ms >= 0) {
        options.budget.max_duration_ms = max_ms;
    } else {
        LogPrintConfig(WARN, "Ignoring negative canonmaxms=%lld", static_cast<long long>(max_ms));
    }

    int64_t workers = config.GetInt64("workers", static_cast<int64_t>(options.nWorkers));
    if (workers > 0) {
        options.nWorkers = static_cast<size_t>(workers);
    }

    int64_t cache_size = config.GetInt64("canoncachesize", static_cast<int64_t>(options.nCacheSize));
    if (cache_size >= 0) {
        options.nCacheSize = static_cast<size_t>(cache_size);
    }

    options.datadir = config.GetString("datadir", "");
    return options;
}

bool InitLogging(const CConfigParser& config, const std::string& datadir, std::string& error) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();

    std::string level_name = config.GetString("loglevel", "info");
    LogLevel level;
    if (!ParseLogLevel(level_name, level)) {
        error = CErrorFormatter::FormatForUser(
            CErrorFormatter::ConfigError("loglevel", "unknown level '" + level_name + "'"));
        return false;
    }
    logging.SetLogLevel(level);

    std::vector<std::string> categories = config.GetList("logcategories");
    if (!categories.empty()) {
        uint32_t mask = 0;
        for (const std::string& name : categories) {
            LogCategory category;
            if (!ParseLogCategory(name, category)) {
                error = CErrorFormatter::FormatForUser(
                    CErrorFormatter::ConfigError("logcategories", "unknown category '" + name + "'"));
                return false;
            }
            mask |= static_cast<uint32_t>(category);
        }
        logging.SetCategoryMask(mask);
    }

    int64_t max_mb = config.GetInt64("logmaxsizemb", 10);
    int64_t max_files = config.GetInt64("logmaxfiles", 5);
    if (max_mb > 0 && max_files > 0) {
        logging.SetRotation(static_cast<size_t>(max_mb) * 1024 * 1024, static_cast<size_t>(max_files));
    } else {
        LogPrintConfig(WARN, "Ignoring non-positive log rotation settings");
    }

    logging.SetLogFile(config.GetString("logfile", ""));
    logging.SetConsoleLogging(config.GetBool("printtoconsole", true));

    if (!CLogger::GetInstance().Initialize(datadir)) {
        error = CErrorFormatter::FormatForUser(
            CErrorFormatter::ConfigError("logfile", "cannot open log file in " + datadir));
        return false;
    }
    return true;
}

CLedger::CLedger(CGraphStore& store, const CLedgerOptions& options)
    : m_store(store),
      m_pdb(dynamic_cast<CGraphDB*>(&store)),
      m_options(options),
      m_pool(options.nWorkers),
      m_cache(options.nCacheSize) {
}

CLedger::~CLedger() {
    Shutdown();
}

bool CLedger::Initialize(CCoreError& error) {
    if (!m_pool.IsRunning()) {
        m_pool.Start();
    }

    if (m_pdb) {
        m_chainstate.SetDatabase(m_pdb);
        if (!m_chainstate.LoadFromDatabase(error)) {
            return false;
        }
    }

    if (m_chainstate.Size() > 0) {
        LogPrintChain(INFO, "Ledger resumed at height %lld", static_cast<long long>(m_chainstate.GetHeight()));
        return true;
    }

    CBlock genesis = Genesis::CreateGenesisBlock();
    std::string store_error;
    if (!m_store.StoreGraph(genesis.graphRef, Genesis::GetGenesisTriples(), store_error)) {
        error = CCoreError(CoreErrorKind::STORE, "cannot store genesis graph: " + store_error, 0);
        return false;
    }
    return m_chainstate.Initialize(genesis, error);
}

void CLedger::Shutdown() {
    if (m_pool.IsRunning()) {
        m_pool.Stop();
    }
}

bool CLedger::CanonicalizeOnPool(const std::vector<CTriple>& triples, CCanonicalizationResult& result,
                                 CCoreError& error, uint64_t index) {
    const CCanonicalizationBudget budget = m_options.budget;
    CCanonicalizationCache* cache = &m_cache;
    std::future<CCanonicalizationResult> future = m_pool.Submit([&triples, budget, cache]() {
        return Canonicalize(CGraph(triples), budget, cache);
    });

    try {
        result = future.get();
    } catch (const CanonicalizationTimeout& e) {
        error = CCoreError(CoreErrorKind::CANONICALIZATION_TIMEOUT, e.what(), index);
        LogPrintCanon(WARN, "Block %llu: %s", static_cast<unsigned long long>(index), e.what());
        return false;
    } catch (const SerializationError& e) {
        error = CCoreError(CoreErrorKind::SERIALIZATION, e.what(), index);
        return false;
    }
    return true;
}

bool CLedger::CreateBlock(uint64_t index, const std::string& rdf_payload, const uint256& previous_hash,
                          CBlock& block, CCoreError& error) {
    std::vector<CTriple> triples;
    std::string parse_error;
    if (!ParseNTriples(rdf_payload, triples, parse_error)) {
        error = CCoreError(CoreErrorKind::SERIALIZATION, "malformed payload: " + parse_error, index);
        return false;
    }
    return CreateBlock(index, triples, previous_hash, block, error);
}

bool CLedger::CreateBlock(uint64_t index, const std::vector<CTriple>& triples, const uint256& previous_hash,
                          CBlock& block, CCoreError& error) {
    if (static_cast<int64_t>(index) <= m_chainstate.GetHeight()) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK,
                           "block " + std::to_string(index) + " already exists", index);
        return false;
    }
    for (const CTriple& triple : triples) {
        if (!triple.IsValid()) {
            error = CCoreError(CoreErrorKind::SERIALIZATION, "invalid triple in payload", index);
            return false;
        }
    }

    CCanonicalizationResult result;
    if (!CanonicalizeOnPool(triples, result, error, index)) {
        return false;
    }

    // Written only once canonicalization succeeded
    const std::string graph_id = GetBlockGraphId(index);
    {
        std::lock_guard<std::mutex> lock(cs_graphs);
        if (static_cast<int64_t>(index) <= m_chainstate.GetHeight()) {
            error = CCoreError(CoreErrorKind::CHAIN_LINK,
                               "block " + std::to_string(index) + " already exists", index);
            return false;
        }
        std::string store_error;
        if (!m_store.StoreGraph(graph_id, triples, store_error)) {
            error = CCoreError(CoreErrorKind::STORE,
                               CErrorFormatter::FormatForLog(CErrorFormatter::DatabaseError("store graph", store_error)),
                               index);
            return false;
        }
    }

    block.SetNull();
    block.nIndex = index;
    block.strTimestamp = FormatISO8601DateTime(GetTime());
    block.graphRef = graph_id;
    block.hashPrevBlock = previous_hash;
    block.hashCanonical = result.hash;
    block.algorithm = result.algorithm;
    block.hashBlock = block.ComputeHash();

    LogPrintChain(DEBUG, "Created block %llu (%s, %s, %lld us)",
                  static_cast<unsigned long long>(index), GetComplexityName(result.complexity),
                  GetAlgorithmName(result.algorithm), static_cast<long long>(result.execution_time_us));
    return true;
}

bool CLedger::CheckStoredGraph(const CBlock& block, CCoreError& error) {
    std::vector<CTriple> triples;
    std::string store_error;
    if (!m_store.TriplesInGraph(block.graphRef, triples, store_error)) {
        error = CCoreError(CoreErrorKind::STORE, store_error, block.nIndex);
        return false;
    }

    const CCanonicalizationBudget budget = m_options.budget;
    const CanonicalizationAlgorithm algorithm = block.algorithm;
    CCanonicalizationCache* cache = &m_cache;
    std::future<uint256> future = m_pool.Submit([&triples, algorithm, budget, cache]() {
        CGraph graph(triples);
        uint256 key = CCanonicalizationCache::GraphKey(graph);
        uint256 hash;
        if (!cache->Lookup(key, algorithm, hash)) {
            hash = CanonicalizeWith(graph, algorithm, budget);
            cache->Insert(key, algorithm, hash);
        }
        return hash;
    });

    uint256 canonical;
    try {
        canonical = future.get();
    } catch (const CanonicalizationTimeout& e) {
        error = CCoreError(CoreErrorKind::CANONICALIZATION_TIMEOUT, e.what(), block.nIndex);
        return false;
    } catch (const SerializationError& e) {
        error = CCoreError(CoreErrorKind::SERIALIZATION, e.what(), block.nIndex);
        return false;
    }

    if (canonical != block.hashCanonical) {
        error = CCoreError(CoreErrorKind::INTEGRITY,
                           "stored graph " + block.graphRef + " hashes to " + canonical.GetHex() +
                           ", block records " + block.hashCanonical.GetHex(),
                           block.nIndex);
        LogPrintChain(WARN, "Rejected block %llu: %s",
                      static_cast<unsigned long long>(block.nIndex), error.message.c_str());
        return false;
    }
    return true;
}

bool CLedger::AppendBlock(const CBlock& block, CCoreError& error) {
    std::lock_guard<std::mutex> lock(cs_graphs);
    if (!CheckStoredGraph(block, error)) {
        return false;
    }
    return m_chainstate.AppendBlock(block, error);
}

bool CLedger::AddBlock(const std::string& rdf_payload, CBlock& block, CCoreError& error) {
    std::vector<CTriple> triples;
    std::string parse_error;
    if (!ParseNTriples(rdf_payload, triples, parse_error)) {
        error = CCoreError(CoreErrorKind::SERIALIZATION, "malformed payload: " + parse_error,
                           static_cast<uint64_t>(m_chainstate.GetHeight() + 1));
        return false;
    }
    return AddBlock(triples, block, error);
}

bool CLedger::AddBlock(const std::vector<CTriple>& triples, CBlock& block, CCoreError& error) {
    std::lock_guard<std::mutex> lock(cs_writer);

    std::shared_ptr<const CBlock> tip = m_chainstate.GetTip();
    if (!tip) {
        error = CCoreError(CoreErrorKind::CHAIN_LINK, "ledger is not initialized");
        return false;
    }
    if (!CreateBlock(tip->nIndex + 1, triples, tip->hashBlock, block, error)) {
        return false;
    }
    return AppendBlock(block, error);
}

CValidationReport CLedger::ValidateChain(ValidationMode mode) const {
    CChainVerifier verifier(m_store, &m_pool, m_options.budget);
    CValidationReport report = verifier.VerifyChain(m_chainstate.GetSnapshot(), mode);
    if (report.IsValid()) {
        LogPrintValidation(INFO, "Chain valid (%zu blocks)", report.blocks_checked);
    } else {
        LogPrintValidation(WARN, "Chain invalid: %zu finding(s) in %zu blocks",
                           report.findings.size(), report.blocks_checked);
    }
    return report;
}

bool CLedger::CanonicalHashOf(const std::string& graph_id, CCanonicalizationResult& result, CCoreError& error) {
    std::vector<CTriple> triples;
    std::string store_error;
    if (!m_store.TriplesInGraph(graph_id, triples, store_error)) {
        error = CCoreError(CoreErrorKind::STORE, store_error);
        return false;
    }
    return CanonicalizeOnPool(triples, result, error, 0);
}

bool CLedger::CanonicalHashOf(const std::string& graph_id, uint256& hash, CCoreError& error) {
    CCanonicalizationResult result;
    if (!CanonicalHashOf(graph_id, result, error)) {
        return false;
    }
    hash = result.hash;
    return true;
}
