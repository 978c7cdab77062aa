// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

/**
 * Ledger Tests
 *
 * End-to-end block creation, concurrent appends, validation and
 * persistence through the LevelDB graph database
 */

#include <boost/test/unit_test.hpp>

#include <node/genesis.h>
#include <node/ledger.h>
#include <rdf/graph.h>
#include <rdf/ntriples.h>
#include <storage/graph_db.h>
#include <storage/graph_store.h>
#include <util/time.h>

#include <atomic>
#include <ctime>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

BOOST_AUTO_TEST_SUITE(ledger_tests)

// ============================================================================
// Helper Functions
// ============================================================================

static CLedgerOptions TestOptions() {
    CLedgerOptions options;
    options.nWorkers = 4;
    return options;
}

static std::string ActivityPayload(int n) {
    return "_:act <http://www.w3.org/ns/prov#used> <http://example.org/batch/" + std::to_string(n) + "> .\n"
           "_:act <http://www.w3.org/ns/prov#startedAtTime> \"2025-05-0" + std::to_string(n % 9 + 1) + "\" .\n";
}

static const char* const MUTUAL_PAYLOAD =
    "_:x <http://example.org/knows> _:y .\n"
    "_:y <http://example.org/knows> _:x .\n";

static std::string MakeTestDataDir() {
    static int counter = 0;
    return std::filesystem::temp_directory_path().string() + "/provchain_ledger_" +
           std::to_string(getpid()) + "_" + std::to_string(time(nullptr)) + "_" + std::to_string(counter++);
}

/**
 * Test Suite 1: Block creation
 */
BOOST_AUTO_TEST_SUITE(block_creation_tests)

BOOST_AUTO_TEST_CASE(initialize_installs_genesis) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE_MESSAGE(ledger.Initialize(error), error.ToString());

    BOOST_CHECK_EQUAL(ledger.GetHeight(), 0);
    BOOST_CHECK(ledger.GetTip()->hashBlock == Genesis::GetGenesisHash());
    BOOST_CHECK(store.HasGraph(GetBlockGraphId(0)));
    BOOST_CHECK(ledger.ValidateChain().IsValid());
}

BOOST_AUTO_TEST_CASE(add_block_links_to_tip) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_REQUIRE_MESSAGE(ledger.AddBlock(ActivityPayload(1), block, error), error.ToString());
    BOOST_CHECK_EQUAL(block.nIndex, 1U);
    BOOST_CHECK(block.hashPrevBlock == Genesis::GetGenesisHash());
    BOOST_CHECK_EQUAL(block.graphRef, GetBlockGraphId(1));
    BOOST_CHECK(block.algorithm == CanonicalizationAlgorithm::CUSTOM);
    BOOST_CHECK(block.hashBlock == block.ComputeHash());

    int64_t when = 0;
    BOOST_CHECK(ParseISO8601DateTime(block.strTimestamp, when));

    CBlock second;
    BOOST_REQUIRE(ledger.AddBlock(MUTUAL_PAYLOAD, second, error));
    BOOST_CHECK(second.algorithm == CanonicalizationAlgorithm::RDFC10);
    BOOST_CHECK(second.hashPrevBlock == block.hashBlock);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 2);
}

BOOST_AUTO_TEST_CASE(create_then_append) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_REQUIRE(ledger.CreateBlock(1, ActivityPayload(1), ledger.GetTip()->hashBlock, block, error));
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 0);
    BOOST_REQUIRE(ledger.AppendBlock(block, error));
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 1);

    // Index already in the chain
    CBlock duplicate;
    BOOST_CHECK(!ledger.CreateBlock(1, ActivityPayload(2), block.hashBlock, duplicate, error));
    BOOST_CHECK(error.kind == CoreErrorKind::CHAIN_LINK);

    // Built on a stale tip
    CBlock stale;
    BOOST_REQUIRE(ledger.CreateBlock(2, ActivityPayload(2), Genesis::GetGenesisHash(), stale, error));
    BOOST_CHECK(!ledger.AppendBlock(stale, error));
    BOOST_CHECK(error.kind == CoreErrorKind::CHAIN_LINK);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 1);
}

BOOST_AUTO_TEST_CASE(malformed_payload_is_rejected) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_CHECK(!ledger.AddBlock("<http://example.org/a> <http://example.org/p> \"unterminated .\n", block, error));
    BOOST_CHECK(error.kind == CoreErrorKind::SERIALIZATION);
    BOOST_CHECK(error.message.find("line 1") != std::string::npos);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 0);

    std::vector<CTriple> bad = {CTriple(CTerm::Literal("s"), CTerm::Iri("http://example.org/p"), CTerm::Literal("o"))};
    BOOST_CHECK(!ledger.AddBlock(bad, block, error));
    BOOST_CHECK(error.kind == CoreErrorKind::SERIALIZATION);
}

BOOST_AUTO_TEST_CASE(budget_exhaustion_rejects_block) {
    CMemoryGraphStore store;
    CLedgerOptions options = TestOptions();
    options.budget = CCanonicalizationBudget(1, 0);
    CLedger ledger(store, options);
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_CHECK(!ledger.AddBlock(MUTUAL_PAYLOAD, block, error));
    BOOST_CHECK(error.kind == CoreErrorKind::CANONICALIZATION_TIMEOUT);
    BOOST_CHECK_EQUAL(error.index, 1U);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 0);

    // Moderate graphs never need the budget
    BOOST_CHECK(ledger.AddBlock(ActivityPayload(1), block, error));
}

BOOST_AUTO_TEST_CASE(failed_create_leaves_pending_block_intact) {
    CMemoryGraphStore store;
    CLedgerOptions options = TestOptions();
    options.budget = CCanonicalizationBudget(1, 0);
    CLedger ledger(store, options);
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    const uint256 genesis_hash = ledger.GetTip()->hashBlock;
    CBlock pending;
    BOOST_REQUIRE_MESSAGE(ledger.CreateBlock(1, ActivityPayload(1), genesis_hash, pending, error), error.ToString());

    // Same index, payload that exceeds the budget
    CBlock timed_out;
    BOOST_CHECK(!ledger.CreateBlock(1, MUTUAL_PAYLOAD, genesis_hash, timed_out, error));
    BOOST_CHECK(error.kind == CoreErrorKind::CANONICALIZATION_TIMEOUT);

    // Same index, term that cannot be serialized
    std::vector<CTriple> unserializable = {
        CTriple(CTerm::Iri("http://example.org/s"), CTerm::Iri("http://example.org/p"), CTerm::LangLiteral("x", ""))};
    CBlock bad;
    BOOST_CHECK(!ledger.CreateBlock(1, unserializable, genesis_hash, bad, error));
    BOOST_CHECK(error.kind == CoreErrorKind::SERIALIZATION);

    std::vector<CTriple> stored;
    std::string store_error;
    BOOST_REQUIRE(store.TriplesInGraph(GetBlockGraphId(1), stored, store_error));
    std::vector<CTriple> expected;
    BOOST_REQUIRE(ParseNTriples(ActivityPayload(1), expected, store_error));
    BOOST_CHECK(CGraph(stored) == CGraph(expected));

    BOOST_REQUIRE_MESSAGE(ledger.AppendBlock(pending, error), error.ToString());
    CValidationReport report = ledger.ValidateChain();
    BOOST_CHECK_MESSAGE(report.IsValid(), report.ToString());
}

BOOST_AUTO_TEST_CASE(append_rejects_block_whose_graph_was_replaced) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    const uint256 genesis_hash = ledger.GetTip()->hashBlock;
    CBlock first;
    CBlock second;
    BOOST_REQUIRE(ledger.CreateBlock(1, ActivityPayload(1), genesis_hash, first, error));
    BOOST_REQUIRE(ledger.CreateBlock(1, ActivityPayload(2), genesis_hash, second, error));

    // The graph of index 1 now belongs to the second candidate
    BOOST_CHECK(!ledger.AppendBlock(first, error));
    BOOST_CHECK(error.kind == CoreErrorKind::INTEGRITY);
    BOOST_CHECK_EQUAL(error.index, 1U);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 0);

    BOOST_REQUIRE_MESSAGE(ledger.AppendBlock(second, error), error.ToString());
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 1);
    BOOST_CHECK(ledger.ValidateChain().IsValid());
}

BOOST_AUTO_TEST_CASE(canonical_hash_of_stored_graphs) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    std::vector<CTriple> a, b;
    std::string parse_error;
    BOOST_REQUIRE(ParseNTriples(MUTUAL_PAYLOAD, a, parse_error));
    BOOST_REQUIRE(ParseNTriples("_:m <http://example.org/knows> _:n .\n"
                                "_:n <http://example.org/knows> _:m .\n", b, parse_error));
    std::string store_error;
    BOOST_REQUIRE(store.StoreGraph("http://example.org/graph/a", a, store_error));
    BOOST_REQUIRE(store.StoreGraph("http://example.org/graph/b", b, store_error));

    CCanonicalizationResult result_a, result_b;
    BOOST_REQUIRE(ledger.CanonicalHashOf("http://example.org/graph/a", result_a, error));
    BOOST_REQUIRE(ledger.CanonicalHashOf("http://example.org/graph/b", result_b, error));
    BOOST_CHECK(result_a.hash == result_b.hash);
    BOOST_CHECK(result_a.complexity == GraphComplexity::PATHOLOGICAL);

    uint256 hash;
    BOOST_CHECK(!ledger.CanonicalHashOf("http://example.org/graph/missing", hash, error));
    BOOST_CHECK(error.kind == CoreErrorKind::STORE);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Validation and concurrency
 */
BOOST_AUTO_TEST_SUITE(ledger_validation_tests)

BOOST_AUTO_TEST_CASE(corrupted_graph_detected) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_REQUIRE(ledger.AddBlock(ActivityPayload(1), block, error));
    BOOST_REQUIRE(ledger.AddBlock(ActivityPayload(2), block, error));
    BOOST_CHECK(ledger.ValidateChain().IsValid());

    std::vector<CTriple> tampered;
    std::string text_error;
    BOOST_REQUIRE(ParseNTriples(ActivityPayload(7), tampered, text_error));
    BOOST_REQUIRE(store.StoreGraph(GetBlockGraphId(1), tampered, text_error));

    CValidationReport report = ledger.ValidateChain();
    BOOST_REQUIRE_EQUAL(report.findings.size(), 1U);
    BOOST_CHECK_EQUAL(report.findings[0].index, 1U);
    BOOST_CHECK(report.findings[0].kind == CoreErrorKind::INTEGRITY);
}

BOOST_AUTO_TEST_CASE(validation_bypasses_cache) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    CBlock block;
    BOOST_REQUIRE(ledger.AddBlock(ActivityPayload(1), block, error));
    BOOST_CHECK_EQUAL(ledger.GetCache().Size(), 1U);

    uint64_t hits = ledger.GetCache().GetHits();
    uint64_t misses = ledger.GetCache().GetMisses();
    BOOST_CHECK(ledger.ValidateChain(ValidationMode::FAIL_FAST).IsValid());
    BOOST_CHECK_EQUAL(ledger.GetCache().GetHits(), hits);
    BOOST_CHECK_EQUAL(ledger.GetCache().GetMisses(), misses);
}

BOOST_AUTO_TEST_CASE(concurrent_appends_form_one_chain) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    const int num_threads = 4;
    const int blocks_per_thread = 5;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&ledger, &failures, t, blocks_per_thread]() {
            for (int i = 0; i < blocks_per_thread; i++) {
                CBlock block;
                CCoreError thread_error;
                const char* payload = (i % 2 == 0) ? MUTUAL_PAYLOAD : nullptr;
                bool ok = payload ? ledger.AddBlock(payload, block, thread_error)
                                  : ledger.AddBlock(ActivityPayload(t * 10 + i), block, thread_error);
                if (!ok) failures++;
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), num_threads * blocks_per_thread);

    CChainState::Snapshot chain = ledger.GetSnapshot();
    for (size_t i = 1; i < chain.size(); i++) {
        BOOST_CHECK_EQUAL(chain[i]->nIndex, i);
        BOOST_CHECK(chain[i]->hashPrevBlock == chain[i - 1]->hashBlock);
    }
    BOOST_CHECK(ledger.ValidateChain().IsValid());
}

BOOST_AUTO_TEST_CASE(reads_during_appends_see_consistent_prefix) {
    CMemoryGraphStore store;
    CLedger ledger(store, TestOptions());
    CCoreError error;
    BOOST_REQUIRE(ledger.Initialize(error));

    std::atomic<bool> done{false};
    std::atomic<int> broken{0};
    std::thread reader([&ledger, &done, &broken]() {
        while (!done.load()) {
            CChainState::Snapshot chain = ledger.GetSnapshot();
            for (size_t i = 1; i < chain.size(); i++) {
                if (chain[i]->hashPrevBlock != chain[i - 1]->hashBlock) broken++;
            }
        }
    });

    for (int i = 0; i < 10; i++) {
        CBlock block;
        BOOST_CHECK(ledger.AddBlock(ActivityPayload(i), block, error));
    }
    done.store(true);
    reader.join();

    BOOST_CHECK_EQUAL(broken.load(), 0);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 10);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: Persistence
 */
BOOST_AUTO_TEST_SUITE(ledger_persistence_tests)

BOOST_AUTO_TEST_CASE(chain_reloads_from_database) {
    std::string datadir = MakeTestDataDir();
    std::string db_error;
    CCoreError error;
    uint256 tip_hash;

    {
        CGraphDB db;
        BOOST_REQUIRE_MESSAGE(db.Open(datadir, db_error), db_error);
        CLedger ledger(db, TestOptions());
        BOOST_REQUIRE_MESSAGE(ledger.Initialize(error), error.ToString());

        CBlock block;
        BOOST_REQUIRE(ledger.AddBlock(ActivityPayload(1), block, error));
        BOOST_REQUIRE(ledger.AddBlock(MUTUAL_PAYLOAD, block, error));
        tip_hash = block.hashBlock;
        ledger.Shutdown();
    }

    {
        CGraphDB db;
        BOOST_REQUIRE_MESSAGE(db.Open(datadir, db_error, false), db_error);
        CLedger ledger(db, TestOptions());
        BOOST_REQUIRE_MESSAGE(ledger.Initialize(error), error.ToString());

        BOOST_CHECK_EQUAL(ledger.GetHeight(), 2);
        BOOST_CHECK(ledger.GetTip()->hashBlock == tip_hash);
        BOOST_CHECK(ledger.GetTip()->algorithm == CanonicalizationAlgorithm::RDFC10);

        CValidationReport report = ledger.ValidateChain();
        BOOST_CHECK_MESSAGE(report.IsValid(), report.ToString());

        CBlock block;
        BOOST_REQUIRE(ledger.AddBlock(ActivityPayload(3), block, error));
        BOOST_CHECK_EQUAL(block.nIndex, 3U);
        BOOST_CHECK(block.hashPrevBlock == tip_hash);
    }

    std::error_code ec;
    std::filesystem::remove_all(datadir, ec);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
