// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

/**
 * Graph Store Tests
 *
 * In-memory store, LevelDB graph database, record framing and block records
 */

#include <boost/test/unit_test.hpp>

#include <crypto/sha256.h>
#include <db/db_errors.h>
#include <node/genesis.h>
#include <primitives/block.h>
#include <rdf/graph.h>
#include <storage/graph_db.h>
#include <storage/graph_store.h>

#include <ctime>
#include <fstream>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

BOOST_AUTO_TEST_SUITE(graph_db_tests)

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Unique temporary directory for a test database
 * (caller responsible for cleanup)
 */
static std::string MakeTestDBPath(const std::string& name) {
    static int counter = 0;
    return std::filesystem::temp_directory_path().string() + "/provchain_" + name + "_" +
           std::to_string(getpid()) + "_" + std::to_string(time(nullptr)) + "_" + std::to_string(counter++);
}

static void CleanupTestDB(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

static std::vector<CTriple> SampleTriples() {
    CTerm p = CTerm::Iri("http://example.org/p");
    return {CTriple(CTerm::Iri("http://example.org/s"), p, CTerm::LangLiteral("v", "en")),
            CTriple(CTerm::Blank("b0"), p, CTerm::Literal("multi\nline")),
            CTriple(CTerm::Blank("b0"), p, CTerm::Blank("b1"))};
}

static CBlock SampleBlock(uint64_t index, const uint256& prev) {
    CBlock block;
    block.nIndex = index;
    block.strTimestamp = "2025-06-01T12:00:00Z";
    block.graphRef = GetBlockGraphId(index);
    block.hashPrevBlock = prev;
    block.hashCanonical = HashSHA256("canonical " + std::to_string(index));
    block.algorithm = CanonicalizationAlgorithm::RDFC10;
    block.hashBlock = block.ComputeHash();
    return block;
}

/**
 * Test Suite 1: In-memory store
 */
BOOST_AUTO_TEST_SUITE(memory_store_tests)

BOOST_AUTO_TEST_CASE(store_and_fetch) {
    CMemoryGraphStore store;
    std::string error;

    BOOST_CHECK(!store.HasGraph("http://provchain.org/block/1"));
    BOOST_REQUIRE(store.StoreGraph("http://provchain.org/block/1", SampleTriples(), error));
    BOOST_CHECK(store.HasGraph("http://provchain.org/block/1"));
    BOOST_CHECK_EQUAL(store.GetGraphCount(), 1U);

    std::vector<CTriple> fetched;
    BOOST_REQUIRE(store.TriplesInGraph("http://provchain.org/block/1", fetched, error));
    BOOST_CHECK(CGraph(fetched) == CGraph(SampleTriples()));
}

BOOST_AUTO_TEST_CASE(store_replaces_content) {
    CMemoryGraphStore store;
    std::string error;
    BOOST_REQUIRE(store.StoreGraph("g", SampleTriples(), error));
    BOOST_REQUIRE(store.StoreGraph("g", std::vector<CTriple>(), error));

    std::vector<CTriple> fetched;
    BOOST_REQUIRE(store.TriplesInGraph("g", fetched, error));
    BOOST_CHECK(fetched.empty());
}

BOOST_AUTO_TEST_CASE(missing_graph_is_an_error) {
    CMemoryGraphStore store;
    std::vector<CTriple> fetched;
    std::string error;
    BOOST_CHECK(!store.TriplesInGraph("nope", fetched, error));
    BOOST_CHECK(!error.empty());
    BOOST_CHECK(!store.StoreGraph("", SampleTriples(), error));
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Record framing
 */
BOOST_AUTO_TEST_SUITE(framing_tests)

BOOST_AUTO_TEST_CASE(frame_roundtrip) {
    std::string data = "payload";
    std::string framed = FrameRecord(data);
    BOOST_CHECK_EQUAL(framed.size(), data.size() + 8 + 32);

    std::string out, error;
    BOOST_CHECK(UnframeRecord(framed, out, error));
    BOOST_CHECK_EQUAL(out, data);
}

BOOST_AUTO_TEST_CASE(frame_detects_corruption) {
    std::string framed = FrameRecord("payload");
    std::string out, error;

    std::string flipped = framed;
    flipped[9] ^= 0x01;
    BOOST_CHECK(!UnframeRecord(flipped, out, error));
    BOOST_CHECK(error.find("checksum") != std::string::npos);

    BOOST_CHECK(!UnframeRecord(framed.substr(0, framed.size() - 1), out, error));
    BOOST_CHECK(!UnframeRecord("short", out, error));

    std::string wrong_version = framed;
    wrong_version[0] = 9;
    BOOST_CHECK(!UnframeRecord(wrong_version, out, error));
}

BOOST_AUTO_TEST_CASE(block_record_roundtrip) {
    CBlock block = SampleBlock(3, HashSHA256("prev"));
    CBlock decoded;
    std::string error;
    BOOST_REQUIRE(DeserializeBlockRecord(SerializeBlockRecord(block), decoded, error));

    BOOST_CHECK_EQUAL(decoded.nIndex, block.nIndex);
    BOOST_CHECK_EQUAL(decoded.strTimestamp, block.strTimestamp);
    BOOST_CHECK_EQUAL(decoded.graphRef, block.graphRef);
    BOOST_CHECK(decoded.hashPrevBlock == block.hashPrevBlock);
    BOOST_CHECK(decoded.hashCanonical == block.hashCanonical);
    BOOST_CHECK(decoded.hashBlock == block.hashBlock);
    BOOST_CHECK(decoded.algorithm == block.algorithm);
}

BOOST_AUTO_TEST_CASE(block_record_rejects_unknown_algorithm) {
    std::string data = SerializeBlockRecord(SampleBlock(1, uint256()));
    data[data.size() - 1] = 0x7f;
    CBlock decoded;
    std::string error;
    BOOST_CHECK(!DeserializeBlockRecord(data, decoded, error));
    BOOST_CHECK(!DeserializeBlockRecord(data.substr(0, 10), decoded, error));
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: LevelDB graph database
 */
BOOST_AUTO_TEST_SUITE(leveldb_tests)

BOOST_AUTO_TEST_CASE(open_and_close) {
    std::string path = MakeTestDBPath("open");
    CGraphDB db;
    std::string error;

    BOOST_CHECK(!db.IsOpen());
    BOOST_REQUIRE_MESSAGE(db.Open(path, error), error);
    BOOST_CHECK(db.IsOpen());
    BOOST_CHECK(!db.GetPath().empty());
    db.Close();
    BOOST_CHECK(!db.IsOpen());

    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(operations_require_open_db) {
    CGraphDB db;
    std::string error;
    std::vector<CTriple> triples;
    std::vector<CBlock> blocks;

    BOOST_CHECK(!db.StoreGraph("g", SampleTriples(), error));
    BOOST_CHECK(!db.TriplesInGraph("g", triples, error));
    BOOST_CHECK(!db.HasGraph("g"));
    BOOST_CHECK(!db.WriteBlock(SampleBlock(0, uint256()), error));
    BOOST_CHECK(!db.ReadBlocks(blocks, error));
}

BOOST_AUTO_TEST_CASE(graphs_survive_reopen) {
    std::string path = MakeTestDBPath("graphs");
    std::string error;
    {
        CGraphDB db;
        BOOST_REQUIRE_MESSAGE(db.Open(path, error), error);
        BOOST_REQUIRE_MESSAGE(db.StoreGraph(GetBlockGraphId(1), SampleTriples(), error), error);
        BOOST_CHECK(db.HasGraph(GetBlockGraphId(1)));
        BOOST_CHECK(!db.HasGraph(GetBlockGraphId(2)));
    }
    {
        CGraphDB db;
        BOOST_REQUIRE_MESSAGE(db.Open(path, error, false), error);
        std::vector<CTriple> fetched;
        BOOST_REQUIRE_MESSAGE(db.TriplesInGraph(GetBlockGraphId(1), fetched, error), error);
        BOOST_CHECK(CGraph(fetched) == CGraph(SampleTriples()));

        BOOST_CHECK(!db.TriplesInGraph(GetBlockGraphId(2), fetched, error));
    }
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(missing_graph_reads_as_recoverable_miss) {
    BOOST_CHECK(ClassifyDBError(leveldb::Status::OK()) == DBErrorType::OK);
    BOOST_CHECK(ClassifyDBError(leveldb::Status::NotFound("k")) == DBErrorType::NOT_FOUND);
    BOOST_CHECK(ClassifyDBError(leveldb::Status::Corruption("bad block")) == DBErrorType::CORRUPTION);
    BOOST_CHECK(ClassifyDBError(leveldb::Status::IOError("disk")) == DBErrorType::IO_ERROR);

    BOOST_CHECK(IsRecoverableError(DBErrorType::NOT_FOUND));
    BOOST_CHECK(!IsRecoverableError(DBErrorType::CORRUPTION));
    BOOST_CHECK(!IsRecoverableError(DBErrorType::IO_ERROR));

    leveldb::Status corruption = leveldb::Status::Corruption("bad block");
    BOOST_CHECK(GetDBErrorMessage(corruption, ClassifyDBError(corruption)).find("corruption") != std::string::npos);

    std::string path = MakeTestDBPath("miss");
    std::string error;
    {
        CGraphDB db;
        BOOST_REQUIRE_MESSAGE(db.Open(path, error), error);
        std::vector<CTriple> fetched;
        BOOST_CHECK(!db.TriplesInGraph(GetBlockGraphId(5), fetched, error));
        BOOST_CHECK(error.find(GetBlockGraphId(5)) != std::string::npos);
        BOOST_CHECK(error.find("not found") != std::string::npos);

        // A miss leaves the database usable
        BOOST_REQUIRE_MESSAGE(db.StoreGraph(GetBlockGraphId(5), SampleTriples(), error), error);
        BOOST_CHECK(db.TriplesInGraph(GetBlockGraphId(5), fetched, error));
    }
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(blocks_are_read_in_index_order) {
    std::string path = MakeTestDBPath("blocks");
    std::string error;
    CGraphDB db;
    BOOST_REQUIRE_MESSAGE(db.Open(path, error), error);

    uint64_t tip = 0;
    BOOST_CHECK(!db.ReadTipIndex(tip));

    // Index 16 sorts after 2 only with fixed-width keys
    CBlock prev = Genesis::CreateGenesisBlock();
    BOOST_REQUIRE(db.WriteBlock(prev, error));
    for (uint64_t i = 1; i <= 17; i++) {
        CBlock block = SampleBlock(i, prev.hashBlock);
        BOOST_REQUIRE_MESSAGE(db.WriteBlock(block, error), error);
        prev = block;
    }

    std::vector<CBlock> blocks;
    BOOST_REQUIRE_MESSAGE(db.ReadBlocks(blocks, error), error);
    BOOST_REQUIRE_EQUAL(blocks.size(), 18U);
    for (size_t i = 0; i < blocks.size(); i++) {
        BOOST_CHECK_EQUAL(blocks[i].nIndex, i);
    }
    BOOST_CHECK(Genesis::IsGenesisBlock(blocks[0]));
    BOOST_CHECK(blocks[17].hashBlock == prev.hashBlock);

    BOOST_CHECK(db.ReadTipIndex(tip));
    BOOST_CHECK_EQUAL(tip, 17U);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(open_fails_on_file_path) {
    std::string path = MakeTestDBPath("file");
    {
        std::ofstream file(path);
        file << "not a database";
    }
    CGraphDB db;
    std::string error;
    BOOST_CHECK(!db.Open(path, error));
    BOOST_CHECK(!error.empty());
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
