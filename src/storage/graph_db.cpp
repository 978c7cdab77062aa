// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <storage/graph_db.h>
#include <core/errors.h>
#include <crypto/sha256.h>
#include <db/db_errors.h>
#include <rdf/ntriples.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <leveldb/write_batch.h>

#include <cstring>
#include <filesystem>
#include <limits>

namespace {

const uint32_t RECORD_VERSION = 1;
const char GRAPH_PREFIX = 'g';
const char BLOCK_PREFIX = 'b';
const char* const TIP_KEY = "T";

std::string GraphKey(const std::string& graph_id) {
    return std::string(1, GRAPH_PREFIX) + graph_id;
}

std::string BlockKey(uint64_t index) {
    return std::string(1, BLOCK_PREFIX) + strprintf("%016llx", static_cast<unsigned long long>(index));
}

template <typename T>
void AppendPod(std::string& out, T value) {
    out.append(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool ReadPod(const std::string& in, size_t& offset, T& value) {
    if (offset + sizeof(T) > in.size()) return false;
    std::memcpy(&value, in.data() + offset, sizeof(T));
    offset += sizeof(T);
    return true;
}

void AppendString(std::string& out, const std::string& str) {
    AppendPod<uint32_t>(out, static_cast<uint32_t>(str.size()));
    out.append(str);
}

bool ReadString(const std::string& in, size_t& offset, std::string& str) {
    uint32_t len = 0;
    if (!ReadPod(in, offset, len)) return false;
    if (offset + len > in.size()) return false;
    str.assign(in, offset, len);
    offset += len;
    return true;
}

bool ReadHash(const std::string& in, size_t& offset, uint256& hash) {
    if (offset + uint256::size() > in.size()) return false;
    std::memcpy(hash.begin(), in.data() + offset, uint256::size());
    offset += uint256::size();
    return true;
}

} // namespace

std::string FrameRecord(const std::string& data) {
    std::string value;
    value.reserve(data.size() + 40);
    AppendPod<uint32_t>(value, RECORD_VERSION);
    AppendPod<uint32_t>(value, static_cast<uint32_t>(data.size()));
    value.append(data);
    uint256 checksum = HashSHA256(data);
    value.append(reinterpret_cast<const char*>(checksum.begin()), uint256::size());
    return value;
}

bool UnframeRecord(const std::string& value, std::string& data, std::string& error) {
    const size_t MIN_SIZE = sizeof(uint32_t) * 2 + uint256::size();
    if (value.size() < MIN_SIZE) {
        error = "record too short: " + std::to_string(value.size()) + " bytes";
        return false;
    }

    size_t offset = 0;
    uint32_t version = 0;
    uint32_t length = 0;
    if (!ReadPod(value, offset, version) || !ReadPod(value, offset, length)) {
        error = "truncated record header";
        return false;
    }
    if (version != RECORD_VERSION) {
        error = "unsupported record version " + std::to_string(version);
        return false;
    }
    if (value.size() != MIN_SIZE + length) {
        error = "record length mismatch";
        return false;
    }

    data.assign(value, offset, length);
    uint256 stored;
    std::memcpy(stored.begin(), value.data() + offset + length, uint256::size());
    if (stored != HashSHA256(data)) {
        error = "record checksum mismatch";
        return false;
    }
    return true;
}

std::string SerializeBlockRecord(const CBlock& block) {
    std::string data;
    AppendPod<uint64_t>(data, block.nIndex);
    AppendString(data, block.strTimestamp);
    AppendString(data, block.graphRef);
    data.append(reinterpret_cast<const char*>(block.hashPrevBlock.begin()), uint256::size());
    data.append(reinterpret_cast<const char*>(block.hashCanonical.begin()), uint256::size());
    data.append(reinterpret_cast<const char*>(block.hashBlock.begin()), uint256::size());
    AppendPod<uint8_t>(data, static_cast<uint8_t>(block.algorithm));
    return data;
}

bool DeserializeBlockRecord(const std::string& data, CBlock& block, std::string& error) {
    block.SetNull();
    size_t offset = 0;
    uint8_t algorithm = 0;
    if (!ReadPod(data, offset, block.nIndex) ||
        !ReadString(data, offset, block.strTimestamp) ||
        !ReadString(data, offset, block.graphRef) ||
        !ReadHash(data, offset, block.hashPrevBlock) ||
        !ReadHash(data, offset, block.hashCanonical) ||
        !ReadHash(data, offset, block.hashBlock) ||
        !ReadPod(data, offset, algorithm)) {
        error = "truncated block record";
        return false;
    }
    if (offset != data.size()) {
        error = "trailing bytes in block record";
        return false;
    }
    if (!AlgorithmFromByte(algorithm, block.algorithm)) {
        error = "unknown canonicalization algorithm " + std::to_string(algorithm);
        return false;
    }
    return true;
}

CGraphDB::CGraphDB() : db(nullptr) {}

CGraphDB::~CGraphDB() {
    Close();
}

bool CGraphDB::ValidateDatabasePath(const std::string& path, std::string& canonical_path, std::string& error) {
    try {
        std::filesystem::path fs_path(path);
        std::filesystem::path parent = fs_path.parent_path();
        if (parent.empty()) {
            parent = std::filesystem::current_path();
        }
        if (!std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        std::filesystem::path canonical = std::filesystem::canonical(parent) / fs_path.filename();
        if (canonical.string().length() > 4096) {
            error = "database path too long (max 4096 chars)";
            return false;
        }
        if (std::filesystem::exists(canonical) && !std::filesystem::is_directory(canonical)) {
            error = "database path is not a directory: " + canonical.string();
            return false;
        }

        canonical_path = canonical.string();
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        error = std::string("invalid database path: ") + e.what();
        return false;
    }
}

bool CGraphDB::Open(const std::string& path, std::string& error, bool create_if_missing) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        return true;  // Already open
    }

    std::string validated_path;
    if (!ValidateDatabasePath(path, validated_path, error)) {
        LogPrintStore(ERROR, "%s", CErrorFormatter::FormatForLog(
            CErrorFormatter::ConfigError("datadir", error)).c_str());
        return false;
    }

    if (create_if_missing) {
        try {
            std::filesystem::create_directories(validated_path);
        } catch (const std::filesystem::filesystem_error& e) {
            error = std::string("cannot create database directory: ") + e.what();
            LogPrintStore(ERROR, "%s", CErrorFormatter::FormatForLog(
                CErrorFormatter::DatabaseError("create directory", e.what())).c_str());
            return false;
        }
    }

    leveldb::Options options;
    options.create_if_missing = create_if_missing;
    options.compression = leveldb::kSnappyCompression;
    options.max_open_files = 100;
    options.write_buffer_size = 8 * 1024 * 1024;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, validated_path, &raw_db);
    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, error_type);
        LogPrintStore(ERROR, "Failed to open graph database: %s", error.c_str());
        return false;
    }

    db.reset(raw_db);
    datadir = validated_path;
    LogPrintStore(INFO, "Opened graph database at %s", datadir.c_str());
    return true;
}

void CGraphDB::Close() {
    std::lock_guard<std::mutex> lock(cs_db);
    db.reset();
}

bool CGraphDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return db != nullptr;
}

std::string CGraphDB::GetPath() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return datadir;
}

bool CGraphDB::ReadRecord(const std::string& key, std::string& data, std::string& error) const {
    std::string value;
    leveldb::Status status;
    {
        std::lock_guard<std::mutex> lock(cs_db);
        if (!db) {
            error = "database not open";
            return false;
        }
        status = db->Get(leveldb::ReadOptions(), key, &value);
    }

    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, error_type);
        if (!IsRecoverableError(error_type)) {
            LogPrintStore(ERROR, "Read of %s failed: %s", key.c_str(), error.c_str());
        }
        return false;
    }

    if (!UnframeRecord(value, data, error)) {
        error = "corrupt record " + key + ": " + error;
        LogPrintStore(ERROR, "%s", error.c_str());
        return false;
    }
    return true;
}

bool CGraphDB::StoreGraph(const std::string& graph_id, const std::vector<CTriple>& triples,
                          std::string& error) {
    if (graph_id.empty()) {
        error = "empty graph id";
        return false;
    }

    std::string payload;
    try {
        payload = SerializeNTriples(triples);
    } catch (const SerializationError& e) {
        error = std::string("cannot serialize graph: ") + e.what();
        return false;
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        error = "graph payload too large";
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_db);
    if (!db) {
        error = "database not open";
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Put(options, GraphKey(graph_id), FrameRecord(payload));
    if (!status.ok()) {
        error = GetDBErrorMessage(status, ClassifyDBError(status));
        LogPrintStore(ERROR, "%s", CErrorFormatter::FormatForLog(
            CErrorFormatter::DatabaseError("store graph " + graph_id, error)).c_str());
        return false;
    }

    LogPrintStore(DEBUG, "Stored graph %s (%zu triples)", graph_id.c_str(), triples.size());
    return true;
}

bool CGraphDB::TriplesInGraph(const std::string& graph_id, std::vector<CTriple>& triples,
                              std::string& error) const {
    std::string payload;
    if (!ReadRecord(GraphKey(graph_id), payload, error)) {
        error = "graph " + graph_id + ": " + error;
        return false;
    }
    if (!ParseNTriples(payload, triples, error)) {
        error = "graph " + graph_id + " has unreadable payload: " + error;
        LogPrintStore(ERROR, "%s", error.c_str());
        return false;
    }
    return true;
}

bool CGraphDB::HasGraph(const std::string& graph_id) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (!db) {
        return false;
    }
    std::string value;
    return db->Get(leveldb::ReadOptions(), GraphKey(graph_id), &value).ok();
}

bool CGraphDB::WriteBlock(const CBlock& block, std::string& error) {
    std::string tip;
    AppendPod<uint64_t>(tip, block.nIndex);

    leveldb::WriteBatch batch;
    batch.Put(BlockKey(block.nIndex), FrameRecord(SerializeBlockRecord(block)));
    batch.Put(TIP_KEY, FrameRecord(tip));

    std::lock_guard<std::mutex> lock(cs_db);
    if (!db) {
        error = "database not open";
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Write(options, &batch);
    if (!status.ok()) {
        error = GetDBErrorMessage(status, ClassifyDBError(status));
        LogPrintStore(ERROR, "%s", CErrorFormatter::FormatForLog(
            CErrorFormatter::DatabaseError("write block " + std::to_string(block.nIndex), error)).c_str());
        return false;
    }
    return true;
}

bool CGraphDB::ReadBlocks(std::vector<CBlock>& blocks, std::string& error) const {
    blocks.clear();

    std::lock_guard<std::mutex> lock(cs_db);
    if (!db) {
        error = "database not open";
        return false;
    }

    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    const std::string prefix(1, BLOCK_PREFIX);
    for (it->Seek(prefix); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.compare(0, prefix.size(), prefix) != 0) {
            break;
        }

        std::string data;
        CBlock block;
        if (!UnframeRecord(it->value().ToString(), data, error) ||
            !DeserializeBlockRecord(data, block, error)) {
            error = "corrupt block record " + key + ": " + error;
            LogPrintStore(ERROR, "%s", error.c_str());
            return false;
        }
        blocks.push_back(block);
    }

    if (!it->status().ok()) {
        error = GetDBErrorMessage(it->status(), ClassifyDBError(it->status()));
        LogPrintStore(ERROR, "Block scan failed: %s", error.c_str());
        return false;
    }
    return true;
}

bool CGraphDB::ReadTipIndex(uint64_t& index) const {
    std::string data;
    std::string error;
    if (!ReadRecord(TIP_KEY, data, error)) {
        return false;
    }
    size_t offset = 0;
    return ReadPod(data, offset, index) && offset == data.size();
}
