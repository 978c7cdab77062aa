// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_STORAGE_GRAPH_DB_H
#define PROVCHAIN_STORAGE_GRAPH_DB_H

#include <primitives/block.h>
#include <storage/graph_store.h>

#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * LevelDB-backed graph store that also persists block records.
 *
 * Key layout:
 *   'g' + graph id              -> N-Triples payload
 *   'b' + 16 hex digit index    -> block record
 *   'T'                         -> tip index (8 bytes)
 *
 * Values are framed as [VERSION][DATA_LENGTH][DATA][SHA-256(DATA)]; a
 * checksum mismatch on read is reported as corruption.
 */
class CGraphDB : public CGraphStore
{
private:
    std::unique_ptr<leveldb::DB> db;
    mutable std::mutex cs_db;
    std::string datadir;

    bool ValidateDatabasePath(const std::string& path, std::string& canonical_path, std::string& error);

    /** Read a framed value and verify its checksum */
    bool ReadRecord(const std::string& key, std::string& data, std::string& error) const;

public:
    CGraphDB();
    ~CGraphDB();

    bool Open(const std::string& path, std::string& error, bool create_if_missing = true);
    void Close();
    bool IsOpen() const;
    std::string GetPath() const;

    // CGraphStore
    bool StoreGraph(const std::string& graph_id, const std::vector<CTriple>& triples,
                    std::string& error) override;
    bool TriplesInGraph(const std::string& graph_id, std::vector<CTriple>& triples,
                        std::string& error) const override;
    bool HasGraph(const std::string& graph_id) const override;

    /**
     * Persist a block record and advance the stored tip in one batch.
     */
    bool WriteBlock(const CBlock& block, std::string& error);

    /**
     * Load every block record in index order.
     */
    bool ReadBlocks(std::vector<CBlock>& blocks, std::string& error) const;

    /** Stored tip index; false if no block was written yet */
    bool ReadTipIndex(uint64_t& index) const;
};

/** Frame data as [VERSION][DATA_LENGTH][DATA][SHA-256(DATA)] */
std::string FrameRecord(const std::string& data);

/** Inverse of FrameRecord; false with error on bad framing or checksum */
bool UnframeRecord(const std::string& value, std::string& data, std::string& error);

std::string SerializeBlockRecord(const CBlock& block);
bool DeserializeBlockRecord(const std::string& data, CBlock& block, std::string& error);

#endif // PROVCHAIN_STORAGE_GRAPH_DB_H
