// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_CHAINSTATE_DB_H
#define POOLNODE_NODE_CHAINSTATE_DB_H

#include <primitives/block.h>
#include <leveldb/db.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

/**
 * Outcome of CChainStateDB::Load. Everything except OK is fatal for the
 * consensus set and therefore for node startup.
 */
enum class ChainDBError {
    OK,
    STORAGE_OPEN_FAILED,    // Store could not be opened, read or written
    CORRUPT_STATE,          // Inconsistency marker set, or initialized store without a genesis record
    GENESIS_MISMATCH        // Stored genesis id belongs to another network or binary
};

const char* ChainDBErrorString(ChainDBError error);

/**
 * Persisted chain state of the consensus set
 *
 * Layout (LevelDB):
 *   "initialized"            -> "1" once the store has been initialized
 *   "inconsistency"          -> "1" if an inconsistency was ever detected
 *   "height"                 -> current height, 4 bytes big-endian
 *   'p' + height (4 bytes BE) -> 32-byte block id at that height
 *
 * The block id at height 0 is the genesis id.
 */
class CChainStateDB
{
private:
    std::unique_ptr<leveldb::DB> db;
    mutable std::mutex cs_db;
    std::string m_path;

    static std::string PathKey(uint32_t height);

    bool ReadFlag(const std::string& key) const;
    bool WriteFlag(const std::string& key);

public:
    CChainStateDB();
    ~CChainStateDB();

    CChainStateDB(const CChainStateDB&) = delete;
    CChainStateDB& operator=(const CChainStateDB&) = delete;

    /**
     * Open (or create) the store at path
     * @param error Receives the LevelDB failure with recovery advice
     */
    bool Open(const std::string& path, std::string& error);
    void Close();
    bool IsOpen() const;

    /**
     * Integrity gate. Runs as one step under the database lock:
     *
     * - not initialized: record genesis at height 0, set height 0 and the
     *   initialized flag in a single synced batch
     * - initialized, inconsistency marker set: CORRUPT_STATE
     * - initialized: the stored genesis id must equal genesis.GetHash()
     *   byte for byte, else GENESIS_MISMATCH
     *
     * Nothing is retried. The store is left untouched on every failure.
     */
    ChainDBError Load(const CBlock& genesis, std::string& error);

    bool IsInitialized() const;
    bool IsInconsistent() const;

    /** Flag the store as inconsistent; every later Load fails */
    bool MarkInconsistent();

    bool ReadBlockID(uint32_t height, uint256& id) const;

    bool WriteHeight(uint32_t height);
    bool ReadHeight(uint32_t& height) const;
};

#endif // POOLNODE_NODE_CHAINSTATE_DB_H
