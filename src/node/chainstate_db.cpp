// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/chainstate_db.h>
#include <db/db_errors.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <leveldb/options.h>
#include <leveldb/write_batch.h>
#include <filesystem>

namespace {

const char* const KEY_INITIALIZED = "initialized";
const char* const KEY_INCONSISTENCY = "inconsistency";
const char* const KEY_HEIGHT = "height";
const char PREFIX_PATH = 'p';

std::string EncodeHeight(uint32_t height) {
    std::string out(4, '\0');
    out[0] = static_cast<char>((height >> 24) & 0xff);
    out[1] = static_cast<char>((height >> 16) & 0xff);
    out[2] = static_cast<char>((height >> 8) & 0xff);
    out[3] = static_cast<char>(height & 0xff);
    return out;
}

uint32_t DecodeHeight(const std::string& in) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(in[0])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(in[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(in[2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(in[3]));
}

std::string EncodeID(const uint256& id) {
    return std::string(reinterpret_cast<const char*>(id.begin()), uint256::WIDTH);
}

// Releases a LevelDB snapshot on scope exit
class SnapshotGuard {
public:
    explicit SnapshotGuard(leveldb::DB* db) : m_db(db), m_snapshot(db->GetSnapshot()) {}
    ~SnapshotGuard() { m_db->ReleaseSnapshot(m_snapshot); }

    SnapshotGuard(const SnapshotGuard&) = delete;
    SnapshotGuard& operator=(const SnapshotGuard&) = delete;

    leveldb::ReadOptions Options() const {
        leveldb::ReadOptions options;
        options.snapshot = m_snapshot;
        options.verify_checksums = true;
        return options;
    }

private:
    leveldb::DB* m_db;
    const leveldb::Snapshot* m_snapshot;
};

ChainDBError ReadFailure(const leveldb::Status& status, const std::string& what, std::string& error) {
    error = "reading " + what + ": " + GetDBErrorMessage(status);
    DBErrorType type = ClassifyDBError(status);
    if (!IsRecoverableError(type)) {
        LogPrintf(CHAIN, ERROR, "Consensus database read of %s failed", what.c_str());
    }
    return type == DBErrorType::CORRUPTION ? ChainDBError::CORRUPT_STATE
                                           : ChainDBError::STORAGE_OPEN_FAILED;
}

} // namespace

const char* ChainDBErrorString(ChainDBError error) {
    switch (error) {
        case ChainDBError::OK: return "ok";
        case ChainDBError::STORAGE_OPEN_FAILED: return "storage open failed";
        case ChainDBError::CORRUPT_STATE: return "database contains inconsistencies";
        case ChainDBError::GENESIS_MISMATCH: return "blockchain has wrong genesis block";
    }
    return "unknown";
}

CChainStateDB::CChainStateDB() : db(nullptr) {}

CChainStateDB::~CChainStateDB() {
    Close();
}

std::string CChainStateDB::PathKey(uint32_t height) {
    return std::string(1, PREFIX_PATH) + EncodeHeight(height);
}

bool CChainStateDB::Open(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        return true;  // Already open
    }

    try {
        std::filesystem::create_directories(path);
    } catch (const std::filesystem::filesystem_error& e) {
        error = "cannot create " + path + ": " + e.what();
        LogPrintf(CHAIN, ERROR, "%s",
                  CErrorFormatter::FormatForLog(CErrorFormatter::DatabaseError("create directory", e.what())).c_str());
        return false;
    }

    leveldb::Options options;
    options.create_if_missing = true;
    options.max_open_files = 64;
    options.write_buffer_size = 4 * 1024 * 1024;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw_db);
    if (!status.ok()) {
        error = GetDBErrorMessage(status);
        LogPrintf(CHAIN, ERROR, "Failed to open consensus database %s: %s", path.c_str(), error.c_str());
        if (ClassifyDBError(status) == DBErrorType::CORRUPTION) {
            LogPrintf(CHAIN, ERROR, "Consensus database is damaged; remove %s to resync", path.c_str());
        }
        return false;
    }

    db.reset(raw_db);
    m_path = path;
    LogPrintf(CHAIN, DEBUG, "Opened consensus database %s", path.c_str());
    return true;
}

void CChainStateDB::Close() {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db != nullptr) {
        db.reset();
        LogPrintf(CHAIN, DEBUG, "Closed consensus database %s", m_path.c_str());
    }
}

bool CChainStateDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return db != nullptr;
}

ChainDBError CChainStateDB::Load(const CBlock& genesis, std::string& error) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db == nullptr) {
        error = "consensus database is not open";
        return ChainDBError::STORAGE_OPEN_FAILED;
    }

    const uint256 expected = genesis.GetHash();

    SnapshotGuard snapshot(db.get());
    const leveldb::ReadOptions read_options = snapshot.Options();

    std::string value;
    leveldb::Status status = db->Get(read_options, KEY_INITIALIZED, &value);
    if (!status.ok() && !status.IsNotFound()) {
        return ReadFailure(status, "initialized flag", error);
    }

    if (status.IsNotFound()) {
        // Fresh store
        leveldb::WriteBatch batch;
        batch.Put(PathKey(0), EncodeID(expected));
        batch.Put(KEY_HEIGHT, EncodeHeight(0));
        batch.Put(KEY_INITIALIZED, "1");

        leveldb::WriteOptions write_options;
        write_options.sync = true;
        status = db->Write(write_options, &batch);
        if (!status.ok()) {
            error = "initializing consensus database: " + GetDBErrorMessage(status);
            return ChainDBError::STORAGE_OPEN_FAILED;
        }
        LogPrintf(CHAIN, INFO, "Initialized consensus database with genesis %s",
                  expected.GetHex().c_str());
        return ChainDBError::OK;
    }

    status = db->Get(read_options, KEY_INCONSISTENCY, &value);
    if (status.ok()) {
        error = "database contains inconsistencies";
        return ChainDBError::CORRUPT_STATE;
    }
    if (!status.IsNotFound()) {
        return ReadFailure(status, "inconsistency marker", error);
    }

    status = db->Get(read_options, PathKey(0), &value);
    if (status.IsNotFound()) {
        error = "initialized database has no genesis record";
        return ChainDBError::CORRUPT_STATE;
    }
    if (!status.ok()) {
        return ReadFailure(status, "genesis record", error);
    }
    if (value.size() != uint256::WIDTH) {
        error = "genesis record has " + std::to_string(value.size()) + " bytes, expected 32";
        return ChainDBError::CORRUPT_STATE;
    }

    uint256 stored;
    memcpy(stored.begin(), value.data(), uint256::WIDTH);
    if (stored != expected) {
        error = "blockchain has wrong genesis block (stored " + stored.GetHex() +
                ", expected " + expected.GetHex() + ")";
        return ChainDBError::GENESIS_MISMATCH;
    }

    LogPrintf(CHAIN, DEBUG, "Consensus database passed integrity check");
    return ChainDBError::OK;
}

bool CChainStateDB::ReadFlag(const std::string& key) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) return false;

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), key, &value);
    return status.ok() && value == "1";
}

bool CChainStateDB::WriteFlag(const std::string& key) {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) return false;

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Put(options, key, "1");
    if (!status.ok()) {
        LogPrintf(CHAIN, ERROR, "Writing %s failed: %s", key.c_str(), GetDBErrorMessage(status).c_str());
    }
    return status.ok();
}

bool CChainStateDB::IsInitialized() const {
    return ReadFlag(KEY_INITIALIZED);
}

bool CChainStateDB::IsInconsistent() const {
    return ReadFlag(KEY_INCONSISTENCY);
}

bool CChainStateDB::MarkInconsistent() {
    LogPrintf(CHAIN, ERROR, "Marking consensus database %s inconsistent", m_path.c_str());
    return WriteFlag(KEY_INCONSISTENCY);
}

bool CChainStateDB::ReadBlockID(uint32_t height, uint256& id) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) return false;

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), PathKey(height), &value);
    if (!status.ok() || value.size() != uint256::WIDTH) {
        return false;
    }
    memcpy(id.begin(), value.data(), uint256::WIDTH);
    return true;
}

bool CChainStateDB::WriteHeight(uint32_t height) {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) return false;

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Put(options, KEY_HEIGHT, EncodeHeight(height));
    return status.ok();
}

bool CChainStateDB::ReadHeight(uint32_t& height) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr) return false;

    std::string value;
    leveldb::Status status = db->Get(leveldb::ReadOptions(), KEY_HEIGHT, &value);
    if (!status.ok() || value.size() != 4) {
        return false;
    }
    height = DecodeHeight(value);
    return true;
}
