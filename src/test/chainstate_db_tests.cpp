// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

/**
 * Consensus database integrity gate tests
 */

#include <boost/test/unit_test.hpp>

#include <core/chainparams.h>
#include <node/chainstate_db.h>
#include <node/genesis.h>
#include <test/test_util.h>

#include <leveldb/db.h>

#include <fstream>
#include <memory>

BOOST_AUTO_TEST_SUITE(chainstate_db_tests)

BOOST_AUTO_TEST_CASE(fresh_store_is_initialized) {
    TempDir dir;
    const CBlock genesis = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());

    CChainStateDB db;
    std::string error;
    BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
    BOOST_CHECK(!db.IsInitialized());

    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::OK);
    BOOST_CHECK(db.IsInitialized());
    BOOST_CHECK(!db.IsInconsistent());

    uint256 stored;
    BOOST_REQUIRE(db.ReadBlockID(0, stored));
    BOOST_CHECK_EQUAL(stored, genesis.GetHash());

    uint32_t height = 99;
    BOOST_REQUIRE(db.ReadHeight(height));
    BOOST_CHECK_EQUAL(height, 0u);
}

BOOST_AUTO_TEST_CASE(resume_does_not_reinitialize) {
    TempDir dir;
    const CBlock genesis = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());
    std::string error;

    {
        CChainStateDB db;
        BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
        BOOST_REQUIRE(db.Load(genesis, error) == ChainDBError::OK);
        // Simulate progress made by the chain after the first boot
        BOOST_REQUIRE(db.WriteHeight(42));
    }

    CChainStateDB db;
    BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
    BOOST_CHECK(db.IsInitialized());
    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::OK);

    // Initialization would have reset the height to 0
    uint32_t height = 0;
    BOOST_REQUIRE(db.ReadHeight(height));
    BOOST_CHECK_EQUAL(height, 42u);
}

BOOST_AUTO_TEST_CASE(inconsistent_store_is_rejected) {
    TempDir dir;
    const CBlock genesis = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());
    std::string error;

    {
        CChainStateDB db;
        BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
        BOOST_REQUIRE(db.Load(genesis, error) == ChainDBError::OK);
        BOOST_REQUIRE(db.MarkInconsistent());
    }

    CChainStateDB db;
    BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
    BOOST_CHECK(db.IsInconsistent());
    error.clear();
    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::CORRUPT_STATE);
    BOOST_CHECK(!error.empty());

    // Every later attempt fails the same way
    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::CORRUPT_STATE);
}

BOOST_AUTO_TEST_CASE(other_network_genesis_is_rejected) {
    TempDir dir;
    const CBlock regtest = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());
    const CBlock testnet = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Testnet());
    BOOST_REQUIRE(regtest.GetHash() != testnet.GetHash());
    std::string error;

    {
        CChainStateDB db;
        BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
        BOOST_REQUIRE(db.Load(regtest, error) == ChainDBError::OK);
    }

    CChainStateDB db;
    BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
    BOOST_CHECK(db.Load(testnet, error) == ChainDBError::GENESIS_MISMATCH);
    BOOST_CHECK(error.find(testnet.GetHash().GetHex()) != std::string::npos);

    // The rejected load left the original record alone
    uint256 stored;
    BOOST_REQUIRE(db.ReadBlockID(0, stored));
    BOOST_CHECK_EQUAL(stored, regtest.GetHash());
}

BOOST_AUTO_TEST_CASE(single_bit_genesis_difference_is_rejected) {
    TempDir dir;
    CBlock genesis = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());
    std::string error;

    CChainStateDB db;
    BOOST_REQUIRE(db.Open(dir.Sub("consensus.db"), error));
    BOOST_REQUIRE(db.Load(genesis, error) == ChainDBError::OK);

    genesis.nNonce ^= 1;
    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::GENESIS_MISMATCH);
}

BOOST_AUTO_TEST_CASE(missing_genesis_record_is_corrupt) {
    TempDir dir;
    const CBlock genesis = Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest());
    const std::string path = dir.Sub("consensus.db");
    std::string error;

    {
        CChainStateDB db;
        BOOST_REQUIRE(db.Open(path, error));
        BOOST_REQUIRE(db.Load(genesis, error) == ChainDBError::OK);
    }

    // Drop the height-0 record behind the database's back
    {
        leveldb::DB* raw = nullptr;
        leveldb::Options options;
        BOOST_REQUIRE(leveldb::DB::Open(options, path, &raw).ok());
        std::unique_ptr<leveldb::DB> ldb(raw);
        const std::string key = std::string("p") + std::string(4, '\0');
        BOOST_REQUIRE(ldb->Delete(leveldb::WriteOptions(), key).ok());
    }

    CChainStateDB db;
    BOOST_REQUIRE(db.Open(path, error));
    BOOST_CHECK(db.IsInitialized());
    BOOST_CHECK(db.Load(genesis, error) == ChainDBError::CORRUPT_STATE);
}

BOOST_AUTO_TEST_CASE(unopenable_path_fails) {
    TempDir dir;
    // A regular file where the database directory should be
    const std::string path = dir.Sub("not_a_dir");
    {
        std::ofstream file(path);
        file << "occupied";
    }

    CChainStateDB db;
    std::string error;
    BOOST_CHECK(!db.Open(path, error));
    BOOST_CHECK(!error.empty());
    BOOST_CHECK(!db.IsOpen());

    BOOST_CHECK(db.Load(Genesis::CreateGenesisBlock(Poolnode::ChainParams::Regtest()), error) ==
                ChainDBError::STORAGE_OPEN_FAILED);
}

BOOST_AUTO_TEST_CASE(error_strings) {
    BOOST_CHECK_EQUAL(std::string(ChainDBErrorString(ChainDBError::CORRUPT_STATE)),
                      "database contains inconsistencies");
    BOOST_CHECK_EQUAL(std::string(ChainDBErrorString(ChainDBError::GENESIS_MISMATCH)),
                      "blockchain has wrong genesis block");
}

BOOST_AUTO_TEST_SUITE_END()
