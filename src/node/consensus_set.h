// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_CONSENSUS_SET_H
#define POOLNODE_NODE_CONSENSUS_SET_H

#include <core/chainparams.h>
#include <node/chainstate_db.h>
#include <node/modules.h>

#include <atomic>
#include <string>

/**
 * CConsensusSet - chain state module
 *
 * Owns the consensus database. Open() runs the integrity gate; the module
 * is usable only if it passed. Block processing is not part of this
 * module yet: the chain stays at whatever height the database records.
 */
class CConsensusSet : public CChainStateModule {
public:
    CConsensusSet(CNetworkModule& gateway, const Poolnode::ChainParams& params);
    ~CConsensusSet() override;

    /**
     * Open <dir>/consensus.db and validate it against this network's genesis
     * @return false with error set; LoadError() tells which check failed
     */
    bool Open(const std::string& dir, std::string& error);

    const char* Name() const override { return "consensus"; }

    uint32_t Height() const override { return m_height.load(); }
    uint256 GenesisID() const override { return m_genesis_id; }

    ChainDBError LoadError() const { return m_load_error; }

private:
    CNetworkModule& m_gateway;
    const Poolnode::ChainParams& m_params;

    CChainStateDB m_db;
    ChainDBError m_load_error{ChainDBError::OK};
    uint256 m_genesis_id;
    std::atomic<uint32_t> m_height{0};
};

#endif // POOLNODE_NODE_CONSENSUS_SET_H
