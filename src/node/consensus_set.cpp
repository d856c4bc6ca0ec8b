// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/consensus_set.h>
#include <node/genesis.h>
#include <util/logging.h>

CConsensusSet::CConsensusSet(CNetworkModule& gateway, const Poolnode::ChainParams& params)
    : m_gateway(gateway), m_params(params) {}

CConsensusSet::~CConsensusSet() {
    Close();
}

bool CConsensusSet::Open(const std::string& dir, std::string& error) {
    if (!m_db.Open(dir + "/consensus.db", error)) {
        m_load_error = ChainDBError::STORAGE_OPEN_FAILED;
        return false;
    }
    // Registered before the gate runs so a failed load still releases the store
    m_tg.OnStop([this]() { m_db.Close(); });

    const CBlock genesis = Genesis::CreateGenesisBlock(m_params);
    m_load_error = m_db.Load(genesis, error);
    if (m_load_error != ChainDBError::OK) {
        LogPrintf(CHAIN, ERROR, "Consensus database rejected: %s", error.c_str());
        return false;
    }

    m_genesis_id = genesis.GetHash();
    uint32_t height = 0;
    if (!m_db.ReadHeight(height)) {
        LogPrintf(CHAIN, WARN, "Consensus database has no height record, assuming 0");
    }
    m_height.store(height);

    LogPrintf(CHAIN, INFO, "Consensus set loaded: network %s, height %u, genesis %s, %zu peers",
              m_params.GetNetworkName(), height, m_genesis_id.GetHex().c_str(),
              m_gateway.Peers().size());
    return true;
}
