// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_CORE_CHAINPARAMS_H
#define POOLNODE_CORE_CHAINPARAMS_H

#include <cstdint>
#include <string>
#include <vector>

namespace Poolnode {

enum Network {
    MAINNET,
    TESTNET,
    REGTEST
};

class ChainParams {
public:
    Network network;

    // Genesis block parameters; the genesis block id is derived from these
    // and stored in the consensus database on first boot
    uint32_t genesisTime;
    uint32_t genesisNonce;
    std::string genesisCoinbaseMsg;

    // Default listen addresses (host:port)
    std::string rpcAddr;            // Gateway (peer-to-peer) listener
    std::string apiAddr;            // API server listener

    // Well-known peers used only to join the network on first contact
    std::vector<std::string> bootstrapPeers;

    // Gateway timings
    uint32_t dialTimeoutMs;         // Outbound connect() is abandoned after this long
    uint32_t acceptPollMs;          // Accept loops re-check the stop signal this often

    static ChainParams Mainnet();
    static ChainParams Testnet();
    static ChainParams Regtest();

    const char* GetNetworkName() const {
        switch (network) {
            case MAINNET: return "mainnet";
            case TESTNET: return "testnet";
            case REGTEST: return "regtest";
        }
        return "unknown";
    }

    bool IsMainnet() const { return network == MAINNET; }
};

/**
 * Select the active network. Must be called once at startup before any
 * module reads g_chainParams.
 */
void SelectParams(Network network);

// Active chain parameters (set by SelectParams, never null afterwards)
extern const ChainParams* g_chainParams;

} // namespace Poolnode

#endif // POOLNODE_CORE_CHAINPARAMS_H
