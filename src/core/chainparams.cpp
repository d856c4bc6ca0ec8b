// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <core/chainparams.h>

namespace Poolnode {

const ChainParams* g_chainParams = nullptr;

ChainParams ChainParams::Mainnet() {
    ChainParams params;
    params.network = MAINNET;

    params.genesisTime = 1433600000;   // June 6, 2015 14:13:20 UTC
    params.genesisNonce = 0;
    params.genesisCoinbaseMsg = "Poolnode mainnet genesis: shares are proof, peers are equal";

    params.rpcAddr = ":9981";
    params.apiAddr = "localhost:9980";

    params.bootstrapPeers = {
        "101.200.214.115:9981",
        "109.172.42.157:9981",
        "109.206.33.225:9981",
        "113.98.98.164:9981",
        "142.4.209.72:9981",
        "162.210.249.170:9981",
        "162.222.23.93:9981",
        "188.166.61.155:9981",
        "188.166.137.138:9981",
        "23.239.14.98:9971",
        "54.93.78.60:9981",
        "62.210.147.164:9981",
        "73.26.49.32:9981",
        "82.196.11.170:9981",
        "85.255.197.69:9981",
    };

    params.dialTimeoutMs = 2 * 60 * 1000;
    params.acceptPollMs = 500;

    return params;
}

ChainParams ChainParams::Testnet() {
    ChainParams params;
    params.network = TESTNET;

    // Different genesis so a testnet datadir can never be resumed on mainnet
    params.genesisTime = 1433600000;
    params.genesisNonce = 1;
    params.genesisCoinbaseMsg = "Poolnode testnet genesis";

    params.rpcAddr = ":19981";
    params.apiAddr = "localhost:19980";

    params.bootstrapPeers = {
        "testnet-seed1.poolnode.org:19981",
        "testnet-seed2.poolnode.org:19981",
        "testnet-seed3.poolnode.org:19981",
        "testnet-seed4.poolnode.org:19981",
    };

    params.dialTimeoutMs = 20 * 1000;
    params.acceptPollMs = 250;

    return params;
}

ChainParams ChainParams::Regtest() {
    ChainParams params;
    params.network = REGTEST;

    params.genesisTime = 1433600000;
    params.genesisNonce = 2;
    params.genesisCoinbaseMsg = "Poolnode regtest genesis";

    // Ephemeral ports so parallel test runs never collide
    params.rpcAddr = "127.0.0.1:0";
    params.apiAddr = "127.0.0.1:0";

    // Loopback addresses nobody listens on: dials fail fast
    params.bootstrapPeers = {
        "127.0.0.1:1",
        "127.0.0.1:2",
        "127.0.0.1:3",
        "127.0.0.1:4",
    };

    params.dialTimeoutMs = 500;
    params.acceptPollMs = 50;

    return params;
}

void SelectParams(Network network) {
    static const ChainParams mainnet = ChainParams::Mainnet();
    static const ChainParams testnet = ChainParams::Testnet();
    static const ChainParams regtest = ChainParams::Regtest();

    switch (network) {
        case MAINNET: g_chainParams = &mainnet; break;
        case TESTNET: g_chainParams = &testnet; break;
        case REGTEST: g_chainParams = &regtest; break;
    }
}

} // namespace Poolnode
