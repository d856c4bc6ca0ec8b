// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/genesis.h>
#include <crypto/sha3.h>

namespace Genesis {

CBlock CreateGenesisBlock(const Poolnode::ChainParams& params) {
    CBlock genesis;

    genesis.nVersion = VERSION;
    genesis.hashPrevBlock = uint256();  // All zeros (no previous block)
    genesis.nTime = params.genesisTime;
    genesis.nNonce = params.genesisNonce;

    const std::string& msg = params.genesisCoinbaseMsg;
    genesis.vtx.assign(msg.begin(), msg.end());

    SHA3_256(genesis.vtx.data(), genesis.vtx.size(), genesis.hashMerkleRoot.data);

    return genesis;
}

uint256 GetGenesisHash(const Poolnode::ChainParams& params) {
    return CreateGenesisBlock(params).GetHash();
}

} // namespace Genesis
