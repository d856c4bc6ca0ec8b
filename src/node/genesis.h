// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_GENESIS_H
#define POOLNODE_NODE_GENESIS_H

#include <primitives/block.h>
#include <core/chainparams.h>

/**
 * Genesis Block
 *
 * The first block of the chain. It is derived from the network's
 * ChainParams, so every network (mainnet, testnet, regtest) has a
 * distinct genesis id. The consensus database records this id on first
 * boot and refuses to resume against a different one.
 */
namespace Genesis {

// Genesis block version (constant across all networks)
const int32_t VERSION = 1;

/**
 * Create the genesis block for the given network
 *
 * - No previous block (hashPrevBlock = 0)
 * - Merkle root = SHA3-256 of the coinbase message
 * - Timestamp and nonce from ChainParams
 */
CBlock CreateGenesisBlock(const Poolnode::ChainParams& params);

/** Id of CreateGenesisBlock(params) */
uint256 GetGenesisHash(const Poolnode::ChainParams& params);

} // namespace Genesis

#endif // POOLNODE_NODE_GENESIS_H
