// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_BOOTSTRAP_H
#define POOLNODE_NODE_BOOTSTRAP_H

#include <node/modules.h>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

/** Outbound dials attempted when the gateway first comes up */
static const size_t BOOTSTRAP_CONNECTIONS = 3;

/**
 * Pick min(count, peers.size()) distinct peers, uniformly at random
 */
std::vector<std::string> SelectBootstrapPeers(const std::vector<std::string>& peers, size_t count,
                                              std::mt19937_64& rng);
std::vector<std::string> SelectBootstrapPeers(const std::vector<std::string>& peers, size_t count);

/**
 * Dial randomly chosen bootstrap peers in the background.
 *
 * Fire-and-forget: returns immediately, dial failures are only logged at
 * DEBUG and nothing is retried. Each dial holds an acquisition of the
 * gateway's thread group, so closing the gateway waits for them.
 *
 * @return number of dials started
 */
size_t JoinBootstrapPeers(CNetworkModule& gateway, const std::vector<std::string>& peers,
                          size_t count = BOOTSTRAP_CONNECTIONS);

#endif // POOLNODE_NODE_BOOTSTRAP_H
