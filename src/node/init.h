// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_INIT_H
#define POOLNODE_NODE_INIT_H

#include <core/chainparams.h>
#include <util/config.h>

#include <cstddef>
#include <string>
#include <vector>

/**
 * Node settings layered on top of the selected network
 *
 * poolnode.conf keys (each also readable as POOLNODE_<KEY>):
 *   bootstrappeer=<host:port>   repeatable; replaces the network's peer list
 *   bootstrapconnections=<n>    peers dialled at startup (0 disables)
 *   dialtimeout=<ms>            outbound connect timeout
 *   acceptpoll=<ms>             how often accept loops re-check for stop
 *   logcategory=<name>          repeatable; log only these categories
 *   maxlogsize=<MB>             rotate poolnode.log beyond this size
 *   maxlogfiles=<n>             rotated files kept
 */

/**
 * Restrict logging to the named categories. Each entry may itself be a
 * comma-separated list. An empty list leaves logging unchanged.
 * @return false (error set, logging unchanged) if a name is unknown
 */
bool SetupLogCategories(const std::vector<std::string>& names, std::string& error);

/** Apply maxlogsize / maxlogfiles */
void ApplyLogRotationSettings(const CConfigParser& conf);

/**
 * Copy of base with the bootstrap peer list and gateway timings overridden
 * from the configuration. Invalid values are logged and ignored.
 */
Poolnode::ChainParams ApplyNetworkSettings(const CConfigParser& conf, const Poolnode::ChainParams& base);

/** bootstrapconnections, or BOOTSTRAP_CONNECTIONS when unset or invalid */
size_t GetBootstrapConnections(const CConfigParser& conf);

#endif // POOLNODE_NODE_INIT_H
