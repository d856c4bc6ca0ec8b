// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_CORE_VERSION_H
#define POOLNODE_CORE_VERSION_H

// Version is injected by the build system - don't hardcode here

#include <string>

/**
 * Get version string
 * Returns format: "X.Y.Z" or "dev" if the build did not set one
 */
std::string GetVersionString();

/**
 * Get full version info for display
 * Returns: "Poolnode Daemon vX.Y.Z" or "Poolnode Daemon (dev build - <date>)"
 */
std::string GetFullVersionString();

#endif // POOLNODE_CORE_VERSION_H
