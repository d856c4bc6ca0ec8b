// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <core/version.h>

// Set by CMakeLists.txt from PROJECT_VERSION
#ifndef POOLNODE_VERSION
#define POOLNODE_VERSION "dev"
#endif

#ifndef POOLNODE_BUILD_DATE
#define POOLNODE_BUILD_DATE __DATE__
#endif

std::string GetVersionString() {
    return POOLNODE_VERSION;
}

std::string GetFullVersionString() {
    std::string version = GetVersionString();
    if (version == "dev") {
        return "Poolnode Daemon (dev build - " + std::string(POOLNODE_BUILD_DATE) + ")";
    }
    return "Poolnode Daemon v" + version;
}
