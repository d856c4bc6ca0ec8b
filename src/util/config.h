// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

/**
 * Configuration System
 *
 * Bitcoin Core-style configuration file and environment variable support.
 * Reads from poolnode.conf and allows environment variable overrides.
 */

#ifndef POOLNODE_UTIL_CONFIG_H
#define POOLNODE_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Repeated keys (read back with GetList)
 * - Environment variable overrides (POOLNODE_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::vector<std::string>> m_settings;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

    static std::string EnvKey(const std::string& key);

public:
    /**
     * Load configuration from file
     * @param file_path Path to poolnode.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * If a key is repeated in the file, the last value wins.
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * Unparsable values log a warning and return the default.
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get list of values (for repeated keys like addnode)
     * The environment form is comma-separated.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsSet(const std::string& key) const;
};

/**
 * Get default config file path
 * @param datadir Data directory
 * @return Path to poolnode.conf
 */
std::string GetConfigFilePath(const std::string& datadir);

/**
 * Get default data directory
 * @param network_name "mainnet", "testnet" or "regtest"
 * @return ~/.poolnode for mainnet, ~/.poolnode-<network> otherwise
 */
std::string GetDefaultDataDir(const std::string& network_name = "mainnet");

#endif // POOLNODE_UTIL_CONFIG_H
