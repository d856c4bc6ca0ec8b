// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/init.h>
#include <node/bootstrap.h>
#include <util/logging.h>

#include <limits>
#include <sstream>

namespace {

// Upper bound for millisecond and count settings
const int64_t MAX_SETTING = std::numeric_limits<uint32_t>::max();

const int64_t BYTES_PER_MB = 1024 * 1024;

/** Integer setting in [min_value, MAX_SETTING], or default_value */
int64_t GetBoundedInt(const CConfigParser& conf, const std::string& key,
                      int64_t default_value, int64_t min_value) {
    int64_t value = conf.GetInt64(key, default_value);
    if (value < min_value || value > MAX_SETTING) {
        LogPrintf(INIT, WARN, "Config: %s=%lld out of range (using default: %lld)",
                  key.c_str(), static_cast<long long>(value), static_cast<long long>(default_value));
        return default_value;
    }
    return value;
}

} // namespace

bool SetupLogCategories(const std::vector<std::string>& names, std::string& error) {
    std::vector<LogCategory> categories;
    for (const std::string& entry : names) {
        std::stringstream ss(entry);
        std::string name;
        while (std::getline(ss, name, ',')) {
            if (name.empty()) {
                continue;
            }
            LogCategory category;
            if (!ParseLogCategory(name, category)) {
                error = "unknown log category '" + name + "'";
                return false;
            }
            categories.push_back(category);
        }
    }
    if (categories.empty()) {
        return true;
    }

    CLoggingConfig& config = CLoggingConfig::GetInstance();
    config.DisableCategory(LogCategory::ALL);
    for (LogCategory category : categories) {
        config.EnableCategory(category);
    }
    return true;
}

void ApplyLogRotationSettings(const CConfigParser& conf) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();

    int64_t default_mb = static_cast<int64_t>(config.GetMaxLogSize()) / BYTES_PER_MB;
    int64_t size_mb = GetBoundedInt(conf, "maxlogsize", default_mb, 1);
    config.SetMaxLogSize(static_cast<size_t>(size_mb * BYTES_PER_MB));

    int64_t files = GetBoundedInt(conf, "maxlogfiles", static_cast<int64_t>(config.GetMaxLogFiles()), 1);
    config.SetMaxLogFiles(static_cast<size_t>(files));
}

Poolnode::ChainParams ApplyNetworkSettings(const CConfigParser& conf, const Poolnode::ChainParams& base) {
    Poolnode::ChainParams params = base;

    if (conf.IsSet("bootstrappeer")) {
        params.bootstrapPeers = conf.GetList("bootstrappeer");
        LogPrintf(INIT, INFO, "Using %zu configured bootstrap peers", params.bootstrapPeers.size());
    }

    params.dialTimeoutMs = static_cast<uint32_t>(GetBoundedInt(conf, "dialtimeout", base.dialTimeoutMs, 1));
    params.acceptPollMs = static_cast<uint32_t>(GetBoundedInt(conf, "acceptpoll", base.acceptPollMs, 1));
    return params;
}

size_t GetBootstrapConnections(const CConfigParser& conf) {
    return static_cast<size_t>(GetBoundedInt(conf, "bootstrapconnections",
                                             static_cast<int64_t>(BOOTSTRAP_CONNECTIONS), 0));
}
