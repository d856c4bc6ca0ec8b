// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include <unistd.h>
#include <pwd.h>
#include <sys/stat.h>

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string ToUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

} // namespace

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    // Remove comments
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    // Skip section headers [section]
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    // Remove quotes if present
    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

std::string CConfigParser::EnvKey(const std::string& key) {
    return "POOLNODE_" + ToUpper(key);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_settings.clear();

    struct stat file_stat;
    if (stat(file_path.c_str(), &file_stat) == 0) {
        if (file_stat.st_mode & (S_IWGRP | S_IWOTH)) {
            LogPrintf(INIT, WARN, "Config file %s is writable by group or others (mode %o)",
                      file_path.c_str(), static_cast<unsigned>(file_stat.st_mode & 0777));
        }
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // File doesn't exist - this is OK, use defaults
        LogPrintf(INIT, DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        return true;
    }

    std::string line;
    size_t count = 0;
    while (std::getline(file, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            m_settings[ToLower(key)].push_back(value);
            ++count;
            LogPrintf(INIT, DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }

    if (file.bad()) {
        LogPrintf(INIT, ERROR, "Failed reading config file %s", file_path.c_str());
        return false;
    }

    if (count > 0) {
        LogPrintf(INIT, INFO, "Loaded configuration from %s (%zu settings)",
                  file_path.c_str(), count);
    }
    return true;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    // Priority 1: Environment variable (POOLNODE_*)
    auto env_value = GetEnv(EnvKey(key));
    if (env_value.has_value()) {
        LogPrintf(INIT, DEBUG, "Config: %s = %s (from environment)",
                  key.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file
    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end() && !it->second.empty()) {
        return it->second.back();
    }

    return default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t pos = 0;
        int64_t result = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    } catch (const std::exception&) {
        LogPrintf(INIT, WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                  key.c_str(), value.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintf(INIT, WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
              key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> result;

    // Environment form is comma-separated
    auto env_value = GetEnv(EnvKey(key));
    if (env_value.has_value()) {
        std::stringstream ss(*env_value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
        return result;
    }

    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end()) {
        result = it->second;
    }
    return result;
}

bool CConfigParser::IsSet(const std::string& key) const {
    return GetEnv(EnvKey(key)).has_value() || m_settings.count(ToLower(key)) > 0;
}

std::string GetDefaultDataDir(const std::string& network_name) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    std::string dir_name = ".poolnode";
    if (network_name != "mainnet") {
        dir_name += "-" + network_name;
    }

    if (home != nullptr) {
        return std::string(home) + "/" + dir_name;
    }
    return dir_name;
}

std::string GetConfigFilePath(const std::string& datadir) {
    return datadir + "/poolnode.conf";
}
