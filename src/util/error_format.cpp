// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <util/error_format.h>
#include <sstream>

std::string CErrorFormatter::FormatForUser(const ErrorMessage& error) {
    std::ostringstream oss;

    const char* color = "";
    const char* symbol = "";
    switch (error.severity) {
        case ErrorSeverity::INFO:
            color = "\033[0;36m";  // Cyan
            symbol = "i";
            break;
        case ErrorSeverity::WARNING:
            color = "\033[0;33m";  // Yellow
            symbol = "!";
            break;
        case ErrorSeverity::ERROR:
            color = "\033[0;31m";  // Red
            symbol = "x";
            break;
        case ErrorSeverity::CRITICAL:
            color = "\033[1;31m";  // Bold Red
            symbol = "x";
            break;
    }
    const char* reset = "\033[0m";

    oss << color << symbol << " " << error.title << reset << std::endl;
    oss << "  " << error.description << std::endl;

    if (!error.cause.empty()) {
        oss << std::endl << "  Cause: " << error.cause << std::endl;
    }

    if (!error.recovery_steps.empty()) {
        oss << std::endl << "  To resolve:" << std::endl;
        for (size_t i = 0; i < error.recovery_steps.size(); ++i) {
            oss << "    " << (i + 1) << ". " << error.recovery_steps[i] << std::endl;
        }
    }

    if (!error.error_code.empty()) {
        oss << std::endl << "  Error code: " << error.error_code << std::endl;
    }

    return oss.str();
}

std::string CErrorFormatter::FormatForLog(const ErrorMessage& error) {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (error.severity) {
        case ErrorSeverity::INFO: severity_str = "INFO"; break;
        case ErrorSeverity::WARNING: severity_str = "WARNING"; break;
        case ErrorSeverity::ERROR: severity_str = "ERROR"; break;
        case ErrorSeverity::CRITICAL: severity_str = "CRITICAL"; break;
    }

    oss << "[" << severity_str << "] " << error.title;
    if (!error.error_code.empty()) {
        oss << " (code: " << error.error_code << ")";
    }
    oss << ": " << error.description;

    if (!error.cause.empty()) {
        oss << " Cause: " << error.cause;
    }

    return oss.str();
}

ErrorMessage CErrorFormatter::DatabaseError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Database Operation Failed",
                      "Failed to " + operation + ": " + details);
    error.cause = "Database I/O error or corruption";
    error.recovery_steps = {
        "Check disk space and permissions on the data directory",
        "Verify the database files are not corrupted",
        "If the database is flagged inconsistent, remove the consensus directory and resync"
    };
    error.error_code = "DB_" + operation;
    return error;
}

ErrorMessage CErrorFormatter::NetworkError(const std::string& operation, const std::string& details) {
    ErrorMessage error(ErrorSeverity::WARNING,
                      "Network Operation Failed",
                      "Failed to " + operation + ": " + details);
    error.cause = "Network connectivity issue or address already in use";
    error.recovery_steps = {
        "Check that no other poolnode is bound to the same address",
        "Verify firewall settings allow the configured ports",
        "Choose different ports with --rpc-addr / --api-addr"
    };
    error.error_code = "NET_" + operation;
    return error;
}

ErrorMessage CErrorFormatter::ConfigError(const std::string& option, const std::string& details) {
    ErrorMessage error(ErrorSeverity::ERROR,
                      "Configuration Error",
                      "Invalid configuration for '" + option + "': " + details);
    error.cause = "Invalid or malformed configuration value";
    error.recovery_steps = {
        "Check poolnode.conf for syntax errors",
        "Verify the value is in the correct format",
        "Run with --help to see command-line options"
    };
    error.error_code = "CONFIG_" + option;
    return error;
}

ErrorMessage CErrorFormatter::StartupError(const std::string& stage, const std::string& details) {
    ErrorMessage error(ErrorSeverity::CRITICAL,
                      "Node Startup Failed",
                      "Failed to load " + stage + ": " + details);
    error.cause = "A module could not be constructed; the node was not started";
    error.recovery_steps = {
        "Read the cause above and the log file in the data directory",
        "Check that the data directory belongs to this network (mainnet/testnet/regtest)",
        "Run with --debug for more detail"
    };
    error.error_code = "STARTUP_" + stage;
    return error;
}
