// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <core/chainparams.h>
#include <core/version.h>
#include <node/daemon.h>
#include <node/init.h>
#include <node/module_factory.h>
#include <util/config.h>
#include <util/error_format.h>
#include <util/logging.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Set from the signal handler; a watcher thread turns it into Shutdown()
std::atomic<bool> g_shutdown_requested{false};

// How often the watcher thread looks at g_shutdown_requested
const std::chrono::milliseconds SIGNAL_POLL_INTERVAL{100};

void SignalHandler(int) {
    g_shutdown_requested.store(true);
}

// API requests must carry this in their User-Agent
const char* const DEFAULT_AGENT = "Poolnode-Agent";

// Parse command line arguments
struct NodeConfig {
    bool testnet = false;
    bool regtest = false;
    bool debug = false;
    std::string datadir = "";       // Will be set based on network
    std::string rpcaddr = "";       // Will be set based on network
    std::string apiaddr = "";       // Will be set based on network
    std::string agent = "";
    std::vector<std::string> debug_categories;

    bool ParseArgs(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg == "--testnet") {
                testnet = true;
            }
            else if (arg == "--regtest") {
                regtest = true;
            }
            else if (arg == "--debug") {
                debug = true;
            }
            else if (arg.find("--debug=") == 0) {
                debug = true;
                debug_categories.push_back(arg.substr(8));
            }
            else if (arg.find("--datadir=") == 0) {
                datadir = arg.substr(10);
            }
            else if (arg.find("--rpc-addr=") == 0) {
                rpcaddr = arg.substr(11);
            }
            else if (arg.find("--api-addr=") == 0) {
                apiaddr = arg.substr(11);
            }
            else if (arg.find("--agent=") == 0) {
                agent = arg.substr(8);
            }
            else if (arg == "--help" || arg == "-h") {
                return false;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        }
        if (testnet && regtest) {
            std::cerr << "Error: --testnet and --regtest are mutually exclusive" << std::endl;
            return false;
        }
        return true;
    }

    void PrintUsage(const char* program) {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --datadir=<path>      Data directory (default: network-specific)" << std::endl;
        std::cout << "  --rpc-addr=<host:port> Gateway listen address (default: network-specific)" << std::endl;
        std::cout << "  --api-addr=<host:port> API server address (default: network-specific)" << std::endl;
        std::cout << "  --agent=<string>      Required User-Agent for API requests (default: " << DEFAULT_AGENT << ")" << std::endl;
        std::cout << "  --testnet             Use testnet" << std::endl;
        std::cout << "  --regtest             Use a private local network (no bootstrap peers)" << std::endl;
        std::cout << "  --debug               Log at DEBUG level" << std::endl;
        std::cout << "  --debug=<category>    Log at DEBUG level, only the given categories" << std::endl;
        std::cout << "                        (net, chain, txpool, api, init, sync; comma-separated)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Configuration file: poolnode.conf (in data directory)" << std::endl;
        std::cout << "  Environment variables: POOLNODE_* (e.g., POOLNODE_APIADDR=localhost:9980)" << std::endl;
        std::cout << "  Priority: Command-line > Environment > Config file > Default" << std::endl;
        std::cout << std::endl;
        std::cout << "Network Defaults:" << std::endl;
        std::cout << "  Mainnet:  datadir=.poolnode         rpc-addr=:9981   api-addr=localhost:9980" << std::endl;
        std::cout << "  Testnet:  datadir=.poolnode-testnet rpc-addr=:19981  api-addr=localhost:19980" << std::endl;
        std::cout << std::endl;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    NodeConfig config;
    if (!config.ParseArgs(argc, argv)) {
        config.PrintUsage(argv[0]);
        return 1;
    }

    // Load configuration from poolnode.conf in the initial data directory
    // (the file may switch to testnet, but it has to be found first)
    Poolnode::Network network = config.regtest ? Poolnode::REGTEST
                              : config.testnet ? Poolnode::TESTNET
                              : Poolnode::MAINNET;
    std::string initial_datadir = config.datadir;
    if (initial_datadir.empty()) {
        initial_datadir = GetDefaultDataDir(network == Poolnode::MAINNET ? "mainnet"
                                            : network == Poolnode::TESTNET ? "testnet" : "regtest");
    }

    std::string config_file = GetConfigFilePath(initial_datadir);
    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(config_file)) {
        ErrorMessage error = CErrorFormatter::ConfigError("conf", "failed to read " + config_file);
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        return 1;
    }

    // Priority: Command-line > Environment > Config file > Default
    if (network == Poolnode::MAINNET && config_parser.GetBool("testnet", false)) {
        network = Poolnode::TESTNET;
    }
    if (!config.debug) {
        config.debug = config_parser.GetBool("debug", false);
    }

    Poolnode::SelectParams(network);
    const Poolnode::ChainParams params = ApplyNetworkSettings(config_parser, *Poolnode::g_chainParams);

    if (config.datadir.empty()) {
        config.datadir = config_parser.GetString("datadir", "");
        if (config.datadir.empty()) {
            config.datadir = GetDefaultDataDir(params.GetNetworkName());
        }
    }
    if (config.rpcaddr.empty()) {
        config.rpcaddr = config_parser.GetString("rpcaddr", params.rpcAddr);
    }
    if (config.apiaddr.empty()) {
        config.apiaddr = config_parser.GetString("apiaddr", params.apiAddr);
    }
    if (config.agent.empty()) {
        config.agent = config_parser.GetString("agent", DEFAULT_AGENT);
    }

    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
        ErrorMessage error = CErrorFormatter::ConfigError("datadir", config.datadir + ": " + ec.message());
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        return 1;
    }

    // Logging
    CLoggingConfig& log_config = CLoggingConfig::GetInstance();
    log_config.SetLogFile(config.datadir + "/poolnode.log");
    if (config.debug) {
        log_config.SetLogLevel(LogLevel::LVL_DEBUG);
    }
    std::vector<std::string> categories = config.debug_categories;
    if (categories.empty()) {
        categories = config_parser.GetList("logcategory");
    }
    std::string category_error;
    if (!SetupLogCategories(categories, category_error)) {
        ErrorMessage error = CErrorFormatter::ConfigError("logcategory", category_error);
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        return 1;
    }
    ApplyLogRotationSettings(config_parser);
    if (!CLogger::GetInstance().Initialize(config.datadir)) {
        std::cerr << "Warning: continuing without a log file" << std::endl;
    }

    LogPrintf(INIT, INFO, "%s starting (%s)", GetFullVersionString().c_str(), params.GetNetworkName());
    LogPrintf(INIT, INFO, "Data directory: %s", config.datadir.c_str());
    if (log_config.IsFileLoggingEnabled()) {
        LogPrintf(INIT, INFO, "Logging to %s%s", log_config.GetLogFile().c_str(),
                  log_config.GetLogLevel() == LogLevel::LVL_DEBUG ? " (debug)" : "");
    }

    DaemonConfig daemon_config;
    daemon_config.datadir = config.datadir;
    daemon_config.rpcAddr = config.rpcaddr;
    daemon_config.apiAddr = config.apiaddr;
    daemon_config.agent = config.agent;
    daemon_config.bootstrapPeers = params.bootstrapPeers;
    daemon_config.bootstrapCount = GetBootstrapConnections(config_parser);

    CModuleFactory factory(params);
    CDaemon daemon(daemon_config, factory);

    if (std::signal(SIGINT, SignalHandler) == SIG_ERR) {
        LogPrintf(INIT, WARN, "Failed to install SIGINT handler");
    }
    if (std::signal(SIGTERM, SignalHandler) == SIG_ERR) {
        LogPrintf(INIT, WARN, "Failed to install SIGTERM handler");
    }

    CStopSignal watcher_exit;
    std::thread watcher([&daemon, &watcher_exit]() {
        while (!watcher_exit.WaitFor(SIGNAL_POLL_INTERVAL)) {
            if (g_shutdown_requested.load()) {
                LogPrintf(INIT, INFO, "Received signal, shutting down gracefully...");
                daemon.Shutdown();
                return;
            }
        }
    });

    bool ok = daemon.Start();

    watcher_exit.Set();
    watcher.join();

    if (!ok) {
        const StartupError& startup_error = daemon.GetError();
        ErrorMessage error = CErrorFormatter::StartupError(StartupStageName(startup_error.stage),
                                                           startup_error.cause);
        LogPrintf(INIT, ERROR, "%s", CErrorFormatter::FormatForLog(error).c_str());
        std::cerr << CErrorFormatter::FormatForUser(error) << std::endl;
        CLogger::GetInstance().Shutdown();
        return 1;
    }

    LogPrintf(INIT, INFO, "Poolnode stopped");
    CLogger::GetInstance().Shutdown();
    return 0;
}
