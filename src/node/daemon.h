// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_DAEMON_H
#define POOLNODE_NODE_DAEMON_H

#include <node/bootstrap.h>
#include <node/module_factory.h>
#include <node/modules.h>
#include <sync/threadgroup.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct DaemonConfig {
    std::string datadir;
    std::string rpcAddr;        // Gateway listen address
    std::string apiAddr;        // API server bind address
    std::string agent;          // Required User-Agent substring for API requests
    std::vector<std::string> bootstrapPeers;
    size_t bootstrapCount{BOOTSTRAP_CONNECTIONS};
};

/** Module construction stages, in the order they run */
enum class StartupStage {
    NONE,
    NETWORK,
    CHAIN_STATE,
    TRANSACTION_POOL,
    SERVING
};

/** Module name of a stage ("gateway", "consensus", ...) */
const char* StartupStageName(StartupStage stage);

struct StartupError {
    StartupStage stage{StartupStage::NONE};
    std::string cause;

    bool IsSet() const { return stage != StartupStage::NONE; }
    std::string ToString() const;
};

enum class DaemonState {
    IDLE,
    STARTING,
    RUNNING,
    FAILED,
    STOPPED
};

/**
 * CDaemon - builds the modules in dependency order and runs the API server
 *
 * Each module's Close() is registered on the daemon's thread group as soon
 * as the module exists, so stopping the daemon group closes the modules
 * newest-first: API server, transaction pool, consensus set, gateway.
 * The same path unwinds a partially built daemon when a stage fails.
 */
class CDaemon {
public:
    CDaemon(const DaemonConfig& config, CModuleFactory& factory);
    ~CDaemon();

    CDaemon(const CDaemon&) = delete;
    CDaemon& operator=(const CDaemon&) = delete;

    /**
     * Build the modules, dial bootstrap peers, then serve the API on the
     * calling thread. Blocks until the daemon is shut down.
     *
     * @return true on a clean shutdown; false if a stage failed to build
     *         (GetError() names it) or the API server failed. In both cases
     *         every module that was built has been closed.
     */
    bool Start();

    /**
     * Stop every module and wait for them to drain. Safe from any thread
     * and safe to call more than once. Start() returns after this.
     */
    void Shutdown();

    /** Only meaningful once Start() has returned */
    const StartupError& GetError() const { return m_error; }

    DaemonState GetState() const { return m_state.load(); }

    /** Bound API address once the serving stage is built, else empty */
    std::string ApiAddress() const;

    /** Bound gateway address once the network stage is built, else empty */
    std::string GatewayAddress() const;

private:
    bool Fail(StartupStage stage, const std::string& cause);
    void WaitStopped();

    const DaemonConfig m_config;
    CModuleFactory& m_factory;

    CThreadGroup m_tg;
    CStopSignal m_done;

    std::atomic<bool> m_started{false};
    std::atomic<DaemonState> m_state{DaemonState::IDLE};
    StartupError m_error;

    // Destroyed in reverse order: dependents before their dependencies
    mutable std::mutex cs_modules;
    std::unique_ptr<CNetworkModule> m_gateway;
    std::unique_ptr<CChainStateModule> m_consensus;
    std::unique_ptr<CTransactionPoolModule> m_tpool;
    std::unique_ptr<CServingModule> m_api;
};

#endif // POOLNODE_NODE_DAEMON_H
