// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/daemon.h>
#include <util/logging.h>

namespace {

/**
 * Hand a freshly built module to the daemon and tie its Close() to the
 * daemon's thread group. If the daemon is already stopping, the hook runs
 * right here and the module is closed before this returns.
 *
 * @return false if the daemon is stopping
 */
template <typename T>
bool AdoptModule(CThreadGroup& tg, std::mutex& mutex, std::unique_ptr<T>& slot, std::unique_ptr<T> module) {
    T& ref = *module;
    {
        std::lock_guard<std::mutex> lock(mutex);
        slot = std::move(module);
    }
    tg.OnStop([&ref]() {
        ref.Close();
        LogPrintf(INIT, INFO, "Closed %s", ref.Name());
    });
    return !tg.IsStopped();
}

} // namespace

const char* StartupStageName(StartupStage stage) {
    switch (stage) {
        case StartupStage::NONE: return "none";
        case StartupStage::NETWORK: return "gateway";
        case StartupStage::CHAIN_STATE: return "consensus";
        case StartupStage::TRANSACTION_POOL: return "transactionpool";
        case StartupStage::SERVING: return "api";
    }
    return "unknown";
}

std::string StartupError::ToString() const {
    if (!IsSet()) {
        return "";
    }
    return std::string("loading ") + StartupStageName(stage) + ": " + cause;
}

CDaemon::CDaemon(const DaemonConfig& config, CModuleFactory& factory)
    : m_config(config), m_factory(factory) {}

CDaemon::~CDaemon() {
    Shutdown();
    WaitStopped();
}

bool CDaemon::Start() {
    if (m_started.exchange(true)) {
        LogPrintf(INIT, ERROR, "Daemon already started");
        return false;
    }
    if (m_tg.IsStopped()) {
        m_state.store(DaemonState::STOPPED);
        return true;
    }
    m_state.store(DaemonState::STARTING);

    std::string error;

    LogPrintf(INIT, INFO, "Loading gateway (1/4)...");
    auto gateway = m_factory.MakeGateway(m_config.rpcAddr, m_config.datadir + "/gateway", error);
    if (!gateway) {
        return Fail(StartupStage::NETWORK, error);
    }
    CNetworkModule& gateway_ref = *gateway;
    if (!AdoptModule(m_tg, cs_modules, m_gateway, std::move(gateway))) {
        LogPrintf(INIT, INFO, "Shutdown requested during startup");
        WaitStopped();
        m_state.store(DaemonState::STOPPED);
        return true;
    }

    LogPrintf(INIT, INFO, "Loading consensus (2/4)...");
    auto consensus = m_factory.MakeConsensusSet(gateway_ref, m_config.datadir + "/consensus", error);
    if (!consensus) {
        return Fail(StartupStage::CHAIN_STATE, error);
    }
    CChainStateModule& consensus_ref = *consensus;
    if (!AdoptModule(m_tg, cs_modules, m_consensus, std::move(consensus))) {
        LogPrintf(INIT, INFO, "Shutdown requested during startup");
        WaitStopped();
        m_state.store(DaemonState::STOPPED);
        return true;
    }

    LogPrintf(INIT, INFO, "Loading transaction pool (3/4)...");
    auto tpool = m_factory.MakeTransactionPool(consensus_ref, gateway_ref,
                                               m_config.datadir + "/transactionpool", error);
    if (!tpool) {
        return Fail(StartupStage::TRANSACTION_POOL, error);
    }
    CTransactionPoolModule& tpool_ref = *tpool;
    if (!AdoptModule(m_tg, cs_modules, m_tpool, std::move(tpool))) {
        LogPrintf(INIT, INFO, "Shutdown requested during startup");
        WaitStopped();
        m_state.store(DaemonState::STOPPED);
        return true;
    }

    LogPrintf(INIT, INFO, "Loading API server (4/4)...");
    auto api = m_factory.MakeApiServer(m_config.apiAddr, m_config.agent,
                                       consensus_ref, gateway_ref, tpool_ref, error);
    if (!api) {
        return Fail(StartupStage::SERVING, error);
    }
    CServingModule& api_ref = *api;
    if (!AdoptModule(m_tg, cs_modules, m_api, std::move(api))) {
        LogPrintf(INIT, INFO, "Shutdown requested during startup");
        WaitStopped();
        m_state.store(DaemonState::STOPPED);
        return true;
    }

    m_state.store(DaemonState::RUNNING);
    LogPrintf(INIT, INFO, "Daemon running: gateway %s, API %s",
              gateway_ref.Address().c_str(), api_ref.Address().c_str());

    JoinBootstrapPeers(gateway_ref, m_config.bootstrapPeers, m_config.bootstrapCount);

    bool ok = api_ref.Serve(error);
    if (!ok) {
        m_error.stage = StartupStage::SERVING;
        m_error.cause = error;
        LogPrintf(INIT, ERROR, "API server failed: %s", error.c_str());
    }

    Shutdown();
    WaitStopped();
    m_state.store(ok ? DaemonState::STOPPED : DaemonState::FAILED);
    return ok;
}

bool CDaemon::Fail(StartupStage stage, const std::string& cause) {
    m_error.stage = stage;
    m_error.cause = cause;
    LogPrintf(INIT, ERROR, "Startup failed %s", m_error.ToString().c_str());

    // Close whatever was already built, newest first
    Shutdown();
    WaitStopped();
    m_state.store(DaemonState::FAILED);
    return false;
}

void CDaemon::Shutdown() {
    if (m_tg.IsStopped()) {
        return;
    }
    LogPrintf(INIT, INFO, "Shutting down...");
    if (m_tg.Stop()) {
        LogPrintf(INIT, INFO, "Shutdown complete");
        m_done.Set();
    }
}

void CDaemon::WaitStopped() {
    m_done.Wait();
}

std::string CDaemon::ApiAddress() const {
    std::lock_guard<std::mutex> lock(cs_modules);
    return m_api ? m_api->Address() : "";
}

std::string CDaemon::GatewayAddress() const {
    std::lock_guard<std::mutex> lock(cs_modules);
    return m_gateway ? m_gateway->Address() : "";
}
