// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

/**
 * Startup sequencing and shutdown of the whole daemon
 */

#include <boost/test/unit_test.hpp>

#include <core/chainparams.h>
#include <node/chainstate_db.h>
#include <net/sock.h>
#include <node/daemon.h>
#include <node/genesis.h>
#include <test/test_util.h>

#include <mutex>
#include <thread>

namespace {

/**
 * Real modules, plus: counts every Make* call, records the order in which
 * modules are closed, and can be told to fail one stage
 */
class CTestFactory : public CModuleFactory {
public:
    explicit CTestFactory(const Poolnode::ChainParams& params) : CModuleFactory(params) {}

    StartupStage fail_at{StartupStage::NONE};
    int made_gateway{0};
    int made_consensus{0};
    int made_tpool{0};
    int made_api{0};

    std::vector<std::string> Closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    std::unique_ptr<CNetworkModule> MakeGateway(const std::string& listen_addr, const std::string& dir,
                                                std::string& error) override {
        ++made_gateway;
        if (fail_at == StartupStage::NETWORK) {
            error = "injected gateway failure";
            return nullptr;
        }
        return Track(CModuleFactory::MakeGateway(listen_addr, dir, error));
    }

    std::unique_ptr<CChainStateModule> MakeConsensusSet(CNetworkModule& gateway, const std::string& dir,
                                                       std::string& error) override {
        ++made_consensus;
        if (fail_at == StartupStage::CHAIN_STATE) {
            error = "injected consensus failure";
            return nullptr;
        }
        return Track(CModuleFactory::MakeConsensusSet(gateway, dir, error));
    }

    std::unique_ptr<CTransactionPoolModule> MakeTransactionPool(CChainStateModule& consensus, CNetworkModule& gateway,
                                                               const std::string& dir, std::string& error) override {
        ++made_tpool;
        if (fail_at == StartupStage::TRANSACTION_POOL) {
            error = "injected transaction pool failure";
            return nullptr;
        }
        return Track(CModuleFactory::MakeTransactionPool(consensus, gateway, dir, error));
    }

    std::unique_ptr<CServingModule> MakeApiServer(const std::string& bind_addr, const std::string& agent,
                                                 CChainStateModule& consensus, CNetworkModule& gateway,
                                                 CTransactionPoolModule& tpool, std::string& error) override {
        ++made_api;
        if (fail_at == StartupStage::SERVING) {
            error = "injected api failure";
            return nullptr;
        }
        return Track(CModuleFactory::MakeApiServer(bind_addr, agent, consensus, gateway, tpool, error));
    }

private:
    template <typename T>
    std::unique_ptr<T> Track(std::unique_ptr<T> module) {
        if (module) {
            T* raw = module.get();
            module->ThreadGroup().OnStop([this, raw]() {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed.push_back(raw->Name());
            });
        }
        return module;
    }

    mutable std::mutex m_mutex;
    std::vector<std::string> m_closed;
};

DaemonConfig MakeConfig(const TempDir& dir, const Poolnode::ChainParams& params) {
    DaemonConfig config;
    config.datadir = dir.Path();
    config.rpcAddr = params.rpcAddr;
    config.apiAddr = params.apiAddr;
    config.agent = "Poolnode-Agent";
    config.bootstrapPeers = params.bootstrapPeers;
    return config;
}

} // namespace

BOOST_AUTO_TEST_SUITE(daemon_tests)

BOOST_AUTO_TEST_CASE(consensus_failure_stops_sequence) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    factory.fail_at = StartupStage::CHAIN_STATE;

    CDaemon daemon(MakeConfig(dir, params), factory);
    BOOST_CHECK(!daemon.Start());

    BOOST_CHECK(daemon.GetState() == DaemonState::FAILED);
    BOOST_CHECK(daemon.GetError().stage == StartupStage::CHAIN_STATE);
    BOOST_CHECK_EQUAL(daemon.GetError().cause, "injected consensus failure");
    BOOST_CHECK_EQUAL(daemon.GetError().ToString(), "loading consensus: injected consensus failure");

    BOOST_CHECK_EQUAL(factory.made_gateway, 1);
    BOOST_CHECK_EQUAL(factory.made_consensus, 1);
    BOOST_CHECK_EQUAL(factory.made_tpool, 0);
    BOOST_CHECK_EQUAL(factory.made_api, 0);

    // The gateway that was already up has been closed
    std::vector<std::string> closed = factory.Closed();
    BOOST_REQUIRE_EQUAL(closed.size(), 1u);
    BOOST_CHECK_EQUAL(closed[0], "gateway");
}

BOOST_AUTO_TEST_CASE(late_failure_unwinds_in_reverse) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    factory.fail_at = StartupStage::SERVING;

    CDaemon daemon(MakeConfig(dir, params), factory);
    BOOST_CHECK(!daemon.Start());
    BOOST_CHECK(daemon.GetError().stage == StartupStage::SERVING);

    std::vector<std::string> closed = factory.Closed();
    std::vector<std::string> expected = {"transactionpool", "consensus", "gateway"};
    BOOST_CHECK_EQUAL_COLLECTIONS(closed.begin(), closed.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(network_failure_builds_nothing_else) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    factory.fail_at = StartupStage::NETWORK;

    CDaemon daemon(MakeConfig(dir, params), factory);
    BOOST_CHECK(!daemon.Start());
    BOOST_CHECK(daemon.GetError().stage == StartupStage::NETWORK);
    BOOST_CHECK_EQUAL(factory.made_consensus, 0);
    BOOST_CHECK(factory.Closed().empty());
}

BOOST_AUTO_TEST_CASE(wrong_genesis_fails_consensus_stage) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();

    // Leave a testnet chain where the regtest daemon will look
    {
        CChainStateDB db;
        std::string error;
        BOOST_REQUIRE(db.Open(dir.Sub("consensus") + "/consensus.db", error));
        BOOST_REQUIRE(db.Load(Genesis::CreateGenesisBlock(Poolnode::ChainParams::Testnet()), error) ==
                      ChainDBError::OK);
    }

    CTestFactory factory(params);
    CDaemon daemon(MakeConfig(dir, params), factory);
    BOOST_CHECK(!daemon.Start());
    BOOST_CHECK(daemon.GetError().stage == StartupStage::CHAIN_STATE);
    BOOST_CHECK(daemon.GetError().cause.find("wrong genesis") != std::string::npos);
    BOOST_CHECK_EQUAL(factory.made_tpool, 0);
}

BOOST_AUTO_TEST_CASE(busy_api_address_fails_serving_stage) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();

    std::string busy_address, error;
    socket_t busy = CSock::Listen("127.0.0.1:0", busy_address, error);
    BOOST_REQUIRE(CSock::IsValid(busy));

    DaemonConfig config = MakeConfig(dir, params);
    config.apiAddr = busy_address;

    CTestFactory factory(params);
    CDaemon daemon(config, factory);
    BOOST_CHECK(!daemon.Start());
    BOOST_CHECK(daemon.GetError().stage == StartupStage::SERVING);
    BOOST_CHECK_EQUAL(factory.Closed().size(), 3u);

    CSock::Close(busy);
}

BOOST_AUTO_TEST_CASE(start_and_shutdown) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    CDaemon daemon(MakeConfig(dir, params), factory);

    bool result = false;
    std::thread runner([&]() { result = daemon.Start(); });

    bool running = WaitUntil([&]() { return daemon.GetState() == DaemonState::RUNNING; });
    if (!running) {
        daemon.Shutdown();
        runner.join();
    }
    BOOST_REQUIRE_MESSAGE(running, daemon.GetError().ToString());
    std::string response = HttpGet(daemon.ApiAddress(), "/daemon/version", "Poolnode-Agent");
    BOOST_CHECK_EQUAL(HttpStatus(response), 200);

    daemon.Shutdown();
    runner.join();

    BOOST_CHECK(result);
    BOOST_CHECK(daemon.GetState() == DaemonState::STOPPED);
    BOOST_CHECK(!daemon.GetError().IsSet());

    std::vector<std::string> closed = factory.Closed();
    std::vector<std::string> expected = {"api", "transactionpool", "consensus", "gateway"};
    BOOST_CHECK_EQUAL_COLLECTIONS(closed.begin(), closed.end(), expected.begin(), expected.end());

    // Second shutdown is harmless
    daemon.Shutdown();
}

BOOST_AUTO_TEST_CASE(api_stop_route_shuts_daemon_down) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    CDaemon daemon(MakeConfig(dir, params), factory);

    bool result = false;
    std::thread runner([&]() { result = daemon.Start(); });

    bool running = WaitUntil([&]() { return daemon.GetState() == DaemonState::RUNNING; });
    if (!running) {
        daemon.Shutdown();
        runner.join();
    }
    BOOST_REQUIRE_MESSAGE(running, daemon.GetError().ToString());
    BOOST_CHECK_EQUAL(HttpStatus(HttpGet(daemon.ApiAddress(), "/daemon/stop", "Poolnode-Agent")), 200);
    runner.join();

    BOOST_CHECK(result);
    BOOST_CHECK(daemon.GetState() == DaemonState::STOPPED);
    BOOST_CHECK_EQUAL(factory.Closed().size(), 4u);
}

BOOST_AUTO_TEST_CASE(restart_resumes_persisted_state) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();

    for (int run = 0; run < 2; ++run) {
        CTestFactory factory(params);
        CDaemon daemon(MakeConfig(dir, params), factory);
        bool result = false;
        std::thread runner([&]() { result = daemon.Start(); });
        bool running = WaitUntil([&]() { return daemon.GetState() == DaemonState::RUNNING; });
        if (!running) {
            daemon.Shutdown();
            runner.join();
        }
        BOOST_REQUIRE_MESSAGE(running, daemon.GetError().ToString());
        daemon.Shutdown();
        runner.join();
        BOOST_CHECK_MESSAGE(result, "run " << run << ": " << daemon.GetError().ToString());
    }
}

BOOST_AUTO_TEST_CASE(shutdown_before_start) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    CDaemon daemon(MakeConfig(dir, params), factory);

    daemon.Shutdown();
    BOOST_CHECK(daemon.Start());
    BOOST_CHECK(daemon.GetState() == DaemonState::STOPPED);
    BOOST_CHECK_EQUAL(factory.made_gateway, 0);
}

BOOST_AUTO_TEST_CASE(start_twice_is_refused) {
    TempDir dir;
    const Poolnode::ChainParams params = Poolnode::ChainParams::Regtest();
    CTestFactory factory(params);
    CDaemon daemon(MakeConfig(dir, params), factory);

    daemon.Shutdown();
    BOOST_CHECK(daemon.Start());
    BOOST_CHECK(!daemon.Start());
}

BOOST_AUTO_TEST_CASE(stage_names) {
    BOOST_CHECK_EQUAL(std::string(StartupStageName(StartupStage::NETWORK)), "gateway");
    BOOST_CHECK_EQUAL(std::string(StartupStageName(StartupStage::CHAIN_STATE)), "consensus");
    BOOST_CHECK_EQUAL(std::string(StartupStageName(StartupStage::TRANSACTION_POOL)), "transactionpool");
    BOOST_CHECK_EQUAL(std::string(StartupStageName(StartupStage::SERVING)), "api");
    BOOST_CHECK(!StartupError().IsSet());
}

BOOST_AUTO_TEST_SUITE_END()
