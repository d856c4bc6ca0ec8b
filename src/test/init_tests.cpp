// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <core/chainparams.h>
#include <node/bootstrap.h>
#include <node/init.h>
#include <test/test_util.h>
#include <util/config.h>
#include <util/logging.h>

#include <fstream>

namespace {

CConfigParser LoadConfig(const TempDir& dir, const std::string& contents) {
    std::string path = GetConfigFilePath(dir.Path());
    {
        std::ofstream file(path);
        file << contents;
    }
    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path));
    return parser;
}

} // namespace

BOOST_AUTO_TEST_SUITE(init_tests)

BOOST_AUTO_TEST_CASE(network_defaults_without_overrides) {
    TempDir dir;
    CConfigParser conf = LoadConfig(dir, "apiaddr=127.0.0.1:9990\n");
    Poolnode::ChainParams base = Poolnode::ChainParams::Testnet();

    Poolnode::ChainParams params = ApplyNetworkSettings(conf, base);
    BOOST_CHECK(params.bootstrapPeers == base.bootstrapPeers);
    BOOST_CHECK_EQUAL(params.dialTimeoutMs, base.dialTimeoutMs);
    BOOST_CHECK_EQUAL(params.acceptPollMs, base.acceptPollMs);
    BOOST_CHECK_EQUAL(GetBootstrapConnections(conf), BOOTSTRAP_CONNECTIONS);
}

BOOST_AUTO_TEST_CASE(configured_peers_replace_network_list) {
    TempDir dir;
    CConfigParser conf = LoadConfig(dir,
        "bootstrappeer=10.0.0.1:9981\n"
        "bootstrappeer=10.0.0.2:9981\n"
        "bootstrapconnections=1\n"
        "dialtimeout=1500\n"
        "acceptpoll=20\n");

    Poolnode::ChainParams params = ApplyNetworkSettings(conf, Poolnode::ChainParams::Mainnet());
    BOOST_REQUIRE_EQUAL(params.bootstrapPeers.size(), 2u);
    BOOST_CHECK_EQUAL(params.bootstrapPeers[0], "10.0.0.1:9981");
    BOOST_CHECK_EQUAL(params.bootstrapPeers[1], "10.0.0.2:9981");
    BOOST_CHECK_EQUAL(params.dialTimeoutMs, 1500u);
    BOOST_CHECK_EQUAL(params.acceptPollMs, 20u);
    BOOST_CHECK_EQUAL(GetBootstrapConnections(conf), 1u);
    // Everything else comes from the network
    BOOST_CHECK_EQUAL(params.rpcAddr, Poolnode::ChainParams::Mainnet().rpcAddr);
}

BOOST_AUTO_TEST_CASE(zero_connections_disables_bootstrap) {
    TempDir dir;
    CConfigParser conf = LoadConfig(dir, "bootstrapconnections=0\n");
    BOOST_CHECK_EQUAL(GetBootstrapConnections(conf), 0u);
}

BOOST_AUTO_TEST_CASE(invalid_values_are_ignored) {
    TempDir dir;
    CConfigParser conf = LoadConfig(dir,
        "dialtimeout=0\n"
        "acceptpoll=-5\n"
        "bootstrapconnections=many\n");
    Poolnode::ChainParams base = Poolnode::ChainParams::Regtest();

    Poolnode::ChainParams params = ApplyNetworkSettings(conf, base);
    BOOST_CHECK_EQUAL(params.dialTimeoutMs, base.dialTimeoutMs);
    BOOST_CHECK_EQUAL(params.acceptPollMs, base.acceptPollMs);
    BOOST_CHECK_EQUAL(GetBootstrapConnections(conf), BOOTSTRAP_CONNECTIONS);
}

BOOST_AUTO_TEST_CASE(environment_supplies_peer_list) {
    TempDir dir;
    CConfigParser conf = LoadConfig(dir, "bootstrappeer=10.0.0.1:9981\n");

    setenv("POOLNODE_BOOTSTRAPPEER", "10.1.1.1:9981, 10.1.1.2:9981", 1);
    Poolnode::ChainParams params = ApplyNetworkSettings(conf, Poolnode::ChainParams::Mainnet());
    unsetenv("POOLNODE_BOOTSTRAPPEER");

    BOOST_REQUIRE_EQUAL(params.bootstrapPeers.size(), 2u);
    BOOST_CHECK_EQUAL(params.bootstrapPeers[1], "10.1.1.2:9981");
}

BOOST_AUTO_TEST_CASE(log_rotation_settings) {
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    size_t saved_size = config.GetMaxLogSize();
    size_t saved_files = config.GetMaxLogFiles();

    TempDir dir;
    CConfigParser conf = LoadConfig(dir, "maxlogsize=2\nmaxlogfiles=4\n");
    ApplyLogRotationSettings(conf);
    BOOST_CHECK_EQUAL(config.GetMaxLogSize(), 2u * 1024 * 1024);
    BOOST_CHECK_EQUAL(config.GetMaxLogFiles(), 4u);

    // Out of range keeps what was there
    CConfigParser bad = LoadConfig(dir, "maxlogsize=0\nmaxlogfiles=-1\n");
    ApplyLogRotationSettings(bad);
    BOOST_CHECK_EQUAL(config.GetMaxLogSize(), 2u * 1024 * 1024);
    BOOST_CHECK_EQUAL(config.GetMaxLogFiles(), 4u);

    config.SetMaxLogSize(saved_size);
    config.SetMaxLogFiles(saved_files);
}

BOOST_AUTO_TEST_SUITE_END()
