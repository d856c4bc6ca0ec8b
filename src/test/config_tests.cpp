// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <test/test_util.h>
#include <util/config.h>

#include <cstdlib>
#include <fstream>

namespace {

std::string WriteConfig(const TempDir& dir, const std::string& contents) {
    std::string path = GetConfigFilePath(dir.Path());
    std::ofstream file(path);
    file << contents;
    return path;
}

} // namespace

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(missing_file_uses_defaults) {
    TempDir dir;
    CConfigParser parser;
    BOOST_CHECK(parser.LoadConfigFile(dir.Sub("absent.conf")));
    BOOST_CHECK_EQUAL(parser.GetString("apiaddr", "localhost:9980"), "localhost:9980");
    BOOST_CHECK(!parser.IsSet("apiaddr"));
}

BOOST_AUTO_TEST_CASE(parses_values_and_comments) {
    TempDir dir;
    std::string path = WriteConfig(dir,
        "# poolnode configuration\n"
        "[main]\n"
        "apiaddr = 127.0.0.1:9990   # trailing comment\n"
        "agent=\"Poolnode-Agent/test\"\n"
        "testnet=yes\n"
        "debug=0\n"
        "; another comment\n"
        "maxpeers=32\n"
        "not a setting\n");

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(parser.GetString("apiaddr"), "127.0.0.1:9990");
    BOOST_CHECK_EQUAL(parser.GetString("agent"), "Poolnode-Agent/test");
    BOOST_CHECK(parser.GetBool("testnet", false));
    BOOST_CHECK(!parser.GetBool("debug", true));
    BOOST_CHECK_EQUAL(parser.GetInt64("maxpeers", 8), 32);
    BOOST_CHECK(parser.IsSet("APIADDR"));
}

BOOST_AUTO_TEST_CASE(repeated_keys) {
    TempDir dir;
    std::string path = WriteConfig(dir, "addnode=10.0.0.1:9981\naddnode=10.0.0.2:9981\n");

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path));
    std::vector<std::string> nodes = parser.GetList("addnode");
    BOOST_REQUIRE_EQUAL(nodes.size(), 2u);
    BOOST_CHECK_EQUAL(nodes[0], "10.0.0.1:9981");
    // Last one wins for scalar reads
    BOOST_CHECK_EQUAL(parser.GetString("addnode"), "10.0.0.2:9981");
}

BOOST_AUTO_TEST_CASE(invalid_values_fall_back) {
    TempDir dir;
    std::string path = WriteConfig(dir, "maxpeers=12abc\ndebug=maybe\n");

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(parser.GetInt64("maxpeers", 8), 8);
    BOOST_CHECK(parser.GetBool("debug", true));
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    TempDir dir;
    std::string path = WriteConfig(dir, "rpcaddr=:9981\n");

    CConfigParser parser;
    BOOST_REQUIRE(parser.LoadConfigFile(path));

    setenv("POOLNODE_RPCADDR", "127.0.0.1:7777", 1);
    BOOST_CHECK_EQUAL(parser.GetString("rpcaddr"), "127.0.0.1:7777");
    unsetenv("POOLNODE_RPCADDR");
    BOOST_CHECK_EQUAL(parser.GetString("rpcaddr"), ":9981");
}

BOOST_AUTO_TEST_CASE(default_paths) {
    BOOST_CHECK_EQUAL(GetConfigFilePath("/data"), "/data/poolnode.conf");

    std::string mainnet = GetDefaultDataDir("mainnet");
    std::string testnet = GetDefaultDataDir("testnet");
    BOOST_CHECK(mainnet.size() >= 9 && mainnet.compare(mainnet.size() - 9, 9, ".poolnode") == 0);
    BOOST_CHECK(testnet.find(".poolnode-testnet") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
