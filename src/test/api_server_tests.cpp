// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <api/api_server.h>
#include <core/chainparams.h>
#include <core/version.h>
#include <net/gateway.h>
#include <node/consensus_set.h>
#include <node/genesis.h>
#include <node/transaction_pool.h>
#include <test/test_util.h>

#include <thread>

namespace {

const char* const AGENT = "Poolnode-Agent";

/** A full module stack with the API server served from a background thread */
struct ApiFixture {
    TempDir dir;
    Poolnode::ChainParams params{Poolnode::ChainParams::Regtest()};
    CGateway gateway{params};
    CConsensusSet consensus{gateway, params};
    CTransactionPool tpool{consensus, gateway};
    CApiServer api{AGENT, consensus, gateway, tpool, params};

    std::thread server;
    bool serve_result{false};
    std::string serve_error;

    ApiFixture() {
        std::string error;
        BOOST_REQUIRE_MESSAGE(gateway.Open("127.0.0.1:0", dir.Sub("gateway"), error), error);
        BOOST_REQUIRE_MESSAGE(consensus.Open(dir.Sub("consensus"), error), error);
        BOOST_REQUIRE_MESSAGE(tpool.Open(dir.Sub("transactionpool"), error), error);
        BOOST_REQUIRE_MESSAGE(api.Open("127.0.0.1:0", error), error);
        server = std::thread([this]() { serve_result = api.Serve(serve_error); });
    }

    ~ApiFixture() {
        api.Close();
        if (server.joinable()) server.join();
    }

    std::string Get(const std::string& path, const std::string& agent = AGENT) {
        return HttpGet(api.Address(), path, agent);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(api_server_tests, ApiFixture)

BOOST_AUTO_TEST_CASE(version) {
    std::string response = Get("/daemon/version");
    BOOST_CHECK_EQUAL(HttpStatus(response), 200);
    BOOST_CHECK(HttpBody(response).find(GetVersionString()) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(rejects_foreign_user_agent) {
    std::string response = Get("/daemon/version", "Mozilla/5.0");
    BOOST_CHECK_EQUAL(HttpStatus(response), 400);
    BOOST_CHECK(HttpBody(response).find("Browser access disabled") != std::string::npos);

    // Contained anywhere in the header is enough
    BOOST_CHECK_EQUAL(HttpStatus(Get("/daemon/version", "poolnodec/1.0 Poolnode-Agent")), 200);
}

BOOST_AUTO_TEST_CASE(unknown_path) {
    BOOST_CHECK_EQUAL(HttpStatus(Get("/renter/files")), 404);
}

BOOST_AUTO_TEST_CASE(module_routes) {
    std::string consensus_body = HttpBody(Get("/consensus"));
    BOOST_CHECK(consensus_body.find("\"height\":0") != std::string::npos);
    BOOST_CHECK(consensus_body.find(Genesis::GetGenesisHash(params).GetHex()) != std::string::npos);

    std::string gateway_body = HttpBody(Get("/gateway"));
    BOOST_CHECK(gateway_body.find(gateway.Address()) != std::string::npos);

    uint256 txid;
    txid.data[0] = 0x42;
    std::string error;
    BOOST_REQUIRE(tpool.AcceptTransaction(txid, error));
    BOOST_CHECK(HttpBody(Get("/tpool")).find("\"transactions\":1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(stop_route_ends_serve) {
    BOOST_CHECK_EQUAL(HttpStatus(Get("/daemon/stop")), 200);
    server.join();
    BOOST_CHECK(serve_result);
    BOOST_CHECK(serve_error.empty());
}

BOOST_AUTO_TEST_CASE(close_ends_serve) {
    BOOST_CHECK(api.Close());
    server.join();
    BOOST_CHECK(serve_result);
    BOOST_CHECK(!api.Close());
}

BOOST_AUTO_TEST_SUITE_END()
