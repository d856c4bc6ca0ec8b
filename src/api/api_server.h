// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_API_API_SERVER_H
#define POOLNODE_API_API_SERVER_H

#include <core/chainparams.h>
#include <net/sock.h>
#include <node/modules.h>

#include <string>

/**
 * CApiServer - HTTP API of the daemon
 *
 * Open() binds the listener; Serve() accepts on the calling thread until
 * the module is stopped or a client requests /daemon/stop. Requests are
 * handled one at a time.
 *
 * Routes (GET):
 *   /daemon/version   - daemon version
 *   /daemon/stop      - make Serve() return; the daemon then shuts down
 *   /consensus        - height and genesis id
 *   /gateway          - listen address and peers
 *   /tpool            - number of unconfirmed transactions
 *
 * Every request must carry a User-Agent containing the configured agent
 * string, otherwise it is answered with 400. This keeps browsers from
 * driving the API through cross-site requests.
 */
class CApiServer : public CServingModule {
public:
    CApiServer(const std::string& agent,
               CChainStateModule& consensus,
               CNetworkModule& gateway,
               CTransactionPoolModule& tpool,
               const Poolnode::ChainParams& params);
    ~CApiServer() override;

    /** Bind the listener. Does not accept yet. */
    bool Open(const std::string& bind_addr, std::string& error);

    const char* Name() const override { return "api"; }

    bool Serve(std::string& error) override;
    std::string Address() const override { return m_address; }

    /** Make Serve() return after the current request */
    void RequestStop() { m_stop_requested.Set(); }

private:
    struct Request {
        std::string method;
        std::string path;
        std::string user_agent;
    };

    struct Response {
        int status{200};
        std::string body;
    };

    void HandleConnection(socket_t client_socket);
    static bool ParseRequest(const std::string& raw, Request& request);
    Response Route(const Request& request);
    static void SendResponse(socket_t client_socket, const Response& response);
    static Response Error(int status, const std::string& message);

    const std::string m_agent;
    CChainStateModule& m_consensus;
    CNetworkModule& m_gateway;
    CTransactionPoolModule& m_tpool;
    const Poolnode::ChainParams& m_params;

    socket_t m_listen_socket{CSock::INVALID_SOCKET_VALUE};
    std::string m_address;
    CStopSignal m_stop_requested;
};

#endif // POOLNODE_API_API_SERVER_H
