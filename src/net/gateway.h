// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NET_GATEWAY_H
#define POOLNODE_NET_GATEWAY_H

#include <core/chainparams.h>
#include <net/sock.h>
#include <node/modules.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * CGateway - peer-to-peer connection manager
 *
 * Listens for inbound peers and dials outbound ones. The accept loop runs
 * on its own thread under an acquisition of the gateway's thread group;
 * every Connect() call holds one too, so Close() waits for in-progress
 * dials. The stop hook shuts the listener and disconnects all peers.
 *
 * Only connection bookkeeping is done here. The peer protocol runs on top.
 */
class CGateway : public CNetworkModule {
public:
    explicit CGateway(const Poolnode::ChainParams& params);
    ~CGateway() override;

    /**
     * Create the gateway directory, bind the listener and start accepting
     * @param listen_addr "host:port" (":9981" for all interfaces, port 0 for ephemeral)
     */
    bool Open(const std::string& listen_addr, const std::string& dir, std::string& error);

    const char* Name() const override { return "gateway"; }

    bool Connect(const std::string& address, std::string& error) override;
    std::string Address() const override;
    std::vector<std::string> Peers() const override;

    size_t PeerCount() const;

private:
    void ThreadAccept();
    void DisconnectAll();

    const Poolnode::ChainParams& m_params;

    socket_t m_listen_socket{CSock::INVALID_SOCKET_VALUE};
    std::string m_address;
    std::string m_dir;
    std::thread m_accept_thread;

    // address -> socket
    mutable std::mutex cs_peers;
    std::map<std::string, socket_t> m_peers;
};

#endif // POOLNODE_NET_GATEWAY_H
