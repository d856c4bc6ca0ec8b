// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license
//
// Socket utilities shared by the gateway and the API server

#ifndef POOLNODE_NET_SOCK_H
#define POOLNODE_NET_SOCK_H

#include <chrono>
#include <cstdint>
#include <string>

using socket_t = int;

class CStopSignal;

/**
 * Socket event types for CSock::Wait()
 */
enum class SocketEvent {
    RECV = 1,   // Ready to receive / accept
    SEND = 2,   // Ready to send / connect completed
    ERR = 4     // Error or hangup
};

/**
 * CSock - Low-level POSIX socket utilities
 */
class CSock {
public:
    //
    // Socket configuration
    //

    static bool SetNonBlocking(socket_t sock);
    static bool SetBlocking(socket_t sock);
    static bool SetRecvTimeout(socket_t sock, std::chrono::milliseconds timeout);
    static bool SetSendTimeout(socket_t sock, std::chrono::milliseconds timeout);
    static bool SetReuseAddr(socket_t sock, bool enable = true);

    //
    // Socket state
    //

    static bool IsValid(socket_t sock) { return sock >= 0; }

    /** Close socket and reset the handle to INVALID_SOCKET_VALUE */
    static void Close(socket_t& sock);

    /**
     * Wake up any thread blocked in poll()/accept() on this socket without
     * releasing the descriptor. The owner closes it once nobody uses it.
     */
    static void Shutdown(socket_t sock);

    //
    // Event waiting
    //

    /**
     * Wait for socket events using poll()
     * @return Events that occurred (0 on timeout, -1 on error)
     */
    static int Wait(socket_t sock, int events, std::chrono::milliseconds timeout);

    //
    // Addresses
    //

    /**
     * Split "host:port". An empty host (":9981") means all interfaces.
     * @return false if the port is missing or not a number in [0, 65535]
     */
    static bool SplitHostPort(const std::string& address, std::string& host, uint16_t& port);

    /** "ip:port" of the local end of a bound socket */
    static std::string GetLocalAddress(socket_t sock);

    /** "ip:port" of the remote end of a connected socket */
    static std::string GetPeerAddress(socket_t sock);

    //
    // Listening and dialing
    //

    /**
     * Create a TCP listener bound to address ("host:port", port 0 = ephemeral)
     * @param bound_address Receives the actual local address
     * @return listening socket, or INVALID_SOCKET_VALUE with error set
     */
    static socket_t Listen(const std::string& address, std::string& bound_address, std::string& error);

    /**
     * Dial address with a deadline. Gives up early if stop is set.
     * @return connected blocking socket, or INVALID_SOCKET_VALUE with error set
     */
    static socket_t Connect(const std::string& address, std::chrono::milliseconds timeout,
                            const CStopSignal* stop, std::string& error);

    //
    // Error handling
    //

    static std::string GetErrorString(int error = 0);

    static constexpr socket_t INVALID_SOCKET_VALUE = -1;
};

#endif // POOLNODE_NET_SOCK_H
