// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license
//
// Socket utilities implementation

#include <net/sock.h>
#include <sync/threadgroup.h>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cctype>
#include <cstring>

#include <algorithm>
#include <memory>

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { freeaddrinfo(ai); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// Listen backlog for both the gateway and the API server
const int LISTEN_BACKLOG = 16;

// Connect() re-checks the stop signal at least this often
const std::chrono::milliseconds DIAL_POLL_INTERVAL{100};

bool Resolve(const std::string& host, uint16_t port, bool passive, AddrInfoPtr& result, std::string& error) {
    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = passive ? AI_PASSIVE : 0;

    std::string service = std::to_string(port);
    const char* node = host.empty() ? (passive ? nullptr : "127.0.0.1") : host.c_str();

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(node, service.c_str(), &hints, &raw);
    if (rc != 0) {
        error = "cannot resolve " + (host.empty() ? std::string("*") : host) + ": " + gai_strerror(rc);
        return false;
    }
    result.reset(raw);
    return true;
}

std::string FormatSockAddr(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* sin = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(ntohs(sin->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* sin6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        return "[" + std::string(buf) + "]:" + std::to_string(ntohs(sin6->sin6_port));
    }
    return "";
}

} // namespace

bool CSock::SetNonBlocking(socket_t sock) {
    if (!IsValid(sock)) return false;
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool CSock::SetBlocking(socket_t sock) {
    if (!IsValid(sock)) return false;
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(sock, F_SETFL, flags & ~O_NONBLOCK) == 0;
}

bool CSock::SetRecvTimeout(socket_t sock, std::chrono::milliseconds timeout) {
    if (!IsValid(sock)) return false;
    struct timeval tv;
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;
    return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool CSock::SetSendTimeout(socket_t sock, std::chrono::milliseconds timeout) {
    if (!IsValid(sock)) return false;
    struct timeval tv;
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;
    return setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool CSock::SetReuseAddr(socket_t sock, bool enable) {
    if (!IsValid(sock)) return false;
    int flag = enable ? 1 : 0;
    return setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) == 0;
}

void CSock::Close(socket_t& sock) {
    if (!IsValid(sock)) return;
    close(sock);
    sock = INVALID_SOCKET_VALUE;
}

void CSock::Shutdown(socket_t sock) {
    if (!IsValid(sock)) return;
    // ENOTCONN is expected on listeners and already-closed peers
    shutdown(sock, SHUT_RDWR);
}

int CSock::Wait(socket_t sock, int events, std::chrono::milliseconds timeout) {
    if (!IsValid(sock)) return -1;

    pollfd pfd;
    pfd.fd = sock;
    pfd.events = 0;
    pfd.revents = 0;
    if (events & static_cast<int>(SocketEvent::RECV)) pfd.events |= POLLIN;
    if (events & static_cast<int>(SocketEvent::SEND)) pfd.events |= POLLOUT;

    int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0) {
        return 0;
    }

    int result = 0;
    if (pfd.revents & POLLIN) result |= static_cast<int>(SocketEvent::RECV);
    if (pfd.revents & POLLOUT) result |= static_cast<int>(SocketEvent::SEND);
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) result |= static_cast<int>(SocketEvent::ERR);
    return result;
}

bool CSock::SplitHostPort(const std::string& address, std::string& host, uint16_t& port) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }

    host = address.substr(0, colon);
    // [v6]:port
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    std::string port_str = address.substr(colon + 1);
    if (port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    unsigned long value = std::stoul(port_str);
    if (value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

std::string CSock::GetLocalAddress(socket_t sock) {
    sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        return "";
    }
    return FormatSockAddr(ss);
}

std::string CSock::GetPeerAddress(socket_t sock) {
    sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    if (getpeername(sock, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        return "";
    }
    return FormatSockAddr(ss);
}

socket_t CSock::Listen(const std::string& address, std::string& bound_address, std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!SplitHostPort(address, host, port)) {
        error = "invalid listen address '" + address + "' (expected host:port)";
        return INVALID_SOCKET_VALUE;
    }

    AddrInfoPtr addrs;
    if (!Resolve(host, port, true, addrs, error)) {
        return INVALID_SOCKET_VALUE;
    }

    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (!IsValid(sock)) {
            error = "socket: " + GetErrorString();
            continue;
        }
        SetReuseAddr(sock);
        if (bind(sock, ai->ai_addr, ai->ai_addrlen) != 0) {
            error = "bind " + address + ": " + GetErrorString();
            Close(sock);
            continue;
        }
        if (listen(sock, LISTEN_BACKLOG) != 0) {
            error = "listen " + address + ": " + GetErrorString();
            Close(sock);
            continue;
        }
        // Accept loops poll first; a peer that resets before accept() must not block them
        SetNonBlocking(sock);
        bound_address = GetLocalAddress(sock);
        error.clear();
        return sock;
    }

    if (error.empty()) {
        error = "no usable address for " + address;
    }
    return INVALID_SOCKET_VALUE;
}

socket_t CSock::Connect(const std::string& address, std::chrono::milliseconds timeout,
                        const CStopSignal* stop, std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!SplitHostPort(address, host, port) || port == 0) {
        error = "invalid peer address '" + address + "'";
        return INVALID_SOCKET_VALUE;
    }

    AddrInfoPtr addrs;
    if (!Resolve(host, port, false, addrs, error)) {
        return INVALID_SOCKET_VALUE;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (!IsValid(sock)) {
            error = "socket: " + GetErrorString();
            continue;
        }
        SetNonBlocking(sock);

        if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            SetBlocking(sock);
            return sock;
        }
        if (errno != EINPROGRESS) {
            error = "connect " + address + ": " + GetErrorString();
            Close(sock);
            continue;
        }

        bool connected = false;
        while (true) {
            if (stop != nullptr && stop->IsSet()) {
                error = "connect " + address + ": interrupted by shutdown";
                Close(sock);
                return INVALID_SOCKET_VALUE;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                error = "connect " + address + ": timed out";
                break;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int events = Wait(sock, static_cast<int>(SocketEvent::SEND), std::min(remaining, DIAL_POLL_INTERVAL));
            if (events < 0) {
                error = "connect " + address + ": " + GetErrorString();
                break;
            }
            if (events == 0) {
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                so_error = errno;
            }
            if (so_error != 0) {
                error = "connect " + address + ": " + GetErrorString(so_error);
            } else {
                connected = true;
            }
            break;
        }

        if (connected) {
            SetBlocking(sock);
            error.clear();
            return sock;
        }
        Close(sock);
    }

    return INVALID_SOCKET_VALUE;
}

std::string CSock::GetErrorString(int error) {
    if (error == 0) {
        error = errno;
    }
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(error, buf, sizeof(buf));
    return std::string(msg);
}
