// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <net/gateway.h>
#include <util/error_format.h>
#include <util/logging.h>

#include <sys/socket.h>
#include <cerrno>
#include <filesystem>

CGateway::CGateway(const Poolnode::ChainParams& params) : m_params(params) {}

CGateway::~CGateway() {
    Close();

    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    CSock::Close(m_listen_socket);
}

bool CGateway::Open(const std::string& listen_addr, const std::string& dir, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error = "cannot create gateway directory " + dir + ": " + ec.message();
        return false;
    }
    m_dir = dir;

    m_listen_socket = CSock::Listen(listen_addr, m_address, error);
    if (!CSock::IsValid(m_listen_socket)) {
        LogPrintf(NET, WARN, "%s",
                  CErrorFormatter::FormatForLog(CErrorFormatter::NetworkError("listen", error)).c_str());
        return false;
    }

    // Runs while Close() is draining, so only wake the accept loop here;
    // the descriptor is closed in the destructor once nobody polls it
    m_tg.OnStop([this]() {
        CSock::Shutdown(m_listen_socket);
        DisconnectAll();
    });

    if (!m_tg.Acquire()) {
        error = "gateway stopped during startup";
        return false;
    }
    try {
        m_accept_thread = std::thread(&CGateway::ThreadAccept, this);
    } catch (const std::exception& e) {
        m_tg.Release();
        error = std::string("failed to start accept thread: ") + e.what();
        return false;
    }

    LogPrintf(NET, INFO, "Gateway listening on %s", m_address.c_str());
    return true;
}

void CGateway::ThreadAccept() {
    const std::chrono::milliseconds poll_interval(m_params.acceptPollMs);
    CStopSignal& stop = m_tg.StopSignal();

    while (!stop.IsSet()) {
        int events = CSock::Wait(m_listen_socket, static_cast<int>(SocketEvent::RECV), poll_interval);
        if (events == 0 || stop.IsSet()) {
            continue;
        }
        if (events < 0) {
            LogPrintf(NET, ERROR, "Gateway listener poll failed: %s", CSock::GetErrorString().c_str());
            break;
        }

        socket_t sock = accept4(m_listen_socket, nullptr, nullptr, SOCK_CLOEXEC);
        if (!CSock::IsValid(sock)) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && !stop.IsSet()) {
                LogPrintf(NET, WARN, "Gateway accept failed: %s", CSock::GetErrorString().c_str());
            }
            continue;
        }

        std::string peer = CSock::GetPeerAddress(sock);
        std::lock_guard<std::mutex> lock(cs_peers);
        if (stop.IsSet() || m_peers.count(peer) > 0) {
            CSock::Close(sock);
            continue;
        }
        m_peers[peer] = sock;
        LogPrintf(NET, DEBUG, "Accepted inbound peer %s", peer.c_str());
    }

    m_tg.Release();
}

bool CGateway::Connect(const std::string& address, std::string& error) {
    CThreadGroupGuard guard(m_tg);
    if (!guard) {
        error = "gateway is stopped";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(cs_peers);
        if (m_peers.count(address) > 0) {
            error = "already connected to " + address;
            return false;
        }
    }

    socket_t sock = CSock::Connect(address, std::chrono::milliseconds(m_params.dialTimeoutMs),
                                   &m_tg.StopSignal(), error);
    if (!CSock::IsValid(sock)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_peers);
    // The stop hook may already have disconnected everyone
    if (m_tg.IsStopped()) {
        CSock::Close(sock);
        error = "gateway is stopped";
        return false;
    }
    if (m_peers.count(address) > 0) {
        CSock::Close(sock);
        error = "already connected to " + address;
        return false;
    }
    m_peers[address] = sock;
    LogPrintf(NET, INFO, "Connected to peer %s", address.c_str());
    return true;
}

std::string CGateway::Address() const {
    return m_address;
}

std::vector<std::string> CGateway::Peers() const {
    std::lock_guard<std::mutex> lock(cs_peers);
    std::vector<std::string> result;
    result.reserve(m_peers.size());
    for (const auto& entry : m_peers) {
        result.push_back(entry.first);
    }
    return result;
}

size_t CGateway::PeerCount() const {
    std::lock_guard<std::mutex> lock(cs_peers);
    return m_peers.size();
}

void CGateway::DisconnectAll() {
    std::lock_guard<std::mutex> lock(cs_peers);
    for (auto& entry : m_peers) {
        CSock::Close(entry.second);
    }
    if (!m_peers.empty()) {
        LogPrintf(NET, INFO, "Disconnected %zu peers", m_peers.size());
    }
    m_peers.clear();
}
