// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <api/api_server.h>
#include <core/version.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>

namespace {

// Requests larger than this are rejected
const size_t MAX_REQUEST_SIZE = 8192;

const std::chrono::seconds CLIENT_TIMEOUT{5};

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

const char* StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
    }
    return "Unknown";
}

} // namespace

CApiServer::CApiServer(const std::string& agent,
                       CChainStateModule& consensus,
                       CNetworkModule& gateway,
                       CTransactionPoolModule& tpool,
                       const Poolnode::ChainParams& params)
    : m_agent(agent), m_consensus(consensus), m_gateway(gateway), m_tpool(tpool), m_params(params) {}

CApiServer::~CApiServer() {
    Close();
    CSock::Close(m_listen_socket);
}

bool CApiServer::Open(const std::string& bind_addr, std::string& error) {
    m_listen_socket = CSock::Listen(bind_addr, m_address, error);
    if (!CSock::IsValid(m_listen_socket)) {
        return false;
    }

    m_tg.OnStop([this]() { CSock::Shutdown(m_listen_socket); });

    LogPrintf(API, INFO, "API server bound to %s", m_address.c_str());
    return true;
}

bool CApiServer::Serve(std::string& error) {
    CThreadGroupGuard guard(m_tg);
    if (!guard) {
        return true;  // Already stopped: nothing to serve
    }
    if (!CSock::IsValid(m_listen_socket)) {
        error = "API server is not bound";
        return false;
    }

    const std::chrono::milliseconds poll_interval(m_params.acceptPollMs);
    CStopSignal& stop = m_tg.StopSignal();

    LogPrintf(API, INFO, "API server accepting on %s", m_address.c_str());
    while (!stop.IsSet() && !m_stop_requested.IsSet()) {
        int events = CSock::Wait(m_listen_socket, static_cast<int>(SocketEvent::RECV), poll_interval);
        if (events == 0 || stop.IsSet()) {
            continue;
        }
        if (events < 0) {
            error = "API listener failed: " + CSock::GetErrorString();
            LogPrintf(API, ERROR, "%s", error.c_str());
            return false;
        }

        socket_t client = accept4(m_listen_socket, nullptr, nullptr, SOCK_CLOEXEC);
        if (!CSock::IsValid(client)) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && !stop.IsSet()) {
                LogPrintf(API, WARN, "API accept failed: %s", CSock::GetErrorString().c_str());
            }
            continue;
        }

        try {
            HandleConnection(client);
        } catch (const std::exception& e) {
            LogPrintf(API, ERROR, "Exception handling request: %s", e.what());
        }
        CSock::Close(client);
    }

    LogPrintf(API, INFO, "API server stopped accepting");
    return true;
}

void CApiServer::HandleConnection(socket_t client_socket) {
    CSock::SetRecvTimeout(client_socket, CLIENT_TIMEOUT);
    CSock::SetSendTimeout(client_socket, CLIENT_TIMEOUT);

    // Read until the end of the headers; request bodies are not used
    std::string raw;
    char buffer[1024];
    while (raw.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(client_socket, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            if (raw.empty()) return;
            break;
        }
        raw.append(buffer, static_cast<size_t>(n));
        if (raw.size() > MAX_REQUEST_SIZE) {
            SendResponse(client_socket, Error(413, "request too large"));
            return;
        }
    }

    Request request;
    if (!ParseRequest(raw, request)) {
        SendResponse(client_socket, Error(400, "malformed request"));
        return;
    }

    LogPrintf(API, DEBUG, "%s %s", request.method.c_str(), request.path.c_str());
    SendResponse(client_socket, Route(request));
}

bool CApiServer::ParseRequest(const std::string& raw, Request& request) {
    std::istringstream stream(raw);
    std::string line;

    // Request line: METHOD PATH HTTP/1.x
    if (!std::getline(stream, line)) {
        return false;
    }
    std::istringstream request_line(line);
    std::string version;
    if (!(request_line >> request.method >> request.path >> version)) {
        return false;
    }
    size_t query = request.path.find('?');
    if (query != std::string::npos) {
        request.path.erase(query);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (ToLower(line.substr(0, colon)) == "user-agent") {
            size_t start = line.find_first_not_of(" \t", colon + 1);
            request.user_agent = start == std::string::npos ? "" : line.substr(start);
        }
    }
    return true;
}

CApiServer::Response CApiServer::Route(const Request& request) {
    if (request.user_agent.find(m_agent) == std::string::npos) {
        return Error(400, "Browser access disabled due to security vulnerability. "
                          "Use a client that sends the " + m_agent + " user agent.");
    }
    if (request.method != "GET") {
        return Error(405, "method not allowed");
    }

    Response response;
    std::ostringstream json;

    if (request.path == "/daemon/version") {
        json << "{\"version\":\"" << EscapeJSON(GetVersionString()) << "\"}";
    } else if (request.path == "/daemon/stop") {
        LogPrintf(API, INFO, "Shutdown requested through the API");
        RequestStop();
        json << "{\"success\":true}";
    } else if (request.path == "/consensus") {
        json << "{\"height\":" << m_consensus.Height()
             << ",\"genesis\":\"" << m_consensus.GenesisID().GetHex() << "\""
             << ",\"network\":\"" << m_params.GetNetworkName() << "\"}";
    } else if (request.path == "/gateway") {
        std::vector<std::string> peers = m_gateway.Peers();
        json << "{\"netaddress\":\"" << EscapeJSON(m_gateway.Address()) << "\",\"peers\":[";
        for (size_t i = 0; i < peers.size(); ++i) {
            if (i > 0) json << ",";
            json << "\"" << EscapeJSON(peers[i]) << "\"";
        }
        json << "]}";
    } else if (request.path == "/tpool") {
        json << "{\"transactions\":" << m_tpool.Size() << "}";
    } else {
        return Error(404, "unrecognized path " + request.path);
    }

    response.body = json.str();
    return response;
}

CApiServer::Response CApiServer::Error(int status, const std::string& message) {
    Response response;
    response.status = status;
    response.body = "{\"message\":\"" + EscapeJSON(message) + "\"}";
    return response;
}

void CApiServer::SendResponse(socket_t client_socket, const Response& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << StatusText(response.status) << "\r\n";
    out << "Content-Type: application/json\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << response.body;

    const std::string data = out.str();
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            LogPrintf(API, WARN, "Failed to send HTTP response: %s", CSock::GetErrorString().c_str());
            return;
        }
        sent += static_cast<size_t>(n);
    }
}
