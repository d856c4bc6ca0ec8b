// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <test/test_util.h>
#include <net/sock.h>

#include <sys/socket.h>

std::string HttpGet(const std::string& address, const std::string& path, const std::string& user_agent) {
    std::string error;
    socket_t sock = CSock::Connect(address, std::chrono::seconds(5), nullptr, error);
    if (!CSock::IsValid(sock)) {
        return "";
    }
    CSock::SetRecvTimeout(sock, std::chrono::seconds(5));

    std::string request = "GET " + path + " HTTP/1.1\r\n"
                          "Host: " + address + "\r\n"
                          "User-Agent: " + user_agent + "\r\n"
                          "Connection: close\r\n\r\n";
    if (send(sock, request.data(), request.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(request.size())) {
        CSock::Close(sock);
        return "";
    }

    std::string response;
    char buffer[1024];
    ssize_t n;
    while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    CSock::Close(sock);
    return response;
}

int HttpStatus(const std::string& response) {
    // "HTTP/1.1 200 OK"
    size_t space = response.find(' ');
    if (space == std::string::npos || response.size() < space + 4) {
        return 0;
    }
    try {
        return std::stoi(response.substr(space + 1, 3));
    } catch (const std::exception&) {
        return 0;
    }
}

std::string HttpBody(const std::string& response) {
    size_t end = response.find("\r\n\r\n");
    return end == std::string::npos ? "" : response.substr(end + 4);
}
