// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/bootstrap.h>
#include <util/logging.h>

#include <algorithm>
#include <numeric>
#include <system_error>
#include <thread>

std::vector<std::string> SelectBootstrapPeers(const std::vector<std::string>& peers, size_t count,
                                              std::mt19937_64& rng) {
    std::vector<size_t> order(peers.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<std::string> selected;
    const size_t n = std::min(count, peers.size());
    selected.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        selected.push_back(peers[order[i]]);
    }
    return selected;
}

std::vector<std::string> SelectBootstrapPeers(const std::vector<std::string>& peers, size_t count) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return SelectBootstrapPeers(peers, count, gen);
}

size_t JoinBootstrapPeers(CNetworkModule& gateway, const std::vector<std::string>& peers, size_t count) {
    size_t started = 0;
    CThreadGroup& tg = gateway.ThreadGroup();

    for (const std::string& peer : SelectBootstrapPeers(peers, count)) {
        // Acquired here so a gateway shutdown racing with startup cannot
        // miss a dial that has not been scheduled yet
        if (!tg.Acquire()) {
            LogPrintf(NET, DEBUG, "Gateway stopped, skipping bootstrap peers");
            break;
        }
        try {
            std::thread([&gateway, &tg, peer]() {
                std::string error;
                if (!gateway.Connect(peer, error)) {
                    LogPrintf(NET, DEBUG, "Bootstrap connect to %s failed: %s", peer.c_str(), error.c_str());
                }
                tg.Release();
            }).detach();
            ++started;
        } catch (const std::system_error& e) {
            tg.Release();
            LogPrintf(NET, WARN, "Could not start bootstrap dial to %s: %s", peer.c_str(), e.what());
        }
    }

    LogPrintf(NET, INFO, "Dialing %zu bootstrap peers", started);
    return started;
}
