// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/transaction_pool.h>
#include <util/logging.h>

#include <filesystem>

CTransactionPool::CTransactionPool(CChainStateModule& consensus, CNetworkModule& gateway)
    : m_consensus(consensus), m_gateway(gateway) {}

CTransactionPool::~CTransactionPool() {
    Close();
}

bool CTransactionPool::Open(const std::string& dir, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error = "cannot create transaction pool directory " + dir + ": " + ec.message();
        return false;
    }

    m_tg.OnStop([this]() {
        std::lock_guard<std::mutex> lock(cs_pool);
        if (!m_txids.empty()) {
            LogPrintf(TXPOOL, INFO, "Dropping %zu unconfirmed transactions", m_txids.size());
        }
        m_txids.clear();
    });

    LogPrintf(TXPOOL, INFO, "Transaction pool ready at height %u (%zu peers)",
              m_consensus.Height(), m_gateway.Peers().size());
    return true;
}

bool CTransactionPool::AcceptTransaction(const uint256& txid, std::string& error) {
    CThreadGroupGuard guard(m_tg);
    if (!guard) {
        error = "transaction pool is stopped";
        return false;
    }
    if (txid.IsNull()) {
        error = "null transaction id";
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_pool);
    // The stop hook may already have emptied the pool
    if (m_tg.IsStopped()) {
        error = "transaction pool is stopped";
        return false;
    }
    if (m_txids.size() >= MAX_POOL_SIZE) {
        error = "transaction pool is full";
        return false;
    }
    if (!m_txids.insert(txid).second) {
        error = "transaction already in pool";
        return false;
    }
    LogPrintf(TXPOOL, DEBUG, "Accepted transaction %s", txid.GetHex().c_str());
    return true;
}

size_t CTransactionPool::Size() const {
    std::lock_guard<std::mutex> lock(cs_pool);
    return m_txids.size();
}

bool CTransactionPool::Contains(const uint256& txid) const {
    std::lock_guard<std::mutex> lock(cs_pool);
    return m_txids.count(txid) > 0;
}
