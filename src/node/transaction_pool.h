// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_TRANSACTION_POOL_H
#define POOLNODE_NODE_TRANSACTION_POOL_H

#include <node/modules.h>

#include <mutex>
#include <set>
#include <string>

/**
 * CTransactionPool - unconfirmed transactions, by id
 *
 * Held in memory only; the directory is created so that the on-disk
 * layout matches the other modules. Cleared when the module stops.
 */
class CTransactionPool : public CTransactionPoolModule {
public:
    /** Upper bound on pooled transactions */
    static const size_t MAX_POOL_SIZE = 100000;

    CTransactionPool(CChainStateModule& consensus, CNetworkModule& gateway);
    ~CTransactionPool() override;

    bool Open(const std::string& dir, std::string& error);

    const char* Name() const override { return "transactionpool"; }

    bool AcceptTransaction(const uint256& txid, std::string& error) override;
    size_t Size() const override;

    bool Contains(const uint256& txid) const;

private:
    CChainStateModule& m_consensus;
    CNetworkModule& m_gateway;

    mutable std::mutex cs_pool;
    std::set<uint256> m_txids;
};

#endif // POOLNODE_NODE_TRANSACTION_POOL_H
