// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_MODULES_H
#define POOLNODE_NODE_MODULES_H

#include <primitives/block.h>
#include <sync/threadgroup.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Node modules
 *
 * The daemon is built from four modules, each constructed only after the
 * previous one succeeded:
 *
 *   gateway (network)  ->  consensus set (chain state)
 *                      ->  transaction pool  ->  API server (serving)
 *
 * Every module owns a CThreadGroup. Work that must finish before the
 * module's resources go away holds an acquisition; resources are released
 * by OnStop hooks. Close() stops the group and returns once everything
 * has drained.
 */
class CModule {
public:
    virtual ~CModule() = default;

    /** Short lowercase name used in logs and startup errors */
    virtual const char* Name() const = 0;

    CThreadGroup& ThreadGroup() { return m_tg; }

    /**
     * Stop the module and wait for its in-flight work
     * @return false if the module was already closed
     */
    bool Close() { return m_tg.Stop(); }

protected:
    CModule() = default;

    CThreadGroup m_tg;

private:
    CModule(const CModule&) = delete;
    CModule& operator=(const CModule&) = delete;
};

/** Peer-to-peer layer */
class CNetworkModule : public CModule {
public:
    /**
     * Dial a peer and keep the connection
     * @return false with error set if the dial failed or the module is stopped
     */
    virtual bool Connect(const std::string& address, std::string& error) = 0;

    /** Address the module listens on ("ip:port") */
    virtual std::string Address() const = 0;

    /** Addresses of connected peers */
    virtual std::vector<std::string> Peers() const = 0;
};

/** Chain state layer */
class CChainStateModule : public CModule {
public:
    virtual uint32_t Height() const = 0;
    virtual uint256 GenesisID() const = 0;
};

/** Pending transaction layer */
class CTransactionPoolModule : public CModule {
public:
    virtual bool AcceptTransaction(const uint256& txid, std::string& error) = 0;
    virtual size_t Size() const = 0;
};

/** Request serving layer */
class CServingModule : public CModule {
public:
    /**
     * Accept and answer requests until the module is stopped
     * @return false with error set on a fatal listener error
     */
    virtual bool Serve(std::string& error) = 0;

    virtual std::string Address() const = 0;
};

#endif // POOLNODE_NODE_MODULES_H
