// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#ifndef POOLNODE_NODE_MODULE_FACTORY_H
#define POOLNODE_NODE_MODULE_FACTORY_H

#include <core/chainparams.h>
#include <node/modules.h>

#include <memory>
#include <string>

/**
 * Builds the daemon's modules
 *
 * Every Make* call returns an opened, ready module, or nullptr with error
 * set. Tests subclass this to inject failures or stand-in modules.
 */
class CModuleFactory {
public:
    explicit CModuleFactory(const Poolnode::ChainParams& params) : m_params(params) {}
    virtual ~CModuleFactory() = default;

    virtual std::unique_ptr<CNetworkModule> MakeGateway(const std::string& listen_addr,
                                                        const std::string& dir,
                                                        std::string& error);

    virtual std::unique_ptr<CChainStateModule> MakeConsensusSet(CNetworkModule& gateway,
                                                               const std::string& dir,
                                                               std::string& error);

    virtual std::unique_ptr<CTransactionPoolModule> MakeTransactionPool(CChainStateModule& consensus,
                                                                       CNetworkModule& gateway,
                                                                       const std::string& dir,
                                                                       std::string& error);

    virtual std::unique_ptr<CServingModule> MakeApiServer(const std::string& bind_addr,
                                                         const std::string& agent,
                                                         CChainStateModule& consensus,
                                                         CNetworkModule& gateway,
                                                         CTransactionPoolModule& tpool,
                                                         std::string& error);

    const Poolnode::ChainParams& Params() const { return m_params; }

protected:
    const Poolnode::ChainParams& m_params;
};

#endif // POOLNODE_NODE_MODULE_FACTORY_H
