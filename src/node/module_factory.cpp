// Copyright (c) 2025 The Poolnode developers
// Distributed under the MIT software license

#include <node/module_factory.h>
#include <api/api_server.h>
#include <net/gateway.h>
#include <node/consensus_set.h>
#include <node/transaction_pool.h>

std::unique_ptr<CNetworkModule> CModuleFactory::MakeGateway(const std::string& listen_addr,
                                                            const std::string& dir,
                                                            std::string& error) {
    auto gateway = std::make_unique<CGateway>(m_params);
    if (!gateway->Open(listen_addr, dir, error)) {
        return nullptr;
    }
    return gateway;
}

std::unique_ptr<CChainStateModule> CModuleFactory::MakeConsensusSet(CNetworkModule& gateway,
                                                                   const std::string& dir,
                                                                   std::string& error) {
    auto cs = std::make_unique<CConsensusSet>(gateway, m_params);
    if (!cs->Open(dir, error)) {
        return nullptr;
    }
    return cs;
}

std::unique_ptr<CTransactionPoolModule> CModuleFactory::MakeTransactionPool(CChainStateModule& consensus,
                                                                           CNetworkModule& gateway,
                                                                           const std::string& dir,
                                                                           std::string& error) {
    auto tpool = std::make_unique<CTransactionPool>(consensus, gateway);
    if (!tpool->Open(dir, error)) {
        return nullptr;
    }
    return tpool;
}

std::unique_ptr<CServingModule> CModuleFactory::MakeApiServer(const std::string& bind_addr,
                                                             const std::string& agent,
                                                             CChainStateModule& consensus,
                                                             CNetworkModule& gateway,
                                                             CTransactionPoolModule& tpool,
                                                             std::string& error) {
    auto api = std::make_unique<CApiServer>(agent, consensus, gateway, tpool, m_params);
    if (!api->Open(bind_addr, error)) {
        return nullptr;
    }
    return api;
}
