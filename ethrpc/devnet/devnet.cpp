// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "devnet.hpp"

#include <ethrpc/core/crypto/ecdsa.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/devnet/dev_backend.hpp>
#include <ethrpc/devnet/dev_miner.hpp>
#include <ethrpc/devnet/memory_tx_pool.hpp>
#include <ethrpc/devnet/transfer_executor.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/infra/concurrency/private_service.hpp>

namespace ethrpc::devnet {

GenesisSpec make_dev_genesis(const DevnetOptions& options) {
    GenesisSpec genesis{
        .gas_limit = options.gas_limit,
        .difficulty = options.difficulty,
    };
    for (size_t i{0}; i < options.num_accounts; ++i) {
        const auto address{ecdsa::private_key_to_address(dev_private_key(i))};
        if (address) {
            genesis.alloc[*address].account.balance = options.account_balance;
        }
    }
    return genesis;
}

std::shared_ptr<MemoryChain> add_devnet_services(boost::asio::io_context& ioc, rpc::WorkerPool& workers, const DevnetOptions& options) {
    auto chain = std::make_shared<MemoryChain>(make_dev_genesis(options));
    auto signer = std::make_unique<DevSigner>(options.chain_id, options.num_accounts);

    evmc::address etherbase{options.etherbase};
    if (!etherbase && !signer->accounts().empty()) {
        etherbase = signer->accounts().front();
    }
    ETHRPC_INFO << "Devnet genesis: " << to_hex(chain->head()->block->hash, true) << " etherbase: " << etherbase
                << " accounts: " << options.num_accounts;

    add_private_service<rpc::ChainHistory>(ioc, std::make_unique<MemoryChainHistory>(chain));
    add_private_service<rpc::ChainState>(ioc, std::make_unique<MemoryChainState>(chain));
    add_private_service<rpc::txpool::TransactionPool>(ioc, std::make_unique<MemoryTxPool>(chain, options.chain_id));
    add_private_service<rpc::txpool::Miner>(ioc, std::make_unique<DevMiner>(chain, workers, MinerSettings{
                                                                                                 .etherbase = etherbase,
                                                                                                 .difficulty = options.difficulty,
                                                                                                 .gas_limit = options.gas_limit,
                                                                                             }));
    add_private_service<rpc::ethbackend::BackEnd>(ioc, std::make_unique<DevBackEnd>(chain, etherbase, options.chain_id));
    add_private_service<rpc::ethbackend::Signer>(ioc, std::move(signer));
    add_private_service<rpc::Executor>(ioc, std::make_unique<TransferExecutor>(chain));
    return chain;
}

}  // namespace ethrpc::devnet
