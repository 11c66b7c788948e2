// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/infra/concurrency/private_service.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/ethbackend/backend.hpp>
#include <ethrpc/rpc/ethbackend/signer.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/txpool/transaction_pool.hpp>

namespace ethrpc::rpc::json_rpc {
class RequestHandler;
}

namespace ethrpc::rpc::commands {

//! Query methods: every read in one call is served by one chain snapshot
class EthReadApi {
  public:
    explicit EthReadApi(boost::asio::io_context& ioc)
        : ioc_{ioc},
          chain_history_{must_use_private_service<ChainHistory>(ioc_)},
          chain_state_{must_use_private_service<ChainState>(ioc_)},
          backend_{must_use_private_service<ethbackend::BackEnd>(ioc_)},
          signer_{must_use_private_service<ethbackend::Signer>(ioc_)},
          tx_pool_{must_use_private_service<txpool::TransactionPool>(ioc_)} {}

    virtual ~EthReadApi() = default;

    EthReadApi(const EthReadApi&) = delete;
    EthReadApi& operator=(const EthReadApi&) = delete;
    EthReadApi(EthReadApi&&) = default;

  protected:
    Task<void> handle_eth_block_num(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_chain_id(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_protocol_version(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_syncing(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_gas_price(const nlohmann::json& request, nlohmann::json& reply);
    void handle_eth_accounts(const nlohmann::json& request, nlohmann::json& reply);

    Task<void> handle_eth_get_balance(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_transaction_count(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_code(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_storage_at(const nlohmann::json& request, nlohmann::json& reply);

    Task<void> handle_eth_get_block_by_hash(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_block_by_number(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_block_transaction_count_by_hash(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_block_transaction_count_by_number(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_uncle_count_by_block_hash(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_uncle_count_by_block_num(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_transaction_by_hash(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_transaction_by_block_hash_and_index(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_transaction_by_block_num_and_index(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_uncle_by_block_hash_and_index(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_uncle_by_block_num_and_index(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_get_logs(const nlohmann::json& request, nlohmann::json& reply);

    boost::asio::io_context& ioc_;
    ChainHistory* chain_history_;
    ChainState* chain_state_;
    ethbackend::BackEnd* backend_;
    ethbackend::Signer* signer_;
    txpool::TransactionPool* tx_pool_;

  private:
    Task<void> get_block(const nlohmann::json& request, const BlockRef& block_ref, bool full_tx, nlohmann::json& reply);
    Task<void> get_block_transaction_count(const nlohmann::json& request, const BlockRef& block_ref, nlohmann::json& reply);
    Task<void> get_uncle_count(const nlohmann::json& request, const BlockRef& block_ref, nlohmann::json& reply);
    Task<void> get_transaction_by_index(const nlohmann::json& request, const BlockRef& block_ref, uint64_t index, nlohmann::json& reply);
    Task<void> get_uncle_by_index(const nlohmann::json& request, const BlockRef& block_ref, uint64_t index, nlohmann::json& reply);

    friend class ethrpc::rpc::json_rpc::RequestHandler;
};

}  // namespace ethrpc::rpc::commands
