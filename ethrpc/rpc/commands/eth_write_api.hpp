// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/infra/concurrency/private_service.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/core/estimate_gas_oracle.hpp>
#include <ethrpc/rpc/core/executor.hpp>
#include <ethrpc/rpc/ethbackend/backend.hpp>
#include <ethrpc/rpc/ethbackend/signer.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/txpool/transaction_pool.hpp>

namespace ethrpc::rpc::json_rpc {
class RequestHandler;
}

namespace ethrpc::rpc::commands {

struct CallSettings {
    uint64_t gas_cap{kDefaultGasCap};
    EstimateGasRevertPolicy estimate_gas_revert_policy{EstimateGasRevertPolicy::kError};
};

//! Transaction submission and sandboxed execution methods
class EthWriteApi {
  public:
    EthWriteApi(boost::asio::io_context& ioc, CallSettings settings)
        : ioc_{ioc},
          chain_history_{must_use_private_service<ChainHistory>(ioc_)},
          chain_state_{must_use_private_service<ChainState>(ioc_)},
          executor_{must_use_private_service<Executor>(ioc_)},
          backend_{must_use_private_service<ethbackend::BackEnd>(ioc_)},
          signer_{must_use_private_service<ethbackend::Signer>(ioc_)},
          tx_pool_{must_use_private_service<txpool::TransactionPool>(ioc_)},
          settings_{settings} {}

    virtual ~EthWriteApi() = default;

    EthWriteApi(const EthWriteApi&) = delete;
    EthWriteApi& operator=(const EthWriteApi&) = delete;
    EthWriteApi(EthWriteApi&&) = default;

  protected:
    Task<void> handle_eth_send_transaction(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_send_raw_transaction(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_call(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_estimate_gas(const nlohmann::json& request, nlohmann::json& reply);

    boost::asio::io_context& ioc_;
    ChainHistory* chain_history_;
    ChainState* chain_state_;
    Executor* executor_;
    ethbackend::BackEnd* backend_;
    ethbackend::Signer* signer_;
    txpool::TransactionPool* tx_pool_;
    CallSettings settings_;

    friend class ethrpc::rpc::json_rpc::RequestHandler;
};

}  // namespace ethrpc::rpc::commands
