// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/infra/concurrency/private_service.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/ethbackend/backend.hpp>
#include <ethrpc/rpc/txpool/miner.hpp>

namespace ethrpc::rpc::json_rpc {
class RequestHandler;
}

namespace ethrpc::rpc::commands {

//! PoW facet: all but solution checking and etherbase lookup answer from the miner resident state
class EthMiningApi {
  public:
    explicit EthMiningApi(boost::asio::io_context& ioc)
        : ioc_{ioc},
          backend_{must_use_private_service<ethbackend::BackEnd>(ioc_)},
          miner_{must_use_private_service<txpool::Miner>(ioc_)} {}

    virtual ~EthMiningApi() = default;

    EthMiningApi(const EthMiningApi&) = delete;
    EthMiningApi& operator=(const EthMiningApi&) = delete;
    EthMiningApi(EthMiningApi&&) = default;

  protected:
    void handle_eth_mining(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_coinbase(const nlohmann::json& request, nlohmann::json& reply);
    void handle_eth_hashrate(const nlohmann::json& request, nlohmann::json& reply);
    void handle_eth_submit_hashrate(const nlohmann::json& request, nlohmann::json& reply);
    void handle_eth_get_work(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_eth_submit_work(const nlohmann::json& request, nlohmann::json& reply);

    boost::asio::io_context& ioc_;
    ethbackend::BackEnd* backend_;
    txpool::Miner* miner_;

    friend class ethrpc::rpc::json_rpc::RequestHandler;
};

}  // namespace ethrpc::rpc::commands
