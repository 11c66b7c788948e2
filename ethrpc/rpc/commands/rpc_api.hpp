// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/io_context.hpp>

#include <ethrpc/rpc/commands/eth_mining_api.hpp>
#include <ethrpc/rpc/commands/eth_read_api.hpp>
#include <ethrpc/rpc/commands/eth_write_api.hpp>

namespace ethrpc::rpc::json_rpc {
class RequestHandler;
}

namespace ethrpc::rpc::commands {

class RpcApiTable;

class RpcApi : protected EthReadApi,
               EthWriteApi,
               EthMiningApi {
  public:
    explicit RpcApi(boost::asio::io_context& ioc, CallSettings call_settings = {})
        : EthReadApi{ioc},
          EthWriteApi{ioc, call_settings},
          EthMiningApi{ioc} {}

    ~RpcApi() override = default;

    RpcApi(const RpcApi&) = delete;
    RpcApi& operator=(const RpcApi&) = delete;
    RpcApi(RpcApi&&) = default;

    friend class RpcApiTable;
    friend class ethrpc::rpc::json_rpc::RequestHandler;
};

}  // namespace ethrpc::rpc::commands
