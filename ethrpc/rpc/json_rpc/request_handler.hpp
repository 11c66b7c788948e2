// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/commands/rpc_api.hpp>
#include <ethrpc/rpc/commands/rpc_api_table.hpp>
#include <ethrpc/rpc/json_rpc/method_table.hpp>
#include <ethrpc/rpc/json_rpc/validator.hpp>

namespace ethrpc::rpc::json_rpc {

//! Routes one JSON-RPC request text to its handler and always produces exactly one reply text
class RequestHandler {
  public:
    RequestHandler(commands::RpcApi& rpc_api, const commands::RpcApiTable& rpc_api_table);
    virtual ~RequestHandler() = default;

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    Task<std::string> handle(const std::string& request);

  protected:
    Task<void> handle_request_and_create_reply(const nlohmann::json& request_json, std::string& response);

  private:
    static nlohmann::json prevalidate_and_parse(const std::string& request);

    Task<void> handle_request(commands::RpcApiTable::HandleMethod handler,
                              const MethodTraits& traits,
                              const nlohmann::json& request_json,
                              std::string& response);
    void handle_request(commands::RpcApiTable::HandleImmediateMethod handler,
                        const MethodTraits& traits,
                        const nlohmann::json& request_json,
                        std::string& response);

    commands::RpcApi& rpc_api_;

    const commands::RpcApiTable& rpc_api_table_;

    Validator json_rpc_validator_;
};

}  // namespace ethrpc::rpc::json_rpc
