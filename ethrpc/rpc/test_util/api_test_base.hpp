// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <ethrpc/rpc/commands/rpc_api.hpp>
#include <ethrpc/rpc/commands/rpc_api_table.hpp>
#include <ethrpc/rpc/common/constants.hpp>
#include <ethrpc/rpc/json_rpc/request_handler.hpp>
#include <ethrpc/rpc/test_util/service_context_test_base.hpp>

namespace ethrpc::rpc::test_util {

//! Drives full request texts through router, handlers and normalizer against collaborator mocks
class RpcApiTestBase : public ServiceContextTestBase {
  public:
    explicit RpcApiTestBase(std::string_view api_spec = kDefaultApiSpec, commands::CallSettings call_settings = {})
        : rpc_api_{ioc_, call_settings}, rpc_api_table_{api_spec}, request_handler_{rpc_api_, rpc_api_table_} {}

    nlohmann::json handle(const std::string& request) {
        const auto reply = spawn_and_wait(request_handler_.handle(request));
        return nlohmann::json::parse(reply);
    }

    nlohmann::json handle(const nlohmann::json& request) {
        return handle(request.dump());
    }

  protected:
    commands::RpcApi rpc_api_;
    commands::RpcApiTable rpc_api_table_;
    json_rpc::RequestHandler request_handler_;
};

}  // namespace ethrpc::rpc::test_util
