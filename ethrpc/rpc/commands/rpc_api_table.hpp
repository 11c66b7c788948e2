// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/commands/rpc_api.hpp>

namespace ethrpc::rpc::commands {

class RpcApiTable {
  public:
    using HandleMethod = Task<void> (RpcApi::*)(const nlohmann::json&, nlohmann::json&);
    using HandleImmediateMethod = void (RpcApi::*)(const nlohmann::json&, nlohmann::json&);

    explicit RpcApiTable(std::string_view api_spec);

    RpcApiTable(const RpcApiTable&) = delete;
    RpcApiTable& operator=(const RpcApiTable&) = delete;
    RpcApiTable(RpcApiTable&&) = default;

    std::optional<HandleMethod> find_json_handler(const std::string& method) const;
    std::optional<HandleImmediateMethod> find_immediate_handler(const std::string& method) const;

  private:
    void build_handlers(std::string_view api_spec);
    void add_handlers(std::string_view api_namespace);
    void add_eth_read_handlers();
    void add_eth_write_handlers();
    void add_eth_mining_handlers();

    std::map<std::string, HandleMethod> method_handlers_;
    std::map<std::string, HandleImmediateMethod> immediate_handlers_;
};

}  // namespace ethrpc::rpc::commands
