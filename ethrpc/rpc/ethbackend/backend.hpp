// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/types/syncing.hpp>

namespace ethrpc::rpc::ethbackend {

class BackEnd {
  public:
    virtual ~BackEnd() = default;
    virtual Task<evmc::address> etherbase() = 0;
    virtual Task<uint64_t> protocol_version() = 0;
    virtual Task<std::optional<uint64_t>> chain_id() = 0;
    virtual Task<intx::uint256> gas_price() = 0;
    virtual Task<SyncStatus> sync_status() = 0;
};

}  // namespace ethrpc::rpc::ethbackend
