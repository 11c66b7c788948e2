// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/core/executor.hpp>

namespace ethrpc::devnet {

//! Executor for plain value transfers: only the intrinsic gas is charged, calls to code and creations
//! are rejected before execution
class TransferExecutor : public rpc::Executor {
  public:
    explicit TransferExecutor(std::shared_ptr<MemoryChain> chain) : chain_{std::move(chain)} {}

    Task<rpc::ExecutionResult> execute(const rpc::ResolvedBlock& block, const rpc::Call& call, uint64_t gas_limit) override;

  private:
    std::shared_ptr<MemoryChain> chain_;
};

}  // namespace ethrpc::devnet
