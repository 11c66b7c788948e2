// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/core/executor.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/types/block_ref.hpp>
#include <ethrpc/rpc/types/call.hpp>

namespace ethrpc::rpc {

inline constexpr uint64_t kTxGas = 21'000;

//! What gas estimation returns for a call failing at the upper bound
enum class EstimateGasRevertPolicy {
    kError,         // RPC error carrying the revert data, if any
    kOverestimate,  // upper bound as best-effort estimate
};

std::string_view to_string(EstimateGasRevertPolicy policy);

class EstimateGasOracle {
  public:
    EstimateGasOracle(Executor& executor,
                      const ChainState& chain_state,
                      uint64_t gas_cap = kDefaultGasCap,
                      EstimateGasRevertPolicy revert_policy = EstimateGasRevertPolicy::kError)
        : executor_{executor}, chain_state_{chain_state}, gas_cap_{gas_cap}, revert_policy_{revert_policy} {}

    EstimateGasOracle(const EstimateGasOracle&) = delete;
    EstimateGasOracle& operator=(const EstimateGasOracle&) = delete;

    //! \brief Binary search the lowest gas limit the call succeeds with at block
    //! \throws ExecutionError if the call cannot succeed within the upper bound
    Task<uint64_t> estimate_gas(const Call& call, const ResolvedBlock& block, uint64_t block_gas_limit);

  private:
    [[noreturn]] static void throw_exception(const ExecutionResult& result);

    Executor& executor_;
    const ChainState& chain_state_;
    uint64_t gas_cap_;
    EstimateGasRevertPolicy revert_policy_;
};

}  // namespace ethrpc::rpc
