// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transfer_executor.hpp"

#include <sstream>

#include <evmc/evmc.h>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::devnet {

using rpc::ExecutionResult;

static ExecutionResult pre_check_failure(const std::string& error) {
    return ExecutionResult{.pre_check_error = error};
}

Task<ExecutionResult> TransferExecutor::execute(const rpc::ResolvedBlock& block, const rpc::Call& call, uint64_t gas_limit) {
    const auto entry = chain_->entry_at(block);
    if (!call.to) {
        co_return pre_check_failure("contract creation not supported");
    }
    const auto& state = *entry->state;
    if (const auto it{state.find(*call.to)}; it != state.end() && !it->second.code.empty()) {
        co_return pre_check_failure("message call to contract not supported");
    }

    const evmc::address from{call.from.value_or(evmc::address{})};
    const auto from_it{state.find(from)};
    const intx::uint256 balance{from_it != state.end() ? from_it->second.account.balance : 0};
    const intx::uint256 value{call.value.value_or(0)};
    const auto fee_cap{call.fee_cap().value_or(0)};
    const intx::uint256 max_cost{intx::uint256{gas_limit} * fee_cap + value};
    if (balance < max_cost) {
        std::stringstream error;
        error << "insufficient funds for gas * price + value: address " << from
              << " have " << intx::to_string(balance) << " want " << intx::to_string(max_cost);
        co_return pre_check_failure(error.str());
    }

    const uint64_t gas{intrinsic_gas(call.data.value_or(Bytes{}), /*contract_creation=*/false)};
    if (gas_limit < gas) {
        ETHRPC_TRACE << "TransferExecutor out of gas: limit " << gas_limit << " intrinsic " << gas;
        co_return ExecutionResult{.error_code = EVMC_OUT_OF_GAS, .gas_used = gas_limit};
    }
    co_return ExecutionResult{.error_code = std::nullopt, .gas_used = gas};
}

}  // namespace ethrpc::devnet
