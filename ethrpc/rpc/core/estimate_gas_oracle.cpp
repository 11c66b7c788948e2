// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "estimate_gas_oracle.hpp"

#include <algorithm>
#include <string>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/protocol/errors.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

std::string_view to_string(EstimateGasRevertPolicy policy) {
    switch (policy) {
        case EstimateGasRevertPolicy::kError:
            return "error";
        case EstimateGasRevertPolicy::kOverestimate:
            return "overestimate";
    }
    return "unknown";
}

Task<uint64_t> EstimateGasOracle::estimate_gas(const Call& call, const ResolvedBlock& block, uint64_t block_gas_limit) {
    ETHRPC_DEBUG << "EstimateGasOracle::estimate_gas block: " << block;

    uint64_t hi{0};
    if (call.gas.value_or(0) >= kTxGas) {
        ETHRPC_DEBUG << "Set gas limit using call args: " << *call.gas;
        hi = *call.gas;
    } else {
        ETHRPC_DEBUG << "Set gas limit using block: " << block_gas_limit;
        hi = block_gas_limit;
    }

    if (hi > gas_cap_) {
        ETHRPC_WARN << "caller gas above allowance, capping: requested " << hi << ", cap " << gas_cap_;
        hi = gas_cap_;
    }

    const auto fee_cap = call.fee_cap();
    if (fee_cap && *fee_cap != 0) {
        const evmc::address from = call.from.value_or(evmc::address{});
        const auto account = co_await chain_state_.read_account(from, block);
        const intx::uint256 balance = account ? account->balance : 0;
        const intx::uint256 value = call.value.value_or(0);
        ETHRPC_DEBUG << "balance for address " << from << ": 0x" << intx::hex(balance);
        if (value > balance) {
            throw ExecutionError{kServerError, "insufficient funds for transfer"};
        }
        const auto allowance = (balance - value) / *fee_cap;
        if (hi > allowance) {
            ETHRPC_WARN << "gas estimation capped by limited funds: original " << hi
                        << ", balance 0x" << intx::hex(balance)
                        << ", sent 0x" << intx::hex(value)
                        << ", feecap 0x" << intx::hex(*fee_cap)
                        << ", allowance " << allowance;
            hi = static_cast<uint64_t>(allowance);
        }
    }

    auto result = co_await executor_.execute(block, call, hi);
    if (!result.success()) {
        if (result.error_code == evmc_status_code::EVMC_OUT_OF_GAS) {
            throw ExecutionError{kServerError, "gas required exceeds allowance (" + std::to_string(hi) + ")"};
        }
        if (revert_policy_ == EstimateGasRevertPolicy::kOverestimate && !result.pre_check_error) {
            ETHRPC_WARN << "call fails at gas " << hi << " (" << result.error_message() << "), returning it as overestimate";
            co_return hi;
        }
        throw_exception(result);
    }

    // The call succeeds with all the gas it wants: the search never goes below what it actually consumed
    const uint64_t true_gas = result.gas_used;
    uint64_t lo = std::max(true_gas + result.gas_refund, kTxGas) - 1;
    ETHRPC_DEBUG << "hi: " << hi << ", lo: " << lo;

    while (lo + 1 < hi) {
        const uint64_t mid = lo + (hi - lo) / 2;
        result = co_await executor_.execute(block, call, mid);
        if (result.pre_check_error) {
            ETHRPC_DEBUG << "pre-check error at gas " << mid << ": " << *result.pre_check_error;
            break;
        }
        if (!result.success() || result.gas_used < true_gas) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    ETHRPC_DEBUG << "EstimateGasOracle::estimate_gas returns " << hi;
    co_return hi;
}

void EstimateGasOracle::throw_exception(const ExecutionResult& result) {
    if (result.pre_check_error) {
        ETHRPC_DEBUG << "result error " << *result.pre_check_error;
        throw ExecutionError{kServerError, *result.pre_check_error};
    }
    const auto error_message = result.error_message();
    ETHRPC_DEBUG << "result message: " << error_message << ", code " << result.error_code.value_or(0);
    if (result.data.empty()) {
        throw ExecutionError{kServerError, error_message};
    }
    throw ExecutionError{kExecutionReverted, error_message, result.data};
}

}  // namespace ethrpc::rpc
