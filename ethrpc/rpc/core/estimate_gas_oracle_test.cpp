// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "estimate_gas_oracle.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/infra/test_util/log.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>
#include <ethrpc/rpc/test_util/mock_chain_storage.hpp>
#include <ethrpc/rpc/test_util/mock_executor.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

using evmc::literals::operator""_address;
using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;

static constexpr uint64_t kBlockGasLimit{30'000'000};
static constexpr uint64_t kRequiredGas{53'000};
static constexpr evmc::address kSender{0x8ced5ad0d8da4ec211c17355ed3dbfec4cf0e5b9_address};

// Succeeds using kRequiredGas whenever the gas limit allows it, runs out of gas otherwise
static Task<ExecutionResult> execute_requiring_gas(const ResolvedBlock& /*block*/, const Call& /*call*/, uint64_t gas_limit) {
    if (gas_limit < kRequiredGas) {
        co_return ExecutionResult{.error_code = evmc_status_code::EVMC_OUT_OF_GAS, .gas_used = gas_limit};
    }
    co_return ExecutionResult{.error_code = evmc_status_code::EVMC_SUCCESS, .gas_used = kRequiredGas};
}

static Task<ExecutionResult> execute_reverting(const ResolvedBlock& /*block*/, const Call& /*call*/, uint64_t gas_limit) {
    co_return ExecutionResult{.error_code = evmc_status_code::EVMC_REVERT, .gas_used = gas_limit / 2, .data = *from_hex("0xdeadbeef")};
}

TEST_CASE("EstimateGasOracle::estimate_gas", "[rpc][core][estimate_gas]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test::ExecutorMock executor;
    test::ChainStateMock chain_state;
    WorkerPool pool{1};
    const ResolvedBlock block{.block_num = 10};
    Call call;

    auto estimate = [&](EstimateGasOracle& oracle) {
        return boost::asio::co_spawn(pool, oracle.estimate_gas(call, block, kBlockGasLimit), boost::asio::use_future).get();
    };
    auto expect_error = [&](EstimateGasOracle& oracle, int64_t code, const std::string& message) {
        try {
            estimate(oracle);
            FAIL("ExecutionError expected");
        } catch (const ExecutionError& e) {
            CHECK(e.error_code() == code);
            CHECK(e.message() == message);
        }
    };

    SECTION("call without gas searches from block gas limit") {
        EstimateGasOracle oracle{executor, chain_state};
        EXPECT_CALL(executor, execute(_, _, _)).WillRepeatedly(Invoke(execute_requiring_gas));
        CHECK(estimate(oracle) == kRequiredGas);
    }

    SECTION("call gas below intrinsic uses block gas limit") {
        EstimateGasOracle oracle{executor, chain_state};
        call.gas = 1'000;
        EXPECT_CALL(executor, execute(_, _, kBlockGasLimit)).WillOnce(Invoke(execute_requiring_gas));
        EXPECT_CALL(executor, execute(_, _, testing::Ne(kBlockGasLimit))).WillRepeatedly(Invoke(execute_requiring_gas));
        CHECK(estimate(oracle) == kRequiredGas);
    }

    SECTION("call gas too low") {
        EstimateGasOracle oracle{executor, chain_state};
        call.gas = 30'000;
        EXPECT_CALL(executor, execute(_, _, 30'000)).WillOnce(Invoke(execute_requiring_gas));
        expect_error(oracle, -32000, "gas required exceeds allowance (30000)");
    }

    SECTION("gas cap") {
        EstimateGasOracle oracle{executor, chain_state, /*gas_cap=*/40'000};
        EXPECT_CALL(executor, execute(_, _, 40'000)).WillOnce(Invoke(execute_requiring_gas));
        expect_error(oracle, -32000, "gas required exceeds allowance (40000)");
    }

    SECTION("gas capped by balance allowance") {
        EstimateGasOracle oracle{executor, chain_state};
        call.from = kSender;
        call.gas_price = 10;
        EXPECT_CALL(chain_state, read_account(kSender, block)).WillOnce(InvokeWithoutArgs([]() -> Task<std::optional<Account>> {
            co_return Account{.balance = 500'000};
        }));
        EXPECT_CALL(executor, execute(_, _, 50'000)).WillOnce(Invoke(execute_requiring_gas));
        expect_error(oracle, -32000, "gas required exceeds allowance (50000)");
    }

    SECTION("balance allowance above requirement") {
        EstimateGasOracle oracle{executor, chain_state};
        call.from = kSender;
        call.gas_price = 10;
        call.value = 100'000;
        EXPECT_CALL(chain_state, read_account(kSender, block)).WillOnce(InvokeWithoutArgs([]() -> Task<std::optional<Account>> {
            co_return Account{.balance = 1'100'000};
        }));
        EXPECT_CALL(executor, execute(_, _, 100'000)).WillOnce(Invoke(execute_requiring_gas));
        EXPECT_CALL(executor, execute(_, _, testing::Lt(100'000))).WillRepeatedly(Invoke(execute_requiring_gas));
        CHECK(estimate(oracle) == kRequiredGas);
    }

    SECTION("value above balance") {
        EstimateGasOracle oracle{executor, chain_state};
        call.from = kSender;
        call.gas_price = 10;
        call.value = 1'000;
        EXPECT_CALL(chain_state, read_account(kSender, block)).WillOnce(InvokeWithoutArgs([]() -> Task<std::optional<Account>> {
            co_return std::nullopt;
        }));
        EXPECT_CALL(executor, execute(_, _, _)).Times(0);
        expect_error(oracle, -32000, "insufficient funds for transfer");
    }

    SECTION("revert with data is an error by default") {
        EstimateGasOracle oracle{executor, chain_state};
        EXPECT_CALL(executor, execute(_, _, kBlockGasLimit)).WillOnce(Invoke(execute_reverting));
        try {
            estimate(oracle);
            FAIL("ExecutionError expected");
        } catch (const ExecutionError& e) {
            CHECK(e.error_code() == 3);
            CHECK(e.message() == "execution reverted");
            CHECK(e.data() == *from_hex("0xdeadbeef"));
        }
    }

    SECTION("revert without data") {
        EstimateGasOracle oracle{executor, chain_state};
        EXPECT_CALL(executor, execute(_, _, kBlockGasLimit)).WillOnce(InvokeWithoutArgs([]() -> Task<ExecutionResult> {
            co_return ExecutionResult{.error_code = evmc_status_code::EVMC_REVERT};
        }));
        expect_error(oracle, -32000, "execution reverted");
    }

    SECTION("revert overestimated by policy") {
        EstimateGasOracle oracle{executor, chain_state, kDefaultGasCap, EstimateGasRevertPolicy::kOverestimate};
        EXPECT_CALL(executor, execute(_, _, kBlockGasLimit)).WillOnce(Invoke(execute_reverting));
        CHECK(estimate(oracle) == kBlockGasLimit);
    }

    SECTION("out of gas is an error whatever the policy") {
        EstimateGasOracle oracle{executor, chain_state, /*gas_cap=*/40'000, EstimateGasRevertPolicy::kOverestimate};
        EXPECT_CALL(executor, execute(_, _, 40'000)).WillOnce(Invoke(execute_requiring_gas));
        expect_error(oracle, -32000, "gas required exceeds allowance (40000)");
    }

    SECTION("pre-check error") {
        EstimateGasOracle oracle{executor, chain_state, kDefaultGasCap, EstimateGasRevertPolicy::kOverestimate};
        EXPECT_CALL(executor, execute(_, _, kBlockGasLimit)).WillOnce(InvokeWithoutArgs([]() -> Task<ExecutionResult> {
            co_return ExecutionResult{.pre_check_error = "insufficient funds for gas * price + value"};
        }));
        expect_error(oracle, -32000, "insufficient funds for gas * price + value");
    }
}

TEST_CASE("EstimateGasRevertPolicy to_string", "[rpc][core][estimate_gas]") {
    CHECK(to_string(EstimateGasRevertPolicy::kError) == "error");
    CHECK(to_string(EstimateGasRevertPolicy::kOverestimate) == "overestimate");
}

}  // namespace ethrpc::rpc
