// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "executor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/infra/test_util/log.hpp>

namespace ethrpc::rpc {

// Error(string) payload carrying "Ownable: caller is not the owner"
static const Bytes kRevertReason{*from_hex(
    "0x08c379a0"
    "0000000000000000000000000000000000000000000000000000000000000020"
    "0000000000000000000000000000000000000000000000000000000000000020"
    "4f776e61626c653a2063616c6c6572206973206e6f7420746865206f776e6572")};

TEST_CASE("ExecutionResult success", "[rpc][core][executor]") {
    CHECK(ExecutionResult{}.success());
    CHECK(ExecutionResult{.error_code = evmc_status_code::EVMC_SUCCESS}.success());
    CHECK(!ExecutionResult{.error_code = evmc_status_code::EVMC_REVERT}.success());
    CHECK(!ExecutionResult{.pre_check_error = "insufficient funds"}.success());
}

TEST_CASE("ExecutionResult error message", "[rpc][core][executor]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("pre-check error wins") {
        const ExecutionResult result{.error_code = evmc_status_code::EVMC_REVERT, .pre_check_error = "nonce too low"};
        CHECK(result.error_message() == "nonce too low");
    }
    SECTION("out of gas") {
        const ExecutionResult result{.error_code = evmc_status_code::EVMC_OUT_OF_GAS};
        CHECK(result.error_message() == "out of gas");
    }
    SECTION("revert without reason") {
        const ExecutionResult result{.error_code = evmc_status_code::EVMC_REVERT, .data = *from_hex("0xdeadbeef")};
        CHECK(result.error_message() == "execution reverted");
    }
    SECTION("revert with reason") {
        const ExecutionResult result{.error_code = evmc_status_code::EVMC_REVERT, .data = kRevertReason};
        CHECK(result.error_message() == "execution reverted: Ownable: caller is not the owner");
        CHECK(result.error_message(/*full_error=*/false) == "execution reverted");
    }
    SECTION("success") {
        CHECK(ExecutionResult{}.error_message().empty());
    }
    SECTION("unknown code") {
        CHECK(get_error_message(1000, {}) == "unknown error code");
    }
}

}  // namespace ethrpc::rpc
