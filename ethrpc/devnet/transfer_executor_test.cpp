// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transfer_executor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/devnet/test_util/devnet_test_base.hpp>
#include <ethrpc/infra/test_util/context_test_base.hpp>
#include <ethrpc/infra/test_util/log.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::devnet {

using evmc::literals::operator""_address;
using evmc::literals::operator""_bytes32;

static constexpr evmc::address kSender{0x00000000000000000000000000000000000000a1_address};
static constexpr evmc::address kRecipient{0x00000000000000000000000000000000000000aa_address};
static constexpr evmc::address kContract{0x00000000000000000000000000000000000000cc_address};

static GenesisSpec executor_genesis() {
    GenesisSpec genesis;
    genesis.alloc[kSender].account.balance = 1'000'000;
    genesis.alloc[kContract] = with_code(Bytes{0x60, 0x00});
    return genesis;
}

struct TransferExecutorTest : public ethrpc::test_util::ContextTestBase {
    rpc::ExecutionResult execute(const rpc::Call& call, uint64_t gas_limit) {
        return spawn_and_wait(executor.execute(genesis_block, call, gas_limit));
    }

    ethrpc::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<MemoryChain> chain{std::make_shared<MemoryChain>(executor_genesis())};
    rpc::ResolvedBlock genesis_block{.block_num = 0, .block_hash = chain->head()->block->hash};
    TransferExecutor executor{chain};
};

TEST_CASE_METHOD(TransferExecutorTest, "TransferExecutor execute", "[devnet][transfer_executor]") {
    SECTION("plain transfer uses the intrinsic gas") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kRecipient, .value = 10}, 50'000)};
        CHECK(result.success());
        CHECK(result.gas_used == 21'000);
        CHECK(result.data.empty());
    }
    SECTION("call data is charged") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kRecipient, .data = Bytes{0x00, 0x01}}, 50'000)};
        CHECK(result.success());
        CHECK(result.gas_used == 21'000 + 4 + 16);
    }
    SECTION("out of gas below the intrinsic gas") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kRecipient}, 20'999)};
        CHECK(!result.success());
        CHECK(result.error_code == EVMC_OUT_OF_GAS);
        CHECK(!result.pre_check_error);
        CHECK(result.gas_used == 20'999);
    }
    SECTION("value beyond balance") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kRecipient, .value = 1'000'001}, 50'000)};
        CHECK(!result.success());
        CHECK(result.pre_check_error == "insufficient funds for gas * price + value: address 0x00000000000000000000000000000000000000a1 have 1000000 want 1000001");
    }
    SECTION("gas price counts against balance") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kRecipient, .gas_price = 100}, 50'000)};
        CHECK(result.pre_check_error);
    }
    SECTION("contract call is not supported") {
        const auto result{execute(rpc::Call{.from = kSender, .to = kContract}, 50'000)};
        CHECK(result.pre_check_error == "message call to contract not supported");
    }
    SECTION("contract creation is not supported") {
        const auto result{execute(rpc::Call{.from = kSender}, 100'000)};
        CHECK(result.pre_check_error == "contract creation not supported");
    }
    SECTION("unknown block") {
        const rpc::ResolvedBlock unknown{.block_num = 7, .block_hash = 0x07_bytes32};
        CHECK_THROWS_AS(spawn_and_wait(executor.execute(unknown, rpc::Call{.to = kRecipient}, 50'000)), rpc::ResolutionError);
    }
}

}  // namespace ethrpc::devnet
