// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipts.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc::core {

using evmc::literals::operator""_address;
using evmc::literals::operator""_bytes32;

static constexpr evmc::address kSender{0x8ced5ad0d8da4ec211c17355ed3dbfec4cf0e5b9_address};
static constexpr evmc::address kRecipient{0xe5ef458d37212a06e3f59d40c454e76150ae7c32_address};
static constexpr evmc::bytes32 kBlockHash{0x439816753229fc0736bf86a5048de4bc9fcdede8c91dadf88c828c76b2281dff_bytes32};
static constexpr evmc::bytes32 kTopic{0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};

static BlockWithHash make_block() {
    BlockWithHash block_with_hash;
    block_with_hash.hash = kBlockHash;
    block_with_hash.block.header.number = 42;
    block_with_hash.block.header.base_fee_per_gas = 7;

    ethrpc::Transaction transfer;
    transfer.type = TransactionType::kDynamicFee;
    transfer.nonce = 3;
    transfer.max_fee_per_gas = 20;
    transfer.max_priority_fee_per_gas = 2;
    transfer.to = kRecipient;
    transfer.set_sender(kSender);

    ethrpc::Transaction creation;
    creation.nonce = 4;
    creation.max_fee_per_gas = 10;
    creation.set_sender(kSender);

    block_with_hash.block.transactions = {transfer, creation};
    return block_with_hash;
}

TEST_CASE("make_receipts", "[rpc][core][receipts]") {
    const BlockWithHash block_with_hash{make_block()};
    const ethrpc::Log raw_log{.address = kRecipient, .topics = {kTopic}, .data = {}};

    SECTION("derived fields") {
        const std::vector<ethrpc::Receipt> raw_receipts{
            {.type = TransactionType::kDynamicFee, .success = true, .cumulative_gas_used = 21'000, .logs = {raw_log, raw_log}},
            {.type = TransactionType::kLegacy, .success = true, .cumulative_gas_used = 74'000, .logs = {raw_log}},
        };
        const auto receipts = make_receipts(block_with_hash, raw_receipts);
        REQUIRE(receipts.size() == 2);

        CHECK(receipts[0].gas_used == 21'000);
        CHECK(receipts[0].tx_index == 0);
        CHECK(receipts[0].block_num == 42);
        CHECK(receipts[0].block_hash == kBlockHash);
        CHECK(receipts[0].from == kSender);
        CHECK(receipts[0].to == kRecipient);
        CHECK(!receipts[0].contract_address);
        CHECK(receipts[0].effective_gas_price == 9);
        CHECK(receipts[0].tx_hash == block_with_hash.block.transactions[0].hash());

        CHECK(receipts[1].gas_used == 53'000);
        CHECK(receipts[1].tx_index == 1);
        CHECK(!receipts[1].to);
        CHECK(receipts[1].contract_address == create_address(kSender, 4));
        CHECK(receipts[1].effective_gas_price == 10);
    }

    SECTION("log indexes run across the block") {
        const std::vector<ethrpc::Receipt> raw_receipts{
            {.success = true, .cumulative_gas_used = 21'000, .logs = {raw_log, raw_log}},
            {.success = true, .cumulative_gas_used = 42'000, .logs = {raw_log}},
        };
        const auto receipts = make_receipts(block_with_hash, raw_receipts);
        REQUIRE(receipts[0].logs.size() == 2);
        REQUIRE(receipts[1].logs.size() == 1);
        CHECK(receipts[0].logs[0].index == 0);
        CHECK(receipts[0].logs[1].index == 1);
        CHECK(receipts[1].logs[0].index == 2);
        CHECK(receipts[1].logs[0].tx_index == 1);
        CHECK(receipts[1].logs[0].block_num == 42);
        CHECK(receipts[1].logs[0].tx_hash == receipts[1].tx_hash);
    }

    SECTION("receipt count mismatch") {
        const std::vector<ethrpc::Receipt> raw_receipts{{.success = true, .cumulative_gas_used = 21'000}};
        CHECK_THROWS_AS(make_receipts(block_with_hash, raw_receipts), std::runtime_error);
    }
}

}  // namespace ethrpc::rpc::core
