// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/empty_hashes.hpp>
#include <ethrpc/core/common/util.hpp>
#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

using namespace evmc::literals;

static BlockHeader make_genesis_header() {
    BlockHeader header;
    header.ommers_hash = kEmptyListHash;
    header.beneficiary = 0x0000000000000000000000000000000000000000_address;
    header.state_root = kEmptyRoot;
    header.transactions_root = kEmptyRoot;
    header.receipts_root = kEmptyRoot;
    header.difficulty = 0x20000;
    header.number = 0;
    header.gas_limit = 0x1c9c380;
    header.timestamp = 0;
    header.extra_data = *from_hex("0x657468727063");
    header.base_fee_per_gas = 1'000'000'000;
    return header;
}

TEST_CASE("serialize block header", "[rpc][to_json][block]") {
    const auto header = make_genesis_header();
    const nlohmann::json j = header;
    CHECK(j["number"] == "0x0");
    CHECK(j["hash"] == to_hex(header.hash(), true));
    CHECK(j["nonce"] == "0x0000000000000000");
    CHECK(j["sha3Uncles"] == "0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347");
    CHECK(j["difficulty"] == "0x20000");
    CHECK(j["gasLimit"] == "0x1c9c380");
    CHECK(j["gasUsed"] == "0x0");
    CHECK(j["extraData"] == "0x657468727063");
    CHECK(j["baseFeePerGas"] == "0x3b9aca00");
    CHECK(j["logsBloom"].get<std::string>().size() == 2 + 2 * kBloomByteLength);
}

TEST_CASE("serialize block without transactions", "[rpc][to_json][block]") {
    auto block_with_hash = std::make_shared<BlockWithHash>();
    block_with_hash->block.header = make_genesis_header();
    block_with_hash->hash = block_with_hash->block.header.hash();

    SECTION("hashes only") {
        const Block block{block_with_hash, /*full_tx=*/false};
        const nlohmann::json j = block;
        CHECK(j["hash"] == to_hex(block_with_hash->hash, true));
        CHECK(j["transactions"] == nlohmann::json::array());
        CHECK(j["uncles"] == nlohmann::json::array());
        CHECK(j.contains("size"));
    }
    SECTION("full transactions") {
        const Block block{block_with_hash, /*full_tx=*/true};
        const nlohmann::json j = block;
        CHECK(j["transactions"] == nlohmann::json::array());
    }
}

TEST_CASE("serialize block with transaction", "[rpc][to_json][block]") {
    auto block_with_hash = std::make_shared<BlockWithHash>();
    block_with_hash->block.header = make_genesis_header();
    block_with_hash->block.header.number = 5;
    ethrpc::Transaction txn;
    txn.nonce = 1;
    txn.gas_limit = 21000;
    txn.max_fee_per_gas = 2'000'000'000;
    txn.max_priority_fee_per_gas = 2'000'000'000;
    txn.to = 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address;
    txn.r = 1;
    txn.s = 1;
    txn.set_sender(0x52c24586c31cff0485a6208bb63859290fba5bce_address);
    block_with_hash->block.transactions.push_back(txn);
    block_with_hash->hash = block_with_hash->block.header.hash();

    SECTION("hashes only") {
        const nlohmann::json j = Block{block_with_hash, false};
        REQUIRE(j["transactions"].size() == 1);
        CHECK(j["transactions"][0] == to_hex(txn.hash(), true));
    }
    SECTION("full transactions") {
        const nlohmann::json j = Block{block_with_hash, true};
        REQUIRE(j["transactions"].size() == 1);
        const auto& json_txn = j["transactions"][0];
        CHECK(json_txn["hash"] == to_hex(txn.hash(), true));
        CHECK(json_txn["from"] == "0x52c24586c31cff0485a6208bb63859290fba5bce");
        CHECK(json_txn["blockNumber"] == "0x5");
        CHECK(json_txn["blockHash"] == to_hex(block_with_hash->hash, true));
        CHECK(json_txn["transactionIndex"] == "0x0");
        CHECK(json_txn["gasPrice"] == "0x77359400");
    }
}

TEST_CASE("serialize uncle", "[rpc][to_json][block]") {
    const Uncle uncle{make_genesis_header()};
    const nlohmann::json j = uncle;
    CHECK(j["transactions"] == nlohmann::json::array());
    CHECK(j["uncles"] == nlohmann::json::array());
    CHECK(j["number"] == "0x0");
}

}  // namespace ethrpc::rpc
