// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

using namespace evmc::literals;

// https://eips.ethereum.org/EIPS/eip-155
static constexpr std::string_view kEip155RawTxn{
    "f86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a764000080"
    "25a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d8997f761a"
    "ecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83"};

TEST_CASE("serialize legacy transaction", "[rpc][to_json][transaction]") {
    const Bytes raw{*from_hex(kEip155RawTxn)};
    ByteView view{raw};
    ethrpc::Transaction txn;
    REQUIRE(rlp::decode_transaction(view, txn));

    const nlohmann::json j = txn;
    CHECK(j["from"] == "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");
    CHECK(j["to"] == "0x3535353535353535353535353535353535353535");
    CHECK(j["nonce"] == "0x9");
    CHECK(j["gas"] == "0x5208");
    CHECK(j["value"] == "0xde0b6b3a7640000");
    CHECK(j["input"] == "0x");
    CHECK(j["type"] == "0x0");
    CHECK(j["chainId"] == "0x1");
    CHECK(j["v"] == "0x25");
    CHECK(j["r"] == "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276");
    CHECK(j["s"] == "0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    CHECK(!j.contains("accessList"));
}

TEST_CASE("serialize transaction in block", "[rpc][to_json][transaction]") {
    Transaction txn;
    txn.type = TransactionType::kDynamicFee;
    txn.chain_id = 1337;
    txn.max_priority_fee_per_gas = 1;
    txn.max_fee_per_gas = 10;
    txn.gas_limit = 21000;
    txn.set_sender(0x52c24586c31cff0485a6208bb63859290fba5bce_address);
    txn.block_hash = 0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32;
    txn.block_num = 2;
    txn.block_base_fee_per_gas = 7;
    txn.transaction_index = 3;

    SECTION("included") {
        const nlohmann::json j = txn;
        CHECK(j["to"] == nullptr);
        CHECK(j["type"] == "0x2");
        CHECK(j["maxFeePerGas"] == "0xa");
        CHECK(j["maxPriorityFeePerGas"] == "0x1");
        CHECK(j["accessList"] == nlohmann::json::array());
        CHECK(j["gasPrice"] == "0x8");
        CHECK(j["blockNumber"] == "0x2");
        CHECK(j["transactionIndex"] == "0x3");
        CHECK(j["blockHash"] == "0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c");
    }
    SECTION("queued in pool") {
        txn.queued_in_pool = true;
        const nlohmann::json j = txn;
        CHECK(j["blockHash"] == nullptr);
        CHECK(j["blockNumber"] == nullptr);
        CHECK(j["transactionIndex"] == nullptr);
    }
}

TEST_CASE("access list entry", "[rpc][to_json][from_json][transaction]") {
    const AccessListEntry entry{
        0x0715a7794a1dc8e42615f059dd6e406a6594651a_address,
        {0x0000000000000000000000000000000000000000000000000000000000000001_bytes32}};
    const nlohmann::json j = entry;
    CHECK(j == R"({
        "address": "0x0715a7794a1dc8e42615f059dd6e406a6594651a",
        "storageKeys": ["0x0000000000000000000000000000000000000000000000000000000000000001"]
    })"_json);
    CHECK(j.get<AccessListEntry>() == entry);
}

}  // namespace ethrpc::rpc
