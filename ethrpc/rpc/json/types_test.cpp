// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/util.hpp>

namespace ethrpc::rpc {

using namespace evmc::literals;

TEST_CASE("convert zero uint256 to quantity", "[rpc][to_quantity]") {
    intx::uint256 zero_u256{0};
    CHECK(to_quantity(zero_u256) == "0x0");
}

TEST_CASE("convert positive number to quantity", "[rpc][to_quantity]") {
    CHECK(to_quantity(uint64_t{0}) == "0x0");
    CHECK(to_quantity(uint64_t{1}) == "0x1");
    CHECK(to_quantity(uint64_t{0x400}) == "0x400");
    CHECK(to_quantity(intx::uint256{1'000'000'000}) == "0x3b9aca00");
    CHECK(to_quantity(ByteView{}) == "0x0");
}

TEST_CASE("convert bytes to data", "[rpc][to_data]") {
    CHECK(to_data(ByteView{}) == "0x");
    CHECK(to_data(*from_hex("0x0041")) == "0x0041");
}

TEST_CASE("parse hex quantity", "[rpc][from_quantity]") {
    CHECK(from_quantity("0x0") == 0);
    CHECK(from_quantity("0x1d") == 29);
    CHECK(from_quantity("0X1D") == 29);
    CHECK(from_quantity("0xffffffffffffffff") == std::numeric_limits<uint64_t>::max());
    CHECK_THROWS_AS(from_quantity("0x"), InvalidParamsError);
    CHECK_THROWS_AS(from_quantity("29"), InvalidParamsError);
    CHECK_THROWS_AS(from_quantity("0xg"), InvalidParamsError);
    CHECK_THROWS_AS(from_quantity("0x10000000000000000"), InvalidParamsError);
}

TEST_CASE("parse quantity from json", "[rpc][from_quantity]") {
    CHECK(quantity_from_json(R"("0x5208")"_json) == 21000);
    CHECK(quantity_from_json(R"(21000)"_json) == 21000);
    CHECK_THROWS_AS(quantity_from_json(R"(-1)"_json), InvalidParamsError);
    CHECK_THROWS_AS(quantity_from_json(R"(true)"_json), InvalidParamsError);
}

TEST_CASE("parse byte string from json", "[rpc][bytes_from_json]") {
    CHECK(bytes_from_json(R"("0x")"_json).empty());
    CHECK(bytes_from_json(R"("0xdeadbeef")"_json) == *from_hex("deadbeef"));
    CHECK_THROWS_AS(bytes_from_json(R"("0xabc")"_json), InvalidParamsError);
    CHECK_THROWS_AS(bytes_from_json(R"("deadbeef")"_json), InvalidParamsError);
    CHECK_THROWS_AS(bytes_from_json(R"("0xzz")"_json), InvalidParamsError);
    CHECK_THROWS_AS(bytes_from_json(R"(12)"_json), InvalidParamsError);
}

TEST_CASE("serialize/deserialize evmc types", "[rpc][to_json][from_json]") {
    SECTION("address") {
        const auto address = 0xa872626373628737383927236382161739290870_address;
        const nlohmann::json j = address;
        CHECK(j == "0xa872626373628737383927236382161739290870");
        CHECK(j.get<evmc::address>() == address);
        CHECK_THROWS_AS(R"("0xa87262637362873738392723638216173929087")"_json.get<evmc::address>(), InvalidParamsError);
        CHECK_THROWS_AS(R"(12)"_json.get<evmc::address>(), InvalidParamsError);
    }
    SECTION("bytes32") {
        const auto hash = 0x3763e4f6e4198413383534c763f3f5dac5c5e939f0a81724e3beb96d6e2ad0d5_bytes32;
        const nlohmann::json j = hash;
        CHECK(j == "0x3763e4f6e4198413383534c763f3f5dac5c5e939f0a81724e3beb96d6e2ad0d5");
        CHECK(j.get<evmc::bytes32>() == hash);
        CHECK_THROWS_AS(R"("0x3763e4f6")"_json.get<evmc::bytes32>(), InvalidParamsError);
    }
    SECTION("uint256") {
        CHECK(R"("0x3b9aca00")"_json.get<intx::uint256>() == 1'000'000'000);
        CHECK(R"(7)"_json.get<intx::uint256>() == 7);
        CHECK_THROWS_AS(R"("1000")"_json.get<intx::uint256>(), InvalidParamsError);
    }
}

TEST_CASE("serialize sync status", "[rpc][to_json]") {
    SECTION("not syncing") {
        const SyncStatus status{NotSyncing{}};
        const nlohmann::json j = status;
        CHECK(j == false);
    }
    SECTION("in progress") {
        const SyncStatus status{SyncProgress{.starting_block = 0, .current_block = 0x10, .highest_block = 0x20}};
        const nlohmann::json j = status;
        CHECK(j == R"({"startingBlock":"0x0","currentBlock":"0x10","highestBlock":"0x20"})"_json);
    }
}

TEST_CASE("serialize work", "[rpc][to_json]") {
    const Work work{
        .header_hash = 0x0000000000000000000000000000000000000000000000000000000000000001_bytes32,
        .seed_hash = 0x0000000000000000000000000000000000000000000000000000000000000002_bytes32,
        .target = 0x0000000000000000000000000000000000000000000000000000000000000003_bytes32,
        .block_num = 1,
    };
    const nlohmann::json j = work;
    CHECK(j == R"([
        "0x0000000000000000000000000000000000000000000000000000000000000001",
        "0x0000000000000000000000000000000000000000000000000000000000000002",
        "0x0000000000000000000000000000000000000000000000000000000000000003",
        "0x1"
    ])"_json);
}

TEST_CASE("make empty json content", "[rpc][make_json_content]") {
    const auto j = make_json_content(R"({"jsonrpc":"2.0","id":1,"method":"eth_blockNumber"})"_json);
    CHECK(j == R"({"jsonrpc":"2.0","id":1,"result":null})"_json);
}

TEST_CASE("make json content", "[rpc][make_json_content]") {
    const auto j = make_json_content(R"({"jsonrpc":"2.0","id":"x","method":"eth_blockNumber"})"_json, "0x10");
    CHECK(j == R"({"jsonrpc":"2.0","id":"x","result":"0x10"})"_json);
}

TEST_CASE("make json error", "[rpc][make_json_error]") {
    const auto j = make_json_error(R"({"jsonrpc":"2.0","id":7})"_json, -32602, "invalid params");
    CHECK(j == R"({"jsonrpc":"2.0","id":7,"error":{"code":-32602,"message":"invalid params"}})"_json);
}

TEST_CASE("make json revert error", "[rpc][make_json_error]") {
    const RevertError error{{3, "execution reverted"}, *from_hex("0x01")};
    const auto j = make_json_error(R"({"jsonrpc":"2.0"})"_json, error);
    CHECK(j == R"({"jsonrpc":"2.0","id":null,"error":{"code":3,"message":"execution reverted","data":"0x01"}})"_json);
}

}  // namespace ethrpc::rpc
