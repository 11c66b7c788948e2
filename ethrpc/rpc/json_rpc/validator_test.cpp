// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/rpc/json_rpc/methods.hpp>

namespace ethrpc::rpc::json_rpc {

TEST_CASE("rpc::json_rpc::Validator validates request fields", "[rpc][json_rpc][validator]") {
    Validator validator;

    SECTION("valid request") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_blockNumber","params":[],"id":1})"_json;
        CHECK(validator.validate(request));
    }
    SECTION("valid request without params and id") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_blockNumber"})"_json;
        CHECK(validator.validate(request));
    }
    SECTION("string id") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_blockNumber","id":"abc"})"_json;
        CHECK(validator.validate(request));
    }
    SECTION("missing jsonrpc") {
        const auto request = R"({"method":"eth_blockNumber","params":[],"id":1})"_json;
        const auto result = validator.validate(request);
        REQUIRE(!result);
        CHECK(result.error() == "Request not valid, required fields: jsonrpc,method");
    }
    SECTION("missing method") {
        const auto request = R"({"jsonrpc":"2.0","params":[],"id":1})"_json;
        CHECK(!validator.validate(request));
    }
    SECTION("wrong jsonrpc version") {
        const auto request = R"({"jsonrpc":"1.0","method":"eth_blockNumber","id":1})"_json;
        const auto result = validator.validate(request);
        REQUIRE(!result);
        CHECK(result.error() == "Invalid field: jsonrpc");
    }
    SECTION("empty method") {
        const auto request = R"({"jsonrpc":"2.0","method":"","id":1})"_json;
        CHECK(!validator.validate(request));
    }
    SECTION("params not array") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_getBalance","params":{"a":1},"id":1})"_json;
        const auto result = validator.validate(request);
        REQUIRE(!result);
        CHECK(result.error() == "Invalid field: params");
    }
    SECTION("id not scalar") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_blockNumber","id":[1]})"_json;
        CHECK(!validator.validate(request));
    }
    SECTION("unknown field") {
        const auto request = R"({"jsonrpc":"2.0","method":"eth_blockNumber","id":1,"extra":true})"_json;
        const auto result = validator.validate(request);
        REQUIRE(!result);
        CHECK(result.error() == "Invalid field: extra");
    }
    SECTION("not an object") {
        CHECK(!validator.validate(R"([1,2])"_json));
        CHECK(!validator.validate(R"("eth_blockNumber")"_json));
    }
}

TEST_CASE("rpc::json_rpc::Validator validates param count", "[rpc][json_rpc][validator]") {
    Validator validator;
    const auto* get_balance = find_method(method::k_eth_getBalance);
    REQUIRE(get_balance != nullptr);

    SECTION("within bounds") {
        CHECK(validator.validate_params(R"({"params":["0x0000000000000000000000000000000000000001"]})"_json, *get_balance));
        CHECK(validator.validate_params(R"({"params":["0x0000000000000000000000000000000000000001","latest"]})"_json, *get_balance));
    }
    SECTION("too few") {
        const auto result = validator.validate_params(R"({"params":[]})"_json, *get_balance);
        REQUIRE(!result);
        CHECK(result.error() == "invalid eth_getBalance params: []");
    }
    SECTION("too many") {
        CHECK(!validator.validate_params(R"({"params":["0x01","latest","extra"]})"_json, *get_balance));
    }
    SECTION("absent params counts as empty") {
        const auto* block_number = find_method(method::k_eth_blockNumber);
        REQUIRE(block_number != nullptr);
        CHECK(validator.validate_params(R"({"jsonrpc":"2.0"})"_json, *block_number));
        CHECK(!validator.validate_params(R"({"jsonrpc":"2.0"})"_json, *get_balance));
    }
}

}  // namespace ethrpc::rpc::json_rpc
