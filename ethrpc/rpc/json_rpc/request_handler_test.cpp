// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <ethrpc/infra/test_util/log.hpp>
#include <ethrpc/rpc/test_util/api_test_base.hpp>

namespace ethrpc::rpc::json_rpc {

using testing::_;
using testing::InvokeWithoutArgs;
using testing::Return;

struct RequestHandlerTest : public test_util::RpcApiTestBase {
    ethrpc::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
};

struct ReadOnlyRequestHandlerTest : public test_util::RpcApiTestBase {
    ReadOnlyRequestHandlerTest() : test_util::RpcApiTestBase{kEthReadApiGroup} {}
    ethrpc::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
};

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler rejects unparseable body", "[rpc][json_rpc][request_handler]") {
    CHECK(handle(std::string{R"({"jsonrpc":"2.0","id":1,"method":)"}) == R"({
        "jsonrpc":"2.0",
        "id":null,
        "error":{"code":-32700,"message":"parse error"}
    })"_json);
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler rejects nil characters outside strings", "[rpc][json_rpc][request_handler]") {
    std::string request{R"({"jsonrpc":"2.0","id":1,"method":"eth_blockNumber"})"};
    request.push_back('\0');
    const auto reply = handle(request);
    CHECK(reply["error"]["code"] == -32700);
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler rejects invalid request objects", "[rpc][json_rpc][request_handler]") {
    SECTION("batch") {
        CHECK(handle(std::string{R"([{"jsonrpc":"2.0","id":1,"method":"eth_blockNumber"}])"}) == R"({
            "jsonrpc":"2.0",
            "id":null,
            "error":{"code":-32600,"message":"invalid request"}
        })"_json);
    }
    SECTION("missing method") {
        CHECK(handle(R"({"jsonrpc":"2.0","id":1})"_json) == R"({
            "jsonrpc":"2.0",
            "id":1,
            "error":{"code":-32600,"message":"Request not valid, required fields: jsonrpc,method"}
        })"_json);
    }
    SECTION("params not array") {
        const auto reply = handle(R"({"jsonrpc":"2.0","id":2,"method":"eth_getBalance","params":"0x01"})"_json);
        CHECK(reply["id"] == 2);
        CHECK(reply["error"]["code"] == -32600);
    }
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler rejects unknown method", "[rpc][json_rpc][request_handler]") {
    CHECK(handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_AAA"})"_json) == R"({
        "jsonrpc":"2.0",
        "id":1,
        "error":{"code":-32601,"message":"the method eth_AAA does not exist/is not available"}
    })"_json);
}

TEST_CASE_METHOD(ReadOnlyRequestHandlerTest, "RequestHandler rejects method of disabled group", "[rpc][json_rpc][request_handler]") {
    const auto reply = handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_sendRawTransaction","params":["0x01"]})"_json);
    CHECK(reply["error"]["code"] == -32601);
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler rejects wrong param count before any collaborator call", "[rpc][json_rpc][request_handler]") {
    EXPECT_CALL(*chain_history_, open_snapshot).Times(0);
    CHECK(handle(R"({"jsonrpc":"2.0","id":3,"method":"eth_getBlockByNumber","params":[]})"_json) == R"({
        "jsonrpc":"2.0",
        "id":3,
        "error":{"code":-32602,"message":"invalid eth_getBlockByNumber params: []"}
    })"_json);
    const auto reply = handle(R"({"jsonrpc":"2.0","id":4,"method":"eth_blockNumber","params":[1]})"_json);
    CHECK(reply["error"]["code"] == -32602);
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler dispatches suspending method", "[rpc][json_rpc][request_handler]") {
    expect_snapshot();
    EXPECT_CALL(*snapshot_, head_block_num()).WillRepeatedly(Return(9));

    SECTION("with params") {
        CHECK(handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_blockNumber","params":[]})"_json) == R"({
            "jsonrpc":"2.0",
            "id":1,
            "result":"0x9"
        })"_json);
    }
    SECTION("without params") {
        CHECK(handle(R"({"jsonrpc":"2.0","id":"x","method":"eth_blockNumber"})"_json) == R"({
            "jsonrpc":"2.0",
            "id":"x",
            "result":"0x9"
        })"_json);
    }
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler dispatches immediate method", "[rpc][json_rpc][request_handler]") {
    EXPECT_CALL(*miner_, is_mining()).WillOnce(Return(true));
    CHECK(handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_mining"})"_json) == R"({
        "jsonrpc":"2.0",
        "id":1,
        "result":true
    })"_json);
}

TEST_CASE_METHOD(RequestHandlerTest, "RequestHandler normalizes handler failures", "[rpc][json_rpc][request_handler]") {
    SECTION("backend failure is internal error") {
        EXPECT_CALL(*backend_, protocol_version()).WillOnce(InvokeWithoutArgs([]() -> Task<uint64_t> {
            throw std::runtime_error{"backend unreachable"};
            co_return 0;
        }));
        CHECK(handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_protocolVersion"})"_json) == R"({
            "jsonrpc":"2.0",
            "id":1,
            "error":{"code":-32603,"message":"backend unreachable"}
        })"_json);
    }
    SECTION("malformed parameter is invalid params") {
        const auto reply = handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_getBalance","params":["0x12","latest"]})"_json);
        CHECK(reply["error"]["code"] == -32602);
    }
    SECTION("parameter of the wrong JSON type is invalid params") {
        const auto reply = handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_getBlockByNumber","params":["0x1","yes"]})"_json);
        CHECK(reply["error"]["code"] == -32602);
        CHECK(reply["error"]["message"].get<std::string>().starts_with("invalid param 1: "));
    }
    SECTION("absent optional result is null") {
        expect_snapshot();
        EXPECT_CALL(*snapshot_, head_block_num()).WillRepeatedly(Return(9));
        const auto reply = handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_getBlockByNumber","params":["0x10",false]})"_json);
        CHECK(reply == R"({"jsonrpc":"2.0","id":1,"result":null})"_json);
    }
}

}  // namespace ethrpc::rpc::json_rpc
