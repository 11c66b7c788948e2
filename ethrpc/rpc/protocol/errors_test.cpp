// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <string>

#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

namespace ethrpc::rpc {

TEST_CASE("ProtocolErrorCategory", "[rpc][protocol][errors]") {
    SECTION("known codes") {
        CHECK(to_system_code(ErrorCode::kResourceNotFound).message() == "resource not found");
        CHECK(to_system_code(ErrorCode::kResourceUnavailable).message() == "resource unavailable");
        CHECK(to_system_code(ErrorCode::kExecutionReverted).value() == 3);
        CHECK(to_system_code(ErrorCode::kInvalidParams).value() == -32602);
        CHECK(to_system_code(ErrorCode::kParseError).category().name() == std::string{"rpc::ProtocolErrorCategory"});
    }
    SECTION("unknown code") {
        const boost::system::error_code ec{-1, protocol_category()};
        CHECK(ec.message() == "unknown error -1");
    }
    SECTION("single category instance") {
        CHECK(to_system_code(ErrorCode::kServerError).category() == protocol_category());
    }
    SECTION("raising system_error") {
        CHECK_THROWS_AS(throw boost::system::system_error{to_system_code(ErrorCode::kInternalError)}, boost::system::system_error);
    }
}

}  // namespace ethrpc::rpc
