// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/util.hpp>

namespace ethrpc::rpc {

TEST_CASE("print Error", "[rpc][types][error]") {
    const Error error{-32000, "nonce too low"};
    std::ostringstream out;
    out << error;
    CHECK(out.str() == "code: -32000 message: nonce too low");
}

TEST_CASE("print RevertError", "[rpc][types][error]") {
    const RevertError error{{3, "execution reverted"}, *from_hex("0x08c379a0")};
    std::ostringstream out;
    out << error;
    CHECK(out.str() == "code: 3 message: execution reverted data: 0x08c379a0");
}

TEST_CASE("ResolutionError reason", "[rpc][types][error]") {
    const ResolutionError error{ResolutionError::Reason::kReorgedDuringCall, "block 5 no longer canonical"};
    CHECK(error.reason() == ResolutionError::Reason::kReorgedDuringCall);
    CHECK(to_string(error.reason()) == "reorged during call");
    CHECK(to_string(ResolutionError::Reason::kPrunedOrUnavailable) == "pruned or unavailable");
}

TEST_CASE("ExecutionError carries revert data", "[rpc][types][error]") {
    const ExecutionError plain{-32000, "intrinsic gas too low"};
    CHECK(plain.data().empty());
    CHECK(std::string{plain.what()} == "intrinsic gas too low");

    const ExecutionError reverted{3, "execution reverted", *from_hex("0x01")};
    CHECK(reverted.error_code() == 3);
    CHECK(reverted.data() == *from_hex("0x01"));
}

}  // namespace ethrpc::rpc
