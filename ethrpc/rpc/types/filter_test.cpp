// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "filter.hpp"

#include <catch2/catch_test_macros.hpp>

namespace ethrpc::rpc {

using namespace evmc::literals;

static const evmc::address kAddress1{0x00000000000000000000000000000000000000aa_address};
static const evmc::address kAddress2{0x00000000000000000000000000000000000000bb_address};
static const evmc::bytes32 kTopic1{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
static const evmc::bytes32 kTopic2{0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
static const evmc::bytes32 kTopic3{0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};

TEST_CASE("Filter matching", "[rpc][types][filter]") {
    SECTION("empty filter matches everything") {
        Filter filter;
        CHECK(matches(filter, kAddress1, {}));
        CHECK(matches(filter, kAddress2, {kTopic1, kTopic2}));
    }
    SECTION("address set") {
        Filter filter{.addresses = {kAddress1}};
        CHECK(matches(filter, kAddress1, {kTopic1}));
        CHECK(!matches(filter, kAddress2, {kTopic1}));
    }
    SECTION("positional topics") {
        Filter filter{.topics = {{kTopic1}, {kTopic2}}};
        CHECK(matches(filter, kAddress1, {kTopic1, kTopic2}));
        CHECK(matches(filter, kAddress1, {kTopic1, kTopic2, kTopic3}));
        CHECK(!matches(filter, kAddress1, {kTopic2, kTopic1}));
        CHECK(!matches(filter, kAddress1, {kTopic1}));
    }
    SECTION("wildcard position") {
        Filter filter{.topics = {{}, {kTopic2}}};
        CHECK(matches(filter, kAddress1, {kTopic3, kTopic2}));
        CHECK(!matches(filter, kAddress1, {kTopic3, kTopic3}));
    }
    SECTION("alternatives within one position") {
        Filter filter{.topics = {{kTopic1, kTopic3}}};
        CHECK(matches(filter, kAddress1, {kTopic1}));
        CHECK(matches(filter, kAddress1, {kTopic3}));
        CHECK(!matches(filter, kAddress1, {kTopic2}));
    }
    SECTION("address and topics are a conjunction") {
        Filter filter{.addresses = {kAddress2}, .topics = {{kTopic1}}};
        CHECK(matches(filter, kAddress2, {kTopic1}));
        CHECK(!matches(filter, kAddress1, {kTopic1}));
        CHECK(!matches(filter, kAddress2, {kTopic2}));
    }
}

TEST_CASE("Filter to_string", "[rpc][types][filter]") {
    Filter filter{.from_block = BlockRef{BlockNum{1}}, .addresses = {kAddress1}, .topics = {{kTopic1}}};
    const auto text = filter.to_string();
    CHECK(text.find("from_block: 0x1") != std::string::npos);
    CHECK(text.find("to_block: null") != std::string::npos);
}

}  // namespace ethrpc::rpc
