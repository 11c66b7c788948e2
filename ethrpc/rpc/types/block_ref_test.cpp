// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_ref.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

using namespace evmc::literals;

TEST_CASE("BlockRef from tags", "[rpc][types][block_ref]") {
    SECTION("earliest") {
        BlockRef ref{std::string{"earliest"}};
        CHECK(ref.is_tag());
        CHECK(ref.tag() == BlockTag::kEarliest);
        CHECK(ref.to_string() == "earliest");
    }
    SECTION("latest") {
        BlockRef ref{std::string{"latest"}};
        CHECK(ref.is_tag());
        CHECK(ref.tag() == BlockTag::kLatest);
        CHECK(!ref.is_pending());
    }
    SECTION("pending") {
        BlockRef ref{std::string{"pending"}};
        CHECK(ref.is_pending());
        CHECK(ref.to_string() == "pending");
    }
    SECTION("default latest") {
        CHECK(BlockRef::latest() == BlockRef{BlockTag::kLatest});
    }
}

TEST_CASE("BlockRef from numbers", "[rpc][types][block_ref]") {
    SECTION("hex quantity") {
        BlockRef ref{std::string{"0x12f4"}};
        CHECK(ref.is_number());
        CHECK(ref.number() == 0x12f4);
        CHECK(ref.to_string() == "0x12f4");
    }
    SECTION("uppercase prefix") {
        BlockRef ref{std::string{"0X10"}};
        CHECK(ref.number() == 16);
    }
    SECTION("decimal string") {
        BlockRef ref{std::string{"4660"}};
        CHECK(ref.is_number());
        CHECK(ref.number() == 4660);
    }
    SECTION("number") {
        BlockRef ref{BlockNum{7}};
        CHECK(ref.is_number());
        CHECK(!ref.is_hash());
        CHECK(!ref.is_tag());
        CHECK(ref.number() == 7);
    }
    SECTION("max 64-bit height") {
        BlockRef ref{std::string{"0xffffffffffffffff"}};
        CHECK(ref.number() == kMaxBlockNum);
    }
}

TEST_CASE("BlockRef from hash", "[rpc][types][block_ref]") {
    const std::string hash_hex{"0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c"};
    BlockRef ref{hash_hex};
    CHECK(ref.is_hash());
    CHECK(ref.hash() == 0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32);
    CHECK(ref.to_string() == hash_hex);
    CHECK(!ref.require_canonical());

    BlockRef canonical_ref{ref.hash(), /*require_canonical=*/true};
    CHECK(canonical_ref.require_canonical());
}

TEST_CASE("BlockRef malformed", "[rpc][types][block_ref]") {
    CHECK_THROWS_AS(BlockRef{std::string{""}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"0x"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"safe"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"0xzz"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"-1"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"12a"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"0x10000000000000000"}}, InvalidParamsError);
    CHECK_THROWS_AS(BlockRef{std::string{"0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126z"}}, InvalidParamsError);
}

}  // namespace ethrpc::rpc
