// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/endian.hpp>

namespace ethrpc {

TEST_CASE("Hex", "[ethrpc][core][util]") {
    auto parsed_bytes = from_hex("0x");
    CHECK((parsed_bytes.has_value() && parsed_bytes->empty()));

    parsed_bytes = from_hex("0xg");
    CHECK(!parsed_bytes.has_value());

    Bytes expected_bytes{0x0a, 0x1f};
    parsed_bytes = from_hex("0xa1f");
    CHECK((parsed_bytes.has_value() && parsed_bytes.value() == expected_bytes));

    parsed_bytes = from_hex("0A1F");
    CHECK((parsed_bytes.has_value() && parsed_bytes.value() == expected_bytes));

    CHECK(to_hex(expected_bytes) == "0a1f");
    CHECK(to_hex(expected_bytes, true) == "0x0a1f");
    CHECK(to_hex(uint64_t{0}, true) == "0x00");
    CHECK(to_hex(uint64_t{0x1234}, true) == "0x1234");
}

TEST_CASE("Hex validation", "[ethrpc][core][util]") {
    CHECK(is_valid_hex("0x0"));
    CHECK(!is_valid_hex("0x"));
    CHECK(!is_valid_hex("1234"));
    CHECK(is_valid_hex("0XaBc"));
    CHECK(!is_valid_hex("0x12g4"));
    CHECK(is_valid_fixed_hex("0x0102", 2));
    CHECK(!is_valid_fixed_hex("0x010", 2));
    CHECK(is_valid_address("0x0000000000000000000000000000000000000001"));
    CHECK(!is_valid_address("0x00000000000000000000000000000000000001"));
    CHECK(is_valid_hash("0x0000000000000000000000000000000000000000000000000000000000000001"));
    CHECK(!is_valid_hash("0x000000000000000000000000000000000000000000000000000000000000000g"));
}

TEST_CASE("zeroless_view", "[ethrpc][core][util]") {
    const Bytes data{0x00, 0x00, 0x01, 0x00};
    CHECK(zeroless_view(data) == ByteView{data}.substr(2));
    CHECK(zeroless_view(Bytes{0x00, 0x00}).empty());
}

TEST_CASE("Big compact endianness", "[ethrpc][core][endian]") {
    CHECK(endian::to_big_compact(uint64_t{0}).empty());
    CHECK(endian::to_big_compact(uint64_t{0x0102}) == Bytes{0x01, 0x02});

    uint64_t out{0};
    CHECK(endian::from_big_compact(Bytes{0x01, 0x02}, out));
    CHECK(out == 0x0102);
    CHECK(endian::from_big_compact(Bytes{0x00, 0x02}, out).error() == DecodingError::kLeadingZero);
    CHECK(endian::from_big_compact(Bytes(9, 0x01), out).error() == DecodingError::kOverflow);
}

TEST_CASE("Keccak", "[ethrpc][core][util]") {
    // keccak256 of the empty input
    CHECK(to_hex(keccak256(ByteView{}).bytes) == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

}  // namespace ethrpc
