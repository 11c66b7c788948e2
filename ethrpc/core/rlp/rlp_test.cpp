// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/decode.hpp>
#include <ethrpc/core/rlp/encode.hpp>

namespace ethrpc::rlp {

template <class T>
static T decode_success(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T res{};
    REQUIRE(decode(view, res));
    return res;
}

template <class T>
static DecodingError decode_failure(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T x{};
    DecodingResult res{decode(view, x)};
    REQUIRE(!res);
    return res.error();
}

template <class T>
static std::string encoded(const T& x) {
    Bytes out;
    encode(out, x);
    return to_hex(out);
}

TEST_CASE("RLP decoding", "[ethrpc][core][rlp]") {
    SECTION("strings") {
        CHECK(to_hex(decode_success<Bytes>("00")) == "00");
        CHECK(to_hex(decode_success<Bytes>("8D6F62636465666768696A6B6C6D")) == "6f62636465666768696a6b6c6d");

        CHECK(decode_failure<Bytes>("8D6F62636465666768696A6B6C6Daa") == DecodingError::kInputTooLong);
        CHECK(decode_failure<Bytes>("C0") == DecodingError::kUnexpectedList);
    }

    SECTION("uint64") {
        CHECK(decode_success<uint64_t>("09") == 9);
        CHECK(decode_success<uint64_t>("80") == 0);
        CHECK(decode_success<uint64_t>("820505") == 0x0505);

        CHECK(decode_failure<uint64_t>("00") == DecodingError::kLeadingZero);
        CHECK(decode_failure<uint64_t>("8105") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("B8020004") == DecodingError::kNonCanonicalSize);
        CHECK(decode_failure<uint64_t>("8AFFFFFFFFFFFFFFFFFF7C") == DecodingError::kOverflow);
    }

    SECTION("headers") {
        Bytes bytes{*from_hex("F90102")};
        ByteView view{bytes};
        CHECK(decode_header(view).error() == DecodingError::kInputTooShort);

        bytes = *from_hex("C3010203");
        view = bytes;
        const auto header{decode_header(view)};
        REQUIRE(header);
        CHECK(header->list);
        CHECK(header->payload_length == 3);
        CHECK(view.size() == 3);
    }

    SECTION("lists") {
        CHECK(decode_success<std::vector<intx::uint256>>("C0").empty());
        CHECK(decode_success<std::vector<uint64_t>>("C883BBCCB583FFC0B5") == std::vector<uint64_t>{0xBBCCB5, 0xFFC0B5});
        CHECK(decode_failure<std::vector<uint64_t>>("C883BBCCB583FFC0B5aa") == DecodingError::kInputTooLong);
    }
}

TEST_CASE("RLP encoding", "[ethrpc][core][rlp]") {
    CHECK(encoded(uint64_t{0}) == "80");
    CHECK(encoded(uint64_t{0x7f}) == "7f");
    CHECK(encoded(uint64_t{0x400}) == "820400");
    CHECK(encoded(ByteView{}) == "80");
    CHECK(encoded(Bytes{0x01}) == "01");
    CHECK(encoded(std::vector<uint64_t>{1, 2, 3}) == "c3010203");
    CHECK(encoded(Bytes(56, 0xaa)).substr(0, 4) == "b838");
    CHECK(length(Bytes(56, 0xaa)) == 58);
}

}  // namespace ethrpc::rlp
