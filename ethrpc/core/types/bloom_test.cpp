// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom.hpp"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>

namespace ethrpc {

using namespace evmc::literals;

TEST_CASE("Logs bloom", "[ethrpc][core][bloom]") {
    CHECK(logs_bloom({}) == Bloom{});

    const Log log{.address = 0x22341ae42d6dd7384bc8584e50419ea3ac75b83f_address,
                  .topics = {0x04491edcd115127caedbd478e2e7895ed80c7847e903431f94f9cfa579cad47f_bytes32}};
    const Bloom bloom{logs_bloom({log})};
    const auto bits_set{std::ranges::count_if(bloom, [](uint8_t b) { return b != 0; })};
    CHECK(bits_set > 0);
    CHECK(bits_set <= 6);

    Bloom sum{};
    join(sum, bloom);
    CHECK(sum == bloom);
}

TEST_CASE("Bloom membership", "[ethrpc][core][bloom]") {
    const auto address{0x22341ae42d6dd7384bc8584e50419ea3ac75b83f_address};
    const auto topic{0x04491edcd115127caedbd478e2e7895ed80c7847e903431f94f9cfa579cad47f_bytes32};
    const Bloom bloom{logs_bloom({Log{.address = address, .topics = {topic}}})};

    CHECK(bloom_contains(bloom, ByteView{address.bytes}));
    CHECK(bloom_contains(bloom, ByteView{topic.bytes}));
    CHECK(!bloom_contains(Bloom{}, ByteView{address.bytes}));

    SECTION("union keeps members of both sides") {
        const auto other{0x00000000000000000000000000000000000000aa_address};
        Bloom sum{logs_bloom({Log{.address = other}})};
        join(sum, bloom);
        CHECK(bloom_contains(sum, ByteView{address.bytes}));
        CHECK(bloom_contains(sum, ByteView{other.bytes}));
    }
}

}  // namespace ethrpc
