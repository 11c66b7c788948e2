// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// RLP encoding functions as per
// https://eth.wiki/en/fundamentals/rlp

#include <numeric>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/common/endian.hpp>

namespace ethrpc::rlp {

struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kEmptyStringCode{0x80};
inline constexpr uint8_t kEmptyListCode{0xC0};

void encode_header(Bytes& to, Header header);

//! Append \p payload, made of already encoded items, as one RLP list
void encode_list(Bytes& to, ByteView payload);

void encode(Bytes& to, ByteView str);

template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    if (n == 0) {
        to.push_back(kEmptyStringCode);
    } else if (n < kEmptyStringCode) {
        to.push_back(static_cast<uint8_t>(n));
    } else {
        const Bytes be{endian::to_big_compact(n)};
        encode_header(to, {.list = false, .payload_length = be.size()});
        to.append(be);
    }
}

void encode(Bytes& to, bool);

void encode(Bytes& to, const evmc::address& address);

void encode(Bytes& to, const evmc::bytes32& value);

size_t length_of_length(uint64_t payload_length) noexcept;

size_t length(ByteView) noexcept;

template <UnsignedIntegral T>
size_t length(const T& n) noexcept {
    if (n < kEmptyStringCode) {
        return 1;
    }
    const size_t n_bytes{intx::count_significant_bytes(n)};
    return n_bytes + length_of_length(n_bytes);
}

inline size_t length(bool) noexcept {
    return 1;
}

inline size_t length(const evmc::address&) noexcept {
    return kAddressLength + 1;
}

inline size_t length(const evmc::bytes32&) noexcept {
    return kHashLength + 1;
}

template <typename T>
size_t length_items(const std::vector<T>& v) {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, const T& x) { return sum + length(x); });
}

template <typename T>
size_t length(const std::vector<T>& v) {
    const size_t payload_length = length_items(v);
    return length_of_length(payload_length) + payload_length;
}

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    const Header h{.list = true, .payload_length = length_items(v)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    for (const T& x : v) {
        encode(to, x);
    }
}

}  // namespace ethrpc::rlp
