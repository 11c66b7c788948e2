// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/encode.hpp>

namespace ethrpc {

evmc::address create_address(const evmc::address& caller, uint64_t nonce) noexcept {
    rlp::Header h{true, 1 + kAddressLength};
    h.payload_length += rlp::length(nonce);

    Bytes rlp{};
    rlp::encode_header(rlp, h);
    rlp::encode(rlp, caller);
    rlp::encode(rlp, nonce);

    ethash::hash256 hash{keccak256(rlp)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(address.bytes, /*with_prefix=*/true);
}

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace ethrpc

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << ethrpc::address_to_hex(address);
    return out;
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value) {
    out << ethrpc::to_hex(value, /*with_prefix=*/true);
    return out;
}

}  // namespace evmc
