// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <cstring>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/util.hpp>

namespace ethrpc::ecdsa {

// secp256k1 curve order and its half
static constexpr auto kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};
static constexpr auto kSecp256k1Halfn{kSecp256k1n >> 1};

static secp256k1_context* context() {
    static secp256k1_context* kDefaultContext{
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)};
    return kDefaultContext;
}

static evmc::address public_key_to_address(const secp256k1_pubkey& public_key) {
    size_t out_len{65};
    uint8_t serialized[65];
    secp256k1_ec_pubkey_serialize(context(), serialized, &out_len, &public_key, SECP256K1_EC_UNCOMPRESSED);

    // Skip the 0x04 prefix and take the last 20 bytes of the hash
    const auto hash{ethash::keccak256(serialized + 1, out_len - 1)};
    evmc::address address;
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) {
    if (r == 0 || s == 0) {
        return false;
    }
    if (r >= kSecp256k1n || s >= kSecp256k1n) {
        return false;
    }
    // https://eips.ethereum.org/EIPS/eip-2
    return s <= kSecp256k1Halfn;
}

std::optional<RecoverableSignature> sign(const evmc::bytes32& message_hash, ByteView private_key) {
    if (private_key.size() != kHashLength) {
        return std::nullopt;
    }
    secp256k1_ecdsa_recoverable_signature signature;
    if (!secp256k1_ecdsa_sign_recoverable(context(), &signature, message_hash.bytes, private_key.data(), nullptr, nullptr)) {
        return std::nullopt;
    }
    uint8_t compact[64];
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context(), compact, &recovery_id, &signature);

    RecoverableSignature result;
    result.r = intx::be::unsafe::load<intx::uint256>(compact);
    result.s = intx::be::unsafe::load<intx::uint256>(compact + kHashLength);
    result.odd_y_parity = recovery_id == 1;
    return result;
}

std::optional<evmc::address> recover_address(const evmc::bytes32& message_hash, const RecoverableSignature& signature) {
    if (!is_valid_signature(signature.r, signature.s)) {
        return std::nullopt;
    }
    uint8_t compact[64];
    intx::be::unsafe::store(compact, signature.r);
    intx::be::unsafe::store(compact + kHashLength, signature.s);

    secp256k1_ecdsa_recoverable_signature parsed;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context(), &parsed, compact, signature.odd_y_parity ? 1 : 0)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ecdsa_recover(context(), &public_key, &parsed, message_hash.bytes)) {
        return std::nullopt;
    }
    return public_key_to_address(public_key);
}

std::optional<evmc::address> private_key_to_address(ByteView private_key) {
    if (private_key.size() != kHashLength || !secp256k1_ec_seckey_verify(context(), private_key.data())) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(context(), &public_key, private_key.data())) {
        return std::nullopt;
    }
    return public_key_to_address(public_key);
}

}  // namespace ethrpc::ecdsa
