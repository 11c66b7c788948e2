// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/bytes.hpp>

namespace ethrpc::ecdsa {

//! Compact recoverable signature over a 32-byte message hash
struct RecoverableSignature {
    intx::uint256 r;
    intx::uint256 s;
    bool odd_y_parity{false};
};

//! \brief Checks that r and s lie in the valid range and s is in the lower half of the curve order (EIP-2)
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s);

//! \brief Signs the message hash with the private key
//! \return std::nullopt if the private key is invalid
std::optional<RecoverableSignature> sign(const evmc::bytes32& message_hash, ByteView private_key);

//! \brief Recovers the signer address from the message hash and signature
//! \return std::nullopt if recovery fails
std::optional<evmc::address> recover_address(const evmc::bytes32& message_hash, const RecoverableSignature& signature);

//! \brief Derives the account address controlled by the private key
std::optional<evmc::address> private_key_to_address(ByteView private_key);

}  // namespace ethrpc::ecdsa
