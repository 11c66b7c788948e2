// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <vector>

#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/bloom.hpp>
#include <ethrpc/core/types/transaction.hpp>

namespace ethrpc {

using TotalDifficulty = intx::uint256;

struct BlockHeader {
    using NonceType = std::array<uint8_t, kNonceLength>;

    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};

    Bytes extra_data{};

    evmc::bytes32 prev_randao{};  // mix hash (digest) prior to EIP-4399
    NonceType nonce{};

    // Added in London
    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    //! \brief Keccak-256 of the RLP encoding; the sealing hash omits mix digest and nonce
    evmc::bytes32 hash(bool for_sealing = false) const;

    //! \brief Calculates header's boundary. This is described by Equation(50) by the Yellow Paper.
    //! \return A hash of 256 bits with big endian byte order
    ethash::hash256 boundary() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

struct BlockBody {
    std::vector<Transaction> transactions;
    std::vector<BlockHeader> ommers;
};

struct Block : public BlockBody {
    BlockHeader header;
};

struct BlockWithHash {
    Block block;
    evmc::bytes32 hash;
};

namespace rlp {
    void encode(Bytes& to, const BlockHeader&, bool for_sealing = false);
}  // namespace rlp

}  // namespace ethrpc
