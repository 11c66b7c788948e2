// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/core/types/receipt.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/devnet/state.hpp>

namespace ethrpc::devnet {

namespace fee {
    inline constexpr uint64_t kGTransaction{21'000};
    inline constexpr uint64_t kGTxCreate{32'000};
    inline constexpr uint64_t kGTxDataZero{4};
    inline constexpr uint64_t kGTxDataNonZero{16};  // EIP-2028
}  // namespace fee

//! \brief Intrinsic gas of a message carrying \p data, in the Istanbul schedule without access lists
uint64_t intrinsic_gas(ByteView data, bool contract_creation) noexcept;

//! Header fields chosen by the block producer
struct BlockTemplate {
    evmc::address beneficiary{};
    intx::uint256 difficulty{1};
    uint64_t gas_limit{0};
    uint64_t timestamp{0};
};

//! Unsealed block together with its execution outcome
struct BuiltBlock {
    Block block;
    std::vector<Receipt> receipts;
    WorldState post_state;
};

//! \brief Apply \p txn as a plain value transfer on top of \p state
//! \param gas_used cumulative gas of the block so far, updated on success
//! \return the reason why the transaction cannot be included, std::nullopt on success
std::optional<std::string> apply_transfer(WorldState& state, const Transaction& txn, const BlockHeader& header, uint64_t& gas_used);

//! \brief Build the child block of \p parent including every candidate that applies as a value transfer
//! \details Candidates that cannot be applied are skipped and left out of the block. The base fee is inherited.
BuiltBlock build_block(const BlockWithHash& parent,
                       const WorldState& parent_state,
                       const std::vector<Transaction>& candidates,
                       const BlockTemplate& block_template);

}  // namespace ethrpc::devnet
