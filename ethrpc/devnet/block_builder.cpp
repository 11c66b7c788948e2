// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_builder.hpp"

#include <algorithm>

#include <ethrpc/core/common/empty_hashes.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::devnet {

uint64_t intrinsic_gas(ByteView data, bool contract_creation) noexcept {
    uint64_t gas{fee::kGTransaction};
    if (contract_creation) {
        gas += fee::kGTxCreate;
    }
    const auto non_zero_bytes{static_cast<uint64_t>(std::ranges::count_if(data, [](uint8_t c) { return c != 0; }))};
    gas += non_zero_bytes * fee::kGTxDataNonZero;
    gas += (data.size() - non_zero_bytes) * fee::kGTxDataZero;
    return gas;
}

std::optional<std::string> apply_transfer(WorldState& state, const Transaction& txn, const BlockHeader& header, uint64_t& gas_used) {
    const auto sender{txn.sender()};
    if (!sender) {
        return "invalid sender";
    }
    if (!txn.to) {
        return "contract creation not supported";
    }
    if (const auto it{state.find(*txn.to)}; it != state.end() && !it->second.code.empty()) {
        return "message call to contract not supported";
    }
    const intx::uint256 base_fee{header.base_fee_per_gas.value_or(0)};
    if (txn.max_fee_per_gas < base_fee) {
        return "max fee per gas less than block base fee";
    }
    const uint64_t gas{intrinsic_gas(txn.data, /*contract_creation=*/false)};
    if (txn.gas_limit < gas) {
        return "intrinsic gas too low";
    }
    if (gas_used + txn.gas_limit > header.gas_limit) {
        return "gas limit reached";
    }

    const auto from_it{state.find(*sender)};
    const Account sender_account{from_it != state.end() ? from_it->second.account : Account{}};
    if (txn.nonce != sender_account.nonce) {
        return txn.nonce < sender_account.nonce ? "nonce too low" : "nonce too high";
    }
    const intx::uint256 max_cost{intx::uint256{txn.gas_limit} * txn.max_fee_per_gas + txn.value};
    if (sender_account.balance < max_cost) {
        return "insufficient funds for gas * price + value";
    }
    AccountState& from{state[*sender]};

    // Only the intrinsic gas is charged, the base fee part is burnt
    const intx::uint256 price{txn.effective_gas_price(base_fee)};
    from.account.balance -= txn.value + intx::uint256{gas} * price;
    ++from.account.nonce;
    state[*txn.to].account.balance += txn.value;
    state[header.beneficiary].account.balance += intx::uint256{gas} * (price - base_fee);
    gas_used += gas;
    return std::nullopt;
}

BuiltBlock build_block(const BlockWithHash& parent,
                       const WorldState& parent_state,
                       const std::vector<Transaction>& candidates,
                       const BlockTemplate& block_template) {
    BuiltBlock built{.post_state = parent_state};

    auto& header = built.block.header;
    header.parent_hash = parent.hash;
    header.ommers_hash = kEmptyListHash;
    header.beneficiary = block_template.beneficiary;
    header.difficulty = block_template.difficulty;
    header.number = parent.block.header.number + 1;
    header.gas_limit = block_template.gas_limit;
    header.timestamp = std::max(block_template.timestamp, parent.block.header.timestamp + 1);
    header.base_fee_per_gas = parent.block.header.base_fee_per_gas;

    uint64_t gas_used{0};
    for (const auto& txn : candidates) {
        const auto error{apply_transfer(built.post_state, txn, header, gas_used)};
        if (error) {
            ETHRPC_TRACE << "build_block skip txn: " << to_hex(txn.hash()) << " reason: " << *error;
            continue;
        }
        Receipt receipt{
            .type = txn.type,
            .success = true,
            .cumulative_gas_used = gas_used,
        };
        built.block.transactions.push_back(txn);
        built.receipts.push_back(std::move(receipt));
    }
    header.gas_used = gas_used;
    header.transactions_root = built.block.transactions.empty() ? kEmptyRoot : evmc::bytes32{};
    header.receipts_root = header.transactions_root;
    return built;
}

}  // namespace ethrpc::devnet
