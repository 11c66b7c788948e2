// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_tx_pool.hpp"

#include <string>
#include <utility>

#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::devnet {

using rpc::txpool::OperationResult;

static OperationResult rejected(std::string error_descr) {
    ETHRPC_DEBUG << "MemoryTxPool rejected transaction: " << error_descr;
    return OperationResult{.success = false, .error_descr = std::move(error_descr)};
}

Task<OperationResult> MemoryTxPool::add_transaction(ByteView rlp_tx) {
    Transaction txn;
    ByteView encoded{rlp_tx};
    if (const auto decoding_result{rlp::decode_transaction(encoded, txn)}; !decoding_result) {
        co_return rejected(std::string{"rlp: "} + to_string(decoding_result.error()));
    }
    const auto tx_hash{txn.hash()};
    if (chain_->is_pooled(tx_hash)) {
        ETHRPC_DEBUG << "MemoryTxPool already known: " << to_hex(tx_hash, true);
        co_return OperationResult{.success = true, .error_descr = {}};
    }
    if (txn.chain_id && (!chain_id_ || *txn.chain_id != intx::uint256{*chain_id_})) {
        co_return rejected("invalid chain id");
    }
    const auto sender{txn.sender()};
    if (!sender) {
        co_return rejected("invalid sender");
    }

    const auto head = chain_->head();
    const auto& header = head->block->block.header;
    const auto it{head->state->find(*sender)};
    const Account account{it != head->state->end() ? it->second.account : Account{}};
    if (txn.nonce < account.nonce) {
        co_return rejected("nonce too low");
    }
    if (txn.gas_limit < intrinsic_gas(txn.data, !txn.to)) {
        co_return rejected("intrinsic gas too low");
    }
    if (txn.gas_limit > header.gas_limit) {
        co_return rejected("exceeds block gas limit");
    }
    if (txn.max_fee_per_gas < txn.max_priority_fee_per_gas) {
        co_return rejected("max priority fee per gas higher than max fee per gas");
    }
    const intx::uint256 cost{intx::uint256{txn.gas_limit} * txn.max_fee_per_gas + txn.value};
    if (account.balance < cost) {
        co_return rejected("insufficient funds for gas * price + value");
    }

    txn.set_sender(*sender);
    chain_->add_pooled_transaction(txn, tx_hash);
    ETHRPC_DEBUG << "MemoryTxPool added: " << to_hex(tx_hash, true) << " sender: " << *sender << " nonce: " << txn.nonce;
    co_return OperationResult{.success = true, .error_descr = {}};
}

Task<std::optional<uint64_t>> MemoryTxPool::nonce(const evmc::address& address) {
    co_return chain_->pooled_nonce(address);
}

}  // namespace ethrpc::devnet
