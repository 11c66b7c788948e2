// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_reader.hpp"

#include <stdexcept>
#include <string>

#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

Task<ResolvedBlock> BlockReader::resolve(const BlockRef& block_ref) const {
    if (block_ref.is_number()) {
        co_return co_await resolve_number(block_ref.number());
    }
    if (block_ref.is_hash()) {
        co_return co_await resolve_hash(block_ref.hash());
    }
    co_return co_await resolve_tag(block_ref.tag());
}

Task<ResolvedBlock> BlockReader::resolve_retained(const BlockRef& block_ref) const {
    const auto block = co_await resolve(block_ref);
    if (!block.pending) {
        ensure_retained(block.block_num);
    }
    co_return block;
}

void BlockReader::ensure_retained(BlockNum block_num) const {
    const BlockNum lowest_block_num{snapshot_.lowest_block_num()};
    if (block_num < lowest_block_num) {
        throw ResolutionError{ResolutionError::Reason::kPrunedOrUnavailable,
                              "block " + std::to_string(block_num) + " pruned, lowest available is " + std::to_string(lowest_block_num)};
    }
}

Task<ResolvedBlock> BlockReader::resolve_number(BlockNum block_num) const {
    if (block_num > snapshot_.head_block_num()) {
        throw NotFoundError{"block " + std::to_string(block_num) + " is beyond head " + std::to_string(snapshot_.head_block_num())};
    }
    const auto block_hash = co_await snapshot_.read_canonical_hash(block_num);
    if (!block_hash) {
        throw NotFoundError{"no canonical hash for block " + std::to_string(block_num)};
    }
    co_return ResolvedBlock{.block_num = block_num, .block_hash = *block_hash};
}

Task<ResolvedBlock> BlockReader::resolve_hash(const evmc::bytes32& block_hash) const {
    const auto block_num = co_await snapshot_.read_block_num(block_hash);
    if (!block_num) {
        throw NotFoundError{"unknown block hash " + to_hex(block_hash, true)};
    }
    if (*block_num > snapshot_.head_block_num()) {
        throw NotFoundError{"block hash " + to_hex(block_hash, true) + " is beyond head"};
    }
    const auto canonical_hash = co_await snapshot_.read_canonical_hash(*block_num);
    if (!canonical_hash || *canonical_hash != block_hash) {
        throw NotFoundError{"block hash " + to_hex(block_hash, true) + " is not canonical"};
    }
    co_return ResolvedBlock{.block_num = *block_num, .block_hash = block_hash};
}

Task<ResolvedBlock> BlockReader::resolve_tag(BlockTag tag) const {
    switch (tag) {
        case BlockTag::kEarliest: {
            if (snapshot_.lowest_block_num() > 0) {
                throw ResolutionError{ResolutionError::Reason::kPrunedOrUnavailable,
                                      "earliest block pruned, lowest available is " + std::to_string(snapshot_.lowest_block_num())};
            }
            const auto genesis_hash = co_await snapshot_.read_canonical_hash(0);
            if (!genesis_hash) {
                throw ResolutionError{ResolutionError::Reason::kPrunedOrUnavailable, "genesis block unavailable"};
            }
            co_return ResolvedBlock{.block_num = 0, .block_hash = *genesis_hash};
        }
        case BlockTag::kPending: {
            const auto pending_block = co_await snapshot_.read_pending_block();
            if (pending_block) {
                co_return ResolvedBlock{
                    .block_num = pending_block->block.header.number,
                    .block_hash = pending_block->hash,
                    .pending = true,
                };
            }
            ETHRPC_TRACE << "no pending block, fallback to latest";
            [[fallthrough]];
        }
        case BlockTag::kLatest: {
            const BlockNum head_block_num = snapshot_.head_block_num();
            const auto head_hash = co_await snapshot_.read_canonical_hash(head_block_num);
            if (!head_hash) {
                throw ResolutionError{ResolutionError::Reason::kPrunedOrUnavailable,
                                      "head block " + std::to_string(head_block_num) + " unavailable"};
            }
            co_return ResolvedBlock{.block_num = head_block_num, .block_hash = *head_hash};
        }
    }
    throw std::logic_error{"unexpected block tag"};
}

Task<std::shared_ptr<const BlockWithHash>> BlockReader::read_block(const ResolvedBlock& block) const {
    if (block.pending) {
        auto pending_block = co_await snapshot_.read_pending_block();
        if (!pending_block || pending_block->hash != block.block_hash) {
            throw ResolutionError{ResolutionError::Reason::kReorgedDuringCall,
                                  "pending block " + to_hex(block.block_hash, true) + " replaced during call"};
        }
        co_return pending_block;
    }
    auto block_with_hash = co_await snapshot_.read_block(block.block_num, block.block_hash);
    if (!block_with_hash) {
        if (block.block_num < snapshot_.lowest_block_num()) {
            throw NotFoundError{"block " + std::to_string(block.block_num) + " pruned"};
        }
        throw ResolutionError{ResolutionError::Reason::kReorgedDuringCall,
                              "block " + std::to_string(block.block_num) + " no longer readable"};
    }
    co_return block_with_hash;
}

Task<std::shared_ptr<const BlockWithHash>> BlockReader::read_block(const BlockRef& block_ref) const {
    const auto resolved_block = co_await resolve(block_ref);
    co_return co_await read_block(resolved_block);
}

Task<std::optional<Transaction>> BlockReader::read_transaction_by_hash(const evmc::bytes32& tx_hash) const {
    const auto location = co_await snapshot_.read_transaction_location(tx_hash);
    if (!location) {
        co_return std::nullopt;
    }
    const auto block_with_hash = co_await read_block(ResolvedBlock{.block_num = location->block_num, .block_hash = location->block_hash});
    const auto& transactions = block_with_hash->block.transactions;
    if (location->transaction_index >= transactions.size()) {
        throw ResolutionError{ResolutionError::Reason::kReorgedDuringCall,
                              "transaction " + to_hex(tx_hash, true) + " not found at recorded position"};
    }
    Transaction transaction{transactions[location->transaction_index]};
    transaction.block_hash = block_with_hash->hash;
    transaction.block_num = location->block_num;
    transaction.block_base_fee_per_gas = block_with_hash->block.header.base_fee_per_gas;
    transaction.transaction_index = location->transaction_index;
    co_return transaction;
}

}  // namespace ethrpc::rpc
