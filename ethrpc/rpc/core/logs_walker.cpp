// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "logs_walker.hpp"

#include <algorithm>
#include <string>

#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/core/receipts.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

bool bloom_matches(const Bloom& bloom, const Filter& filter) {
    if (!filter.addresses.empty()) {
        const bool any_address = std::any_of(filter.addresses.begin(), filter.addresses.end(), [&](const auto& address) {
            return bloom_contains(bloom, ByteView{address.bytes});
        });
        if (!any_address) {
            return false;
        }
    }
    for (const auto& sub_topics : filter.topics) {
        if (sub_topics.empty()) {
            continue;
        }
        const bool any_topic = std::any_of(sub_topics.begin(), sub_topics.end(), [&](const auto& topic) {
            return bloom_contains(bloom, ByteView{topic.bytes});
        });
        if (!any_topic) {
            return false;
        }
    }
    return true;
}

Task<BlockNum> LogsWalker::get_bound(const BlockRef& block_ref) {
    if (block_ref.is_number()) {
        co_return block_ref.number();
    }
    if (block_ref.is_pending()) {
        co_return snapshot_.head_block_num();
    }
    const auto resolved_block = co_await block_reader_.resolve(block_ref);
    co_return resolved_block.block_num;
}

Task<std::pair<BlockNum, BlockNum>> LogsWalker::get_block_nums(const Filter& filter) {
    if (filter.block_hash) {
        const auto resolved_block = co_await block_reader_.resolve_retained(BlockRef{*filter.block_hash});
        co_return std::make_pair(resolved_block.block_num, resolved_block.block_num);
    }
    const BlockNum head_block_num = snapshot_.head_block_num();
    BlockNum start{head_block_num}, end{head_block_num};
    if (filter.from_block) {
        start = co_await get_bound(*filter.from_block);
    }
    if (filter.to_block) {
        end = std::min(co_await get_bound(*filter.to_block), head_block_num);
    }
    if (start <= end) {
        block_reader_.ensure_retained(start);
    }
    co_return std::make_pair(start, end);
}

Task<void> LogsWalker::get_logs(BlockNum start, BlockNum end, const Filter& filter, Logs& logs) {
    ETHRPC_DEBUG << "start: " << start << " end: " << end;
    if (start > end) {
        co_return;
    }

    uint64_t block_count{0};
    uint64_t log_count{0};
    for (BlockNum block_num = start; block_num <= end; ++block_num) {
        const auto block_hash = co_await snapshot_.read_canonical_hash(block_num);
        if (!block_hash) {
            throw ResolutionError{ResolutionError::Reason::kReorgedDuringCall,
                                  "no canonical hash for block " + std::to_string(block_num) + " within range"};
        }
        const auto block_with_hash = co_await block_reader_.read_block(ResolvedBlock{.block_num = block_num, .block_hash = *block_hash});
        ++block_count;
        if (block_with_hash->block.transactions.empty() || !bloom_matches(block_with_hash->block.header.logs_bloom, filter)) {
            continue;
        }

        const auto receipts = co_await core::get_receipts(snapshot_, *block_with_hash);
        if (!receipts) {
            throw ResolutionError{ResolutionError::Reason::kPrunedOrUnavailable,
                                  "receipts for block " + std::to_string(block_num) + " unavailable"};
        }
        for (const auto& receipt : *receipts) {
            for (const auto& log : receipt.logs) {
                if (matches(filter, log.address, log.topics)) {
                    logs.push_back(log);
                    ++log_count;
                }
            }
        }
        if (block_num == end) {
            break;
        }
    }
    ETHRPC_DEBUG << "visited blocks: " << block_count << " matching logs: " << log_count;
}

}  // namespace ethrpc::rpc
