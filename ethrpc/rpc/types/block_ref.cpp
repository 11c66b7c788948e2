// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_ref.hpp"

#include <charconv>
#include <sstream>

#include <absl/strings/match.h>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

namespace {

    BlockNum parse_block_num(std::string_view digits, int base, const std::string& block_ref) {
        // 64-bit heights need at most 16 hex or 20 decimal digits
        if (digits.empty() || digits.size() > (base == 16 ? 16u : 20u)) {
            throw InvalidParamsError{"invalid block identifier: " + block_ref};
        }
        BlockNum block_num{0};
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), block_num, base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            throw InvalidParamsError{"invalid block identifier: " + block_ref};
        }
        return block_num;
    }

}  // namespace

std::string_view to_string(BlockTag tag) {
    switch (tag) {
        case BlockTag::kEarliest:
            return kEarliestBlockId;
        case BlockTag::kLatest:
            return kLatestBlockId;
        case BlockTag::kPending:
            return kPendingBlockId;
    }
    return kLatestBlockId;
}

std::ostream& operator<<(std::ostream& out, const BlockRef& block_ref) {
    out << block_ref.to_string();
    return out;
}

std::string BlockRef::to_string() const {
    std::stringstream out;
    if (is_number()) {
        out << "0x" << std::hex << number() << std::dec;
    } else if (is_hash()) {
        out << ethrpc::to_hex(hash(), true);
    } else {
        out << rpc::to_string(tag());
    }
    return out.str();
}

void BlockRef::parse(const std::string& block_ref) {
    if (block_ref == kEarliestBlockId) {
        value_ = BlockTag::kEarliest;
    } else if (block_ref == kLatestBlockId) {
        value_ = BlockTag::kLatest;
    } else if (block_ref == kPendingBlockId) {
        value_ = BlockTag::kPending;
    } else if (absl::StartsWithIgnoreCase(block_ref, "0x")) {
        if (block_ref.size() == 2 + 2 * kHashLength) {
            if (!is_valid_hash(block_ref)) {
                throw InvalidParamsError{"invalid block hash: " + block_ref};
            }
            value_ = to_bytes32(*from_hex(block_ref));
        } else {
            value_ = parse_block_num(std::string_view{block_ref}.substr(2), 16, block_ref);
        }
    } else {
        value_ = parse_block_num(block_ref, 10, block_ref);
    }
}

std::ostream& operator<<(std::ostream& out, const ResolvedBlock& resolved_block) {
    out << "number: " << resolved_block.block_num << " hash: " << ethrpc::to_hex(resolved_block.block_hash, true);
    if (resolved_block.pending) {
        out << " (pending)";
    }
    return out;
}

}  // namespace ethrpc::rpc
