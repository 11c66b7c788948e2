// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <sstream>

#include <ethrpc/core/common/endian.hpp>
#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/encode.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::ostream& operator<<(std::ostream& out, const Block& b) {
    out << b.to_string();
    return out;
}

uint64_t Block::get_block_size() const {
    const auto& block = block_with_hash->block;

    Bytes rlp_bytes;
    rlp::encode(rlp_bytes, block.header);
    const size_t header_length{rlp_bytes.size()};

    size_t transactions_payload_length{0};
    for (const auto& txn : block.transactions) {
        rlp_bytes.clear();
        rlp::encode(rlp_bytes, txn);
        // typed transactions are wrapped into an RLP string inside block bodies
        transactions_payload_length += txn.type == TransactionType::kLegacy ? rlp_bytes.size() : rlp::length(ByteView{rlp_bytes});
    }

    size_t ommers_payload_length{0};
    for (const auto& ommer : block.ommers) {
        rlp_bytes.clear();
        rlp::encode(rlp_bytes, ommer);
        ommers_payload_length += rlp_bytes.size();
    }

    size_t payload_length{header_length};
    payload_length += rlp::length_of_length(transactions_payload_length) + transactions_payload_length;
    payload_length += rlp::length_of_length(ommers_payload_length) + ommers_payload_length;
    return rlp::length_of_length(payload_length) + payload_length;
}

std::string Block::to_string() const {
    std::stringstream out;

    const auto& block = block_with_hash->block;
    out << "parent_hash: " << to_hex(block.header.parent_hash);
    out << " ommers_hash: " << to_hex(block.header.ommers_hash);
    out << " beneficiary: " << block.header.beneficiary;
    out << " state_root: " << to_hex(block.header.state_root);
    out << " transactions_root: " << to_hex(block.header.transactions_root);
    out << " receipts_root: " << to_hex(block.header.receipts_root);
    out << " difficulty: " << ethrpc::to_hex(endian::to_big_compact(block.header.difficulty));
    out << " number: " << block.header.number;
    out << " gas_limit: " << block.header.gas_limit;
    out << " gas_used: " << block.header.gas_used;
    out << " timestamp: " << block.header.timestamp;
    out << " extra_data: " << ethrpc::to_hex(block.header.extra_data);
    out << " #transactions: " << block.transactions.size();
    out << " #ommers: " << block.ommers.size();
    out << " hash: " << to_hex(block_with_hash->hash);
    out << " full_tx: " << full_tx;
    return out.str();
}

}  // namespace ethrpc::rpc
