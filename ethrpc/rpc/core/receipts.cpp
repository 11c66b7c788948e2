// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipts.hpp"

#include <stdexcept>
#include <string>

#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::rpc::core {

Receipts make_receipts(const BlockWithHash& block_with_hash, const std::vector<ethrpc::Receipt>& raw_receipts) {
    const auto& header = block_with_hash.block.header;
    const auto& transactions = block_with_hash.block.transactions;
    if (transactions.size() != raw_receipts.size()) {
        throw std::runtime_error{"#transactions and #receipts do not match in block " + std::to_string(header.number) +
                                 ": " + std::to_string(transactions.size()) + " != " + std::to_string(raw_receipts.size())};
    }

    Receipts receipts;
    receipts.reserve(raw_receipts.size());
    uint32_t log_index{0};
    for (size_t i{0}; i < raw_receipts.size(); ++i) {
        const auto& raw_receipt = raw_receipts[i];
        const auto& transaction = transactions[i];

        Receipt receipt;
        receipt.type = raw_receipt.type;
        receipt.success = raw_receipt.success;
        receipt.cumulative_gas_used = raw_receipt.cumulative_gas_used;
        receipt.bloom = raw_receipt.bloom;

        receipt.tx_hash = transaction.hash();
        receipt.block_hash = block_with_hash.hash;
        receipt.block_num = header.number;
        receipt.tx_index = static_cast<uint32_t>(i);
        receipt.from = transaction.sender();
        receipt.to = transaction.to;
        receipt.effective_gas_price = transaction.effective_gas_price(header.base_fee_per_gas.value_or(0));
        if (!transaction.to && receipt.from) {
            receipt.contract_address = create_address(*receipt.from, transaction.nonce);
        }
        if (i == 0) {
            receipt.gas_used = raw_receipt.cumulative_gas_used;
        } else {
            receipt.gas_used = raw_receipt.cumulative_gas_used - raw_receipts[i - 1].cumulative_gas_used;
        }

        receipt.logs.reserve(raw_receipt.logs.size());
        for (const auto& raw_log : raw_receipt.logs) {
            Log log{
                .address = raw_log.address,
                .topics = raw_log.topics,
                .data = raw_log.data,
                .block_num = header.number,
                .tx_hash = receipt.tx_hash,
                .tx_index = receipt.tx_index,
                .block_hash = block_with_hash.hash,
                .index = log_index++,
            };
            receipt.logs.push_back(std::move(log));
        }
        receipts.push_back(std::move(receipt));
    }
    return receipts;
}

Task<std::optional<Receipts>> get_receipts(const ChainSnapshot& snapshot, const BlockWithHash& block_with_hash) {
    const auto& header = block_with_hash.block.header;
    const auto raw_receipts = co_await snapshot.read_receipts(header.number, block_with_hash.hash);
    if (!raw_receipts) {
        ETHRPC_DEBUG << "no receipts for block " << header.number;
        co_return std::nullopt;
    }
    co_return make_receipts(block_with_hash, *raw_receipts);
}

}  // namespace ethrpc::rpc::core
