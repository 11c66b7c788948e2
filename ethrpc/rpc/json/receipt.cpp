// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Receipt& receipt) {
    json["blockHash"] = receipt.block_hash;
    json["blockNumber"] = to_quantity(receipt.block_num);
    json["transactionHash"] = receipt.tx_hash;
    json["transactionIndex"] = to_quantity(uint64_t{receipt.tx_index});
    json["from"] = receipt.from.value_or(evmc::address{});
    if (receipt.to) {
        json["to"] = *receipt.to;
    } else {
        json["to"] = nullptr;
    }
    json["type"] = to_quantity(static_cast<uint64_t>(receipt.type));
    json["gasUsed"] = to_quantity(receipt.gas_used);
    json["cumulativeGasUsed"] = to_quantity(receipt.cumulative_gas_used);
    json["effectiveGasPrice"] = to_quantity(receipt.effective_gas_price);
    if (receipt.contract_address) {
        json["contractAddress"] = *receipt.contract_address;
    } else {
        json["contractAddress"] = nullptr;
    }
    json["logs"] = receipt.logs;
    json["logsBloom"] = to_data(receipt.bloom);
    json["status"] = to_quantity(uint64_t{receipt.success ? 1u : 0u});
}

}  // namespace ethrpc::rpc
