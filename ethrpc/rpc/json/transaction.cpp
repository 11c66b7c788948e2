// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc {

void to_json(nlohmann::json& json, const AccessListEntry& access_list) {
    json["address"] = access_list.account;
    json["storageKeys"] = access_list.storage_keys;
}

void from_json(const nlohmann::json& json, AccessListEntry& entry) {
    entry.account = json.at("address").get<evmc::address>();
    entry.storage_keys = json.at("storageKeys").get<std::vector<evmc::bytes32>>();
}

void to_json(nlohmann::json& json, const Transaction& transaction) {
    if (const std::optional<evmc::address> sender{transaction.sender()}; sender) {
        json["from"] = *sender;
    }
    json["gas"] = rpc::to_quantity(transaction.gas_limit);
    json["hash"] = transaction.hash();
    json["input"] = rpc::to_data(transaction.data);
    json["nonce"] = rpc::to_quantity(transaction.nonce);
    if (transaction.to) {
        json["to"] = transaction.to.value();
    } else {
        json["to"] = nullptr;
    }
    json["type"] = rpc::to_quantity(static_cast<uint64_t>(transaction.type));

    if (transaction.type == TransactionType::kDynamicFee) {
        json["maxPriorityFeePerGas"] = rpc::to_quantity(transaction.max_priority_fee_per_gas);
        json["maxFeePerGas"] = rpc::to_quantity(transaction.max_fee_per_gas);
    }
    if (transaction.type != TransactionType::kLegacy) {
        json["chainId"] = rpc::to_quantity(transaction.chain_id.value_or(0));
        json["v"] = rpc::to_quantity(uint64_t{transaction.odd_y_parity});
        json["accessList"] = transaction.access_list;  // EIP2930
        json["yParity"] = rpc::to_quantity(uint64_t{transaction.odd_y_parity});
    } else if (transaction.chain_id) {
        json["chainId"] = rpc::to_quantity(*transaction.chain_id);
        json["v"] = rpc::to_quantity(transaction.v());
    } else {
        json["v"] = rpc::to_quantity(transaction.v());
    }

    json["value"] = rpc::to_quantity(transaction.value);
    json["r"] = rpc::to_quantity(transaction.r);
    json["s"] = rpc::to_quantity(transaction.s);
}

}  // namespace ethrpc

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Transaction& transaction) {
    to_json(json, static_cast<const ethrpc::Transaction&>(transaction));

    json["gasPrice"] = to_quantity(transaction.effective_gas_price());
    if (transaction.queued_in_pool) {
        json["blockHash"] = nullptr;
        json["blockNumber"] = nullptr;
        json["transactionIndex"] = nullptr;
    } else {
        json["blockHash"] = transaction.block_hash;
        json["blockNumber"] = to_quantity(transaction.block_num);
        json["transactionIndex"] = to_quantity(transaction.transaction_index);
    }
}

}  // namespace ethrpc::rpc
