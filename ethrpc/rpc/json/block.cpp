// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <vector>

#include <ethrpc/core/common/endian.hpp>
#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/encode.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/types/transaction.hpp>

namespace ethrpc {

void to_json(nlohmann::json& json, const BlockHeader& header) {
    json["number"] = rpc::to_quantity(header.number);
    json["hash"] = header.hash();
    json["parentHash"] = header.parent_hash;
    json["nonce"] = rpc::to_data({header.nonce.data(), header.nonce.size()});
    json["sha3Uncles"] = header.ommers_hash;
    json["logsBloom"] = rpc::to_data({header.logs_bloom.data(), header.logs_bloom.size()});
    json["transactionsRoot"] = header.transactions_root;
    json["stateRoot"] = header.state_root;
    json["receiptsRoot"] = header.receipts_root;
    json["miner"] = header.beneficiary;
    json["difficulty"] = rpc::to_quantity(header.difficulty);
    json["extraData"] = rpc::to_data(header.extra_data);
    json["mixHash"] = header.prev_randao;
    json["gasLimit"] = rpc::to_quantity(header.gas_limit);
    json["gasUsed"] = rpc::to_quantity(header.gas_used);
    json["timestamp"] = rpc::to_quantity(header.timestamp);
    if (header.base_fee_per_gas) {
        json["baseFeePerGas"] = rpc::to_quantity(*header.base_fee_per_gas);
    }
}

}  // namespace ethrpc

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Block& b) {
    const auto& block = b.block_with_hash->block;
    const auto& header = block.header;
    to_json(json, header);
    json["hash"] = b.block_with_hash->hash;
    json["size"] = to_quantity(b.get_block_size());
    if (b.full_tx) {
        json["transactions"] = nlohmann::json::array();
        for (size_t i{0}; i < block.transactions.size(); ++i) {
            Transaction txn{block.transactions[i]};
            txn.block_hash = b.block_with_hash->hash;
            txn.block_num = header.number;
            txn.block_base_fee_per_gas = header.base_fee_per_gas;
            txn.transaction_index = i;
            json["transactions"].push_back(txn);
        }
    } else {
        std::vector<evmc::bytes32> transaction_hashes;
        transaction_hashes.reserve(block.transactions.size());
        for (const auto& transaction : block.transactions) {
            transaction_hashes.push_back(transaction.hash());
        }
        json["transactions"] = transaction_hashes;
    }
    std::vector<evmc::bytes32> ommer_hashes;
    ommer_hashes.reserve(block.ommers.size());
    for (size_t i{0}; i < block.ommers.size(); ++i) {
        ommer_hashes.push_back(block.ommers[i].hash());
        ETHRPC_TRACE << "ommer_hashes[" << i << "]: " << ethrpc::to_hex(ommer_hashes[i], true);
    }
    json["uncles"] = ommer_hashes;
}

void to_json(nlohmann::json& json, const Uncle& uncle) {
    to_json(json, uncle.header);
    Bytes rlp_header;
    rlp::encode(rlp_header, uncle.header);
    // an ommer is sized as a block with empty transaction and ommer lists
    const size_t payload_length{rlp_header.size() + 2};
    json["size"] = to_quantity(rlp::length_of_length(payload_length) + payload_length);
    json["transactions"] = nlohmann::json::array();
    json["uncles"] = nlohmann::json::array();
}

}  // namespace ethrpc::rpc
