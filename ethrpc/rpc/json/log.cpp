// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Log& log) {
    json["address"] = log.address;
    json["topics"] = log.topics;
    json["data"] = to_data(log.data);
    json["blockNumber"] = to_quantity(log.block_num);
    json["blockHash"] = log.block_hash;
    json["transactionHash"] = log.tx_hash;
    json["transactionIndex"] = to_quantity(uint64_t{log.tx_index});
    json["logIndex"] = to_quantity(uint64_t{log.index});
    json["removed"] = log.removed;
}

}  // namespace ethrpc::rpc
