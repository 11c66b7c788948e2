// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "filter.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Filter& filter) {
    if (filter.from_block) {
        json["fromBlock"] = *filter.from_block;
    }
    if (filter.to_block) {
        json["toBlock"] = *filter.to_block;
    }
    if (!filter.addresses.empty()) {
        if (filter.addresses.size() == 1) {
            json["address"] = filter.addresses[0];
        } else {
            json["address"] = filter.addresses;
        }
    }
    if (!filter.topics.empty()) {
        json["topics"] = filter.topics;
    }
    if (filter.block_hash) {
        json["blockHash"] = *filter.block_hash;
    }
}

void from_json(const nlohmann::json& json, Filter& filter) {
    if (!json.is_object()) {
        throw InvalidParamsError{"invalid filter object: " + json.dump()};
    }
    if (json.contains("fromBlock") && !json.at("fromBlock").is_null()) {
        filter.from_block = json.at("fromBlock").get<BlockRef>();
    }
    if (json.contains("toBlock") && !json.at("toBlock").is_null()) {
        filter.to_block = json.at("toBlock").get<BlockRef>();
    }
    if (json.contains("address")) {
        const auto& address = json.at("address");
        if (address.is_string()) {
            filter.addresses = {address.get<evmc::address>()};
        } else if (address.is_array()) {
            filter.addresses = address.get<FilterAddresses>();
        } else if (!address.is_null()) {
            throw InvalidParamsError{"invalid filter address: " + address.dump()};
        }
    }
    if (json.contains("topics")) {
        const auto& topics = json.at("topics");
        if (topics.is_array()) {
            for (const auto& topic_item : topics) {
                if (topic_item.is_null()) {
                    filter.topics.emplace_back();
                } else if (topic_item.is_string()) {
                    filter.topics.push_back({topic_item.get<evmc::bytes32>()});
                } else if (topic_item.is_array()) {
                    filter.topics.push_back(topic_item.get<FilterSubTopics>());
                } else {
                    throw InvalidParamsError{"invalid filter topic: " + topic_item.dump()};
                }
            }
        } else if (!topics.is_null()) {
            throw InvalidParamsError{"invalid filter topics: " + topics.dump()};
        }
    }
    if (json.contains("blockHash") && !json.at("blockHash").is_null()) {
        if (filter.from_block || filter.to_block) {
            throw InvalidParamsError{"cannot specify both blockHash and fromBlock/toBlock"};
        }
        filter.block_hash = json.at("blockHash").get<evmc::bytes32>();
    }
}

}  // namespace ethrpc::rpc
