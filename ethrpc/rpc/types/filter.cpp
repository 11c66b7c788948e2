// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "filter.hpp"

#include <algorithm>
#include <sstream>

#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::string Filter::to_string() const {
    std::stringstream out;
    out << "from_block: " << (from_block ? from_block->to_string() : "null");
    out << " to_block: " << (to_block ? to_block->to_string() : "null");
    out << " address: [";
    for (size_t i{0}; i < addresses.size(); ++i) {
        out << (i == 0 ? "" : ", ") << addresses[i];
    }
    out << "] topics: [";
    for (size_t i{0}; i < topics.size(); ++i) {
        out << (i == 0 ? "" : ", ") << "[";
        for (size_t j{0}; j < topics[i].size(); ++j) {
            out << (j == 0 ? "" : ", ") << topics[i][j];
        }
        out << "]";
    }
    out << "] block_hash: " << (block_hash ? to_hex(*block_hash, true) : "null");
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const Filter& filter) {
    out << filter.to_string();
    return out;
}

bool matches(const Filter& filter, const evmc::address& address, const std::vector<evmc::bytes32>& topics) {
    if (!filter.addresses.empty() &&
        std::find(filter.addresses.begin(), filter.addresses.end(), address) == filter.addresses.end()) {
        return false;
    }
    if (filter.topics.size() > topics.size()) {
        return false;
    }
    for (size_t i{0}; i < filter.topics.size(); ++i) {
        const auto& subtopics = filter.topics[i];
        if (subtopics.empty()) {
            continue;
        }
        if (std::find(subtopics.begin(), subtopics.end(), topics[i]) == subtopics.end()) {
            return false;
        }
    }
    return true;
}

}  // namespace ethrpc::rpc
