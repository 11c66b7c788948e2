// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/rpc/types/block_ref.hpp>
#include <ethrpc/rpc/types/log.hpp>

namespace ethrpc::rpc {

using FilterAddresses = std::vector<evmc::address>;
using FilterSubTopics = std::vector<evmc::bytes32>;
using FilterTopics = std::vector<FilterSubTopics>;

//! Log query: a block range (or a single block hash) plus address and positional topic constraints
struct Filter {
    std::optional<BlockRef> from_block;
    std::optional<BlockRef> to_block;
    FilterAddresses addresses;  // empty matches any address
    FilterTopics topics;        // empty position matches any topic
    std::optional<evmc::bytes32> block_hash;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const Filter& filter);

//! \brief Tells if log satisfies both the address set and every positional topic constraint
bool matches(const Filter& filter, const evmc::address& address, const std::vector<evmc::bytes32>& topics);

}  // namespace ethrpc::rpc
