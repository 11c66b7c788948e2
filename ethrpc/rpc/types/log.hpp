// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>

namespace ethrpc::rpc {

struct Log {
    /* raw fields */
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    /* derived fields */
    BlockNum block_num{0};
    evmc::bytes32 tx_hash;
    uint32_t tx_index{0};
    evmc::bytes32 block_hash;
    uint32_t index{0};
    bool removed{false};

    std::string to_string() const;
};

using Logs = std::vector<Log>;

std::ostream& operator<<(std::ostream& out, const Log& log);

}  // namespace ethrpc::rpc
