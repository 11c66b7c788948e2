// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/types/bloom.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/rpc/types/log.hpp>

namespace ethrpc::rpc {

struct Receipt {
    /* raw fields */
    TransactionType type{TransactionType::kLegacy};  // EIP-2718
    bool success{false};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    Logs logs;

    /* derived fields */
    evmc::bytes32 tx_hash;
    std::optional<evmc::address> contract_address;
    uint64_t gas_used{0};
    evmc::bytes32 block_hash;
    BlockNum block_num{0};
    uint32_t tx_index{0};
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    intx::uint256 effective_gas_price{0};

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const Receipt& r);

using Receipts = std::vector<Receipt>;

}  // namespace ethrpc::rpc
