// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/types/transaction.hpp>

namespace ethrpc::rpc {

//! Transaction as seen by clients: the signed transaction plus its position in the chain
struct Transaction : public ethrpc::Transaction {
    evmc::bytes32 block_hash;
    BlockNum block_num{0};
    std::optional<intx::uint256> block_base_fee_per_gas{std::nullopt};
    uint64_t transaction_index{0};
    bool queued_in_pool{false};

    intx::uint256 effective_gas_price() const;  // EIP-1559
};

std::ostream& operator<<(std::ostream& out, const Transaction& t);

}  // namespace ethrpc::rpc
