// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/transaction.hpp>

namespace ethrpc::rpc {

// Gas limit cap for eth_call and eth_estimateGas
inline constexpr uint64_t kDefaultGasCap{50'000'000};

//! Sandboxed message call: never touches the pool or the chain state
struct Call {
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    std::optional<uint64_t> gas;
    std::optional<intx::uint256> gas_price;
    std::optional<intx::uint256> max_priority_fee_per_gas;
    std::optional<intx::uint256> max_fee_per_gas;
    std::optional<intx::uint256> value;
    std::optional<Bytes> data;
    std::optional<uint64_t> nonce;

    //! Price per gas the sender is willing to pay, if any was given
    std::optional<intx::uint256> fee_cap() const {
        if (gas_price) {
            return gas_price;
        }
        return max_fee_per_gas;
    }
};

std::ostream& operator<<(std::ostream& out, const Call& call);

//! Transaction to be filled in, signed by the node and submitted to the pool
struct TransactionRequest {
    evmc::address from;
    std::optional<evmc::address> to;
    std::optional<uint64_t> gas;
    std::optional<intx::uint256> gas_price;
    std::optional<intx::uint256> max_priority_fee_per_gas;
    std::optional<intx::uint256> max_fee_per_gas;
    std::optional<intx::uint256> value;
    std::optional<Bytes> data;
    std::optional<uint64_t> nonce;

    //! \brief Builds the unsigned transaction, missing fields taking their zero value
    UnsignedTransaction to_transaction(const std::optional<intx::uint256>& chain_id) const;

    //! Message call equivalent, used for gas estimation
    Call to_call() const;
};

std::ostream& operator<<(std::ostream& out, const TransactionRequest& request);

}  // namespace ethrpc::rpc
