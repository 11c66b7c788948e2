// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "call.hpp"

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::ostream& operator<<(std::ostream& out, const Call& call) {
    out << "from: " << call.from.value_or(evmc::address{}) << " "
        << "to: " << call.to.value_or(evmc::address{}) << " "
        << "gas: " << call.gas.value_or(0) << " "
        << "gas_price: " << call.gas_price.value_or(intx::uint256{}) << " "
        << "max_priority_fee_per_gas: " << call.max_priority_fee_per_gas.value_or(intx::uint256{}) << " "
        << "max_fee_per_gas: " << call.max_fee_per_gas.value_or(intx::uint256{}) << " "
        << "value: " << call.value.value_or(intx::uint256{}) << " "
        << "data: " << to_hex(call.data.value_or(Bytes{}));
    return out;
}

UnsignedTransaction TransactionRequest::to_transaction(const std::optional<intx::uint256>& chain_id) const {
    UnsignedTransaction txn{};
    txn.chain_id = chain_id;
    txn.nonce = nonce.value_or(0);
    txn.gas_limit = gas.value_or(0);
    txn.to = to;
    txn.value = value.value_or(0);
    txn.data = data.value_or(Bytes{});
    if (max_fee_per_gas && !gas_price) {
        txn.type = TransactionType::kDynamicFee;
        txn.max_fee_per_gas = *max_fee_per_gas;
        txn.max_priority_fee_per_gas = max_priority_fee_per_gas.value_or(*max_fee_per_gas);
    } else {
        txn.type = TransactionType::kLegacy;
        txn.max_fee_per_gas = gas_price.value_or(0);
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
    }
    return txn;
}

Call TransactionRequest::to_call() const {
    return Call{
        .from = from,
        .to = to,
        .gas = gas,
        .gas_price = gas_price,
        .max_priority_fee_per_gas = max_priority_fee_per_gas,
        .max_fee_per_gas = max_fee_per_gas,
        .value = value,
        .data = data,
        .nonce = nonce,
    };
}

std::ostream& operator<<(std::ostream& out, const TransactionRequest& request) {
    out << "from: " << request.from << " "
        << "to: " << request.to.value_or(evmc::address{}) << " "
        << "gas: " << request.gas.value_or(0) << " "
        << "gas_price: " << request.gas_price.value_or(intx::uint256{}) << " "
        << "value: " << request.value.value_or(intx::uint256{}) << " "
        << "nonce: " << request.nonce.value_or(0) << " "
        << "data: " << to_hex(request.data.value_or(Bytes{}));
    return out;
}

}  // namespace ethrpc::rpc
