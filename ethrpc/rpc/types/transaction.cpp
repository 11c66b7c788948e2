// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

intx::uint256 Transaction::effective_gas_price() const {
    if (!block_base_fee_per_gas) {
        return max_fee_per_gas;
    }
    return ethrpc::Transaction::effective_gas_price(*block_base_fee_per_gas);
}

std::ostream& operator<<(std::ostream& out, const Transaction& t) {
    out << " #access_list: " << t.access_list.size();
    out << " block_hash: " << to_hex(t.block_hash);
    out << " block_num: " << t.block_num;
    out << " chain_id: " << t.chain_id.value_or(intx::uint256{});
    out << " data: " << to_hex(t.data);
    out << " gas_limit: " << t.gas_limit;
    out << " max_fee_per_gas: " << t.max_fee_per_gas;
    out << " nonce: " << t.nonce;
    out << " odd_y_parity: " << t.odd_y_parity;
    if (t.to) {
        out << " to: " << *t.to;
    } else {
        out << " to: null";
    }
    out << " transaction_index: " << t.transaction_index;
    out << " type: " << static_cast<int>(t.type);
    out << " value: " << t.value;
    return out;
}

}  // namespace ethrpc::rpc
