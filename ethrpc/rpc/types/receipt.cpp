// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <sstream>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::ostream& operator<<(std::ostream& out, const Receipt& r) {
    out << r.to_string();
    return out;
}

std::string Receipt::to_string() const {
    std::stringstream out;
    out << " block_hash: " << to_hex(block_hash);
    out << " block_num: " << block_num;
    if (contract_address) {
        out << " contract_address: " << *contract_address;
    }
    out << " cumulative_gas_used: " << cumulative_gas_used;
    out << " gas_used: " << gas_used;
    out << " #logs: " << logs.size();
    out << " success: " << success;
    out << " tx_hash: " << to_hex(tx_hash);
    out << " tx_index: " << tx_index;
    out << " type: " << static_cast<int>(type);
    return out.str();
}

}  // namespace ethrpc::rpc
