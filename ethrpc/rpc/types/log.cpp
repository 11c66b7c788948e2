// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <sstream>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::ostream& operator<<(std::ostream& out, const Log& log) {
    out << log.to_string();
    return out;
}

std::string Log::to_string() const {
    std::stringstream out;
    out << "#topics: " << topics.size();
    out << " #data: " << data.size();
    out << " block_num: " << block_num;
    out << " tx_hash: " << to_hex(tx_hash);
    out << " tx_index: " << tx_index;
    out << " block_hash: " << to_hex(block_hash);
    out << " index: " << index;
    out << " removed: " << removed;
    out << " address: " << address;
    return out.str();
}

}  // namespace ethrpc::rpc
