// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <ethrpc/core/common/util.hpp>

namespace ethrpc::endian {

Bytes to_big_compact(uint64_t value) {
    uint8_t full_be[sizeof(uint64_t)];
    intx::be::store(full_be, value);
    return Bytes{zeroless_view(full_be)};
}

Bytes to_big_compact(const intx::uint256& value) {
    uint8_t full_be[sizeof(intx::uint256)];
    intx::be::store(full_be, value);
    return Bytes{zeroless_view(full_be)};
}

}  // namespace ethrpc::endian
