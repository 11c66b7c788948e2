// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <intx/intx.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/common/decoding_result.hpp>

namespace ethrpc::endian {

//! \brief Transforms a uint64_t stored in memory with native endianness to it's compacted big endian byte form
//! \remarks A "compact" big endian form strips leftmost bytes valued to zero
Bytes to_big_compact(uint64_t value);

//! \brief Transforms a uint256 stored in memory with native endianness to it's compacted big endian byte form
Bytes to_big_compact(const intx::uint256& value);

//! \brief Parses unsigned integer from a compacted big endian byte form.
//! \return Success or kOverflow or kLeadingZero.
template <UnsignedIntegral T>
DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    for (const uint8_t b : data) {
        out = (out << 8) | T{b};
    }
    return {};
}

}  // namespace ethrpc::endian
