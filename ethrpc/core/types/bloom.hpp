// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <vector>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/log.hpp>

namespace ethrpc {

inline constexpr size_t kBloomByteLength{256};

//! 2048-bit log filter carried by receipts and headers
using Bloom = std::array<uint8_t, kBloomByteLength>;

//! Set the three bits selected by KEC(x), see Section 4.3.1 "Transaction Receipt" of the Yellow Paper
void m3_2048(Bloom& bloom, ByteView x);

//! Bloom covering the address and topics of every log
Bloom logs_bloom(const std::vector<Log>& logs);

//! \brief Whether \p value may have been added to \p bloom
//! \note false positives are possible, false negatives are not
bool bloom_contains(const Bloom& bloom, ByteView value);

//! Accumulate \p addend into \p sum, as a header bloom does for the receipts of its block
void join(Bloom& sum, const Bloom& addend);

}  // namespace ethrpc
