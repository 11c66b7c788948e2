// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom.hpp"

#include <algorithm>
#include <functional>

#include <ethrpc/core/common/util.hpp>

namespace ethrpc {

void m3_2048(Bloom& bloom, ByteView x) {
    const ethash::hash256 hash{keccak256(x)};
    for (size_t pair{0}; pair < 3; ++pair) {
        const unsigned bit{(static_cast<unsigned>(hash.bytes[2 * pair]) << 8 | hash.bytes[2 * pair + 1]) & 0x7FFu};
        bloom[kBloomByteLength - 1 - bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
    }
}

Bloom logs_bloom(const std::vector<Log>& logs) {
    Bloom bloom{};
    for (const Log& log : logs) {
        m3_2048(bloom, log.address.bytes);
        for (const auto& topic : log.topics) {
            m3_2048(bloom, topic.bytes);
        }
    }
    return bloom;
}

bool bloom_contains(const Bloom& bloom, ByteView value) {
    Bloom needle{};
    m3_2048(needle, value);
    for (size_t i{0}; i < kBloomByteLength; ++i) {
        if ((bloom[i] & needle[i]) != needle[i]) {
            return false;
        }
    }
    return true;
}

void join(Bloom& sum, const Bloom& addend) {
    std::ranges::transform(sum, addend, sum.begin(), std::bit_or<>{});
}

}  // namespace ethrpc
