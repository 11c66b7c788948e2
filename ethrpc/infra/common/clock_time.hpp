// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>

namespace ethrpc::clock_time {

//! Monotonic time in nanoseconds
inline uint64_t now() {
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

//! Elapsed nanoseconds since \p start
inline uint64_t since(uint64_t start) { return now() - start; }

}  // namespace ethrpc::clock_time
