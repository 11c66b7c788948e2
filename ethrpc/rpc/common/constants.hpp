// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace ethrpc {

inline constexpr std::string_view kEthApiNamespace{"eth"};

// Method groups that can be enabled separately inside the eth namespace
inline constexpr std::string_view kEthReadApiGroup{"eth.read"};
inline constexpr std::string_view kEthWriteApiGroup{"eth.write"};
inline constexpr std::string_view kEthMiningApiGroup{"eth.mining"};

inline constexpr std::string_view kApiSpecSeparator{","};

inline constexpr std::string_view kDefaultApiSpec{"eth"};

}  // namespace ethrpc
