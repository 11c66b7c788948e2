// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <ethrpc/core/types/bloom.hpp>
#include <ethrpc/core/types/log.hpp>
#include <ethrpc/core/types/transaction.hpp>

namespace ethrpc {

struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<Log> logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

}  // namespace ethrpc
