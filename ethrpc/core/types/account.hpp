// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/empty_hashes.hpp>

namespace ethrpc {

struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};

    friend bool operator==(const Account&, const Account&) = default;
};

}  // namespace ethrpc
