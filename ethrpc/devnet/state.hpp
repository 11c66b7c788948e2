// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/account.hpp>

namespace ethrpc::devnet {

struct AccountState {
    Account account;
    Bytes code;
    std::map<evmc::bytes32, evmc::bytes32> storage;
};

//! Whole account state after one block, address -> account
using WorldState = std::map<evmc::address, AccountState>;

}  // namespace ethrpc::devnet
