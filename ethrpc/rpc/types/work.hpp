// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>

namespace ethrpc::rpc {

//! Proof-of-work job for external miners
struct Work {
    evmc::bytes32 header_hash;  // seal hash of the candidate header
    evmc::bytes32 seed_hash;    // DAG seed for the candidate epoch
    evmc::bytes32 target;       // boundary condition: 2^256 / difficulty
    BlockNum block_num{0};

    friend bool operator==(const Work&, const Work&) = default;
};

}  // namespace ethrpc::rpc
