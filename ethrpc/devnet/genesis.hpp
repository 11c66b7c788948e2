// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/devnet/state.hpp>

namespace ethrpc::devnet {

inline constexpr uint64_t kDefaultGenesisGasLimit{30'000'000};
inline constexpr uint64_t kDefaultGenesisDifficulty{131'072};
inline constexpr uint64_t kDefaultBaseFeePerGas{kGiga};

struct GenesisSpec {
    WorldState alloc;
    uint64_t gas_limit{kDefaultGenesisGasLimit};
    intx::uint256 difficulty{kDefaultGenesisDifficulty};
    intx::uint256 base_fee_per_gas{kDefaultBaseFeePerGas};
    uint64_t timestamp{0};
    evmc::address beneficiary{};
    Bytes extra_data;
};

//! \brief Build the block zero described by \p genesis
//! \details Account code hashes in the allocation are expected to be consistent with the code, see with_code
BlockWithHash make_genesis_block(const GenesisSpec& genesis);

//! \brief Account state holding \p code, with its code hash set accordingly
AccountState with_code(Bytes code, const intx::uint256& balance = 0);

}  // namespace ethrpc::devnet
