// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "genesis.hpp"

#include <bit>
#include <utility>

#include <ethrpc/core/common/empty_hashes.hpp>
#include <ethrpc/core/common/util.hpp>

namespace ethrpc::devnet {

BlockWithHash make_genesis_block(const GenesisSpec& genesis) {
    BlockWithHash genesis_block;
    auto& header = genesis_block.block.header;
    header.ommers_hash = kEmptyListHash;
    header.beneficiary = genesis.beneficiary;
    header.transactions_root = kEmptyRoot;
    header.receipts_root = kEmptyRoot;
    header.difficulty = genesis.difficulty;
    header.number = 0;
    header.gas_limit = genesis.gas_limit;
    header.timestamp = genesis.timestamp;
    header.extra_data = genesis.extra_data;
    header.base_fee_per_gas = genesis.base_fee_per_gas;
    genesis_block.hash = header.hash();
    return genesis_block;
}

AccountState with_code(Bytes code, const intx::uint256& balance) {
    AccountState account_state;
    account_state.account.balance = balance;
    account_state.account.code_hash = std::bit_cast<evmc_bytes32>(keccak256(code));
    account_state.code = std::move(code);
    return account_state;
}

}  // namespace ethrpc::devnet
