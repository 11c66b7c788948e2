// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/account.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/core/types/receipt.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/types/block_ref.hpp>

namespace ethrpc::rpc {

//! Position of an included transaction in the canonical chain
struct TransactionLocation {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    uint64_t transaction_index{0};
};

//! ChainSnapshot is an immutable view of the canonical chain taken at one point in time:
//! head advancement or reorganization after the snapshot is opened is not observed by its index.
class ChainSnapshot {
  public:
    virtual ~ChainSnapshot() = default;

    //! Number of the canonical head when the snapshot was opened
    virtual BlockNum head_block_num() const = 0;

    //! Number of the lowest block whose data is still retained
    virtual BlockNum lowest_block_num() const = 0;

    //! Read the canonical block hash at specified height
    virtual Task<std::optional<evmc::bytes32>> read_canonical_hash(BlockNum block_num) const = 0;

    //! Read the canonical block number for specified hash
    virtual Task<std::optional<BlockNum>> read_block_num(const evmc::bytes32& block_hash) const = 0;

    //! Read block with the specified key (block number, hash), nullptr when its data is no longer available
    virtual Task<std::shared_ptr<const BlockWithHash>> read_block(BlockNum block_num, const evmc::bytes32& block_hash) const = 0;

    //! Read the speculative next block, nullptr when the backend does not build one
    virtual Task<std::shared_ptr<const BlockWithHash>> read_pending_block() const = 0;

    //! Read the location of an included transaction
    virtual Task<std::optional<TransactionLocation>> read_transaction_location(const evmc::bytes32& tx_hash) const = 0;

    //! Read the consensus receipts of block with the specified key (block number, hash)
    virtual Task<std::optional<std::vector<ethrpc::Receipt>>> read_receipts(BlockNum block_num, const evmc::bytes32& block_hash) const = 0;
};

//! ChainHistory gives access to the canonical chain through per-call snapshots
class ChainHistory {
  public:
    virtual ~ChainHistory() = default;

    virtual Task<std::shared_ptr<ChainSnapshot>> open_snapshot() = 0;
};

//! ChainState gives access to the account state at a resolved block; missing entries are std::nullopt.
//! Reads throw ResolutionError when the state of the block itself is no longer available.
class ChainState {
  public:
    virtual ~ChainState() = default;

    virtual Task<std::optional<Account>> read_account(const evmc::address& address, const ResolvedBlock& block) const = 0;

    virtual Task<std::optional<Bytes>> read_code(const evmc::address& address, const ResolvedBlock& block) const = 0;

    virtual Task<std::optional<evmc::bytes32>> read_storage(const evmc::address& address,
                                                            const evmc::bytes32& location,
                                                            const ResolvedBlock& block) const = 0;
};

}  // namespace ethrpc::rpc
