// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/types/block_ref.hpp>
#include <ethrpc/rpc/types/transaction.hpp>

namespace ethrpc::rpc {

//! BlockReader resolves client block identifiers and reads blocks from one chain snapshot
class BlockReader {
  public:
    explicit BlockReader(const ChainSnapshot& snapshot) : snapshot_{snapshot} {}

    BlockReader(const BlockReader&) = delete;
    BlockReader& operator=(const BlockReader&) = delete;

    //! \brief Turn the block identifier into the concrete block every other read in the call is keyed by
    //! \throws NotFoundError if the identifier does not denote a canonical block in the snapshot
    //! \throws ResolutionError if the denoted block is no longer retained
    Task<ResolvedBlock> resolve(const BlockRef& block_ref) const;

    //! \brief Resolve the block whose post-state or receipts the call reads
    //! \throws ResolutionError if the denoted block lies below the lowest retained block
    Task<ResolvedBlock> resolve_retained(const BlockRef& block_ref) const;

    //! \throws ResolutionError if block \p block_num lies below the lowest retained block
    void ensure_retained(BlockNum block_num) const;

    //! \brief Read the resolved block
    //! \throws NotFoundError if the block has been pruned
    //! \throws ResolutionError if the block was canonical at resolution but cannot be read any more
    Task<std::shared_ptr<const BlockWithHash>> read_block(const ResolvedBlock& block) const;

    //! \brief Resolve then read the block denoted by the identifier
    Task<std::shared_ptr<const BlockWithHash>> read_block(const BlockRef& block_ref) const;

    //! \brief Read an included transaction by hash, std::nullopt if not included in the snapshot
    Task<std::optional<Transaction>> read_transaction_by_hash(const evmc::bytes32& tx_hash) const;

    BlockNum head_block_num() const { return snapshot_.head_block_num(); }

  private:
    Task<ResolvedBlock> resolve_number(BlockNum block_num) const;
    Task<ResolvedBlock> resolve_hash(const evmc::bytes32& block_hash) const;
    Task<ResolvedBlock> resolve_tag(BlockTag tag) const;

    const ChainSnapshot& snapshot_;
};

}  // namespace ethrpc::rpc
