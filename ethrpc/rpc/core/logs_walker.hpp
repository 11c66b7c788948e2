// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/types/bloom.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/core/block_reader.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/types/filter.hpp>
#include <ethrpc/rpc/types/log.hpp>

namespace ethrpc::rpc {

class LogsWalker {
  public:
    explicit LogsWalker(const ChainSnapshot& snapshot) : snapshot_{snapshot}, block_reader_{snapshot} {}

    LogsWalker(const LogsWalker&) = delete;
    LogsWalker& operator=(const LogsWalker&) = delete;

    //! \brief Inclusive block range the filter covers, clamped to the snapshot head
    //! \details A range whose start is above its end is empty
    //! \throws ResolutionError if a non-empty range starts below the lowest retained block
    Task<std::pair<BlockNum, BlockNum>> get_block_nums(const Filter& filter);

    //! \brief Collect the logs matching filter in [start, end] ordered by (block, tx index, log index)
    Task<void> get_logs(BlockNum start, BlockNum end, const Filter& filter, Logs& logs);

  private:
    Task<BlockNum> get_bound(const BlockRef& block_ref);

    const ChainSnapshot& snapshot_;
    BlockReader block_reader_;
};

//! \brief Tells if the block bloom may contain logs matching the filter: false means it surely does not
bool bloom_matches(const Bloom& bloom, const Filter& filter);

}  // namespace ethrpc::rpc
