// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <ethrpc/core/types/block.hpp>
#include <ethrpc/core/types/receipt.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/types/receipt.hpp>

namespace ethrpc::rpc::core {

//! \brief Attach the derived fields (hashes, positions, gas used, contract address, log indexes) to consensus receipts
//! \throws std::runtime_error if receipts and block transactions do not pair up
Receipts make_receipts(const BlockWithHash& block_with_hash, const std::vector<ethrpc::Receipt>& raw_receipts);

//! \brief Read the receipts of block from the snapshot
//! \return std::nullopt if the snapshot has no receipts for block
Task<std::optional<Receipts>> get_receipts(const ChainSnapshot& snapshot, const BlockWithHash& block_with_hash);

}  // namespace ethrpc::rpc::core
