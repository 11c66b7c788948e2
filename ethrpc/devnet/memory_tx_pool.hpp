// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/txpool/transaction_pool.hpp>

namespace ethrpc::devnet {

//! Admission of signed transactions into the MemoryChain pooled set.
//! Resubmitting a pooled transaction succeeds without adding a second entry.
class MemoryTxPool : public rpc::txpool::TransactionPool {
  public:
    MemoryTxPool(std::shared_ptr<MemoryChain> chain, std::optional<uint64_t> chain_id)
        : chain_{std::move(chain)}, chain_id_{chain_id} {}

    Task<rpc::txpool::OperationResult> add_transaction(ByteView rlp_tx) override;

    Task<std::optional<uint64_t>> nonce(const evmc::address& address) override;

  private:
    std::shared_ptr<MemoryChain> chain_;
    std::optional<uint64_t> chain_id_;
};

}  // namespace ethrpc::devnet
