// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/infra/concurrency/task.hpp>

namespace ethrpc::rpc::txpool {

struct OperationResult {
    bool success{false};
    std::string error_descr;
};

//! Admission point for signed transactions: signature and nonce validation happen behind this interface
class TransactionPool {
  public:
    virtual ~TransactionPool() = default;

    virtual Task<OperationResult> add_transaction(ByteView rlp_tx) = 0;

    //! Next nonce of sender accounting for its pooled transactions, std::nullopt if the pool does not know it
    virtual Task<std::optional<uint64_t>> nonce(const evmc::address& address) = 0;
};

}  // namespace ethrpc::rpc::txpool
