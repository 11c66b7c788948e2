// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/types/call.hpp>

namespace ethrpc::rpc::ethbackend {

//! Holder of the node-managed accounts
class Signer {
  public:
    virtual ~Signer() = default;

    virtual std::vector<evmc::address> accounts() const = 0;

    //! \brief Sign a fully populated request
    //! \return the RLP encoding of the signed transaction, std::nullopt if the sender is not managed here
    virtual Task<std::optional<Bytes>> sign_transaction(const TransactionRequest& request) = 0;
};

}  // namespace ethrpc::rpc::ethbackend
