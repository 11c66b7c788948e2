// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmc/evmc.h>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/types/block_ref.hpp>
#include <ethrpc/rpc/types/call.hpp>

namespace ethrpc::rpc {

struct ExecutionResult {
    std::optional<int64_t> error_code;  // evmc_status_code, std::nullopt means success
    uint64_t gas_used{0};
    uint64_t gas_refund{0};
    Bytes data;
    std::optional<std::string> pre_check_error{std::nullopt};

    bool success() const {
        return ((error_code == std::nullopt || *error_code == evmc_status_code::EVMC_SUCCESS) && pre_check_error == std::nullopt);
    }

    std::string error_message(bool full_error = true) const;
};

//! \brief Human readable description of a failed execution
//! \param full_error append the reason decoded from Error(string) revert data, if any
std::string get_error_message(int64_t error_code, const Bytes& error_data, bool full_error = true);

//! Sandboxed message call runner: state writes are discarded after each execution
class Executor {
  public:
    virtual ~Executor() = default;

    //! \brief Execute call on top of the state at block with the given gas limit
    virtual Task<ExecutionResult> execute(const ResolvedBlock& block, const Call& call, uint64_t gas_limit) = 0;
};

}  // namespace ethrpc::rpc
