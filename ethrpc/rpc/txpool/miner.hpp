// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/infra/concurrency/task.hpp>
#include <ethrpc/rpc/types/work.hpp>

namespace ethrpc::rpc::txpool {

//! Mining coordinator: counters and the current job are resident, so only solution checking suspends
class Miner {
  public:
    virtual ~Miner() = default;

    virtual bool is_mining() const = 0;

    //! Aggregate of the hash rates currently reported by external miners
    virtual intx::uint256 hash_rate() const = 0;

    //! Current PoW job, std::nullopt when no work is available
    virtual std::optional<Work> get_work() = 0;

    virtual bool submit_hash_rate(const intx::uint256& rate, const evmc::bytes32& id) = 0;

    //! \brief Check a PoW solution against the outstanding job
    //! \return true iff the solution has been accepted
    virtual Task<bool> submit_work(const Bytes& block_nonce, const evmc::bytes32& pow_hash, const evmc::bytes32& digest) = 0;
};

}  // namespace ethrpc::rpc::txpool
