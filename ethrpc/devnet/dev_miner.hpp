// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include <ethash/ethash.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/devnet/block_builder.hpp>
#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>
#include <ethrpc/rpc/txpool/miner.hpp>

namespace ethrpc::devnet {

//! Hash rate reports older than this are not counted any more
inline constexpr std::chrono::seconds kHashRateExpiry{10};

//! Outstanding jobs kept per head, older ones are evicted first
inline constexpr size_t kMaxSealingJobs{8};

struct MinerSettings {
    evmc::address etherbase{};
    intx::uint256 difficulty{kDefaultGenesisDifficulty};
    uint64_t gas_limit{kDefaultGenesisGasLimit};
};

//! Remote sealing coordinator for the devnet: hands out PoW jobs built on the current head from the pooled
//! transactions and appends the block of the job an accepted solution belongs to
class DevMiner : public rpc::txpool::Miner {
  public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    DevMiner(std::shared_ptr<MemoryChain> chain, rpc::WorkerPool& workers, MinerSettings settings, ClockFn now = Clock::now)
        : chain_{std::move(chain)}, workers_{workers}, settings_{settings}, now_{std::move(now)} {}

    //! Mining is on while at least one remote miner keeps reporting its hash rate
    bool is_mining() const override;

    intx::uint256 hash_rate() const override;

    std::optional<rpc::Work> get_work() override;

    bool submit_hash_rate(const intx::uint256& rate, const evmc::bytes32& id) override;

    Task<bool> submit_work(const Bytes& block_nonce, const evmc::bytes32& pow_hash, const evmc::bytes32& digest) override;

    size_t num_jobs() const;

  private:
    struct HashRateReport {
        uint64_t rate{0};
        Clock::time_point timestamp;
    };

    bool verify_seal(const BlockHeader& header);
    void add_job(const evmc::bytes32& parent_hash, const evmc::bytes32& sealing_hash, const BuiltBlock& candidate);

    std::shared_ptr<MemoryChain> chain_;
    rpc::WorkerPool& workers_;
    MinerSettings settings_;
    ClockFn now_;

    mutable std::mutex mutex_;
    std::map<evmc::bytes32, HashRateReport> hash_rates_;
    evmc::bytes32 jobs_parent_hash_{};
    std::map<evmc::bytes32, BuiltBlock> jobs_;  // sealing hash -> candidate block
    std::deque<evmc::bytes32> job_order_;

    std::mutex epoch_mutex_;
    ethash::epoch_context_ptr epoch_context_{nullptr, ethash_destroy_epoch_context};
};

}  // namespace ethrpc::devnet
