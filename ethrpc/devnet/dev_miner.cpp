// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_miner.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <utility>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/common/async_task.hpp>

namespace ethrpc::devnet {

static uint64_t unix_timestamp() {
    const auto since_epoch{std::chrono::system_clock::now().time_since_epoch()};
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

bool DevMiner::is_mining() const {
    std::scoped_lock lock{mutex_};
    const auto now{now_()};
    return std::ranges::any_of(hash_rates_, [&](const auto& entry) {
        return now - entry.second.timestamp < kHashRateExpiry;
    });
}

intx::uint256 DevMiner::hash_rate() const {
    std::scoped_lock lock{mutex_};
    const auto now{now_()};
    intx::uint256 total{0};
    for (const auto& [_, report] : hash_rates_) {
        if (now - report.timestamp < kHashRateExpiry) {
            total += report.rate;
        }
    }
    return total;
}

bool DevMiner::submit_hash_rate(const intx::uint256& rate, const evmc::bytes32& id) {
    if (rate > intx::uint256{std::numeric_limits<uint64_t>::max()}) {
        ETHRPC_DEBUG << "DevMiner rejected hash rate from: " << to_hex(id, true);
        return false;
    }
    std::scoped_lock lock{mutex_};
    const auto now{now_()};
    std::erase_if(hash_rates_, [&](const auto& entry) { return now - entry.second.timestamp >= kHashRateExpiry; });
    hash_rates_.insert_or_assign(id, HashRateReport{.rate = static_cast<uint64_t>(rate), .timestamp = now});
    return true;
}

std::optional<rpc::Work> DevMiner::get_work() {
    if (!settings_.etherbase) {
        ETHRPC_DEBUG << "DevMiner no work: etherbase not set";
        return std::nullopt;
    }
    const auto head = chain_->head();
    const BlockTemplate block_template{
        .beneficiary = settings_.etherbase,
        .difficulty = settings_.difficulty,
        .gas_limit = settings_.gas_limit,
        .timestamp = unix_timestamp(),
    };
    auto candidate{build_block(*head->block, *head->state, chain_->pooled_transactions(), block_template)};
    const auto& header = candidate.block.header;

    const int epoch_number{static_cast<int>(header.number / ethash::epoch_length)};
    rpc::Work work{
        .header_hash = header.hash(/*for_sealing=*/true),
        .seed_hash = std::bit_cast<evmc_bytes32>(ethash::calculate_epoch_seed(epoch_number)),
        .target = std::bit_cast<evmc_bytes32>(header.boundary()),
        .block_num = header.number,
    };
    add_job(head->block->hash, work.header_hash, candidate);
    chain_->set_pending_block(std::move(candidate));
    ETHRPC_DEBUG << "DevMiner new job: " << to_hex(work.header_hash, true) << " block: " << work.block_num;
    return work;
}

Task<bool> DevMiner::submit_work(const Bytes& block_nonce, const evmc::bytes32& pow_hash, const evmc::bytes32& digest) {
    if (block_nonce.size() != kNonceLength) {
        co_return false;
    }
    std::optional<BuiltBlock> job;
    {
        std::scoped_lock lock{mutex_};
        if (const auto it{jobs_.find(pow_hash)}; it != jobs_.end()) {
            job = it->second;
        }
    }
    if (!job) {
        ETHRPC_DEBUG << "DevMiner unknown or stale job: " << to_hex(pow_hash, true);
        co_return false;
    }
    if (job->block.header.parent_hash != chain_->head()->block->hash) {
        ETHRPC_DEBUG << "DevMiner stale job: " << to_hex(pow_hash, true) << " block: " << job->block.header.number;
        co_return false;
    }

    auto& header = job->block.header;
    std::copy_n(block_nonce.begin(), kNonceLength, header.nonce.begin());
    header.prev_randao = digest;
    const bool valid = co_await rpc::async_task(workers_.get_executor(), [this, &header]() { return verify_seal(header); });
    if (!valid) {
        ETHRPC_DEBUG << "DevMiner invalid seal for job: " << to_hex(pow_hash, true);
        co_return false;
    }

    const auto sealed = chain_->insert_sealed_block(std::move(*job));
    if (!sealed) {
        co_return false;
    }
    {
        std::scoped_lock lock{mutex_};
        jobs_.clear();
        job_order_.clear();
    }
    ETHRPC_INFO << "DevMiner sealed block: " << sealed->block.header.number << " hash: " << to_hex(sealed->hash, true);
    co_return true;
}

size_t DevMiner::num_jobs() const {
    std::scoped_lock lock{mutex_};
    return jobs_.size();
}

void DevMiner::add_job(const evmc::bytes32& parent_hash, const evmc::bytes32& sealing_hash, const BuiltBlock& candidate) {
    std::scoped_lock lock{mutex_};
    if (jobs_parent_hash_ != parent_hash) {
        jobs_.clear();
        job_order_.clear();
        jobs_parent_hash_ = parent_hash;
    }
    if (!jobs_.insert_or_assign(sealing_hash, candidate).second) {
        return;
    }
    job_order_.push_back(sealing_hash);
    while (job_order_.size() > kMaxSealingJobs) {
        ETHRPC_TRACE << "DevMiner evicted job: " << to_hex(job_order_.front(), true);
        jobs_.erase(job_order_.front());
        job_order_.pop_front();
    }
}

bool DevMiner::verify_seal(const BlockHeader& header) {
    std::scoped_lock lock{epoch_mutex_};
    const int epoch_number{static_cast<int>(header.number / ethash::epoch_length)};
    if (!epoch_context_ || epoch_context_->epoch_number != epoch_number) {
        epoch_context_.reset();  // Firstly release the obsoleted context
        epoch_context_ = ethash::create_epoch_context(epoch_number);
    }

    const auto nonce{intx::be::unsafe::load<uint64_t>(header.nonce.data())};
    const auto seal_hash(header.hash(/*for_sealing =*/true));
    const auto diff256{intx::be::store<ethash::hash256>(header.difficulty)};
    const auto sealh256{ethash::hash256_from_bytes(seal_hash.bytes)};
    const auto mixh256{ethash::hash256_from_bytes(header.prev_randao.bytes)};

    const auto ec{ethash::verify_against_difficulty(*epoch_context_, sealh256, mixh256, nonce, diff256)};
    return !ec;
}

}  // namespace ethrpc::devnet
