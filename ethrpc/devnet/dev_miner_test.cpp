// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_miner.hpp"

#include <bit>
#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <ethrpc/devnet/test_util/devnet_test_base.hpp>
#include <ethrpc/infra/test_util/context_test_base.hpp>
#include <ethrpc/infra/test_util/log.hpp>

namespace ethrpc::devnet {

using evmc::literals::operator""_address;
using evmc::literals::operator""_bytes32;

static constexpr evmc::address kEtherbase{0x00000000000000000000000000000000000000bb_address};
static constexpr evmc::bytes32 kMinerId1{0x01_bytes32};
static constexpr evmc::bytes32 kMinerId2{0x02_bytes32};

static GenesisSpec easy_genesis() {
    GenesisSpec genesis;
    genesis.difficulty = 1;
    genesis.alloc[test_util::dev_address(0)].account.balance = kEther;
    return genesis;
}

struct DevMinerTest : public ethrpc::test_util::ContextTestBase {
    //! Solve the job with an arbitrary nonce: any hash meets the boundary at difficulty 1
    static evmc::bytes32 mix_digest(const rpc::Work& work, uint64_t nonce) {
        const auto context{ethash::create_epoch_context(static_cast<int>(work.block_num / ethash::epoch_length))};
        const auto result{ethash::hash(*context, ethash::hash256_from_bytes(work.header_hash.bytes), nonce)};
        return std::bit_cast<evmc_bytes32>(result.mix_hash);
    }

    ethrpc::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    rpc::WorkerPool workers{1};
    std::shared_ptr<MemoryChain> chain{std::make_shared<MemoryChain>(easy_genesis())};
    DevMiner::Clock::time_point now{DevMiner::Clock::now()};
    DevMiner miner{chain, workers, MinerSettings{.etherbase = kEtherbase, .difficulty = 1, .gas_limit = 30'000'000},
                   [this]() { return now; }};
};

TEST_CASE_METHOD(DevMinerTest, "DevMiner hash rate", "[devnet][dev_miner]") {
    CHECK(!miner.is_mining());
    CHECK(miner.hash_rate() == 0);

    CHECK(miner.submit_hash_rate(100, kMinerId1));
    CHECK(miner.submit_hash_rate(50, kMinerId2));
    CHECK(miner.is_mining());
    CHECK(miner.hash_rate() == 150);

    SECTION("latest report per miner") {
        CHECK(miner.submit_hash_rate(10, kMinerId1));
        CHECK(miner.hash_rate() == 60);
    }
    SECTION("reports expire") {
        now += std::chrono::seconds{5};
        CHECK(miner.submit_hash_rate(10, kMinerId1));
        now += std::chrono::seconds{6};
        CHECK(miner.hash_rate() == 10);
        now += kHashRateExpiry;
        CHECK(miner.hash_rate() == 0);
        CHECK(!miner.is_mining());
    }
    SECTION("rate beyond 64 bits is rejected") {
        const intx::uint256 huge{intx::uint256{std::numeric_limits<uint64_t>::max()} + 1};
        CHECK(!miner.submit_hash_rate(huge, kMinerId1));
        CHECK(miner.hash_rate() == 150);
    }
    SECTION("total beyond 64 bits") {
        const intx::uint256 max_rate{std::numeric_limits<uint64_t>::max()};
        CHECK(miner.submit_hash_rate(max_rate, kMinerId1));
        CHECK(miner.submit_hash_rate(max_rate, kMinerId2));
        CHECK(miner.hash_rate() == max_rate + max_rate);
    }
}

TEST_CASE_METHOD(DevMinerTest, "DevMiner get_work", "[devnet][dev_miner]") {
    const auto work{miner.get_work()};
    REQUIRE(work);
    CHECK(work->block_num == 1);
    CHECK(work->seed_hash == evmc::bytes32{});  // epoch 0
    CHECK(work->target == 0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff_bytes32);

    const auto pending = chain->data()->pending;
    REQUIRE(pending);
    CHECK(pending->block->block.header.hash(/*for_sealing=*/true) == work->header_hash);
    CHECK(pending->block->block.header.beneficiary == kEtherbase);
    CHECK(pending->block->block.header.parent_hash == chain->head()->block->hash);

    SECTION("pooled transactions are included") {
        const auto txn{test_util::make_transfer(0, 0, kEtherbase, 1)};
        REQUIRE(chain->add_pooled_transaction(txn, txn.hash()));
        const auto next_work{miner.get_work()};
        REQUIRE(next_work);
        CHECK(next_work->header_hash != work->header_hash);
        CHECK(chain->data()->pending->block->block.transactions.size() == 1);
    }
    SECTION("no work without etherbase") {
        DevMiner idle{chain, workers, MinerSettings{.etherbase = {}, .difficulty = 1, .gas_limit = 30'000'000}};
        CHECK(!idle.get_work());
    }
}

TEST_CASE_METHOD(DevMinerTest, "DevMiner keeps a bounded number of jobs", "[devnet][dev_miner]") {
    std::vector<rpc::Work> works;
    for (uint64_t nonce{0}; nonce < kMaxSealingJobs + 2; ++nonce) {
        const auto txn{test_util::make_transfer(0, nonce, kEtherbase, 1)};
        REQUIRE(chain->add_pooled_transaction(txn, txn.hash()));
        const auto work{miner.get_work()};
        REQUIRE(work);
        works.push_back(*work);
        CHECK(miner.num_jobs() <= kMaxSealingJobs);
    }
    CHECK(miner.num_jobs() == kMaxSealingJobs);

    // Further polls stay within the bound
    CHECK(miner.get_work());
    CHECK(miner.num_jobs() == kMaxSealingJobs);

    const Bytes nonce_bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
    SECTION("oldest job is evicted") {
        CHECK(!spawn_and_wait(miner.submit_work(nonce_bytes, works.front().header_hash, mix_digest(works.front(), 1))));
        CHECK(chain->head()->block->block.header.number == 0);
    }
    SECTION("newest job is sealable") {
        CHECK(spawn_and_wait(miner.submit_work(nonce_bytes, works.back().header_hash, mix_digest(works.back(), 1))));
        CHECK(chain->head()->block->block.transactions.size() == kMaxSealingJobs + 2);
        CHECK(miner.num_jobs() == 0);
    }
}

TEST_CASE_METHOD(DevMinerTest, "DevMiner submit_work", "[devnet][dev_miner]") {
    const Bytes nonce_bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x2a};
    const auto work{miner.get_work()};
    REQUIRE(work);
    const auto digest{mix_digest(*work, 0x2a)};

    SECTION("valid solution seals the job") {
        CHECK(spawn_and_wait(miner.submit_work(nonce_bytes, work->header_hash, digest)));
        const auto head = chain->head()->block;
        CHECK(head->block.header.number == 1);
        CHECK(head->block.header.prev_randao == digest);
        CHECK(head->block.header.nonce[7] == 0x2a);
        CHECK(head->block.header.hash(/*for_sealing=*/true) == work->header_hash);

        // The same job is stale once sealed
        CHECK(!spawn_and_wait(miner.submit_work(nonce_bytes, work->header_hash, digest)));
    }
    SECTION("stale job after head advance") {
        chain->append_block(Block{}, {});
        CHECK(!spawn_and_wait(miner.submit_work(nonce_bytes, work->header_hash, digest)));
        CHECK(chain->head()->block->block.header.number == 1);
    }
    SECTION("unknown job") {
        CHECK(!spawn_and_wait(miner.submit_work(nonce_bytes, 0x01_bytes32, digest)));
    }
    SECTION("wrong mix digest") {
        CHECK(!spawn_and_wait(miner.submit_work(nonce_bytes, work->header_hash, 0x01_bytes32)));
        CHECK(chain->head()->block->block.header.number == 0);
    }
}

}  // namespace ethrpc::devnet
