// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "service_context_test_base.hpp"

#include <optional>
#include <utility>

#include <ethrpc/infra/concurrency/private_service.hpp>

namespace ethrpc::rpc::test_util {

template <typename Interface, typename Mock>
static Mock* add_mock_service(boost::asio::io_context& ioc) {
    auto mock = std::make_unique<Mock>();
    Mock* mock_ptr = mock.get();
    add_private_service<Interface>(ioc, std::move(mock));
    return mock_ptr;
}

ServiceContextTestBase::ServiceContextTestBase()
    : ContextTestBase(),
      chain_history_{add_mock_service<ChainHistory, test::ChainHistoryMock>(ioc_)},
      chain_state_{add_mock_service<ChainState, test::ChainStateMock>(ioc_)},
      backend_{add_mock_service<ethbackend::BackEnd, test::BackEndMock>(ioc_)},
      signer_{add_mock_service<ethbackend::Signer, test::SignerMock>(ioc_)},
      tx_pool_{add_mock_service<txpool::TransactionPool, test::TransactionPoolMock>(ioc_)},
      miner_{add_mock_service<txpool::Miner, test::MinerMock>(ioc_)},
      executor_{add_mock_service<Executor, test::ExecutorMock>(ioc_)} {}

void ServiceContextTestBase::expect_snapshot() {
    ON_CALL(*chain_history_, open_snapshot).WillByDefault([this]() -> Task<std::shared_ptr<ChainSnapshot>> {
        co_return snapshot_;
    });
    EXPECT_CALL(*chain_history_, open_snapshot).Times(::testing::AnyNumber());
}

void ServiceContextTestBase::expect_chain(std::vector<BlockWithHash> blocks, std::vector<std::vector<ethrpc::Receipt>> receipts) {
    using ::testing::_;
    using ::testing::AnyNumber;
    using ::testing::Return;

    expect_snapshot();
    auto chain = std::make_shared<std::vector<std::shared_ptr<const BlockWithHash>>>();
    for (auto& block : blocks) {
        chain->push_back(std::make_shared<const BlockWithHash>(std::move(block)));
    }
    auto chain_receipts = std::make_shared<std::vector<std::vector<ethrpc::Receipt>>>(std::move(receipts));

    ON_CALL(*snapshot_, head_block_num()).WillByDefault(Return(chain->size() - 1));
    ON_CALL(*snapshot_, lowest_block_num()).WillByDefault(Return(0));
    ON_CALL(*snapshot_, read_canonical_hash(_)).WillByDefault([chain](BlockNum block_num) -> Task<std::optional<evmc::bytes32>> {
        if (block_num >= chain->size()) {
            co_return std::nullopt;
        }
        co_return (*chain)[block_num]->hash;
    });
    ON_CALL(*snapshot_, read_block_num(_)).WillByDefault([chain](const evmc::bytes32& block_hash) -> Task<std::optional<BlockNum>> {
        for (const auto& block : *chain) {
            if (block->hash == block_hash) {
                co_return block->block.header.number;
            }
        }
        co_return std::nullopt;
    });
    ON_CALL(*snapshot_, read_block(_, _)).WillByDefault([chain, snapshot = snapshot_.get()](BlockNum block_num, const evmc::bytes32& block_hash) -> Task<std::shared_ptr<const BlockWithHash>> {
        if (block_num < snapshot->lowest_block_num() || block_num >= chain->size() || (*chain)[block_num]->hash != block_hash) {
            co_return nullptr;
        }
        co_return (*chain)[block_num];
    });
    ON_CALL(*snapshot_, read_pending_block()).WillByDefault([]() -> Task<std::shared_ptr<const BlockWithHash>> {
        co_return nullptr;
    });
    ON_CALL(*snapshot_, read_transaction_location(_)).WillByDefault([chain](const evmc::bytes32& tx_hash) -> Task<std::optional<TransactionLocation>> {
        for (const auto& block : *chain) {
            const auto& transactions = block->block.transactions;
            for (uint64_t i{0}; i < transactions.size(); ++i) {
                if (transactions[i].hash() == tx_hash) {
                    co_return TransactionLocation{block->block.header.number, block->hash, i};
                }
            }
        }
        co_return std::nullopt;
    });
    ON_CALL(*snapshot_, read_receipts(_, _)).WillByDefault([chain_receipts](BlockNum block_num, const evmc::bytes32&) -> Task<std::optional<std::vector<ethrpc::Receipt>>> {
        if (block_num >= chain_receipts->size()) {
            co_return std::vector<ethrpc::Receipt>{};
        }
        co_return (*chain_receipts)[block_num];
    });
    EXPECT_CALL(*snapshot_, head_block_num()).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, lowest_block_num()).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_canonical_hash(_)).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_block_num(_)).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_block(_, _)).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_pending_block()).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_transaction_location(_)).Times(AnyNumber());
    EXPECT_CALL(*snapshot_, read_receipts(_, _)).Times(AnyNumber());
}

BlockWithHash ServiceContextTestBase::make_block(const BlockWithHash* parent, std::vector<ethrpc::Transaction> transactions) {
    BlockWithHash block_with_hash;
    auto& header = block_with_hash.block.header;
    if (parent) {
        header.parent_hash = parent->hash;
        header.number = parent->block.header.number + 1;
        header.timestamp = parent->block.header.timestamp + 12;
    }
    header.gas_limit = 30'000'000;
    header.difficulty = 131'072;
    header.base_fee_per_gas = 7;
    block_with_hash.block.transactions = std::move(transactions);
    block_with_hash.hash = header.hash();
    return block_with_hash;
}

}  // namespace ethrpc::rpc::test_util
