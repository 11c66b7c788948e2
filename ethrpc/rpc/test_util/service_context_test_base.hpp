// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <ethrpc/infra/test_util/context_test_base.hpp>
#include <ethrpc/infra/test_util/log.hpp>
#include <ethrpc/rpc/test_util/mock_back_end.hpp>
#include <ethrpc/rpc/test_util/mock_chain_storage.hpp>
#include <ethrpc/rpc/test_util/mock_executor.hpp>
#include <ethrpc/rpc/test_util/mock_txpool.hpp>

namespace ethrpc::rpc::test_util {

using ethrpc::test_util::ContextTestBase;
using ethrpc::test_util::SetLogVerbosityGuard;

//! Registers one mock per collaborator as private service of the test io_context
class ServiceContextTestBase : public ContextTestBase {
  public:
    ServiceContextTestBase();
    ~ServiceContextTestBase() = default;

  protected:
    //! Make open_snapshot always return the shared snapshot mock
    void expect_snapshot();

    //! Serve the canonical chain made of blocks numbered from zero through the snapshot mock
    void expect_chain(std::vector<BlockWithHash> blocks, std::vector<std::vector<ethrpc::Receipt>> receipts = {});

    //! Build a block linked to parent with the given transactions and its hash
    static BlockWithHash make_block(const BlockWithHash* parent, std::vector<ethrpc::Transaction> transactions = {});

    // Mock instances are owned by the io_context services
    test::ChainHistoryMock* chain_history_;
    test::ChainStateMock* chain_state_;
    test::BackEndMock* backend_;
    test::SignerMock* signer_;
    test::TransactionPoolMock* tx_pool_;
    test::MinerMock* miner_;
    test::ExecutorMock* executor_;

    std::shared_ptr<test::ChainSnapshotMock> snapshot_{std::make_shared<test::ChainSnapshotMock>()};
};

}  // namespace ethrpc::rpc::test_util
