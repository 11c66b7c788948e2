// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <gmock/gmock.h>

#include <ethrpc/rpc/storage/chain_storage.hpp>

namespace ethrpc::rpc::test {

class ChainSnapshotMock : public ChainSnapshot {  // NOLINT
  public:
    MOCK_METHOD((BlockNum), head_block_num, (), (const, override));
    MOCK_METHOD((BlockNum), lowest_block_num, (), (const, override));
    MOCK_METHOD((Task<std::optional<evmc::bytes32>>), read_canonical_hash, (BlockNum), (const, override));
    MOCK_METHOD((Task<std::optional<BlockNum>>), read_block_num, (const evmc::bytes32&), (const, override));
    MOCK_METHOD((Task<std::shared_ptr<const BlockWithHash>>), read_block, (BlockNum, const evmc::bytes32&), (const, override));
    MOCK_METHOD((Task<std::shared_ptr<const BlockWithHash>>), read_pending_block, (), (const, override));
    MOCK_METHOD((Task<std::optional<TransactionLocation>>), read_transaction_location, (const evmc::bytes32&), (const, override));
    MOCK_METHOD((Task<std::optional<std::vector<ethrpc::Receipt>>>), read_receipts, (BlockNum, const evmc::bytes32&), (const, override));
};

class ChainHistoryMock : public ChainHistory {  // NOLINT
  public:
    MOCK_METHOD((Task<std::shared_ptr<ChainSnapshot>>), open_snapshot, (), (override));
};

class ChainStateMock : public ChainState {  // NOLINT
  public:
    MOCK_METHOD((Task<std::optional<Account>>), read_account, (const evmc::address&, const ResolvedBlock&), (const, override));
    MOCK_METHOD((Task<std::optional<Bytes>>), read_code, (const evmc::address&, const ResolvedBlock&), (const, override));
    MOCK_METHOD((Task<std::optional<evmc::bytes32>>), read_storage,
                (const evmc::address&, const evmc::bytes32&, const ResolvedBlock&), (const, override));
};

}  // namespace ethrpc::rpc::test
