// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gmock/gmock.h>

#include <ethrpc/rpc/txpool/miner.hpp>
#include <ethrpc/rpc/txpool/transaction_pool.hpp>

namespace ethrpc::rpc::test {

class TransactionPoolMock : public txpool::TransactionPool {  // NOLINT
  public:
    MOCK_METHOD((Task<txpool::OperationResult>), add_transaction, (ByteView), (override));
    MOCK_METHOD((Task<std::optional<uint64_t>>), nonce, (const evmc::address&), (override));
};

class MinerMock : public txpool::Miner {  // NOLINT
  public:
    MOCK_METHOD((bool), is_mining, (), (const, override));
    MOCK_METHOD((intx::uint256), hash_rate, (), (const, override));
    MOCK_METHOD((std::optional<Work>), get_work, (), (override));
    MOCK_METHOD((bool), submit_hash_rate, (const intx::uint256&, const evmc::bytes32&), (override));
    MOCK_METHOD((Task<bool>), submit_work, (const Bytes&, const evmc::bytes32&, const evmc::bytes32&), (override));
};

}  // namespace ethrpc::rpc::test
