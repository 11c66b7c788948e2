// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <gmock/gmock.h>

#include <ethrpc/rpc/ethbackend/backend.hpp>
#include <ethrpc/rpc/ethbackend/signer.hpp>

namespace ethrpc::rpc::test {

class BackEndMock : public ethbackend::BackEnd {  // NOLINT
  public:
    MOCK_METHOD((Task<evmc::address>), etherbase, (), (override));
    MOCK_METHOD((Task<uint64_t>), protocol_version, (), (override));
    MOCK_METHOD((Task<std::optional<uint64_t>>), chain_id, (), (override));
    MOCK_METHOD((Task<intx::uint256>), gas_price, (), (override));
    MOCK_METHOD((Task<SyncStatus>), sync_status, (), (override));
};

class SignerMock : public ethbackend::Signer {  // NOLINT
  public:
    MOCK_METHOD((std::vector<evmc::address>), accounts, (), (const, override));
    MOCK_METHOD((Task<std::optional<Bytes>>), sign_transaction, (const TransactionRequest&), (override));
};

}  // namespace ethrpc::rpc::test
