// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <ethrpc/rpc/core/executor.hpp>

namespace ethrpc::rpc::test {

class ExecutorMock : public Executor {  // NOLINT
  public:
    MOCK_METHOD((Task<ExecutionResult>), execute, (const ResolvedBlock&, const Call&, uint64_t), (override));
};

}  // namespace ethrpc::rpc::test
