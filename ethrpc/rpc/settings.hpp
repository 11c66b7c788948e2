// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/commands/eth_write_api.hpp>
#include <ethrpc/rpc/common/constants.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>

namespace ethrpc::rpc {

inline constexpr uint64_t kDefaultDevnetDifficulty{131'072};
inline constexpr uint64_t kDefaultDevnetGasLimit{30'000'000};

struct DevnetSettings {
    uint64_t difficulty{kDefaultDevnetDifficulty};
    uint64_t gas_limit{kDefaultDevnetGasLimit};
};

struct DaemonSettings {
    log::Settings log_settings;
    uint32_t num_workers{kDefaultNumWorkers};
    std::string eth_api_spec{kDefaultApiSpec};
    commands::CallSettings call_settings;
    std::string etherbase;
    std::optional<uint64_t> chain_id;
    DevnetSettings devnet;
};

}  // namespace ethrpc::rpc
