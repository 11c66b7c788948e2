// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>

#include <ethrpc/core/common/base.hpp>

namespace ethrpc::rpc {

struct NotSyncing {};

struct SyncProgress {
    BlockNum starting_block{0};
    BlockNum current_block{0};
    BlockNum highest_block{0};

    friend bool operator==(const SyncProgress&, const SyncProgress&) = default;
};

using SyncStatus = std::variant<NotSyncing, SyncProgress>;

}  // namespace ethrpc::rpc
