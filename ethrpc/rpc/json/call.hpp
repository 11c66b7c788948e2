// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ethrpc/rpc/types/call.hpp>

namespace ethrpc::rpc {

void from_json(const nlohmann::json& json, Call& call);

void from_json(const nlohmann::json& json, TransactionRequest& request);

}  // namespace ethrpc::rpc
