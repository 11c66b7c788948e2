// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ethrpc/rpc/types/log.hpp>

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Log& log);

}  // namespace ethrpc::rpc
