// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ethrpc/core/types/block.hpp>
#include <ethrpc/rpc/types/block.hpp>

namespace ethrpc {

void to_json(nlohmann::json& json, const BlockHeader& header);

}  // namespace ethrpc

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Block& b);

void to_json(nlohmann::json& json, const Uncle& uncle);

}  // namespace ethrpc::rpc
