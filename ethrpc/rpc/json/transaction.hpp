// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/rpc/types/transaction.hpp>

namespace ethrpc {

void to_json(nlohmann::json& json, const AccessListEntry& access_list);
void from_json(const nlohmann::json& json, AccessListEntry& entry);

void to_json(nlohmann::json& json, const Transaction& transaction);

}  // namespace ethrpc

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const Transaction& transaction);

}  // namespace ethrpc::rpc
