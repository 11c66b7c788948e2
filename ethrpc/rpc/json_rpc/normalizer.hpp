// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>

#include <nlohmann/json.hpp>

#include <ethrpc/rpc/json_rpc/method_table.hpp>

namespace ethrpc::rpc::json_rpc {

//! \brief Shape the failure raised while handling request into its JSON-RPC reply
//! \details Absence becomes null for optional results and resource not found for required ones,
//! malformed input becomes invalid params, anything unexpected becomes internal error. JSON failures count as
//! malformed input only once parameter decoding has turned them into InvalidParamsError
nlohmann::json make_error_reply(const nlohmann::json& request, const MethodTraits& traits, std::exception_ptr eptr);

}  // namespace ethrpc::rpc::json_rpc
