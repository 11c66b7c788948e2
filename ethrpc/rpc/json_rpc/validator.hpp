// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <ethrpc/rpc/json_rpc/method_table.hpp>

namespace ethrpc::rpc::json_rpc {

using ValidationResult = tl::expected<void, std::string>;

//! Structural checks on a JSON-RPC request object, independent of its method semantics
class Validator {
  public:
    //! \brief Check the request envelope: jsonrpc version, id, method and params fields
    ValidationResult validate(const nlohmann::json& request);

    //! \brief Check the number of positional parameters against the method arity
    ValidationResult validate_params(const nlohmann::json& request, const MethodTraits& traits);

  private:
    ValidationResult check_request_fields(const nlohmann::json& request);
};

}  // namespace ethrpc::rpc::json_rpc
