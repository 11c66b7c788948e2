// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <boost/system/error_code.hpp>

namespace ethrpc::rpc {

//! JSON-RPC 2.0 and EIP-1474 error codes carried in the error object of a reply
enum ErrorCode : int64_t {
    kParseError = -32700,      // Invalid JSON was received by the server
    kInvalidRequest = -32600,  // The JSON sent is not a valid Request object
    kMethodNotFound = -32601,  // The method does not exist / is not available
    kInvalidParams = -32602,   // Invalid method parameter(s)
    kInternalError = -32603,   // Internal JSON-RPC error
    kServerError = -32000,     // Request understood but rejected (pool, pre-check, gas estimation)

    kResourceNotFound = -32001,     // Required result does not exist
    kResourceUnavailable = -32002,  // Block pruned or reorged while serving the request

    kExecutionReverted = 3,  // Execution reverted, revert data in the error object
};

//! Error category naming every ErrorCode
const boost::system::error_category& protocol_category() noexcept;

// To raise a boost::system::system_error exception:
//    throw boost::system::system_error{rpc::to_system_code(rpc::ErrorCode::kSomething)};
boost::system::error_code to_system_code(ErrorCode e);

}  // namespace ethrpc::rpc
