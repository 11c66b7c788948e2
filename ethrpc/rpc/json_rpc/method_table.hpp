// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace ethrpc::rpc::json_rpc {

//! How absence of the requested entity is reported
enum class ResultKind {
    kOptional,  // null result
    kRequired,  // resource not found error
};

enum class DispatchMode {
    kSuspending,  // coroutine awaiting collaborator I/O
    kImmediate,   // answered from resident state without suspending
};

struct MethodTraits {
    std::string_view name;
    std::string_view group;
    ResultKind result_kind;
    DispatchMode dispatch_mode;
    size_t min_params;
    size_t max_params;
};

//! Every method served by the facade
std::span<const MethodTraits> method_table();

//! \return the traits of method or nullptr if the method is unknown
const MethodTraits* find_method(std::string_view name);

}  // namespace ethrpc::rpc::json_rpc
