// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <ethrpc/core/common/util.hpp>

namespace ethrpc::rpc {

std::ostream& operator<<(std::ostream& out, const Error& error) {
    return out << "code: " << error.code << " message: " << error.message;
}

std::ostream& operator<<(std::ostream& out, const RevertError& error) {
    return out << static_cast<const Error&>(error) << " data: " << to_hex(error.data, /*with_prefix=*/true);
}

std::string_view to_string(ResolutionError::Reason reason) {
    switch (reason) {
        case ResolutionError::Reason::kPrunedOrUnavailable:
            return "pruned or unavailable";
        case ResolutionError::Reason::kReorgedDuringCall:
            return "reorged during call";
    }
    return "unknown";
}

}  // namespace ethrpc::rpc
