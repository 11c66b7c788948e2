// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <string>

namespace ethrpc::rpc {

namespace {

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"

    // NOLINTNEXTLINE(cppcoreguidelines-virtual-class-destructor)
    class ProtocolErrorCategory final : public boost::system::error_category {
      public:
        const char* name() const noexcept override { return "rpc::ProtocolErrorCategory"; }

        std::string message(int ev) const override {
            switch (ev) {
                case ErrorCode::kParseError:
                    return "parse error";
                case ErrorCode::kInvalidRequest:
                    return "invalid request";
                case ErrorCode::kMethodNotFound:
                    return "method not found";
                case ErrorCode::kInvalidParams:
                    return "invalid params";
                case ErrorCode::kInternalError:
                    return "internal error";
                case ErrorCode::kServerError:
                    return "server error";
                case ErrorCode::kResourceNotFound:
                    return "resource not found";
                case ErrorCode::kResourceUnavailable:
                    return "resource unavailable";
                case ErrorCode::kExecutionReverted:
                    return "execution reverted";
                default:
                    return "unknown error " + std::to_string(ev);
            }
        }
    };

#pragma GCC diagnostic pop

}  // namespace

const boost::system::error_category& protocol_category() noexcept {
    static const ProtocolErrorCategory kCategory;
    return kCategory;
}

boost::system::error_code to_system_code(ErrorCode e) {
    return {static_cast<int>(e), protocol_category()};
}

}  // namespace ethrpc::rpc
