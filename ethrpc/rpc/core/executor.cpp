// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "executor.hpp"

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::rpc {

std::string ExecutionResult::error_message(bool full_error) const {
    if (pre_check_error) {
        return *pre_check_error;
    }
    if (error_code) {
        return get_error_message(*error_code, data, full_error);
    }
    return "";
}

static Bytes build_abi_selector(std::string_view signature) {
    const auto signature_hash = keccak256({reinterpret_cast<const uint8_t*>(signature.data()), signature.size()});
    return {std::begin(signature_hash.bytes), std::begin(signature_hash.bytes) + 4};
}

static std::optional<std::string> decode_error_reason(const Bytes& error_data) {
    static const Bytes kRevertSelector = build_abi_selector("Error(string)");
    static constexpr size_t kAbiStringOffsetSize{32};

    if (error_data.size() < kRevertSelector.size() || error_data.substr(0, kRevertSelector.size()) != kRevertSelector) {
        return std::nullopt;
    }

    ByteView encoded_msg{error_data.data() + kRevertSelector.size(), error_data.size() - kRevertSelector.size()};
    ETHRPC_TRACE << "decode_error_reason size: " << encoded_msg.size() << " error_message: " << to_hex(encoded_msg);
    if (encoded_msg.size() < kAbiStringOffsetSize) {
        return std::nullopt;
    }

    const auto offset_uint256{intx::be::unsafe::load<intx::uint256>(encoded_msg.data())};
    if (offset_uint256 > encoded_msg.size()) {
        return std::nullopt;
    }
    const auto offset = static_cast<uint64_t>(offset_uint256);
    if (encoded_msg.size() < kAbiStringOffsetSize + offset) {
        return std::nullopt;
    }

    const uint64_t message_offset{kAbiStringOffsetSize + offset};
    const auto length_uint256{intx::be::unsafe::load<intx::uint256>(encoded_msg.data() + offset)};
    if (length_uint256 > encoded_msg.size()) {
        return std::nullopt;
    }
    const auto length = static_cast<uint64_t>(length_uint256);
    if (encoded_msg.size() < message_offset + length) {
        return std::nullopt;
    }

    return std::string{std::begin(encoded_msg) + static_cast<std::ptrdiff_t>(message_offset),
                       std::begin(encoded_msg) + static_cast<std::ptrdiff_t>(message_offset + length)};
}

std::string get_error_message(int64_t error_code, const Bytes& error_data, bool full_error) {
    ETHRPC_DEBUG << "get_error_message error_data: " << to_hex(error_data);

    std::string error_message;
    switch (error_code) {
        case evmc_status_code::EVMC_FAILURE:
            error_message = "execution failed";
            break;
        case evmc_status_code::EVMC_REVERT:
            error_message = "execution reverted";
            break;
        case evmc_status_code::EVMC_OUT_OF_GAS:
            error_message = "out of gas";
            break;
        case evmc_status_code::EVMC_INVALID_INSTRUCTION:
            error_message = "invalid instruction";
            break;
        case evmc_status_code::EVMC_UNDEFINED_INSTRUCTION:
            error_message = "invalid opcode";
            break;
        case evmc_status_code::EVMC_STACK_OVERFLOW:
            error_message = "stack overflow";
            break;
        case evmc_status_code::EVMC_STACK_UNDERFLOW:
            error_message = "stack underflow";
            break;
        case evmc_status_code::EVMC_BAD_JUMP_DESTINATION:
            error_message = "invalid jump destination";
            break;
        case evmc_status_code::EVMC_INVALID_MEMORY_ACCESS:
            error_message = "invalid memory access";
            break;
        case evmc_status_code::EVMC_CALL_DEPTH_EXCEEDED:
            error_message = "call depth exceeded";
            break;
        case evmc_status_code::EVMC_STATIC_MODE_VIOLATION:
            error_message = "static mode violation";
            break;
        case evmc_status_code::EVMC_PRECOMPILE_FAILURE:
            error_message = "precompile failure";
            break;
        case evmc_status_code::EVMC_INSUFFICIENT_BALANCE:
            error_message = "insufficient balance";
            break;
        case evmc_status_code::EVMC_INTERNAL_ERROR:
            error_message = "internal error";
            break;
        case evmc_status_code::EVMC_REJECTED:
            error_message = "execution rejected";
            break;
        case evmc_status_code::EVMC_OUT_OF_MEMORY:
            error_message = "out of memory";
            break;
        default:
            error_message = "unknown error code";
    }

    if (full_error) {
        const auto error_reason{decode_error_reason(error_data)};
        if (error_reason) {
            error_message += ": " + *error_reason;
        }
    }
    ETHRPC_DEBUG << "get_error_message error_message: " << error_message;
    return error_message;
}

}  // namespace ethrpc::rpc
