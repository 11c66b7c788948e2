// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "call.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc {

namespace {

    template <typename Request>
    void read_message_fields(const nlohmann::json& json, Request& request) {
        if (!json.is_object()) {
            throw InvalidParamsError{"invalid call object: " + json.dump()};
        }
        if (json.contains("to")) {
            const auto& to = json.at("to");
            if (!to.is_null()) {
                request.to = to.get<evmc::address>();
            }
        }
        if (json.contains("nonce")) {
            request.nonce = quantity_from_json(json.at("nonce"));
        }
        if (json.contains("gas")) {
            request.gas = quantity_from_json(json.at("gas"));
        }
        if (json.contains("gasPrice")) {
            request.gas_price = json.at("gasPrice").get<intx::uint256>();
        }
        if (json.contains("maxFeePerGas")) {
            request.max_fee_per_gas = json.at("maxFeePerGas").get<intx::uint256>();
        }
        if (json.contains("maxPriorityFeePerGas")) {
            request.max_priority_fee_per_gas = json.at("maxPriorityFeePerGas").get<intx::uint256>();
        }
        if (request.gas_price && (request.max_fee_per_gas || request.max_priority_fee_per_gas)) {
            throw InvalidParamsError{"both gasPrice and (maxFeePerGas or maxPriorityFeePerGas) specified"};
        }
        if (json.contains("value")) {
            request.value = json.at("value").get<intx::uint256>();
        }

        // backward compatibility: both `data` and `input` fields are accepted as input
        if (json.contains("data")) {
            request.data = bytes_from_json(json.at("data"));
        }
        if (json.contains("input")) {
            auto input = bytes_from_json(json.at("input"));
            if (request.data && *request.data != input) {
                throw InvalidParamsError{"both data and input specified with different values"};
            }
            request.data = std::move(input);
        }
    }

}  // namespace

void from_json(const nlohmann::json& json, Call& call) {
    read_message_fields(json, call);
    if (json.contains("from")) {
        const auto& from = json.at("from");
        if (!from.is_null()) {
            call.from = from.get<evmc::address>();
        }
    }
}

void from_json(const nlohmann::json& json, TransactionRequest& request) {
    read_message_fields(json, request);
    if (!json.contains("from")) {
        throw InvalidParamsError{"missing sender: " + json.dump()};
    }
    request.from = json.at("from").get<evmc::address>();
}

}  // namespace ethrpc::rpc
