// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validator.hpp"

#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::rpc::json_rpc {

static const std::string kRequestFieldJsonRpc{"jsonrpc"};
static const std::string kRequestFieldId{"id"};
static const std::string kRequestFieldMethod{"method"};
static const std::string kRequestFieldParameters{"params"};
static const std::string kRequestRequiredFields{kRequestFieldJsonRpc + "," + kRequestFieldMethod};

ValidationResult Validator::validate(const nlohmann::json& request) {
    if (!request.is_object()) {
        return tl::make_unexpected("Request not valid, expected object");
    }
    return check_request_fields(request);
}

ValidationResult Validator::check_request_fields(const nlohmann::json& request) {
    // Expected fields: jsonrpc, method, id (optional), params (optional)
    auto required_fields = 0b11;

    for (auto item = request.begin(); item != request.end(); ++item) {
        if (item.key() == kRequestFieldMethod) {
            if (!item.value().is_string() || item.value().get<std::string>().empty()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
            required_fields &= 0b10;
        } else if (item.key() == kRequestFieldId) {
            if (!item.value().is_number_integer() && !item.value().is_string() && !item.value().is_null()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
        } else if (item.key() == kRequestFieldParameters) {
            if (!item.value().is_array()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
        } else if (item.key() == kRequestFieldJsonRpc) {
            if (!item.value().is_string() || item.value().get<std::string>() != kJsonVersion) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
            required_fields &= 0b01;
        } else {
            return tl::make_unexpected("Invalid field: " + item.key());
        }
    }

    if (required_fields != 0) {
        return tl::make_unexpected("Request not valid, required fields: " + kRequestRequiredFields);
    }

    return {};
}

ValidationResult Validator::validate_params(const nlohmann::json& request, const MethodTraits& traits) {
    const size_t num_params = request.contains(kRequestFieldParameters) ? request[kRequestFieldParameters].size() : 0;
    if (num_params < traits.min_params || num_params > traits.max_params) {
        const auto params = request.contains(kRequestFieldParameters) ? request[kRequestFieldParameters].dump() : "[]";
        return tl::make_unexpected("invalid " + std::string{traits.name} + " params: " + params);
    }
    return {};
}

}  // namespace ethrpc::rpc::json_rpc
