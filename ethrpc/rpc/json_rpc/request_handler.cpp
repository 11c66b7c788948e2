// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <ethrpc/infra/common/clock_time.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/json_rpc/normalizer.hpp>
#include <ethrpc/rpc/protocol/errors.hpp>

namespace ethrpc::rpc::json_rpc {

//! Reply carrying the standard message of \p code
static nlohmann::json make_protocol_error(const nlohmann::json& request_json, ErrorCode code) {
    return make_json_error(request_json, static_cast<int>(code), to_system_code(code).message());
}

static std::string dump_reply(const nlohmann::json& reply_json) {
    return reply_json.dump(
        /*indent=*/-1, /*indent_char=*/' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace);
}

RequestHandler::RequestHandler(commands::RpcApi& rpc_api, const commands::RpcApiTable& rpc_api_table)
    : rpc_api_{rpc_api}, rpc_api_table_{rpc_api_table} {}

Task<std::string> RequestHandler::handle(const std::string& request) {
    const auto start = clock_time::now();
    std::string response;
    nlohmann::json request_json;
    bool parsed{false};
    try {
        request_json = prevalidate_and_parse(request);
        parsed = true;
    } catch (const nlohmann::json::exception& e) {
        ETHRPC_ERROR << "RequestHandler::handle nlohmann::json::exception: " << e.what();
        response = dump_reply(make_protocol_error(nlohmann::json::object(), kParseError));
    } catch (const std::runtime_error& re) {
        ETHRPC_ERROR << "RequestHandler::handle runtime error: " << re.what();
        response = dump_reply(make_json_error(nlohmann::json::object(), kParseError, re.what()));
    }

    if (parsed) {
        if (!request_json.is_object()) {
            response = dump_reply(make_protocol_error(nlohmann::json::object(), kInvalidRequest));
        } else if (const auto valid_result{json_rpc_validator_.validate(request_json)}; !valid_result) {
            response = dump_reply(make_json_error(request_json, kInvalidRequest, valid_result.error()));
        } else {
            co_await handle_request_and_create_reply(request_json, response);
        }
    }

    ETHRPC_TRACE << "handle request t=" << clock_time::since(start) << "ns";
    co_return response;
}

/**
 * @brief Prevalidate and parse the JSON request. Specifically, it checks for nil characters that are only allowed inside quoted strings.
 * @param request The JSON request
 * @return The parsed JSON request
 */
nlohmann::json RequestHandler::prevalidate_and_parse(const std::string& request) {
    bool inside_quote = false;
    bool previous_char_escape = false;
    for (auto ch : request) {
        if (!inside_quote && ch == 0x0) {
            throw std::runtime_error("invalid request: nil character");
        }

        if (ch == '"' && !previous_char_escape) {
            inside_quote = !inside_quote;
        }
        previous_char_escape = ch == '\\' && !previous_char_escape;
    }

    return nlohmann::json::parse(request);
}

Task<void> RequestHandler::handle_request_and_create_reply(const nlohmann::json& request_json, std::string& response) {
    const auto method = request_json["method"].get<std::string>();

    const auto* traits = find_method(method);
    const auto json_handler = rpc_api_table_.find_json_handler(method);
    const auto immediate_handler = rpc_api_table_.find_immediate_handler(method);
    if (!traits || (!json_handler && !immediate_handler)) {
        response = dump_reply(make_json_error(request_json, kMethodNotFound, "the method " + method + " does not exist/is not available"));
        co_return;
    }

    if (const auto valid_params{json_rpc_validator_.validate_params(request_json, *traits)}; !valid_params) {
        response = dump_reply(make_json_error(request_json, kInvalidParams, valid_params.error()));
        co_return;
    }

    // Handlers index positional parameters, so an omitted params field is an empty list
    nlohmann::json full_request_json = request_json;
    if (!full_request_json.contains("params")) {
        full_request_json["params"] = nlohmann::json::array();
    }

    ETHRPC_TRACE << "--> handle RPC request: " << method;
    if (immediate_handler) {
        handle_request(*immediate_handler, *traits, full_request_json, response);
    } else {
        co_await handle_request(*json_handler, *traits, full_request_json, response);
    }
    ETHRPC_TRACE << "<-- handle RPC request: " << method;
}

Task<void> RequestHandler::handle_request(commands::RpcApiTable::HandleMethod handler,
                                          const MethodTraits& traits,
                                          const nlohmann::json& request_json,
                                          std::string& response) {
    nlohmann::json reply_json;
    std::exception_ptr eptr;
    try {
        co_await (rpc_api_.*handler)(request_json, reply_json);
    } catch (const std::exception&) {
        eptr = std::current_exception();
    }
    if (eptr) {
        reply_json = make_error_reply(request_json, traits, eptr);
    }
    response = dump_reply(reply_json);
}

void RequestHandler::handle_request(commands::RpcApiTable::HandleImmediateMethod handler,
                                    const MethodTraits& traits,
                                    const nlohmann::json& request_json,
                                    std::string& response) {
    nlohmann::json reply_json;
    try {
        (rpc_api_.*handler)(request_json, reply_json);
    } catch (const std::exception&) {
        reply_json = make_error_reply(request_json, traits, std::current_exception());
    }
    response = dump_reply(reply_json);
}

}  // namespace ethrpc::rpc::json_rpc
