// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <variant>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/rpc/json/block.hpp>
#include <ethrpc/rpc/json/block_ref.hpp>
#include <ethrpc/rpc/json/call.hpp>
#include <ethrpc/rpc/json/filter.hpp>
#include <ethrpc/rpc/json/log.hpp>
#include <ethrpc/rpc/json/receipt.hpp>
#include <ethrpc/rpc/json/transaction.hpp>
#include <ethrpc/rpc/types/error.hpp>
#include <ethrpc/rpc/types/syncing.hpp>
#include <ethrpc/rpc/types/work.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

//! Accepts a hex quantity string or a non-negative JSON integer
void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx

namespace ethrpc::rpc {

inline constexpr const char* kJsonVersion{"2.0"};

void to_json(nlohmann::json& json, const SyncStatus& sync_status);

void to_json(nlohmann::json& json, const Work& work);

void to_json(nlohmann::json& json, const Error& error);
void to_json(nlohmann::json& json, const RevertError& error);

//! \brief Parses a 0x-prefixed hex quantity fitting in 64 bits
//! \throws InvalidParamsError on malformed input
uint64_t from_quantity(const std::string& hex_quantity);

//! \brief Reads a 64-bit quantity given either as hex string or as JSON integer
//! \throws InvalidParamsError on malformed input
uint64_t quantity_from_json(const nlohmann::json& json);

//! \brief Reads a 0x-prefixed even-length hex byte string
//! \throws InvalidParamsError on malformed input
Bytes bytes_from_json(const nlohmann::json& json);

//! \brief Decodes the request parameter at \p index
//! \throws InvalidParamsError if the parameter is missing or does not decode as T
template <typename T>
T get_param(const nlohmann::json& params, size_t index) {
    try {
        return params.at(index).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidParamsError{"invalid param " + std::to_string(index) + ": " + e.what()};
    }
}

std::string to_hex_no_leading_zeros(uint64_t number);
std::string to_hex_no_leading_zeros(ByteView bytes);
std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);
std::string to_quantity(ByteView bytes);

//! Byte string in wire format: 0x followed by two hex digits per byte
std::string to_data(ByteView bytes);

nlohmann::json make_json_content(const nlohmann::json& request_json);
nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result);
nlohmann::json make_json_error(const nlohmann::json& request_json, int code, const std::string& message);
nlohmann::json make_json_error(const nlohmann::json& request_json, const RevertError& error);

}  // namespace ethrpc::rpc
