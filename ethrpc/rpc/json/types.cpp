// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <charconv>

#include <ethrpc/core/common/endian.hpp>
#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc::rpc {

std::string to_hex_no_leading_zeros(ByteView bytes) {
    static constexpr const char* kHexDigits{"0123456789abcdef"};

    std::string out{};

    if (bytes.empty()) {
        out.reserve(1);
        out.push_back('0');
        return out;
    }

    out.reserve(2 * bytes.length());

    bool found_nonzero{false};
    for (size_t i{0}; i < bytes.length(); ++i) {
        uint8_t x{bytes[i]};
        char lo{kHexDigits[x & 0x0f]};
        char hi{kHexDigits[x >> 4]};
        if (!found_nonzero && hi != '0') {
            found_nonzero = true;
        }
        if (found_nonzero) {
            out.push_back(hi);
        }
        if (!found_nonzero && lo != '0') {
            found_nonzero = true;
        }
        if (found_nonzero || i == bytes.length() - 1) {
            out.push_back(lo);
        }
    }

    return out;
}

std::string to_hex_no_leading_zeros(uint64_t number) {
    Bytes number_bytes(8, '\0');
    intx::be::unsafe::store<uint64_t>(number_bytes.data(), number);
    return to_hex_no_leading_zeros(number_bytes);
}

std::string to_quantity(ByteView bytes) {
    return "0x" + to_hex_no_leading_zeros(bytes);
}

std::string to_quantity(uint64_t number) {
    return "0x" + to_hex_no_leading_zeros(number);
}

std::string to_quantity(const intx::uint256& number) {
    if (number == 0) {
        return "0x0";
    }
    return to_quantity(endian::to_big_compact(number));
}

std::string to_data(ByteView bytes) {
    return ethrpc::to_hex(bytes, /*with_prefix=*/true);
}

uint64_t from_quantity(const std::string& hex_quantity) {
    if (!has_hex_prefix(hex_quantity) || hex_quantity.size() == 2 || hex_quantity.size() > 2 + 16) {
        throw InvalidParamsError{"invalid hex quantity: " + hex_quantity};
    }
    uint64_t number{0};
    const char* first{hex_quantity.data() + 2};
    const char* last{hex_quantity.data() + hex_quantity.size()};
    const auto [ptr, ec] = std::from_chars(first, last, number, 16);
    if (ec != std::errc{} || ptr != last) {
        throw InvalidParamsError{"invalid hex quantity: " + hex_quantity};
    }
    return number;
}

uint64_t quantity_from_json(const nlohmann::json& json) {
    if (json.is_string()) {
        return from_quantity(json.get<std::string>());
    }
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    throw InvalidParamsError{"invalid quantity: " + json.dump()};
}

Bytes bytes_from_json(const nlohmann::json& json) {
    if (!json.is_string()) {
        throw InvalidParamsError{"invalid hex string: " + json.dump()};
    }
    const auto hex = json.get<std::string>();
    if (!has_hex_prefix(hex) || hex.size() % 2 != 0) {
        throw InvalidParamsError{"invalid hex string: " + hex};
    }
    auto bytes = from_hex(hex);
    if (!bytes) {
        throw InvalidParamsError{"invalid hex string: " + hex};
    }
    return std::move(*bytes);
}

}  // namespace ethrpc::rpc

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = ethrpc::address_to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    if (!json.is_string()) {
        throw ethrpc::rpc::InvalidParamsError{"invalid address: " + json.dump()};
    }
    const auto parsed_address = ethrpc::hex_to_address(json.get<std::string>());
    if (!parsed_address) {
        throw ethrpc::rpc::InvalidParamsError{"invalid address: " + json.get<std::string>()};
    }
    addr = *parsed_address;
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = ethrpc::to_hex(b32, true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    if (!json.is_string() || !ethrpc::is_valid_hash(json.get<std::string>())) {
        throw ethrpc::rpc::InvalidParamsError{"invalid hash: " + json.dump()};
    }
    b32 = ethrpc::to_bytes32(*ethrpc::from_hex(json.get<std::string>()));
}

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    if (json.is_number_unsigned()) {
        ui256 = json.get<uint64_t>();
        return;
    }
    if (!json.is_string()) {
        throw ethrpc::rpc::InvalidParamsError{"invalid quantity: " + json.dump()};
    }
    const auto hex = json.get<std::string>();
    // At most 64 hex digits fit into 256 bits
    if (!ethrpc::is_valid_hex(hex) || hex.size() > 2 + 64) {
        throw ethrpc::rpc::InvalidParamsError{"invalid quantity: " + hex};
    }
    ui256 = intx::from_string<uint256>(hex);
}

}  // namespace intx

namespace ethrpc::rpc {

void to_json(nlohmann::json& json, const SyncStatus& sync_status) {
    if (std::holds_alternative<NotSyncing>(sync_status)) {
        json = false;
        return;
    }
    const auto& progress = std::get<SyncProgress>(sync_status);
    json["startingBlock"] = to_quantity(progress.starting_block);
    json["currentBlock"] = to_quantity(progress.current_block);
    json["highestBlock"] = to_quantity(progress.highest_block);
}

void to_json(nlohmann::json& json, const Work& work) {
    json = nlohmann::json::array();
    json.push_back(work.header_hash);
    json.push_back(work.seed_hash);
    json.push_back(work.target);
    json.push_back(to_quantity(work.block_num));
}

void to_json(nlohmann::json& json, const Error& error) {
    json = {{"code", error.code}, {"message", error.message}};
}

void to_json(nlohmann::json& json, const RevertError& error) {
    json = {{"code", error.code}, {"message", error.message}, {"data", to_data(error.data)}};
}

nlohmann::json make_json_content(const nlohmann::json& request_json) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;

    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"result", nullptr}};
}

nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;
    nlohmann::json json{{"jsonrpc", kJsonVersion}, {"id", id}, {"result", result}};
    return json;
}

nlohmann::json make_json_error(const nlohmann::json& request_json, int code, const std::string& message) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;
    const Error error{code, message};
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"error", error}};
}

nlohmann::json make_json_error(const nlohmann::json& request_json, const RevertError& error) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"error", error}};
}

}  // namespace ethrpc::rpc
