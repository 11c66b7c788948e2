// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <ethrpc/rpc/types/block_ref.hpp>

namespace ethrpc::rpc {

//! \brief Parses a block identifier parameter
//! \details Accepts a tag, a hex quantity, a decimal string, a JSON integer, a 32-byte hash or an EIP-1898 object
//! \throws InvalidParamsError on malformed input
BlockRef parse_block_ref(const nlohmann::json& json);

}  // namespace ethrpc::rpc

namespace nlohmann {

template <>
struct adl_serializer<ethrpc::rpc::BlockRef> {
    static ethrpc::rpc::BlockRef from_json(const json& json) {
        return ethrpc::rpc::parse_block_ref(json);
    }

    static void to_json(json& json, const ethrpc::rpc::BlockRef& block_ref) {
        json = block_ref.to_string();
    }
};

}  // namespace nlohmann
