// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_ref.hpp"

#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc {

BlockRef parse_block_ref(const nlohmann::json& json) {
    if (json.is_string()) {
        return BlockRef{json.get<std::string>()};
    }
    if (json.is_number_unsigned()) {
        return BlockRef{json.get<BlockNum>()};
    }
    if (json.is_object()) {
        // EIP-1898
        const bool has_number{json.contains("blockNumber")};
        const bool has_hash{json.contains("blockHash")};
        if (has_number == has_hash) {
            throw InvalidParamsError{"invalid block identifier object: " + json.dump()};
        }
        if (has_number) {
            const auto& block_num = json.at("blockNumber");
            if (!block_num.is_string()) {
                throw InvalidParamsError{"invalid block identifier object: " + json.dump()};
            }
            const BlockRef block_ref{block_num.get<std::string>()};
            if (block_ref.is_hash()) {
                throw InvalidParamsError{"invalid block identifier object: " + json.dump()};
            }
            return block_ref;
        }
        const auto block_hash = json.at("blockHash").get<evmc::bytes32>();
        bool require_canonical{false};
        if (json.contains("requireCanonical")) {
            const auto& flag = json.at("requireCanonical");
            if (!flag.is_boolean()) {
                throw InvalidParamsError{"invalid block identifier object: " + json.dump()};
            }
            require_canonical = flag.get<bool>();
        }
        return BlockRef{block_hash, require_canonical};
    }
    throw InvalidParamsError{"invalid block identifier: " + json.dump()};
}

}  // namespace ethrpc::rpc
