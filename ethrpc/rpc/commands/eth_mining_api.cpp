// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "eth_mining_api.hpp"

#include <string>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc::commands {

// https://eth.wiki/json-rpc/API#eth_mining
void EthMiningApi::handle_eth_mining(const nlohmann::json& request, nlohmann::json& reply) {
    reply = make_json_content(request, miner_->is_mining());
}

// https://eth.wiki/json-rpc/API#eth_coinbase
Task<void> EthMiningApi::handle_eth_coinbase(const nlohmann::json& request, nlohmann::json& reply) {
    const auto coinbase = co_await backend_->etherbase();
    reply = make_json_content(request, coinbase);
}

// https://eth.wiki/json-rpc/API#eth_hashrate
void EthMiningApi::handle_eth_hashrate(const nlohmann::json& request, nlohmann::json& reply) {
    reply = make_json_content(request, to_quantity(miner_->hash_rate()));
}

// https://eth.wiki/json-rpc/API#eth_submithashrate
void EthMiningApi::handle_eth_submit_hashrate(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto hash_rate = get_param<intx::uint256>(params, 0);
    const auto id = get_param<evmc::bytes32>(params, 1);
    ETHRPC_DEBUG << "hash_rate: " << hash_rate << " id: " << id;

    reply = make_json_content(request, miner_->submit_hash_rate(hash_rate, id));
}

// https://eth.wiki/json-rpc/API#eth_getwork
void EthMiningApi::handle_eth_get_work(const nlohmann::json& request, nlohmann::json& reply) {
    const auto work = miner_->get_work();
    if (!work) {
        throw NotFoundError{"no mining work available"};
    }
    reply = make_json_content(request, *work);
}

// https://eth.wiki/json-rpc/API#eth_submitwork
Task<void> EthMiningApi::handle_eth_submit_work(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_nonce = bytes_from_json(params[0]);
    if (block_nonce.size() != kNonceLength) {
        throw InvalidParamsError{"invalid eth_submitWork nonce length: " + std::to_string(block_nonce.size())};
    }
    const auto pow_hash = get_param<evmc::bytes32>(params, 1);
    const auto digest = get_param<evmc::bytes32>(params, 2);
    ETHRPC_DEBUG << "pow_hash: " << pow_hash << " digest: " << digest;

    const auto success = co_await miner_->submit_work(block_nonce, pow_hash, digest);
    reply = make_json_content(request, success);
}

}  // namespace ethrpc::rpc::commands
