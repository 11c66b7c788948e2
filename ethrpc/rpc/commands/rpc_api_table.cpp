// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_api_table.hpp"

#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/common/constants.hpp>
#include <ethrpc/rpc/json_rpc/methods.hpp>

namespace ethrpc::rpc::commands {

RpcApiTable::RpcApiTable(std::string_view api_spec) {
    build_handlers(api_spec);
}

std::optional<RpcApiTable::HandleMethod> RpcApiTable::find_json_handler(const std::string& method) const {
    const auto handle_method_pair = method_handlers_.find(method);
    if (handle_method_pair == method_handlers_.end()) {
        return std::nullopt;
    }
    return handle_method_pair->second;
}

std::optional<RpcApiTable::HandleImmediateMethod> RpcApiTable::find_immediate_handler(const std::string& method) const {
    const auto handle_method_pair = immediate_handlers_.find(method);
    if (handle_method_pair == immediate_handlers_.end()) {
        return std::nullopt;
    }
    return handle_method_pair->second;
}

void RpcApiTable::build_handlers(std::string_view api_spec) {
    size_t start = 0;
    size_t end = api_spec.find(kApiSpecSeparator);
    while (end != std::string_view::npos) {
        add_handlers(api_spec.substr(start, end - start));
        start = end + kApiSpecSeparator.length();
        end = api_spec.find(kApiSpecSeparator, start);
    }
    add_handlers(api_spec.substr(start));
}

void RpcApiTable::add_handlers(std::string_view api_namespace) {
    if (api_namespace == kEthApiNamespace) {
        add_eth_read_handlers();
        add_eth_write_handlers();
        add_eth_mining_handlers();
    } else if (api_namespace == kEthReadApiGroup) {
        add_eth_read_handlers();
    } else if (api_namespace == kEthWriteApiGroup) {
        add_eth_write_handlers();
    } else if (api_namespace == kEthMiningApiGroup) {
        add_eth_mining_handlers();
    } else {
        ETHRPC_WARN << "RpcApiTable::add_handlers invalid namespace [" << api_namespace << "] ignored";
    }
}

void RpcApiTable::add_eth_read_handlers() {
    method_handlers_[json_rpc::method::k_eth_blockNumber] = &commands::RpcApi::handle_eth_block_num;
    method_handlers_[json_rpc::method::k_eth_chainId] = &commands::RpcApi::handle_eth_chain_id;
    method_handlers_[json_rpc::method::k_eth_protocolVersion] = &commands::RpcApi::handle_eth_protocol_version;
    method_handlers_[json_rpc::method::k_eth_syncing] = &commands::RpcApi::handle_eth_syncing;
    method_handlers_[json_rpc::method::k_eth_gasPrice] = &commands::RpcApi::handle_eth_gas_price;
    method_handlers_[json_rpc::method::k_eth_getBalance] = &commands::RpcApi::handle_eth_get_balance;
    method_handlers_[json_rpc::method::k_eth_getTransactionCount] = &commands::RpcApi::handle_eth_get_transaction_count;
    method_handlers_[json_rpc::method::k_eth_getCode] = &commands::RpcApi::handle_eth_get_code;
    method_handlers_[json_rpc::method::k_eth_getStorageAt] = &commands::RpcApi::handle_eth_get_storage_at;
    method_handlers_[json_rpc::method::k_eth_getBlockByHash] = &commands::RpcApi::handle_eth_get_block_by_hash;
    method_handlers_[json_rpc::method::k_eth_getBlockByNumber] = &commands::RpcApi::handle_eth_get_block_by_number;
    method_handlers_[json_rpc::method::k_eth_getBlockTransactionCountByHash] = &commands::RpcApi::handle_eth_get_block_transaction_count_by_hash;
    method_handlers_[json_rpc::method::k_eth_getBlockTransactionCountByNumber] = &commands::RpcApi::handle_eth_get_block_transaction_count_by_number;
    method_handlers_[json_rpc::method::k_eth_getUncleCountByBlockHash] = &commands::RpcApi::handle_eth_get_uncle_count_by_block_hash;
    method_handlers_[json_rpc::method::k_eth_getUncleCountByBlockNumber] = &commands::RpcApi::handle_eth_get_uncle_count_by_block_num;
    method_handlers_[json_rpc::method::k_eth_getTransactionByHash] = &commands::RpcApi::handle_eth_get_transaction_by_hash;
    method_handlers_[json_rpc::method::k_eth_getTransactionByBlockHashAndIndex] = &commands::RpcApi::handle_eth_get_transaction_by_block_hash_and_index;
    method_handlers_[json_rpc::method::k_eth_getTransactionByBlockNumberAndIndex] = &commands::RpcApi::handle_eth_get_transaction_by_block_num_and_index;
    method_handlers_[json_rpc::method::k_eth_getTransactionReceipt] = &commands::RpcApi::handle_eth_get_transaction_receipt;
    method_handlers_[json_rpc::method::k_eth_getUncleByBlockHashAndIndex] = &commands::RpcApi::handle_eth_get_uncle_by_block_hash_and_index;
    method_handlers_[json_rpc::method::k_eth_getUncleByBlockNumberAndIndex] = &commands::RpcApi::handle_eth_get_uncle_by_block_num_and_index;
    method_handlers_[json_rpc::method::k_eth_getLogs] = &commands::RpcApi::handle_eth_get_logs;

    immediate_handlers_[json_rpc::method::k_eth_accounts] = &commands::RpcApi::handle_eth_accounts;
}

void RpcApiTable::add_eth_write_handlers() {
    method_handlers_[json_rpc::method::k_eth_sendTransaction] = &commands::RpcApi::handle_eth_send_transaction;
    method_handlers_[json_rpc::method::k_eth_sendRawTransaction] = &commands::RpcApi::handle_eth_send_raw_transaction;
    method_handlers_[json_rpc::method::k_eth_call] = &commands::RpcApi::handle_eth_call;
    method_handlers_[json_rpc::method::k_eth_estimateGas] = &commands::RpcApi::handle_eth_estimate_gas;
}

void RpcApiTable::add_eth_mining_handlers() {
    method_handlers_[json_rpc::method::k_eth_coinbase] = &commands::RpcApi::handle_eth_coinbase;
    method_handlers_[json_rpc::method::k_eth_submitWork] = &commands::RpcApi::handle_eth_submit_work;

    immediate_handlers_[json_rpc::method::k_eth_mining] = &commands::RpcApi::handle_eth_mining;
    immediate_handlers_[json_rpc::method::k_eth_hashrate] = &commands::RpcApi::handle_eth_hashrate;
    immediate_handlers_[json_rpc::method::k_eth_submitHashrate] = &commands::RpcApi::handle_eth_submit_hashrate;
    immediate_handlers_[json_rpc::method::k_eth_getWork] = &commands::RpcApi::handle_eth_get_work;
}

}  // namespace ethrpc::rpc::commands
