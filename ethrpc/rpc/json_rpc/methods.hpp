// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace ethrpc::rpc::json_rpc::method {

inline constexpr const char* k_eth_blockNumber{"eth_blockNumber"};
inline constexpr const char* k_eth_chainId{"eth_chainId"};
inline constexpr const char* k_eth_protocolVersion{"eth_protocolVersion"};
inline constexpr const char* k_eth_syncing{"eth_syncing"};
inline constexpr const char* k_eth_gasPrice{"eth_gasPrice"};
inline constexpr const char* k_eth_accounts{"eth_accounts"};
inline constexpr const char* k_eth_getBalance{"eth_getBalance"};
inline constexpr const char* k_eth_getTransactionCount{"eth_getTransactionCount"};
inline constexpr const char* k_eth_getCode{"eth_getCode"};
inline constexpr const char* k_eth_getStorageAt{"eth_getStorageAt"};
inline constexpr const char* k_eth_getBlockByHash{"eth_getBlockByHash"};
inline constexpr const char* k_eth_getBlockByNumber{"eth_getBlockByNumber"};
inline constexpr const char* k_eth_getBlockTransactionCountByHash{"eth_getBlockTransactionCountByHash"};
inline constexpr const char* k_eth_getBlockTransactionCountByNumber{"eth_getBlockTransactionCountByNumber"};
inline constexpr const char* k_eth_getUncleCountByBlockHash{"eth_getUncleCountByBlockHash"};
inline constexpr const char* k_eth_getUncleCountByBlockNumber{"eth_getUncleCountByBlockNumber"};
inline constexpr const char* k_eth_getTransactionByHash{"eth_getTransactionByHash"};
inline constexpr const char* k_eth_getTransactionByBlockHashAndIndex{"eth_getTransactionByBlockHashAndIndex"};
inline constexpr const char* k_eth_getTransactionByBlockNumberAndIndex{"eth_getTransactionByBlockNumberAndIndex"};
inline constexpr const char* k_eth_getTransactionReceipt{"eth_getTransactionReceipt"};
inline constexpr const char* k_eth_getUncleByBlockHashAndIndex{"eth_getUncleByBlockHashAndIndex"};
inline constexpr const char* k_eth_getUncleByBlockNumberAndIndex{"eth_getUncleByBlockNumberAndIndex"};
inline constexpr const char* k_eth_getLogs{"eth_getLogs"};
inline constexpr const char* k_eth_sendTransaction{"eth_sendTransaction"};
inline constexpr const char* k_eth_sendRawTransaction{"eth_sendRawTransaction"};
inline constexpr const char* k_eth_call{"eth_call"};
inline constexpr const char* k_eth_estimateGas{"eth_estimateGas"};
inline constexpr const char* k_eth_mining{"eth_mining"};
inline constexpr const char* k_eth_coinbase{"eth_coinbase"};
inline constexpr const char* k_eth_hashrate{"eth_hashrate"};
inline constexpr const char* k_eth_submitHashrate{"eth_submitHashrate"};
inline constexpr const char* k_eth_getWork{"eth_getWork"};
inline constexpr const char* k_eth_submitWork{"eth_submitWork"};

}  // namespace ethrpc::rpc::json_rpc::method
