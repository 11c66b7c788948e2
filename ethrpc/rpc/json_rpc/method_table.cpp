// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "method_table.hpp"

#include <algorithm>
#include <array>

#include <ethrpc/rpc/common/constants.hpp>
#include <ethrpc/rpc/json_rpc/methods.hpp>

namespace ethrpc::rpc::json_rpc {

using enum ResultKind;
using enum DispatchMode;

static constexpr std::array kMethodTable{
    // eth.read: node facts
    MethodTraits{method::k_eth_blockNumber, kEthReadApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_chainId, kEthReadApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_protocolVersion, kEthReadApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_syncing, kEthReadApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_gasPrice, kEthReadApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_accounts, kEthReadApiGroup, kRequired, kImmediate, 0, 0},
    // eth.read: account state
    MethodTraits{method::k_eth_getBalance, kEthReadApiGroup, kRequired, kSuspending, 1, 2},
    MethodTraits{method::k_eth_getTransactionCount, kEthReadApiGroup, kRequired, kSuspending, 1, 2},
    MethodTraits{method::k_eth_getCode, kEthReadApiGroup, kRequired, kSuspending, 1, 2},
    MethodTraits{method::k_eth_getStorageAt, kEthReadApiGroup, kRequired, kSuspending, 2, 3},
    // eth.read: blocks and transactions
    MethodTraits{method::k_eth_getBlockByHash, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getBlockByNumber, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getBlockTransactionCountByHash, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getBlockTransactionCountByNumber, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getUncleCountByBlockHash, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getUncleCountByBlockNumber, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getTransactionByHash, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getTransactionByBlockHashAndIndex, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getTransactionByBlockNumberAndIndex, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getTransactionReceipt, kEthReadApiGroup, kOptional, kSuspending, 1, 1},
    MethodTraits{method::k_eth_getUncleByBlockHashAndIndex, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getUncleByBlockNumberAndIndex, kEthReadApiGroup, kOptional, kSuspending, 2, 2},
    MethodTraits{method::k_eth_getLogs, kEthReadApiGroup, kRequired, kSuspending, 1, 1},
    // eth.write
    MethodTraits{method::k_eth_sendTransaction, kEthWriteApiGroup, kRequired, kSuspending, 1, 1},
    MethodTraits{method::k_eth_sendRawTransaction, kEthWriteApiGroup, kRequired, kSuspending, 1, 1},
    MethodTraits{method::k_eth_call, kEthWriteApiGroup, kRequired, kSuspending, 1, 2},
    MethodTraits{method::k_eth_estimateGas, kEthWriteApiGroup, kRequired, kSuspending, 1, 2},
    // eth.mining
    MethodTraits{method::k_eth_mining, kEthMiningApiGroup, kRequired, kImmediate, 0, 0},
    MethodTraits{method::k_eth_coinbase, kEthMiningApiGroup, kRequired, kSuspending, 0, 0},
    MethodTraits{method::k_eth_hashrate, kEthMiningApiGroup, kRequired, kImmediate, 0, 0},
    MethodTraits{method::k_eth_submitHashrate, kEthMiningApiGroup, kRequired, kImmediate, 2, 2},
    MethodTraits{method::k_eth_getWork, kEthMiningApiGroup, kRequired, kImmediate, 0, 0},
    MethodTraits{method::k_eth_submitWork, kEthMiningApiGroup, kRequired, kSuspending, 3, 3},
};

std::span<const MethodTraits> method_table() {
    return kMethodTable;
}

const MethodTraits* find_method(std::string_view name) {
    const auto it = std::find_if(kMethodTable.begin(), kMethodTable.end(), [&](const auto& traits) { return traits.name == name; });
    return it != kMethodTable.end() ? &*it : nullptr;
}

}  // namespace ethrpc::rpc::json_rpc
