// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "eth_write_api.hpp"

#include <algorithm>
#include <string>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/decode.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/core/block_reader.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/protocol/errors.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc::commands {

static BlockRef block_ref_param(const nlohmann::json& params, size_t index) {
    if (params.size() <= index || params[index].is_null()) {
        return BlockRef::latest();
    }
    return parse_block_ref(params[index]);
}

static evmc::bytes32 transaction_hash(ByteView rlp_tx) {
    const auto hash{keccak256(rlp_tx)};
    return to_bytes32({hash.bytes, kHashLength});
}

// https://eth.wiki/json-rpc/API#eth_sendtransaction
Task<void> EthWriteApi::handle_eth_send_transaction(const nlohmann::json& request, nlohmann::json& reply) {
    auto tx_request = get_param<TransactionRequest>(request["params"], 0);
    ETHRPC_DEBUG << "request: " << tx_request;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto latest_block = co_await block_reader.resolve(BlockRef::latest());

    if (!tx_request.nonce) {
        const auto pool_nonce = co_await tx_pool_->nonce(tx_request.from);
        if (pool_nonce) {
            tx_request.nonce = *pool_nonce;
        } else {
            const auto account = co_await chain_state_->read_account(tx_request.from, latest_block);
            tx_request.nonce = account ? account->nonce : 0;
        }
    }
    if (!tx_request.gas_price && !tx_request.max_fee_per_gas) {
        tx_request.gas_price = co_await backend_->gas_price();
    }
    if (!tx_request.gas) {
        const auto block_with_hash = co_await block_reader.read_block(latest_block);
        EstimateGasOracle estimate_gas_oracle{*executor_, *chain_state_, settings_.gas_cap, settings_.estimate_gas_revert_policy};
        tx_request.gas = co_await estimate_gas_oracle.estimate_gas(tx_request.to_call(), latest_block, block_with_hash->block.header.gas_limit);
    }

    const auto signed_tx = co_await signer_->sign_transaction(tx_request);
    if (!signed_tx) {
        const auto error_msg = "unknown account: " + address_to_hex(tx_request.from);
        ETHRPC_ERROR << error_msg;
        reply = make_json_error(request, kServerError, error_msg);
        co_return;
    }

    const auto result = co_await tx_pool_->add_transaction(*signed_tx);
    if (!result.success) {
        ETHRPC_ERROR << "cannot add transaction: " << result.error_descr;
        reply = make_json_error(request, kServerError, result.error_descr);
        co_return;
    }

    const auto hash = transaction_hash(*signed_tx);
    ETHRPC_DEBUG << "submitted transaction hash: " << hash << " from: " << tx_request.from << " nonce: " << *tx_request.nonce;
    reply = make_json_content(request, hash);
}

// https://eth.wiki/json-rpc/API#eth_sendrawtransaction
Task<void> EthWriteApi::handle_eth_send_raw_transaction(const nlohmann::json& request, nlohmann::json& reply) {
    const auto encoded_tx = bytes_from_json(request["params"][0]);
    if (const auto decoding_result{rlp::validate_transaction_envelope(encoded_tx)}; !decoding_result) {
        throw InvalidParamsError{std::string{"invalid eth_sendRawTransaction encoded tx: "} + to_string(decoding_result.error())};
    }

    const auto result = co_await tx_pool_->add_transaction(encoded_tx);
    if (!result.success) {
        ETHRPC_ERROR << "cannot add transaction: " << result.error_descr;
        reply = make_json_error(request, kServerError, result.error_descr);
        co_return;
    }

    const auto hash = transaction_hash(encoded_tx);
    ETHRPC_DEBUG << "submitted raw transaction hash: " << hash << " size: " << encoded_tx.size();
    reply = make_json_content(request, hash);
}

// https://eth.wiki/json-rpc/API#eth_call
Task<void> EthWriteApi::handle_eth_call(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto call = get_param<Call>(params, 0);
    const auto block_ref = block_ref_param(params, 1);
    ETHRPC_DEBUG << "call: " << call << " block_ref: " << block_ref;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);
    const auto block_with_hash = co_await block_reader.read_block(block);

    uint64_t gas_limit = call.gas.value_or(block_with_hash->block.header.gas_limit);
    if (gas_limit > settings_.gas_cap) {
        ETHRPC_WARN << "caller gas above allowance, capping: requested " << gas_limit << ", cap " << settings_.gas_cap;
        gas_limit = settings_.gas_cap;
    }

    const auto result = co_await executor_->execute(block, call, gas_limit);
    if (result.pre_check_error) {
        ETHRPC_DEBUG << "pre-check error: " << *result.pre_check_error;
        throw ExecutionError{kServerError, *result.pre_check_error};
    }
    if (!result.success()) {
        ETHRPC_DEBUG << "call failed: " << result.error_message() << ", returning output as result";
    }
    reply = make_json_content(request, to_data(result.data));
}

// https://eth.wiki/json-rpc/API#eth_estimategas
Task<void> EthWriteApi::handle_eth_estimate_gas(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto call = get_param<Call>(params, 0);
    const auto block_ref = block_ref_param(params, 1);
    ETHRPC_DEBUG << "call: " << call << " block_ref: " << block_ref;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);
    const auto block_with_hash = co_await block_reader.read_block(block);

    EstimateGasOracle estimate_gas_oracle{*executor_, *chain_state_, settings_.gas_cap, settings_.estimate_gas_revert_policy};
    const auto estimated_gas = co_await estimate_gas_oracle.estimate_gas(call, block, block_with_hash->block.header.gas_limit);

    reply = make_json_content(request, to_quantity(estimated_gas));
}

}  // namespace ethrpc::rpc::commands
