// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "eth_read_api.hpp"

#include <string>
#include <utility>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/core/block_reader.hpp>
#include <ethrpc/rpc/core/logs_walker.hpp>
#include <ethrpc/rpc/core/receipts.hpp>
#include <ethrpc/rpc/json/types.hpp>
#include <ethrpc/rpc/protocol/errors.hpp>
#include <ethrpc/rpc/types/block.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::rpc::commands {

//! Block identifier at position index, Latest when omitted
static BlockRef block_ref_param(const nlohmann::json& params, size_t index) {
    if (params.size() <= index || params[index].is_null()) {
        return BlockRef::latest();
    }
    return parse_block_ref(params[index]);
}

// https://eth.wiki/json-rpc/API#eth_blocknumber
Task<void> EthReadApi::handle_eth_block_num(const nlohmann::json& request, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    reply = make_json_content(request, to_quantity(snapshot->head_block_num()));
}

// https://eth.wiki/json-rpc/API#eth_chainid
Task<void> EthReadApi::handle_eth_chain_id(const nlohmann::json& request, nlohmann::json& reply) {
    const auto chain_id = co_await backend_->chain_id();
    if (chain_id) {
        reply = make_json_content(request, to_quantity(*chain_id));
    } else {
        reply = make_json_content(request, nlohmann::json(nullptr));
    }
}

// https://eth.wiki/json-rpc/API#eth_protocolversion
Task<void> EthReadApi::handle_eth_protocol_version(const nlohmann::json& request, nlohmann::json& reply) {
    const auto protocol_version = co_await backend_->protocol_version();
    reply = make_json_content(request, to_quantity(protocol_version));
}

// https://eth.wiki/json-rpc/API#eth_syncing
Task<void> EthReadApi::handle_eth_syncing(const nlohmann::json& request, nlohmann::json& reply) {
    const auto sync_status = co_await backend_->sync_status();
    reply = make_json_content(request, sync_status);
}

// https://eth.wiki/json-rpc/API#eth_gasprice
Task<void> EthReadApi::handle_eth_gas_price(const nlohmann::json& request, nlohmann::json& reply) {
    const auto gas_price = co_await backend_->gas_price();
    ETHRPC_DEBUG << "gas_price: " << gas_price;
    reply = make_json_content(request, to_quantity(gas_price));
}

// https://eth.wiki/json-rpc/API#eth_accounts
void EthReadApi::handle_eth_accounts(const nlohmann::json& request, nlohmann::json& reply) {
    reply = make_json_content(request, signer_->accounts());
}

// https://eth.wiki/json-rpc/API#eth_getbalance
Task<void> EthReadApi::handle_eth_get_balance(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto address = get_param<evmc::address>(params, 0);
    const auto block_ref = block_ref_param(params, 1);
    ETHRPC_DEBUG << "address: " << address << " block_ref: " << block_ref;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);
    const auto account = co_await chain_state_->read_account(address, block);

    reply = make_json_content(request, to_quantity(account ? account->balance : intx::uint256{0}));
}

// https://eth.wiki/json-rpc/API#eth_gettransactioncount
Task<void> EthReadApi::handle_eth_get_transaction_count(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto address = get_param<evmc::address>(params, 0);
    const auto block_ref = block_ref_param(params, 1);
    ETHRPC_DEBUG << "address: " << address << " block_ref: " << block_ref;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);

    if (block_ref.is_pending()) {
        const auto pool_nonce = co_await tx_pool_->nonce(address);
        if (pool_nonce) {
            reply = make_json_content(request, to_quantity(*pool_nonce));
            co_return;
        }
    }
    const auto account = co_await chain_state_->read_account(address, block);
    reply = make_json_content(request, to_quantity(account ? account->nonce : 0));
}

// https://eth.wiki/json-rpc/API#eth_getcode
Task<void> EthReadApi::handle_eth_get_code(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto address = get_param<evmc::address>(params, 0);
    const auto block_ref = block_ref_param(params, 1);
    ETHRPC_DEBUG << "address: " << address << " block_ref: " << block_ref;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);
    const auto code = co_await chain_state_->read_code(address, block);

    reply = make_json_content(request, to_data(code ? ByteView{*code} : ByteView{}));
}

// https://eth.wiki/json-rpc/API#eth_getstorageat
Task<void> EthReadApi::handle_eth_get_storage_at(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto address = get_param<evmc::address>(params, 0);
    const auto position = get_param<intx::uint256>(params, 1);
    const auto block_ref = block_ref_param(params, 2);
    ETHRPC_DEBUG << "address: " << address << " position: " << position << " block_ref: " << block_ref;

    const auto location = intx::be::store<evmc::bytes32>(position);
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block = co_await block_reader.resolve_retained(block_ref);
    const auto value = co_await chain_state_->read_storage(address, location, block);

    reply = make_json_content(request, value.value_or(evmc::bytes32{}));
}

// https://eth.wiki/json-rpc/API#eth_getblockbyhash
Task<void> EthReadApi::handle_eth_get_block_by_hash(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_hash = get_param<evmc::bytes32>(params, 0);
    const auto full_tx = get_param<bool>(params, 1);
    ETHRPC_DEBUG << "block_hash: " << block_hash << " full_tx: " << std::boolalpha << full_tx;

    co_await get_block(request, BlockRef{block_hash}, full_tx, reply);
}

// https://eth.wiki/json-rpc/API#eth_getblockbynumber
Task<void> EthReadApi::handle_eth_get_block_by_number(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_ref = parse_block_ref(params[0]);
    const auto full_tx = get_param<bool>(params, 1);
    ETHRPC_DEBUG << "block_ref: " << block_ref << " full_tx: " << std::boolalpha << full_tx;

    co_await get_block(request, block_ref, full_tx, reply);
}

// https://eth.wiki/json-rpc/API#eth_getblocktransactioncountbyhash
Task<void> EthReadApi::handle_eth_get_block_transaction_count_by_hash(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_hash = get_param<evmc::bytes32>(request["params"], 0);
    ETHRPC_DEBUG << "block_hash: " << block_hash;

    co_await get_block_transaction_count(request, BlockRef{block_hash}, reply);
}

// https://eth.wiki/json-rpc/API#eth_getblocktransactioncountbynumber
Task<void> EthReadApi::handle_eth_get_block_transaction_count_by_number(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_ref = parse_block_ref(request["params"][0]);
    ETHRPC_DEBUG << "block_ref: " << block_ref;

    co_await get_block_transaction_count(request, block_ref, reply);
}

// https://eth.wiki/json-rpc/API#eth_getunclecountbyblockhash
Task<void> EthReadApi::handle_eth_get_uncle_count_by_block_hash(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_hash = get_param<evmc::bytes32>(request["params"], 0);
    ETHRPC_DEBUG << "block_hash: " << block_hash;

    co_await get_uncle_count(request, BlockRef{block_hash}, reply);
}

// https://eth.wiki/json-rpc/API#eth_getunclecountbyblocknumber
Task<void> EthReadApi::handle_eth_get_uncle_count_by_block_num(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_ref = parse_block_ref(request["params"][0]);
    ETHRPC_DEBUG << "block_ref: " << block_ref;

    co_await get_uncle_count(request, block_ref, reply);
}

// https://eth.wiki/json-rpc/API#eth_gettransactionbyhash
Task<void> EthReadApi::handle_eth_get_transaction_by_hash(const nlohmann::json& request, nlohmann::json& reply) {
    const auto transaction_hash = get_param<evmc::bytes32>(request["params"], 0);
    ETHRPC_DEBUG << "transaction_hash: " << transaction_hash;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto transaction = co_await block_reader.read_transaction_by_hash(transaction_hash);
    if (!transaction) {
        throw NotFoundError{"transaction " + to_hex(transaction_hash, true) + " not included"};
    }
    reply = make_json_content(request, *transaction);
}

// https://eth.wiki/json-rpc/API#eth_gettransactionbyblockhashandindex
Task<void> EthReadApi::handle_eth_get_transaction_by_block_hash_and_index(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_hash = get_param<evmc::bytes32>(params, 0);
    const auto index = quantity_from_json(params[1]);
    ETHRPC_DEBUG << "block_hash: " << block_hash << " index: " << index;

    co_await get_transaction_by_index(request, BlockRef{block_hash}, index, reply);
}

// https://eth.wiki/json-rpc/API#eth_gettransactionbyblocknumberandindex
Task<void> EthReadApi::handle_eth_get_transaction_by_block_num_and_index(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_ref = parse_block_ref(params[0]);
    const auto index = quantity_from_json(params[1]);
    ETHRPC_DEBUG << "block_ref: " << block_ref << " index: " << index;

    co_await get_transaction_by_index(request, block_ref, index, reply);
}

// https://eth.wiki/json-rpc/API#eth_gettransactionreceipt
Task<void> EthReadApi::handle_eth_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply) {
    const auto transaction_hash = get_param<evmc::bytes32>(request["params"], 0);
    ETHRPC_DEBUG << "transaction_hash: " << transaction_hash;

    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto location = co_await snapshot->read_transaction_location(transaction_hash);
    if (!location) {
        throw NotFoundError{"transaction " + to_hex(transaction_hash, true) + " not included"};
    }
    const auto block_with_hash = co_await block_reader.read_block(ResolvedBlock{.block_num = location->block_num, .block_hash = location->block_hash});
    const auto receipts = co_await core::get_receipts(*snapshot, *block_with_hash);
    if (!receipts || location->transaction_index >= receipts->size()) {
        throw NotFoundError{"receipt for transaction " + to_hex(transaction_hash, true) + " unavailable"};
    }
    reply = make_json_content(request, receipts->at(location->transaction_index));
}

// https://eth.wiki/json-rpc/API#eth_getunclebyblockhashandindex
Task<void> EthReadApi::handle_eth_get_uncle_by_block_hash_and_index(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_hash = get_param<evmc::bytes32>(params, 0);
    const auto index = quantity_from_json(params[1]);
    ETHRPC_DEBUG << "block_hash: " << block_hash << " index: " << index;

    co_await get_uncle_by_index(request, BlockRef{block_hash}, index, reply);
}

// https://eth.wiki/json-rpc/API#eth_getunclebyblocknumberandindex
Task<void> EthReadApi::handle_eth_get_uncle_by_block_num_and_index(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request["params"];
    const auto block_ref = parse_block_ref(params[0]);
    const auto index = quantity_from_json(params[1]);
    ETHRPC_DEBUG << "block_ref: " << block_ref << " index: " << index;

    co_await get_uncle_by_index(request, block_ref, index, reply);
}

// https://eth.wiki/json-rpc/API#eth_getlogs
Task<void> EthReadApi::handle_eth_get_logs(const nlohmann::json& request, nlohmann::json& reply) {
    const auto filter = get_param<Filter>(request["params"], 0);
    ETHRPC_DEBUG << "filter: " << filter;

    const auto snapshot = co_await chain_history_->open_snapshot();
    LogsWalker logs_walker{*snapshot};
    const auto [start, end] = co_await logs_walker.get_block_nums(filter);
    Logs logs;
    co_await logs_walker.get_logs(start, end, filter, logs);

    ETHRPC_DEBUG << "logs.size(): " << logs.size();
    reply = make_json_content(request, logs);
}

Task<void> EthReadApi::get_block(const nlohmann::json& request, const BlockRef& block_ref, bool full_tx, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block_with_hash = co_await block_reader.read_block(block_ref);
    const Block block{block_with_hash, full_tx};
    reply = make_json_content(request, block);
}

Task<void> EthReadApi::get_block_transaction_count(const nlohmann::json& request, const BlockRef& block_ref, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block_with_hash = co_await block_reader.read_block(block_ref);
    reply = make_json_content(request, to_quantity(block_with_hash->block.transactions.size()));
}

Task<void> EthReadApi::get_uncle_count(const nlohmann::json& request, const BlockRef& block_ref, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block_with_hash = co_await block_reader.read_block(block_ref);
    reply = make_json_content(request, to_quantity(block_with_hash->block.ommers.size()));
}

Task<void> EthReadApi::get_transaction_by_index(const nlohmann::json& request, const BlockRef& block_ref, uint64_t index, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block_with_hash = co_await block_reader.read_block(block_ref);
    const auto& transactions = block_with_hash->block.transactions;
    if (index >= transactions.size()) {
        throw NotFoundError{"transaction index " + std::to_string(index) + " out of range"};
    }
    Transaction transaction{transactions[index]};
    transaction.block_hash = block_with_hash->hash;
    transaction.block_num = block_with_hash->block.header.number;
    transaction.block_base_fee_per_gas = block_with_hash->block.header.base_fee_per_gas;
    transaction.transaction_index = index;
    reply = make_json_content(request, transaction);
}

Task<void> EthReadApi::get_uncle_by_index(const nlohmann::json& request, const BlockRef& block_ref, uint64_t index, nlohmann::json& reply) {
    const auto snapshot = co_await chain_history_->open_snapshot();
    const BlockReader block_reader{*snapshot};
    const auto block_with_hash = co_await block_reader.read_block(block_ref);
    const auto& ommers = block_with_hash->block.ommers;
    if (index >= ommers.size()) {
        throw NotFoundError{"uncle index " + std::to_string(index) + " out of range"};
    }
    const Uncle uncle{ommers[index]};
    reply = make_json_content(request, uncle);
}

}  // namespace ethrpc::rpc::commands
