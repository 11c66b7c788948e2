// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "devnet_test_base.hpp"

#include <stdexcept>
#include <utility>

#include <ethash/ethash.hpp>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/crypto/ecdsa.hpp>
#include <ethrpc/rpc/common/constants.hpp>
#include <ethrpc/rpc/json/types.hpp>

namespace ethrpc::devnet::test_util {

evmc::address dev_address(size_t index) {
    const auto address{ecdsa::private_key_to_address(dev_private_key(index))};
    if (!address) {
        throw std::logic_error{"invalid devnet key"};
    }
    return *address;
}

void sign(Transaction& txn, size_t key_index) {
    const auto signature{ecdsa::sign(txn.signing_hash(), dev_private_key(key_index))};
    if (!signature) {
        throw std::logic_error{"cannot sign test transaction"};
    }
    txn.r = signature->r;
    txn.s = signature->s;
    txn.odd_y_parity = signature->odd_y_parity;
}

Transaction make_transfer(size_t key_index,
                          uint64_t nonce,
                          const evmc::address& to,
                          const intx::uint256& value,
                          std::optional<uint64_t> chain_id) {
    Transaction txn;
    txn.type = TransactionType::kLegacy;
    if (chain_id) {
        txn.chain_id = *chain_id;
    }
    txn.nonce = nonce;
    txn.max_priority_fee_per_gas = kTestGasPrice;
    txn.max_fee_per_gas = kTestGasPrice;
    txn.gas_limit = 21'000;
    txn.to = to;
    txn.value = value;
    sign(txn, key_index);
    return txn;
}

Bytes encode(const Transaction& txn) {
    Bytes encoded;
    rlp::encode(encoded, txn);
    return encoded;
}

DevnetTestBase::DevnetTestBase(DevnetOptions options)
    : chain_{add_devnet_services(ioc_, workers_, options)},
      rpc_api_{ioc_},
      rpc_api_table_{rpc::kDefaultApiSpec},
      request_handler_{rpc_api_, rpc_api_table_} {}

nlohmann::json DevnetTestBase::handle(const nlohmann::json& request) {
    const auto reply = spawn_and_wait(request_handler_.handle(request.dump()));
    return nlohmann::json::parse(reply);
}

bool DevnetTestBase::mine_block() {
    const auto work = handle(R"({"jsonrpc":"2.0","id":1,"method":"eth_getWork","params":[]})"_json);
    if (!work.contains("result")) {
        return false;
    }
    const auto header_hash{*from_hex(work["result"][0].get<std::string>())};
    const auto block_num{work["result"][3].get<std::string>()};

    const auto epoch_number{static_cast<int>(rpc::from_quantity(block_num) / ethash::epoch_length)};
    const auto context{ethash::create_epoch_context(epoch_number)};
    const uint64_t nonce{0x0102030405060708};
    const auto result{ethash::hash(*context, ethash::hash256_from_bytes(header_hash.data()), nonce)};

    const nlohmann::json request{
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"method", "eth_submitWork"},
        {"params", nlohmann::json::array({"0x0102030405060708",
                                          work["result"][0],
                                          to_hex(ByteView{result.mix_hash.bytes}, /*with_prefix=*/true)})},
    };
    const auto reply = handle(request);
    return reply.contains("result") && reply["result"] == true;
}

}  // namespace ethrpc::devnet::test_util
