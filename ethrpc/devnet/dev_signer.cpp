// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_signer.hpp"

#include <stdexcept>
#include <string>

#include <intx/intx.hpp>

#include <ethrpc/core/crypto/ecdsa.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::devnet {

Bytes dev_private_key(size_t index) {
    Bytes private_key(kHashLength, 0);
    intx::be::unsafe::store(private_key.data(), intx::uint256{index + 1});
    return private_key;
}

DevSigner::DevSigner(std::optional<uint64_t> chain_id, size_t num_accounts) : chain_id_{chain_id} {
    for (size_t i{0}; i < num_accounts; ++i) {
        auto private_key{dev_private_key(i)};
        const auto address{ecdsa::private_key_to_address(private_key)};
        if (!address) {
            throw std::runtime_error{"invalid devnet private key #" + std::to_string(i)};
        }
        accounts_.push_back(*address);
        keys_.emplace(*address, std::move(private_key));
    }
}

std::vector<evmc::address> DevSigner::accounts() const {
    return accounts_;
}

Task<std::optional<Bytes>> DevSigner::sign_transaction(const rpc::TransactionRequest& request) {
    const auto it{keys_.find(request.from)};
    if (it == keys_.end()) {
        co_return std::nullopt;
    }
    std::optional<intx::uint256> chain_id;
    if (chain_id_) {
        chain_id = *chain_id_;
    }
    Transaction txn;
    static_cast<UnsignedTransaction&>(txn) = request.to_transaction(chain_id);

    const auto signature{ecdsa::sign(txn.signing_hash(), it->second)};
    if (!signature) {
        throw std::runtime_error{"cannot sign transaction"};
    }
    txn.r = signature->r;
    txn.s = signature->s;
    txn.odd_y_parity = signature->odd_y_parity;
    txn.set_sender(request.from);

    Bytes encoded;
    rlp::encode(encoded, txn);
    ETHRPC_DEBUG << "DevSigner signed txn nonce: " << txn.nonce << " from: " << request.from;
    co_return encoded;
}

}  // namespace ethrpc::devnet
