// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/rpc/ethbackend/signer.hpp>

namespace ethrpc::devnet {

inline constexpr size_t kDefaultNumDevAccounts{4};

//! \brief Private key of the i-th devnet account: the 32-byte big endian encoding of i + 1
Bytes dev_private_key(size_t index);

//! Signer holding the deterministic devnet keys. Without a chain id transactions are signed pre-EIP-155.
class DevSigner : public rpc::ethbackend::Signer {
  public:
    explicit DevSigner(std::optional<uint64_t> chain_id, size_t num_accounts = kDefaultNumDevAccounts);

    std::vector<evmc::address> accounts() const override;

    Task<std::optional<Bytes>> sign_transaction(const rpc::TransactionRequest& request) override;

  private:
    std::optional<uint64_t> chain_id_;
    std::vector<evmc::address> accounts_;
    std::map<evmc::address, Bytes> keys_;
};

}  // namespace ethrpc::devnet
