// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_backend.hpp"

namespace ethrpc::devnet {

Task<evmc::address> DevBackEnd::etherbase() {
    co_return etherbase_;
}

Task<uint64_t> DevBackEnd::protocol_version() {
    co_return kProtocolVersion;
}

Task<std::optional<uint64_t>> DevBackEnd::chain_id() {
    co_return chain_id_;
}

Task<intx::uint256> DevBackEnd::gas_price() {
    const auto head = chain_->head();
    co_return head->block->block.header.base_fee_per_gas.value_or(0) + kSuggestedTip;
}

Task<rpc::SyncStatus> DevBackEnd::sync_status() {
    co_return rpc::NotSyncing{};
}

}  // namespace ethrpc::devnet
