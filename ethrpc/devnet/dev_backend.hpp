// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/ethbackend/backend.hpp>

namespace ethrpc::devnet {

//! Version of the eth wire protocol reported by the devnet node
inline constexpr uint64_t kProtocolVersion{68};

//! Priority fee suggested on top of the head base fee
inline constexpr uint64_t kSuggestedTip{kGiga};

class DevBackEnd : public rpc::ethbackend::BackEnd {
  public:
    DevBackEnd(std::shared_ptr<MemoryChain> chain, const evmc::address& etherbase, std::optional<uint64_t> chain_id)
        : chain_{std::move(chain)}, etherbase_{etherbase}, chain_id_{chain_id} {}

    Task<evmc::address> etherbase() override;
    Task<uint64_t> protocol_version() override;
    Task<std::optional<uint64_t>> chain_id() override;
    Task<intx::uint256> gas_price() override;

    //! The devnet produces its own blocks, so it is never syncing
    Task<rpc::SyncStatus> sync_status() override;

  private:
    std::shared_ptr<MemoryChain> chain_;
    evmc::address etherbase_;
    std::optional<uint64_t> chain_id_;
};

}  // namespace ethrpc::devnet
