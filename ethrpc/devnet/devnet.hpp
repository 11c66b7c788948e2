// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/devnet/dev_signer.hpp>
#include <ethrpc/devnet/genesis.hpp>
#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>

namespace ethrpc::devnet {

//! Genesis balance of every devnet account
inline constexpr uint64_t kDefaultAccountBalance{10 * kEther};

struct DevnetOptions {
    std::optional<uint64_t> chain_id;
    evmc::address etherbase{};  // zero means the first devnet account
    intx::uint256 difficulty{kDefaultGenesisDifficulty};
    uint64_t gas_limit{kDefaultGenesisGasLimit};
    size_t num_accounts{kDefaultNumDevAccounts};
    intx::uint256 account_balance{kDefaultAccountBalance};
};

//! \brief Genesis funding every devnet account with the configured balance
GenesisSpec make_dev_genesis(const DevnetOptions& options);

//! \brief Register the devnet implementation of every collaborator as a private service of \p ioc
//! \return the chain store shared by the registered services
std::shared_ptr<MemoryChain> add_devnet_services(boost::asio::io_context& ioc, rpc::WorkerPool& workers, const DevnetOptions& options);

}  // namespace ethrpc::devnet
