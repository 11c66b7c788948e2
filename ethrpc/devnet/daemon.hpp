// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <ethrpc/devnet/devnet.hpp>
#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/rpc/commands/rpc_api.hpp>
#include <ethrpc/rpc/commands/rpc_api_table.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>
#include <ethrpc/rpc/json_rpc/request_handler.hpp>
#include <ethrpc/rpc/settings.hpp>

namespace ethrpc::devnet {

//! \brief Translate the command-line settings into the devnet options
//! \throws std::invalid_argument if the etherbase is not a valid address
DevnetOptions make_devnet_options(const rpc::DaemonSettings& settings);

//! JSON RPC daemon serving the Ethereum API on top of an in-memory devnet
class Daemon {
  public:
    static int run(const rpc::DaemonSettings& settings);

    explicit Daemon(const rpc::DaemonSettings& settings);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    //! \brief Handle every newline-delimited request read from \p in writing one reply line per request to \p out
    //! \return the number of handled requests
    size_t serve(std::istream& in, std::ostream& out);

    //! Handle one request text and return the reply text
    std::string handle(const std::string& request);

    const std::shared_ptr<MemoryChain>& chain() const { return chain_; }

  private:
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    rpc::WorkerPool workers_;
    std::shared_ptr<MemoryChain> chain_;
    rpc::commands::RpcApi rpc_api_;
    rpc::commands::RpcApiTable rpc_api_table_;
    rpc::json_rpc::RequestHandler request_handler_;
    std::thread context_thread_;
};

}  // namespace ethrpc::devnet
