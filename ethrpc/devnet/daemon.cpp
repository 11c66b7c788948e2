// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/process/environment.hpp>

#include <ethrpc/core/types/address.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/infra/concurrency/spawn.hpp>

namespace ethrpc::devnet {

DevnetOptions make_devnet_options(const rpc::DaemonSettings& settings) {
    DevnetOptions options{
        .chain_id = settings.chain_id,
        .difficulty = settings.devnet.difficulty,
        .gas_limit = settings.devnet.gas_limit,
    };
    if (!settings.etherbase.empty()) {
        const auto etherbase{hex_to_address(settings.etherbase)};
        if (!etherbase) {
            throw std::invalid_argument{"invalid etherbase: " + settings.etherbase};
        }
        options.etherbase = *etherbase;
    }
    return options;
}

int Daemon::run(const rpc::DaemonSettings& settings) {
    // Standard output carries the replies
    auto log_settings{settings.log_settings};
    const bool log_std_out_requested{log_settings.log_std_out};
    log_settings.log_std_out = false;
    log::init(log_settings);
    log::set_thread_name("main-thread");
    if (log_std_out_requested) {
        ETHRPC_WARN << "Console logging kept on standard error, standard output is reserved for replies";
    }

    std::set_terminate([]() {
        try {
            auto exc = std::current_exception();
            if (exc) {
                std::rethrow_exception(exc);
            }
        } catch (const std::exception& e) {
            ETHRPC_CRIT << "ethrpcd terminating due to exception: " << e.what();
        }
        std::abort();
    });

    const auto pid = boost::this_process::get_id();
    const auto tid = std::this_thread::get_id();

    int exit_code{0};
    try {
        ETHRPC_INFO << "ethrpcd launched using " << settings.num_workers << " workers, API spec: " << settings.eth_api_spec;

        Daemon daemon{settings};

        ETHRPC_LOG << "ethrpcd is now serving requests from standard input [pid=" << pid << ", main thread=" << tid << "]";

        const auto num_requests = daemon.serve(std::cin, std::cout);

        ETHRPC_INFO << "Standard input closed after " << num_requests << " requests";
    } catch (const std::exception& e) {
        ETHRPC_CRIT << "Exception: " << e.what();
        exit_code = -1;
    }

    ETHRPC_LOG << "ethrpcd exiting [pid=" << pid << ", main thread=" << tid << "]";

    return exit_code;
}

Daemon::Daemon(const rpc::DaemonSettings& settings)
    : work_guard_{boost::asio::make_work_guard(ioc_)},
      workers_{std::max(settings.num_workers, uint32_t{1})},
      chain_{add_devnet_services(ioc_, workers_, make_devnet_options(settings))},
      rpc_api_{ioc_, settings.call_settings},
      rpc_api_table_{settings.eth_api_spec},
      request_handler_{rpc_api_, rpc_api_table_},
      context_thread_{[&]() {
          log::set_thread_name("rpc-context");
          ioc_.run();
      }} {}

Daemon::~Daemon() {
    work_guard_.reset();
    ioc_.stop();
    if (context_thread_.joinable()) {
        context_thread_.join();
    }
    workers_.stop();
    workers_.join();
}

std::string Daemon::handle(const std::string& request) {
    return concurrency::spawn_future_and_wait(ioc_, request_handler_.handle(request));
}

size_t Daemon::serve(std::istream& in, std::ostream& out) {
    size_t num_requests{0};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        ETHRPC_TRACE << "Request: " << line;
        const auto reply = handle(line);
        ETHRPC_TRACE << "Reply: " << reply;
        out << reply << '\n'
            << std::flush;
        ++num_requests;
    }
    return num_requests;
}

}  // namespace ethrpc::devnet
