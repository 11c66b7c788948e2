// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>

#include <ethrpc/devnet/daemon.hpp>
#include <ethrpc/rpc/cli/rpc_options.hpp>

using namespace ethrpc;
using namespace ethrpc::cmd::common;
using namespace ethrpc::rpc;

int main(int argc, char* argv[]) {
    CLI::App cli{"ethrpcd - Ethereum JSON RPC API over standard input and output backed by an in-memory devnet"};

    DaemonSettings settings;

    try {
        // Parse and validate program arguments
        add_rpc_options(cli, settings);
        cli.parse(argc, argv);

        return devnet::Daemon::run(settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    }
}
