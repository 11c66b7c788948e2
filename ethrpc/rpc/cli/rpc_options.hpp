// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <ethrpc/rpc/settings.hpp>

namespace ethrpc::cmd::common {

void add_rpc_options(CLI::App& cli, ethrpc::rpc::DaemonSettings& settings);

}  // namespace ethrpc::cmd::common
