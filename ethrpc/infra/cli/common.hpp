// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

#include <ethrpc/infra/common/log.hpp>

namespace ethrpc::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the node Etherbase address
void add_option_etherbase(CLI::App& cli, std::string& etherbase_address);

//! \brief Set up option for the number of worker threads used for blocking tasks
void add_option_num_workers(CLI::App& cli, uint32_t& num_workers);

}  // namespace ethrpc::cmd::common
