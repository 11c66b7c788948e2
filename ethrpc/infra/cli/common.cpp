// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <thread>

namespace ethrpc::cmd::common {

//! CLI11 validator for an optional 20-byte hex address
struct AddressValidator : public CLI::Validator {
    AddressValidator() {
        func_ = [](const std::string& value) -> std::string {
            if (value.empty()) return {};
            static const std::regex kAddressPattern{"^0x[0-9a-fA-F]{40}$"};
            if (!std::regex_match(value, kAddressPattern)) {
                return "Value " + value + " is not a valid address";
            }
            return {};
        };
    }
};

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_etherbase(CLI::App& cli, std::string& etherbase_address) {
    cli.add_option("--etherbase", etherbase_address, "The coinbase address as hex string")
        ->check(AddressValidator{})
        ->default_val("");
}

void add_option_num_workers(CLI::App& cli, uint32_t& num_workers) {
    cli.add_option("--workers", num_workers, "Number of worker threads for blocking tasks")
        ->check(CLI::Range(1, 1024))
        ->default_val(std::max(1u, std::thread::hardware_concurrency() / 2));
}

}  // namespace ethrpc::cmd::common
