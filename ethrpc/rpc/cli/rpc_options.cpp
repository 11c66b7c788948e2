// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_options.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <numeric>
#include <string>

#include <absl/strings/str_split.h>

#include <ethrpc/infra/cli/common.hpp>
#include <ethrpc/rpc/common/constants.hpp>

namespace ethrpc::cmd::common {

//! All method groups that can be enabled
static constexpr std::array kAllApiGroups{
    kEthApiNamespace,
    kEthReadApiGroup,
    kEthWriteApiGroup,
    kEthMiningApiGroup};

//! Compute the maximum number of chars in comma-separated list of all API groups
static const size_t kApiGroupListMaxChars{
    std::accumulate(kAllApiGroups.cbegin(), kAllApiGroups.cend(), size_t{0}, [](size_t sum, auto s) {
        return sum + s.size();
    }) +
    kAllApiGroups.size() - 1};

//! CLI11 validator for JSON RPC API group specification
struct ApiSpecValidator : public CLI::Validator {
    ApiSpecValidator() {
        func_ = [](const std::string& value) -> std::string {
            if (value.size() > kApiGroupListMaxChars) {
                return "Value " + value + " is too long for valid API specification";
            }

            // Parse the entire API specification, i.e. comma-separated list of API groups
            for (const auto group : absl::StrSplit(value, ',')) {
                const auto it = std::find(kAllApiGroups.cbegin(), kAllApiGroups.cend(), std::string_view{group.data(), group.size()});
                if (it == kAllApiGroups.cend()) {
                    return "Value " + std::string{group} + " is not a valid API group";
                }
            }

            return {};
        };
    }
};

void add_rpc_options(CLI::App& cli, ethrpc::rpc::DaemonSettings& settings) {
    add_logging_options(cli, settings.log_settings);
    add_option_num_workers(cli, settings.num_workers);
    add_option_etherbase(cli, settings.etherbase);

    cli.add_option("--api", settings.eth_api_spec)
        ->description("JSON RPC API method groups as comma-separated list of strings")
        ->check(ApiSpecValidator())
        ->capture_default_str();

    cli.add_option("--rpc.gascap", settings.call_settings.gas_cap)
        ->description("Maximum gas granted to eth_call and eth_estimateGas")
        ->check(CLI::Range(uint64_t{rpc::kTxGas}, std::numeric_limits<uint64_t>::max()))
        ->capture_default_str();

    const std::map<std::string, rpc::EstimateGasRevertPolicy> revert_policy_mapping{
        {"error", rpc::EstimateGasRevertPolicy::kError},
        {"overestimate", rpc::EstimateGasRevertPolicy::kOverestimate},
    };
    cli.add_option("--rpc.estimategas.revert", settings.call_settings.estimate_gas_revert_policy)
        ->description("eth_estimateGas behaviour when execution fails for reasons other than gas: error or overestimate")
        ->transform(CLI::CheckedTransformer(revert_policy_mapping, CLI::ignore_case))
        ->default_str("error");

    cli.add_option("--chain.id", settings.chain_id)
        ->description("Chain identifier returned by eth_chainId and used for replay protection")
        ->check(CLI::PositiveNumber);

    auto& devnet_opts = *cli.add_option_group("Devnet", "In-memory development chain options");
    devnet_opts.add_option("--devnet.difficulty", settings.devnet.difficulty)
        ->description("Difficulty of the PoW jobs handed out by eth_getWork")
        ->check(CLI::Range(uint64_t{1}, std::numeric_limits<uint64_t>::max()))
        ->capture_default_str();
    devnet_opts.add_option("--devnet.gaslimit", settings.devnet.gas_limit)
        ->description("Gas limit of every devnet block")
        ->check(CLI::Range(uint64_t{rpc::kTxGas}, std::numeric_limits<uint64_t>::max()))
        ->capture_default_str();
}

}  // namespace ethrpc::cmd::common
