// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/devnet/devnet.hpp>
#include <ethrpc/devnet/memory_chain.hpp>
#include <ethrpc/infra/test_util/context_test_base.hpp>
#include <ethrpc/rpc/commands/rpc_api.hpp>
#include <ethrpc/rpc/commands/rpc_api_table.hpp>
#include <ethrpc/rpc/common/worker_pool.hpp>
#include <ethrpc/rpc/json_rpc/request_handler.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::devnet::test_util {

inline constexpr uint64_t kTestGasPrice{2 * kGiga};

//! \brief Address of the i-th devnet account
evmc::address dev_address(size_t index);

//! \brief Sign \p txn with the key of the i-th devnet account
void sign(Transaction& txn, size_t key_index);

//! \brief Legacy value transfer signed by the i-th devnet account, paying kTestGasPrice
Transaction make_transfer(size_t key_index,
                          uint64_t nonce,
                          const evmc::address& to,
                          const intx::uint256& value,
                          std::optional<uint64_t> chain_id = std::nullopt);

Bytes encode(const Transaction& txn);

//! Matches a ResolutionError raised for \p reason
inline auto has_reason(rpc::ResolutionError::Reason reason) {
    return Catch::Matchers::Predicate<rpc::ResolutionError>(
        [=](const rpc::ResolutionError& e) { return e.reason() == reason; }, "has resolution reason " + std::string{rpc::to_string(reason)});
}

//! Full devnet node behind the JSON-RPC router, driven by request texts
class DevnetTestBase : public ethrpc::test_util::ContextTestBase {
  public:
    explicit DevnetTestBase(DevnetOptions options = {});

    nlohmann::json handle(const nlohmann::json& request);

    //! \brief Request eth_getWork and seal the returned job, the devnet difficulty must be 1
    bool mine_block();

  protected:
    rpc::WorkerPool workers_{1};
    std::shared_ptr<MemoryChain> chain_;
    rpc::commands::RpcApi rpc_api_;
    rpc::commands::RpcApiTable rpc_api_table_;
    rpc::json_rpc::RequestHandler request_handler_;
};

}  // namespace ethrpc::devnet::test_util
