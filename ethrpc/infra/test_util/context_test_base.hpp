// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/infra/concurrency/spawn.hpp>
#include <ethrpc/infra/test_util/log.hpp>

namespace ethrpc::test_util {

//! Runs one io_context on a dedicated thread so that tests can drive coroutines to completion
class ContextTestBase {
  public:
    ContextTestBase();

    template <typename AwaitableOrFunction>
    auto spawn(AwaitableOrFunction&& awaitable) {
        return concurrency::spawn_future(ioc_, std::forward<AwaitableOrFunction>(awaitable));
    }

    template <typename AwaitableOrFunction>
    auto spawn_and_wait(AwaitableOrFunction&& awaitable) {
        return spawn(std::forward<AwaitableOrFunction>(awaitable)).get();
    }

    static void sleep_for(std::chrono::milliseconds sleep_time_ms) {
        std::this_thread::sleep_for(sleep_time_ms);
    }

    ~ContextTestBase();

  protected:
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread context_thread_;
};

}  // namespace ethrpc::test_util
