// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <ethrpc/infra/concurrency/task.hpp>

namespace ethrpc::rpc {

//! \brief Run \p fn with \p args on the \p runner executor, resuming the caller on its own executor once done
//! \details Exceptions thrown by \p fn are rethrown to the awaiting coroutine
template <typename Executor, typename F, typename... Args>
Task<std::invoke_result_t<F&, Args&...>> async_task(Executor runner, F fn, Args... args) {
    using Result = std::invoke_result_t<F&, Args&...>;
    co_return co_await boost::asio::co_spawn(
        runner,
        [fn = std::move(fn), ... args = std::move(args)]() mutable -> Task<Result> {
            co_return std::invoke(fn, args...);
        },
        boost::asio::use_awaitable);
}

}  // namespace ethrpc::rpc
