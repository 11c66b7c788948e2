// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

namespace ethrpc {

//! Every operation that may suspend on collaborator I/O returns a Task
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace ethrpc
