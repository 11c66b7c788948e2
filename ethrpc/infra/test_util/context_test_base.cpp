// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_test_base.hpp"

namespace ethrpc::test_util {

ContextTestBase::ContextTestBase()
    : ioc_{1},
      work_guard_{boost::asio::make_work_guard(ioc_)},
      context_thread_{[&]() { ioc_.run(); }} {}

ContextTestBase::~ContextTestBase() {
    work_guard_.reset();
    ioc_.stop();
    if (context_thread_.joinable()) {
        context_thread_.join();
    }
}

}  // namespace ethrpc::test_util
