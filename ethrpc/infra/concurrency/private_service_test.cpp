// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "private_service.hpp"

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>

namespace ethrpc {

TEST_CASE("PrivateService", "[ethrpc][infra][concurrency][services]") {
    struct Counter {
        explicit Counter(int initial) : count_(initial) {}
        int count() const { return count_; }

      private:
        int count_{0};
    };
    boost::asio::io_context ioc;

    SECTION("unregistered lookup") {
        CHECK(!use_private_service<Counter>(ioc));
        CHECK_THROWS_AS(must_use_private_service<Counter>(ioc), std::logic_error);
    }
    SECTION("register then replace") {
        CHECK_NOTHROW(add_private_service<Counter>(ioc, std::make_unique<Counter>(7)));
        CHECK(must_use_private_service<Counter>(ioc)->count() == 7);
        CHECK_NOTHROW(add_private_service<Counter>(ioc, std::make_unique<Counter>(8)));
        CHECK(use_private_service<Counter>(ioc)->count() == 8);
    }
    SECTION("interface lookup requires interface registration") {
        struct Base {
            virtual ~Base() = default;
        };
        struct Derived : Base {};
        add_private_service(ioc, std::make_unique<Derived>());
        CHECK(!use_private_service<Base>(ioc));
        add_private_service<Base>(ioc, std::make_unique<Derived>());
        CHECK(use_private_service<Base>(ioc));
    }
}

}  // namespace ethrpc
