// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <ethrpc/devnet/test_util/devnet_test_base.hpp>
#include <ethrpc/infra/test_util/log.hpp>

namespace ethrpc::devnet {

using evmc::literals::operator""_address;

static rpc::DaemonSettings make_settings() {
    rpc::DaemonSettings settings;
    settings.num_workers = 1;
    settings.chain_id = 1337;
    settings.devnet.difficulty = 1;
    return settings;
}

static std::vector<nlohmann::json> read_replies(const std::string& output) {
    std::vector<nlohmann::json> replies;
    std::istringstream stream{output};
    std::string line;
    while (std::getline(stream, line)) {
        replies.push_back(nlohmann::json::parse(line));
    }
    return replies;
}

TEST_CASE("make_devnet_options", "[devnet][daemon]") {
    auto settings{make_settings()};

    SECTION("default etherbase") {
        const auto options{make_devnet_options(settings)};
        CHECK(options.chain_id == 1337);
        CHECK(options.difficulty == 1);
        CHECK(options.gas_limit == rpc::kDefaultDevnetGasLimit);
        CHECK(!options.etherbase);
    }

    SECTION("explicit etherbase") {
        settings.etherbase = "0x00000000000000000000000000000000000000aa";
        const auto options{make_devnet_options(settings)};
        CHECK(options.etherbase == evmc::address{0x00000000000000000000000000000000000000aa_address});
    }

    SECTION("invalid etherbase") {
        settings.etherbase = "0x1234";
        CHECK_THROWS_AS(make_devnet_options(settings), std::invalid_argument);
    }
}

TEST_CASE("Daemon::serve", "[devnet][daemon]") {
    ethrpc::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Daemon daemon{make_settings()};

    SECTION("one reply line per request line") {
        std::istringstream in{
            R"({"jsonrpc":"2.0","id":1,"method":"eth_chainId","params":[]})"
            "\n\n"
            R"({"jsonrpc":"2.0","id":2,"method":"eth_blockNumber","params":[]})"
            "\r\n"};
        std::ostringstream out;
        CHECK(daemon.serve(in, out) == 2);

        const auto replies{read_replies(out.str())};
        REQUIRE(replies.size() == 2);
        CHECK(replies[0] == R"({"jsonrpc":"2.0","id":1,"result":"0x539"})"_json);
        CHECK(replies[1] == R"({"jsonrpc":"2.0","id":2,"result":"0x0"})"_json);
    }

    SECTION("malformed line gets a parse error reply") {
        std::istringstream in{"{not json\n"};
        std::ostringstream out;
        CHECK(daemon.serve(in, out) == 1);

        const auto replies{read_replies(out.str())};
        REQUIRE(replies.size() == 1);
        CHECK(replies[0]["id"].is_null());
        CHECK(replies[0]["error"]["code"] == -32700);
    }

    SECTION("unknown method") {
        const auto reply = nlohmann::json::parse(daemon.handle(R"({"jsonrpc":"2.0","id":"a","method":"net_version","params":[]})"));
        CHECK(reply["id"] == "a");
        CHECK(reply["error"]["code"] == -32601);
    }

    SECTION("served requests share the chain") {
        std::istringstream in{R"({"jsonrpc":"2.0","id":1,"method":"eth_getWork","params":[]})"
                              "\n"};
        std::ostringstream out;
        CHECK(daemon.serve(in, out) == 1);
        const auto replies{read_replies(out.str())};
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0].contains("result"));
        CHECK(replies[0]["result"][3] == "0x1");
        CHECK(daemon.chain()->data()->pending != nullptr);
    }
}

}  // namespace ethrpc::devnet
