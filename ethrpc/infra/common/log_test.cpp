// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <ethrpc/infra/test_util/log.hpp>

namespace ethrpc::log {

//! LineBuffer exposing its buffered content
class LineBufferForTest : public LineBuffer {
  public:
    explicit LineBufferForTest(Level level) : LineBuffer{level} {}

    std::string content() const { return ss_.str(); }
};

TEST_CASE("strip_colors", "[ethrpc][infra][log]") {
    CHECK(strip_colors("") == "");
    CHECK(strip_colors("plain line") == "plain line");
    CHECK(strip_colors(std::string{color::kGreen} + "INFO" + std::string{color::kReset} + " done") == "INFO done");
    CHECK(strip_colors(std::string{color::kOrange} + "x") == "x");
    CHECK(strip_colors("\x1b[12") == "\x1b[12");
}

TEST_CASE("LineBuffer", "[ethrpc][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Temporarily override std::cout and std::cerr with string streams to avoid terminal output
    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    const Settings settings{.log_verbosity = Level::kInfo};
    init(settings);

    SECTION("levels above the configured verbosity are discarded") {
        for (const auto level : {Level::kDebug, Level::kTrace}) {
            LineBufferForTest buffer{level};
            buffer << "test";
            CHECK(buffer.content().empty());
        }
        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        LineBufferForTest buffer{Level::kInfo};
        buffer << "test";
        CHECK(buffer.content().empty());
    }

    SECTION("levels up to the configured verbosity are kept") {
        for (const auto level : {Level::kNone, Level::kError, Level::kInfo}) {
            LineBufferForTest buffer{level};
            buffer << "test " << 42;
            CHECK(absl::StrContains(buffer.content(), "test 42"));
        }
    }

    SECTION("thread names are printed on request") {
        init(Settings{.log_threads = true, .log_verbosity = Level::kInfo});
        LineBufferForTest buffer{Level::kInfo};
        CHECK(absl::StrContains(buffer.content(), get_thread_name()));
        init(settings);
    }

    SECTION("macros skip disabled levels") {
        ETHRPC_DEBUG << "hidden line";
        ETHRPC_INFO << "visible line";
        CHECK(!absl::StrContains(string_cerr.str(), "hidden line"));
        CHECK(absl::StrContains(string_cerr.str(), "visible line"));
        CHECK(string_cout.str().empty());
    }

    SECTION("console output can be moved to standard output") {
        init(Settings{.log_std_out = true, .log_verbosity = Level::kInfo});
        ETHRPC_WARN << "to stdout";
        init(settings);
        CHECK(absl::StrContains(string_cout.str(), "to stdout"));
        CHECK(!absl::StrContains(string_cerr.str(), "to stdout"));
    }

    SECTION("log file receives uncolored lines") {
        const auto temp_file{std::filesystem::temp_directory_path() / "ethrpc_log_test.log"};
        std::filesystem::remove(temp_file);
        init(Settings{.log_verbosity = Level::kInfo, .log_file = temp_file.string()});
        ETHRPC_INFO << "teed line";
        init(settings);

        std::ifstream log_file{temp_file};
        std::stringstream file_content;
        file_content << log_file.rdbuf();
        CHECK(absl::StrContains(file_content.str(), "teed line"));
        CHECK(!absl::StrContains(file_content.str(), color::kReset));
        log_file.close();
        std::filesystem::remove(temp_file);
    }

    SECTION("unwritable log file is rejected") {
        CHECK_THROWS_AS(tee_file("/nonexistent-dir/ethrpc.log"), std::runtime_error);
    }
}

}  // namespace ethrpc::log
