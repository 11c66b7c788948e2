// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <unistd.h>

namespace ethrpc::log {

//! The fixed size for thread name in log traces
static constexpr size_t kThreadNameFixedSize{11};

struct LevelStyle {
    std::string_view tag;
    std::string_view color;
};

//! Indexed by Level
static constexpr std::array<LevelStyle, 7> kLevelStyles{{
    {"     ", color::kReset},
    {" CRIT", color::kBackgroundRed},
    {"ERROR", color::kRed},
    {" WARN", color::kOrange},
    {" INFO", color::kGreen},
    {"DEBUG", color::kBackgroundPurple},
    {"TRACE", color::kCoal},
}};

static Settings settings_{};
static std::mutex out_mutex_;
static std::unique_ptr<std::ofstream> file_;
static bool console_is_terminal_{false};
thread_local std::string thread_name_;

void init(const Settings& settings) {
    settings_ = settings;
    if (settings_.log_file.empty()) {
        file_.reset();
    } else {
        tee_file(settings_.log_file);
    }
    console_is_terminal_ = ::isatty(::fileno(settings_.log_std_out ? stdout : stderr)) != 0;
    if (!console_is_terminal_) {
        settings_.log_nocolor = true;
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        throw std::runtime_error{"Could not open log file " + path.string()};
    }
    file_ = std::move(file);
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name_ = id.str();
    }
    return thread_name_;
}

std::string strip_colors(std::string_view line) {
    std::string stripped;
    stripped.reserve(line.size());
    for (size_t i{0}; i < line.size(); ++i) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            // CSI sequence: parameters up to the final 'm'
            const auto end{line.find('m', i + 2)};
            if (end != std::string_view::npos) {
                i = end;
                continue;
            }
        }
        stripped.push_back(line[i]);
    }
    return stripped;
}

LineBuffer::LineBuffer(Level level) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;

    const auto& style{kLevelStyles.at(static_cast<size_t>(level))};

    // Level
    if (settings_.log_trim) {
        const auto tag{absl::StripAsciiWhitespace(absl::string_view{style.tag.data(), style.tag.size()}).substr(0, 4)};
        ss_ << color::kReset << (console_is_terminal_ ? "" : "[") << style.color << tag << color::kReset
            << (console_is_terminal_ ? "" : "] ");
    } else {
        ss_ << color::kReset << " " << style.color << style.tag << color::kReset << " ";
    }

    // Timestamp
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << color::kWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz)
        << (settings_.log_timezone ? " " + tz.name() : "") << "] " << color::kReset;

    // Thread
    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

void LineBuffer::flush() {
    if (!enabled_) return;

    const std::string line{settings_.log_nocolor ? strip_colors(ss_.str()) : ss_.str()};

    std::scoped_lock lock{out_mutex_};
    (settings_.log_std_out ? std::cout : std::cerr) << line << '\n';
    if (file_) {
        *file_ << (settings_.log_nocolor ? line : strip_colors(line)) << '\n';
    }
}

}  // namespace ethrpc::log
