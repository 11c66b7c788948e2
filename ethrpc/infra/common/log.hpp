// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>

namespace ethrpc::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. startup banner)
    kCritical,  // An error there's no way we can recover from
    kError,     // A request or a collaborator failed
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Request parameters and collaborator outcomes
    kTrace      // Request and reply texts
};

//! ANSI escape sequences used to colorize console lines
namespace color {
    inline constexpr std::string_view kReset{"\x1b[0m"};
    inline constexpr std::string_view kCoal{"\x1b[90m"};
    inline constexpr std::string_view kWhite{"\x1b[97m"};
    inline constexpr std::string_view kRed{"\x1b[91m"};
    inline constexpr std::string_view kGreen{"\x1b[32m"};
    inline constexpr std::string_view kOrange{"\x1b[1;33m"};
    inline constexpr std::string_view kBackgroundRed{"\x1b[101m"};
    inline constexpr std::string_view kBackgroundPurple{"\x1b[105m"};
}  // namespace color

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether timestamps should include the timezone identifier
    bool log_timezone{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to trim log level
    bool log_trim{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Remove every ANSI color sequence from \p line
std::string strip_colors(std::string_view line);

//! Accumulates one log line and writes it out on destruction
class LineBuffer {
  public:
    explicit LineBuffer(Level level);
    ~LineBuffer() { flush(); }

    LineBuffer(const LineBuffer&) = delete;
    LineBuffer& operator=(const LineBuffer&) = delete;

    template <class T>
    LineBuffer& operator<<(const T& t) {
        if (enabled_) ss_ << t;
        return *this;
    }

  protected:
    void flush();

    const bool enabled_;
    std::stringstream ss_;
};

}  // namespace ethrpc::log

#define ETHRPC_LOG_LINE(level_)                 \
    if (!ethrpc::log::test_verbosity(level_)) { \
    } else                                      \
        ethrpc::log::LineBuffer(level_)

#define ETHRPC_TRACE ETHRPC_LOG_LINE(ethrpc::log::Level::kTrace)
#define ETHRPC_DEBUG ETHRPC_LOG_LINE(ethrpc::log::Level::kDebug)
#define ETHRPC_INFO ETHRPC_LOG_LINE(ethrpc::log::Level::kInfo)
#define ETHRPC_WARN ETHRPC_LOG_LINE(ethrpc::log::Level::kWarning)
#define ETHRPC_ERROR ETHRPC_LOG_LINE(ethrpc::log::Level::kError)
#define ETHRPC_CRIT ETHRPC_LOG_LINE(ethrpc::log::Level::kCritical)
#define ETHRPC_LOG ETHRPC_LOG_LINE(ethrpc::log::Level::kNone)
