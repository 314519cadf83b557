// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <ember/infra/common/terminal.hpp>

namespace ember::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Plain line with no severity (e.g. tool banners)
    kCritical,  // The service cannot continue
    kError,     // An operation failed and the failure was reported to the caller
    kWarning,   // Something unusual the operator may want to look at
    kInfo,      // Regular operations (commits, stream lifecycle)
    kDebug,     // Per request details
    kTrace      // Per message details on streams
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps are in UTC or in the local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Copy every log line to this file (colors are disabled when set)
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \throws std::runtime_error if the log file cannot be opened
//! \note Not thread safe: call at process start or from tests
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note Not thread safe: call at process start or from tests
void set_verbosity(Level level);

//! \brief Sets the name shown for this thread when thread names are enabled
void set_thread_name(const char* name);

//! \brief Returns the name set for this thread or its id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! Alternating keys and values appended to a log line as key=value pairs
using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        for (size_t i{0}; i + 1 < args.size(); i += 2) {
            ss_ << paint(kColorGreen) << args[i] << paint(kColorReset) << "=" << paint(kColorWhite) << args[i + 1]
                << paint(kColorReset) << " ";
        }
        if (args.size() % 2 != 0) {
            ss_ << args.back();
        }
    }
    //! Escape sequence if this line is colorized, nothing otherwise
    std::string_view paint(std::string_view color) const { return colorize_ ? color : std::string_view{}; }
    void flush();

    const bool should_print_;
    const bool colorize_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace ember::log

#define EMBER_LOGBUFFER(level_, ...)           \
    if (!ember::log::test_verbosity(level_)) { \
    } else                                     \
        ember::log::LogBuffer<level_>(__VA_ARGS__)

#define EMBER_TRACE_M(...) EMBER_LOGBUFFER(ember::log::Level::kTrace, __VA_ARGS__)
#define EMBER_DEBUG_M(...) EMBER_LOGBUFFER(ember::log::Level::kDebug, __VA_ARGS__)
#define EMBER_INFO_M(...) EMBER_LOGBUFFER(ember::log::Level::kInfo, __VA_ARGS__)
#define EMBER_WARN_M(...) EMBER_LOGBUFFER(ember::log::Level::kWarning, __VA_ARGS__)
#define EMBER_ERROR_M(...) EMBER_LOGBUFFER(ember::log::Level::kError, __VA_ARGS__)
#define EMBER_CRIT_M(...) EMBER_LOGBUFFER(ember::log::Level::kCritical, __VA_ARGS__)
#define EMBER_LOG_M(...) EMBER_LOGBUFFER(ember::log::Level::kNone, __VA_ARGS__)

#define EMBER_TRACE EMBER_TRACE_M()
#define EMBER_DEBUG EMBER_DEBUG_M()
#define EMBER_INFO EMBER_INFO_M()
#define EMBER_WARN EMBER_WARN_M()
#define EMBER_ERROR EMBER_ERROR_M()
#define EMBER_CRIT EMBER_CRIT_M()
#define EMBER_LOG EMBER_LOG_M()
