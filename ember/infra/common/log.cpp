// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace ember::log {

namespace {

    //! Thread names are padded or cut to this size so that columns line up
    constexpr size_t kThreadNameSize = 11;

    struct State {
        Settings settings;
        bool colorize{false};
        absl::TimeZone time_zone{absl::UTCTimeZone()};
        std::unique_ptr<std::ofstream> file;
    };

    State state_{};
    std::mutex out_mutex_;
    thread_local std::string thread_name_;

    std::unique_ptr<std::ofstream> open_log_file(const std::string& path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
        if (!file->is_open()) {
            throw std::runtime_error{"Could not open log file " + path};
        }
        return file;
    }

    //! Fixed width tag and color for each level
    std::pair<std::string_view, std::string_view> level_tag(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kWarning:
                return {" WARN", kColorOrangeHigh};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            default:
                return {"     ", kColorReset};
        }
    }

}  // namespace

void init(const Settings& settings) {
    State state{.settings = settings};
    if (!settings.log_file.empty()) {
        state.file = open_log_file(settings.log_file);
    }
    const bool is_terminal{settings.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    // Escape sequences never reach the log file
    state.colorize = is_terminal && !settings.log_nocolor && !state.file;
    state.time_zone = settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone();

    std::scoped_lock lock{out_mutex_};
    state_ = std::move(state);
}

Level get_verbosity() { return state_.settings.log_verbosity; }

void set_verbosity(Level level) { state_.settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= state_.settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameSize, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name_ = id.str();
    }
    return thread_name_;
}

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)), colorize_(state_.colorize) {
    if (!should_print_) return;

    const auto [tag, color] = level_tag(level);
    ss_ << " " << paint(color) << tag << paint(kColorReset) << " ";
    ss_ << paint(kColorWhite) << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), state_.time_zone) << "] "
        << paint(kColorReset);
    if (state_.settings.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock lock{out_mutex_};
    auto& out = state_.settings.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (state_.file) {
        *state_.file << line << '\n';
    }
}

}  // namespace ember::log
