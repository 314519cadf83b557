// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <ember/infra/test_util/log.hpp>

namespace ember::log {

//! Plain line settings writing to std::cout, colors stripped on flush
static Settings plain_settings(Level verbosity) {
    return Settings{
        .log_std_out = true,
        .log_nocolor = true,
        .log_verbosity = verbosity,
    };
}

TEST_CASE("Log lines honour verbosity", "[ember][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};
    std::stringstream string_cout;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    init(plain_settings(Level::kInfo));

    SECTION("levels above the configured one are dropped") {
        EMBER_DEBUG << "debug line";
        EMBER_TRACE << "trace line";
        CHECK(string_cout.str().empty());
        CHECK_FALSE(test_verbosity(Level::kDebug));
    }

    SECTION("levels up to the configured one are printed") {
        EMBER_INFO << "info line";
        EMBER_WARN << "warn line";
        EMBER_ERROR << "error line";
        const auto output{string_cout.str()};
        CHECK(absl::StrContains(output, "INFO"));
        CHECK(absl::StrContains(output, "info line"));
        CHECK(absl::StrContains(output, "WARN"));
        CHECK(absl::StrContains(output, "error line"));
    }

    SECTION("verbosity guard restores the previous level") {
        {
            test_util::SetLogVerbosityGuard guard{Level::kTrace};
            EMBER_TRACE << "traced";
        }
        CHECK(get_verbosity() == Level::kInfo);
        EMBER_TRACE << "not traced";
        CHECK(absl::StrContains(string_cout.str(), "traced"));
        CHECK_FALSE(absl::StrContains(string_cout.str(), "not traced"));
    }
}

TEST_CASE("Log arguments are printed as key-value pairs", "[ember][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};
    std::stringstream string_cout;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    init(plain_settings(Level::kInfo));

    SECTION("accumulated arguments") {
        EMBER_INFO << "Commit applied" << Args{"writes", "3", "commit_time", "5.000000000"};
        const auto output{string_cout.str()};
        CHECK(absl::StrContains(output, "Commit applied"));
        CHECK(absl::StrContains(output, "writes=3"));
        CHECK(absl::StrContains(output, "commit_time=5.000000000"));
        CHECK_FALSE(absl::StrContains(output, kColorGreen));
    }

    SECTION("constructor arguments") {
        EMBER_WARN_M("Listen target removed", {"target_id", "7"});
        CHECK(absl::StrContains(string_cout.str(), "Listen target removed"));
        CHECK(absl::StrContains(string_cout.str(), "target_id=7"));
    }
}

TEST_CASE("Log lines carry thread names on request", "[ember][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};
    std::stringstream string_cout;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    set_thread_name("ember-test");

    auto settings{plain_settings(Level::kInfo)};
    init(settings);
    EMBER_INFO << "without thread";
    CHECK_FALSE(absl::StrContains(string_cout.str(), "ember-test"));

    settings.log_threads = true;
    init(settings);
    EMBER_INFO << "with thread";
    CHECK(absl::StrContains(string_cout.str(), "[ember-test "));

    settings.log_threads = false;
    init(settings);
}

}  // namespace ember::log
