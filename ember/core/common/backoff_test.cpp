// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "backoff.hpp"

#include <catch2/catch.hpp>

#include <ember/core/common/status.hpp>
#include <ember/infra/test_util/task_runner.hpp>

namespace ember {

using std::chrono::milliseconds;

TEST_CASE("ExponentialBackoff without jitter", "[ember][core][backoff]") {
    ExponentialBackoff backoff{{.initial_delay = milliseconds{10},
                                .max_delay = milliseconds{30},
                                .factor = 2.0,
                                .jitter_factor = 0.0,
                                .max_retry_attempts = 5}};

    SECTION("first delay is zero then grows up to max") {
        CHECK(backoff.next_delay() == milliseconds{0});
        CHECK(backoff.next_delay() == milliseconds{10});
        CHECK(backoff.next_delay() == milliseconds{20});
        CHECK(backoff.next_delay() == milliseconds{30});
        CHECK(backoff.next_delay() == milliseconds{30});
        CHECK(backoff.retry_count() == 5);
    }

    SECTION("reset restarts from zero") {
        backoff.next_delay();
        backoff.next_delay();
        backoff.reset();
        CHECK(backoff.retry_count() == 0);
        CHECK(backoff.next_delay() == milliseconds{0});
    }

    SECTION("reset_to_max uses the maximum delay") {
        backoff.reset_to_max();
        CHECK(backoff.next_delay() == milliseconds{30});
    }

    SECTION("too many retries") {
        for (int i{0}; i < 6; ++i) {
            backoff.next_delay();
        }
        CHECK_THROWS_AS(backoff.next_delay(), StatusException);
    }
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[ember][core][backoff]") {
    ExponentialBackoff backoff{{.initial_delay = milliseconds{100},
                                .max_delay = milliseconds{100},
                                .factor = 1.5,
                                .jitter_factor = 1.0,
                                .max_retry_attempts = 100}};
    backoff.next_delay();
    for (int i{0}; i < 50; ++i) {
        const auto delay = backoff.next_delay();
        CHECK(delay >= milliseconds{50});
        CHECK(delay <= milliseconds{150});
    }
}

TEST_CASE("ExponentialBackoff wait", "[ember][core][backoff]") {
    test_util::TaskRunner runner;
    ExponentialBackoff backoff{{.initial_delay = milliseconds{1}, .jitter_factor = 0.0}};
    CHECK_NOTHROW(runner.run(backoff.wait()));
    CHECK_NOTHROW(runner.run(backoff.wait()));
    CHECK(backoff.retry_count() == 2);
}

}  // namespace ember
