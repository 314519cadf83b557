// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

#include <ember/infra/concurrency/task.hpp>

namespace ember {

struct BackoffSettings {
    //! Delay applied before the first retry
    std::chrono::milliseconds initial_delay{1000};
    //! Upper bound for the base delay
    std::chrono::milliseconds max_delay{60'000};
    //! Multiplier applied to the base delay after each attempt
    double factor{1.5};
    //! Jitter as a fraction of the base delay, uniformly spread in [-jitter/2, +jitter/2]
    double jitter_factor{1.0};
    //! Number of backoff rounds allowed before giving up
    uint32_t max_retry_attempts{10};
};

//! Exponential backoff with jitter used between retries of streams and transactions
class ExponentialBackoff {
  public:
    explicit ExponentialBackoff(BackoffSettings settings = {});

    //! Forget any accumulated delay: next wait happens immediately
    void reset();

    //! Use the maximum delay for the next wait, e.g. after RESOURCE_EXHAUSTED
    void reset_to_max();

    //! Compute the delay for the current round and advance to the next one
    //! \throws StatusException with RESOURCE_EXHAUSTED once max_retry_attempts is exceeded
    std::chrono::milliseconds next_delay();

    //! Suspend the calling coroutine for next_delay()
    Task<void> wait();

    uint32_t retry_count() const { return retry_count_; }
    std::chrono::milliseconds current_base() const { return current_base_; }

  private:
    std::chrono::milliseconds jitter_delay();

    BackoffSettings settings_;
    uint32_t retry_count_{0};
    std::chrono::milliseconds current_base_{0};
    std::mt19937_64 generator_{std::random_device{}()};
};

}  // namespace ember
