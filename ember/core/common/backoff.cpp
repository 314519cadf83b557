// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "backoff.hpp"

#include <algorithm>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <ember/core/common/status.hpp>
#include <ember/infra/common/log.hpp>

namespace ember {

using std::chrono::milliseconds;

ExponentialBackoff::ExponentialBackoff(BackoffSettings settings) : settings_{settings} {}

void ExponentialBackoff::reset() {
    retry_count_ = 0;
    current_base_ = milliseconds{0};
}

void ExponentialBackoff::reset_to_max() {
    current_base_ = settings_.max_delay;
}

milliseconds ExponentialBackoff::next_delay() {
    if (retry_count_ > settings_.max_retry_attempts) {
        throw StatusException{resource_exhausted("Exceeded maximum number of retries allowed")};
    }
    // The current base may be zero and must be honoured as such
    const milliseconds delay = std::max(current_base_ + jitter_delay(), milliseconds{0});
    if (current_base_.count() > 0) {
        EMBER_DEBUG << "ExponentialBackoff: backing off for " << delay.count() << " ms (base delay: "
                    << current_base_.count() << " ms)";
    }

    auto next_base = milliseconds{static_cast<int64_t>(static_cast<double>(current_base_.count()) * settings_.factor)};
    next_base = std::max(next_base, settings_.initial_delay);
    current_base_ = std::min(next_base, settings_.max_delay);
    ++retry_count_;

    return delay;
}

Task<void> ExponentialBackoff::wait() {
    const auto delay = next_delay();
    if (delay.count() == 0) {
        co_return;
    }
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer{executor};
    timer.expires_after(delay);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

milliseconds ExponentialBackoff::jitter_delay() {
    if (current_base_.count() == 0 || settings_.jitter_factor == 0.0) {
        return milliseconds{0};
    }
    std::uniform_real_distribution<double> distribution{-0.5, 0.5};
    const double jitter = distribution(generator_) * settings_.jitter_factor * static_cast<double>(current_base_.count());
    return milliseconds{static_cast<int64_t>(jitter)};
}

}  // namespace ember
