// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>

#include <ember/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace ember::test_util {

/**
 * A helper to run Task-s on io_context in tests
 */
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    //! Run task to completion
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = spawn_future(std::move(task));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    //! co_spawn with use_future
    template <typename TResult>
    std::future<TResult> spawn_future(Task<TResult> task) {
        return co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    //! Poll until the spawned future completes
    template <typename TResult>
    void poll_context_until_future_is_ready(std::future<TResult>& future) {
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    //! Execute all the handlers ready to run without blocking
    void poll() {
        ioc_.restart();
        ioc_.poll();
    }

    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace ember::test_util
