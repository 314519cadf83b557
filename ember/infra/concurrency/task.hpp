// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

/// Use just \ember as namespace here to make these definitions available everywhere
/// So that we can write Task<void> foo(); instead of concurrency::Task<void> foo();
namespace ember {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace ember
