// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace ember {

//! Point in time with nanosecond resolution, as carried by the protocol
struct Timestamp {
    int64_t seconds{0};
    int32_t nanos{0};

    static constexpr int32_t kNanosPerSecond{1'000'000'000};

    static Timestamp now();
    static Timestamp from_micros(int64_t micros);

    int64_t to_micros() const { return seconds * 1'000'000 + nanos / 1'000; }

    //! Timestamp shifted by the given (possibly negative) duration
    Timestamp plus(std::chrono::nanoseconds delta) const;

    //! The smallest timestamp strictly greater than this one
    Timestamp successor() const;

    std::string to_string() const;

    friend auto operator<=>(const Timestamp&, const Timestamp&) = default;
};

std::ostream& operator<<(std::ostream& out, const Timestamp& ts);

//! Source of wall clock time for the document service, replaceable in tests
using Clock = std::function<Timestamp()>;

}  // namespace ember
