// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "timestamp.hpp"

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace ember {

Timestamp Timestamp::now() {
    const absl::Time now = absl::Now();
    const int64_t nanos = absl::ToUnixNanos(now);
    return Timestamp{}.plus(std::chrono::nanoseconds{nanos});
}

Timestamp Timestamp::from_micros(int64_t micros) {
    return Timestamp{}.plus(std::chrono::microseconds{micros});
}

Timestamp Timestamp::plus(std::chrono::nanoseconds delta) const {
    const int64_t total = static_cast<int64_t>(nanos) + delta.count() % kNanosPerSecond;
    int64_t secs = seconds + delta.count() / kNanosPerSecond + total / kNanosPerSecond;
    int64_t ns = total % kNanosPerSecond;
    if (ns < 0) {
        ns += kNanosPerSecond;
        --secs;
    }
    return Timestamp{secs, static_cast<int32_t>(ns)};
}

Timestamp Timestamp::successor() const {
    return plus(std::chrono::nanoseconds{1});
}

std::string Timestamp::to_string() const {
    const absl::Time t = absl::FromUnixSeconds(seconds) + absl::Nanoseconds(nanos);
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E9SZ", t, absl::UTCTimeZone());
}

std::ostream& operator<<(std::ostream& out, const Timestamp& ts) {
    out << ts.to_string();
    return out;
}

}  // namespace ember
