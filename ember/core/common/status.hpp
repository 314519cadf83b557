// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace ember {

//! Canonical status codes, numbered as in the gRPC protocol
enum class StatusCode {
    kOk = 0,
    kCancelled = 1,
    kUnknown = 2,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kAlreadyExists = 6,
    kPermissionDenied = 7,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kAborted = 10,
    kOutOfRange = 11,
    kUnimplemented = 12,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
    kUnauthenticated = 16,
};

class Status {
  public:
    Status() = default;
    Status(StatusCode code, std::string message) : code_{code}, message_{std::move(message)} {}

    StatusCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    bool ok() const noexcept { return code_ == StatusCode::kOk; }

    std::string to_string() const;

    friend bool operator==(const Status&, const Status&) = default;

  private:
    StatusCode code_{StatusCode::kOk};
    std::string message_;
};

std::ostream& operator<<(std::ostream& out, const Status& status);

Status invalid_argument(std::string message);
Status not_found(std::string message);
Status already_exists(std::string message);
Status failed_precondition(std::string message);
Status aborted(std::string message);
Status resource_exhausted(std::string message);
Status internal_error(std::string message);

//! Outcome of a protocol operation: either a value or the status explaining the failure
// TODO(C++23) Switch to std::expected
template <typename T>
using Result = tl::expected<T, Status>;

using VoidResult = tl::expected<void, Status>;

inline tl::unexpected<Status> make_error(StatusCode code, std::string message) {
    return tl::make_unexpected(Status{code, std::move(message)});
}

inline tl::unexpected<Status> make_error(Status status) {
    return tl::make_unexpected(std::move(status));
}

class StatusException : public std::runtime_error {
  public:
    explicit StatusException(Status status);

    const Status& status() const noexcept { return status_; }
    StatusCode code() const noexcept { return status_.code(); }

  private:
    Status status_;
};

template <class T>
inline void success_or_throw(const Result<T>& res) {
    if (!res) {
        throw StatusException(res.error());
    }
}

template <class T>
inline T unwrap_or_throw(Result<T> res) {
    success_or_throw(res);
    return std::move(*res);
}

}  // namespace ember
