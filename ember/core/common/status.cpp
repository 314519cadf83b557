// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "status.hpp"

#include <magic_enum.hpp>

namespace ember {

std::string Status::to_string() const {
    std::string code_name{magic_enum::enum_name(code_)};
    if (message_.empty()) {
        return code_name;
    }
    return code_name + ": " + message_;
}

std::ostream& operator<<(std::ostream& out, const Status& status) {
    out << status.to_string();
    return out;
}

Status invalid_argument(std::string message) {
    return {StatusCode::kInvalidArgument, std::move(message)};
}

Status not_found(std::string message) {
    return {StatusCode::kNotFound, std::move(message)};
}

Status already_exists(std::string message) {
    return {StatusCode::kAlreadyExists, std::move(message)};
}

Status failed_precondition(std::string message) {
    return {StatusCode::kFailedPrecondition, std::move(message)};
}

Status aborted(std::string message) {
    return {StatusCode::kAborted, std::move(message)};
}

Status resource_exhausted(std::string message) {
    return {StatusCode::kResourceExhausted, std::move(message)};
}

Status internal_error(std::string message) {
    return {StatusCode::kInternal, std::move(message)};
}

StatusException::StatusException(Status status)
    : std::runtime_error{status.to_string()}, status_{std::move(status)} {}

}  // namespace ember
