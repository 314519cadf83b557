// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace ember {

//! Raise a logic error when an internal invariant of the store or the service does not hold.
//! The message is built only on failure.
//! Usage: `ensure_invariant(found, [&] { return "document " + name + " not found"; });`
template <typename MessageBuilder>
void ensure_invariant(bool condition, MessageBuilder&& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + std::string{message_builder()}};
    }
}

}  // namespace ember
