// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace ember {

//! Visitor helper for std::visit over the protocol sum types
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace ember
