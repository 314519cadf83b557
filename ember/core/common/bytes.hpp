// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ember {

//! Opaque byte string (blobs, transaction, resume and stream tokens)
using Bytes = std::basic_string<uint8_t>;
using ByteView = std::basic_string_view<uint8_t>;

inline ByteView string_view_to_byte_view(std::string_view v) {
    return {reinterpret_cast<const uint8_t*>(v.data()), v.length()};
}

inline std::string_view byte_view_to_string_view(ByteView v) {
    return {reinterpret_cast<const char*>(v.data()), v.length()};
}

inline Bytes string_to_bytes(std::string_view s) {
    return Bytes{string_view_to_byte_view(s)};
}

//! \brief Returns the hex form (no prefix) of provided bytes
std::string to_hex(ByteView bytes);

}  // namespace ember
