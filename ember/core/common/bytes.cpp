// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "bytes.hpp"

namespace ember {

std::string to_hex(ByteView bytes) {
    static constexpr std::string_view kHexDigits{"0123456789abcdef"};
    std::string out;
    out.reserve(bytes.length() * 2);
    for (const uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0f]);
    }
    return out;
}

}  // namespace ember
