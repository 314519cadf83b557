// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "listen_protocol.hpp"

#include <absl/strings/str_join.h>
#include <magic_enum.hpp>

#include <ember/core/common/overloaded.hpp>

namespace ember::db::watch {

//! Magic prefix plus big-endian seconds and nanos
static constexpr uint8_t kResumeTokenVersion{0x01};
static constexpr size_t kResumeTokenSize{1 + 8 + 4};

Bytes encode_resume_token(Timestamp read_time) {
    Bytes token;
    token.reserve(kResumeTokenSize);
    token.push_back(kResumeTokenVersion);
    const auto seconds = static_cast<uint64_t>(read_time.seconds);
    for (int shift{56}; shift >= 0; shift -= 8) {
        token.push_back(static_cast<uint8_t>(seconds >> shift));
    }
    const auto nanos = static_cast<uint32_t>(read_time.nanos);
    for (int shift{24}; shift >= 0; shift -= 8) {
        token.push_back(static_cast<uint8_t>(nanos >> shift));
    }
    return token;
}

std::optional<Timestamp> decode_resume_token(ByteView token) {
    if (token.size() != kResumeTokenSize || token[0] != kResumeTokenVersion) {
        return std::nullopt;
    }
    uint64_t seconds{0};
    for (size_t i{1}; i < 9; ++i) {
        seconds = (seconds << 8) | token[i];
    }
    uint32_t nanos{0};
    for (size_t i{9}; i < kResumeTokenSize; ++i) {
        nanos = (nanos << 8) | token[i];
    }
    if (nanos >= static_cast<uint32_t>(Timestamp::kNanosPerSecond)) {
        return std::nullopt;
    }
    return Timestamp{static_cast<int64_t>(seconds), static_cast<int32_t>(nanos)};
}

std::ostream& operator<<(std::ostream& out, const TargetChange& change) {
    out << magic_enum::enum_name(change.type) << " targets=[" << absl::StrJoin(change.target_ids, ",") << "]";
    if (change.cause) out << " cause=" << *change.cause;
    if (change.read_time) out << " read_time=" << *change.read_time;
    return out;
}

std::ostream& operator<<(std::ostream& out, const ListenResponse& response) {
    std::visit(Overloaded{
                   [&](const TargetChange& change) { out << "TargetChange " << change; },
                   [&](const DocumentChange& change) {
                       out << "DocumentChange " << change.document.name << " targets=["
                           << absl::StrJoin(change.target_ids, ",") << "] removed=["
                           << absl::StrJoin(change.removed_target_ids, ",") << "]";
                   },
                   [&](const DocumentDelete& del) {
                       out << "DocumentDelete " << del.document << " removed=["
                           << absl::StrJoin(del.removed_target_ids, ",") << "]";
                   },
                   [&](const DocumentRemove& remove) {
                       out << "DocumentRemove " << remove.document << " removed=["
                           << absl::StrJoin(remove.removed_target_ids, ",") << "]";
                   },
                   [&](const ExistenceFilter& filter) {
                       out << "ExistenceFilter target=" << filter.target_id << " count=" << filter.count;
                   },
               },
               response);
    return out;
}

}  // namespace ember::db::watch
