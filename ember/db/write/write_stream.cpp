// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "write_stream.hpp"

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include <ember/infra/common/log.hpp>

namespace ember::db::write {

WriteStreamSession::WriteStreamSession(std::string stream_id, WriteStreamSettings settings, CommitFunction commit)
    : stream_id_{std::move(stream_id)}, settings_{settings}, commit_{std::move(commit)} {}

Bytes WriteStreamSession::encode_token(uint64_t sequence) const {
    return string_to_bytes(absl::StrCat(stream_id_, "@", sequence));
}

Result<uint64_t> WriteStreamSession::decode_token(ByteView token) const {
    const std::string_view text = byte_view_to_string_view(token);
    const std::string prefix = stream_id_ + "@";
    uint64_t sequence{0};
    if (!absl::StartsWith(text, prefix) || !absl::SimpleAtoi(text.substr(prefix.size()), &sequence)) {
        return make_error(StatusCode::kInvalidArgument, "invalid stream token for stream " + stream_id_);
    }
    if (sequence < acknowledged_ || sequence >= next_sequence_) {
        return make_error(StatusCode::kInvalidArgument, "stream token out of range for stream " + stream_id_);
    }
    return sequence;
}

void WriteStreamSession::acknowledge(uint64_t sequence) {
    while (!unacknowledged_.empty() && unacknowledged_.front().first <= sequence) {
        unacknowledged_.pop_front();
    }
    acknowledged_ = sequence;
}

WriteResponse WriteStreamSession::handshake() {
    connected_ = true;
    return WriteResponse{.stream_id = stream_id_, .stream_token = encode_token(acknowledged_)};
}

Result<std::vector<WriteResponse>> WriteStreamSession::resume(ByteView token) {
    const auto sequence = decode_token(token);
    if (!sequence) return make_error(sequence.error());
    acknowledge(*sequence);

    std::vector<WriteResponse> responses{handshake()};
    for (const auto& [_, response] : unacknowledged_) {
        responses.push_back(response);
    }
    EMBER_DEBUG << "WriteStreamSession::resume" << log::Args{"stream_id", stream_id_, "replayed",
                                                            std::to_string(responses.size() - 1)};
    return responses;
}

Result<std::optional<WriteResponse>> WriteStreamSession::handle(const WriteRequest& request) {
    if (!connected_) {
        return make_error(StatusCode::kUnavailable, "write stream " + stream_id_ + " is not connected");
    }
    const auto sequence = decode_token(request.stream_token);
    if (!sequence) {
        disconnect();
        return make_error(sequence.error());
    }
    acknowledge(*sequence);
    if (request.writes.empty()) {
        return std::optional<WriteResponse>{};
    }

    auto result = commit_(request.writes);
    if (!result) {
        disconnect();
        return make_error(result.error());
    }

    const uint64_t response_sequence = next_sequence_++;
    WriteResponse response{
        .stream_id = stream_id_,
        .stream_token = encode_token(response_sequence),
        .write_results = std::move(result->write_results),
        .commit_time = result->commit_time,
    };
    unacknowledged_.emplace_back(response_sequence, response);
    if (unacknowledged_.size() > settings_.max_unacknowledged_responses) {
        disconnect();
        EMBER_WARN << "WriteStreamSession::handle too many unacknowledged responses"
                   << log::Args{"stream_id", stream_id_, "unacknowledged", std::to_string(unacknowledged_.size())};
        return make_error(StatusCode::kResourceExhausted,
                          "too many unacknowledged responses on write stream " + stream_id_);
    }
    return std::optional<WriteResponse>{std::move(response)};
}

WriteStreamClient::WriteStreamClient(std::string database, WriteStreamClientSettings settings)
    : database_{std::move(database)}, settings_{settings} {}

WriteRequest WriteStreamClient::open_request() const {
    return WriteRequest{.database = database_, .stream_id = stream_id_, .stream_token = last_received_token_};
}

VoidResult WriteStreamClient::on_handshake(const WriteResponse& response) {
    if (response.stream_id.empty() || response.stream_token.empty()) {
        return make_error(StatusCode::kInternal, "handshake without stream id or token");
    }
    if (!stream_id_.empty() && response.stream_id != stream_id_) {
        return make_error(StatusCode::kInternal, "handshake for stream " + response.stream_id + " while resuming " + stream_id_);
    }
    stream_id_ = response.stream_id;
    last_received_token_ = response.stream_token;
    last_acknowledged_token_ = response.stream_token;
    outstanding_ = 0;
    return {};
}

WriteRequest WriteStreamClient::write_request(std::vector<Write> writes) const {
    return WriteRequest{
        .database = database_,
        .stream_id = stream_id_,
        .writes = std::move(writes),
        .stream_token = last_acknowledged_token_,
    };
}

std::optional<WriteRequest> WriteStreamClient::on_response(const WriteResponse& response) {
    last_received_token_ = response.stream_token;
    ++outstanding_;
    if (outstanding_ < settings_.acknowledgement_threshold) {
        return std::nullopt;
    }
    last_acknowledged_token_ = last_received_token_;
    outstanding_ = 0;
    return WriteRequest{.database = database_, .stream_id = stream_id_, .stream_token = last_acknowledged_token_};
}

bool WriteStreamClient::should_reopen(const Status& status) {
    return status.code() == StatusCode::kResourceExhausted || status.code() == StatusCode::kUnavailable;
}

}  // namespace ember::db::write
