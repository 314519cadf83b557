// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/write/write.hpp>

namespace ember::db::write {

struct WriteRequest {
    std::string database;
    //! Empty on the first request of a new stream, set to resume an existing one
    std::string stream_id;
    std::vector<Write> writes;
    //! Latest token acknowledged by the client, empty on the first request of a new stream
    Bytes stream_token;
    std::map<std::string, std::string> labels;
};

struct WriteResponse {
    std::string stream_id;
    Bytes stream_token;
    std::vector<WriteResult> write_results;
    Timestamp commit_time;
};

struct WriteStreamSettings {
    //! Responses the server keeps in flight before closing the stream with RESOURCE_EXHAUSTED
    size_t max_unacknowledged_responses{100};
    //! How long a disconnected stream can still be resumed
    std::chrono::seconds resume_window{300};
};

using CommitFunction = std::function<Result<CommitResult>(const std::vector<Write>&)>;

//! Server side state of one write stream. It survives disconnections so that the client can resume
//! from the last token it acknowledged and get the responses it has not acknowledged replayed.
class WriteStreamSession {
  public:
    WriteStreamSession(std::string stream_id, WriteStreamSettings settings, CommitFunction commit);

    const std::string& stream_id() const { return stream_id_; }

    //! First response of a new stream: stream id and initial token, no results
    WriteResponse handshake();

    //! Reconnect acknowledging everything up to token.
    //! \return the handshake followed by the unacknowledged responses issued after token
    Result<std::vector<WriteResponse>> resume(ByteView token);

    //! Process one request on a connected stream: acknowledge its token then commit its writes.
    //! \return the response for the writes, std::nullopt for a pure acknowledgement. Any error
    //! disconnects the stream.
    Result<std::optional<WriteResponse>> handle(const WriteRequest& request);

    size_t unacknowledged() const { return unacknowledged_.size(); }
    bool connected() const { return connected_; }
    void disconnect() { connected_ = false; }

    //! Record client activity on the stream at now
    void touch(Timestamp now) { last_activity_ = now; }
    //! Whether the stream is disconnected and its resume window has elapsed at now
    bool is_expired(Timestamp now) const {
        return !connected_ && last_activity_.plus(settings_.resume_window) < now;
    }

  private:
    Bytes encode_token(uint64_t sequence) const;
    Result<uint64_t> decode_token(ByteView token) const;
    void acknowledge(uint64_t sequence);

    std::string stream_id_;
    WriteStreamSettings settings_;
    CommitFunction commit_;

    bool connected_{false};
    Timestamp last_activity_;
    uint64_t next_sequence_{1};
    uint64_t acknowledged_{0};
    std::deque<std::pair<uint64_t, WriteResponse>> unacknowledged_;
};

struct WriteStreamClientSettings {
    //! Outstanding responses after which the client sends an explicit acknowledgement
    size_t acknowledgement_threshold{10};
};

//! Client side bookkeeping of a write stream: token tracking, acknowledgement window, reopening
class WriteStreamClient {
  public:
    explicit WriteStreamClient(std::string database, WriteStreamClientSettings settings = {});

    //! Request opening the stream, or resuming it from the latest received token after a disconnection
    WriteRequest open_request() const;

    //! Record the handshake response of open_request()
    VoidResult on_handshake(const WriteResponse& response);

    //! Request carrying writes and the latest acknowledged token
    WriteRequest write_request(std::vector<Write> writes) const;

    //! Record a write response.
    //! \return an empty acknowledgement request once the outstanding count reaches the threshold
    std::optional<WriteRequest> on_response(const WriteResponse& response);

    //! Whether a stream failure can be recovered by reopening with open_request()
    static bool should_reopen(const Status& status);

    const std::string& stream_id() const { return stream_id_; }
    const Bytes& last_received_token() const { return last_received_token_; }
    const Bytes& last_acknowledged_token() const { return last_acknowledged_token_; }
    size_t outstanding() const { return outstanding_; }

  private:
    std::string database_;
    WriteStreamClientSettings settings_;
    std::string stream_id_;
    Bytes last_received_token_;
    Bytes last_acknowledged_token_;
    size_t outstanding_{0};
};

}  // namespace ember::db::write
