// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/btree_map.h>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/query/query_evaluator.hpp>
#include <ember/db/watch/listen_protocol.hpp>

namespace ember::db::watch {

//! Client view of one target
enum class TargetState {
    kPending,  // requested, not acknowledged
    kSyncing,  // acknowledged, receiving the initial documents
    kCurrent,  // consistent, first snapshot not yet published
    kActive,   // snapshots published
    kReset,    // state discarded by the server, resynchronizing
    kRemoved,
};

enum class ChangeType {
    kAdded,
    kModified,
    kRemoved,
};

struct DocumentViewChange {
    ChangeType type{ChangeType::kAdded};
    Document document;
    //! Position in the previous snapshot, -1 when added
    int64_t old_index{-1};
    //! Position in this snapshot, -1 when removed
    int64_t new_index{-1};
};

//! Consistent view of a target at read_time
struct Snapshot {
    TargetId target_id{0};
    Timestamp read_time;
    //! Documents in query order
    std::vector<Document> documents;
    //! Differences from the previous snapshot of the target
    std::vector<DocumentViewChange> changes;
};

enum class ExistenceFilterPolicy {
    //! Discard the target state and listen again without resume token
    kResetTarget,
    //! Replace the target state with a fresh query result
    kRequery,
};

struct WatchSettings {
    ExistenceFilterPolicy existence_filter_policy{ExistenceFilterPolicy::kResetTarget};
};

using SnapshotCallback = std::function<void(const Snapshot&)>;
using TargetErrorCallback = std::function<void(TargetId, const Status&)>;
using StreamErrorCallback = std::function<void(const Status&)>;

//! Current matching documents of a target, used by ExistenceFilterPolicy::kRequery
using RequeryFunction = std::function<Result<std::vector<Document>>(const Target&)>;

//! Client side reconciliation of a listen stream: accumulates document changes per target and
//! publishes a snapshot whenever the server declares the targets consistent at a read time.
class WatchAggregator {
  public:
    WatchAggregator(std::string database, WatchSettings settings, SnapshotCallback on_snapshot,
                    TargetErrorCallback on_target_error, StreamErrorCallback on_stream_error,
                    RequeryFunction requery = {});

    //! Start listening to target, which must carry a non-zero client assigned id
    //! \return the request to send on the stream
    Result<ListenRequest> add_target(Target target);

    //! Stop listening to target_id
    //! \return the request to send on the stream
    Result<ListenRequest> remove_target(TargetId target_id);

    //! Process one server message. An error is stream-fatal and has been reported to on_stream_error.
    VoidResult on_response(const ListenResponse& response);

    //! Stream-fatal failure, also used for errors closing the stream on the server side
    VoidResult fail(Status status);

    //! Requests produced while processing responses, e.g. re-listening after an existence filter mismatch
    std::vector<ListenRequest> take_pending_requests();

    //! Forget the per stream state after a disconnection: targets go back to kPending
    //! \return the requests re-adding every live target with its resume token
    std::vector<ListenRequest> reopen();

    std::optional<TargetState> state(TargetId target_id) const;
    std::optional<Bytes> resume_token(TargetId target_id) const;
    const std::optional<Timestamp>& last_read_time() const { return last_read_time_; }

  private:
    struct TargetView {
        Target target;
        std::optional<query::QueryEvaluator> evaluator;
        TargetState state{TargetState::kPending};
        absl::btree_map<std::string, Document> accumulated;
        std::vector<Document> published;
        bool has_published{false};
        bool dirty{false};
        //! Server acknowledgements of removals issued by resets, not meant to remove the target
        uint32_t pending_removals{0};
    };

    VoidResult on_target_change(const TargetChange& change);
    void on_document_change(const DocumentChange& change);
    void on_document_removed(const std::string& name, const std::vector<TargetId>& removed_target_ids);
    void on_existence_filter(const ExistenceFilter& filter);

    void reset_target(TargetId target_id, TargetView& view);
    void publish(TargetId target_id, TargetView& view, Timestamp read_time);
    std::vector<Document> ordered(const TargetView& view) const;

    ListenRequest add_request(const Target& target) const;

    std::string database_;
    WatchSettings settings_;
    SnapshotCallback on_snapshot_;
    TargetErrorCallback on_target_error_;
    StreamErrorCallback on_stream_error_;
    RequeryFunction requery_;

    absl::btree_map<TargetId, TargetView> targets_;
    std::optional<Timestamp> last_read_time_;
    std::vector<ListenRequest> pending_requests_;
    bool failed_{false};
};

}  // namespace ember::db::watch
