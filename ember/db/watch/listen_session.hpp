// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>

#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/datastore/document_store.hpp>
#include <ember/db/query/query_evaluator.hpp>
#include <ember/db/watch/listen_protocol.hpp>

namespace ember::db::watch {

//! Server side of one listen stream: tracks the targets added by the client and turns target
//! additions and store commits into the ordered sequence of listen responses.
//! Not thread safe: the owner serializes calls together with the store access.
class ListenSession {
  public:
    ListenSession(const datastore::DocumentStore& store, std::string database);

    //! Apply a client request. Stream-fatal problems are returned as errors, a target that cannot be
    //! served is rejected with a kRemove carrying the cause.
    Result<std::vector<ListenResponse>> handle(const ListenRequest& request);

    //! Changes of every target caused by the commit, followed by a global kNoChange at its commit time
    std::vector<ListenResponse> on_commit(const datastore::CommitEvent& event);

    //! Count of documents currently matching target_id, as last sent to the client
    Result<ExistenceFilter> existence_filter(TargetId target_id) const;

    //! Existence filters of every target
    std::vector<ExistenceFilter> existence_filters() const;

    size_t target_count() const { return targets_.size(); }
    const std::string& database() const { return database_; }
    const Timestamp& last_read_time() const { return last_read_time_; }

  private:
    struct ActiveTarget {
        Target target;
        std::optional<query::QueryEvaluator> evaluator;
        absl::btree_set<std::string> members;
    };

    Result<std::vector<ListenResponse>> add_target(Target target);
    Result<std::vector<ListenResponse>> remove_target(TargetId target_id);

    //! Compile the selector of target, std::nullopt evaluator for documents targets
    Result<std::optional<query::QueryEvaluator>> compile(const Target& target) const;

    std::vector<Document> evaluate(const ActiveTarget& target, Timestamp read_time) const;

    //! Changes bringing every registered target from last_read_time_ to read_time, which becomes
    //! the new last_read_time_. Nothing when read_time is not later.
    std::vector<ListenResponse> advance_targets(Timestamp read_time);

    TargetChange global_no_change(Timestamp read_time) const;

    const datastore::DocumentStore& store_;
    std::string database_;
    absl::btree_map<TargetId, ActiveTarget> targets_;
    TargetId next_target_id_{1};
    Timestamp last_read_time_;
};

}  // namespace ember::db::watch
