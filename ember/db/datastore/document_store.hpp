// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>

#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>

namespace ember::db::datastore {

//! State of a document as of one commit: std::nullopt records a deletion
struct DocumentVersion {
    Timestamp commit_time;
    std::optional<Document> document;
};

//! Upsert (document set) or deletion (document empty) of one name
struct Mutation {
    std::string name;
    std::optional<Document> document;
};

struct ChangeRecord {
    std::string name;
    std::optional<Document> before;
    std::optional<Document> after;
};

//! Effect of one commit, published to observers after the store is updated
struct CommitEvent {
    Timestamp commit_time;
    std::vector<ChangeRecord> changes;
};

using CommitObserver = std::function<void(const CommitEvent&)>;

//! Oldest read time that must stay readable, std::nullopt when no reader holds history back
using RetentionFloor = std::function<std::optional<Timestamp>()>;

//! Versions older than this are pruned and cannot be read anymore
inline constexpr std::chrono::seconds kDefaultVersionRetention{300};

//! In-memory multi-version document store. Every commit appends a version per mutated name so that
//! reads at any retained timestamp see a consistent snapshot. Not thread safe: callers serialize access.
class DocumentStore {
  public:
    explicit DocumentStore(std::chrono::nanoseconds retention = kDefaultVersionRetention);

    //! Document as of read_time (latest if unset), std::nullopt if absent at that time
    std::optional<Document> get(std::string_view name, std::optional<Timestamp> read_time = std::nullopt) const;

    //! Commit time of the latest version of name (including deletions)
    std::optional<Timestamp> last_change_time(std::string_view name) const;

    //! All documents existing at read_time strictly below parent, ordered by name
    std::vector<Document> scan(std::string_view parent, std::optional<Timestamp> read_time = std::nullopt) const;

    //! Documents directly inside collection at read_time; with show_missing, also name-only entries for
    //! absent documents which have descendants
    std::vector<Document> list_collection(std::string_view collection, std::optional<Timestamp> read_time,
                                          bool show_missing) const;

    //! Sorted ids of the collections directly below parent containing at least one document at read_time
    std::vector<std::string> collection_ids(std::string_view parent, std::optional<Timestamp> read_time = std::nullopt) const;

    //! Apply mutations atomically at commit_time, which must exceed the previous commit time
    CommitEvent commit(std::vector<Mutation> mutations, Timestamp commit_time);

    //! Drop versions no longer visible to reads at or after horizon
    void prune(Timestamp horizon);

    //! Pruning after a commit never goes past floor(), e.g. the snapshot of the oldest open transaction
    void set_retention_floor(RetentionFloor floor) { retention_floor_ = std::move(floor); }

    Timestamp latest_commit_time() const { return latest_commit_time_; }

    //! Oldest timestamp a read can still be served at
    Timestamp earliest_read_time() const { return earliest_read_time_; }

    size_t version_count() const;

    uint64_t subscribe(CommitObserver observer);
    void unsubscribe(uint64_t id);

  private:
    using History = std::vector<DocumentVersion>;

    static const DocumentVersion* version_at(const History& history, std::optional<Timestamp> read_time);

    std::chrono::nanoseconds retention_;
    RetentionFloor retention_floor_;
    absl::btree_map<std::string, History> documents_;
    Timestamp latest_commit_time_;
    Timestamp earliest_read_time_;

    absl::flat_hash_map<uint64_t, CommitObserver> observers_;
    uint64_t next_observer_id_{1};
};

}  // namespace ember::db::datastore
