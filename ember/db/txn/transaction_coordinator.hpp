// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/datastore/document_store.hpp>
#include <ember/db/query/query_evaluator.hpp>
#include <ember/db/write/write.hpp>

namespace ember::db::txn {

enum class TransactionState {
    kActive,
    kCommitted,
    kRolledBack,
    kExpired,
};

struct ReadOnlyOptions {
    //! Snapshot to read at, latest committed state when unset
    std::optional<Timestamp> read_time;
};

struct ReadWriteOptions {
    //! Token of a previous failed attempt of the same logical transaction
    std::optional<Bytes> retry_transaction;
};

using TransactionOptions = std::variant<ReadOnlyOptions, ReadWriteOptions>;

struct TransactionSettings {
    //! Idle time after which an active transaction expires
    std::chrono::seconds transaction_timeout{270};
    //! Time terminal transactions are remembered, so that reuse is reported as such
    std::chrono::seconds terminal_retention{600};
};

//! Public view of a transaction
struct TransactionInfo {
    std::string database;
    uint64_t logical_id{0};
    uint32_t attempt{0};
    bool read_only{false};
    Timestamp read_time;
    TransactionState state{TransactionState::kActive};
};

//! Owns the lifecycle of transaction tokens: begin, snapshot reads, conflict detection at commit,
//! rollback and expiry. Optimistic: read-write transactions record what they read and are aborted
//! at commit if any of it changed after their snapshot.
class TransactionCoordinator {
  public:
    TransactionCoordinator(const datastore::DocumentStore& store, TransactionSettings settings, Clock clock);

    //! Start a transaction in database, returning its opaque token
    Result<Bytes> begin(const std::string& database, const TransactionOptions& options);

    //! Snapshot time of an active transaction of database
    Result<Timestamp> read_time(const std::string& database, ByteView token);

    //! Remember that the transaction observed document name (std::nullopt when absent)
    VoidResult record_read(ByteView token, const std::string& name, const std::optional<Document>& observed);

    //! Remember a query run in the transaction and the names of its results
    VoidResult record_query(ByteView token, query::QueryEvaluator evaluator, std::vector<std::string> result_names);

    //! Check that the transaction is active in database and allowed to commit writes
    VoidResult check_commit(const std::string& database, ByteView token, const std::vector<write::Write>& writes);

    //! Optimistic validation: nothing the transaction read or is about to write changed since its
    //! snapshot. A conflict aborts the transaction.
    VoidResult validate_snapshot(ByteView token, const std::vector<write::Write>& writes);

    //! Terminal transition after the commit attempt: kCommitted or kRolledBack
    void finish(ByteView token, TransactionState state);

    VoidResult rollback(const std::string& database, ByteView token);

    //! Expire idle active transactions and forget old terminal ones
    size_t expire_idle();

    std::optional<TransactionInfo> info(ByteView token) const;

    size_t active_count() const;

    //! Snapshot time of the oldest transaction that can still read, std::nullopt if there is none
    std::optional<Timestamp> oldest_read_time() const;

  private:
    struct QueryRead {
        query::QueryEvaluator evaluator;
        std::vector<std::string> result_names;
    };

    struct Entry {
        TransactionInfo info;
        Timestamp last_activity;
        absl::flat_hash_map<std::string, std::optional<Timestamp>> read_set;
        std::vector<QueryRead> queries;
    };

    //! Lookup for an operation requiring an active transaction
    Result<Entry*> active_entry(ByteView token, const std::string* database);

    bool is_idle(const Entry& entry, Timestamp now) const;
    VoidResult detect_conflicts(const Entry& entry, const std::vector<write::Write>& writes) const;
    Bytes new_token();

    const datastore::DocumentStore& store_;
    TransactionSettings settings_;
    Clock clock_;

    absl::flat_hash_map<std::string, Entry> transactions_;
    uint64_t next_logical_id_{1};
    std::mt19937_64 generator_{std::random_device{}()};
};

//! Message used for operations on an expired transaction, recognized by retrying clients
inline constexpr std::string_view kTransactionExpiredMessage{"transaction has expired"};

}  // namespace ember::db::txn
