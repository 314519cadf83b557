// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <ember/core/common/backoff.hpp>
#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/db/query/aggregation.hpp>
#include <ember/db/query/structured_query.hpp>
#include <ember/db/service/database.hpp>
#include <ember/db/write/write.hpp>
#include <ember/infra/concurrency/task.hpp>

namespace ember::db::txn {

struct TransactionRunnerSettings {
    //! Attempts, the first one included, before giving up with the last error
    uint32_t max_attempts{5};
    BackoffSettings backoff;
    bool read_only{false};
    //! Snapshot of read-only transactions, latest when unset
    std::optional<Timestamp> read_time;
};

//! Client handle of one transaction attempt: reads run in the transaction, writes are buffered and
//! sent with the commit. Read failures are thrown as StatusException.
class Transaction {
  public:
    Transaction(service::Database& database, std::string database_name, Bytes token);

    //! Document as of the transaction snapshot, std::nullopt when it does not exist
    std::optional<Document> get(const std::string& name);

    //! Documents matching query as of the transaction snapshot
    std::vector<Document> query(const std::string& parent, query::StructuredQuery query);

    //! Aggregates over the results of query keyed by alias, as of the transaction snapshot
    MapValue aggregate(const std::string& parent, query::StructuredQuery query,
                       std::vector<query::Aggregation> aggregations);

    Transaction& create(Document document);
    Transaction& set(Document document, std::optional<DocumentMask> mask = std::nullopt);
    //! Update an existing document
    Transaction& update(Document document, DocumentMask mask);
    Transaction& remove(std::string name, std::optional<write::Precondition> precondition = std::nullopt);
    Transaction& add(write::Write write);

    const Bytes& token() const { return token_; }
    const std::vector<write::Write>& writes() const { return writes_; }

  private:
    service::Database& database_;
    std::string database_name_;
    Bytes token_;
    std::vector<write::Write> writes_;
};

//! Runs a transaction callback with optimistic concurrency: begin, callback, commit, and on a
//! retryable failure roll back, wait and run again chaining the previous attempt
class TransactionRunner {
  public:
    using Callback = std::function<Task<void>(Transaction&)>;

    TransactionRunner(service::Database& database, std::string database_name, TransactionRunnerSettings settings = {});

    //! \throws StatusException with the error of the callback or of the last attempt
    Task<write::CommitResult> run(Callback callback);

    //! Whether an attempt failing with status may succeed when run again
    static bool is_retryable(const Status& status);

  private:
    void rollback(const Transaction& transaction);

    service::Database& database_;
    std::string database_name_;
    TransactionRunnerSettings settings_;
};

}  // namespace ember::db::txn
