// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/query/aggregation.hpp>
#include <ember/db/query/structured_query.hpp>
#include <ember/db/txn/transaction_coordinator.hpp>
#include <ember/db/write/write.hpp>

namespace ember::db::service {

//! Read inside an existing transaction
struct InTransaction {
    Bytes transaction;
};

//! Begin a transaction and read inside it, the token is returned with the first response
struct NewTransaction {
    txn::TransactionOptions options;
};

//! Read at a past snapshot
struct AtReadTime {
    Timestamp read_time;
};

//! Consistency of single-response reads: latest state when monostate
using ReadConsistency = std::variant<std::monostate, InTransaction, AtReadTime>;

//! Consistency of streamed reads, which may also begin a transaction
using StreamConsistency = std::variant<std::monostate, InTransaction, NewTransaction, AtReadTime>;

struct GetDocumentRequest {
    std::string name;
    std::optional<DocumentMask> mask;
    ReadConsistency consistency;
};

struct ListDocumentsRequest {
    //! Documents root or document owning the collection
    std::string parent;
    std::string collection_id;
    //! Zero means no limit
    int32_t page_size{0};
    std::string page_token;
    //! Comma separated field paths, each optionally followed by " desc"
    std::string order_by;
    std::optional<DocumentMask> mask;
    ReadConsistency consistency;
    //! Also list missing documents having descendants
    bool show_missing{false};
};

struct ListDocumentsResponse {
    std::vector<Document> documents;
    //! Empty on the last page
    std::string next_page_token;
};

struct CreateDocumentRequest {
    std::string parent;
    std::string collection_id;
    //! Server assigned when empty
    std::string document_id;
    MapValue fields;
    std::optional<DocumentMask> mask;
};

struct UpdateDocumentRequest {
    Document document;
    std::optional<DocumentMask> update_mask;
    std::optional<DocumentMask> mask;
    std::optional<write::Precondition> current_document;
};

struct DeleteDocumentRequest {
    std::string name;
    std::optional<write::Precondition> current_document;
};

struct BatchGetDocumentsRequest {
    std::string database;
    std::vector<std::string> documents;
    std::optional<DocumentMask> mask;
    StreamConsistency consistency;
};

//! One message of a batch get: either found or missing is set
struct BatchGetDocumentsResponse {
    std::optional<Document> found;
    std::string missing;
    std::optional<Bytes> transaction;
    Timestamp read_time;
};

struct BeginTransactionRequest {
    std::string database;
    txn::TransactionOptions options{txn::ReadWriteOptions{}};
};

struct CommitRequest {
    std::string database;
    std::vector<write::Write> writes;
    std::optional<Bytes> transaction;
};

struct RollbackRequest {
    std::string database;
    Bytes transaction;
};

struct RunQueryRequest {
    std::string parent;
    query::StructuredQuery structured_query;
    StreamConsistency consistency;
};

struct RunAggregationQueryRequest {
    std::string parent;
    query::StructuredQuery structured_query;
    std::vector<query::Aggregation> aggregations;
    StreamConsistency consistency;
};

//! Aggregates keyed by alias, computed at read_time
struct AggregationQueryResponse {
    MapValue result;
    Timestamp read_time;
    std::optional<Bytes> transaction;
};

struct ListCollectionIdsRequest {
    std::string parent;
    int32_t page_size{0};
    std::string page_token;
    std::optional<Timestamp> read_time;
};

struct ListCollectionIdsResponse {
    std::vector<std::string> collection_ids;
    std::string next_page_token;
};

}  // namespace ember::db::service
