// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/query/structured_query.hpp>

namespace ember::db::query {

//! One message of a query response stream: a document, or a progress report carrying only
//! read_time and the count of results skipped since the previous message
struct QueryResponse {
    std::optional<Bytes> transaction;
    std::optional<Document> document;
    Timestamp read_time;
    int64_t skipped_results{0};
};

//! Number of skipped results after which a progress message is emitted
inline constexpr int64_t kDefaultProgressInterval{1000};

//! Lazy, finite sequence of query responses in query order
class QueryResponseStream {
  public:
    QueryResponseStream(std::vector<Document> ordered, Timestamp read_time, int64_t offset, std::optional<int64_t> limit,
                        std::optional<DocumentMask> projection, int64_t progress_interval);

    //! Next response or std::nullopt once the stream is exhausted
    std::optional<QueryResponse> next();

    //! Drain the stream
    std::vector<QueryResponse> collect();

    //! Transaction begun for the query, reported by the first response
    void set_transaction(Bytes transaction) { transaction_ = std::move(transaction); }

  private:
    std::optional<QueryResponse> advance();

    std::vector<Document> ordered_;
    Timestamp read_time_;
    std::optional<int64_t> limit_;
    std::optional<DocumentMask> projection_;
    int64_t progress_interval_;

    size_t position_{0};
    int64_t to_skip_{0};
    int64_t pending_skipped_{0};
    int64_t yielded_{0};
    bool emitted_any_{false};
    bool finished_{false};
    std::optional<Bytes> transaction_;
};

//! Folds a response stream (documents interleaved with progress messages) into one logical result
class QueryResultMerger {
  public:
    void add(const QueryResponse& response);

    const std::vector<Document>& documents() const { return documents_; }
    int64_t skipped_results() const { return skipped_results_; }
    const Timestamp& read_time() const { return read_time_; }
    const std::optional<Bytes>& transaction() const { return transaction_; }

  private:
    std::vector<Document> documents_;
    int64_t skipped_results_{0};
    Timestamp read_time_;
    std::optional<Bytes> transaction_;
};

//! Compiled structured query bound to a parent resource
class QueryEvaluator {
  public:
    //! Validate query and bind it to parent (a documents root or a document name)
    static Result<QueryEvaluator> create(std::string_view parent, StructuredQuery query);

    const StructuredQuery& query() const { return query_; }
    const ResourcePath& parent() const { return parent_; }

    //! Whether the document lives in a collection selected by the query
    bool in_scope(const Document& document) const;

    //! Whether the document belongs to the result set ignoring cursors, offset and limit:
    //! existing, in scope, passing the filter and holding every orderBy field
    bool matches(const Document& document) const;

    //! Whether the document lies between start_at and end_at
    bool within_cursors(const Document& document) const;

    //! Total order of the query: explicit orderBy keys then document name ascending
    //! \return negative, zero or positive like strcmp
    int compare(const Document& lhs, const Document& rhs) const;

    //! Matching documents from candidates, sorted and bounded by cursors, before offset and limit
    std::vector<Document> select(const std::vector<Document>& candidates) const;

    //! Evaluate over candidates producing the lazy response stream
    QueryResponseStream run(const std::vector<Document>& candidates, Timestamp read_time,
                            int64_t progress_interval = kDefaultProgressInterval) const;

    //! Collection group id selected by the query, empty when none
    const std::string& collection_id() const;

  private:
    QueryEvaluator(ResourcePath parent, StructuredQuery query);

    bool passes(const Filter& filter, const Document& document) const;
    int compare_to_cursor(const Document& document, const Cursor& cursor) const;

    ResourcePath parent_;
    StructuredQuery query_;
    std::vector<Order> effective_order_;
};

//! Field value of a document as seen by filters and ordering: __name__ maps to a reference
std::optional<Value> lookup_field(const Document& document, const FieldPath& path);

}  // namespace ember::db::query
