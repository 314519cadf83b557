// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include <ember/core/common/status.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/datastore/document_store.hpp>
#include <ember/db/service/database.hpp>
#include <ember/db/txn/transaction_coordinator.hpp>
#include <ember/db/watch/listen_session.hpp>
#include <ember/db/write/write_pipeline.hpp>
#include <ember/db/write/write_stream.hpp>

namespace ember::db::service {

struct DatabaseSettings {
    //! Reads at a read time older than this are rejected
    std::chrono::seconds staleness_bound{60};
    //! History kept by the document store
    std::chrono::seconds version_retention{datastore::kDefaultVersionRetention};
    //! Skipped results after which a query reports progress
    int64_t progress_interval{query::kDefaultProgressInterval};
    txn::TransactionSettings transactions;
    write::WriteStreamSettings write_stream;
    //! Commits buffered per listen stream before the stream is closed with RESOURCE_EXHAUSTED
    size_t listen_buffer_size{1024};
    //! Send an existence filter per target along with the changes of each commit
    bool existence_filters_on_commit{false};
};

//! In-process implementation of the document database API over a multi-version store.
//! Unary calls are serialized on one mutex, streams run as coroutines on the caller executor.
class DocumentService : public Database {
  public:
    explicit DocumentService(DatabaseSettings settings = {}, Clock clock = Timestamp::now);
    ~DocumentService() override = default;

    Result<Document> get_document(const GetDocumentRequest& request) override;
    Result<ListDocumentsResponse> list_documents(const ListDocumentsRequest& request) override;
    Result<Document> create_document(const CreateDocumentRequest& request) override;
    Result<Document> update_document(const UpdateDocumentRequest& request) override;
    VoidResult delete_document(const DeleteDocumentRequest& request) override;
    Result<std::vector<BatchGetDocumentsResponse>> batch_get_documents(const BatchGetDocumentsRequest& request) override;
    Result<Bytes> begin_transaction(const BeginTransactionRequest& request) override;
    Result<write::CommitResult> commit(const CommitRequest& request) override;
    VoidResult rollback(const RollbackRequest& request) override;
    Result<query::QueryResponseStream> run_query(const RunQueryRequest& request) override;
    Result<AggregationQueryResponse> run_aggregation_query(const RunAggregationQueryRequest& request) override;
    Result<ListCollectionIdsResponse> list_collection_ids(const ListCollectionIdsRequest& request) override;

    Task<void> open_write_stream(WriteRequestChannel& requests, WriteResponseChannel& responses) override;
    Task<void> open_listen(watch::ListenRequestChannel& requests, watch::ListenResponseChannel& responses) override;

    //! Expire idle transactions, meant to be called periodically
    size_t expire_transactions();

    //! Drop disconnected write streams whose resume window has elapsed, meant to be called periodically
    size_t expire_write_streams();

    size_t write_stream_count() const;

    //! Load documents as if created by one commit, e.g. from a fixture
    Result<write::CommitResult> import_documents(const std::vector<Document>& documents);

    Timestamp latest_commit_time() const;

  private:
    //! Snapshot and transaction a read is served in
    struct ReadContext {
        Timestamp read_time;
        //! Transaction the read belongs to
        std::optional<Bytes> transaction;
        //! Whether the transaction was begun by this read
        bool began{false};
        bool read_only{false};
    };

    using ListenInput = std::variant<watch::ListenRequest, datastore::CommitEvent>;

    Result<ReadContext> resolve(const std::string& database, const StreamConsistency& consistency);
    VoidResult check_staleness(Timestamp read_time) const;
    VoidResult record_read(const ReadContext& context, const std::string& name, const std::optional<Document>& document);

    Result<write::CommitResult> commit_locked(const std::string& database, const std::vector<write::Write>& writes,
                                              const std::optional<Bytes>& transaction);
    Timestamp next_commit_time() const;
    std::string new_document_id();

    Task<void> forward_listen_requests(watch::ListenRequestChannel& requests, concurrency::Channel<ListenInput>& inbox);
    Task<void> serve_listen(concurrency::Channel<ListenInput>& inbox, watch::ListenResponseChannel& responses,
                            std::atomic_bool& overflow);

    DatabaseSettings settings_;
    Clock clock_;

    mutable std::mutex mutex_;
    datastore::DocumentStore store_;
    txn::TransactionCoordinator coordinator_;
    write::WritePipeline pipeline_;
    absl::flat_hash_map<std::string, std::shared_ptr<write::WriteStreamSession>> write_streams_;
    uint64_t next_stream_id_{1};
    Timestamp max_served_read_time_;
    std::mt19937_64 generator_{std::random_device{}()};
};

}  // namespace ember::db::service
