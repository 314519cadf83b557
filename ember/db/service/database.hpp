// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/db/query/query_evaluator.hpp>
#include <ember/db/service/requests.hpp>
#include <ember/db/watch/listen_stream.hpp>
#include <ember/db/write/write.hpp>
#include <ember/db/write/write_stream.hpp>
#include <ember/infra/concurrency/channel.hpp>
#include <ember/infra/concurrency/task.hpp>

namespace ember::db::service {

using WriteRequestChannel = concurrency::Channel<write::WriteRequest>;
//! Server to client half of a write stream: responses, or the status closing the stream
using WriteResponseChannel = concurrency::Channel<Result<write::WriteResponse>>;

//! Document database API: unary reads and writes, transactions and the write and listen streams
class Database {
  public:
    Database() = default;
    virtual ~Database() = default;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    virtual Result<Document> get_document(const GetDocumentRequest& request) = 0;

    virtual Result<ListDocumentsResponse> list_documents(const ListDocumentsRequest& request) = 0;

    //! Create a new document, ALREADY_EXISTS if the name is taken
    virtual Result<Document> create_document(const CreateDocumentRequest& request) = 0;

    //! Update or insert a document, NOT_FOUND if it must exist and does not
    virtual Result<Document> update_document(const UpdateDocumentRequest& request) = 0;

    virtual VoidResult delete_document(const DeleteDocumentRequest& request) = 0;

    //! One response per requested document, in request order
    virtual Result<std::vector<BatchGetDocumentsResponse>> batch_get_documents(const BatchGetDocumentsRequest& request) = 0;

    virtual Result<Bytes> begin_transaction(const BeginTransactionRequest& request) = 0;

    //! Apply writes atomically, inside transaction when set
    virtual Result<write::CommitResult> commit(const CommitRequest& request) = 0;

    virtual VoidResult rollback(const RollbackRequest& request) = 0;

    virtual Result<query::QueryResponseStream> run_query(const RunQueryRequest& request) = 0;

    //! Count, sum and average over the results of a structured query
    virtual Result<AggregationQueryResponse> run_aggregation_query(const RunAggregationQueryRequest& request) = 0;

    virtual Result<ListCollectionIdsResponse> list_collection_ids(const ListCollectionIdsRequest& request) = 0;

    //! Serve one write stream until the client closes its requests or an error closes the stream
    virtual Task<void> open_write_stream(WriteRequestChannel& requests, WriteResponseChannel& responses) = 0;

    //! Serve one listen stream until the client closes its requests or an error closes the stream
    virtual Task<void> open_listen(watch::ListenRequestChannel& requests, watch::ListenResponseChannel& responses) = 0;
};

}  // namespace ember::db::service
