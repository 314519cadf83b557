// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_runner.hpp"

#include <exception>

#include <magic_enum.hpp>

#include <ember/infra/common/log.hpp>

namespace ember::db::txn {

Transaction::Transaction(service::Database& database, std::string database_name, Bytes token)
    : database_{database}, database_name_{std::move(database_name)}, token_{std::move(token)} {}

std::optional<Document> Transaction::get(const std::string& name) {
    auto document = database_.get_document(
        service::GetDocumentRequest{.name = name, .consistency = service::InTransaction{token_}});
    if (!document) {
        if (document.error().code() == StatusCode::kNotFound) return std::nullopt;
        throw StatusException{document.error()};
    }
    return std::move(*document);
}

std::vector<Document> Transaction::query(const std::string& parent, query::StructuredQuery query) {
    auto stream = unwrap_or_throw(database_.run_query(service::RunQueryRequest{
        .parent = parent,
        .structured_query = std::move(query),
        .consistency = service::InTransaction{token_},
    }));
    query::QueryResultMerger merger;
    while (auto response = stream.next()) {
        merger.add(*response);
    }
    return merger.documents();
}

MapValue Transaction::aggregate(const std::string& parent, query::StructuredQuery query,
                               std::vector<query::Aggregation> aggregations) {
    auto response = unwrap_or_throw(database_.run_aggregation_query(service::RunAggregationQueryRequest{
        .parent = parent,
        .structured_query = std::move(query),
        .aggregations = std::move(aggregations),
        .consistency = service::InTransaction{token_},
    }));
    return std::move(response.result);
}

Transaction& Transaction::create(Document document) {
    auto create = write::Write::update(std::move(document));
    create.with_precondition(write::Precondition::exists(false));
    return add(std::move(create));
}

Transaction& Transaction::set(Document document, std::optional<DocumentMask> mask) {
    return add(write::Write::update(std::move(document), std::move(mask)));
}

Transaction& Transaction::update(Document document, DocumentMask mask) {
    auto update = write::Write::update(std::move(document), std::move(mask));
    update.with_precondition(write::Precondition::exists(true));
    return add(std::move(update));
}

Transaction& Transaction::remove(std::string name, std::optional<write::Precondition> precondition) {
    auto remove = write::Write::remove(std::move(name));
    if (precondition) remove.with_precondition(*precondition);
    return add(std::move(remove));
}

Transaction& Transaction::add(write::Write write) {
    writes_.push_back(std::move(write));
    return *this;
}

TransactionRunner::TransactionRunner(service::Database& database, std::string database_name,
                                     TransactionRunnerSettings settings)
    : database_{database}, database_name_{std::move(database_name)}, settings_{settings} {}

bool TransactionRunner::is_retryable(const Status& status) {
    switch (status.code()) {
        case StatusCode::kAborted:
        case StatusCode::kCancelled:
        case StatusCode::kUnknown:
        case StatusCode::kDeadlineExceeded:
        case StatusCode::kInternal:
        case StatusCode::kUnavailable:
        case StatusCode::kUnauthenticated:
        case StatusCode::kResourceExhausted:
            return true;
        case StatusCode::kInvalidArgument:
            // An expired transaction can be started again
            return status.message() == kTransactionExpiredMessage;
        default:
            return false;
    }
}

void TransactionRunner::rollback(const Transaction& transaction) {
    const auto rolled_back = database_.rollback(
        service::RollbackRequest{.database = database_name_, .transaction = transaction.token()});
    if (!rolled_back) {
        // The transaction is dead anyway: the server discards it on expiry
        EMBER_DEBUG << "TransactionRunner: rollback failed" << log::Args{"status", rolled_back.error().to_string()};
    }
}

Task<write::CommitResult> TransactionRunner::run(Callback callback) {
    ExponentialBackoff backoff{settings_.backoff};
    std::optional<Bytes> previous;
    Status last_error{StatusCode::kUnknown, "transaction not attempted"};

    for (uint32_t attempt{0}; attempt < settings_.max_attempts; ++attempt) {
        if (attempt > 0) {
            co_await backoff.wait();
        }

        TransactionOptions options{ReadWriteOptions{previous}};
        if (settings_.read_only) {
            options = ReadOnlyOptions{settings_.read_time};
        }
        auto token = database_.begin_transaction(
            service::BeginTransactionRequest{.database = database_name_, .options = options});
        if (!token) {
            last_error = token.error();
            if (!is_retryable(last_error)) throw StatusException{last_error};
            continue;
        }
        if (!settings_.read_only) {
            previous = *token;
        }
        Transaction transaction{database_, database_name_, std::move(*token)};

        std::optional<Status> callback_error;
        try {
            co_await callback(transaction);
        } catch (const StatusException& ex) {
            callback_error = ex.status();
        } catch (const std::exception& ex) {
            EMBER_DEBUG << "TransactionRunner: callback failed" << log::Args{"what", ex.what()};
            rollback(transaction);
            throw;
        }
        if (callback_error) {
            rollback(transaction);
            if (!is_retryable(*callback_error)) throw StatusException{*callback_error};
            last_error = *callback_error;
            continue;
        }

        auto committed = database_.commit(service::CommitRequest{
            .database = database_name_,
            .writes = transaction.writes(),
            .transaction = transaction.token(),
        });
        if (committed) {
            co_return std::move(*committed);
        }
        last_error = committed.error();
        EMBER_DEBUG << "TransactionRunner: commit failed"
                    << log::Args{"attempt", std::to_string(attempt + 1), "code",
                                 std::string{magic_enum::enum_name(last_error.code())}, "message", last_error.message()};
        if (!is_retryable(last_error)) {
            throw StatusException{last_error};
        }
        if (last_error.code() == StatusCode::kResourceExhausted) {
            backoff.reset_to_max();
        }
    }
    throw StatusException{last_error};
}

}  // namespace ember::db::txn
