// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "document_service.hpp"

#include <algorithm>

#include <absl/strings/escaping.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/this_coro.hpp>
#include <gsl/util>

#include <ember/core/common/overloaded.hpp>
#include <ember/core/types/path.hpp>
#include <ember/infra/common/ensure.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::service {

namespace {

    constexpr std::string_view kPageTokenPrefix{"offset:"};

    std::string encode_page_token(size_t offset) {
        return absl::WebSafeBase64Escape(absl::StrCat(kPageTokenPrefix, offset));
    }

    Result<size_t> decode_page_token(const std::string& token) {
        if (token.empty()) return size_t{0};
        std::string decoded;
        if (!absl::WebSafeBase64Unescape(token, &decoded)) {
            return make_error(StatusCode::kInvalidArgument, "invalid page token");
        }
        absl::string_view payload{decoded};
        size_t offset{0};
        if (!absl::ConsumePrefix(&payload, kPageTokenPrefix) || !absl::SimpleAtoi(payload, &offset)) {
            return make_error(StatusCode::kInvalidArgument, "invalid page token");
        }
        return offset;
    }

    //! Page [offset, offset + page_size) of total elements, page_size zero meaning unbounded
    std::pair<size_t, size_t> page_bounds(size_t offset, int32_t page_size, size_t total) {
        const size_t begin = std::min(offset, total);
        const size_t end = page_size > 0 ? std::min(begin + static_cast<size_t>(page_size), total) : total;
        return {begin, end};
    }

    VoidResult validate_database_name(std::string_view database) {
        const auto path = ResourcePath::parse(database);
        if (!path || path->size() != 4 || path->segment(0) != "projects" || path->segment(2) != "databases") {
            return make_error(StatusCode::kInvalidArgument, "invalid database name: " + std::string{database});
        }
        return {};
    }

    VoidResult validate_collection_id(std::string_view collection_id) {
        if (collection_id.empty() || absl::StrContains(collection_id, '/')) {
            return make_error(StatusCode::kInvalidArgument, "invalid collection id: " + std::string{collection_id});
        }
        return {};
    }

    //! Parse "field [asc|desc], ..." as used by document listings
    Result<std::vector<query::Order>> parse_order_by(std::string_view order_by) {
        std::vector<query::Order> orders;
        for (std::string_view clause : absl::StrSplit(order_by, ',')) {
            std::vector<std::string_view> words = absl::StrSplit(clause, ' ', absl::SkipWhitespace());
            if (words.empty() || words.size() > 2) {
                return make_error(StatusCode::kInvalidArgument, "invalid order by clause: " + std::string{clause});
            }
            auto field = FieldPath::parse(words[0]);
            if (!field) return make_error(field.error());
            query::Order order{.field = std::move(*field)};
            if (words.size() == 2) {
                if (words[1] == "desc") {
                    order.direction = query::Direction::kDescending;
                } else if (words[1] != "asc") {
                    return make_error(StatusCode::kInvalidArgument, "invalid order direction: " + std::string{words[1]});
                }
            }
            orders.push_back(std::move(order));
        }
        return orders;
    }

    StreamConsistency to_stream_consistency(const ReadConsistency& consistency) {
        return std::visit([](const auto& selector) -> StreamConsistency { return selector; }, consistency);
    }

    Document apply_mask(Document document, const std::optional<DocumentMask>& mask) {
        if (mask && document.exists()) return document.project(*mask);
        return document;
    }

    bool requires_existence(const std::optional<write::Precondition>& precondition) {
        if (!precondition) return false;
        const bool* exists = std::get_if<bool>(&precondition->condition);
        return exists != nullptr && *exists;
    }

}  // namespace

DocumentService::DocumentService(DatabaseSettings settings, Clock clock)
    : settings_{std::move(settings)},
      clock_{std::move(clock)},
      store_{settings_.version_retention},
      coordinator_{store_, settings_.transactions, clock_},
      pipeline_{store_} {
    // Open transactions keep reading their snapshot however long they last
    store_.set_retention_floor([this] { return coordinator_.oldest_read_time(); });
}

Timestamp DocumentService::latest_commit_time() const {
    std::scoped_lock lock{mutex_};
    return store_.latest_commit_time();
}

VoidResult DocumentService::check_staleness(Timestamp read_time) const {
    if (read_time < clock_().plus(-settings_.staleness_bound) || read_time < store_.earliest_read_time()) {
        return make_error(StatusCode::kInvalidArgument, "read time " + read_time.to_string() + " is too old");
    }
    return {};
}

Result<DocumentService::ReadContext> DocumentService::resolve(const std::string& database,
                                                              const StreamConsistency& consistency) {
    ReadContext context{.read_time = store_.latest_commit_time()};
    if (const auto* in_transaction = std::get_if<InTransaction>(&consistency)) {
        auto read_time = coordinator_.read_time(database, in_transaction->transaction);
        if (!read_time) return make_error(read_time.error());
        const auto info = coordinator_.info(in_transaction->transaction);
        context.read_time = *read_time;
        context.transaction = in_transaction->transaction;
        context.read_only = info && info->read_only;
    } else if (const auto* new_transaction = std::get_if<NewTransaction>(&consistency)) {
        const auto* read_only = std::get_if<txn::ReadOnlyOptions>(&new_transaction->options);
        if (read_only && read_only->read_time) {
            if (auto fresh = check_staleness(*read_only->read_time); !fresh) return make_error(fresh.error());
        }
        auto token = coordinator_.begin(database, new_transaction->options);
        if (!token) return make_error(token.error());
        auto read_time = coordinator_.read_time(database, *token);
        if (!read_time) return make_error(read_time.error());
        context.read_time = *read_time;
        context.transaction = std::move(*token);
        context.began = true;
        context.read_only = read_only != nullptr;
    } else if (const auto* at = std::get_if<AtReadTime>(&consistency)) {
        if (auto fresh = check_staleness(at->read_time); !fresh) return make_error(fresh.error());
        context.read_time = at->read_time;
    }
    if (context.read_time > max_served_read_time_) {
        max_served_read_time_ = context.read_time;
    }
    return context;
}

VoidResult DocumentService::record_read(const ReadContext& context, const std::string& name,
                                        const std::optional<Document>& document) {
    if (!context.transaction || context.read_only) return {};
    return coordinator_.record_read(*context.transaction, name, document);
}

Timestamp DocumentService::next_commit_time() const {
    return std::max({clock_(), store_.latest_commit_time().successor(), max_served_read_time_.successor()});
}

std::string DocumentService::new_document_id() {
    static constexpr std::string_view kAlphabet{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"};
    std::uniform_int_distribution<size_t> distribution{0, kAlphabet.size() - 1};
    std::string id(20, ' ');
    for (auto& c : id) {
        c = kAlphabet[distribution(generator_)];
    }
    return id;
}

Result<Document> DocumentService::get_document(const GetDocumentRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_document_name(request.name); !valid) return make_error(valid.error());
    const auto context = resolve(database_name_of(request.name), to_stream_consistency(request.consistency));
    if (!context) return make_error(context.error());

    auto document = store_.get(request.name, context->read_time);
    if (auto recorded = record_read(*context, request.name, document); !recorded) return make_error(recorded.error());
    if (!document) {
        return make_error(StatusCode::kNotFound, "document " + request.name + " not found");
    }
    return apply_mask(std::move(*document), request.mask);
}

Result<ListDocumentsResponse> DocumentService::list_documents(const ListDocumentsRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_parent_name(request.parent); !valid) return make_error(valid.error());
    if (auto valid = validate_collection_id(request.collection_id); !valid) return make_error(valid.error());
    if (request.page_size < 0) {
        return make_error(StatusCode::kInvalidArgument, "negative page size");
    }
    if (request.show_missing && !request.order_by.empty()) {
        return make_error(StatusCode::kInvalidArgument, "show missing cannot be combined with order by");
    }
    const auto offset = decode_page_token(request.page_token);
    if (!offset) return make_error(offset.error());

    query::StructuredQuery listing;
    listing.from.push_back({.collection_id = request.collection_id});
    if (!request.order_by.empty()) {
        auto order = parse_order_by(request.order_by);
        if (!order) return make_error(order.error());
        listing.order_by = std::move(*order);
    }
    const auto evaluator = query::QueryEvaluator::create(request.parent, std::move(listing));
    if (!evaluator) return make_error(evaluator.error());

    const auto context = resolve(database_name_of(request.parent), to_stream_consistency(request.consistency));
    if (!context) return make_error(context.error());

    auto documents = store_.list_collection(request.parent + "/" + request.collection_id, context->read_time,
                                            request.show_missing);
    if (!request.order_by.empty()) {
        documents = evaluator->select(documents);
    }
    if (context->transaction && !context->read_only && !request.show_missing) {
        std::vector<std::string> names;
        names.reserve(documents.size());
        for (const auto& document : documents) names.push_back(document.name);
        if (auto recorded = coordinator_.record_query(*context->transaction, *evaluator, std::move(names)); !recorded) {
            return make_error(recorded.error());
        }
    }

    ListDocumentsResponse response;
    const auto [begin, end] = page_bounds(*offset, request.page_size, documents.size());
    for (size_t i{begin}; i < end; ++i) {
        response.documents.push_back(apply_mask(std::move(documents[i]), request.mask));
    }
    if (end < documents.size()) {
        response.next_page_token = encode_page_token(end);
    }
    return response;
}

Result<Document> DocumentService::create_document(const CreateDocumentRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_parent_name(request.parent); !valid) return make_error(valid.error());
    if (auto valid = validate_collection_id(request.collection_id); !valid) return make_error(valid.error());

    const std::string id = request.document_id.empty() ? new_document_id() : request.document_id;
    const std::string name = absl::StrCat(request.parent, "/", request.collection_id, "/", id);
    if (auto valid = validate_document_name(name); !valid) return make_error(valid.error());

    auto create = write::Write::update(Document{.name = name, .fields = request.fields});
    create.with_precondition(write::Precondition::exists(false));
    const auto committed = commit_locked(database_name_of(name), {create}, std::nullopt);
    if (!committed) {
        if (committed.error().code() == StatusCode::kFailedPrecondition) {
            return make_error(StatusCode::kAlreadyExists, "document " + name + " already exists");
        }
        return make_error(committed.error());
    }
    auto document = store_.get(name);
    ensure_invariant(document.has_value(), [&] { return "created document " + name + " not found"; });
    return apply_mask(std::move(*document), request.mask);
}

Result<Document> DocumentService::update_document(const UpdateDocumentRequest& request) {
    std::scoped_lock lock{mutex_};
    const std::string& name = request.document.name;
    if (auto valid = validate_document_name(name); !valid) return make_error(valid.error());
    if (requires_existence(request.current_document) && !store_.get(name)) {
        return make_error(StatusCode::kNotFound, "document " + name + " not found");
    }

    auto update = write::Write::update(request.document, request.update_mask);
    if (request.current_document) update.with_precondition(*request.current_document);
    const auto committed = commit_locked(database_name_of(name), {update}, std::nullopt);
    if (!committed) return make_error(committed.error());

    auto document = store_.get(name);
    ensure_invariant(document.has_value(), [&] { return "updated document " + name + " not found"; });
    return apply_mask(std::move(*document), request.mask);
}

VoidResult DocumentService::delete_document(const DeleteDocumentRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_document_name(request.name); !valid) return make_error(valid.error());
    if (requires_existence(request.current_document) && !store_.get(request.name)) {
        return make_error(StatusCode::kNotFound, "document " + request.name + " not found");
    }

    auto remove = write::Write::remove(request.name);
    if (request.current_document) remove.with_precondition(*request.current_document);
    const auto committed = commit_locked(database_name_of(request.name), {remove}, std::nullopt);
    if (!committed) return make_error(committed.error());
    return {};
}

Result<std::vector<BatchGetDocumentsResponse>> DocumentService::batch_get_documents(
    const BatchGetDocumentsRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_database_name(request.database); !valid) return make_error(valid.error());
    for (const auto& name : request.documents) {
        if (auto valid = validate_document_name(name); !valid) return make_error(valid.error());
        if (database_name_of(name) != request.database) {
            return make_error(StatusCode::kInvalidArgument, "document " + name + " is not in " + request.database);
        }
    }
    const auto context = resolve(request.database, request.consistency);
    if (!context) return make_error(context.error());

    std::vector<BatchGetDocumentsResponse> responses;
    responses.reserve(request.documents.size());
    for (const auto& name : request.documents) {
        auto document = store_.get(name, context->read_time);
        if (auto recorded = record_read(*context, name, document); !recorded) return make_error(recorded.error());
        BatchGetDocumentsResponse response{.read_time = context->read_time};
        if (document) {
            response.found = apply_mask(std::move(*document), request.mask);
        } else {
            response.missing = name;
        }
        responses.push_back(std::move(response));
    }
    if (context->began) {
        if (responses.empty()) {
            responses.push_back(BatchGetDocumentsResponse{.read_time = context->read_time});
        }
        responses.front().transaction = context->transaction;
    }
    return responses;
}

Result<Bytes> DocumentService::begin_transaction(const BeginTransactionRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_database_name(request.database); !valid) return make_error(valid.error());
    coordinator_.expire_idle();
    if (const auto* read_only = std::get_if<txn::ReadOnlyOptions>(&request.options); read_only && read_only->read_time) {
        if (auto fresh = check_staleness(*read_only->read_time); !fresh) return make_error(fresh.error());
        if (*read_only->read_time > max_served_read_time_) max_served_read_time_ = *read_only->read_time;
    }
    return coordinator_.begin(request.database, request.options);
}

Result<write::CommitResult> DocumentService::commit(const CommitRequest& request) {
    std::scoped_lock lock{mutex_};
    return commit_locked(request.database, request.writes, request.transaction);
}

Result<write::CommitResult> DocumentService::commit_locked(const std::string& database,
                                                           const std::vector<write::Write>& writes,
                                                           const std::optional<Bytes>& transaction) {
    if (auto valid = validate_database_name(database); !valid) return make_error(valid.error());
    if (auto valid = write::validate_writes(writes); !valid) return make_error(valid.error());
    for (const auto& write : writes) {
        if (database_name_of(write.name()) != database) {
            return make_error(StatusCode::kInvalidArgument, "document " + write.name() + " is not in " + database);
        }
    }
    if (transaction) {
        if (auto checked = coordinator_.check_commit(database, *transaction, writes); !checked) {
            return make_error(checked.error());
        }
    }

    const Timestamp commit_time = next_commit_time();
    auto staged = pipeline_.stage(writes, commit_time);
    if (!staged) {
        if (transaction && staged.error().code() == StatusCode::kFailedPrecondition) {
            coordinator_.finish(*transaction, txn::TransactionState::kRolledBack);
        }
        return make_error(staged.error());
    }
    if (transaction) {
        if (auto validated = coordinator_.validate_snapshot(*transaction, writes); !validated) {
            return make_error(validated.error());
        }
    }
    if (!writes.empty()) {
        store_.commit(std::move(staged->mutations), commit_time);
    }
    if (transaction) {
        coordinator_.finish(*transaction, txn::TransactionState::kCommitted);
    }
    EMBER_DEBUG << "DocumentService::commit"
                << log::Args{"database", database, "writes", std::to_string(writes.size()), "commit_time",
                             commit_time.to_string(), "transactional", transaction ? "true" : "false"};
    return write::CommitResult{.write_results = std::move(staged->results), .commit_time = commit_time};
}

VoidResult DocumentService::rollback(const RollbackRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_database_name(request.database); !valid) return make_error(valid.error());
    return coordinator_.rollback(request.database, request.transaction);
}

Result<query::QueryResponseStream> DocumentService::run_query(const RunQueryRequest& request) {
    std::scoped_lock lock{mutex_};
    const auto evaluator = query::QueryEvaluator::create(request.parent, request.structured_query);
    if (!evaluator) return make_error(evaluator.error());
    const auto context = resolve(database_name_of(request.parent), request.consistency);
    if (!context) return make_error(context.error());

    const auto candidates = store_.scan(request.parent, context->read_time);
    auto stream = evaluator->run(candidates, context->read_time, settings_.progress_interval);
    if (context->transaction && !context->read_only) {
        std::vector<std::string> names;
        auto replay = stream;
        while (auto response = replay.next()) {
            if (!response->document) continue;
            names.push_back(response->document->name);
            if (auto recorded = record_read(*context, response->document->name, response->document); !recorded) {
                return make_error(recorded.error());
            }
        }
        if (auto recorded = coordinator_.record_query(*context->transaction, *evaluator, std::move(names)); !recorded) {
            return make_error(recorded.error());
        }
    }
    if (context->began) {
        stream.set_transaction(*context->transaction);
    }
    return stream;
}

Result<AggregationQueryResponse> DocumentService::run_aggregation_query(const RunAggregationQueryRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = query::validate_aggregations(request.aggregations); !valid) return make_error(valid.error());
    const auto evaluator = query::QueryEvaluator::create(request.parent, request.structured_query);
    if (!evaluator) return make_error(evaluator.error());
    const auto context = resolve(database_name_of(request.parent), request.consistency);
    if (!context) return make_error(context.error());

    const auto results = query::query_results(*evaluator, store_.scan(request.parent, context->read_time));
    if (context->transaction && !context->read_only) {
        std::vector<std::string> names;
        names.reserve(results.size());
        for (const auto& document : results) {
            names.push_back(document.name);
            if (auto recorded = record_read(*context, document.name, document); !recorded) {
                return make_error(recorded.error());
            }
        }
        if (auto recorded = coordinator_.record_query(*context->transaction, *evaluator, std::move(names)); !recorded) {
            return make_error(recorded.error());
        }
    }
    AggregationQueryResponse response{.result = query::aggregate(request.aggregations, results),
                                      .read_time = context->read_time};
    if (context->began) {
        response.transaction = *context->transaction;
    }
    return response;
}

Result<ListCollectionIdsResponse> DocumentService::list_collection_ids(const ListCollectionIdsRequest& request) {
    std::scoped_lock lock{mutex_};
    if (auto valid = validate_parent_name(request.parent); !valid) return make_error(valid.error());
    if (request.page_size < 0) {
        return make_error(StatusCode::kInvalidArgument, "negative page size");
    }
    const auto offset = decode_page_token(request.page_token);
    if (!offset) return make_error(offset.error());
    if (request.read_time) {
        if (auto fresh = check_staleness(*request.read_time); !fresh) return make_error(fresh.error());
    }

    auto ids = store_.collection_ids(request.parent, request.read_time);
    ListCollectionIdsResponse response;
    const auto [begin, end] = page_bounds(*offset, request.page_size, ids.size());
    response.collection_ids.assign(std::make_move_iterator(ids.begin() + static_cast<std::ptrdiff_t>(begin)),
                                   std::make_move_iterator(ids.begin() + static_cast<std::ptrdiff_t>(end)));
    if (end < ids.size()) {
        response.next_page_token = encode_page_token(end);
    }
    return response;
}

size_t DocumentService::expire_transactions() {
    std::scoped_lock lock{mutex_};
    return coordinator_.expire_idle();
}

size_t DocumentService::expire_write_streams() {
    std::scoped_lock lock{mutex_};
    const Timestamp now = clock_();
    const auto expired = absl::erase_if(write_streams_, [&](const auto& entry) { return entry.second->is_expired(now); });
    if (expired > 0) {
        EMBER_DEBUG << "DocumentService: write streams expired" << log::Args{"count", std::to_string(expired)};
    }
    return expired;
}

size_t DocumentService::write_stream_count() const {
    std::scoped_lock lock{mutex_};
    return write_streams_.size();
}

Result<write::CommitResult> DocumentService::import_documents(const std::vector<Document>& documents) {
    std::scoped_lock lock{mutex_};
    std::vector<write::Write> writes;
    writes.reserve(documents.size());
    for (const auto& document : documents) {
        if (auto valid = validate_document_name(document.name); !valid) return make_error(valid.error());
        writes.push_back(write::Write::update(Document{.name = document.name, .fields = document.fields}));
    }
    return pipeline_.apply(writes, next_commit_time());
}

Task<void> DocumentService::open_write_stream(WriteRequestChannel& requests, WriteResponseChannel& responses) {
    [[maybe_unused]] auto _ = gsl::finally([&]() { responses.close(); });

    auto first = co_await requests.receive();
    if (!first) co_return;

    std::shared_ptr<write::WriteStreamSession> session;
    Result<std::vector<write::WriteResponse>> opened;
    {
        std::scoped_lock lock{mutex_};
        if (auto valid = validate_database_name(first->database); !valid) {
            opened = make_error(valid.error());
        } else if (!first->writes.empty()) {
            opened = make_error(StatusCode::kInvalidArgument, "first request of a write stream cannot carry writes");
        } else if (first->stream_id.empty()) {
            const std::string stream_id = absl::StrCat("stream-", next_stream_id_++);
            auto commit = [this, database = first->database](const std::vector<write::Write>& writes) {
                return commit_locked(database, writes, std::nullopt);
            };
            session = std::make_shared<write::WriteStreamSession>(stream_id, settings_.write_stream, std::move(commit));
            write_streams_.emplace(stream_id, session);
            opened = std::vector<write::WriteResponse>{session->handshake()};
        } else if (const auto it = write_streams_.find(first->stream_id); it == write_streams_.end()) {
            opened = make_error(StatusCode::kNotFound, "write stream " + first->stream_id + " not found");
        } else {
            session = it->second;
            opened = session->resume(first->stream_token);
        }
        if (session) session->touch(clock_());
    }
    if (!opened) {
        EMBER_DEBUG << "DocumentService: write stream rejected" << log::Args{"status", opened.error().to_string()};
        co_await responses.send(make_error(opened.error()));
        co_return;
    }
    EMBER_DEBUG << "DocumentService: write stream open"
                << log::Args{"stream_id", session->stream_id(), "replayed", std::to_string(opened->size() - 1)};
    for (auto& response : *opened) {
        co_await responses.send(std::move(response));
    }

    const std::string database = first->database;
    while (auto request = co_await requests.receive()) {
        Result<std::optional<write::WriteResponse>> outcome;
        {
            std::scoped_lock lock{mutex_};
            if (!request->database.empty() && request->database != database) {
                session->disconnect();
                outcome = make_error(StatusCode::kInvalidArgument, "write stream bound to " + database);
            } else {
                outcome = session->handle(*request);
            }
            session->touch(clock_());
            // Only streams closed for flow control can be resumed
            if (!outcome && !write::WriteStreamClient::should_reopen(outcome.error())) {
                write_streams_.erase(session->stream_id());
            }
        }
        if (!outcome) {
            co_await responses.send(make_error(outcome.error()));
            co_return;
        }
        if (*outcome) {
            co_await responses.send(std::move(**outcome));
        }
    }

    std::scoped_lock lock{mutex_};
    session->disconnect();
    session->touch(clock_());
    if (session->unacknowledged() == 0) {
        write_streams_.erase(session->stream_id());
    }
}

Task<void> DocumentService::open_listen(watch::ListenRequestChannel& requests, watch::ListenResponseChannel& responses) {
    using namespace boost::asio::experimental::awaitable_operators;

    auto executor = co_await boost::asio::this_coro::executor;
    concurrency::Channel<ListenInput> inbox{executor, settings_.listen_buffer_size};
    std::atomic_bool overflow{false};

    uint64_t subscription{0};
    {
        std::scoped_lock lock{mutex_};
        subscription = store_.subscribe([&inbox, &overflow](const datastore::CommitEvent& event) {
            if (!inbox.try_send(ListenInput{event})) {
                overflow = true;
            }
        });
    }
    [[maybe_unused]] auto _ = gsl::finally([&]() {
        {
            std::scoped_lock lock{mutex_};
            store_.unsubscribe(subscription);
        }
        responses.close();
    });

    co_await (forward_listen_requests(requests, inbox) || serve_listen(inbox, responses, overflow));
}

Task<void> DocumentService::forward_listen_requests(watch::ListenRequestChannel& requests,
                                                    concurrency::Channel<ListenInput>& inbox) {
    while (auto request = co_await requests.receive()) {
        co_await inbox.send(ListenInput{std::move(*request)});
    }
    EMBER_DEBUG << "DocumentService: listen stream closed by client";
}

Task<void> DocumentService::serve_listen(concurrency::Channel<ListenInput>& inbox, watch::ListenResponseChannel& responses,
                                         std::atomic_bool& overflow) {
    std::optional<watch::ListenSession> session;
    while (auto input = co_await inbox.receive()) {
        std::vector<watch::ListenResponse> outgoing;
        Status failure;
        {
            std::scoped_lock lock{mutex_};
            if (overflow) {
                failure = resource_exhausted("listen stream fell behind the commits");
            } else if (auto* request = std::get_if<watch::ListenRequest>(&*input)) {
                if (!session) {
                    if (auto valid = validate_database_name(request->database); !valid) {
                        failure = valid.error();
                    } else {
                        session.emplace(store_, request->database);
                    }
                }
                if (session) {
                    auto handled = session->handle(*request);
                    if (handled) {
                        outgoing = std::move(*handled);
                    } else {
                        failure = handled.error();
                    }
                }
            } else if (session) {
                outgoing = session->on_commit(std::get<datastore::CommitEvent>(*input));
                if (settings_.existence_filters_on_commit && !outgoing.empty()) {
                    // Counts reflect the changes just sent, before the global no-change closing the batch
                    auto no_change = std::move(outgoing.back());
                    outgoing.pop_back();
                    for (const auto& filter : session->existence_filters()) {
                        outgoing.emplace_back(filter);
                    }
                    outgoing.push_back(std::move(no_change));
                }
            }
        }
        if (!failure.ok()) {
            EMBER_DEBUG << "DocumentService: listen stream failed" << log::Args{"status", failure.to_string()};
            co_await responses.send(make_error(failure));
            co_return;
        }
        for (auto& response : outgoing) {
            co_await responses.send(std::move(response));
        }
    }
}

}  // namespace ember::db::service
