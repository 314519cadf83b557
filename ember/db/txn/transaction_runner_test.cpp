// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_runner.hpp"

#include <catch2/catch.hpp>

#include <ember/db/service/document_service.hpp>
#include <ember/infra/test_util/task_runner.hpp>

namespace ember::db::txn {

using service::DocumentService;

static const std::string kDatabase{"projects/p/databases/d"};
static const std::string kRoot{kDatabase + "/documents"};
static const std::string kCounter{kRoot + "/counters/c"};

//! No delay between attempts
static const BackoffSettings kNoDelay{.initial_delay = std::chrono::milliseconds{0},
                                      .max_delay = std::chrono::milliseconds{0}};

static Document counter(int64_t n) {
    return Document{.name = kCounter, .fields = {{"n", Value::integer(n)}}};
}

static int64_t count_of(const Document& document) {
    const Value* n = document.field(FieldPath::parse("n").value());
    REQUIRE(n != nullptr);
    return n->as_integer();
}

class RunnerFixture : public test_util::TaskRunner {
  public:
    RunnerFixture() {
        REQUIRE(database.import_documents({counter(1)}));
    }

    Timestamp now{1'000, 0};
    DocumentService database{service::DatabaseSettings{}, [this] { return now; }};
    TransactionRunner runner{database, kDatabase, TransactionRunnerSettings{.backoff = kNoDelay}};
};

TEST_CASE("Retryable status codes", "[ember][db][txn][runner]") {
    CHECK(TransactionRunner::is_retryable(aborted("conflict")));
    CHECK(TransactionRunner::is_retryable(Status{StatusCode::kUnavailable, "down"}));
    CHECK(TransactionRunner::is_retryable(resource_exhausted("busy")));
    CHECK(TransactionRunner::is_retryable(invalid_argument(std::string{kTransactionExpiredMessage})));
    CHECK_FALSE(TransactionRunner::is_retryable(invalid_argument("bad field path")));
    CHECK_FALSE(TransactionRunner::is_retryable(failed_precondition("missing")));
    CHECK_FALSE(TransactionRunner::is_retryable(not_found("gone")));
}

TEST_CASE_METHOD(RunnerFixture, "Read-modify-write commits once without contention", "[ember][db][txn][runner]") {
    int attempts{0};
    const auto result = run(runner.run([&](Transaction& transaction) -> Task<void> {
        ++attempts;
        const auto current = transaction.get(kCounter);
        REQUIRE(current);
        transaction.set(counter(count_of(*current) + 1));
        co_return;
    }));
    CHECK(attempts == 1);
    CHECK(result.write_results.size() == 1);

    const auto stored = database.get_document({.name = kCounter});
    REQUIRE(stored);
    CHECK(count_of(*stored) == 2);
    CHECK(stored->update_time == result.commit_time);
}

TEST_CASE_METHOD(RunnerFixture, "Conflicting commit is retried", "[ember][db][txn][runner]") {
    int attempts{0};
    const auto result = run(runner.run([&](Transaction& transaction) -> Task<void> {
        ++attempts;
        const auto current = transaction.get(kCounter);
        REQUIRE(current);
        if (attempts == 1) {
            // Another client wins the race
            const auto concurrent = database.commit({.database = kDatabase, .writes = {write::Write::update(counter(10))}});
            REQUIRE(concurrent);
        }
        transaction.set(counter(count_of(*current) + 1));
        co_return;
    }));
    CHECK(attempts == 2);

    const auto stored = database.get_document({.name = kCounter});
    REQUIRE(stored);
    CHECK(count_of(*stored) == 11);
    CHECK(stored->update_time == result.commit_time);
}

TEST_CASE_METHOD(RunnerFixture, "Persistent contention exhausts the attempts", "[ember][db][txn][runner]") {
    TransactionRunner limited{database, kDatabase, TransactionRunnerSettings{.max_attempts = 3, .backoff = kNoDelay}};
    int attempts{0};
    try {
        run(limited.run([&](Transaction& transaction) -> Task<void> {
            ++attempts;
            const auto current = transaction.get(kCounter);
            REQUIRE(current);
            REQUIRE(database.commit({.database = kDatabase, .writes = {write::Write::update(counter(attempts * 100))}}));
            transaction.set(counter(count_of(*current) + 1));
            co_return;
        }));
        FAIL("contention must fail the transaction");
    } catch (const StatusException& ex) {
        CHECK(ex.code() == StatusCode::kAborted);
    }
    CHECK(attempts == 3);

    const auto stored = database.get_document({.name = kCounter});
    REQUIRE(stored);
    CHECK(count_of(*stored) == 300);
}

TEST_CASE_METHOD(RunnerFixture, "Callback errors roll back without retry", "[ember][db][txn][runner]") {
    int attempts{0};
    Bytes token;

    SECTION("status error") {
        CHECK_THROWS_MATCHES(run(runner.run([&](Transaction& transaction) -> Task<void> {
                                 ++attempts;
                                 token = transaction.token();
                                 transaction.set(counter(42));
                                 throw StatusException{failed_precondition("counter is frozen")};
                                 co_return;
                             })),
                             StatusException, Catch::Predicate<StatusException>([](const StatusException& ex) {
                                 return ex.code() == StatusCode::kFailedPrecondition;
                             }));
    }
    SECTION("other exception") {
        CHECK_THROWS_AS(run(runner.run([&](Transaction& transaction) -> Task<void> {
                            ++attempts;
                            token = transaction.token();
                            throw std::runtime_error{"application failure"};
                            co_return;
                        })),
                        std::runtime_error);
    }
    CHECK(attempts == 1);

    // The attempt is gone: its token cannot commit anymore and nothing was written
    const auto late = database.commit({.database = kDatabase, .writes = {}, .transaction = token});
    REQUIRE_FALSE(late);
    CHECK(late.error().code() == StatusCode::kInvalidArgument);
    const auto stored = database.get_document({.name = kCounter});
    REQUIRE(stored);
    CHECK(count_of(*stored) == 1);
}

TEST_CASE_METHOD(RunnerFixture, "Create inside a transaction", "[ember][db][txn][runner]") {
    const std::string name{kRoot + "/counters/fresh"};

    const auto created = run(runner.run([&](Transaction& transaction) -> Task<void> {
        CHECK_FALSE(transaction.get(name));
        transaction.create(Document{.name = name, .fields = {{"n", Value::integer(0)}}});
        co_return;
    }));
    CHECK(created.write_results.size() == 1);

    // Creating it again violates the precondition, which is not retried
    CHECK_THROWS_MATCHES(run(runner.run([&](Transaction& transaction) -> Task<void> {
                             transaction.create(Document{.name = name, .fields = {}});
                             co_return;
                         })),
                         StatusException, Catch::Predicate<StatusException>([](const StatusException& ex) {
                             return ex.code() == StatusCode::kFailedPrecondition;
                         }));
}

TEST_CASE_METHOD(RunnerFixture, "Queries run at the transaction snapshot", "[ember][db][txn][runner]") {
    REQUIRE(database.import_documents({Document{.name = kRoot + "/counters/d", .fields = {{"n", Value::integer(5)}}}}));

    std::vector<Document> seen;
    run(runner.run([&](Transaction& transaction) -> Task<void> {
        query::StructuredQuery counters;
        counters.from.push_back({.collection_id = "counters"});
        seen = transaction.query(kRoot, std::move(counters));
        for (const auto& document : seen) {
            transaction.remove(document.name, write::Precondition::exists(true));
        }
        co_return;
    }));
    CHECK(seen.size() == 2);

    const auto listed = database.list_documents({.parent = kRoot, .collection_id = "counters"});
    REQUIRE(listed);
    CHECK(listed->documents.empty());
}

TEST_CASE_METHOD(RunnerFixture, "Aggregates are retried when an aggregated value changes", "[ember][db][txn][runner]") {
    REQUIRE(database.import_documents({Document{.name = kRoot + "/counters/d", .fields = {{"n", Value::integer(5)}}}}));

    int attempts{0};
    int64_t total{0};
    run(runner.run([&](Transaction& transaction) -> Task<void> {
        ++attempts;
        query::StructuredQuery counters;
        counters.from.push_back({.collection_id = "counters"});
        const MapValue result =
            transaction.aggregate(kRoot, std::move(counters), {query::Aggregation::sum("total", FieldPath::from_string("n"))});
        total = result.get("total")->as_integer();
        if (attempts == 1) {
            // Same documents match, only a value under the sum moves
            REQUIRE(database.commit({.database = kDatabase, .writes = {write::Write::update(counter(10))}}));
        }
        transaction.set(Document{.name = kRoot + "/totals/all", .fields = {{"n", Value::integer(total)}}});
        co_return;
    }));
    CHECK(attempts == 2);
    CHECK(total == 15);
}

TEST_CASE_METHOD(RunnerFixture, "Read-only runner", "[ember][db][txn][runner]") {
    TransactionRunner reader{database, kDatabase, TransactionRunnerSettings{.backoff = kNoDelay, .read_only = true}};
    std::optional<Document> seen;
    const auto result = run(reader.run([&](Transaction& transaction) -> Task<void> {
        seen = transaction.get(kCounter);
        co_return;
    }));
    REQUIRE(seen);
    CHECK(count_of(*seen) == 1);
    CHECK(result.write_results.empty());

    CHECK_THROWS_AS(run(reader.run([&](Transaction& transaction) -> Task<void> {
                        transaction.set(counter(7));
                        co_return;
                    })),
                    StatusException);
}

}  // namespace ember::db::txn
