// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_coordinator.hpp"

#include <catch2/catch.hpp>

namespace ember::db::txn {

static const std::string kDatabase{"projects/p/databases/d"};
static const std::string kRoot{kDatabase + "/documents"};

class CoordinatorFixture {
  public:
    CoordinatorFixture() {
        now = {100, 0};
        store.commit({upsert("c/a", 1), upsert("c/b", 2)}, now);
    }

    datastore::Mutation upsert(const std::string& path, int64_t n) const {
        return datastore::Mutation{kRoot + "/" + path, Document{
                                                           .name = kRoot + "/" + path,
                                                           .fields = {{"n", Value::integer(n)}},
                                                           .create_time = now,
                                                           .update_time = now,
                                                       }};
    }

    void commit_at(int64_t seconds, std::vector<datastore::Mutation> mutations) {
        now = {seconds, 0};
        for (auto& mutation : mutations) {
            if (mutation.document) mutation.document->update_time = now;
        }
        store.commit(std::move(mutations), now);
    }

    Bytes begin_read_write() {
        const auto token = coordinator.begin(kDatabase, ReadWriteOptions{});
        REQUIRE(token);
        return *token;
    }

    datastore::DocumentStore store{std::chrono::seconds{0}};
    Timestamp now;
    TransactionCoordinator coordinator{store, TransactionSettings{}, [this] { return now; }};
};

TEST_CASE_METHOD(CoordinatorFixture, "Begin assigns a snapshot", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    CHECK(token.size() == 16);
    CHECK(coordinator.read_time(kDatabase, token) == Timestamp{100, 0});
    CHECK(coordinator.active_count() == 1);

    const auto info = coordinator.info(token);
    REQUIRE(info);
    CHECK(info->attempt == 0);
    CHECK_FALSE(info->read_only);
    CHECK(info->state == TransactionState::kActive);

    SECTION("token is bound to its database") {
        const auto other = coordinator.read_time("projects/p/databases/other", token);
        REQUIRE_FALSE(other);
        CHECK(other.error().code() == StatusCode::kInvalidArgument);
    }

    SECTION("unknown and empty tokens") {
        CHECK(coordinator.read_time(kDatabase, string_to_bytes("nope")).error().code() == StatusCode::kNotFound);
        CHECK(coordinator.read_time(kDatabase, Bytes{}).error().code() == StatusCode::kInvalidArgument);
    }
}

TEST_CASE_METHOD(CoordinatorFixture, "Read-only transactions", "[ember][db][txn]") {
    commit_at(200, {upsert("c/a", 10)});

    SECTION("pinned read time") {
        const auto token = coordinator.begin(kDatabase, ReadOnlyOptions{Timestamp{150, 0}});
        REQUIRE(token);
        CHECK(coordinator.read_time(kDatabase, *token) == Timestamp{150, 0});
    }

    SECTION("writes are rejected") {
        const auto token = coordinator.begin(kDatabase, ReadOnlyOptions{});
        REQUIRE(token);
        const auto checked = coordinator.check_commit(kDatabase, *token, {write::Write::remove(kRoot + "/c/a")});
        REQUIRE_FALSE(checked);
        CHECK(checked.error().code() == StatusCode::kInvalidArgument);
        CHECK(coordinator.check_commit(kDatabase, *token, {}));
    }
}

TEST_CASE_METHOD(CoordinatorFixture, "Read-only transaction before the retained versions", "[ember][db][txn]") {
    datastore::DocumentStore pruning{std::chrono::seconds{10}};
    TransactionCoordinator pruned{pruning, TransactionSettings{}, [this] { return now; }};
    pruning.commit({upsert("c/a", 1)}, {100, 0});
    pruning.commit({upsert("c/a", 2)}, {200, 0});

    const auto token = pruned.begin(kDatabase, ReadOnlyOptions{Timestamp{120, 0}});
    REQUIRE_FALSE(token);
    CHECK(token.error().code() == StatusCode::kInvalidArgument);
}

TEST_CASE_METHOD(CoordinatorFixture, "Conflicting read aborts the transaction", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    REQUIRE(coordinator.record_read(token, kRoot + "/c/a", store.get(kRoot + "/c/a")));

    commit_at(200, {upsert("c/a", 5)});

    REQUIRE(coordinator.check_commit(kDatabase, token, {}));
    const auto validated = coordinator.validate_snapshot(token, {});
    REQUIRE_FALSE(validated);
    CHECK(validated.error().code() == StatusCode::kAborted);
    CHECK(coordinator.info(token)->state == TransactionState::kRolledBack);

    const auto reused = coordinator.check_commit(kDatabase, token, {});
    REQUIRE_FALSE(reused);
    CHECK(reused.error().code() == StatusCode::kInvalidArgument);
}

TEST_CASE_METHOD(CoordinatorFixture, "Absent read later created aborts the transaction", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    REQUIRE(coordinator.record_read(token, kRoot + "/c/z", std::nullopt));

    SECTION("unchanged") {
        CHECK(coordinator.validate_snapshot(token, {}));
    }
    SECTION("created") {
        commit_at(200, {upsert("c/z", 1)});
        CHECK(coordinator.validate_snapshot(token, {}).error().code() == StatusCode::kAborted);
    }
}

TEST_CASE_METHOD(CoordinatorFixture, "Blind write conflicts with a concurrent commit", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    commit_at(200, {upsert("c/b", 7)});

    const std::vector<write::Write> on_a{write::Write::remove(kRoot + "/c/a")};
    const std::vector<write::Write> on_b{write::Write::remove(kRoot + "/c/b")};
    CHECK(coordinator.validate_snapshot(token, on_a));
    CHECK(coordinator.validate_snapshot(token, on_b).error().code() == StatusCode::kAborted);
}

TEST_CASE_METHOD(CoordinatorFixture, "Query phantoms abort the transaction", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    query::StructuredQuery structured;
    structured.from.push_back({.collection_id = "c"});
    structured.where = query::field_filter("n", query::FieldOperator::kGreaterThan, Value::integer(0));
    auto evaluator = query::QueryEvaluator::create(kRoot, structured);
    REQUIRE(evaluator);
    REQUIRE(coordinator.record_query(token, *evaluator, {kRoot + "/c/a", kRoot + "/c/b"}));

    SECTION("non matching insert") {
        commit_at(200, {upsert("c/n", -1)});
        CHECK(coordinator.validate_snapshot(token, {}));
    }
    SECTION("matching insert") {
        commit_at(200, {upsert("c/n", 3)});
        CHECK(coordinator.validate_snapshot(token, {}).error().code() == StatusCode::kAborted);
    }
}

TEST_CASE_METHOD(CoordinatorFixture, "Retry chains the logical transaction", "[ember][db][txn]") {
    const Bytes first = begin_read_write();
    const auto second = coordinator.begin(kDatabase, ReadWriteOptions{first});
    REQUIRE(second);
    CHECK(coordinator.info(first)->state == TransactionState::kRolledBack);
    CHECK(coordinator.info(*second)->logical_id == coordinator.info(first)->logical_id);
    CHECK(coordinator.info(*second)->attempt == 1);

    SECTION("committed transaction cannot be retried") {
        coordinator.finish(*second, TransactionState::kCommitted);
        const auto third = coordinator.begin(kDatabase, ReadWriteOptions{*second});
        REQUIRE_FALSE(third);
        CHECK(third.error().code() == StatusCode::kInvalidArgument);
    }

    SECTION("unknown transaction cannot be retried") {
        const auto third = coordinator.begin(kDatabase, ReadWriteOptions{string_to_bytes("unknown")});
        REQUIRE_FALSE(third);
        CHECK(third.error().code() == StatusCode::kNotFound);
    }
}

TEST_CASE_METHOD(CoordinatorFixture, "Rollback", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    REQUIRE(coordinator.rollback(kDatabase, token));
    CHECK(coordinator.active_count() == 0);
    CHECK(coordinator.rollback(kDatabase, token).error().code() == StatusCode::kInvalidArgument);
}

TEST_CASE_METHOD(CoordinatorFixture, "Idle transactions expire", "[ember][db][txn]") {
    const Bytes token = begin_read_write();
    const Bytes busy = begin_read_write();

    now = {300, 0};
    REQUIRE(coordinator.read_time(kDatabase, busy));
    now = {100 + 271, 0};

    const auto expired = coordinator.read_time(kDatabase, token);
    REQUIRE_FALSE(expired);
    CHECK(expired.error().code() == StatusCode::kInvalidArgument);
    CHECK(expired.error().message() == kTransactionExpiredMessage);
    CHECK(coordinator.read_time(kDatabase, busy));

    SECTION("expired transactions are forgotten after the terminal retention") {
        now = {100 + 271 + 601, 0};
        coordinator.expire_idle();
        CHECK_FALSE(coordinator.info(token));
    }
}

}  // namespace ember::db::txn
