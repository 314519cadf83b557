// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "listen_session.hpp"

#include <catch2/catch.hpp>

namespace ember::db::watch {

static const std::string kDatabase{"projects/p/databases/d"};
static const std::string kRoot{kDatabase + "/documents"};

static datastore::Mutation upsert(const std::string& path, int64_t n, Timestamp at) {
    return datastore::Mutation{kRoot + "/" + path, Document{
                                                       .name = kRoot + "/" + path,
                                                       .fields = {{"n", Value::integer(n)}},
                                                       .create_time = at,
                                                       .update_time = at,
                                                   }};
}

static datastore::Mutation erase(const std::string& path) {
    return datastore::Mutation{kRoot + "/" + path, std::nullopt};
}

//! Query on collection c for documents with n >= 10
static Target big_numbers(TargetId target_id) {
    query::StructuredQuery query;
    query.from.push_back({.collection_id = "c"});
    query.where = query::field_filter("n", query::FieldOperator::kGreaterThanOrEqual, Value::integer(10));
    return Target{.target_id = target_id, .selector = QueryTarget{.parent = kRoot, .structured_query = std::move(query)}};
}

static ListenRequest add(Target target) {
    return ListenRequest{.database = kDatabase, .change = std::move(target)};
}

static const TargetChange& as_target_change(const ListenResponse& response) {
    REQUIRE(std::holds_alternative<TargetChange>(response));
    return std::get<TargetChange>(response);
}

class ListenSessionFixture {
  public:
    ListenSessionFixture() {
        store.commit({upsert("c/a", 10, {100, 0}), upsert("c/b", 5, {100, 0}), upsert("c/c", 20, {100, 0})}, {100, 0});
    }

    datastore::DocumentStore store{std::chrono::seconds{0}};
    ListenSession session{store, kDatabase};
};

TEST_CASE_METHOD(ListenSessionFixture, "Adding a target sends its initial state", "[ember][db][watch][session]") {
    const auto responses = session.handle(add(big_numbers(7)));
    REQUIRE(responses);
    REQUIRE(responses->size() == 5);

    CHECK(as_target_change((*responses)[0]).type == TargetChangeType::kAdd);
    CHECK(as_target_change((*responses)[0]).target_ids == std::vector<TargetId>{7});

    REQUIRE(std::holds_alternative<DocumentChange>((*responses)[1]));
    const auto& first = std::get<DocumentChange>((*responses)[1]);
    CHECK(first.document.name == kRoot + "/c/a");
    CHECK(first.target_ids == std::vector<TargetId>{7});
    CHECK(std::get<DocumentChange>((*responses)[2]).document.name == kRoot + "/c/c");

    const auto& current = as_target_change((*responses)[3]);
    CHECK(current.type == TargetChangeType::kCurrent);
    CHECK(decode_resume_token(current.resume_token) == Timestamp{100, 0});

    const auto& no_change = as_target_change((*responses)[4]);
    CHECK(no_change.type == TargetChangeType::kNoChange);
    CHECK(no_change.target_ids.empty());
    CHECK(no_change.read_time == Timestamp{100, 0});

    CHECK(session.target_count() == 1);
    CHECK(session.existence_filter(7)->count == 2);
    CHECK(session.last_read_time() == Timestamp{100, 0});
}

TEST_CASE_METHOD(ListenSessionFixture, "Commits produce changes, removes and deletes", "[ember][db][watch][session]") {
    REQUIRE(session.handle(add(big_numbers(1))));

    const auto event = store.commit({upsert("c/b", 50, {200, 0}), upsert("c/a", 1, {200, 0}), erase("c/c"),
                                     upsert("other/x", 99, {200, 0})},
                                    {200, 0});
    const auto responses = session.on_commit(event);
    REQUIRE(responses.size() == 4);

    REQUIRE(std::holds_alternative<DocumentChange>(responses[0]));
    CHECK(std::get<DocumentChange>(responses[0]).document.name == kRoot + "/c/b");

    REQUIRE(std::holds_alternative<DocumentRemove>(responses[1]));
    const auto& remove = std::get<DocumentRemove>(responses[1]);
    CHECK(remove.document == kRoot + "/c/a");
    CHECK(remove.removed_target_ids == std::vector<TargetId>{1});
    CHECK(remove.read_time == Timestamp{200, 0});

    REQUIRE(std::holds_alternative<DocumentDelete>(responses[2]));
    CHECK(std::get<DocumentDelete>(responses[2]).document == kRoot + "/c/c");

    CHECK(as_target_change(responses[3]).read_time == Timestamp{200, 0});
    CHECK(session.existence_filter(1)->count == 1);

    SECTION("a commit already covered is ignored") {
        CHECK(session.on_commit(event).empty());
    }
}

TEST_CASE_METHOD(ListenSessionFixture, "Targets sharing a document get one change", "[ember][db][watch][session]") {
    REQUIRE(session.handle(add(big_numbers(1))));
    REQUIRE(session.handle(add(Target{.target_id = 2, .selector = DocumentsTarget{{kRoot + "/c/a", kRoot + "/c/a"}}})));

    const auto responses = session.on_commit(store.commit({upsert("c/a", 11, {200, 0})}, {200, 0}));
    REQUIRE(responses.size() == 2);
    REQUIRE(std::holds_alternative<DocumentChange>(responses[0]));
    CHECK(std::get<DocumentChange>(responses[0]).target_ids == std::vector<TargetId>{1, 2});
}

TEST_CASE_METHOD(ListenSessionFixture, "Adding a target catches up existing targets first", "[ember][db][watch][session]") {
    REQUIRE(session.handle(add(big_numbers(1))));

    // Store already moved to 200 but its commit event is still queued behind the new target
    const auto event = store.commit({upsert("c/d", 40, {200, 0}), erase("c/c")}, {200, 0});
    const auto responses = session.handle(add(Target{.target_id = 2, .selector = DocumentsTarget{{kRoot + "/c/b"}}}));
    REQUIRE(responses);
    REQUIRE(responses->size() == 6);

    REQUIRE(std::holds_alternative<DocumentChange>((*responses)[0]));
    const auto& added = std::get<DocumentChange>((*responses)[0]);
    CHECK(added.document.name == kRoot + "/c/d");
    CHECK(added.target_ids == std::vector<TargetId>{1});
    REQUIRE(std::holds_alternative<DocumentDelete>((*responses)[1]));
    CHECK(std::get<DocumentDelete>((*responses)[1]).document == kRoot + "/c/c");

    CHECK(as_target_change((*responses)[2]).type == TargetChangeType::kAdd);
    CHECK(std::get<DocumentChange>((*responses)[3]).target_ids == std::vector<TargetId>{2});
    CHECK(as_target_change((*responses)[4]).type == TargetChangeType::kCurrent);
    CHECK(as_target_change((*responses)[5]).read_time == Timestamp{200, 0});

    CHECK(session.existence_filter(1)->count == 2);
    CHECK(session.on_commit(event).empty());
}

TEST_CASE_METHOD(ListenSessionFixture, "Resuming sends only what changed", "[ember][db][watch][session]") {
    store.commit({upsert("c/a", 12, {200, 0}), upsert("c/b", 15, {200, 0}), erase("c/c")}, {200, 0});

    Target resumed = big_numbers(3);
    resumed.resume_token = encode_resume_token({100, 0});
    const auto responses = session.handle(add(std::move(resumed)));
    REQUIRE(responses);
    REQUIRE(responses->size() == 6);

    CHECK(as_target_change((*responses)[0]).type == TargetChangeType::kAdd);
    CHECK(std::get<DocumentChange>((*responses)[1]).document.name == kRoot + "/c/a");
    CHECK(std::get<DocumentChange>((*responses)[2]).document.name == kRoot + "/c/b");
    CHECK(std::get<DocumentDelete>((*responses)[3]).document == kRoot + "/c/c");
    CHECK(as_target_change((*responses)[4]).type == TargetChangeType::kCurrent);
    CHECK(as_target_change((*responses)[5]).read_time == Timestamp{200, 0});
}

TEST_CASE("Resuming before the retained history resets the target", "[ember][db][watch][session]") {
    datastore::DocumentStore store{std::chrono::seconds{10}};
    store.commit({upsert("c/a", 10, {100, 0})}, {100, 0});
    store.commit({upsert("c/b", 30, {200, 0})}, {200, 0});
    ListenSession session{store, kDatabase};

    Target resumed = big_numbers(1);
    resumed.read_time = Timestamp{100, 0};
    const auto responses = session.handle(add(std::move(resumed)));
    REQUIRE(responses);
    REQUIRE(responses->size() == 6);
    CHECK(as_target_change((*responses)[1]).type == TargetChangeType::kReset);
    CHECK(std::holds_alternative<DocumentChange>((*responses)[2]));
    CHECK(std::holds_alternative<DocumentChange>((*responses)[3]));
}

TEST_CASE_METHOD(ListenSessionFixture, "Once targets are removed when current", "[ember][db][watch][session]") {
    Target once = big_numbers(4);
    once.once = true;
    const auto responses = session.handle(add(std::move(once)));
    REQUIRE(responses);
    const auto& last = as_target_change(responses->back());
    CHECK(last.type == TargetChangeType::kRemove);
    CHECK_FALSE(last.cause);
    CHECK(session.target_count() == 0);
}

TEST_CASE_METHOD(ListenSessionFixture, "Target ids", "[ember][db][watch][session]") {
    SECTION("zero is assigned by the server") {
        const auto responses = session.handle(add(big_numbers(0)));
        REQUIRE(responses);
        CHECK(as_target_change(responses->front()).target_ids == std::vector<TargetId>{1});
        const auto second = session.handle(add(big_numbers(0)));
        REQUIRE(second);
        CHECK(as_target_change(second->front()).target_ids == std::vector<TargetId>{2});
    }

    SECTION("duplicates fail the stream") {
        REQUIRE(session.handle(add(big_numbers(5))));
        const auto duplicate = session.handle(add(big_numbers(5)));
        REQUIRE_FALSE(duplicate);
        CHECK(duplicate.error().code() == StatusCode::kInvalidArgument);
    }

    SECTION("resume token and read time are exclusive") {
        Target both = big_numbers(5);
        both.resume_token = encode_resume_token({100, 0});
        both.read_time = Timestamp{100, 0};
        CHECK(session.handle(add(std::move(both))).error().code() == StatusCode::kInvalidArgument);
    }

    SECTION("removing an unknown target fails the stream") {
        const auto removed = session.handle(ListenRequest{.database = kDatabase, .change = RemoveTarget{9}});
        REQUIRE_FALSE(removed);
        CHECK(removed.error().code() == StatusCode::kInvalidArgument);
    }
}

TEST_CASE_METHOD(ListenSessionFixture, "Invalid targets are removed with a cause", "[ember][db][watch][session]") {
    Target target;
    SECTION("bad query") {
        target = big_numbers(6);
        std::get<QueryTarget>(target.selector).structured_query.limit = -1;
    }
    SECTION("foreign document") {
        target = Target{.target_id = 6, .selector = DocumentsTarget{{"projects/p/databases/other/documents/c/a"}}};
    }
    SECTION("malformed resume token") {
        target = big_numbers(6);
        target.resume_token = string_to_bytes("garbage");
    }
    const auto responses = session.handle(add(std::move(target)));
    REQUIRE(responses);
    REQUIRE(responses->size() == 1);
    const auto& remove = as_target_change(responses->front());
    CHECK(remove.type == TargetChangeType::kRemove);
    REQUIRE(remove.cause);
    CHECK(remove.cause->code() == StatusCode::kInvalidArgument);
    CHECK(session.target_count() == 0);
}

TEST_CASE_METHOD(ListenSessionFixture, "Requests for another database fail", "[ember][db][watch][session]") {
    const auto responses = session.handle(ListenRequest{.database = "projects/p/databases/other", .change = big_numbers(1)});
    REQUIRE_FALSE(responses);
    CHECK(responses.error().code() == StatusCode::kInvalidArgument);
}

}  // namespace ember::db::watch
