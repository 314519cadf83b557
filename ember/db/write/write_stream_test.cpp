// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "write_stream.hpp"

#include <catch2/catch.hpp>

namespace ember::db::write {

static const std::string kDatabase{"projects/p/databases/d"};

class WriteStreamFixture {
  public:
    WriteStreamFixture()
        : session{"s1", WriteStreamSettings{.max_unacknowledged_responses = 3}, [this](const std::vector<Write>& writes) {
                      return commit(writes);
                  }} {}

    Result<CommitResult> commit(const std::vector<Write>& writes) {
        ++commits;
        std::vector<WriteResult> results(writes.size(), WriteResult{.update_time = {commits, 0}});
        return CommitResult{std::move(results), Timestamp{commits, 0}};
    }

    static std::vector<Write> one_write() {
        return {Write::remove("projects/p/databases/d/documents/c/a")};
    }

    int64_t commits{0};
    WriteStreamSession session;
};

TEST_CASE_METHOD(WriteStreamFixture, "Write stream handshake and writes", "[ember][db][write_stream]") {
    const WriteResponse handshake = session.handshake();
    CHECK(handshake.stream_id == "s1");
    CHECK_FALSE(handshake.stream_token.empty());
    CHECK(handshake.write_results.empty());

    const auto first = session.handle({.database = kDatabase, .writes = one_write(), .stream_token = handshake.stream_token});
    REQUIRE(first);
    REQUIRE(*first);
    CHECK((*first)->write_results.size() == 1);
    CHECK((*first)->commit_time == Timestamp{1, 0});
    CHECK((*first)->stream_token != handshake.stream_token);
    CHECK(session.unacknowledged() == 1);

    SECTION("empty request acknowledges without response") {
        const auto ack = session.handle({.database = kDatabase, .stream_token = (*first)->stream_token});
        REQUIRE(ack);
        CHECK_FALSE(*ack);
        CHECK(session.unacknowledged() == 0);
    }

    SECTION("unknown token closes the stream") {
        const auto bad = session.handle({.database = kDatabase, .stream_token = string_to_bytes("s1@99")});
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code() == StatusCode::kInvalidArgument);
        CHECK_FALSE(session.connected());
    }

    SECTION("foreign token is rejected") {
        const auto bad = session.handle({.database = kDatabase, .stream_token = string_to_bytes("other@0")});
        CHECK(bad.error().code() == StatusCode::kInvalidArgument);
    }
}

TEST_CASE_METHOD(WriteStreamFixture, "Write stream backpressure and resume", "[ember][db][write_stream]") {
    const Bytes initial = session.handshake().stream_token;
    Bytes last;
    for (int i{0}; i < 3; ++i) {
        const auto response = session.handle({.database = kDatabase, .writes = one_write(), .stream_token = initial});
        REQUIRE(response);
        last = (*response)->stream_token;
    }
    CHECK(session.unacknowledged() == 3);

    const auto exhausted = session.handle({.database = kDatabase, .writes = one_write(), .stream_token = initial});
    REQUIRE_FALSE(exhausted);
    CHECK(exhausted.error().code() == StatusCode::kResourceExhausted);
    CHECK_FALSE(session.connected());
    CHECK(commits == 4);

    const auto closed = session.handle({.database = kDatabase, .stream_token = last});
    CHECK(closed.error().code() == StatusCode::kUnavailable);

    const auto replay = session.resume(last);
    REQUIRE(replay);
    REQUIRE(replay->size() == 2);
    CHECK((*replay)[0].write_results.empty());
    CHECK((*replay)[1].commit_time == Timestamp{4, 0});
    CHECK(session.connected());
    CHECK(session.unacknowledged() == 1);

    CHECK_FALSE(session.resume(initial));
}

TEST_CASE_METHOD(WriteStreamFixture, "Write stream client drives the acknowledgement window", "[ember][db][write_stream]") {
    WriteStreamClient client{kDatabase, {.acknowledgement_threshold = 2}};

    const WriteRequest open = client.open_request();
    CHECK(open.stream_id.empty());
    CHECK(open.stream_token.empty());
    REQUIRE(client.on_handshake(session.handshake()));
    CHECK(client.stream_id() == "s1");

    for (int round{0}; round < 10; ++round) {
        const auto response = session.handle(client.write_request(one_write()));
        REQUIRE(response);
        if (auto ack = client.on_response(**response)) {
            CHECK(ack->writes.empty());
            REQUIRE(session.handle(*ack));
        }
        CHECK(session.unacknowledged() < 3);
    }
    CHECK(commits == 10);
}

TEST_CASE_METHOD(WriteStreamFixture, "Write stream client reopens after exhaustion", "[ember][db][write_stream]") {
    WriteStreamClient client{kDatabase, {.acknowledgement_threshold = 10}};
    REQUIRE(client.on_handshake(session.handshake()));

    Status failure;
    for (int round{0}; round < 4; ++round) {
        const auto response = session.handle(client.write_request(one_write()));
        if (!response) {
            failure = response.error();
            break;
        }
        CHECK_FALSE(client.on_response(**response));
    }
    REQUIRE(WriteStreamClient::should_reopen(failure));

    const WriteRequest reopen = client.open_request();
    CHECK(reopen.stream_id == "s1");
    const auto replay = session.resume(reopen.stream_token);
    REQUIRE(replay);
    REQUIRE(client.on_handshake(replay->front()));
    REQUIRE(replay->size() == 2);
    CHECK((*replay)[1].commit_time == Timestamp{4, 0});
    CHECK_FALSE(client.on_response((*replay)[1]));
    CHECK(session.unacknowledged() == 1);
}

}  // namespace ember::db::write
