// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "aggregation.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

namespace ember::db::query {

static const std::string kRoot{"projects/p/databases/d/documents"};

static Document make_doc(const std::string& path, MapValue fields) {
    return Document{
        .name = kRoot + "/" + path,
        .fields = std::move(fields),
        .create_time = Timestamp{1, 0},
        .update_time = Timestamp{1, 0},
    };
}

static std::vector<Document> scores() {
    return {
        make_doc("scores/a", {{"points", Value::integer(10)}, {"team", Value::string("red")}}),
        make_doc("scores/b", {{"points", Value::integer(20)}, {"team", Value::string("blue")}}),
        make_doc("scores/c", {{"points", Value::string("n/a")}, {"team", Value::string("red")}}),
        make_doc("scores/d", {{"team", Value::string("red")}}),
        make_doc("scores/e", {{"points", Value::integer(30)}, {"team", Value::string("blue")}}),
        make_doc("other/x", {{"points", Value::integer(1000)}}),
    };
}

static MapValue run_aggregation(StructuredQuery query, const std::vector<Aggregation>& aggregations,
                                const std::vector<Document>& docs) {
    REQUIRE(validate_aggregations(aggregations));
    const auto evaluator = QueryEvaluator::create(kRoot, std::move(query));
    REQUIRE(evaluator);
    return aggregate(aggregations, query_results(*evaluator, docs));
}

static StructuredQuery all_scores() {
    return StructuredQuery{.from = {{"scores", false}}};
}

TEST_CASE("Count aggregation", "[ember][db][query][aggregation]") {
    const FieldPath points = FieldPath::from_string("points");

    SECTION("counts every result") {
        const auto result = run_aggregation(all_scores(), {Aggregation::count("count")}, scores());
        CHECK(result.get("count")->as_integer() == 5);
    }

    SECTION("stops at up_to") {
        const auto result = run_aggregation(all_scores(), {Aggregation::count("count", 3)}, scores());
        CHECK(result.get("count")->as_integer() == 3);
    }

    SECTION("honours filter, offset and limit") {
        StructuredQuery query = all_scores();
        query.where = field_filter("team", FieldOperator::kEqual, Value::string("red"));
        query.offset = 1;
        query.limit = 1;
        const auto result = run_aggregation(std::move(query), {Aggregation::count("count"), Aggregation::sum("sum", points)},
                                            scores());
        CHECK(result.get("count")->as_integer() == 1);
        // a is skipped by the offset, c has no number
        CHECK(result.get("sum")->as_integer() == 0);
    }

    SECTION("empty result") {
        StructuredQuery query = StructuredQuery{.from = {{"nothing", false}}};
        const auto result = run_aggregation(std::move(query), {Aggregation::count("count"), Aggregation::sum("sum", points),
                                                               Aggregation::avg("avg", points)},
                                            scores());
        CHECK(result.get("count")->as_integer() == 0);
        CHECK(result.get("sum")->as_integer() == 0);
        CHECK(result.get("avg")->is_null());
    }
}

TEST_CASE("Sum and average", "[ember][db][query][aggregation]") {
    const FieldPath points = FieldPath::from_string("points");

    SECTION("integers stay integers, non numbers are skipped") {
        const auto result =
            run_aggregation(all_scores(), {Aggregation::sum("sum", points), Aggregation::avg("avg", points)}, scores());
        REQUIRE(result.get("sum")->type() == ValueType::kInteger);
        CHECK(result.get("sum")->as_integer() == 60);
        REQUIRE(result.get("avg")->type() == ValueType::kDouble);
        CHECK(result.get("avg")->as_double() == 20.0);
    }

    SECTION("a double operand makes the sum a double") {
        auto docs = scores();
        docs.push_back(make_doc("scores/f", {{"points", Value::floating(0.5)}}));
        const auto result = run_aggregation(all_scores(), {Aggregation::sum("sum", points)}, docs);
        REQUIRE(result.get("sum")->type() == ValueType::kDouble);
        CHECK(result.get("sum")->as_double() == 60.5);
    }

    SECTION("integer overflow falls back to a double") {
        const std::vector<Document> docs{
            make_doc("scores/a", {{"points", Value::integer(std::numeric_limits<int64_t>::max())}}),
            make_doc("scores/b", {{"points", Value::integer(1)}}),
        };
        const auto result = run_aggregation(all_scores(), {Aggregation::sum("sum", points)}, docs);
        REQUIRE(result.get("sum")->type() == ValueType::kDouble);
        CHECK(result.get("sum")->as_double() == 9223372036854775808.0);
    }

    SECTION("NaN propagates") {
        const std::vector<Document> docs{
            make_doc("scores/a", {{"points", Value::integer(1)}}),
            make_doc("scores/b", {{"points", Value::floating(std::numeric_limits<double>::quiet_NaN())}}),
        };
        const auto result =
            run_aggregation(all_scores(), {Aggregation::sum("sum", points), Aggregation::avg("avg", points)}, docs);
        CHECK(std::isnan(result.get("sum")->as_double()));
        CHECK(std::isnan(result.get("avg")->as_double()));
    }

    SECTION("nested fields") {
        const std::vector<Document> docs{
            make_doc("scores/a", {{"stats", Value::map({{"points", Value::integer(4)}})}}),
            make_doc("scores/b", {{"stats", Value::map({{"points", Value::integer(6)}})}}),
        };
        const auto result =
            run_aggregation(all_scores(), {Aggregation::avg("avg", FieldPath::from_string("stats.points"))}, docs);
        CHECK(result.get("avg")->as_double() == 5.0);
    }
}

TEST_CASE("Aggregation validation", "[ember][db][query][aggregation]") {
    const FieldPath points = FieldPath::from_string("points");
    CHECK(validate_aggregations({Aggregation::count("c"), Aggregation::sum("s", points), Aggregation::avg("a", points)}));

    CHECK(validate_aggregations({}).error().code() == StatusCode::kInvalidArgument);
    CHECK(validate_aggregations({Aggregation::count("")}).error().code() == StatusCode::kInvalidArgument);
    CHECK(validate_aggregations({Aggregation::count("x"), Aggregation::sum("x", points)}).error().code() ==
          StatusCode::kInvalidArgument);
    CHECK(validate_aggregations({Aggregation::count("c", 0)}).error().code() == StatusCode::kInvalidArgument);
    CHECK(validate_aggregations({Aggregation::sum("s", FieldPath{})}).error().code() == StatusCode::kInvalidArgument);
    CHECK(validate_aggregations({Aggregation::avg("a", FieldPath::from_string("__name__"))}).error().code() ==
          StatusCode::kInvalidArgument);

    std::vector<Aggregation> too_many;
    for (size_t i{0}; i <= kMaxAggregations; ++i) too_many.push_back(Aggregation::count("c" + std::to_string(i)));
    CHECK(validate_aggregations(too_many).error().code() == StatusCode::kInvalidArgument);
}

}  // namespace ember::db::query
