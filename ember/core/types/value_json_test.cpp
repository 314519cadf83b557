// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "value_json.hpp"

#include <catch2/catch.hpp>

namespace ember {

TEST_CASE("Value from proto3 JSON", "[ember][core][json]") {
    const auto json = R"({"mapValue": {"fields": {
        "count": {"integerValue": "42"},
        "ratio": {"doubleValue": "NaN"},
        "tags": {"arrayValue": {"values": [{"stringValue": "a"}, {"nullValue": null}]}},
        "at": {"timestampValue": "2024-01-02T03:04:05.000000006Z"},
        "blob": {"bytesValue": "AAE="},
        "where": {"geoPointValue": {"latitude": 1.5, "longitude": -2}},
        "ok": {"booleanValue": true}
    }}})"_json;

    const auto value = json.get<Value>();
    REQUIRE(value.is_map());
    const MapValue& fields = value.as_map();
    CHECK(fields.get("count")->as_integer() == 42);
    CHECK(fields.get("ratio")->is_nan());
    CHECK(fields.get("tags")->as_array().values.size() == 2);
    CHECK(fields.get("at")->as_timestamp().nanos == 6);
    CHECK(fields.get("at")->as_timestamp().to_string() == "2024-01-02T03:04:05.000000006Z");
    CHECK(fields.get("blob")->as_bytes() == Bytes{0x00, 0x01});
    CHECK(fields.get("where")->as_geo_point().longitude == -2.0);
    CHECK(fields.get("ok")->as_boolean());

    const nlohmann::json back = value;
    CHECK(back["mapValue"]["fields"]["count"] == R"({"integerValue": "42"})"_json);
    CHECK(back["mapValue"]["fields"]["ratio"]["doubleValue"] == "NaN");
}

TEST_CASE("Document from proto3 JSON", "[ember][core][json]") {
    const auto json = R"({
        "name": "projects/p/databases/d/documents/c/x",
        "fields": {"n": {"integerValue": 1}},
        "updateTime": "2024-01-01T00:00:00Z"
    })"_json;
    const auto doc = json.get<Document>();
    CHECK(doc.exists());
    CHECK_FALSE(doc.create_time);
    CHECK(doc.field(FieldPath::from_string("n"))->as_integer() == 1);
}

TEST_CASE("Malformed JSON fixtures", "[ember][core][json]") {
    CHECK_THROWS_AS(R"({"integerValue": "x"})"_json.get<Value>(), StatusException);
    CHECK_THROWS_AS(R"({"stringValue": "a", "booleanValue": true})"_json.get<Value>(), StatusException);
    CHECK_THROWS_AS(R"({"fooValue": 1})"_json.get<Value>(), StatusException);
    CHECK_THROWS_AS(R"({"timestampValue": "yesterday"})"_json.get<Value>(), StatusException);
}

}  // namespace ember
