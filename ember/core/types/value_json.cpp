// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "value_json.hpp"

#include <cmath>
#include <limits>
#include <string>

#include <absl/strings/escaping.h>
#include <absl/strings/numbers.h>
#include <absl/time/time.h>

#include <ember/core/common/overloaded.hpp>
#include <ember/core/common/status.hpp>

namespace ember {

static constexpr const char* kTimestampFormat{"%Y-%m-%dT%H:%M:%E*SZ"};

[[noreturn]] static void throw_malformed(const std::string& what) {
    throw StatusException{invalid_argument("malformed JSON fixture: " + what)};
}

void to_json(nlohmann::json& json, const Timestamp& ts) {
    json = ts.to_string();
}

void from_json(const nlohmann::json& json, Timestamp& ts) {
    if (!json.is_string()) throw_malformed("timestamp must be a string");
    absl::Time time;
    std::string error;
    if (!absl::ParseTime(kTimestampFormat, json.get<std::string>(), &time, &error)) {
        throw_malformed("timestamp " + json.get<std::string>() + ": " + error);
    }
    const absl::Duration since_epoch = time - absl::UnixEpoch();
    const int64_t seconds = absl::ToInt64Seconds(since_epoch);
    const int64_t nanos = absl::ToInt64Nanoseconds(since_epoch - absl::Seconds(seconds));
    ts = Timestamp{seconds, 0}.plus(std::chrono::nanoseconds{nanos});
}

static nlohmann::json double_to_json(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    return d;
}

static double double_from_json(const nlohmann::json& json) {
    if (json.is_number()) return json.get<double>();
    if (json.is_string()) {
        const auto s = json.get<std::string>();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
    }
    throw_malformed("doubleValue " + json.dump());
}

void to_json(nlohmann::json& json, const Value& value) {
    json = nlohmann::json::object();
    std::visit(Overloaded{
                   [&](const NullValue&) { json["nullValue"] = nullptr; },
                   [&](bool b) { json["booleanValue"] = b; },
                   [&](int64_t i) { json["integerValue"] = std::to_string(i); },
                   [&](double d) { json["doubleValue"] = double_to_json(d); },
                   [&](const Timestamp& ts) { json["timestampValue"] = ts; },
                   [&](const std::string& s) { json["stringValue"] = s; },
                   [&](const Bytes& b) { json["bytesValue"] = absl::Base64Escape(byte_view_to_string_view(b)); },
                   [&](const Reference& r) { json["referenceValue"] = r.name; },
                   [&](const GeoPoint& g) {
                       json["geoPointValue"] = {{"latitude", g.latitude}, {"longitude", g.longitude}};
                   },
                   [&](const ArrayValue& a) {
                       auto values = nlohmann::json::array();
                       for (const auto& v : a.values) values.push_back(nlohmann::json(v));
                       json["arrayValue"] = {{"values", std::move(values)}};
                   },
                   [&](const MapValue& m) { json["mapValue"] = {{"fields", m}}; },
               },
               value.variant());
}

void from_json(const nlohmann::json& json, Value& value) {
    if (!json.is_object() || json.size() != 1) throw_malformed("value must hold exactly one kind: " + json.dump());
    const auto it = json.begin();
    const std::string& kind = it.key();
    const nlohmann::json& payload = it.value();
    if (kind == "nullValue") {
        value = Value::null();
    } else if (kind == "booleanValue") {
        if (!payload.is_boolean()) throw_malformed("booleanValue " + payload.dump());
        value = Value::boolean(payload.get<bool>());
    } else if (kind == "integerValue") {
        int64_t i{0};
        if (payload.is_number_integer()) {
            i = payload.get<int64_t>();
        } else if (!payload.is_string() || !absl::SimpleAtoi(payload.get<std::string>(), &i)) {
            throw_malformed("integerValue " + payload.dump());
        }
        value = Value::integer(i);
    } else if (kind == "doubleValue") {
        value = Value::floating(double_from_json(payload));
    } else if (kind == "timestampValue") {
        value = Value::timestamp(payload.get<Timestamp>());
    } else if (kind == "stringValue") {
        if (!payload.is_string()) throw_malformed("stringValue " + payload.dump());
        value = Value::string(payload.get<std::string>());
    } else if (kind == "bytesValue") {
        std::string decoded;
        if (!payload.is_string() || !absl::Base64Unescape(payload.get<std::string>(), &decoded)) {
            throw_malformed("bytesValue " + payload.dump());
        }
        value = Value::bytes(string_to_bytes(decoded));
    } else if (kind == "referenceValue") {
        if (!payload.is_string()) throw_malformed("referenceValue " + payload.dump());
        value = Value::reference(payload.get<std::string>());
    } else if (kind == "geoPointValue") {
        value = Value::geo_point(payload.value("latitude", 0.0), payload.value("longitude", 0.0));
    } else if (kind == "arrayValue") {
        ArrayValue array;
        if (payload.contains("values")) {
            for (const auto& element : payload.at("values")) {
                array.values.push_back(element.get<Value>());
            }
        }
        value = Value{std::move(array)};
    } else if (kind == "mapValue") {
        MapValue map;
        if (payload.contains("fields")) {
            map = payload.at("fields").get<MapValue>();
        }
        value = Value{std::move(map)};
    } else {
        throw_malformed("unknown value kind " + kind);
    }
}

void to_json(nlohmann::json& json, const MapValue& map) {
    json = nlohmann::json::object();
    for (const auto& [key, value] : map) {
        json[key] = value;
    }
}

void from_json(const nlohmann::json& json, MapValue& map) {
    if (!json.is_object()) throw_malformed("fields must be an object");
    for (const auto& [key, value] : json.items()) {
        map.put(key, value.get<Value>());
    }
}

void to_json(nlohmann::json& json, const Document& document) {
    json = {{"name", document.name}};
    if (!document.exists()) return;
    json["fields"] = document.fields;
    if (document.create_time) json["createTime"] = *document.create_time;
    json["updateTime"] = *document.update_time;
}

void from_json(const nlohmann::json& json, Document& document) {
    if (!json.is_object() || !json.contains("name")) throw_malformed("document without name");
    document.name = json.at("name").get<std::string>();
    if (json.contains("fields")) {
        document.fields = json.at("fields").get<MapValue>();
    }
    if (json.contains("createTime")) {
        document.create_time = json.at("createTime").get<Timestamp>();
    }
    if (json.contains("updateTime")) {
        document.update_time = json.at("updateTime").get<Timestamp>();
    }
}

}  // namespace ember
