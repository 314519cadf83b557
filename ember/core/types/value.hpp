// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/timestamp.hpp>

namespace ember {

class Value;

struct NullValue {
    friend bool operator==(const NullValue&, const NullValue&) = default;
};

//! Reference to another document by its full resource name
struct Reference {
    std::string name;
    friend bool operator==(const Reference&, const Reference&) = default;
};

struct GeoPoint {
    double latitude{0};
    double longitude{0};
    friend bool operator==(const GeoPoint&, const GeoPoint&) = default;
};

//! Ordered sequence of values
struct ArrayValue {
    std::vector<Value> values;

    ArrayValue() = default;
    ArrayValue(std::initializer_list<Value> init);
    explicit ArrayValue(std::vector<Value> v);

    bool contains(const Value& value) const;

    friend bool operator==(const ArrayValue&, const ArrayValue&);
};

//! Mapping from field name to value, kept sorted by key
class MapValue {
  public:
    using Entry = std::pair<std::string, Value>;

    MapValue() = default;
    MapValue(std::initializer_list<Entry> init);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    const Value* get(std::string_view key) const;
    void put(std::string key, Value value);
    bool remove(std::string_view key);

    //! Lookup of a possibly nested field
    const Value* find(const FieldPath& path) const;

    //! Set a possibly nested field, creating or overwriting intermediate maps
    void set(const FieldPath& path, Value value);

    //! Delete a possibly nested field, returning whether something was removed
    bool erase(const FieldPath& path);

    friend bool operator==(const MapValue&, const MapValue&);

  private:
    std::vector<Entry>::iterator lower_bound(std::string_view key);
    std::vector<Entry>::const_iterator lower_bound(std::string_view key) const;

    std::vector<Entry> entries_;
};

//! Kind of value held, in declaration order of the underlying variant
enum class ValueType {
    kNull,
    kBoolean,
    kInteger,
    kDouble,
    kTimestamp,
    kString,
    kBytes,
    kReference,
    kGeoPoint,
    kArray,
    kMap,
};

//! Typed document field value: exactly one alternative is held at any time
class Value {
  public:
    using Variant = std::variant<NullValue, bool, int64_t, double, Timestamp, std::string, Bytes, Reference, GeoPoint,
                                 ArrayValue, MapValue>;

    Value() = default;
    explicit Value(ArrayValue array) : value_{std::move(array)} {}
    explicit Value(MapValue map) : value_{std::move(map)} {}

    static Value null() { return Value{}; }
    static Value boolean(bool b) { return Value{Variant{b}}; }
    static Value integer(int64_t i) { return Value{Variant{i}}; }
    static Value floating(double d) { return Value{Variant{d}}; }
    static Value timestamp(Timestamp ts) { return Value{Variant{ts}}; }
    static Value string(std::string s) { return Value{Variant{std::move(s)}}; }
    static Value bytes(Bytes b) { return Value{Variant{std::move(b)}}; }
    static Value reference(std::string name) { return Value{Variant{Reference{std::move(name)}}}; }
    static Value geo_point(double latitude, double longitude) { return Value{Variant{GeoPoint{latitude, longitude}}}; }
    static Value array(std::initializer_list<Value> values) { return Value{ArrayValue{values}}; }
    static Value map(std::initializer_list<MapValue::Entry> entries) { return Value{MapValue{entries}}; }

    ValueType type() const { return static_cast<ValueType>(value_.index()); }
    const Variant& variant() const { return value_; }

    bool is_null() const { return type() == ValueType::kNull; }
    bool is_number() const { return type() == ValueType::kInteger || type() == ValueType::kDouble; }
    bool is_nan() const;
    bool is_array() const { return type() == ValueType::kArray; }
    bool is_map() const { return type() == ValueType::kMap; }

    bool as_boolean() const { return std::get<bool>(value_); }
    int64_t as_integer() const { return std::get<int64_t>(value_); }
    double as_double() const { return std::get<double>(value_); }
    const Timestamp& as_timestamp() const { return std::get<Timestamp>(value_); }
    const std::string& as_string() const { return std::get<std::string>(value_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(value_); }
    const Reference& as_reference() const { return std::get<Reference>(value_); }
    const GeoPoint& as_geo_point() const { return std::get<GeoPoint>(value_); }
    const ArrayValue& as_array() const { return std::get<ArrayValue>(value_); }
    const MapValue& as_map() const { return std::get<MapValue>(value_); }
    MapValue& as_map() { return std::get<MapValue>(value_); }

    //! Numeric value as double, integer or double alternatives only
    double number_as_double() const;

    //! Compact human readable rendering for logs and test diagnostics
    std::string to_string() const;

    //! Structural equality: same alternative holding equal contents
    friend bool operator==(const Value&, const Value&) = default;

  private:
    explicit Value(Variant v) : value_{std::move(v)} {}

    Variant value_;
};

std::ostream& operator<<(std::ostream& out, const Value& value);

//! Total order across all values as defined by the backend:
//! null < bool < number < timestamp < string < bytes < reference < geopoint < array < map
//! \return negative, zero or positive like strcmp
int compare_values(const Value& lhs, const Value& rhs);

//! Whether two values have comparable types (same position in the type order)
bool same_type_order(const Value& lhs, const Value& rhs);

//! Equality used for set semantics (array transforms, array-contains, in):
//! integer and double compare numerically, NaN equals NaN
bool values_equal(const Value& lhs, const Value& rhs);

//! Segment-wise ordering of slash separated resource names
int compare_resource_names(std::string_view lhs, std::string_view rhs);

}  // namespace ember
