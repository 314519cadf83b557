// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "value.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <absl/strings/str_split.h>

#include <ember/core/common/overloaded.hpp>

namespace ember {

ArrayValue::ArrayValue(std::initializer_list<Value> init) : values{init} {}

ArrayValue::ArrayValue(std::vector<Value> v) : values{std::move(v)} {}

bool ArrayValue::contains(const Value& value) const {
    return std::any_of(values.begin(), values.end(), [&](const Value& v) { return values_equal(v, value); });
}

bool operator==(const ArrayValue& lhs, const ArrayValue& rhs) {
    return lhs.values == rhs.values;
}

MapValue::MapValue(std::initializer_list<Entry> init) {
    for (const auto& [key, value] : init) {
        put(key, value);
    }
}

std::vector<MapValue::Entry>::iterator MapValue::lower_bound(std::string_view key) {
    return std::lower_bound(entries_.begin(), entries_.end(), key,
                            [](const Entry& entry, std::string_view k) { return entry.first < k; });
}

std::vector<MapValue::Entry>::const_iterator MapValue::lower_bound(std::string_view key) const {
    return std::lower_bound(entries_.begin(), entries_.end(), key,
                            [](const Entry& entry, std::string_view k) { return entry.first < k; });
}

const Value* MapValue::get(std::string_view key) const {
    const auto it = lower_bound(key);
    if (it == entries_.end() || it->first != key) return nullptr;
    return &it->second;
}

void MapValue::put(std::string key, Value value) {
    auto it = lower_bound(key);
    if (it != entries_.end() && it->first == key) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace(it, std::move(key), std::move(value));
}

bool MapValue::remove(std::string_view key) {
    const auto it = lower_bound(key);
    if (it == entries_.end() || it->first != key) return false;
    entries_.erase(it);
    return true;
}

const Value* MapValue::find(const FieldPath& path) const {
    if (path.empty()) return nullptr;
    const MapValue* current{this};
    for (size_t i{0}; i + 1 < path.size(); ++i) {
        const Value* child = current->get(path.segment(i));
        if (child == nullptr || !child->is_map()) return nullptr;
        current = &child->as_map();
    }
    return current->get(path.segment(path.size() - 1));
}

void MapValue::set(const FieldPath& path, Value value) {
    if (path.empty()) return;
    MapValue* current{this};
    for (size_t i{0}; i + 1 < path.size(); ++i) {
        const std::string& key = path.segment(i);
        auto it = current->lower_bound(key);
        if (it == current->entries_.end() || it->first != key) {
            it = current->entries_.emplace(it, key, Value{MapValue{}});
        } else if (!it->second.is_map()) {
            it->second = Value{MapValue{}};
        }
        current = &it->second.as_map();
    }
    current->put(path.segment(path.size() - 1), std::move(value));
}

bool MapValue::erase(const FieldPath& path) {
    if (path.empty()) return false;
    MapValue* current{this};
    for (size_t i{0}; i + 1 < path.size(); ++i) {
        auto it = current->lower_bound(path.segment(i));
        if (it == current->entries_.end() || it->first != path.segment(i) || !it->second.is_map()) return false;
        current = &it->second.as_map();
    }
    return current->remove(path.segment(path.size() - 1));
}

bool operator==(const MapValue& lhs, const MapValue& rhs) {
    return lhs.entries_ == rhs.entries_;
}

bool Value::is_nan() const {
    return type() == ValueType::kDouble && std::isnan(as_double());
}

double Value::number_as_double() const {
    if (type() == ValueType::kInteger) return static_cast<double>(as_integer());
    return as_double();
}

static void render(std::ostream& out, const Value& value) {
    std::visit(Overloaded{
                   [&](const NullValue&) { out << "null"; },
                   [&](bool b) { out << (b ? "true" : "false"); },
                   [&](int64_t i) { out << i; },
                   [&](double d) { out << d; },
                   [&](const Timestamp& ts) { out << ts.to_string(); },
                   [&](const std::string& s) { out << '"' << s << '"'; },
                   [&](const Bytes& b) { out << "b'" << to_hex(b) << "'"; },
                   [&](const Reference& r) { out << "ref(" << r.name << ")"; },
                   [&](const GeoPoint& g) { out << "geo(" << g.latitude << ", " << g.longitude << ")"; },
                   [&](const ArrayValue& a) {
                       out << '[';
                       for (size_t i{0}; i < a.values.size(); ++i) {
                           if (i > 0) out << ", ";
                           render(out, a.values[i]);
                       }
                       out << ']';
                   },
                   [&](const MapValue& m) {
                       out << '{';
                       bool first{true};
                       for (const auto& [key, v] : m) {
                           if (!first) out << ", ";
                           first = false;
                           out << key << ": ";
                           render(out, v);
                       }
                       out << '}';
                   },
               },
               value.variant());
}

std::string Value::to_string() const {
    std::ostringstream out;
    render(out, *this);
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    render(out, value);
    return out;
}

namespace {

    //! Position of the value kind in the cross-type order
    enum class TypeOrder {
        kNull,
        kBoolean,
        kNumber,
        kTimestamp,
        kString,
        kBytes,
        kReference,
        kGeoPoint,
        kArray,
        kMap,
    };

    TypeOrder type_order(const Value& value) {
        switch (value.type()) {
            case ValueType::kNull:
                return TypeOrder::kNull;
            case ValueType::kBoolean:
                return TypeOrder::kBoolean;
            case ValueType::kInteger:
            case ValueType::kDouble:
                return TypeOrder::kNumber;
            case ValueType::kTimestamp:
                return TypeOrder::kTimestamp;
            case ValueType::kString:
                return TypeOrder::kString;
            case ValueType::kBytes:
                return TypeOrder::kBytes;
            case ValueType::kReference:
                return TypeOrder::kReference;
            case ValueType::kGeoPoint:
                return TypeOrder::kGeoPoint;
            case ValueType::kArray:
                return TypeOrder::kArray;
            case ValueType::kMap:
                return TypeOrder::kMap;
        }
        return TypeOrder::kNull;
    }

    template <typename T>
    int primitive_compare(const T& lhs, const T& rhs) {
        if (lhs < rhs) return -1;
        if (rhs < lhs) return 1;
        return 0;
    }

    //! NaN sorts before every other number and equals itself, -0.0 equals +0.0
    int compare_doubles(double lhs, double rhs) {
        if (lhs < rhs) return -1;
        if (lhs > rhs) return 1;
        if (lhs == rhs) return 0;
        if (std::isnan(lhs)) return std::isnan(rhs) ? 0 : -1;
        return 1;
    }

    int compare_integer_double(int64_t lhs, double rhs) {
        if (std::isnan(rhs)) return 1;
        // Doubles outside [-2^63, 2^63) are beyond every int64, infinities included
        constexpr double kTwoPow63 = 9223372036854775808.0;
        if (rhs >= kTwoPow63) return -1;
        if (rhs < -kTwoPow63) return 1;
        const double whole = std::trunc(rhs);
        if (const int order = primitive_compare(lhs, static_cast<int64_t>(whole)); order != 0) return order;
        // Same integral part, the fraction decides
        const double fraction = rhs - whole;
        if (fraction > 0) return -1;
        if (fraction < 0) return 1;
        return 0;
    }

    int compare_numbers(const Value& lhs, const Value& rhs) {
        const bool lhs_int = lhs.type() == ValueType::kInteger;
        const bool rhs_int = rhs.type() == ValueType::kInteger;
        if (lhs_int && rhs_int) return primitive_compare(lhs.as_integer(), rhs.as_integer());
        if (lhs_int) return compare_integer_double(lhs.as_integer(), rhs.as_double());
        if (rhs_int) return -compare_integer_double(rhs.as_integer(), lhs.as_double());
        return compare_doubles(lhs.as_double(), rhs.as_double());
    }

    int compare_arrays(const ArrayValue& lhs, const ArrayValue& rhs) {
        const size_t common = std::min(lhs.values.size(), rhs.values.size());
        for (size_t i{0}; i < common; ++i) {
            const int c = compare_values(lhs.values[i], rhs.values[i]);
            if (c != 0) return c;
        }
        return primitive_compare(lhs.values.size(), rhs.values.size());
    }

    int compare_maps(const MapValue& lhs, const MapValue& rhs) {
        auto lit = lhs.begin();
        auto rit = rhs.begin();
        for (; lit != lhs.end() && rit != rhs.end(); ++lit, ++rit) {
            const int key_comparison = primitive_compare(lit->first, rit->first);
            if (key_comparison != 0) return key_comparison;
            const int value_comparison = compare_values(lit->second, rit->second);
            if (value_comparison != 0) return value_comparison;
        }
        return primitive_compare(lhs.size(), rhs.size());
    }

}  // namespace

int compare_resource_names(std::string_view lhs, std::string_view rhs) {
    std::vector<std::string_view> left = absl::StrSplit(lhs, '/');
    std::vector<std::string_view> right = absl::StrSplit(rhs, '/');
    const size_t common = std::min(left.size(), right.size());
    for (size_t i{0}; i < common; ++i) {
        const int c = left[i].compare(right[i]);
        if (c != 0) return c < 0 ? -1 : 1;
    }
    return primitive_compare(left.size(), right.size());
}

bool same_type_order(const Value& lhs, const Value& rhs) {
    return type_order(lhs) == type_order(rhs);
}

int compare_values(const Value& lhs, const Value& rhs) {
    const TypeOrder left_type = type_order(lhs);
    const TypeOrder right_type = type_order(rhs);
    if (left_type != right_type) {
        return left_type < right_type ? -1 : 1;
    }

    switch (left_type) {
        case TypeOrder::kNull:
            return 0;
        case TypeOrder::kBoolean:
            return primitive_compare(lhs.as_boolean(), rhs.as_boolean());
        case TypeOrder::kNumber:
            return compare_numbers(lhs, rhs);
        case TypeOrder::kTimestamp:
            return primitive_compare(lhs.as_timestamp(), rhs.as_timestamp());
        case TypeOrder::kString:
            // Byte-wise comparison of UTF-8 strings yields code point order
            return primitive_compare(lhs.as_string(), rhs.as_string());
        case TypeOrder::kBytes:
            return primitive_compare(lhs.as_bytes(), rhs.as_bytes());
        case TypeOrder::kReference:
            return compare_resource_names(lhs.as_reference().name, rhs.as_reference().name);
        case TypeOrder::kGeoPoint: {
            const auto& l = lhs.as_geo_point();
            const auto& r = rhs.as_geo_point();
            const int latitude = compare_doubles(l.latitude, r.latitude);
            return latitude != 0 ? latitude : compare_doubles(l.longitude, r.longitude);
        }
        case TypeOrder::kArray:
            return compare_arrays(lhs.as_array(), rhs.as_array());
        case TypeOrder::kMap:
            return compare_maps(lhs.as_map(), rhs.as_map());
    }
    return 0;
}

bool values_equal(const Value& lhs, const Value& rhs) {
    return same_type_order(lhs, rhs) && compare_values(lhs, rhs) == 0;
}

}  // namespace ember
