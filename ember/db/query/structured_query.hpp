// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/value.hpp>

namespace ember::db::query {

enum class FieldOperator {
    kLessThan,
    kLessThanOrEqual,
    kGreaterThan,
    kGreaterThanOrEqual,
    kEqual,
    kNotEqual,
    kArrayContains,
    kIn,
    kArrayContainsAny,
    kNotIn,
};

enum class UnaryOperator {
    kIsNan,
    kIsNull,
    kIsNotNan,
    kIsNotNull,
};

enum class CompositeOperator {
    kAnd,
    kOr,
};

struct FieldFilter {
    FieldPath field;
    FieldOperator op{FieldOperator::kEqual};
    Value value;
};

struct UnaryFilter {
    FieldPath field;
    UnaryOperator op{UnaryOperator::kIsNull};
};

struct CompositeFilter;

using Filter = std::variant<FieldFilter, UnaryFilter, CompositeFilter>;

struct CompositeFilter {
    CompositeOperator op{CompositeOperator::kAnd};
    std::vector<Filter> filters;
};

enum class Direction {
    kAscending,
    kDescending,
};

struct Order {
    FieldPath field;
    Direction direction{Direction::kAscending};
};

//! Position in the query order: one value per explicit order_by clause
struct Cursor {
    std::vector<Value> values;
    //! For start_at: include documents equal to the cursor. For end_at: exclude them.
    bool before{false};
};

struct CollectionSelector {
    std::string collection_id;
    bool all_descendants{false};
};

struct StructuredQuery {
    std::optional<DocumentMask> select;
    std::vector<CollectionSelector> from;
    std::optional<Filter> where;
    std::vector<Order> order_by;
    std::optional<Cursor> start_at;
    std::optional<Cursor> end_at;
    int64_t offset{0};
    std::optional<int64_t> limit;
};

//! Check the request shape: selectors, cursor arity, filter operands, offset and limit
VoidResult validate(const StructuredQuery& query);

//! Convenience constructors for the common filter shapes
Filter field_filter(std::string_view field, FieldOperator op, Value value);
Filter unary_filter(std::string_view field, UnaryOperator op);
Filter and_filter(std::vector<Filter> filters);
Filter or_filter(std::vector<Filter> filters);

std::ostream& operator<<(std::ostream& out, const Filter& filter);
std::ostream& operator<<(std::ostream& out, const StructuredQuery& query);

}  // namespace ember::db::query
