// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "structured_query.hpp"

#include <magic_enum.hpp>

#include <ember/core/common/overloaded.hpp>

namespace ember::db::query {

static bool takes_array_operand(FieldOperator op) {
    return op == FieldOperator::kIn || op == FieldOperator::kNotIn || op == FieldOperator::kArrayContainsAny;
}

static VoidResult validate_filter(const Filter& filter) {
    return std::visit(
        Overloaded{
            [](const FieldFilter& f) -> VoidResult {
                if (f.field.empty()) return make_error(StatusCode::kInvalidArgument, "filter on empty field path");
                if (takes_array_operand(f.op) && !f.value.is_array()) {
                    return make_error(StatusCode::kInvalidArgument,
                                      "operator " + std::string{magic_enum::enum_name(f.op)} + " requires an array value");
                }
                if (f.field.is_document_key() && !takes_array_operand(f.op) && f.op != FieldOperator::kArrayContains &&
                    f.value.type() != ValueType::kReference) {
                    return make_error(StatusCode::kInvalidArgument, "filter on __name__ requires a reference value");
                }
                return {};
            },
            [](const UnaryFilter& f) -> VoidResult {
                if (f.field.empty()) return make_error(StatusCode::kInvalidArgument, "filter on empty field path");
                return {};
            },
            [](const CompositeFilter& f) -> VoidResult {
                if (f.filters.empty()) return make_error(StatusCode::kInvalidArgument, "composite filter without filters");
                for (const auto& sub : f.filters) {
                    if (auto result = validate_filter(sub); !result) return result;
                }
                return {};
            },
        },
        filter);
}

static VoidResult validate_cursor(const Cursor& cursor, const StructuredQuery& query, std::string_view which) {
    if (cursor.values.size() != query.order_by.size()) {
        return make_error(StatusCode::kInvalidArgument,
                          std::string{which} + " has " + std::to_string(cursor.values.size()) +
                              " values but the query has " + std::to_string(query.order_by.size()) + " orderBy clauses");
    }
    for (size_t i{0}; i < cursor.values.size(); ++i) {
        if (query.order_by[i].field.is_document_key() && cursor.values[i].type() != ValueType::kReference) {
            return make_error(StatusCode::kInvalidArgument,
                              std::string{which} + " value for __name__ must be a document reference");
        }
    }
    return {};
}

VoidResult validate(const StructuredQuery& query) {
    if (query.from.size() > 1) {
        return make_error(StatusCode::kInvalidArgument, "at most one collection selector is supported");
    }
    for (const auto& selector : query.from) {
        if (selector.collection_id.empty() && !selector.all_descendants) {
            return make_error(StatusCode::kInvalidArgument, "collection selector without collection id");
        }
        if (selector.collection_id.find('/') != std::string::npos) {
            return make_error(StatusCode::kInvalidArgument, "invalid collection id: " + selector.collection_id);
        }
    }
    if (query.select) {
        for (const auto& path : query.select->field_paths) {
            if (path.empty()) return make_error(StatusCode::kInvalidArgument, "projection of empty field path");
        }
    }
    for (const auto& order : query.order_by) {
        if (order.field.empty()) return make_error(StatusCode::kInvalidArgument, "orderBy on empty field path");
    }
    if (query.where) {
        if (auto result = validate_filter(*query.where); !result) return result;
    }
    if (query.start_at) {
        if (auto result = validate_cursor(*query.start_at, query, "startAt"); !result) return result;
    }
    if (query.end_at) {
        if (auto result = validate_cursor(*query.end_at, query, "endAt"); !result) return result;
    }
    if (query.offset < 0) {
        return make_error(StatusCode::kInvalidArgument, "negative offset");
    }
    if (query.limit && *query.limit < 0) {
        return make_error(StatusCode::kInvalidArgument, "negative limit");
    }
    return {};
}

Filter field_filter(std::string_view field, FieldOperator op, Value value) {
    return FieldFilter{FieldPath::from_string(field), op, std::move(value)};
}

Filter unary_filter(std::string_view field, UnaryOperator op) {
    return UnaryFilter{FieldPath::from_string(field), op};
}

Filter and_filter(std::vector<Filter> filters) {
    return CompositeFilter{CompositeOperator::kAnd, std::move(filters)};
}

Filter or_filter(std::vector<Filter> filters) {
    return CompositeFilter{CompositeOperator::kOr, std::move(filters)};
}

std::ostream& operator<<(std::ostream& out, const Filter& filter) {
    std::visit(Overloaded{
                   [&](const FieldFilter& f) { out << f.field << " " << magic_enum::enum_name(f.op) << " " << f.value; },
                   [&](const UnaryFilter& f) { out << f.field << " " << magic_enum::enum_name(f.op); },
                   [&](const CompositeFilter& f) {
                       out << magic_enum::enum_name(f.op) << "(";
                       for (size_t i{0}; i < f.filters.size(); ++i) {
                           if (i > 0) out << ", ";
                           out << f.filters[i];
                       }
                       out << ")";
                   },
               },
               filter);
    return out;
}

std::ostream& operator<<(std::ostream& out, const StructuredQuery& query) {
    out << "from=";
    for (const auto& selector : query.from) {
        out << selector.collection_id << (selector.all_descendants ? "/**" : "");
    }
    if (query.where) out << " where=" << *query.where;
    for (const auto& order : query.order_by) {
        out << " orderBy=" << order.field << (order.direction == Direction::kDescending ? " desc" : "");
    }
    if (query.offset > 0) out << " offset=" << query.offset;
    if (query.limit) out << " limit=" << *query.limit;
    return out;
}

}  // namespace ember::db::query
