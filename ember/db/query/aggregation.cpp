// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "aggregation.hpp"

#include <algorithm>
#include <limits>

#include <absl/container/flat_hash_set.h>

namespace ember::db::query {

Aggregation Aggregation::count(std::string alias, std::optional<int64_t> up_to) {
    return Aggregation{.alias = std::move(alias), .kind = AggregationKind::kCount, .up_to = up_to};
}

Aggregation Aggregation::sum(std::string alias, FieldPath field) {
    return Aggregation{.alias = std::move(alias), .kind = AggregationKind::kSum, .field = std::move(field)};
}

Aggregation Aggregation::avg(std::string alias, FieldPath field) {
    return Aggregation{.alias = std::move(alias), .kind = AggregationKind::kAvg, .field = std::move(field)};
}

VoidResult validate_aggregations(const std::vector<Aggregation>& aggregations) {
    if (aggregations.empty()) {
        return make_error(StatusCode::kInvalidArgument, "aggregation query without aggregations");
    }
    if (aggregations.size() > kMaxAggregations) {
        return make_error(StatusCode::kInvalidArgument,
                          "at most " + std::to_string(kMaxAggregations) + " aggregations are allowed");
    }
    absl::flat_hash_set<std::string> aliases;
    for (const auto& aggregation : aggregations) {
        if (aggregation.alias.empty()) {
            return make_error(StatusCode::kInvalidArgument, "aggregation without alias");
        }
        if (!aliases.insert(aggregation.alias).second) {
            return make_error(StatusCode::kInvalidArgument, "duplicate aggregation alias " + aggregation.alias);
        }
        if (aggregation.kind == AggregationKind::kCount) {
            if (aggregation.up_to && *aggregation.up_to <= 0) {
                return make_error(StatusCode::kInvalidArgument, "count up_to must be positive");
            }
        } else if (aggregation.field.empty() || aggregation.field.is_document_key()) {
            return make_error(StatusCode::kInvalidArgument, "aggregation " + aggregation.alias + " needs a field");
        }
    }
    return {};
}

namespace {

    Value count_of(const std::vector<Document>& documents, std::optional<int64_t> up_to) {
        auto count = static_cast<int64_t>(documents.size());
        if (up_to) count = std::min(count, *up_to);
        return Value::integer(count);
    }

    bool add_overflows(int64_t lhs, int64_t rhs) {
        if (rhs > 0) return lhs > std::numeric_limits<int64_t>::max() - rhs;
        return lhs < std::numeric_limits<int64_t>::min() - rhs;
    }

    Value sum_of(const std::vector<Document>& documents, const FieldPath& field) {
        int64_t integer_sum{0};
        double double_sum{0};
        bool is_double{false};
        for (const auto& document : documents) {
            const Value* value = document.field(field);
            if (value == nullptr || !value->is_number()) continue;
            if (!is_double && value->type() == ValueType::kInteger && !add_overflows(integer_sum, value->as_integer())) {
                integer_sum += value->as_integer();
                continue;
            }
            if (!is_double) {
                is_double = true;
                double_sum = static_cast<double>(integer_sum);
            }
            double_sum += value->number_as_double();
        }
        return is_double ? Value::floating(double_sum) : Value::integer(integer_sum);
    }

    Value avg_of(const std::vector<Document>& documents, const FieldPath& field) {
        double total{0};
        int64_t count{0};
        for (const auto& document : documents) {
            const Value* value = document.field(field);
            if (value == nullptr || !value->is_number()) continue;
            total += value->number_as_double();
            ++count;
        }
        if (count == 0) return Value::null();
        return Value::floating(total / static_cast<double>(count));
    }

}  // namespace

MapValue aggregate(const std::vector<Aggregation>& aggregations, const std::vector<Document>& documents) {
    MapValue result;
    for (const auto& aggregation : aggregations) {
        switch (aggregation.kind) {
            case AggregationKind::kCount:
                result.put(aggregation.alias, count_of(documents, aggregation.up_to));
                break;
            case AggregationKind::kSum:
                result.put(aggregation.alias, sum_of(documents, aggregation.field));
                break;
            case AggregationKind::kAvg:
                result.put(aggregation.alias, avg_of(documents, aggregation.field));
                break;
        }
    }
    return result;
}

std::vector<Document> query_results(const QueryEvaluator& evaluator, const std::vector<Document>& candidates) {
    std::vector<Document> selected = evaluator.select(candidates);
    const auto offset = static_cast<size_t>(std::min<int64_t>(evaluator.query().offset,
                                                              static_cast<int64_t>(selected.size())));
    selected.erase(selected.begin(), selected.begin() + static_cast<std::ptrdiff_t>(offset));
    if (const auto& limit = evaluator.query().limit; limit && static_cast<size_t>(*limit) < selected.size()) {
        selected.resize(static_cast<size_t>(*limit));
    }
    return selected;
}

}  // namespace ember::db::query
