// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/value.hpp>
#include <ember/db/query/query_evaluator.hpp>

namespace ember::db::query {

enum class AggregationKind {
    kCount,
    kSum,
    kAvg,
};

//! One aggregate computed over the results of a structured query, reported under alias
struct Aggregation {
    std::string alias;
    AggregationKind kind{AggregationKind::kCount};
    FieldPath field;
    //! Stop counting once this many documents matched
    std::optional<int64_t> up_to;

    static Aggregation count(std::string alias, std::optional<int64_t> up_to = std::nullopt);
    static Aggregation sum(std::string alias, FieldPath field);
    static Aggregation avg(std::string alias, FieldPath field);
};

//! Maximum number of aggregations in one request
inline constexpr size_t kMaxAggregations{5};

//! Check aliases (present, unique), aggregation count and the operands of each kind
VoidResult validate_aggregations(const std::vector<Aggregation>& aggregations);

//! Aggregate over documents, which are taken as the final query results.
//! Sum stays an integer until a double operand or an int64 overflow turns it into a double,
//! avg is always a double and null when no document holds a number; non numeric values are skipped.
MapValue aggregate(const std::vector<Aggregation>& aggregations, const std::vector<Document>& documents);

//! Documents that the query evaluated by evaluator returns from candidates, offset and limit applied
std::vector<Document> query_results(const QueryEvaluator& evaluator, const std::vector<Document>& candidates);

}  // namespace ember::db::query
