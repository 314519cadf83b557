// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "query_evaluator.hpp"

#include <algorithm>

#include <ember/core/common/overloaded.hpp>

namespace ember::db::query {

std::optional<Value> lookup_field(const Document& document, const FieldPath& path) {
    if (path.is_document_key()) return Value::reference(document.name);
    if (const Value* value = document.field(path)) return *value;
    return std::nullopt;
}

//! Order-aware comparison of a single key, avoiding copies for regular fields
static int compare_key(const Document& lhs, const Document& rhs, const FieldPath& path) {
    if (path.is_document_key()) return compare_resource_names(lhs.name, rhs.name);
    const Value* left = lhs.field(path);
    const Value* right = rhs.field(path);
    if (left == nullptr || right == nullptr) {
        // Missing fields never reach ordering: matches() rejects them
        return left == right ? 0 : (left == nullptr ? -1 : 1);
    }
    return compare_values(*left, *right);
}

QueryResponseStream::QueryResponseStream(std::vector<Document> ordered, Timestamp read_time, int64_t offset,
                                         std::optional<int64_t> limit, std::optional<DocumentMask> projection,
                                         int64_t progress_interval)
    : ordered_{std::move(ordered)},
      read_time_{read_time},
      limit_{limit},
      projection_{std::move(projection)},
      progress_interval_{progress_interval},
      to_skip_{offset} {}

std::optional<QueryResponse> QueryResponseStream::next() {
    auto response = advance();
    if (response && transaction_) {
        response->transaction = std::move(transaction_);
        transaction_.reset();
    }
    return response;
}

std::optional<QueryResponse> QueryResponseStream::advance() {
    if (finished_) return std::nullopt;

    while (to_skip_ > 0 && position_ < ordered_.size()) {
        ++position_;
        --to_skip_;
        ++pending_skipped_;
        if (progress_interval_ > 0 && pending_skipped_ >= progress_interval_) {
            QueryResponse progress{.read_time = read_time_, .skipped_results = pending_skipped_};
            pending_skipped_ = 0;
            emitted_any_ = true;
            return progress;
        }
    }

    if (position_ < ordered_.size() && (!limit_ || yielded_ < *limit_)) {
        const Document& document = ordered_[position_++];
        QueryResponse response{
            .document = projection_ ? document.project(*projection_) : document,
            .read_time = read_time_,
            .skipped_results = pending_skipped_,
        };
        pending_skipped_ = 0;
        ++yielded_;
        emitted_any_ = true;
        return response;
    }

    finished_ = true;
    if (!emitted_any_ || pending_skipped_ > 0) {
        QueryResponse last{.read_time = read_time_, .skipped_results = pending_skipped_};
        pending_skipped_ = 0;
        return last;
    }
    return std::nullopt;
}

std::vector<QueryResponse> QueryResponseStream::collect() {
    std::vector<QueryResponse> responses;
    while (auto response = next()) {
        responses.push_back(std::move(*response));
    }
    return responses;
}

void QueryResultMerger::add(const QueryResponse& response) {
    if (response.transaction && !transaction_) {
        transaction_ = response.transaction;
    }
    if (response.read_time > read_time_) {
        read_time_ = response.read_time;
    }
    skipped_results_ += response.skipped_results;
    if (response.document) {
        documents_.push_back(*response.document);
    }
}

Result<QueryEvaluator> QueryEvaluator::create(std::string_view parent, StructuredQuery query) {
    if (auto result = validate_parent_name(parent); !result) return make_error(result.error());
    if (auto result = validate(query); !result) return make_error(result.error());
    auto parent_path = ResourcePath::parse(parent);
    return QueryEvaluator{std::move(*parent_path), std::move(query)};
}

QueryEvaluator::QueryEvaluator(ResourcePath parent, StructuredQuery query)
    : parent_{std::move(parent)}, query_{std::move(query)}, effective_order_{query_.order_by} {
    const bool has_name_order = std::any_of(effective_order_.begin(), effective_order_.end(),
                                            [](const Order& order) { return order.field.is_document_key(); });
    if (!has_name_order) {
        effective_order_.push_back(Order{FieldPath::document_key(), Direction::kAscending});
    }
}

const std::string& QueryEvaluator::collection_id() const {
    static const std::string kNone;
    return query_.from.empty() ? kNone : query_.from.front().collection_id;
}

bool QueryEvaluator::in_scope(const Document& document) const {
    if (query_.from.empty()) return false;
    const auto path = ResourcePath::parse(document.name);
    if (!path || !is_document_path(*path)) return false;

    const CollectionSelector& selector = query_.from.front();
    if (!selector.all_descendants) {
        return path->parent() == parent_.child(selector.collection_id);
    }
    if (path->size() <= parent_.size() || !parent_.is_prefix_of(*path)) return false;
    return selector.collection_id.empty() || path->segment(path->size() - 2) == selector.collection_id;
}

bool QueryEvaluator::passes(const Filter& filter, const Document& document) const {
    return std::visit(
        Overloaded{
            [&](const FieldFilter& f) -> bool {
                const auto value = lookup_field(document, f.field);
                if (!value) return false;
                switch (f.op) {
                    case FieldOperator::kLessThan:
                    case FieldOperator::kLessThanOrEqual:
                    case FieldOperator::kGreaterThan:
                    case FieldOperator::kGreaterThanOrEqual: {
                        if (!same_type_order(*value, f.value) || value->is_nan() || f.value.is_nan()) return false;
                        const int c = compare_values(*value, f.value);
                        if (f.op == FieldOperator::kLessThan) return c < 0;
                        if (f.op == FieldOperator::kLessThanOrEqual) return c <= 0;
                        if (f.op == FieldOperator::kGreaterThan) return c > 0;
                        return c >= 0;
                    }
                    case FieldOperator::kEqual:
                        if (value->is_nan() || f.value.is_nan()) return false;
                        return values_equal(*value, f.value);
                    case FieldOperator::kNotEqual:
                        return !value->is_null() && !values_equal(*value, f.value);
                    case FieldOperator::kArrayContains:
                        return value->is_array() && value->as_array().contains(f.value);
                    case FieldOperator::kIn:
                        return f.value.as_array().contains(*value);
                    case FieldOperator::kArrayContainsAny: {
                        if (!value->is_array()) return false;
                        const auto& candidates = f.value.as_array().values;
                        return std::any_of(candidates.begin(), candidates.end(),
                                           [&](const Value& v) { return value->as_array().contains(v); });
                    }
                    case FieldOperator::kNotIn:
                        return !value->is_null() && !f.value.as_array().contains(*value);
                }
                return false;
            },
            [&](const UnaryFilter& f) -> bool {
                const auto value = lookup_field(document, f.field);
                if (!value) return false;
                switch (f.op) {
                    case UnaryOperator::kIsNan:
                        return value->is_nan();
                    case UnaryOperator::kIsNull:
                        return value->is_null();
                    case UnaryOperator::kIsNotNan:
                        return !value->is_nan();
                    case UnaryOperator::kIsNotNull:
                        return !value->is_null();
                }
                return false;
            },
            [&](const CompositeFilter& f) -> bool {
                if (f.op == CompositeOperator::kAnd) {
                    return std::all_of(f.filters.begin(), f.filters.end(),
                                       [&](const Filter& sub) { return passes(sub, document); });
                }
                return std::any_of(f.filters.begin(), f.filters.end(),
                                   [&](const Filter& sub) { return passes(sub, document); });
            },
        },
        filter);
}

bool QueryEvaluator::matches(const Document& document) const {
    if (!document.exists() || !in_scope(document)) return false;
    if (query_.where && !passes(*query_.where, document)) return false;
    return std::all_of(query_.order_by.begin(), query_.order_by.end(), [&](const Order& order) {
        return order.field.is_document_key() || document.field(order.field) != nullptr;
    });
}

int QueryEvaluator::compare(const Document& lhs, const Document& rhs) const {
    for (const auto& order : effective_order_) {
        int c = compare_key(lhs, rhs, order.field);
        if (order.direction == Direction::kDescending) c = -c;
        if (c != 0) return c;
    }
    return 0;
}

int QueryEvaluator::compare_to_cursor(const Document& document, const Cursor& cursor) const {
    for (size_t i{0}; i < cursor.values.size() && i < query_.order_by.size(); ++i) {
        const Order& order = query_.order_by[i];
        int c{0};
        if (order.field.is_document_key()) {
            c = compare_resource_names(document.name, cursor.values[i].as_reference().name);
        } else if (const Value* value = document.field(order.field)) {
            c = compare_values(*value, cursor.values[i]);
        } else {
            c = -1;
        }
        if (order.direction == Direction::kDescending) c = -c;
        if (c != 0) return c;
    }
    return 0;
}

bool QueryEvaluator::within_cursors(const Document& document) const {
    if (query_.start_at) {
        const int c = compare_to_cursor(document, *query_.start_at);
        if (query_.start_at->before ? c < 0 : c <= 0) return false;
    }
    if (query_.end_at) {
        const int c = compare_to_cursor(document, *query_.end_at);
        if (query_.end_at->before ? c >= 0 : c > 0) return false;
    }
    return true;
}

std::vector<Document> QueryEvaluator::select(const std::vector<Document>& candidates) const {
    std::vector<Document> selected;
    for (const auto& document : candidates) {
        if (matches(document) && within_cursors(document)) {
            selected.push_back(document);
        }
    }
    std::sort(selected.begin(), selected.end(),
              [this](const Document& lhs, const Document& rhs) { return compare(lhs, rhs) < 0; });
    return selected;
}

QueryResponseStream QueryEvaluator::run(const std::vector<Document>& candidates, Timestamp read_time,
                                        int64_t progress_interval) const {
    return QueryResponseStream{select(candidates), read_time, query_.offset, query_.limit, query_.select,
                               progress_interval};
}

}  // namespace ember::db::query
