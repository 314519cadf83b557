// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transforms.hpp"

#include <limits>

#include <ember/core/common/overloaded.hpp>

namespace ember::db::write {

VoidResult validate_transform(const FieldTransform& transform) {
    if (transform.field.empty() || transform.field.is_document_key()) {
        return make_error(StatusCode::kInvalidArgument, "invalid transform field path: " + transform.field.to_string());
    }
    const Value* operand = std::visit(Overloaded{
                                          [](const Increment& op) { return &op.operand; },
                                          [](const Maximum& op) { return &op.operand; },
                                          [](const Minimum& op) { return &op.operand; },
                                          [](const auto&) -> const Value* { return nullptr; },
                                      },
                                      transform.operation);
    if (operand != nullptr && !operand->is_number()) {
        return make_error(StatusCode::kInvalidArgument,
                          "numeric transform on " + transform.field.to_string() + " requires a number, got " +
                              operand->to_string());
    }
    return {};
}

static int64_t saturating_add(int64_t a, int64_t b) {
    int64_t sum{0};
    if (__builtin_add_overflow(a, b, &sum)) {
        return b > 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
    }
    return sum;
}

static Value add_numbers(const Value& base, const Value& operand) {
    if (base.type() == ValueType::kInteger && operand.type() == ValueType::kInteger) {
        return Value::integer(saturating_add(base.as_integer(), operand.as_integer()));
    }
    return Value::floating(base.number_as_double() + operand.number_as_double());
}

static ArrayValue array_or_empty(const Value* previous) {
    if (previous != nullptr && previous->is_array()) return previous->as_array();
    return {};
}

TransformOutcome apply_transform(const FieldTransform& transform, const Value* previous, Timestamp commit_time) {
    const bool numeric_previous = previous != nullptr && previous->is_number();
    return std::visit(
        Overloaded{
            [&](ServerValue) -> TransformOutcome {
                const Value now = Value::timestamp(commit_time);
                return {now, now};
            },
            [&](const AppendMissingElements& op) -> TransformOutcome {
                ArrayValue array = array_or_empty(previous);
                for (const auto& element : op.elements.values) {
                    if (!array.contains(element)) array.values.push_back(element);
                }
                return {Value{std::move(array)}, Value::null()};
            },
            [&](const RemoveAllFromArray& op) -> TransformOutcome {
                ArrayValue array = array_or_empty(previous);
                std::erase_if(array.values, [&](const Value& v) { return op.elements.contains(v); });
                return {Value{std::move(array)}, Value::null()};
            },
            [&](const Increment& op) -> TransformOutcome {
                Value sum = numeric_previous ? add_numbers(*previous, op.operand) : op.operand;
                return {sum, sum};
            },
            [&](const Maximum& op) -> TransformOutcome {
                Value max = numeric_previous && compare_values(*previous, op.operand) >= 0 ? *previous : op.operand;
                return {max, max};
            },
            [&](const Minimum& op) -> TransformOutcome {
                Value min = numeric_previous && compare_values(*previous, op.operand) <= 0 ? *previous : op.operand;
                return {min, min};
            },
        },
        transform.operation);
}

std::vector<Value> apply_transforms(const std::vector<FieldTransform>& transforms, MapValue& fields,
                                    Timestamp commit_time) {
    std::vector<Value> results;
    results.reserve(transforms.size());
    for (const auto& transform : transforms) {
        TransformOutcome outcome = apply_transform(transform, fields.find(transform.field), commit_time);
        fields.set(transform.field, std::move(outcome.field_value));
        results.push_back(std::move(outcome.result));
    }
    return results;
}

}  // namespace ember::db::write
