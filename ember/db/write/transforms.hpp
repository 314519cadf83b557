// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ember/core/common/status.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/core/types/value.hpp>
#include <ember/db/write/write.hpp>

namespace ember::db::write {

struct TransformOutcome {
    //! New value of the transformed field
    Value field_value;
    //! Value reported in the write result
    Value result;
};

//! Check the transform operands: numeric operands for increment, maximum and minimum
VoidResult validate_transform(const FieldTransform& transform);

//! Compute the effect of transform on the current field value (nullptr when the field is absent)
TransformOutcome apply_transform(const FieldTransform& transform, const Value* previous, Timestamp commit_time);

//! Apply transforms in order to fields, collecting one result per transform
std::vector<Value> apply_transforms(const std::vector<FieldTransform>& transforms, MapValue& fields,
                                    Timestamp commit_time);

}  // namespace ember::db::write
