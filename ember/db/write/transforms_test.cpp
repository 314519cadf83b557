// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transforms.hpp"

#include <limits>

#include <catch2/catch.hpp>

namespace ember::db::write {

static FieldTransform on(std::string_view field, decltype(FieldTransform::operation) operation) {
    return FieldTransform{FieldPath::from_string(field), std::move(operation)};
}

TEST_CASE("Server timestamp transform", "[ember][db][write]") {
    const auto outcome = apply_transform(on("t", ServerValue::kRequestTime), nullptr, Timestamp{42, 7});
    CHECK(outcome.field_value == Value::timestamp({42, 7}));
    CHECK(outcome.result == Value::timestamp({42, 7}));
}

TEST_CASE("Array transforms", "[ember][db][write]") {
    const Value existing = Value::array({Value::integer(1), Value::string("a"), Value::integer(1)});

    SECTION("append missing elements adds only new values") {
        const auto outcome = apply_transform(
            on("x", AppendMissingElements{{Value::floating(1.0), Value::string("b"), Value::string("b")}}), &existing, {});
        CHECK(outcome.field_value ==
              Value::array({Value::integer(1), Value::string("a"), Value::integer(1), Value::string("b")}));
        CHECK(outcome.result.is_null());
    }

    SECTION("append is idempotent") {
        const auto transform = on("x", AppendMissingElements{{Value::string("z")}});
        const auto once = apply_transform(transform, &existing, {});
        const auto twice = apply_transform(transform, &once.field_value, {});
        CHECK(twice.field_value == once.field_value);
        const auto present = apply_transform(on("x", AppendMissingElements{{Value::string("a")}}), &existing, {});
        CHECK(present.field_value == existing);
    }

    SECTION("remove all occurrences") {
        const auto outcome = apply_transform(on("x", RemoveAllFromArray{{Value::integer(1)}}), &existing, {});
        CHECK(outcome.field_value == Value::array({Value::string("a")}));
    }

    SECTION("non array previous values are replaced") {
        const Value scalar = Value::integer(5);
        CHECK(apply_transform(on("x", AppendMissingElements{{Value::integer(1)}}), &scalar, {}).field_value ==
              Value::array({Value::integer(1)}));
        CHECK(apply_transform(on("x", RemoveAllFromArray{{Value::integer(1)}}), nullptr, {}).field_value ==
              Value::array({}));
    }
}

TEST_CASE("Numeric transforms", "[ember][db][write]") {
    const Value three = Value::integer(3);

    SECTION("increment") {
        CHECK(apply_transform(on("n", Increment{Value::integer(2)}), &three, {}).field_value == Value::integer(5));
        CHECK(apply_transform(on("n", Increment{Value::floating(0.5)}), &three, {}).field_value == Value::floating(3.5));
        CHECK(apply_transform(on("n", Increment{Value::integer(2)}), nullptr, {}).field_value == Value::integer(2));
        const Value text = Value::string("3");
        CHECK(apply_transform(on("n", Increment{Value::integer(2)}), &text, {}).result == Value::integer(2));
    }

    SECTION("increment saturates") {
        const Value big = Value::integer(std::numeric_limits<int64_t>::max() - 1);
        CHECK(apply_transform(on("n", Increment{Value::integer(10)}), &big, {}).field_value ==
              Value::integer(std::numeric_limits<int64_t>::max()));
    }

    SECTION("maximum and minimum") {
        CHECK(apply_transform(on("n", Maximum{Value::integer(7)}), &three, {}).field_value == Value::integer(7));
        CHECK(apply_transform(on("n", Maximum{Value::integer(1)}), &three, {}).field_value == three);
        CHECK(apply_transform(on("n", Maximum{Value::floating(3.0)}), &three, {}).field_value == three);
        CHECK(apply_transform(on("n", Minimum{Value::floating(1.5)}), &three, {}).field_value == Value::floating(1.5));
        CHECK(apply_transform(on("n", Minimum{Value::integer(9)}), nullptr, {}).field_value == Value::integer(9));
    }

    SECTION("operands must be numbers") {
        CHECK(validate_transform(on("n", Increment{Value::string("1")})).error().code() == StatusCode::kInvalidArgument);
        CHECK(validate_transform(on("__name__", ServerValue::kRequestTime)).error().code() ==
              StatusCode::kInvalidArgument);
        CHECK(validate_transform(on("n", Maximum{Value::integer(1)})));
    }
}

}  // namespace ember::db::write
