// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "path.hpp"

#include <catch2/catch.hpp>

namespace ember {

TEST_CASE("ResourcePath::parse", "[ember][core][path]") {
    const auto path = ResourcePath::parse("projects/p/databases/d/documents/users/alice");
    REQUIRE(path);
    CHECK(path->size() == 7);
    CHECK(path->last_segment() == "alice");
    CHECK(is_document_path(*path));
    CHECK(is_collection_path(path->parent()));
    CHECK(is_documents_root(path->parent().parent()));
    CHECK(path->to_string() == "projects/p/databases/d/documents/users/alice");

    CHECK(ResourcePath::parse("projects//databases").error().code() == StatusCode::kInvalidArgument);
    CHECK(ResourcePath::parse("a/b/").error().code() == StatusCode::kInvalidArgument);
}

TEST_CASE("ResourcePath ordering is segment-wise", "[ember][core][path]") {
    const auto a = *ResourcePath::parse("c/a");
    const auto a_child = *ResourcePath::parse("c/a/sub/x");
    const auto a_dash = *ResourcePath::parse("c/a-");
    CHECK(a < a_child);
    CHECK(a_child < a_dash);
    CHECK(a.is_prefix_of(a_child));
    CHECK_FALSE(a_child.is_prefix_of(a));
}

TEST_CASE("FieldPath::parse", "[ember][core][path]") {
    SECTION("simple") {
        const auto path = FieldPath::parse("address.city");
        REQUIRE(path);
        CHECK(path->size() == 2);
        CHECK(path->segment(1) == "city");
        CHECK(path->to_string() == "address.city");
    }
    SECTION("quoted segments") {
        const auto path = FieldPath::parse("`a.b`.c");
        REQUIRE(path);
        CHECK(path->size() == 2);
        CHECK(path->segment(0) == "a.b");
        CHECK(path->to_string() == "`a.b`.c");
    }
    SECTION("escapes inside backticks") {
        const auto path = FieldPath::parse(R"(`x\`y`)");
        REQUIRE(path);
        CHECK(path->segment(0) == "x`y");
    }
    SECTION("document key") {
        CHECK(FieldPath::parse("__name__")->is_document_key());
    }
    SECTION("malformed") {
        CHECK_FALSE(FieldPath::parse(""));
        CHECK_FALSE(FieldPath::parse("a..b"));
        CHECK_FALSE(FieldPath::parse("`unterminated"));
        CHECK_THROWS_AS(FieldPath::from_string("a."), StatusException);
    }
}

}  // namespace ember
