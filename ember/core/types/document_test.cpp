// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "document.hpp"

#include <catch2/catch.hpp>

namespace ember {

static const std::string kAlice{"projects/p/databases/d/documents/users/alice"};

TEST_CASE("Document names", "[ember][core][document]") {
    const Document doc{.name = kAlice};
    CHECK_FALSE(doc.exists());
    CHECK(doc.collection_id() == "users");
    CHECK(doc.id() == "alice");
    CHECK(doc.parent_name() == "projects/p/databases/d/documents");
    CHECK(database_name_of(kAlice) == "projects/p/databases/d");

    CHECK(validate_document_name(kAlice));
    CHECK(validate_document_name("projects/p/databases/d/documents/users").error().code() == StatusCode::kInvalidArgument);
    CHECK(validate_parent_name("projects/p/databases/d/documents"));
    CHECK(validate_parent_name(kAlice));
    CHECK_FALSE(validate_parent_name("projects/p/databases/d/documents/users"));
}

TEST_CASE("Document::project", "[ember][core][document]") {
    const Document doc{
        .name = kAlice,
        .fields = {{"age", Value::integer(30)},
                   {"address", Value::map({{"city", Value::string("Rome")}, {"zip", Value::string("00100")}})}},
        .create_time = Timestamp{1, 0},
        .update_time = Timestamp{2, 0},
    };

    const Document projected = doc.project({{FieldPath::from_string("address.city"), FieldPath::from_string("nope")}});
    CHECK(projected.name == kAlice);
    CHECK(projected.update_time == doc.update_time);
    CHECK(projected.fields == MapValue{{"address", Value::map({{"city", Value::string("Rome")}})}});

    const DocumentMask mask{{FieldPath::from_string("address")}};
    CHECK(mask.covers(FieldPath::from_string("address.zip")));
    CHECK_FALSE(mask.covers(FieldPath::from_string("age")));
}

}  // namespace ember
