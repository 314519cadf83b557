// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <ember/core/common/status.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/core/types/value.hpp>

namespace ember {

//! Set of field paths selecting part of a document (read projection or update mask)
struct DocumentMask {
    std::vector<FieldPath> field_paths;

    //! Whether path, or one of its ancestors, is selected by the mask
    bool covers(const FieldPath& path) const;

    friend bool operator==(const DocumentMask&, const DocumentMask&) = default;
};

//! Named map of fields. A document without update_time is missing: it exists only as the parent of
//! other documents and carries neither fields nor timestamps.
struct Document {
    std::string name;
    MapValue fields;
    std::optional<Timestamp> create_time;
    std::optional<Timestamp> update_time;

    bool exists() const { return update_time.has_value(); }

    const Value* field(const FieldPath& path) const { return fields.find(path); }

    //! Parsed resource name
    //! \throws StatusException if the name is malformed
    ResourcePath path() const;

    //! Identifier of the collection directly containing the document
    std::string collection_id() const;

    //! Name of the parent (document or database root) of the containing collection
    std::string parent_name() const;

    //! Identifier of the document within its collection
    std::string id() const;

    //! Copy restricted to the fields covered by mask
    Document project(const DocumentMask& mask) const;

    friend bool operator==(const Document&, const Document&) = default;
};

std::ostream& operator<<(std::ostream& out, const Document& document);

//! Check that name is a well formed document name
VoidResult validate_document_name(std::string_view name);

//! Check that parent is a documents root or a document name, the form used by collection parents
VoidResult validate_parent_name(std::string_view parent);

//! Name of the database owning a document or collection parent: projects/{p}/databases/{d}
std::string database_name_of(std::string_view name);

}  // namespace ember
