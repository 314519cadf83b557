// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <ember/core/common/status.hpp>

namespace ember {

//! Slash separated resource name, e.g. projects/p/databases/d/documents/users/alice
class ResourcePath {
  public:
    ResourcePath() = default;
    explicit ResourcePath(std::vector<std::string> segments) : segments_{std::move(segments)} {}

    //! Parse a slash separated name, rejecting empty segments
    static Result<ResourcePath> parse(std::string_view name);

    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }
    const std::string& segment(size_t index) const { return segments_.at(index); }
    const std::string& last_segment() const { return segments_.back(); }
    const std::vector<std::string>& segments() const { return segments_; }

    ResourcePath parent() const;
    ResourcePath child(std::string_view segment) const;

    //! Whether this path is a proper or improper prefix of other
    bool is_prefix_of(const ResourcePath& other) const;

    std::string to_string() const;

    friend auto operator<=>(const ResourcePath&, const ResourcePath&) = default;
    friend bool operator==(const ResourcePath&, const ResourcePath&) = default;

  private:
    std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& out, const ResourcePath& path);

//! Number of segments of the documents root: projects/{p}/databases/{d}/documents
inline constexpr size_t kDocumentsRootSize{5};

//! Whether path names a document below a documents root
bool is_document_path(const ResourcePath& path);

//! Whether path names a collection below a documents root
bool is_collection_path(const ResourcePath& path);

//! Whether path is a documents root
bool is_documents_root(const ResourcePath& path);

//! Dot separated path into the fields of a document, e.g. address.city or `odd.name`.x
class FieldPath {
  public:
    //! Reserved path designating the document name
    static constexpr std::string_view kDocumentKey{"__name__"};

    FieldPath() = default;
    explicit FieldPath(std::vector<std::string> segments) : segments_{std::move(segments)} {}

    //! Parse the canonical dotted form, honouring backtick quoted segments and escapes
    static Result<FieldPath> parse(std::string_view path);

    //! Parse or throw, for paths known at compile time
    static FieldPath from_string(std::string_view path);

    static FieldPath document_key() { return FieldPath{{std::string{kDocumentKey}}}; }

    size_t size() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }
    const std::string& segment(size_t index) const { return segments_.at(index); }
    const std::vector<std::string>& segments() const { return segments_; }

    bool is_document_key() const { return segments_.size() == 1 && segments_[0] == kDocumentKey; }
    bool is_prefix_of(const FieldPath& other) const;

    //! Canonical dotted form, quoting segments that are not simple identifiers
    std::string to_string() const;

    friend auto operator<=>(const FieldPath&, const FieldPath&) = default;
    friend bool operator==(const FieldPath&, const FieldPath&) = default;

  private:
    std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& out, const FieldPath& path);

}  // namespace ember
