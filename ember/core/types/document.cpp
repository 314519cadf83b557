// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "document.hpp"

#include <absl/strings/str_join.h>

namespace ember {

bool DocumentMask::covers(const FieldPath& path) const {
    for (const auto& selected : field_paths) {
        if (selected.is_prefix_of(path)) return true;
    }
    return false;
}

ResourcePath Document::path() const {
    return unwrap_or_throw(ResourcePath::parse(name));
}

std::string Document::collection_id() const {
    const ResourcePath p = path();
    return p.size() >= 2 ? p.segment(p.size() - 2) : std::string{};
}

std::string Document::parent_name() const {
    return path().parent().parent().to_string();
}

std::string Document::id() const {
    const ResourcePath p = path();
    return p.empty() ? std::string{} : p.last_segment();
}

Document Document::project(const DocumentMask& mask) const {
    Document projected{.name = name, .create_time = create_time, .update_time = update_time};
    for (const auto& path : mask.field_paths) {
        if (const Value* value = fields.find(path)) {
            projected.fields.set(path, *value);
        }
    }
    return projected;
}

std::ostream& operator<<(std::ostream& out, const Document& document) {
    out << document.name;
    if (!document.exists()) {
        out << " (missing)";
        return out;
    }
    out << " " << Value{document.fields} << " @" << *document.update_time;
    return out;
}

VoidResult validate_document_name(std::string_view name) {
    const auto path = ResourcePath::parse(name);
    if (!path) return make_error(path.error());
    if (!is_document_path(*path)) {
        return make_error(StatusCode::kInvalidArgument, "invalid document name: " + std::string{name});
    }
    return {};
}

VoidResult validate_parent_name(std::string_view parent) {
    const auto path = ResourcePath::parse(parent);
    if (!path) return make_error(path.error());
    if (!is_documents_root(*path) && !is_document_path(*path)) {
        return make_error(StatusCode::kInvalidArgument, "invalid parent: " + std::string{parent});
    }
    return {};
}

std::string database_name_of(std::string_view name) {
    const auto path = ResourcePath::parse(name);
    if (!path || path->size() < 4) return {};
    const auto& segments = path->segments();
    return absl::StrJoin(segments.begin(), segments.begin() + 4, "/");
}

}  // namespace ember
