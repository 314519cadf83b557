// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "path.hpp"

#include <algorithm>
#include <cctype>

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace ember {

Result<ResourcePath> ResourcePath::parse(std::string_view name) {
    std::vector<std::string> segments = absl::StrSplit(name, '/');
    for (const auto& segment : segments) {
        if (segment.empty()) {
            return make_error(StatusCode::kInvalidArgument, "invalid resource name: " + std::string{name});
        }
    }
    return ResourcePath{std::move(segments)};
}

ResourcePath ResourcePath::parent() const {
    if (segments_.empty()) return {};
    return ResourcePath{{segments_.begin(), segments_.end() - 1}};
}

ResourcePath ResourcePath::child(std::string_view segment) const {
    auto segments = segments_;
    segments.emplace_back(segment);
    return ResourcePath{std::move(segments)};
}

bool ResourcePath::is_prefix_of(const ResourcePath& other) const {
    if (segments_.size() > other.segments_.size()) return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

std::string ResourcePath::to_string() const {
    return absl::StrJoin(segments_, "/");
}

std::ostream& operator<<(std::ostream& out, const ResourcePath& path) {
    out << path.to_string();
    return out;
}

static bool has_documents_root(const ResourcePath& path) {
    return path.size() >= kDocumentsRootSize && path.segment(0) == "projects" &&
           path.segment(2) == "databases" && path.segment(4) == "documents";
}

bool is_document_path(const ResourcePath& path) {
    return has_documents_root(path) && path.size() > kDocumentsRootSize && (path.size() - kDocumentsRootSize) % 2 == 0;
}

bool is_collection_path(const ResourcePath& path) {
    return has_documents_root(path) && (path.size() - kDocumentsRootSize) % 2 == 1;
}

bool is_documents_root(const ResourcePath& path) {
    return has_documents_root(path) && path.size() == kDocumentsRootSize;
}

Result<FieldPath> FieldPath::parse(std::string_view path) {
    std::vector<std::string> segments;
    std::string current;
    bool quoted{false};
    bool segment_started{false};
    for (size_t i{0}; i < path.size(); ++i) {
        const char c = path[i];
        if (c == '\\') {
            if (i + 1 == path.size()) {
                return make_error(StatusCode::kInvalidArgument, "trailing escape in field path: " + std::string{path});
            }
            current.push_back(path[++i]);
            segment_started = true;
        } else if (c == '`') {
            quoted = !quoted;
            segment_started = true;
        } else if (c == '.' && !quoted) {
            if (!segment_started) {
                return make_error(StatusCode::kInvalidArgument, "empty segment in field path: " + std::string{path});
            }
            segments.push_back(std::move(current));
            current.clear();
            segment_started = false;
        } else {
            current.push_back(c);
            segment_started = true;
        }
    }
    if (quoted) {
        return make_error(StatusCode::kInvalidArgument, "unterminated backtick in field path: " + std::string{path});
    }
    if (!segment_started) {
        return make_error(StatusCode::kInvalidArgument, "empty segment in field path: " + std::string{path});
    }
    segments.push_back(std::move(current));
    return FieldPath{std::move(segments)};
}

FieldPath FieldPath::from_string(std::string_view path) {
    return unwrap_or_throw(parse(path));
}

bool FieldPath::is_prefix_of(const FieldPath& other) const {
    if (segments_.size() > other.segments_.size()) return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

static bool is_simple_identifier(std::string_view segment) {
    if (segment.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(segment[0])) || segment[0] == '_')) return false;
    return std::all_of(segment.begin(), segment.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::string FieldPath::to_string() const {
    std::string out;
    for (size_t i{0}; i < segments_.size(); ++i) {
        if (i > 0) out.push_back('.');
        const auto& segment = segments_[i];
        if (is_simple_identifier(segment)) {
            out.append(segment);
            continue;
        }
        out.push_back('`');
        for (const char c : segment) {
            if (c == '`' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('`');
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, const FieldPath& path) {
    out << path.to_string();
    return out;
}

}  // namespace ember
