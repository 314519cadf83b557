// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <ember/core/common/bytes.hpp>
#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/query/structured_query.hpp>

namespace ember::db::watch {

using TargetId = int32_t;

struct QueryTarget {
    std::string parent;
    query::StructuredQuery structured_query;
};

struct DocumentsTarget {
    std::vector<std::string> documents;
};

//! Query or set of documents a listen stream keeps in sync
struct Target {
    //! Zero asks the server to assign an id
    TargetId target_id{0};
    std::variant<QueryTarget, DocumentsTarget> selector;
    //! Resume from a previous stream: at most one of resume_token and read_time
    std::optional<Bytes> resume_token;
    std::optional<Timestamp> read_time;
    //! Remove the target once it is current
    bool once{false};
};

struct RemoveTarget {
    TargetId target_id{0};
};

struct ListenRequest {
    std::string database;
    std::variant<Target, RemoveTarget> change;
    std::map<std::string, std::string> labels;
};

enum class TargetChangeType {
    kNoChange,
    kAdd,
    kRemove,
    kCurrent,
    kReset,
};

struct TargetChange {
    TargetChangeType type{TargetChangeType::kNoChange};
    //! Empty means every target of the stream
    std::vector<TargetId> target_ids;
    //! Only set on kRemove caused by an error
    std::optional<Status> cause;
    Bytes resume_token;
    //! Non-decreasing along a stream. Set on a global kNoChange (and optionally kCurrent): all targets are
    //! consistent as of read_time.
    std::optional<Timestamp> read_time;
};

//! Document added to or modified in target_ids, and no longer matching removed_target_ids
struct DocumentChange {
    Document document;
    std::vector<TargetId> target_ids;
    std::vector<TargetId> removed_target_ids;
};

//! Document deleted, removed from removed_target_ids
struct DocumentDelete {
    std::string document;
    std::vector<TargetId> removed_target_ids;
    Timestamp read_time;
};

//! Document still existing but no longer matching removed_target_ids
struct DocumentRemove {
    std::string document;
    std::vector<TargetId> removed_target_ids;
    Timestamp read_time;
};

//! Number of documents matching target_id on the server, sent so clients can detect divergence
struct ExistenceFilter {
    TargetId target_id{0};
    int32_t count{0};
};

using ListenResponse = std::variant<TargetChange, DocumentChange, DocumentDelete, DocumentRemove, ExistenceFilter>;

//! Resume tokens carry the commit time the stream was consistent at
Bytes encode_resume_token(Timestamp read_time);
std::optional<Timestamp> decode_resume_token(ByteView token);

std::ostream& operator<<(std::ostream& out, const TargetChange& change);
std::ostream& operator<<(std::ostream& out, const ListenResponse& response);

}  // namespace ember::db::watch
