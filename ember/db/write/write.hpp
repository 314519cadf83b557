// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <ember/core/types/document.hpp>
#include <ember/core/types/path.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/core/types/value.hpp>

namespace ember::db::write {

//! Guard on the current state of the written document
struct Precondition {
    //! Either the required existence or the exact required update time
    std::variant<bool, Timestamp> condition;

    static Precondition exists(bool exists) { return Precondition{exists}; }
    static Precondition updated_at(Timestamp update_time) { return Precondition{update_time}; }

    friend bool operator==(const Precondition&, const Precondition&) = default;
};

std::ostream& operator<<(std::ostream& out, const Precondition& precondition);

enum class ServerValue {
    kRequestTime,
};

struct AppendMissingElements {
    ArrayValue elements;
};

struct RemoveAllFromArray {
    ArrayValue elements;
};

struct Increment {
    Value operand;
};

struct Maximum {
    Value operand;
};

struct Minimum {
    Value operand;
};

struct FieldTransform {
    FieldPath field;
    std::variant<ServerValue, AppendMissingElements, RemoveAllFromArray, Increment, Maximum, Minimum> operation;
};

struct UpdateOperation {
    Document document;
    //! Restrict the update to these paths, absent means replace the whole document
    std::optional<DocumentMask> update_mask;
};

struct DeleteOperation {
    std::string name;
};

struct TransformOperation {
    std::string name;
    std::vector<FieldTransform> transforms;
};

//! One mutation of a batch
struct Write {
    std::variant<UpdateOperation, DeleteOperation, TransformOperation> operation;
    //! Applied after an update at the same batch position
    std::vector<FieldTransform> update_transforms;
    std::optional<Precondition> current_document;

    static Write update(Document document, std::optional<DocumentMask> mask = std::nullopt);
    static Write remove(std::string name);
    static Write transform(std::string name, std::vector<FieldTransform> transforms);

    Write& with_precondition(Precondition precondition);
    Write& with_transforms(std::vector<FieldTransform> transforms);

    const std::string& name() const;
    bool is_delete() const { return std::holds_alternative<DeleteOperation>(operation); }
};

struct WriteResult {
    Timestamp update_time;
    //! One entry per transform of the write, in order
    std::vector<Value> transform_results;
};

struct CommitResult {
    std::vector<WriteResult> write_results;
    Timestamp commit_time;
};

}  // namespace ember::db::write
