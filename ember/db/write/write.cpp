// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "write.hpp"

#include <ember/core/common/overloaded.hpp>

namespace ember::db::write {

std::ostream& operator<<(std::ostream& out, const Precondition& precondition) {
    std::visit(Overloaded{
                   [&](bool exists) { out << "exists=" << (exists ? "true" : "false"); },
                   [&](const Timestamp& update_time) { out << "update_time=" << update_time; },
               },
               precondition.condition);
    return out;
}

Write Write::update(Document document, std::optional<DocumentMask> mask) {
    return Write{.operation = UpdateOperation{std::move(document), std::move(mask)}};
}

Write Write::remove(std::string name) {
    return Write{.operation = DeleteOperation{std::move(name)}};
}

Write Write::transform(std::string name, std::vector<FieldTransform> transforms) {
    return Write{.operation = TransformOperation{std::move(name), std::move(transforms)}};
}

Write& Write::with_precondition(Precondition precondition) {
    current_document = std::move(precondition);
    return *this;
}

Write& Write::with_transforms(std::vector<FieldTransform> transforms) {
    update_transforms = std::move(transforms);
    return *this;
}

const std::string& Write::name() const {
    return std::visit(Overloaded{
                          [](const UpdateOperation& op) -> const std::string& { return op.document.name; },
                          [](const DeleteOperation& op) -> const std::string& { return op.name; },
                          [](const TransformOperation& op) -> const std::string& { return op.name; },
                      },
                      operation);
}

}  // namespace ember::db::write
