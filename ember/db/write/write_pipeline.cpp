// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "write_pipeline.hpp"

#include <sstream>

#include <ember/core/common/overloaded.hpp>
#include <ember/db/write/transforms.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::write {

namespace {

    //! Latest state of each document touched by the batch, falling back to the store
    class Overlay {
      public:
        explicit Overlay(const datastore::DocumentStore& store) : store_{store} {}

        const std::optional<Document>& current(const std::string& name) {
            auto it = staged_.find(name);
            if (it == staged_.end()) {
                it = staged_.emplace(name, store_.get(name)).first;
                order_.push_back(name);
            }
            return it->second;
        }

        void put(const std::string& name, std::optional<Document> document) {
            current(name);
            staged_[name] = std::move(document);
        }

        std::vector<datastore::Mutation> mutations() const {
            std::vector<datastore::Mutation> result;
            for (const auto& name : order_) {
                result.push_back({name, staged_.at(name)});
            }
            return result;
        }

      private:
        const datastore::DocumentStore& store_;
        absl::flat_hash_map<std::string, std::optional<Document>> staged_;
        std::vector<std::string> order_;
    };

    VoidResult check_precondition(const Precondition& precondition, const std::optional<Document>& current,
                                  size_t index, const std::string& name) {
        const bool exists = current.has_value() && current->exists();
        const bool ok = std::visit(Overloaded{
                                       [&](bool must_exist) { return must_exist == exists; },
                                       [&](const Timestamp& update_time) {
                                           return exists && current->update_time == update_time;
                                       },
                                   },
                                   precondition.condition);
        if (ok) return {};
        std::ostringstream message;
        message << "write " << index << " on " << name << " failed precondition " << precondition;
        return make_error(StatusCode::kFailedPrecondition, message.str());
    }

    void apply_mask(MapValue& fields, const Document& update, const DocumentMask& mask) {
        for (const auto& path : mask.field_paths) {
            if (const Value* value = update.field(path)) {
                fields.set(path, *value);
            } else {
                fields.erase(path);
            }
        }
    }

}  // namespace

VoidResult validate_writes(const std::vector<Write>& writes) {
    for (size_t i{0}; i < writes.size(); ++i) {
        const Write& write = writes[i];
        if (auto result = validate_document_name(write.name()); !result) {
            return make_error(StatusCode::kInvalidArgument, "write " + std::to_string(i) + ": " + result.error().message());
        }
        if (write.is_delete() && !write.update_transforms.empty()) {
            return make_error(StatusCode::kInvalidArgument, "write " + std::to_string(i) + ": delete with transforms");
        }
        const auto* transform_op = std::get_if<TransformOperation>(&write.operation);
        if (transform_op && !write.update_transforms.empty()) {
            return make_error(StatusCode::kInvalidArgument,
                              "write " + std::to_string(i) + ": transform with update transforms");
        }
        for (const auto* transforms : {&write.update_transforms, transform_op ? &transform_op->transforms : nullptr}) {
            if (transforms == nullptr) continue;
            for (const auto& transform : *transforms) {
                if (auto result = validate_transform(transform); !result) {
                    return make_error(StatusCode::kInvalidArgument,
                                      "write " + std::to_string(i) + ": " + result.error().message());
                }
            }
        }
        if (const auto* update = std::get_if<UpdateOperation>(&write.operation); update && update->update_mask) {
            for (const auto& path : update->update_mask->field_paths) {
                if (path.empty() || path.is_document_key()) {
                    return make_error(StatusCode::kInvalidArgument,
                                      "write " + std::to_string(i) + ": invalid update mask path " + path.to_string());
                }
            }
        }
    }
    return {};
}

Result<StagedBatch> WritePipeline::stage(const std::vector<Write>& writes, Timestamp commit_time) const {
    if (auto result = validate_writes(writes); !result) return make_error(result.error());

    Overlay overlay{store_};
    StagedBatch batch;
    batch.results.reserve(writes.size());
    for (size_t i{0}; i < writes.size(); ++i) {
        const Write& write = writes[i];
        const std::string& name = write.name();
        const std::optional<Document> current = overlay.current(name);
        const bool exists = current.has_value() && current->exists();

        if (write.current_document) {
            if (auto result = check_precondition(*write.current_document, current, i, name); !result) {
                return make_error(result.error());
            }
        }

        WriteResult write_result{.update_time = commit_time};
        if (write.is_delete()) {
            overlay.put(name, std::nullopt);
            batch.results.push_back(std::move(write_result));
            continue;
        }

        MapValue fields = exists ? current->fields : MapValue{};
        const std::vector<FieldTransform>* transforms{&write.update_transforms};
        if (const auto* update = std::get_if<UpdateOperation>(&write.operation)) {
            if (update->update_mask) {
                apply_mask(fields, update->document, *update->update_mask);
            } else {
                fields = update->document.fields;
            }
        } else {
            transforms = &std::get<TransformOperation>(write.operation).transforms;
        }
        write_result.transform_results = apply_transforms(*transforms, fields, commit_time);

        overlay.put(name, Document{
                              .name = name,
                              .fields = std::move(fields),
                              .create_time = exists ? current->create_time : commit_time,
                              .update_time = commit_time,
                          });
        batch.results.push_back(std::move(write_result));
    }
    batch.mutations = overlay.mutations();
    return batch;
}

Result<CommitResult> WritePipeline::apply(const std::vector<Write>& writes, Timestamp commit_time) {
    auto staged = stage(writes, commit_time);
    if (!staged) {
        EMBER_DEBUG << "WritePipeline::apply rejected" << log::Args{"reason", staged.error().to_string()};
        return make_error(staged.error());
    }
    store_.commit(std::move(staged->mutations), commit_time);
    return CommitResult{std::move(staged->results), commit_time};
}

}  // namespace ember::db::write
