// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "listen_session.hpp"

#include <limits>

#include <absl/container/flat_hash_set.h>

#include <ember/core/common/overloaded.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::watch {

namespace {

    //! Responses of one update, merging the target ids of each document
    class ChangeCollector {
      public:
        void changed(const Document& document, TargetId target_id) {
            auto [it, _] = changes_.try_emplace(document.name, DocumentChange{.document = document});
            it->second.target_ids.push_back(target_id);
        }

        void removed(const std::string& name, bool still_exists, TargetId target_id, Timestamp read_time) {
            if (still_exists) {
                auto [it, _] = removes_.try_emplace(name, DocumentRemove{.document = name, .read_time = read_time});
                it->second.removed_target_ids.push_back(target_id);
            } else {
                auto [it, _] = deletes_.try_emplace(name, DocumentDelete{.document = name, .read_time = read_time});
                it->second.removed_target_ids.push_back(target_id);
            }
        }

        void flush(std::vector<ListenResponse>& responses) {
            for (auto& [_, change] : changes_) responses.emplace_back(std::move(change));
            for (auto& [_, remove] : removes_) responses.emplace_back(std::move(remove));
            for (auto& [_, del] : deletes_) responses.emplace_back(std::move(del));
            changes_.clear();
            removes_.clear();
            deletes_.clear();
        }

      private:
        absl::btree_map<std::string, DocumentChange> changes_;
        absl::btree_map<std::string, DocumentRemove> removes_;
        absl::btree_map<std::string, DocumentDelete> deletes_;
    };

    TargetChange target_change(TargetChangeType type, TargetId target_id) {
        return TargetChange{.type = type, .target_ids = {target_id}};
    }

}  // namespace

ListenSession::ListenSession(const datastore::DocumentStore& store, std::string database)
    : store_{store}, database_{std::move(database)} {}

Result<std::vector<ListenResponse>> ListenSession::handle(const ListenRequest& request) {
    if (request.database != database_) {
        return make_error(StatusCode::kInvalidArgument,
                          "listen request for " + request.database + " on a stream of " + database_);
    }
    return std::visit(Overloaded{
                          [&](const Target& target) { return add_target(target); },
                          [&](const RemoveTarget& remove) { return remove_target(remove.target_id); },
                      },
                      request.change);
}

Result<std::optional<query::QueryEvaluator>> ListenSession::compile(const Target& target) const {
    using Compiled = Result<std::optional<query::QueryEvaluator>>;
    return std::visit(
        Overloaded{
            [&](const QueryTarget& query_target) -> Compiled {
                if (auto valid = validate_parent_name(query_target.parent); !valid) return make_error(valid.error());
                if (database_name_of(query_target.parent) != database_) {
                    return make_error(StatusCode::kInvalidArgument, "query parent " + query_target.parent +
                                                                        " is not in " + database_);
                }
                auto evaluator = query::QueryEvaluator::create(query_target.parent, query_target.structured_query);
                if (!evaluator) return make_error(evaluator.error());
                return std::optional<query::QueryEvaluator>{std::move(*evaluator)};
            },
            [&](const DocumentsTarget& documents_target) -> Compiled {
                if (documents_target.documents.empty()) {
                    return make_error(StatusCode::kInvalidArgument, "documents target without documents");
                }
                for (const auto& name : documents_target.documents) {
                    if (auto valid = validate_document_name(name); !valid) return make_error(valid.error());
                    if (database_name_of(name) != database_) {
                        return make_error(StatusCode::kInvalidArgument, "document " + name + " is not in " + database_);
                    }
                }
                return std::optional<query::QueryEvaluator>{};
            },
        },
        target.selector);
}

std::vector<Document> ListenSession::evaluate(const ActiveTarget& target, Timestamp read_time) const {
    std::vector<Document> documents;
    if (target.evaluator) {
        const auto candidates = store_.scan(target.evaluator->parent().to_string(), read_time);
        auto stream = target.evaluator->run(candidates, read_time, std::numeric_limits<int64_t>::max());
        while (auto response = stream.next()) {
            if (response->document) documents.push_back(std::move(*response->document));
        }
        return documents;
    }
    absl::flat_hash_set<std::string> seen;
    for (const auto& name : std::get<DocumentsTarget>(target.target.selector).documents) {
        if (!seen.insert(name).second) continue;
        if (auto document = store_.get(name, read_time)) {
            documents.push_back(std::move(*document));
        }
    }
    return documents;
}

TargetChange ListenSession::global_no_change(Timestamp read_time) const {
    return TargetChange{
        .type = TargetChangeType::kNoChange,
        .resume_token = encode_resume_token(read_time),
        .read_time = read_time,
    };
}

Result<std::vector<ListenResponse>> ListenSession::add_target(Target target) {
    if (target.target_id != 0 && targets_.contains(target.target_id)) {
        return make_error(StatusCode::kInvalidArgument, "target id " + std::to_string(target.target_id) + " already in use");
    }
    if (target.resume_token && target.read_time) {
        return make_error(StatusCode::kInvalidArgument, "target cannot have both resume token and read time");
    }
    if (target.target_id == 0) {
        while (targets_.contains(next_target_id_)) ++next_target_id_;
        target.target_id = next_target_id_++;
    }
    const TargetId target_id = target.target_id;

    std::vector<ListenResponse> responses;
    auto evaluator = compile(target);
    std::optional<Timestamp> since = target.read_time;
    if (evaluator && target.resume_token) {
        since = decode_resume_token(*target.resume_token);
        if (!since) {
            evaluator = make_error(StatusCode::kInvalidArgument, "malformed resume token");
        }
    }
    if (!evaluator) {
        EMBER_DEBUG << "ListenSession: rejecting target"
                    << log::Args{"target_id", std::to_string(target_id), "cause", evaluator.error().to_string()};
        TargetChange remove = target_change(TargetChangeType::kRemove, target_id);
        remove.cause = evaluator.error();
        responses.emplace_back(std::move(remove));
        return responses;
    }

    // Targets already registered must be consistent at the read time announced below, even when
    // the commit event that moved the store there has not been delivered yet
    const Timestamp read_time = store_.latest_commit_time();
    responses = advance_targets(read_time);

    ActiveTarget active{.target = std::move(target), .evaluator = std::move(*evaluator)};
    const auto current = evaluate(active, read_time);

    responses.emplace_back(target_change(TargetChangeType::kAdd, target_id));
    ChangeCollector collector;
    if (since && *since >= store_.earliest_read_time()) {
        const auto previous = evaluate(active, *since);
        absl::flat_hash_set<std::string> previous_names;
        for (const auto& document : previous) previous_names.insert(document.name);
        absl::flat_hash_set<std::string> current_names;
        for (const auto& document : current) {
            current_names.insert(document.name);
            if (!previous_names.contains(document.name) || *document.update_time > *since) {
                collector.changed(document, target_id);
            }
        }
        for (const auto& document : previous) {
            if (!current_names.contains(document.name)) {
                collector.removed(document.name, store_.get(document.name, read_time).has_value(), target_id, read_time);
            }
        }
    } else {
        if (since) {
            responses.emplace_back(target_change(TargetChangeType::kReset, target_id));
        }
        for (const auto& document : current) {
            collector.changed(document, target_id);
        }
    }
    collector.flush(responses);

    for (const auto& document : current) {
        active.members.insert(document.name);
    }
    TargetChange current_change = target_change(TargetChangeType::kCurrent, target_id);
    current_change.resume_token = encode_resume_token(read_time);
    responses.emplace_back(std::move(current_change));
    responses.emplace_back(global_no_change(read_time));

    if (active.target.once) {
        responses.emplace_back(target_change(TargetChangeType::kRemove, target_id));
    } else {
        targets_.emplace(target_id, std::move(active));
    }
    EMBER_DEBUG << "ListenSession: target added"
                << log::Args{"target_id", std::to_string(target_id), "documents", std::to_string(current.size()),
                             "read_time", read_time.to_string()};
    return responses;
}

Result<std::vector<ListenResponse>> ListenSession::remove_target(TargetId target_id) {
    if (targets_.erase(target_id) == 0) {
        return make_error(StatusCode::kInvalidArgument, "unknown target id " + std::to_string(target_id));
    }
    std::vector<ListenResponse> responses;
    responses.emplace_back(target_change(TargetChangeType::kRemove, target_id));
    return responses;
}

std::vector<ListenResponse> ListenSession::advance_targets(Timestamp read_time) {
    std::vector<ListenResponse> responses;
    if (read_time <= last_read_time_) {
        return responses;
    }
    ChangeCollector collector;
    for (auto& [target_id, target] : targets_) {
        const auto current = evaluate(target, read_time);
        absl::btree_set<std::string> members;
        for (const auto& document : current) {
            members.insert(document.name);
            if (!target.members.contains(document.name) || *document.update_time > last_read_time_) {
                collector.changed(document, target_id);
            }
        }
        for (const auto& name : target.members) {
            if (!members.contains(name)) {
                collector.removed(name, store_.get(name, read_time).has_value(), target_id, read_time);
            }
        }
        target.members = std::move(members);
    }
    collector.flush(responses);
    last_read_time_ = read_time;
    return responses;
}

std::vector<ListenResponse> ListenSession::on_commit(const datastore::CommitEvent& event) {
    if (targets_.empty() || event.commit_time <= last_read_time_) {
        return {};
    }
    auto responses = advance_targets(event.commit_time);
    responses.emplace_back(global_no_change(event.commit_time));
    return responses;
}

Result<ExistenceFilter> ListenSession::existence_filter(TargetId target_id) const {
    const auto it = targets_.find(target_id);
    if (it == targets_.end()) {
        return make_error(StatusCode::kNotFound, "unknown target id " + std::to_string(target_id));
    }
    return ExistenceFilter{.target_id = target_id, .count = static_cast<int32_t>(it->second.members.size())};
}

std::vector<ExistenceFilter> ListenSession::existence_filters() const {
    std::vector<ExistenceFilter> filters;
    filters.reserve(targets_.size());
    for (const auto& [target_id, target] : targets_) {
        filters.push_back({.target_id = target_id, .count = static_cast<int32_t>(target.members.size())});
    }
    return filters;
}

}  // namespace ember::db::watch
