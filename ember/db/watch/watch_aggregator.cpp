// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "watch_aggregator.hpp"

#include <algorithm>

#include <absl/container/flat_hash_map.h>
#include <magic_enum.hpp>

#include <ember/core/common/overloaded.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::watch {

WatchAggregator::WatchAggregator(std::string database, WatchSettings settings, SnapshotCallback on_snapshot,
                                 TargetErrorCallback on_target_error, StreamErrorCallback on_stream_error,
                                 RequeryFunction requery)
    : database_{std::move(database)},
      settings_{settings},
      on_snapshot_{std::move(on_snapshot)},
      on_target_error_{std::move(on_target_error)},
      on_stream_error_{std::move(on_stream_error)},
      requery_{std::move(requery)} {}

ListenRequest WatchAggregator::add_request(const Target& target) const {
    return ListenRequest{.database = database_, .change = target};
}

Result<ListenRequest> WatchAggregator::add_target(Target target) {
    if (target.target_id == 0) {
        return make_error(StatusCode::kInvalidArgument, "client targets need a non-zero id");
    }
    const auto it = targets_.find(target.target_id);
    if (it != targets_.end() && it->second.state != TargetState::kRemoved) {
        return make_error(StatusCode::kInvalidArgument, "target " + std::to_string(target.target_id) + " already active");
    }
    std::optional<query::QueryEvaluator> evaluator;
    if (const auto* query_target = std::get_if<QueryTarget>(&target.selector)) {
        auto compiled = query::QueryEvaluator::create(query_target->parent, query_target->structured_query);
        if (!compiled) return make_error(compiled.error());
        evaluator = std::move(*compiled);
    }
    ListenRequest request = add_request(target);
    const TargetId target_id = target.target_id;
    targets_.insert_or_assign(target_id, TargetView{.target = std::move(target), .evaluator = std::move(evaluator)});
    return request;
}

Result<ListenRequest> WatchAggregator::remove_target(TargetId target_id) {
    const auto it = targets_.find(target_id);
    if (it == targets_.end() || it->second.state == TargetState::kRemoved) {
        return make_error(StatusCode::kNotFound, "target " + std::to_string(target_id) + " is not active");
    }
    it->second.state = TargetState::kRemoved;
    it->second.accumulated.clear();
    return ListenRequest{.database = database_, .change = RemoveTarget{target_id}};
}

VoidResult WatchAggregator::on_response(const ListenResponse& response) {
    if (failed_) {
        return make_error(StatusCode::kFailedPrecondition, "listen stream has failed");
    }
    return std::visit(Overloaded{
                          [&](const TargetChange& change) { return on_target_change(change); },
                          [&](const DocumentChange& change) -> VoidResult {
                              on_document_change(change);
                              return {};
                          },
                          [&](const DocumentDelete& del) -> VoidResult {
                              on_document_removed(del.document, del.removed_target_ids);
                              return {};
                          },
                          [&](const DocumentRemove& remove) -> VoidResult {
                              on_document_removed(remove.document, remove.removed_target_ids);
                              return {};
                          },
                          [&](const ExistenceFilter& filter) -> VoidResult {
                              on_existence_filter(filter);
                              return {};
                          },
                      },
                      response);
}

VoidResult WatchAggregator::fail(Status status) {
    failed_ = true;
    EMBER_WARN << "WatchAggregator: listen stream failed" << log::Args{"status", status.to_string()};
    if (on_stream_error_) on_stream_error_(status);
    return make_error(std::move(status));
}

VoidResult WatchAggregator::on_target_change(const TargetChange& change) {
    if (change.read_time) {
        if (last_read_time_ && *change.read_time < *last_read_time_) {
            return fail(internal_error("read time " + change.read_time->to_string() + " precedes " +
                                       last_read_time_->to_string()));
        }
        last_read_time_ = change.read_time;
    }

    // Empty target ids address every target of the stream
    std::vector<TargetId> target_ids = change.target_ids;
    if (target_ids.empty() && change.type != TargetChangeType::kNoChange) {
        for (const auto& [target_id, _] : targets_) target_ids.push_back(target_id);
    }

    switch (change.type) {
        case TargetChangeType::kNoChange:
            if (change.target_ids.empty()) {
                if (!change.read_time) break;
                for (auto& [target_id, view] : targets_) {
                    if (!change.resume_token.empty() &&
                        (view.state == TargetState::kCurrent || view.state == TargetState::kActive)) {
                        view.target.resume_token = change.resume_token;
                    }
                    if (view.state == TargetState::kCurrent || (view.state == TargetState::kActive && view.dirty)) {
                        publish(target_id, view, *change.read_time);
                    }
                }
            } else if (!change.resume_token.empty()) {
                for (const TargetId target_id : target_ids) {
                    const auto it = targets_.find(target_id);
                    if (it != targets_.end()) it->second.target.resume_token = change.resume_token;
                }
            }
            break;
        case TargetChangeType::kAdd:
            for (const TargetId target_id : target_ids) {
                const auto it = targets_.find(target_id);
                if (it == targets_.end() || it->second.state != TargetState::kPending) continue;
                TargetView& view = it->second;
                view.state = TargetState::kSyncing;
                // Without resume point the server sends the full result set again
                if (!view.target.resume_token && !view.target.read_time) view.accumulated.clear();
            }
            break;
        case TargetChangeType::kRemove:
            for (const TargetId target_id : target_ids) {
                const auto it = targets_.find(target_id);
                if (it == targets_.end()) continue;
                TargetView& view = it->second;
                if (change.cause) {
                    EMBER_DEBUG << "WatchAggregator: target removed"
                                << log::Args{"target_id", std::to_string(target_id), "cause", change.cause->to_string()};
                    if (on_target_error_) on_target_error_(target_id, *change.cause);
                } else if (view.pending_removals > 0) {
                    // Removal requested by a reset, the target is being listened to again
                    --view.pending_removals;
                    continue;
                }
                view.state = TargetState::kRemoved;
                view.accumulated.clear();
            }
            break;
        case TargetChangeType::kCurrent:
            for (const TargetId target_id : target_ids) {
                const auto it = targets_.find(target_id);
                if (it == targets_.end() || it->second.state == TargetState::kRemoved) continue;
                TargetView& view = it->second;
                view.state = TargetState::kCurrent;
                if (change.read_time) {
                    if (!change.resume_token.empty()) view.target.resume_token = change.resume_token;
                    publish(target_id, view, *change.read_time);
                }
            }
            break;
        case TargetChangeType::kReset:
            for (const TargetId target_id : target_ids) {
                const auto it = targets_.find(target_id);
                if (it == targets_.end() || it->second.state == TargetState::kRemoved) continue;
                it->second.accumulated.clear();
                it->second.dirty = true;
                it->second.state = TargetState::kReset;
            }
            break;
    }
    return {};
}

void WatchAggregator::on_document_change(const DocumentChange& change) {
    for (const TargetId target_id : change.target_ids) {
        const auto it = targets_.find(target_id);
        if (it == targets_.end() || it->second.state == TargetState::kRemoved) continue;
        it->second.accumulated.insert_or_assign(change.document.name, change.document);
        it->second.dirty = true;
    }
    on_document_removed(change.document.name, change.removed_target_ids);
}

void WatchAggregator::on_document_removed(const std::string& name, const std::vector<TargetId>& removed_target_ids) {
    for (const TargetId target_id : removed_target_ids) {
        const auto it = targets_.find(target_id);
        if (it == targets_.end()) continue;
        if (it->second.accumulated.erase(name) > 0) {
            it->second.dirty = true;
        }
    }
}

void WatchAggregator::on_existence_filter(const ExistenceFilter& filter) {
    const auto it = targets_.find(filter.target_id);
    if (it == targets_.end() || it->second.state == TargetState::kRemoved) return;
    TargetView& view = it->second;
    if (static_cast<size_t>(filter.count) == view.accumulated.size()) return;

    EMBER_DEBUG << "WatchAggregator: existence filter mismatch"
                << log::Args{"target_id", std::to_string(filter.target_id), "expected", std::to_string(filter.count),
                             "actual", std::to_string(view.accumulated.size()), "policy",
                             std::string{magic_enum::enum_name(settings_.existence_filter_policy)}};
    if (settings_.existence_filter_policy == ExistenceFilterPolicy::kRequery && requery_) {
        auto documents = requery_(view.target);
        if (documents) {
            view.accumulated.clear();
            for (auto& document : *documents) {
                auto name = document.name;
                view.accumulated.insert_or_assign(std::move(name), std::move(document));
            }
            view.dirty = true;
            return;
        }
        EMBER_WARN << "WatchAggregator: requery failed, resetting target"
                   << log::Args{"target_id", std::to_string(filter.target_id), "status", documents.error().to_string()};
    }
    reset_target(filter.target_id, view);
}

void WatchAggregator::reset_target(TargetId target_id, TargetView& view) {
    view.accumulated.clear();
    view.dirty = true;
    view.target.resume_token.reset();
    view.target.read_time.reset();
    view.state = TargetState::kPending;
    ++view.pending_removals;
    pending_requests_.push_back(ListenRequest{.database = database_, .change = RemoveTarget{target_id}});
    pending_requests_.push_back(add_request(view.target));
}

std::vector<Document> WatchAggregator::ordered(const TargetView& view) const {
    std::vector<Document> documents;
    documents.reserve(view.accumulated.size());
    for (const auto& [_, document] : view.accumulated) {
        documents.push_back(document);
    }
    if (view.evaluator) {
        std::sort(documents.begin(), documents.end(), [&](const Document& lhs, const Document& rhs) {
            return view.evaluator->compare(lhs, rhs) < 0;
        });
    } else {
        std::sort(documents.begin(), documents.end(), [](const Document& lhs, const Document& rhs) {
            return compare_resource_names(lhs.name, rhs.name) < 0;
        });
    }
    return documents;
}

void WatchAggregator::publish(TargetId target_id, TargetView& view, Timestamp read_time) {
    Snapshot snapshot{.target_id = target_id, .read_time = read_time, .documents = ordered(view)};

    absl::flat_hash_map<std::string, size_t> old_positions;
    for (size_t i{0}; i < view.published.size(); ++i) {
        old_positions.emplace(view.published[i].name, i);
    }
    absl::flat_hash_map<std::string, size_t> new_positions;
    for (size_t i{0}; i < snapshot.documents.size(); ++i) {
        new_positions.emplace(snapshot.documents[i].name, i);
    }
    for (size_t i{0}; i < view.published.size(); ++i) {
        if (!new_positions.contains(view.published[i].name)) {
            snapshot.changes.push_back({ChangeType::kRemoved, view.published[i], static_cast<int64_t>(i), -1});
        }
    }
    for (size_t i{0}; i < snapshot.documents.size(); ++i) {
        const Document& document = snapshot.documents[i];
        const auto old = old_positions.find(document.name);
        if (old == old_positions.end()) {
            snapshot.changes.push_back({ChangeType::kAdded, document, -1, static_cast<int64_t>(i)});
        } else if (!(view.published[old->second] == document)) {
            snapshot.changes.push_back(
                {ChangeType::kModified, document, static_cast<int64_t>(old->second), static_cast<int64_t>(i)});
        }
    }

    view.state = TargetState::kActive;
    view.dirty = false;
    if (view.has_published && snapshot.changes.empty()) {
        return;
    }
    view.has_published = true;
    view.published = snapshot.documents;
    EMBER_TRACE << "WatchAggregator: snapshot"
                << log::Args{"target_id", std::to_string(target_id), "read_time", read_time.to_string(), "documents",
                             std::to_string(snapshot.documents.size()), "changes",
                             std::to_string(snapshot.changes.size())};
    if (on_snapshot_) on_snapshot_(snapshot);
}

std::vector<ListenRequest> WatchAggregator::take_pending_requests() {
    std::vector<ListenRequest> requests;
    requests.swap(pending_requests_);
    return requests;
}

std::vector<ListenRequest> WatchAggregator::reopen() {
    failed_ = false;
    last_read_time_.reset();
    pending_requests_.clear();

    std::vector<ListenRequest> requests;
    for (auto& [target_id, view] : targets_) {
        if (view.state == TargetState::kRemoved) continue;
        // Unpublished changes are dropped, the new stream resumes from the last consistent view
        view.accumulated.clear();
        for (const auto& document : view.published) {
            view.accumulated.insert_or_assign(document.name, document);
        }
        view.dirty = false;
        view.pending_removals = 0;
        view.state = TargetState::kPending;
        requests.push_back(add_request(view.target));
    }
    return requests;
}

std::optional<TargetState> WatchAggregator::state(TargetId target_id) const {
    const auto it = targets_.find(target_id);
    if (it == targets_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<Bytes> WatchAggregator::resume_token(TargetId target_id) const {
    const auto it = targets_.find(target_id);
    if (it == targets_.end()) return std::nullopt;
    return it->second.target.resume_token;
}

}  // namespace ember::db::watch
