// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "document_store.hpp"

#include <absl/container/btree_set.h>
#include <absl/strings/match.h>

#include <ember/infra/common/ensure.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::datastore {

DocumentStore::DocumentStore(std::chrono::nanoseconds retention) : retention_{retention} {}

const DocumentVersion* DocumentStore::version_at(const History& history, std::optional<Timestamp> read_time) {
    if (!read_time) {
        return history.empty() ? nullptr : &history.back();
    }
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->commit_time <= *read_time) return &*it;
    }
    return nullptr;
}

std::optional<Document> DocumentStore::get(std::string_view name, std::optional<Timestamp> read_time) const {
    const auto it = documents_.find(name);
    if (it == documents_.end()) return std::nullopt;
    const DocumentVersion* version = version_at(it->second, read_time);
    if (version == nullptr) return std::nullopt;
    return version->document;
}

std::optional<Timestamp> DocumentStore::last_change_time(std::string_view name) const {
    const auto it = documents_.find(name);
    if (it == documents_.end() || it->second.empty()) return std::nullopt;
    return it->second.back().commit_time;
}

std::vector<Document> DocumentStore::scan(std::string_view parent, std::optional<Timestamp> read_time) const {
    const std::string prefix = std::string{parent} + "/";
    std::vector<Document> result;
    for (auto it = documents_.lower_bound(prefix); it != documents_.end() && absl::StartsWith(it->first, prefix); ++it) {
        const DocumentVersion* version = version_at(it->second, read_time);
        if (version != nullptr && version->document) {
            result.push_back(*version->document);
        }
    }
    return result;
}

std::vector<Document> DocumentStore::list_collection(std::string_view collection, std::optional<Timestamp> read_time,
                                                     bool show_missing) const {
    const std::string prefix = std::string{collection} + "/";
    absl::btree_map<std::string, Document> entries;
    for (auto it = documents_.lower_bound(prefix); it != documents_.end() && absl::StartsWith(it->first, prefix); ++it) {
        const DocumentVersion* version = version_at(it->second, read_time);
        if (version == nullptr || !version->document) continue;

        const std::string_view rest = std::string_view{it->first}.substr(prefix.size());
        const auto slash = rest.find('/');
        if (slash == std::string_view::npos) {
            entries.insert_or_assign(it->first, *version->document);
        } else if (show_missing) {
            std::string direct = prefix + std::string{rest.substr(0, slash)};
            if (!entries.contains(direct) && !get(direct, read_time)) {
                entries.emplace(direct, Document{.name = direct});
            }
        }
    }
    std::vector<Document> result;
    result.reserve(entries.size());
    for (auto& [name, document] : entries) {
        result.push_back(std::move(document));
    }
    return result;
}

std::vector<std::string> DocumentStore::collection_ids(std::string_view parent, std::optional<Timestamp> read_time) const {
    const std::string prefix = std::string{parent} + "/";
    absl::btree_set<std::string> ids;
    for (auto it = documents_.lower_bound(prefix); it != documents_.end() && absl::StartsWith(it->first, prefix); ++it) {
        const DocumentVersion* version = version_at(it->second, read_time);
        if (version == nullptr || !version->document) continue;
        const std::string_view rest = std::string_view{it->first}.substr(prefix.size());
        ids.emplace(rest.substr(0, rest.find('/')));
    }
    return {ids.begin(), ids.end()};
}

CommitEvent DocumentStore::commit(std::vector<Mutation> mutations, Timestamp commit_time) {
    ensure_invariant(commit_time > latest_commit_time_, [&]() {
        return "commit time " + commit_time.to_string() + " not after " + latest_commit_time_.to_string();
    });

    CommitEvent event{.commit_time = commit_time};
    event.changes.reserve(mutations.size());
    for (auto& mutation : mutations) {
        History& history = documents_[mutation.name];
        std::optional<Document> before = history.empty() ? std::nullopt : history.back().document;
        if (!before && !mutation.document) {
            // Deleting an absent document leaves no trace
            if (history.empty()) documents_.erase(mutation.name);
            continue;
        }
        history.push_back(DocumentVersion{commit_time, mutation.document});
        event.changes.push_back(ChangeRecord{mutation.name, std::move(before), std::move(mutation.document)});
    }
    latest_commit_time_ = commit_time;

    EMBER_TRACE << "DocumentStore::commit" << log::Args{"commit_time", commit_time.to_string(), "changes",
                                                       std::to_string(event.changes.size())};

    if (retention_.count() > 0) {
        Timestamp horizon = commit_time.plus(-retention_);
        if (retention_floor_) {
            if (const auto floor = retention_floor_(); floor && *floor < horizon) {
                horizon = *floor;
            }
        }
        prune(horizon);
    }

    std::vector<CommitObserver> observers;
    observers.reserve(observers_.size());
    for (const auto& [_, observer] : observers_) {
        observers.push_back(observer);
    }
    for (const auto& observer : observers) {
        observer(event);
    }
    return event;
}

void DocumentStore::prune(Timestamp horizon) {
    if (horizon <= earliest_read_time_) return;
    for (auto it = documents_.begin(); it != documents_.end();) {
        History& history = it->second;
        size_t first_visible{0};
        for (size_t i{0}; i < history.size(); ++i) {
            if (history[i].commit_time <= horizon) first_visible = i;
        }
        history.erase(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(first_visible));
        const bool only_tombstone = history.size() == 1 && !history.front().document && history.front().commit_time <= horizon;
        if (history.empty() || only_tombstone) {
            it = documents_.erase(it);
        } else {
            ++it;
        }
    }
    earliest_read_time_ = horizon;
}

size_t DocumentStore::version_count() const {
    size_t count{0};
    for (const auto& [_, history] : documents_) {
        count += history.size();
    }
    return count;
}

uint64_t DocumentStore::subscribe(CommitObserver observer) {
    const uint64_t id = next_observer_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void DocumentStore::unsubscribe(uint64_t id) {
    observers_.erase(id);
}

}  // namespace ember::db::datastore
