// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_coordinator.hpp"

#include <magic_enum.hpp>

#include <ember/core/common/overloaded.hpp>
#include <ember/infra/common/log.hpp>

namespace ember::db::txn {

static std::string token_key(ByteView token) {
    return std::string{byte_view_to_string_view(token)};
}

TransactionCoordinator::TransactionCoordinator(const datastore::DocumentStore& store, TransactionSettings settings,
                                               Clock clock)
    : store_{store}, settings_{settings}, clock_{std::move(clock)} {}

Bytes TransactionCoordinator::new_token() {
    Bytes token;
    do {
        token.clear();
        for (int i{0}; i < 2; ++i) {
            const uint64_t random = generator_();
            for (int shift{56}; shift >= 0; shift -= 8) {
                token.push_back(static_cast<uint8_t>(random >> shift));
            }
        }
    } while (transactions_.contains(token_key(token)));
    return token;
}

bool TransactionCoordinator::is_idle(const Entry& entry, Timestamp now) const {
    return entry.info.state == TransactionState::kActive &&
           entry.last_activity.plus(settings_.transaction_timeout) < now;
}

Result<TransactionCoordinator::Entry*> TransactionCoordinator::active_entry(ByteView token, const std::string* database) {
    if (token.empty()) {
        return make_error(StatusCode::kInvalidArgument, "missing transaction");
    }
    const auto it = transactions_.find(token_key(token));
    if (it == transactions_.end()) {
        return make_error(StatusCode::kNotFound, "transaction " + to_hex(token) + " not found");
    }
    Entry& entry = it->second;
    if (database != nullptr && entry.info.database != *database) {
        return make_error(StatusCode::kInvalidArgument, "transaction " + to_hex(token) + " belongs to " + entry.info.database);
    }
    const Timestamp now = clock_();
    if (is_idle(entry, now)) {
        entry.info.state = TransactionState::kExpired;
    }
    switch (entry.info.state) {
        case TransactionState::kActive:
            break;
        case TransactionState::kExpired:
            return make_error(StatusCode::kInvalidArgument, std::string{kTransactionExpiredMessage});
        case TransactionState::kCommitted:
        case TransactionState::kRolledBack:
            return make_error(StatusCode::kInvalidArgument,
                              "transaction " + to_hex(token) + " is " + std::string{magic_enum::enum_name(entry.info.state)});
    }
    entry.last_activity = now;
    return &entry;
}

Result<Bytes> TransactionCoordinator::begin(const std::string& database, const TransactionOptions& options) {
    TransactionInfo info{.database = database, .read_time = store_.latest_commit_time()};

    if (const auto* read_only = std::get_if<ReadOnlyOptions>(&options)) {
        info.read_only = true;
        if (read_only->read_time) {
            if (*read_only->read_time < store_.earliest_read_time()) {
                return make_error(StatusCode::kInvalidArgument, "read time " + read_only->read_time->to_string() +
                                                                    " is older than the retained versions");
            }
            info.read_time = *read_only->read_time;
        }
    } else if (const auto& retry = std::get<ReadWriteOptions>(options).retry_transaction) {
        const auto it = transactions_.find(token_key(*retry));
        if (it == transactions_.end()) {
            return make_error(StatusCode::kNotFound, "retried transaction " + to_hex(*retry) + " not found");
        }
        TransactionInfo& previous = it->second.info;
        if (previous.database != database || previous.read_only) {
            return make_error(StatusCode::kInvalidArgument, "cannot retry transaction " + to_hex(*retry));
        }
        if (previous.state == TransactionState::kCommitted) {
            return make_error(StatusCode::kInvalidArgument, "retried transaction " + to_hex(*retry) + " has committed");
        }
        if (previous.state == TransactionState::kActive) {
            previous.state = TransactionState::kRolledBack;
        }
        info.logical_id = previous.logical_id;
        info.attempt = previous.attempt + 1;
    }
    if (info.logical_id == 0) {
        info.logical_id = next_logical_id_++;
    }

    Bytes token = new_token();
    EMBER_DEBUG << "TransactionCoordinator::begin"
                << log::Args{"token", to_hex(token), "logical_id", std::to_string(info.logical_id), "attempt",
                             std::to_string(info.attempt), "read_only", info.read_only ? "true" : "false"};
    transactions_.emplace(token_key(token), Entry{.info = std::move(info), .last_activity = clock_()});
    return token;
}

Result<Timestamp> TransactionCoordinator::read_time(const std::string& database, ByteView token) {
    const auto entry = active_entry(token, &database);
    if (!entry) return make_error(entry.error());
    return (*entry)->info.read_time;
}

VoidResult TransactionCoordinator::record_read(ByteView token, const std::string& name,
                                               const std::optional<Document>& observed) {
    const auto entry = active_entry(token, nullptr);
    if (!entry) return make_error(entry.error());
    if ((*entry)->info.read_only) return {};
    (*entry)->read_set.try_emplace(name, observed ? observed->update_time : std::nullopt);
    return {};
}

VoidResult TransactionCoordinator::record_query(ByteView token, query::QueryEvaluator evaluator,
                                                std::vector<std::string> result_names) {
    const auto entry = active_entry(token, nullptr);
    if (!entry) return make_error(entry.error());
    if ((*entry)->info.read_only) return {};
    (*entry)->queries.push_back(QueryRead{std::move(evaluator), std::move(result_names)});
    return {};
}

VoidResult TransactionCoordinator::detect_conflicts(const Entry& entry, const std::vector<write::Write>& writes) const {
    for (const auto& [name, observed] : entry.read_set) {
        const auto current = store_.get(name);
        const std::optional<Timestamp> current_update_time = current ? current->update_time : std::nullopt;
        if (current_update_time != observed) {
            return make_error(StatusCode::kAborted, "document " + name + " changed since it was read");
        }
    }
    for (const auto& write : writes) {
        const auto last_change = store_.last_change_time(write.name());
        if (last_change && *last_change > entry.info.read_time) {
            return make_error(StatusCode::kAborted, "document " + write.name() + " changed since transaction start");
        }
    }
    for (const auto& query_read : entry.queries) {
        const auto candidates = store_.scan(query_read.evaluator.parent().to_string());
        std::vector<std::string> names;
        for (const auto& response : query_read.evaluator.run(candidates, store_.latest_commit_time()).collect()) {
            if (response.document) names.push_back(response.document->name);
        }
        if (names != query_read.result_names) {
            return make_error(StatusCode::kAborted, "query results changed since they were read");
        }
    }
    return {};
}

VoidResult TransactionCoordinator::check_commit(const std::string& database, ByteView token,
                                                const std::vector<write::Write>& writes) {
    const auto entry = active_entry(token, &database);
    if (!entry) return make_error(entry.error());
    if ((*entry)->info.read_only && !writes.empty()) {
        return make_error(StatusCode::kInvalidArgument, "cannot write in a read-only transaction");
    }
    return {};
}

VoidResult TransactionCoordinator::validate_snapshot(ByteView token, const std::vector<write::Write>& writes) {
    const auto entry = active_entry(token, nullptr);
    if (!entry) return make_error(entry.error());
    Entry& transaction = **entry;
    if (transaction.info.read_only) return {};
    if (auto conflict = detect_conflicts(transaction, writes); !conflict) {
        transaction.info.state = TransactionState::kRolledBack;
        EMBER_DEBUG << "TransactionCoordinator::validate_snapshot aborted"
                    << log::Args{"token", to_hex(token), "reason", conflict.error().message()};
        return conflict;
    }
    return {};
}

void TransactionCoordinator::finish(ByteView token, TransactionState state) {
    const auto it = transactions_.find(token_key(token));
    if (it == transactions_.end()) return;
    it->second.info.state = state;
    it->second.last_activity = clock_();
}

VoidResult TransactionCoordinator::rollback(const std::string& database, ByteView token) {
    const auto entry = active_entry(token, &database);
    if (!entry) return make_error(entry.error());
    (*entry)->info.state = TransactionState::kRolledBack;
    return {};
}

size_t TransactionCoordinator::expire_idle() {
    const Timestamp now = clock_();
    size_t expired{0};
    for (auto it = transactions_.begin(); it != transactions_.end();) {
        Entry& entry = it->second;
        if (is_idle(entry, now)) {
            entry.info.state = TransactionState::kExpired;
            entry.last_activity = now;
            ++expired;
        }
        if (entry.info.state != TransactionState::kActive &&
            entry.last_activity.plus(settings_.terminal_retention) < now) {
            transactions_.erase(it++);
        } else {
            ++it;
        }
    }
    if (expired > 0) {
        EMBER_DEBUG << "TransactionCoordinator::expire_idle" << log::Args{"expired", std::to_string(expired)};
    }
    return expired;
}

std::optional<TransactionInfo> TransactionCoordinator::info(ByteView token) const {
    const auto it = transactions_.find(token_key(token));
    if (it == transactions_.end()) return std::nullopt;
    TransactionInfo info = it->second.info;
    if (is_idle(it->second, clock_())) {
        info.state = TransactionState::kExpired;
    }
    return info;
}

size_t TransactionCoordinator::active_count() const {
    size_t count{0};
    for (const auto& [_, entry] : transactions_) {
        if (entry.info.state == TransactionState::kActive) ++count;
    }
    return count;
}

std::optional<Timestamp> TransactionCoordinator::oldest_read_time() const {
    const Timestamp now = clock_();
    std::optional<Timestamp> oldest;
    for (const auto& [_, entry] : transactions_) {
        if (entry.info.state != TransactionState::kActive || is_idle(entry, now)) continue;
        if (!oldest || entry.info.read_time < *oldest) oldest = entry.info.read_time;
    }
    return oldest;
}

}  // namespace ember::db::txn
