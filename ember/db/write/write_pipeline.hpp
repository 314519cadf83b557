// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include <ember/core/common/status.hpp>
#include <ember/core/types/document.hpp>
#include <ember/core/types/timestamp.hpp>
#include <ember/db/datastore/document_store.hpp>
#include <ember/db/write/write.hpp>

namespace ember::db::write {

//! Outcome of staging a batch: the store mutations to apply and the per-write results
struct StagedBatch {
    std::vector<datastore::Mutation> mutations;
    std::vector<WriteResult> results;
};

//! Check the batch shape (names, transforms) before staging
VoidResult validate_writes(const std::vector<Write>& writes);

//! Applies ordered write batches atomically: the batch is staged against an overlay of the current
//! store state and the store is mutated only if every write succeeds.
class WritePipeline {
  public:
    explicit WritePipeline(datastore::DocumentStore& store) : store_{store} {}

    //! Evaluate writes against the latest state without touching the store
    Result<StagedBatch> stage(const std::vector<Write>& writes, Timestamp commit_time) const;

    //! Stage and commit writes at commit_time
    Result<CommitResult> apply(const std::vector<Write>& writes, Timestamp commit_time);

  private:
    datastore::DocumentStore& store_;
};

}  // namespace ember::db::write
