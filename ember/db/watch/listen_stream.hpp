// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ember/core/common/status.hpp>
#include <ember/db/watch/listen_protocol.hpp>
#include <ember/db/watch/watch_aggregator.hpp>
#include <ember/infra/concurrency/channel.hpp>
#include <ember/infra/concurrency/task.hpp>

namespace ember::db::watch {

//! Server to client half of a listen stream: responses, or the status closing the stream
using ListenResponseChannel = concurrency::Channel<Result<ListenResponse>>;
using ListenRequestChannel = concurrency::Channel<ListenRequest>;

//! Client driver of a listen stream: feeds the server responses to the aggregator in arrival order and
//! sends back the requests the aggregator produces
class ListenStream {
  public:
    ListenStream(WatchAggregator& aggregator, ListenRequestChannel& requests, ListenResponseChannel& responses)
        : aggregator_{aggregator}, requests_{requests}, responses_{responses} {}

    Task<void> add_target(Target target);
    Task<void> remove_target(TargetId target_id);

    //! Consume responses until the server closes the stream
    //! \return OK on orderly close, otherwise the stream-fatal status
    Task<Status> run();

  private:
    WatchAggregator& aggregator_;
    ListenRequestChannel& requests_;
    ListenResponseChannel& responses_;
};

}  // namespace ember::db::watch
