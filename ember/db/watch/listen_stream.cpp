// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include "listen_stream.hpp"

#include <ember/infra/common/log.hpp>

namespace ember::db::watch {

Task<void> ListenStream::add_target(Target target) {
    auto request = aggregator_.add_target(std::move(target));
    success_or_throw(request);
    co_await requests_.send(std::move(*request));
}

Task<void> ListenStream::remove_target(TargetId target_id) {
    auto request = aggregator_.remove_target(target_id);
    success_or_throw(request);
    co_await requests_.send(std::move(*request));
}

Task<Status> ListenStream::run() {
    while (true) {
        auto message = co_await responses_.receive();
        if (!message) {
            EMBER_DEBUG << "ListenStream: closed by server";
            co_return Status{};
        }
        if (!*message) {
            requests_.close();
            co_return aggregator_.fail(message->error()).error();
        }
        if (auto processed = aggregator_.on_response(**message); !processed) {
            requests_.close();
            co_return processed.error();
        }
        for (auto& request : aggregator_.take_pending_requests()) {
            co_await requests_.send(std::move(request));
        }
    }
}

}  // namespace ember::db::watch
