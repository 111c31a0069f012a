//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BootstrapTracker.cpp
// Purpose: In-flight refresh deduplication keyed by server id
//==========================================================================================================

#include <thread>

#include "logging/Logger.h"
#include "mcphost/BootstrapTracker.h"

namespace mcphost {

BootstrapTracker::BootstrapTracker() : state(std::make_shared<State>()) {}

std::shared_future<void> BootstrapTracker::RunOnce(const std::string& id, Work work) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> future;
    uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lk(state->mutex);
        auto it = state->inFlight.find(id);
        if (it != state->inFlight.end()) {
            LOG_DEBUG("[{}] joining in-flight bootstrap", id);
            return it->second.future;
        }
        token = state->nextToken++;
        future = promise->get_future().share();
        state->inFlight.emplace(id, State::Entry{token, future});
    }

    std::thread([st = state, id, token, promise, work = std::move(work)]() {
        std::exception_ptr failure;
        try {
            work();
        } catch (const std::exception& e) {
            LOG_WARN("[{}] bootstrap failed: {}", id, e.what());
            failure = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lk(st->mutex);
            auto it = st->inFlight.find(id);
            // Forget() followed by a new run may have replaced the entry.
            if (it != st->inFlight.end() && it->second.token == token) {
                st->inFlight.erase(it);
            }
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    }).detach();
    return future;
}

bool BootstrapTracker::IsInFlight(const std::string& id) const {
    std::lock_guard<std::mutex> lk(state->mutex);
    return state->inFlight.count(id) > 0;
}

std::size_t BootstrapTracker::InFlightCount() const {
    std::lock_guard<std::mutex> lk(state->mutex);
    return state->inFlight.size();
}

void BootstrapTracker::Forget(const std::string& id) {
    std::lock_guard<std::mutex> lk(state->mutex);
    state->inFlight.erase(id);
}

} // namespace mcphost
