//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BootstrapTracker.h
// Purpose: At-most-one in-flight refresh per server id, shared by every concurrent caller
//==========================================================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcphost {

//==========================================================================================================
// BootstrapTracker
// Purpose: Deduplicates expensive refresh operations keyed by server id.
// Notes:
//   - RunOnce() returns the in-flight shared future for an id when one exists; otherwise it registers a
//     new entry and runs the work on a detached worker thread.
//   - The entry is removed before the outcome is published, so a caller arriving after completion
//     starts a fresh run.
//   - Safe to call from any thread; outstanding work keeps the tracker's state alive on its own.
//==========================================================================================================
class BootstrapTracker {
public:
    using Work = std::function<void()>;

    BootstrapTracker();

    std::shared_future<void> RunOnce(const std::string& id, Work work);

    bool IsInFlight(const std::string& id) const;
    std::size_t InFlightCount() const;

    // Stops tracking an id; a run already in progress completes for the callers that joined it.
    void Forget(const std::string& id);

private:
    struct State {
        mutable std::mutex mutex;
        uint64_t nextToken{1};
        struct Entry {
            uint64_t token;
            std::shared_future<void> future;
        };
        std::unordered_map<std::string, Entry> inFlight;
    };
    std::shared_ptr<State> state;
};

} // namespace mcphost
