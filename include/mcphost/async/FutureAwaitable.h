//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiters enabling co_await on std::future and timed delays inside async::Task coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace mcphost {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends until a std::future is ready, then resumes the coroutine on a detached waiter
//          thread. await_resume() calls get(), so a stored exception surfaces at the co_await.
// Notes:
//   When slowAfter is non-zero and the future is still pending at that point, onSlow runs once on the
//   waiter thread and waiting continues.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f,
                             std::chrono::milliseconds slowAfter = std::chrono::milliseconds::zero(),
                             std::function<void()> onSlow = {})
        : fut(std::move(f)), slowAfter(slowAfter), onSlow(std::move(onSlow)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // The awaitable lives in the suspended frame, so `this` stays valid until h.resume().
        std::thread waiter([this, h]() {
            if (slowAfter.count() > 0 && onSlow &&
                fut.wait_for(slowAfter) == std::future_status::timeout) {
                onSlow();
            }
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
    std::chrono::milliseconds slowAfter;
    std::function<void()> onSlow;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut, std::chrono::milliseconds slowAfter,
                                              std::function<void()> onSlow) {
    return FutureAwaitable<T>(std::move(fut), slowAfter, std::move(onSlow));
}

//==========================================================================================================
// DelayAwaitable
// Purpose: co_await-able pause; resumes on a detached thread after the given duration.
//==========================================================================================================
class DelayAwaitable {
public:
    explicit DelayAwaitable(std::chrono::milliseconds d) : delay(d) {}

    bool await_ready() const noexcept { return delay.count() <= 0; }

    void await_suspend(std::coroutine_handle<> h) const {
        std::thread([d = delay, h]() {
            std::this_thread::sleep_for(d);
            h.resume();
        }).detach();
    }

    void await_resume() const noexcept {}

private:
    std::chrono::milliseconds delay;
};

inline DelayAwaitable delayFor(std::chrono::milliseconds d) {
    return DelayAwaitable(d);
}

} // namespace async
} // namespace mcphost
