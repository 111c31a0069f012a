//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type whose outcome is published through std::future (C++20)
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace mcphost {
namespace async {

namespace detail {

// Shared promise plumbing: the coroutine runs until its first real suspension on the calling thread,
// and the frame (with its std::promise) is released at final suspension.
template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Return type for orchestrator coroutines. Dropping a Task neither blocks nor cancels it.
// Usage:
//   Task<int> work() { co_return 1; }
//   std::future<int> f = work().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::TaskPromiseBase<T> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }
    std::shared_future<T> share() { return fut.share(); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    using value_type = void;

    struct promise_type : detail::TaskPromiseBase<void> {
        Task get_return_object() { return Task{ this->promise.get_future() }; }
        void return_void() { this->promise.set_value(); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }
    std::shared_future<void> share() { return fut.share(); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

} // namespace async
} // namespace mcphost
