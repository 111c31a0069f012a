//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_async_task.cpp
// Purpose: Coroutine Task publishing and future/delay awaiters
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "mcphost/async/FutureAwaitable.h"
#include "mcphost/async/Task.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

async::Task<int> addLater(std::future<int> f, int extra) {
    int v = co_await async::makeFutureAwaitable(std::move(f));
    co_return v + extra;
}

async::Task<void> throwAfterAwait(std::future<void> f) {
    co_await async::makeFutureAwaitable(std::move(f));
    throw std::runtime_error("after await");
}

async::Task<int> slowValue(std::future<int> f, std::atomic<int>& slowCalls) {
    int v = co_await async::makeFutureAwaitable(std::move(f), 20ms, [&slowCalls]() { ++slowCalls; });
    co_return v;
}

async::Task<void> sleepThenMark(std::atomic<bool>& done) {
    co_await async::delayFor(30ms);
    done = true;
}

} // namespace

TEST(AsyncTask, ResumesWhenFutureIsFulfilled) {
    std::promise<int> p;
    auto fut = addLater(p.get_future(), 2).toFuture();
    EXPECT_EQ(fut.wait_for(10ms), std::future_status::timeout);
    p.set_value(40);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), 42);
}

TEST(AsyncTask, ReadyFutureCompletesSynchronously) {
    std::promise<int> p;
    p.set_value(1);
    auto fut = addLater(p.get_future(), 1).toFuture();
    EXPECT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(fut.get(), 2);
}

TEST(AsyncTask, AwaitedExceptionPropagates) {
    std::promise<int> p;
    auto fut = addLater(p.get_future(), 0).toFuture();
    p.set_exception(std::make_exception_ptr(std::runtime_error("boom")));
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(AsyncTask, BodyExceptionPropagates) {
    std::promise<void> p;
    auto fut = throwAfterAwait(p.get_future()).toFuture();
    p.set_value();
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(AsyncTask, SlowCallbackFiresOnceAndWaitingContinues) {
    std::promise<int> p;
    std::atomic<int> slowCalls{0};
    auto fut = slowValue(p.get_future(), slowCalls).share();
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(slowCalls.load(), 1);
    p.set_value(7);
    EXPECT_EQ(fut.get(), 7);
    EXPECT_EQ(slowCalls.load(), 1);
}

TEST(AsyncTask, SlowCallbackSkippedForFastFuture) {
    std::promise<int> p;
    std::atomic<int> slowCalls{0};
    auto fut = slowValue(p.get_future(), slowCalls).toFuture();
    p.set_value(3);
    EXPECT_EQ(fut.get(), 3);
    EXPECT_EQ(slowCalls.load(), 0);
}

TEST(AsyncTask, DelayResumesLater) {
    std::atomic<bool> done{false};
    const auto start = std::chrono::steady_clock::now();
    auto fut = sleepThenMark(done).toFuture();
    fut.get();
    EXPECT_TRUE(done.load());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}
