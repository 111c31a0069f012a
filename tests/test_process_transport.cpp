//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: Child process lifecycle, handshake and request correlation against fake_tool_server
//==========================================================================================================

#include <gtest/gtest.h>

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mcphost/ProcessTransport.hpp"
#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using namespace std::chrono_literals;
using errors::ErrorCode;
using errors::TransportError;

#ifndef FAKE_TOOL_SERVER_PATH
#error "FAKE_TOOL_SERVER_PATH must point at the fake_tool_server binary"
#endif

namespace {

ServerConfig fakeServer(const std::string& id, std::vector<std::string> args = {}) {
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = id;
    cfg.command = FAKE_TOOL_SERVER_PATH;
    cfg.args = std::move(args);
    cfg.postSpawnDelayMs = 50;
    cfg.initTimeoutMs = 5000;
    return cfg;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

template <typename F>
ErrorCode failureCode(F& fut) {
    try {
        fut.get();
    } catch (const TransportError& e) {
        return e.code();
    }
    ADD_FAILURE() << "future completed without a TransportError";
    return ErrorCode::InvalidConfig;
}

std::future<JSONValue> callTool(ProcessTransport& t, const std::string& name, const std::string& argsJson,
                                std::optional<uint64_t> timeoutMs = std::nullopt) {
    return t.SendRequest(Methods::CallTool, MakeCallToolParams(name, ParseJSON(argsJson)), timeoutMs);
}

std::string firstText(const JSONValue& result) {
    const JSONValue* content = result.find("content");
    if (!content || !content->isArray()) {
        return {};
    }
    const auto& items = std::get<JSONValue::Array>(content->value);
    if (items.empty() || !items[0]) {
        return {};
    }
    const JSONValue* text = items[0]->find("text");
    return text && text->isString() ? std::get<std::string>(text->value) : std::string();
}

int64_t intField(const JSONValue& result, const char* key) {
    const JSONValue* v = result.find(key);
    return v ? std::get<int64_t>(v->value) : -1;
}

} // namespace

TEST(ProcessTransport, StartsAndReportsCapabilities) {
    ProcessTransport t(fakeServer("caps", {"--capabilities=tools,prompts"}));
    EXPECT_EQ(t.GetState(), TransportState::Idle);
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_EQ(t.GetState(), TransportState::Connected);
    EXPECT_GT(t.GetPid(), 0);
    EXPECT_EQ(t.GetServerCapabilities().Names(), (std::vector<std::string>{"tools", "prompts"}));

    // A second Start on a connected transport resolves immediately.
    EXPECT_NO_THROW(t.Start().get());
    t.Stop().get();
    EXPECT_EQ(t.GetState(), TransportState::Stopped);
    EXPECT_EQ(t.GetPid(), -1);
}

TEST(ProcessTransport, EchoRoundTrip) {
    ProcessTransport t(fakeServer("echo"));
    t.Start().get();
    auto result = callTool(t, "echo", R"({"text":"hello"})").get();
    EXPECT_EQ(firstText(result), "hello");
    EXPECT_EQ(t.PendingCount(), 0u);
    t.Stop().get();
}

TEST(ProcessTransport, OutOfOrderRepliesCorrelateById) {
    ProcessTransport t(fakeServer("order"));
    t.Start().get();
    auto slow = callTool(t, "sleep", R"({"ms":300})");
    auto mid = callTool(t, "sleep", R"({"ms":150})");
    auto fast = callTool(t, "sleep", R"({"ms":10})");
    EXPECT_EQ(intField(fast.get(), "slept"), 10);
    EXPECT_EQ(intField(mid.get(), "slept"), 150);
    EXPECT_EQ(intField(slow.get(), "slept"), 300);
    t.Stop().get();
}

TEST(ProcessTransport, InjectedRepliesResolveMatchingRequests) {
    auto cfg = fakeServer("inject", {"--mute"});
    cfg.skipInitialize = true;
    ProcessTransport t(cfg);
    t.Start().get();
    EXPECT_EQ(t.GetServerCapabilities().Names(), std::vector<std::string>{"tools"});

    std::vector<std::future<JSONValue>> futs;
    for (int i = 0; i < 3; ++i) {
        futs.push_back(callTool(t, "echo", R"({"text":"x"})"));
    }
    ASSERT_TRUE(waitUntil([&]() { return t.PendingCount() == 3; }));
    auto ids = ProcessTransportTestHooks::pendingIds(t);
    std::sort(ids.begin(), ids.end());
    ASSERT_EQ(ids.size(), 3u);

    // Reverse order, one id as a numeric string, one frame split across two writes.
    const std::string third = R"({"jsonrpc":"2.0","id":)" + std::to_string(ids[2]) + R"(,"result":{"n":2}})";
    const std::string second = R"({"jsonrpc":"2.0","id":")" + std::to_string(ids[1]) + R"(","result":{"n":1}})";
    const std::string first = R"({"jsonrpc":"2.0","id":)" + std::to_string(ids[0]) +
                              R"(,"error":{"code":-32602,"message":"bad"}})";
    const std::string framedThird = "Content-Length: " + std::to_string(third.size()) + "\r\n\r\n" + third;
    ProcessTransportTestHooks::injectStdout(t, framedThird.substr(0, 10));
    ProcessTransportTestHooks::injectStdout(t, framedThird.substr(10));
    ProcessTransportTestHooks::injectStdout(t, second + "\n");
    ProcessTransportTestHooks::injectStdout(t, "Content-Length: " + std::to_string(first.size()) + "\r\n\r\n" + first);

    EXPECT_EQ(intField(futs[2].get(), "n"), 2);
    EXPECT_EQ(intField(futs[1].get(), "n"), 1);
    try {
        futs[0].get();
        FAIL() << "expected rejection";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RequestRejected);
        ASSERT_TRUE(e.peer().has_value());
        EXPECT_EQ(e.peer()->code, JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.peer()->message, "bad");
    }
    EXPECT_EQ(t.PendingCount(), 0u);
    EXPECT_EQ(ProcessTransportTestHooks::unsolicitedCount(t), 0u);

    // A reply for an id nobody waits on is dropped.
    ProcessTransportTestHooks::injectStdout(t, R"({"jsonrpc":"2.0","id":9999,"result":{}})");
    EXPECT_EQ(ProcessTransportTestHooks::unsolicitedCount(t), 1u);
    t.Stop().get();
}

TEST(ProcessTransport, TimeoutFailsOnceAndLateReplyIsUnsolicited) {
    ProcessTransport t(fakeServer("timeout"));
    t.Start().get();
    auto fut = callTool(t, "sleep", R"({"ms":300})", 50);
    EXPECT_EQ(failureCode(fut), ErrorCode::RequestTimeout);
    EXPECT_EQ(t.PendingCount(), 0u);
    EXPECT_TRUE(waitUntil([&]() { return ProcessTransportTestHooks::unsolicitedCount(t) == 1; }, 3s));

    // The transport stays usable after a timeout.
    EXPECT_EQ(firstText(callTool(t, "echo", R"({"text":"still here"})").get()), "still here");
    t.Stop().get();
}

TEST(ProcessTransport, PeerErrorRejectsRequest) {
    ProcessTransport t(fakeServer("peer-error"));
    t.Start().get();
    auto fut = callTool(t, "no_such_tool", "{}");
    try {
        fut.get();
        FAIL() << "expected rejection";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RequestRejected);
        ASSERT_TRUE(e.peer().has_value());
        EXPECT_EQ(e.peer()->code, JSONRPCErrorCodes::ToolNotFound);
    }
    t.Stop().get();
}

TEST(ProcessTransport, CrashFailsPendingRequests) {
    ProcessTransport t(fakeServer("crash"));
    t.Start().get();
    auto waiting = callTool(t, "sleep", R"({"ms":5000})");
    auto crash = callTool(t, "crash", R"({"code":3})");
    EXPECT_EQ(failureCode(waiting), ErrorCode::ProcessExited);
    EXPECT_EQ(failureCode(crash), ErrorCode::ProcessExited);
    ASSERT_TRUE(waitUntil([&]() { return t.GetState() == TransportState::Exited; }));
    EXPECT_EQ(t.GetPid(), -1);

    auto after = callTool(t, "echo", R"({"text":"x"})");
    EXPECT_EQ(failureCode(after), ErrorCode::NotConnected);
}

TEST(ProcessTransport, AutoRestartAfterUnexpectedExit) {
    auto cfg = fakeServer("restart");
    cfg.autoRestart = true;
    cfg.restartBackoffMs = 100;
    ProcessTransport t(cfg);
    t.Start().get();
    const int firstPid = t.GetPid();
    auto crash = callTool(t, "crash", "{}");
    EXPECT_EQ(failureCode(crash), ErrorCode::ProcessExited);

    ASSERT_TRUE(waitUntil([&]() { return t.RestartCount() == 1 && t.GetState() == TransportState::Connected; }));
    EXPECT_NE(t.GetPid(), firstPid);
    EXPECT_EQ(firstText(callTool(t, "echo", R"({"text":"back"})").get()), "back");
    t.Stop().get();
    EXPECT_EQ(t.GetState(), TransportState::Stopped);
}

TEST(ProcessTransport, StopDoesNotRestart) {
    auto cfg = fakeServer("stop");
    cfg.autoRestart = true;
    cfg.restartBackoffMs = 50;
    ProcessTransport t(cfg);
    t.Start().get();
    auto pending = callTool(t, "sleep", R"({"ms":5000})");
    t.Stop().get();
    EXPECT_EQ(failureCode(pending), ErrorCode::Stopped);
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(t.GetState(), TransportState::Stopped);
    EXPECT_EQ(t.RestartCount(), 0u);

    // Stop on a stopped transport is a no-op.
    EXPECT_NO_THROW(t.Stop().get());
}

TEST(ProcessTransport, StopRightAfterStartLeavesNoChild) {
    ProcessTransport t(fakeServer("quick-stop"));
    auto started = t.Start();
    t.Stop().get();
    EXPECT_EQ(failureCode(started), ErrorCode::Stopped);
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(t.GetPid(), -1);
    EXPECT_EQ(t.GetState(), TransportState::Stopped);

    // The transport can still be started afterwards.
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_GT(t.GetPid(), 0);
    t.Stop().get();
    EXPECT_EQ(t.GetPid(), -1);
}

TEST(ProcessTransport, StopEscalatesWhenSigtermIgnored) {
    ProcessTransport t(fakeServer("stubborn", {"--ignore-sigterm"}));
    t.Start().get();
    const auto begin = std::chrono::steady_clock::now();
    t.Stop().get();
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 1500ms);
    EXPECT_EQ(t.GetState(), TransportState::Stopped);
}

TEST(ProcessTransport, SkipInitializeConnectsWithoutHandshake) {
    auto cfg = fakeServer("skip", {"--no-initialize"});
    cfg.skipInitialize = true;
    ProcessTransport t(cfg);
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_EQ(t.GetState(), TransportState::Connected);
    EXPECT_EQ(firstText(callTool(t, "echo", R"({"text":"direct"})").get()), "direct");
    t.Stop().get();
}

TEST(ProcessTransport, SpawnFailureForMissingCommand) {
    ServerConfig cfg;
    cfg.id = "missing";
    cfg.command = "/nonexistent/mcphost/server-binary";
    ProcessTransport t(cfg);
    auto fut = t.Start();
    EXPECT_EQ(failureCode(fut), ErrorCode::SpawnFailure);
    EXPECT_EQ(t.GetState(), TransportState::Exited);
}

TEST(ProcessTransport, RejectedInitialize) {
    ProcessTransport t(fakeServer("rejected", {"--reject-initialize"}));
    auto fut = t.Start();
    EXPECT_EQ(failureCode(fut), ErrorCode::HandshakeRejected);
    EXPECT_EQ(t.GetState(), TransportState::Exited);
    EXPECT_EQ(t.GetPid(), -1);
}

TEST(ProcessTransport, SilentServerTimesOutHandshake) {
    auto cfg = fakeServer("silent", {"--mute"});
    cfg.initTimeoutMs = 200;
    ProcessTransport t(cfg);
    auto fut = t.Start();
    EXPECT_EQ(failureCode(fut), ErrorCode::HandshakeTimeout);
    EXPECT_EQ(t.GetPid(), -1);
}

TEST(ProcessTransport, ReadyMarkerAllowsOneHandshakeRetry) {
    auto cfg = fakeServer("marker", {"--ready-line=server ready on stdio", "--fail-initialize-once"});
    cfg.readyPattern = "ready on";
    cfg.postSpawnDelayMs = 10000;
    ProcessTransport t(cfg);
    const auto begin = std::chrono::steady_clock::now();
    ASSERT_NO_THROW(t.Start().get());
    // The marker cuts the readiness wait short.
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 8s);
    EXPECT_EQ(t.GetState(), TransportState::Connected);
    t.Stop().get();
}

TEST(ProcessTransport, FailedInitializeWithoutMarkerIsNotRetried) {
    ProcessTransport t(fakeServer("no-marker", {"--fail-initialize-once"}));
    auto fut = t.Start();
    EXPECT_EQ(failureCode(fut), ErrorCode::HandshakeRejected);
}

TEST(ProcessTransport, RawJsonAndStdoutNoiseAreTolerated) {
    ProcessTransport t(fakeServer("noisy", {"--raw-json", "--stdout-noise"}));
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_EQ(firstText(callTool(t, "echo", R"({"text":"through the noise"})").get()), "through the noise");
    t.Stop().get();
}

TEST(ProcessTransport, UnterminatedStderrIsBounded) {
    auto cfg = fakeServer("stderr-flood");
    cfg.readyPattern = "never printed";
    ProcessTransport t(cfg);
    t.Start().get();
    auto flooded = callTool(t, "stderr_flood", R"({"bytes":2000000})").get();
    EXPECT_EQ(firstText(flooded), "flooded");
    EXPECT_LE(ProcessTransportTestHooks::stderrPartialSize(t), 64u * 1024u);
    EXPECT_EQ(firstText(callTool(t, "echo", R"({"text":"after flood"})").get()), "after flood");
    t.Stop().get();
}

TEST(ProcessTransport, PassesEnvironmentAndWorkingDirectory) {
    auto cfg = fakeServer("env");
    cfg.env["MCPHOST_TEST_MARKER"] = "marker-value";
    cfg.cwd = "/tmp";
    ProcessTransport t(cfg);
    t.Start().get();
    auto env = callTool(t, "env", R"({"name":"MCPHOST_TEST_MARKER"})").get();
    EXPECT_EQ(firstText(env), "marker-value");
    auto cwd = callTool(t, "cwd", "{}").get();
    EXPECT_EQ(firstText(cwd), "/tmp");
    t.Stop().get();
}

TEST(ProcessTransport, InvalidConfigIsRejectedAtConstruction) {
    ServerConfig cfg;
    cfg.id = "invalid";
    try {
        ProcessTransport t(cfg);
        FAIL() << "expected InvalidConfig";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfig);
    }
}

TEST(ProcessTransport, StateHandlerMayReleaseLastOwner) {
    auto owner = std::make_unique<ProcessTransport>(fakeServer("release"));
    std::atomic<int> pid{-1};
    std::atomic<bool> released{false};
    owner->SetStateHandler([&](TransportState s) {
        if (s != TransportState::Connected) {
            return;
        }
        pid = owner->GetPid();
        owner.reset();
        released = true;
    });
    std::future<void> started = owner->Start();
    ASSERT_TRUE(waitUntil([&]() { return released.load(); }));
    ASSERT_GT(pid.load(), 0);
    EXPECT_TRUE(waitUntil([&]() { return ::kill(pid.load(), 0) != 0; }));
    // The start either completed or was rejected as stopped; it never hangs.
    EXPECT_EQ(started.wait_for(5s), std::future_status::ready);
}

TEST(ProcessTransport, DestroyWhileRunningTerminatesChild) {
    int pid = -1;
    {
        ProcessTransport t(fakeServer("destroy"));
        t.Start().get();
        pid = t.GetPid();
        ASSERT_GT(pid, 0);
    }
    EXPECT_NE(::kill(pid, 0), 0);
}
