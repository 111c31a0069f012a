//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: JSON-RPC transport over the stdio pipes of a spawned tool server, with lifecycle supervision
//==========================================================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {

enum class TransportState {
    Idle,       // constructed, never started
    Starting,   // spawn/readiness/handshake in progress
    Connected,  // handshake complete, requests accepted
    Restarting, // unexpected exit observed, supervised respawn pending or running
    Exited,     // child gone (or start failed) and no restart outstanding
    Stopped     // Stop() completed
};

const char* transportStateName(TransportState s);

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. All mutable state lives on a private io thread driven by a
//          boost::asio::io_context, so callers on any thread interact through posted work and futures.
// Notes:
//   - Request ids are per-transport monotonically increasing integers.
//   - Every request future completes exactly once: response, timeout, or forced failure.
//   - Errors are delivered as errors::TransportError stored in the futures.
//==========================================================================================================
class ProcessTransport {
public:
    explicit ProcessTransport(ServerConfig cfg);
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the child, waits for readiness and performs the initialize handshake.
    // Returns:
    //   Future completing when Connected; fails with SpawnFailure, HandshakeTimeout, HandshakeRejected,
    //   ProcessExited or Stopped. Resolves immediately when already connected and joins a start in
    //   progress.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Cancels any scheduled restart, fails in-flight requests with Stopped, sends SIGTERM and
    //          escalates to SIGKILL after a grace period. Never triggers auto-restart.
    // Returns:
    //   Future completing once the child is reaped (immediately when none is running).
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // SendRequest
    // Purpose: Sends a request and returns a future for its `result`.
    // Args:
    //   method: JSON-RPC method.
    //   params: Optional params value.
    //   timeoutMs: Per-request timeout; none when unset or zero.
    // Returns:
    //   Future with the result value; fails with RequestTimeout, RequestRejected, ProcessExited, Stopped
    //   or NotConnected.
    //==========================================================================================================
    std::future<JSONValue> SendRequest(const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt,
                                       std::optional<uint64_t> timeoutMs = std::nullopt);

    // Fire-and-forget notification; dropped with a debug log when no child is running.
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    TransportState GetState() const;
    int GetPid() const;
    ServerCapabilities GetServerCapabilities() const;
    std::size_t PendingCount() const;
    uint32_t RestartCount() const;
    const ServerConfig& GetConfig() const;

    // Invoked on the transport's io thread after each state change. The handler must not block on
    // the transport's futures. It may destroy the transport: the child is killed at once and the
    // io thread releases the remaining state after the handler returns.
    using StateHandler = std::function<void(TransportState)>;
    void SetStateHandler(StateHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct ProcessTransportTestHooks;
};

//==========================================================================================================
// ProcessTransportTestHooks
// Purpose: Deterministic access for tests (runs on the io thread and waits for completion).
//==========================================================================================================
struct ProcessTransportTestHooks {
    // Feeds bytes as if they had been read from the child's stdout.
    static void injectStdout(ProcessTransport& t, const std::string& bytes);
    // Ids of in-flight requests in ascending order.
    static std::vector<int64_t> pendingIds(ProcessTransport& t);
    // Frames received from stdout that did not match a pending request.
    static uint64_t unsolicitedCount(ProcessTransport& t);
    // Bytes of the current unterminated stderr line.
    static std::size_t stderrPartialSize(ProcessTransport& t);
};

} // namespace mcphost
