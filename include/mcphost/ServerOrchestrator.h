//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerOrchestrator.h
// Purpose: Registry of tool servers with connect/disconnect, tool calls, listing and bootstrap refresh
//==========================================================================================================
#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

const char* connectionStatusName(ConnectionStatus s);

//==========================================================================================================
// ServerInfo
// Purpose: Snapshot of one registered server as reported by ListServers().
//==========================================================================================================
struct ServerInfo {
    std::string id;
    std::string name;
    std::string command;
    ConnectionStatus status{ConnectionStatus::Disconnected};
    uint32_t errorCount{0};
    std::optional<std::string> lastError;
    int pid{-1};
    uint32_t restartCount{0};
};

struct CallOptions {
    std::optional<uint64_t> timeoutMs;
};

//==========================================================================================================
// ServerOrchestrator
// Purpose: Owns one ProcessTransport per connected server and routes host operations to it.
// Notes:
//   - Registration order is preserved by ListServers().
//   - Concurrent ConnectServer() calls for one id share a single connect attempt sequence.
//   - The registry lock is never held while calling into a transport.
//   - Failures are delivered as errors::TransportError stored in the returned futures.
//==========================================================================================================
class ServerOrchestrator {
public:
    explicit ServerOrchestrator(OrchestratorOptions options = OrchestratorOptions::FromEnvironment());
    ~ServerOrchestrator();

    ServerOrchestrator(const ServerOrchestrator&) = delete;
    ServerOrchestrator& operator=(const ServerOrchestrator&) = delete;

    ////////////////////////////////////////// Registration ///////////////////////////////////////////
    // Returns false (with a warning) when the id is already registered or the config is invalid.
    bool RegisterServerConfig(const ServerConfig& cfg);

    // Registers every valid entry of a JSON server list; returns how many were accepted.
    std::size_t RegisterFromJson(const std::string& text, const std::string& source = "inline");

    // Registers servers from MCPHOST_SERVERS_CONFIG_PATH and MCPHOST_SERVERS.
    std::size_t RegisterFromEnvironment();

    std::vector<ServerInfo> ListServers() const;

    ////////////////////////////////////////// Connection ///////////////////////////////////////////
    //==========================================================================================================
    // ConnectServer
    // Purpose: Starts the server's transport with bounded retries.
    // Returns:
    //   A shared future that is ready immediately when already connected, joins an in-flight connect for
    //   the same id, and fails with NotConnected for unknown ids. After maxConnectAttempts failures the
    //   last error is propagated. On success a bootstrap refresh is kicked off in the background.
    //==========================================================================================================
    std::shared_future<void> ConnectServer(const std::string& id);

    // Stops the transport and forgets connection and bootstrap state; ready at once when not connected.
    std::future<void> DisconnectServer(const std::string& id);

    bool IsServerConnected(const std::string& id) const;
    std::vector<std::string> GetConnectedServers() const;

    // Capability names advertised in the handshake. Throws TransportError(NotConnected).
    std::vector<std::string> GetServerCapabilities(const std::string& id) const;

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // CallFunction
    // Purpose: Issues tools/call { name, arguments } on a connected server.
    // Returns:
    //   Future with the raw result; transport failures propagate untranslated.
    //==========================================================================================================
    std::future<JSONValue> CallFunction(const std::string& id,
                                        const std::string& name,
                                        const JSONValue& arguments,
                                        CallOptions options = {});

    //==========================================================================================================
    // ListTools
    // Purpose: Issues tools/list and refreshes the tool cache. A listing that takes longer than
    //          slowListWarnMs is reported with a warning and still awaited.
    //==========================================================================================================
    std::future<std::vector<ToolInfo>> ListTools(const std::string& id);

    // Tools from the most recent successful listing, std::nullopt when never listed.
    std::optional<std::vector<ToolInfo>> GetCachedTools(const std::string& id) const;

    //==========================================================================================================
    // BootstrapSchemas
    // Purpose: Runs the refresh (bootstrap tool when configured, then tools/list) at most once at a time
    //          per server; concurrent callers share the same outcome.
    //==========================================================================================================
    std::shared_future<void> BootstrapSchemas(const std::string& id);

    // Disconnects every server; failures are logged and skipped.
    void Cleanup();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
