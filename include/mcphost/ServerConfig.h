//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Tool server launch configuration, orchestrator tunables and JSON/environment loading
//==========================================================================================================
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ServerConfig
// Purpose: How to launch and supervise one tool server. Immutable once registered.
// Fields:
//   id: Unique registry key.
//   name: Display name (defaults to id when loaded from JSON).
//   command/args/cwd: Executable, argument vector and working directory (empty = inherit).
//   env: Variables overlaid on the host environment for the child.
//   autoRestart/restartBackoffMs: Respawn after an unexpected exit, after min(backoff, 15000) ms.
//   initTimeoutMs: Timeout of the initialize request.
//   skipInitialize: Server does not implement initialize; ready after a short settle.
//   readyPattern: ECMAScript regex matched case-insensitively against stderr lines.
//   postSpawnDelayMs: Readiness wait when no pattern matches first.
//   bootstrapTool: Tool invoked by the bootstrap refresh, when set.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
    std::map<std::string, std::string> env;
    bool autoRestart{false};
    uint64_t restartBackoffMs{2000};
    uint64_t initTimeoutMs{20000};
    bool skipInitialize{false};
    std::optional<std::string> readyPattern;
    uint64_t postSpawnDelayMs{1500};
    std::optional<std::string> bootstrapTool;
};

constexpr uint64_t MaxRestartBackoffMs = 15000;

// Returns an error description when the config cannot be launched, std::nullopt when valid.
std::optional<std::string> ValidateServerConfig(const ServerConfig& cfg);

//==========================================================================================================
// ParseServerConfig
// Purpose: Maps one JSON object onto a ServerConfig.
// Args:
//   value: Object with at least string `id` and `command`.
//   error: Receives the reason when the entry is rejected.
// Returns:
//   The config, or std::nullopt when required fields are missing, mistyped or invalid.
//==========================================================================================================
std::optional<ServerConfig> ParseServerConfig(const JSONValue& value, std::string& error);

//==========================================================================================================
// ParseServerConfigs
// Purpose: Parses a JSON array of server objects, or an object with a `servers` array.
//          Rejected entries and malformed documents are logged as warnings and skipped.
// Args:
//   text: JSON document.
//   source: Label used in warnings (variable name or file path).
//==========================================================================================================
std::vector<ServerConfig> ParseServerConfigs(const std::string& text, const std::string& source);

// Reads and parses a config file; an unreadable file is a warning and yields no entries.
std::vector<ServerConfig> LoadServerConfigFile(const std::string& path);

// Configs from MCPHOST_SERVERS_CONFIG_PATH (file) followed by MCPHOST_SERVERS (inline JSON).
std::vector<ServerConfig> LoadServerConfigsFromEnvironment();

//==========================================================================================================
// OrchestratorOptions
// Purpose: Connect retry and listing diagnostics tunables.
//==========================================================================================================
struct OrchestratorOptions {
    uint32_t maxConnectAttempts{3};
    uint64_t connectRetryDelayMs{1000};
    uint64_t maxConnectRetryDelayMs{10000};
    uint64_t slowListWarnMs{10000};
    bool bootstrapOnConnect{true};

    // Defaults overridden by MCPHOST_CONNECT_MAX_ATTEMPTS, MCPHOST_CONNECT_RETRY_DELAY_MS and
    // MCPHOST_SLOW_LIST_WARN_MS.
    static OrchestratorOptions FromEnvironment();
};

} // namespace mcphost
