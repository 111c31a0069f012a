//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and the handshake/tool structures the host consumes
//==========================================================================================================

#pragma once

#include "mcphost/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphost {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Client-side view of the protocol: what the host sends and what it reads back.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered in the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Host identity reported as clientInfo
constexpr const char* HOST_NAME = "mcphost";
constexpr const char* HOST_VERSION = "0.1.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
//==========================================================================================================
// ServerCapabilities
// Purpose: Feature families a server advertised in its initialize result (key presence => true).
//==========================================================================================================
struct ServerCapabilities {
    bool tools = false;
    bool resources = false;
    bool prompts = false;
    bool sampling = false;
    bool logging = false;

    // Capability names that are set, in a fixed order: tools, resources, prompts, sampling, logging.
    std::vector<std::string> Names() const;

    // Assumed when the handshake is skipped or reports nothing.
    static ServerCapabilities ToolsOnly() {
        ServerCapabilities c;
        c.tools = true;
        return c;
    }
};

//==========================================================================================================
// ParseServerCapabilities
// Purpose: Reads `capabilities` from an initialize result. Falls back to ToolsOnly() when the result
//          has no capabilities object.
//==========================================================================================================
ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult);

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as reported by tools/list
struct ToolInfo {
    std::string name;
    std::optional<std::string> description;
    std::optional<JSONValue> inputSchema;
};

//==========================================================================================================
// ParseToolList
// Purpose: Accepts either a bare array of tool objects or an object with a `tools` array.
//          Entries without a string name are skipped.
// Throws:
//   std::runtime_error when the result is neither shape.
//==========================================================================================================
std::vector<ToolInfo> ParseToolList(const JSONValue& listResult);

// Builds tools/call params: { name, arguments }.
JSONValue MakeCallToolParams(const std::string& name, const JSONValue& arguments);

// Builds initialize params: { protocolVersion, clientInfo, capabilities: {} }.
JSONValue MakeInitializeParams(const Implementation& clientInfo);

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
}

} // namespace mcphost
