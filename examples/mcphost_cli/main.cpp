//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line host: registers tool servers, connects one and lists or calls its tools
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/ServerOrchestrator.h"
#include "mcphost/errors/Errors.h"
#include <iostream>
#include <optional>
#include <string>

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

// True when a bare flag such as "--list" is present.
static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "usage: mcphost_cli [--config=<file>] [--server=<id>] [--list] [--tools]\n"
                 "                   [--call=<tool> [--args=<json>] [--timeout-ms=<n>]] [--bootstrap]\n"
                 "                   [--log-level=DEBUG|INFO|WARN|ERROR]\n"
                 "Servers are also read from MCPHOST_SERVERS_CONFIG_PATH and MCPHOST_SERVERS.\n";
}

static int runServerCommands(ServerOrchestrator& orchestrator, const std::string& id, int argc, char** argv) {
    orchestrator.ConnectServer(id).get();
    std::cout << id << " capabilities:";
    for (const auto& c : orchestrator.GetServerCapabilities(id)) {
        std::cout << ' ' << c;
    }
    std::cout << '\n';

    if (hasFlag(argc, argv, "--bootstrap")) {
        orchestrator.BootstrapSchemas(id).get();
        std::cout << "bootstrap complete\n";
    }

    if (hasFlag(argc, argv, "--tools")) {
        auto tools = orchestrator.ListTools(id).get();
        for (const auto& t : tools) {
            std::cout << t.name;
            if (t.description.has_value()) {
                std::cout << " - " << *t.description;
            }
            std::cout << '\n';
        }
    }

    if (auto tool = getArgValue(argc, argv, "--call"); tool.has_value()) {
        JSONValue args{JSONValue::Object{}};
        if (auto raw = getArgValue(argc, argv, "--args"); raw.has_value() && !raw->empty()) {
            args = ParseJSON(*raw);
        }
        CallOptions opts;
        if (auto t = getArgValue(argc, argv, "--timeout-ms"); t.has_value()) {
            opts.timeoutMs = std::stoull(*t);
        }
        JSONValue result = orchestrator.CallFunction(id, *tool, args, opts).get();
        std::cout << SerializeJSON(result) << '\n';
    }

    orchestrator.DisconnectServer(id).get();
    return 0;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();
    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        Logger::setLogLevel(Logger::levelFromString(*lvl));
    }
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }

    // Bootstrap only runs on request so a one-shot command does not race its own disconnect.
    OrchestratorOptions options = OrchestratorOptions::FromEnvironment();
    options.bootstrapOnConnect = false;
    ServerOrchestrator orchestrator(options);
    if (auto path = getArgValue(argc, argv, "--config"); path.has_value()) {
        for (const auto& cfg : LoadServerConfigFile(*path)) {
            orchestrator.RegisterServerConfig(cfg);
        }
    }
    orchestrator.RegisterFromEnvironment();

    if (hasFlag(argc, argv, "--list")) {
        for (const auto& s : orchestrator.ListServers()) {
            std::cout << s.id << " (" << s.name << ") " << connectionStatusName(s.status) << " errors=" << s.errorCount
                      << " cmd=" << s.command << '\n';
        }
    }

    auto server = getArgValue(argc, argv, "--server");
    if (!server.has_value()) {
        if (!hasFlag(argc, argv, "--list")) {
            printUsage();
            return 2;
        }
        return 0;
    }

    try {
        return runServerCommands(orchestrator, *server, argc, argv);
    } catch (const errors::TransportError& e) {
        LOG_ERROR("[{}] {}: {}", *server, errors::errorCodeName(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] {}", *server, e.what());
        return 1;
    }
}
