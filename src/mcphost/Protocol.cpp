//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Handshake capability parsing and tool list/call payload helpers
//==========================================================================================================

#include <stdexcept>

#include "mcphost/Protocol.h"
#include "logging/Logger.h"

namespace mcphost {

std::vector<std::string> ServerCapabilities::Names() const {
    std::vector<std::string> out;
    if (tools) out.emplace_back("tools");
    if (resources) out.emplace_back("resources");
    if (prompts) out.emplace_back("prompts");
    if (sampling) out.emplace_back("sampling");
    if (logging) out.emplace_back("logging");
    return out;
}

ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult) {
    const JSONValue* caps = initializeResult.find("capabilities");
    if (!caps || !caps->isObject()) {
        return ServerCapabilities::ToolsOnly();
    }
    ServerCapabilities c;
    c.tools = caps->find("tools") != nullptr;
    c.resources = caps->find("resources") != nullptr;
    c.prompts = caps->find("prompts") != nullptr;
    c.sampling = caps->find("sampling") != nullptr;
    c.logging = caps->find("logging") != nullptr;
    return c;
}

std::vector<ToolInfo> ParseToolList(const JSONValue& listResult) {
    const JSONValue* arrVal = nullptr;
    if (listResult.isArray()) {
        arrVal = &listResult;
    } else if (const JSONValue* tools = listResult.find("tools")) {
        if (tools->isArray()) {
            arrVal = tools;
        }
    }
    if (!arrVal) {
        throw std::runtime_error("tools/list result is neither an array nor {tools:[...]}");
    }

    std::vector<ToolInfo> out;
    for (const auto& item : std::get<JSONValue::Array>(arrVal->value)) {
        if (!item) continue;
        const JSONValue* name = item->find("name");
        if (!name || !name->isString()) {
            LOG_DEBUG("Skipping tool entry without a name: {}", SerializeJSON(*item));
            continue;
        }
        ToolInfo t;
        t.name = std::get<std::string>(name->value);
        if (const JSONValue* d = item->find("description"); d && d->isString()) {
            t.description = std::get<std::string>(d->value);
        }
        if (const JSONValue* s = item->find("inputSchema")) {
            t.inputSchema = *s;
        }
        out.push_back(std::move(t));
    }
    return out;
}

JSONValue MakeCallToolParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments);
    return JSONValue{params};
}

JSONValue MakeInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(clientInfo.name);
    info["version"] = std::make_shared<JSONValue>(clientInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    params["clientInfo"] = std::make_shared<JSONValue>(JSONValue{info});
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue{JSONValue::Object{}});
    return JSONValue{params};
}

} // namespace mcphost
