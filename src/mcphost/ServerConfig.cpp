//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Server config validation and loading from JSON documents and environment variables
//==========================================================================================================

#include <fstream>
#include <regex>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/ServerConfig.h"

namespace mcphost {

namespace {

bool readString(const JSONValue& obj, const char* key, std::string& out, std::string& error) {
    const JSONValue* v = obj.find(key);
    if (!v || v->isNull()) {
        return true;
    }
    if (!v->isString()) {
        error = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = std::get<std::string>(v->value);
    return true;
}

bool readBool(const JSONValue& obj, const char* key, bool& out, std::string& error) {
    const JSONValue* v = obj.find(key);
    if (!v || v->isNull()) {
        return true;
    }
    if (!std::holds_alternative<bool>(v->value)) {
        error = std::string("field '") + key + "' must be a boolean";
        return false;
    }
    out = std::get<bool>(v->value);
    return true;
}

bool readMillis(const JSONValue& obj, const char* key, uint64_t& out, std::string& error) {
    const JSONValue* v = obj.find(key);
    if (!v || v->isNull()) {
        return true;
    }
    if (std::holds_alternative<int64_t>(v->value) && std::get<int64_t>(v->value) >= 0) {
        out = static_cast<uint64_t>(std::get<int64_t>(v->value));
        return true;
    }
    if (std::holds_alternative<double>(v->value) && std::get<double>(v->value) >= 0.0) {
        out = static_cast<uint64_t>(std::get<double>(v->value));
        return true;
    }
    error = std::string("field '") + key + "' must be a non-negative number";
    return false;
}

} // namespace

std::optional<std::string> ValidateServerConfig(const ServerConfig& cfg) {
    if (cfg.id.empty()) {
        return std::string("missing id");
    }
    if (cfg.command.empty()) {
        return std::string("missing command");
    }
    if (cfg.readyPattern.has_value()) {
        try {
            std::regex re(cfg.readyPattern.value(), std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            return "invalid readyPattern '" + cfg.readyPattern.value() + "': " + e.what();
        }
    }
    return std::nullopt;
}

std::optional<ServerConfig> ParseServerConfig(const JSONValue& value, std::string& error) {
    if (!value.isObject()) {
        error = "entry is not an object";
        return std::nullopt;
    }
    ServerConfig cfg;
    if (!readString(value, "id", cfg.id, error) || !readString(value, "command", cfg.command, error) ||
        !readString(value, "name", cfg.name, error) || !readString(value, "cwd", cfg.cwd, error) ||
        !readBool(value, "autoRestart", cfg.autoRestart, error) ||
        !readBool(value, "skipInitialize", cfg.skipInitialize, error) ||
        !readMillis(value, "restartBackoffMs", cfg.restartBackoffMs, error) ||
        !readMillis(value, "initTimeoutMs", cfg.initTimeoutMs, error) ||
        !readMillis(value, "postSpawnDelayMs", cfg.postSpawnDelayMs, error)) {
        return std::nullopt;
    }
    if (cfg.name.empty()) {
        cfg.name = cfg.id;
    }

    if (const JSONValue* args = value.find("args"); args && !args->isNull()) {
        if (!args->isArray()) {
            error = "field 'args' must be an array of strings";
            return std::nullopt;
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                error = "field 'args' must be an array of strings";
                return std::nullopt;
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = value.find("env"); env && !env->isNull()) {
        if (!env->isObject()) {
            error = "field 'env' must be an object of strings";
            return std::nullopt;
        }
        for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
            if (!v || !v->isString()) {
                error = "env value for '" + k + "' must be a string";
                return std::nullopt;
            }
            cfg.env[k] = std::get<std::string>(v->value);
        }
    }

    std::string pattern;
    if (!readString(value, "readyPattern", pattern, error)) {
        return std::nullopt;
    }
    if (!pattern.empty()) {
        cfg.readyPattern = pattern;
    }
    std::string bootstrapTool;
    if (!readString(value, "bootstrapTool", bootstrapTool, error)) {
        return std::nullopt;
    }
    if (!bootstrapTool.empty()) {
        cfg.bootstrapTool = bootstrapTool;
    }

    if (auto invalid = ValidateServerConfig(cfg)) {
        error = *invalid;
        return std::nullopt;
    }
    return cfg;
}

std::vector<ServerConfig> ParseServerConfigs(const std::string& text, const std::string& source) {
    std::vector<ServerConfig> out;
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse server configs from {}: {}", source, e.what());
        return out;
    }

    const JSONValue* list = nullptr;
    if (doc.isArray()) {
        list = &doc;
    } else if (const JSONValue* servers = doc.find("servers"); servers && servers->isArray()) {
        list = servers;
    }
    if (!list) {
        LOG_WARN("Server configs in {} must be an array or an object with a 'servers' array", source);
        return out;
    }

    std::size_t index = 0;
    for (const auto& entry : std::get<JSONValue::Array>(list->value)) {
        std::string error;
        auto cfg = entry ? ParseServerConfig(*entry, error) : std::nullopt;
        if (!cfg) {
            LOG_WARN("Skipping server entry #{} from {}: {}", index, source, error.empty() ? "null entry" : error);
        } else {
            out.push_back(std::move(*cfg));
        }
        ++index;
    }
    return out;
}

std::vector<ServerConfig> LoadServerConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("Cannot open server config file: {}", path);
        return {};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ParseServerConfigs(ss.str(), path);
}

std::vector<ServerConfig> LoadServerConfigsFromEnvironment() {
    std::vector<ServerConfig> out;
    const std::string path = GetEnvOrDefault("MCPHOST_SERVERS_CONFIG_PATH", "");
    if (!path.empty()) {
        out = LoadServerConfigFile(path);
    }
    const std::string inlineJson = GetEnvOrDefault("MCPHOST_SERVERS", "");
    if (!inlineJson.empty()) {
        auto more = ParseServerConfigs(inlineJson, "MCPHOST_SERVERS");
        out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
    }
    return out;
}

OrchestratorOptions OrchestratorOptions::FromEnvironment() {
    OrchestratorOptions o;
    o.maxConnectAttempts = static_cast<uint32_t>(GetEnvUint64("MCPHOST_CONNECT_MAX_ATTEMPTS", o.maxConnectAttempts));
    if (o.maxConnectAttempts == 0) {
        o.maxConnectAttempts = 1;
    }
    o.connectRetryDelayMs = GetEnvUint64("MCPHOST_CONNECT_RETRY_DELAY_MS", o.connectRetryDelayMs);
    o.slowListWarnMs = GetEnvUint64("MCPHOST_SLOW_LIST_WARN_MS", o.slowListWarnMs);
    return o;
}

} // namespace mcphost
