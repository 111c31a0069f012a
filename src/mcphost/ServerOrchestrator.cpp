//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerOrchestrator.cpp
// Purpose: Server registry, connect retry loop, tool routing and bootstrap refresh
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/BootstrapTracker.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/ServerOrchestrator.h"
#include "mcphost/async/FutureAwaitable.h"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorCode;
using errors::TransportError;

const char* connectionStatusName(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error: return "error";
    }
    return "unknown";
}

namespace {

template <typename T>
std::future<T> failedFuture(std::exception_ptr ep) {
    std::promise<T> p;
    p.set_exception(std::move(ep));
    return p.get_future();
}

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

std::exception_ptr notConnected(const std::string& id, const std::string& what) {
    return std::make_exception_ptr(TransportError(ErrorCode::NotConnected, "[" + id + "] " + what));
}

} // namespace

class ServerOrchestrator::Impl : public std::enable_shared_from_this<ServerOrchestrator::Impl> {
public:
    struct Connection {
        std::shared_ptr<ProcessTransport> transport;
        ConnectionStatus status{ConnectionStatus::Disconnected};
        uint32_t errorCount{0};
        std::optional<std::string> lastError;
        uint64_t connectToken{0};
        std::optional<std::shared_future<void>> connecting;
        std::optional<std::vector<ToolInfo>> tools;
    };

    const OrchestratorOptions options;

    mutable std::mutex mutex;
    std::vector<std::string> order;
    std::unordered_map<std::string, ServerConfig> configs;
    std::unordered_map<std::string, Connection> connections;
    uint64_t nextToken{1};

    BootstrapTracker bootstrap;

    explicit Impl(OrchestratorOptions o) : options(o) {}

    // Maps the recorded status onto what the transport is doing right now.
    static ConnectionStatus liveStatus(ConnectionStatus recorded, const std::shared_ptr<ProcessTransport>& t) {
        if (recorded != ConnectionStatus::Connected || !t) {
            return recorded;
        }
        switch (t->GetState()) {
            case TransportState::Connected:
                return ConnectionStatus::Connected;
            case TransportState::Starting:
            case TransportState::Restarting:
                return ConnectionStatus::Connecting;
            case TransportState::Idle:
            case TransportState::Exited:
            case TransportState::Stopped:
                return ConnectionStatus::Disconnected;
        }
        return recorded;
    }

    std::shared_ptr<ProcessTransport> connectedTransport(const std::string& id) const {
        std::shared_ptr<ProcessTransport> t;
        ConnectionStatus recorded = ConnectionStatus::Disconnected;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = connections.find(id);
            if (it == connections.end()) {
                return nullptr;
            }
            t = it->second.transport;
            recorded = it->second.status;
        }
        return liveStatus(recorded, t) == ConnectionStatus::Connected ? t : nullptr;
    }

    bool isRegistered(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        return configs.count(id) != 0;
    }

    //////////////////////////////////////////// registration ////////////////////////////////////////////

    bool registerConfig(const ServerConfig& cfg) {
        if (auto invalid = ValidateServerConfig(cfg)) {
            LOG_WARN("Rejecting server config '{}': {}", cfg.id, *invalid);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (configs.count(cfg.id) != 0) {
                LOG_WARN("Server '{}' is already registered", cfg.id);
                return false;
            }
            configs.emplace(cfg.id, cfg);
            order.push_back(cfg.id);
        }
        LOG_INFO("[{}] registered: {}", cfg.id, cfg.command);
        return true;
    }

    std::size_t registerAll(const std::vector<ServerConfig>& cfgs) {
        std::size_t accepted = 0;
        for (const auto& cfg : cfgs) {
            if (registerConfig(cfg)) {
                ++accepted;
            }
        }
        return accepted;
    }

    std::vector<ServerInfo> listServers() const {
        struct Row {
            ServerInfo info;
            ConnectionStatus recorded;
            std::shared_ptr<ProcessTransport> transport;
        };
        std::vector<Row> rows;
        {
            std::lock_guard<std::mutex> lock(mutex);
            rows.reserve(order.size());
            for (const auto& id : order) {
                const ServerConfig& cfg = configs.at(id);
                Row row;
                row.info.id = id;
                row.info.name = cfg.name.empty() ? cfg.id : cfg.name;
                row.info.command = cfg.command;
                row.recorded = ConnectionStatus::Disconnected;
                if (auto it = connections.find(id); it != connections.end()) {
                    row.recorded = it->second.status;
                    row.info.errorCount = it->second.errorCount;
                    row.info.lastError = it->second.lastError;
                    row.transport = it->second.transport;
                }
                rows.push_back(std::move(row));
            }
        }
        std::vector<ServerInfo> out;
        out.reserve(rows.size());
        for (auto& row : rows) {
            row.info.status = liveStatus(row.recorded, row.transport);
            if (row.transport) {
                row.info.pid = row.transport->GetPid();
                row.info.restartCount = row.transport->RestartCount();
            }
            out.push_back(std::move(row.info));
        }
        return out;
    }

    //////////////////////////////////////////// connect ////////////////////////////////////////////

    std::shared_future<void> connect(const std::string& id) {
        auto gate = std::make_shared<std::promise<void>>();
        std::shared_future<void> result;
        ServerConfig cfg;
        uint64_t token = 0;
        {
            std::unique_lock<std::mutex> lock(mutex);
            auto cit = configs.find(id);
            if (cit == configs.end()) {
                lock.unlock();
                LOG_WARN("Connect requested for unknown server '{}'", id);
                return failedFuture<void>(notConnected(id, "unknown server")).share();
            }
            Connection& c = connections[id];
            if (c.connecting.has_value()) {
                LOG_DEBUG("[{}] joining in-flight connect", id);
                return c.connecting.value();
            }
            if (c.status == ConnectionStatus::Connected && c.transport &&
                c.transport->GetState() == TransportState::Connected) {
                return readyFuture().share();
            }
            result = gate->get_future().share();
            token = nextToken++;
            c.connectToken = token;
            c.connecting = result;
            c.status = ConnectionStatus::Connecting;
            cfg = cit->second;
        }
        coConnect(shared_from_this(), cfg, token, gate);
        return result;
    }

    static async::Task<void> coConnect(std::shared_ptr<Impl> self,
                                       ServerConfig cfg,
                                       uint64_t token,
                                       std::shared_ptr<std::promise<void>> gate) {
        FUNC_SCOPE();
        const std::string id = cfg.id;
        const uint32_t maxAttempts = std::max<uint32_t>(1, self->options.maxConnectAttempts);
        uint64_t delayMs = self->options.connectRetryDelayMs;

        std::shared_ptr<ProcessTransport> transport;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            auto it = self->connections.find(id);
            if (it != self->connections.end()) {
                transport = it->second.transport;
            }
        }

        std::exception_ptr lastError;
        bool abandoned = false;
        for (uint32_t attempt = 1; attempt <= maxAttempts; ++attempt) {
            LOG_INFO("[{}] connecting (attempt {}/{})", id, attempt, maxAttempts);
            bool ok = false;
            try {
                if (!transport) {
                    transport = std::make_shared<ProcessTransport>(cfg);
                    std::lock_guard<std::mutex> lock(self->mutex);
                    auto it = self->connections.find(id);
                    if (it != self->connections.end() && it->second.connectToken == token) {
                        it->second.transport = transport;
                    }
                }
                co_await async::makeFutureAwaitable(transport->Start());
                ok = true;
            } catch (const std::exception& e) {
                lastError = std::current_exception();
                {
                    std::lock_guard<std::mutex> lock(self->mutex);
                    auto it = self->connections.find(id);
                    if (it != self->connections.end() && it->second.connectToken == token) {
                        ++it->second.errorCount;
                        it->second.lastError = e.what();
                    } else {
                        abandoned = true;
                    }
                }
                LOG_WARN("[{}] connect attempt {}/{} failed: {}", id, attempt, maxAttempts, e.what());
            }
            if (ok) {
                lastError = nullptr;
                break;
            }
            if (abandoned) {
                break;
            }
            if (auto code = errors::errorCodeOf(lastError); code && *code == ErrorCode::InvalidConfig) {
                break;
            }
            if (attempt < maxAttempts) {
                co_await async::delayFor(std::chrono::milliseconds(delayMs));
                delayMs = std::min(delayMs * 2, self->options.maxConnectRetryDelayMs);
            }
        }

        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            auto it = self->connections.find(id);
            if (it != self->connections.end() && it->second.connectToken == token) {
                owned = true;
                Connection& c = it->second;
                c.connecting.reset();
                if (lastError) {
                    c.status = ConnectionStatus::Error;
                } else {
                    c.status = ConnectionStatus::Connected;
                    c.transport = transport;
                    c.tools.reset();
                }
            }
        }

        if (!owned) {
            // Disconnected while connecting; the transport may not have been visible to the disconnect.
            LOG_INFO("[{}] connect abandoned after disconnect", id);
            if (transport && !lastError) {
                co_await async::makeFutureAwaitable(transport->Stop());
            }
            gate->set_exception(std::make_exception_ptr(TransportError(ErrorCode::Stopped,
                                                                       "[" + id + "] disconnected while connecting")));
            co_return;
        }

        if (lastError) {
            LOG_ERROR("[{}] connect failed after {} attempt(s)", id, maxAttempts);
            gate->set_exception(lastError);
            co_return;
        }

        LOG_INFO("[{}] connected (pid {})", id, transport->GetPid());
        if (self->options.bootstrapOnConnect) {
            (void) self->bootstrapSchemas(id);
        }
        gate->set_value();
    }

    std::future<void> disconnect(const std::string& id) {
        std::shared_ptr<ProcessTransport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = connections.find(id);
            if (it != connections.end()) {
                transport = std::move(it->second.transport);
                connections.erase(it);
            }
        }
        bootstrap.Forget(id);
        if (!transport) {
            return readyFuture();
        }
        LOG_INFO("[{}] disconnecting", id);
        return coDisconnect(id, std::move(transport)).toFuture();
    }

    // Keeps the transport alive until its graceful stop has completed.
    static async::Task<void> coDisconnect(std::string id, std::shared_ptr<ProcessTransport> transport) {
        co_await async::makeFutureAwaitable(transport->Stop());
        LOG_INFO("[{}] disconnected", id);
    }

    //////////////////////////////////////////// tools ////////////////////////////////////////////

    std::future<JSONValue> callFunction(const std::string& id, const std::string& name, const JSONValue& args,
                                        const CallOptions& opts) {
        auto transport = connectedTransport(id);
        if (!transport) {
            return failedFuture<JSONValue>(notConnected(id, isRegistered(id) ? "not connected" : "unknown server"));
        }
        LOG_DEBUG("[{}] tools/call {}", id, name);
        return transport->SendRequest(Methods::CallTool, MakeCallToolParams(name, args), opts.timeoutMs);
    }

    static async::Task<std::vector<ToolInfo>> coListTools(std::shared_ptr<Impl> self, std::string id) {
        FUNC_SCOPE();
        auto transport = self->connectedTransport(id);
        if (!transport) {
            std::rethrow_exception(notConnected(id, self->isRegistered(id) ? "not connected" : "unknown server"));
        }
        const uint64_t warnMs = self->options.slowListWarnMs;
        const auto started = std::chrono::steady_clock::now();
        JSONValue result = co_await async::makeFutureAwaitable(
            transport->SendRequest(Methods::ListTools, JSONValue{JSONValue::Object{}}),
            std::chrono::milliseconds(warnMs),
            [id, warnMs]() { LOG_WARN("[{}] tools/list still pending after {} ms; continuing to wait", id, warnMs); });
        std::vector<ToolInfo> tools = ParseToolList(result);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        LOG_INFO("[{}] tools/list returned {} tool(s) in {} ms", id, tools.size(), elapsed.count());
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            auto it = self->connections.find(id);
            if (it != self->connections.end() && it->second.transport == transport) {
                it->second.tools = tools;
            }
        }
        co_return tools;
    }

    std::shared_future<void> bootstrapSchemas(const std::string& id) {
        std::optional<std::string> tool;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = configs.find(id);
            if (it == configs.end()) {
                return failedFuture<void>(notConnected(id, "unknown server")).share();
            }
            tool = it->second.bootstrapTool;
        }
        std::weak_ptr<Impl> weak = weak_from_this();
        return bootstrap.RunOnce(id, [weak, id, tool]() {
            auto self = weak.lock();
            if (!self) {
                throw TransportError(ErrorCode::Stopped, "[" + id + "] orchestrator destroyed");
            }
            if (tool.has_value()) {
                LOG_INFO("[{}] bootstrap: invoking {}", id, *tool);
                (void) self->callFunction(id, *tool, JSONValue{JSONValue::Object{}}, CallOptions{}).get();
            }
            auto tools = coListTools(self, id).toFuture().get();
            LOG_INFO("[{}] bootstrap: {} tool schema(s) cached", id, tools.size());
        });
    }

    void cleanup() {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [id, c] : connections) {
                ids.push_back(id);
            }
        }
        for (const auto& id : ids) {
            try {
                disconnect(id).get();
            } catch (const std::exception& e) {
                LOG_WARN("[{}] disconnect during cleanup failed: {}", id, e.what());
            }
        }
    }
};

ServerOrchestrator::ServerOrchestrator(OrchestratorOptions options)
    : pImpl(std::make_shared<Impl>(options)) {
    FUNC_SCOPE();
}

ServerOrchestrator::~ServerOrchestrator() {
    FUNC_SCOPE();
    pImpl->cleanup();
}

bool ServerOrchestrator::RegisterServerConfig(const ServerConfig& cfg) {
    return pImpl->registerConfig(cfg);
}

std::size_t ServerOrchestrator::RegisterFromJson(const std::string& text, const std::string& source) {
    return pImpl->registerAll(ParseServerConfigs(text, source));
}

std::size_t ServerOrchestrator::RegisterFromEnvironment() {
    return pImpl->registerAll(LoadServerConfigsFromEnvironment());
}

std::vector<ServerInfo> ServerOrchestrator::ListServers() const {
    return pImpl->listServers();
}

std::shared_future<void> ServerOrchestrator::ConnectServer(const std::string& id) {
    FUNC_SCOPE();
    return pImpl->connect(id);
}

std::future<void> ServerOrchestrator::DisconnectServer(const std::string& id) {
    FUNC_SCOPE();
    return pImpl->disconnect(id);
}

bool ServerOrchestrator::IsServerConnected(const std::string& id) const {
    return pImpl->connectedTransport(id) != nullptr;
}

std::vector<std::string> ServerOrchestrator::GetConnectedServers() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ids = pImpl->order;
    }
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [this](const std::string& id) { return !IsServerConnected(id); }),
              ids.end());
    return ids;
}

std::vector<std::string> ServerOrchestrator::GetServerCapabilities(const std::string& id) const {
    auto transport = pImpl->connectedTransport(id);
    if (!transport) {
        throw TransportError(ErrorCode::NotConnected, "[" + id + "] not connected");
    }
    return transport->GetServerCapabilities().Names();
}

std::future<JSONValue> ServerOrchestrator::CallFunction(const std::string& id,
                                                        const std::string& name,
                                                        const JSONValue& arguments,
                                                        CallOptions options) {
    FUNC_SCOPE();
    return pImpl->callFunction(id, name, arguments, options);
}

std::future<std::vector<ToolInfo>> ServerOrchestrator::ListTools(const std::string& id) {
    FUNC_SCOPE();
    return Impl::coListTools(pImpl, id).toFuture();
}

std::optional<std::vector<ToolInfo>> ServerOrchestrator::GetCachedTools(const std::string& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->connections.find(id);
    if (it == pImpl->connections.end()) {
        return std::nullopt;
    }
    return it->second.tools;
}

std::shared_future<void> ServerOrchestrator::BootstrapSchemas(const std::string& id) {
    FUNC_SCOPE();
    return pImpl->bootstrapSchemas(id);
}

void ServerOrchestrator::Cleanup() {
    FUNC_SCOPE();
    pImpl->cleanup();
}

} // namespace mcphost
