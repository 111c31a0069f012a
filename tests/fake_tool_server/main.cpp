//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Scriptable MCP stdio tool server used by the process transport and orchestrator tests
//==========================================================================================================

#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/ContentFramer.h"
#include "mcphost/FrameDecoder.h"
#include "mcphost/JSONRPCTypes.h"

using namespace mcphost;

// Behaviour switches (all optional):
//   --ready-line=<text>        line written to stderr once started
//   --startup-delay-ms=<n>     delay before the ready line
//   --mute                     never answer anything
//   --no-initialize            answer initialize with MethodNotFound
//   --reject-initialize        answer initialize with an error
//   --fail-initialize-once     first initialize fails, later ones succeed
//   --raw-json                 write replies as bare JSON lines instead of Content-Length frames
//   --stdout-noise             write non-protocol text on stdout at start and before every reply
//   --capabilities=<a,b>       capability keys of the initialize result (default: tools)
//   --tools-as-array           answer tools/list with a bare array
//   --list-delay-ms=<n>        delay before answering tools/list
//   --ignore-sigterm           ignore SIGTERM so the host must escalate
//
// Tools: echo{text}, sleep{ms}, refresh{delayMs}, get_count, crash{code}, env{name}, cwd,
//        stderr_flood{bytes} (writes bytes to stderr without a newline, then replies).

static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

namespace {

struct Options {
    std::optional<std::string> readyLine;
    uint64_t startupDelayMs{0};
    bool mute{false};
    bool noInitialize{false};
    bool rejectInitialize{false};
    bool failInitializeOnce{false};
    bool rawJson{false};
    bool stdoutNoise{false};
    std::vector<std::string> capabilities{"tools"};
    bool toolsAsArray{false};
    uint64_t listDelayMs{0};
    bool ignoreSigterm{false};
};

std::shared_ptr<JSONValue> ptr(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

int64_t intArg(const JSONValue& args, const char* key, int64_t fallback) {
    const JSONValue* v = args.find(key);
    if (v && std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (v && std::holds_alternative<double>(v->value)) {
        return static_cast<int64_t>(std::get<double>(v->value));
    }
    return fallback;
}

std::string stringArg(const JSONValue& args, const char* key) {
    const JSONValue* v = args.find(key);
    return (v && v->isString()) ? std::get<std::string>(v->value) : std::string();
}

// { content: [ { type: "text", text } ], ...extra }
JSONValue textResult(const std::string& text, JSONValue::Object extra = {}) {
    JSONValue::Object item;
    item["type"] = ptr(JSONValue("text"));
    item["text"] = ptr(JSONValue(text));
    JSONValue::Array content;
    content.push_back(ptr(JSONValue(item)));
    extra["content"] = ptr(JSONValue(content));
    return JSONValue(extra);
}

JSONValue toolEntry(const std::string& name, const std::string& description) {
    JSONValue::Object schema;
    schema["type"] = ptr(JSONValue("object"));
    JSONValue::Object tool;
    tool["name"] = ptr(JSONValue(name));
    tool["description"] = ptr(JSONValue(description));
    tool["inputSchema"] = ptr(JSONValue(schema));
    return JSONValue(tool);
}

class FakeToolServer {
public:
    explicit FakeToolServer(Options o) : opts(std::move(o)), framer(MakeContentLengthFramer()) {}

    ~FakeToolServer() {
        for (auto& w : workers) {
            if (w.joinable()) {
                w.join();
            }
        }
    }

    int Run() {
        if (opts.stdoutNoise) {
            writeRaw("fake_tool_server booting (this line is not protocol)\n");
        }
        if (opts.startupDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.startupDelayMs));
        }
        if (opts.readyLine.has_value()) {
            const std::string line = *opts.readyLine + "\n";
            (void) !::write(STDERR_FILENO, line.data(), line.size());
        }

        FrameDecoder decoder("fake_tool_server");
        char buf[4096];
        for (;;) {
            const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            for (const auto& msg : decoder.Feed(buf, static_cast<std::size_t>(n))) {
                handle(msg);
            }
        }
        LOG_INFO("stdin closed; exiting");
        return 0;
    }

private:
    void writeRaw(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(outMutex);
        std::size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t w = ::write(STDOUT_FILENO, bytes.data() + off, bytes.size() - off);
            if (w <= 0) {
                return;
            }
            off += static_cast<std::size_t>(w);
        }
    }

    void send(const JSONValue& msg) {
        const std::string body = SerializeJSON(msg);
        std::string out;
        if (opts.stdoutNoise) {
            out += "progress: working...\n";
        }
        out += opts.rawJson ? body + "\n" : framer->encode(body);
        writeRaw(out);
    }

    void reply(const JSONValue& id, JSONValue result) {
        JSONValue::Object env;
        env["jsonrpc"] = ptr(JSONValue("2.0"));
        env["id"] = ptr(id);
        env["result"] = ptr(std::move(result));
        send(JSONValue(env));
    }

    void replyError(const JSONValue& id, int code, const std::string& message) {
        JSONValue::Object env;
        env["jsonrpc"] = ptr(JSONValue("2.0"));
        env["id"] = ptr(id);
        env["error"] = ptr(CreateErrorObject(code, message));
        send(JSONValue(env));
    }

    // Replies from a worker thread after a delay.
    void replyLater(const JSONValue& id, uint64_t delayMs, std::function<JSONValue()> produce) {
        workers.emplace_back([this, id, delayMs, produce = std::move(produce)]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
            reply(id, produce());
        });
    }

    void handle(const JSONValue& msg) {
        const JSONValue* id = msg.find("id");
        const JSONValue* method = msg.find("method");
        if (!method || !method->isString()) {
            return;
        }
        const std::string name = std::get<std::string>(method->value);
        if (!id || id->isNull()) {
            LOG_DEBUG("notification {}", name);
            return;
        }
        if (opts.mute) {
            return;
        }
        const JSONValue* params = msg.find("params");
        const JSONValue empty{JSONValue::Object{}};
        const JSONValue& p = params ? *params : empty;

        if (name == "initialize") {
            handleInitialize(*id);
        } else if (name == "tools/list") {
            handleList(*id);
        } else if (name == "tools/call") {
            const JSONValue* args = p.find("arguments");
            handleCall(*id, stringArg(p, "name"), args ? *args : empty);
        } else {
            replyError(*id, JSONRPCErrorCodes::MethodNotFound, "method not found: " + name);
        }
    }

    void handleInitialize(const JSONValue& id) {
        ++initializeCount;
        if (opts.noInitialize) {
            replyError(id, JSONRPCErrorCodes::MethodNotFound, "method not found: initialize");
            return;
        }
        if (opts.rejectInitialize || (opts.failInitializeOnce && initializeCount == 1)) {
            replyError(id, JSONRPCErrorCodes::InternalError, "initialize refused");
            return;
        }
        JSONValue::Object caps;
        for (const auto& c : opts.capabilities) {
            caps[c] = ptr(JSONValue(JSONValue::Object{}));
        }
        JSONValue::Object info;
        info["name"] = ptr(JSONValue("fake_tool_server"));
        info["version"] = ptr(JSONValue("1.0.0"));
        JSONValue::Object result;
        result["protocolVersion"] = ptr(JSONValue("2024-11-05"));
        result["serverInfo"] = ptr(JSONValue(info));
        result["capabilities"] = ptr(JSONValue(caps));
        reply(id, JSONValue(result));
    }

    void handleList(const JSONValue& id) {
        JSONValue::Array tools;
        tools.push_back(ptr(toolEntry("echo", "Echoes its text argument")));
        tools.push_back(ptr(toolEntry("sleep", "Replies after ms milliseconds")));
        tools.push_back(ptr(toolEntry("refresh", "Increments the refresh counter")));
        tools.push_back(ptr(toolEntry("get_count", "Reports the refresh counter")));
        tools.push_back(ptr(toolEntry("crash", "Exits immediately")));
        tools.push_back(ptr(toolEntry("env", "Reads an environment variable")));
        tools.push_back(ptr(toolEntry("cwd", "Reports the working directory")));
        tools.push_back(ptr(toolEntry("stderr_flood", "Writes unterminated stderr output")));
        JSONValue result;
        if (opts.toolsAsArray) {
            result = JSONValue(tools);
        } else {
            JSONValue::Object obj;
            obj["tools"] = ptr(JSONValue(tools));
            result = JSONValue(obj);
        }
        if (opts.listDelayMs > 0) {
            replyLater(id, opts.listDelayMs, [result]() { return result; });
        } else {
            reply(id, result);
        }
    }

    void handleCall(const JSONValue& id, const std::string& tool, const JSONValue& args) {
        if (tool == "echo") {
            reply(id, textResult(stringArg(args, "text")));
        } else if (tool == "sleep") {
            const int64_t ms = intArg(args, "ms", 0);
            replyLater(id, static_cast<uint64_t>(std::max<int64_t>(ms, 0)), [ms]() {
                JSONValue::Object extra;
                extra["slept"] = ptr(JSONValue(ms));
                return textResult("slept " + std::to_string(ms), extra);
            });
        } else if (tool == "refresh") {
            const int64_t delay = intArg(args, "delayMs", 0);
            replyLater(id, static_cast<uint64_t>(std::max<int64_t>(delay, 0)), [this]() {
                const int64_t n = ++refreshCount;
                JSONValue::Object extra;
                extra["count"] = ptr(JSONValue(n));
                return textResult("refreshed", extra);
            });
        } else if (tool == "get_count") {
            JSONValue::Object extra;
            extra["count"] = ptr(JSONValue(static_cast<int64_t>(refreshCount.load())));
            reply(id, textResult(std::to_string(refreshCount.load()), extra));
        } else if (tool == "crash") {
            ::_exit(static_cast<int>(intArg(args, "code", 3)));
        } else if (tool == "env") {
            const char* v = std::getenv(stringArg(args, "name").c_str());
            JSONValue::Object extra;
            extra["value"] = v ? ptr(JSONValue(std::string(v))) : ptr(JSONValue(nullptr));
            reply(id, textResult(v ? v : "", extra));
        } else if (tool == "cwd") {
            char path[4096];
            const char* cwd = ::getcwd(path, sizeof(path));
            reply(id, textResult(cwd ? cwd : ""));
        } else if (tool == "stderr_flood") {
            const std::string chunk(4096, 'x');
            int64_t left = intArg(args, "bytes", 0);
            while (left > 0) {
                const std::size_t n = static_cast<std::size_t>(std::min<int64_t>(left, static_cast<int64_t>(chunk.size())));
                const ssize_t w = ::write(STDERR_FILENO, chunk.data(), n);
                if (w <= 0) {
                    break;
                }
                left -= w;
            }
            reply(id, textResult("flooded"));
        } else {
            replyError(id, JSONRPCErrorCodes::ToolNotFound, "unknown tool: " + tool);
        }
    }

    Options opts;
    std::unique_ptr<IContentFramer> framer;
    std::mutex outMutex;
    std::vector<std::thread> workers;
    int initializeCount{0};
    std::atomic<int64_t> refreshCount{0};
};

} // namespace

int main(int argc, char** argv) {
    Logger::configureFromEnvironment();
    Logger::setConsoleStderr(true);

    Options opts;
    opts.readyLine = getArgValue(argc, argv, "--ready-line");
    if (auto v = getArgValue(argc, argv, "--startup-delay-ms")) opts.startupDelayMs = std::stoull(*v);
    if (auto v = getArgValue(argc, argv, "--list-delay-ms")) opts.listDelayMs = std::stoull(*v);
    if (auto v = getArgValue(argc, argv, "--capabilities")) {
        opts.capabilities.clear();
        std::size_t start = 0;
        while (start <= v->size()) {
            const std::size_t comma = v->find(',', start);
            const std::string item = v->substr(start, comma == std::string::npos ? std::string::npos : comma - start);
            if (!item.empty()) {
                opts.capabilities.push_back(item);
            }
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
    }
    opts.mute = hasFlag(argc, argv, "--mute");
    opts.noInitialize = hasFlag(argc, argv, "--no-initialize");
    opts.rejectInitialize = hasFlag(argc, argv, "--reject-initialize");
    opts.failInitializeOnce = hasFlag(argc, argv, "--fail-initialize-once");
    opts.rawJson = hasFlag(argc, argv, "--raw-json");
    opts.stdoutNoise = hasFlag(argc, argv, "--stdout-noise");
    opts.toolsAsArray = hasFlag(argc, argv, "--tools-as-array");
    opts.ignoreSigterm = hasFlag(argc, argv, "--ignore-sigterm");

    if (opts.ignoreSigterm) {
        std::signal(SIGTERM, SIG_IGN);
    }

    FakeToolServer server(std::move(opts));
    return server.Run();
}
