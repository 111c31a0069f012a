//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child process transport: spawn, framing, request correlation, readiness, handshake, restart
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <regex>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/FrameDecoder.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/errors/Errors.h"

extern char** environ;

namespace mcphost {
namespace net = boost::asio;
using errors::ErrorCode;
using errors::TransportError;

const char* transportStateName(TransportState s) {
    switch (s) {
        case TransportState::Idle: return "Idle";
        case TransportState::Starting: return "Starting";
        case TransportState::Connected: return "Connected";
        case TransportState::Restarting: return "Restarting";
        case TransportState::Exited: return "Exited";
        case TransportState::Stopped: return "Stopped";
    }
    return "Unknown";
}

namespace {

constexpr std::chrono::milliseconds SkipInitializeSettle{300};
constexpr std::chrono::milliseconds HandshakeRetryDelay{300};
constexpr uint64_t ReadinessCeilingMs = 15000;
constexpr std::chrono::milliseconds ReapPollInterval{10};
constexpr std::chrono::milliseconds StopGracePeriod{2000};
// Longest stderr line kept before it is logged and flushed unterminated.
constexpr std::size_t StderrLineLimit = 64 * 1024;
// Trailing part of an unterminated stderr line searched for the readiness marker.
constexpr std::size_t StderrMarkerWindow = 4 * 1024;

std::once_flag sigpipeOnce;

void ignoreSigpipe() {
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::exception_ptr makeError(ErrorCode code, const std::string& msg) {
    return std::make_exception_ptr(TransportError(code, msg));
}

std::string describeStatus(int status) {
    if (WIFEXITED(status)) {
        return "code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

struct SpawnedChild {
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

//==========================================================================================================
// spawnChild
// Purpose: fork/exec with all three stdio streams piped. Exec (or chdir) failures in the child are
//          reported through a close-on-exec status pipe so the parent can fail synchronously.
// Throws:
//   TransportError(SpawnFailure)
//==========================================================================================================
SpawnedChild spawnChild(const ServerConfig& cfg, const std::string& command) {
    std::vector<std::string> argvStore;
    argvStore.push_back(command);
    argvStore.insert(argvStore.end(), cfg.args.begin(), cfg.args.end());
    std::vector<char*> argv;
    for (auto& s : argvStore) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq != std::string::npos) {
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [k, v] : cfg.env) {
        merged[k] = v;
    }
    std::vector<std::string> envStore;
    envStore.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        envStore.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    for (auto& s : envStore) {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closeAll();
        throw TransportError(ErrorCode::SpawnFailure, fmt::format("pipe creation failed: {}", ::strerror(err)));
    }

    const char* cwd = cfg.cwd.empty() ? nullptr : cfg.cwd.c_str();
    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closeAll();
        throw TransportError(ErrorCode::SpawnFailure, fmt::format("fork failed: {}", ::strerror(err)));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int report[2] = {0, 0};
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            report[0] = 1;
            report[1] = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            report[0] = 2;
            report[1] = errno;
        }
        ssize_t w = ::write(statusPipe[1], report, sizeof(report));
        (void)w;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(statusPipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeAll();
        const char* stage = (report[0] == 1) ? "chdir" : "exec";
        throw TransportError(ErrorCode::SpawnFailure,
                             fmt::format("spawn failed ({} '{}'): {}", stage,
                                         report[0] == 1 ? cfg.cwd : command, ::strerror(report[1])));
    }

    SpawnedChild c;
    c.pid = pid;
    c.stdinFd = inPipe[1];
    c.stdoutFd = outPipe[0];
    c.stderrFd = errPipe[0];
    return c;
}

} // namespace

class ProcessTransport::Impl {
public:
    struct Pending {
        std::string method;
        std::function<void(std::exception_ptr, JSONValue)> complete;
        std::unique_ptr<net::steady_timer> timer;
    };

    // Declared first so it is destroyed last; every I/O object below refers to it.
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;

    const ServerConfig cfg;
    std::optional<std::regex> readyRe;
    bool debugIO{false};

    std::atomic<TransportState> state{TransportState::Idle};
    std::atomic<int> pidAtomic{-1};
    std::atomic<std::size_t> pendingCount{0};
    std::atomic<uint32_t> restarts{0};

    mutable std::mutex capsMutex;
    ServerCapabilities caps;

    std::mutex handlerMutex;
    StateHandler stateHandler;

    // Owns this Impl after the transport is destroyed from its own io thread.
    std::unique_ptr<Impl> orphan;

    // ---- io-thread state ----
    pid_t pid{-1};
    uint64_t generation{0};
    std::unique_ptr<net::posix::stream_descriptor> childIn;
    std::unique_ptr<net::posix::stream_descriptor> childOut;
    std::unique_ptr<net::posix::stream_descriptor> childErr;
    std::array<char, 8192> outBuf{};
    std::array<char, 4096> errBuf{};
    std::string stderrLine;
    FrameDecoder decoder;
    uint64_t unsolicited{0};

    std::deque<std::string> writeQueue;
    bool writeInFlight{false};

    int64_t nextId{1};
    std::map<int64_t, Pending> pending;

    bool childExited{false};
    bool expectExit{false};
    bool readyMarkerSeen{false};
    bool reaperActive{false};
    std::unique_ptr<net::steady_timer> reapTimer;
    std::unique_ptr<net::steady_timer> killTimer;

    bool startInProgress{false};
    bool stopRequested{false};
    std::vector<std::promise<void>> startWaiters;
    std::vector<std::promise<void>> stopWaiters;
    std::shared_ptr<net::steady_timer> waitTimer;

    bool restartScheduled{false};
    std::unique_ptr<net::steady_timer> restartTimer;

    explicit Impl(ServerConfig c) : cfg(std::move(c)), decoder(cfg.id) {
        if (auto invalid = ValidateServerConfig(cfg)) {
            throw TransportError(ErrorCode::InvalidConfig, "[" + cfg.id + "] " + *invalid);
        }
        if (cfg.readyPattern.has_value()) {
            readyRe.emplace(cfg.readyPattern.value(), std::regex::ECMAScript | std::regex::icase);
        }
        debugIO = GetEnvBool("MCPHOST_DEBUG_IO", false);
        decoder.SetVerbose(debugIO);
        ignoreSigpipe();
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            for (;;) {
                try {
                    ioc.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("[{}] io loop handler threw: {}", cfg.id, e.what());
                }
            }
            // Set when the owner was destroyed from a handler on this thread; the Impl dies here.
            std::unique_ptr<Impl> self = std::move(orphan);
            if (self) {
                ioThread.detach();
            }
        });
    }

    ~Impl() {
        if (!ioThread.joinable()) {
            return;
        }
        std::promise<void> done;
        auto fut = done.get_future();
        net::post(ioc, [this, &done]() {
            shutdownNow();
            done.set_value();
        });
        fut.wait();
        workGuard.reset();
        ioc.stop();
        ioThread.join();
    }

    //////////////////////////////////////////// helpers ////////////////////////////////////////////

    bool onIoThread() const { return std::this_thread::get_id() == ioThread.get_id(); }

    template <typename F>
    void runOnIo(F&& fn) {
        if (onIoThread()) {
            fn();
            return;
        }
        std::promise<void> done;
        auto fut = done.get_future();
        net::post(ioc, [&]() {
            fn();
            done.set_value();
        });
        fut.wait();
    }

    void setState(TransportState s) {
        const TransportState prev = state.exchange(s);
        if (prev == s) {
            return;
        }
        LOG_INFO("[{}] state {} -> {}", cfg.id, transportStateName(prev), transportStateName(s));
        StateHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = stateHandler;
        }
        if (h) {
            h(s);
        }
    }

    std::string resolveCommand() const {
        if (cfg.command == "node") {
            const std::string overrideBin = GetEnvOrDefault("MCPHOST_NODE_BIN", "");
            if (!overrideBin.empty()) {
                return overrideBin;
            }
        }
        return cfg.command;
    }

    //////////////////////////////////////////// process ////////////////////////////////////////////

    void spawn() {
        const std::string command = resolveCommand();
        std::string argsJoined;
        for (const auto& a : cfg.args) {
            argsJoined += " '" + a + "'";
        }
        LOG_INFO("[{}] spawning '{}'{}{}", cfg.id, command, argsJoined, cfg.cwd.empty() ? "" : " in " + cfg.cwd);

        SpawnedChild child = spawnChild(cfg, command);
        ++generation;
        pid = child.pid;
        pidAtomic.store(child.pid);
        childExited = false;
        expectExit = false;
        readyMarkerSeen = false;
        stderrLine.clear();
        decoder.Reset();
        writeQueue.clear();
        writeInFlight = false;
        childIn = std::make_unique<net::posix::stream_descriptor>(ioc, child.stdinFd);
        childOut = std::make_unique<net::posix::stream_descriptor>(ioc, child.stdoutFd);
        childErr = std::make_unique<net::posix::stream_descriptor>(ioc, child.stderrFd);
        LOG_INFO("[{}] spawned pid {}", cfg.id, pid);

        readStdout(generation);
        readStderr(generation);
    }

    void closePipes() {
        boost::system::error_code ignored;
        if (childIn) { childIn->close(ignored); childIn.reset(); }
        if (childOut) { childOut->close(ignored); childOut.reset(); }
        if (childErr) { childErr->close(ignored); childErr.reset(); }
        writeQueue.clear();
        writeInFlight = false;
    }

    void readStdout(uint64_t gen) {
        if (!childOut) {
            return;
        }
        childOut->async_read_some(net::buffer(outBuf), [this, gen](const boost::system::error_code& ec, std::size_t n) {
            if (gen != generation) {
                return;
            }
            if (n > 0) {
                handleStdoutBytes(outBuf.data(), n);
            }
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    LOG_DEBUG("[{}] stdout closed ({})", cfg.id, ec.message());
                    startReaper();
                }
                return;
            }
            readStdout(gen);
        });
    }

    void readStderr(uint64_t gen) {
        if (!childErr) {
            return;
        }
        childErr->async_read_some(net::buffer(errBuf), [this, gen](const boost::system::error_code& ec, std::size_t n) {
            if (gen != generation) {
                return;
            }
            if (n > 0) {
                handleStderrBytes(std::string(errBuf.data(), n));
            }
            if (ec) {
                if (!stderrLine.empty()) {
                    LOG_INFO("[{}] stderr: {}", cfg.id, stderrLine);
                    stderrLine.clear();
                }
                return;
            }
            readStderr(gen);
        });
    }

    void handleStderrBytes(const std::string& chunk) {
        stderrLine += chunk;
        std::size_t nl;
        while ((nl = stderrLine.find('\n')) != std::string::npos) {
            std::string line = stderrLine.substr(0, nl);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            stderrLine.erase(0, nl + 1);
            LOG_INFO("[{}] stderr: {}", cfg.id, line);
            checkReadyMarker(line);
        }
        if (stderrLine.size() > StderrLineLimit) {
            LOG_INFO("[{}] stderr: {}... ({} bytes without newline)", cfg.id, stderrLine.substr(0, 200),
                     stderrLine.size());
            checkReadyMarker(stderrLine.substr(stderrLine.size() - StderrMarkerWindow));
            stderrLine.clear();
            return;
        }
        // Markers written without a trailing newline still count.
        if (!stderrLine.empty()) {
            const std::size_t from = stderrLine.size() > StderrMarkerWindow ? stderrLine.size() - StderrMarkerWindow : 0;
            checkReadyMarker(stderrLine.substr(from));
        }
    }

    void checkReadyMarker(const std::string& text) {
        if (!readyRe || readyMarkerSeen) {
            return;
        }
        if (std::regex_search(text, *readyRe)) {
            readyMarkerSeen = true;
            LOG_INFO("[{}] readiness marker observed", cfg.id);
            if (waitTimer) {
                waitTimer->cancel();
            }
        }
    }

    void handleStdoutBytes(const char* data, std::size_t n) {
        for (auto& msg : decoder.Feed(data, n)) {
            dispatch(msg);
        }
    }

    void startReaper() {
        if (reaperActive || pid <= 0) {
            return;
        }
        reaperActive = true;
        if (!reapTimer) {
            reapTimer = std::make_unique<net::steady_timer>(ioc);
        }
        pollReap(pid);
    }

    void pollReap(pid_t target) {
        if (target != pid) {
            reaperActive = false;
            return;
        }
        int status = 0;
        pid_t r = ::waitpid(target, &status, WNOHANG);
        if (r == target || (r < 0 && errno == ECHILD)) {
            reaperActive = false;
            onChildExit(status);
            return;
        }
        reapTimer->expires_after(ReapPollInterval);
        reapTimer->async_wait([this, target](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                reaperActive = false;
                return;
            }
            pollReap(target);
        });
    }

    void onChildExit(int status) {
        LOG_INFO("[{}] process {} exited ({})", cfg.id, pid, describeStatus(status));
        ++generation;
        pid = -1;
        pidAtomic.store(-1);
        childExited = true;
        closePipes();
        if (killTimer) {
            killTimer->cancel();
        }
        failAllPending(ErrorCode::ProcessExited, "process exited");
        if (waitTimer) {
            waitTimer->cancel();
        }

        if (stopRequested) {
            finishStop();
            return;
        }
        if (expectExit || startInProgress) {
            // Start failures and their cleanup are handled by the start sequence.
            return;
        }
        if (state.load() == TransportState::Connected && cfg.autoRestart) {
            setState(TransportState::Restarting);
            scheduleRestart();
        } else {
            setState(TransportState::Exited);
        }
    }

    // Synchronous SIGKILL + reap for a child this transport no longer wants.
    void terminateChildNow() {
        if (pid <= 0) {
            return;
        }
        expectExit = true;
        const pid_t target = pid;
        ::kill(target, SIGKILL);
        int status = 0;
        while (::waitpid(target, &status, 0) < 0 && errno == EINTR) {}
        LOG_INFO("[{}] terminated process {} ({})", cfg.id, target, describeStatus(status));
        ++generation;
        pid = -1;
        pidAtomic.store(-1);
        childExited = true;
        reaperActive = false;
        if (reapTimer) {
            reapTimer->cancel();
        }
        closePipes();
    }

    //////////////////////////////////////////// writing ////////////////////////////////////////////

    void enqueueFrame(const std::string& payload) {
        if (!childIn) {
            LOG_WARN("[{}] dropping outbound frame: stdin not open", cfg.id);
            return;
        }
        writeQueue.push_back("Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload);
        if (!writeInFlight) {
            writeNext(generation);
        }
    }

    void writeNext(uint64_t gen) {
        if (writeQueue.empty() || !childIn) {
            writeInFlight = false;
            return;
        }
        writeInFlight = true;
        net::async_write(*childIn, net::buffer(writeQueue.front()),
            [this, gen](const boost::system::error_code& ec, std::size_t /*n*/) {
                if (gen != generation) {
                    return;
                }
                if (ec) {
                    LOG_ERROR("[{}] write to stdin failed: {}", cfg.id, ec.message());
                    writeQueue.clear();
                    writeInFlight = false;
                    return;
                }
                writeQueue.pop_front();
                writeNext(gen);
            });
    }

    //////////////////////////////////////////// requests ////////////////////////////////////////////

    void registerRequest(const std::string& method, const std::optional<JSONValue>& params,
                         std::optional<uint64_t> timeoutMs,
                         std::function<void(std::exception_ptr, JSONValue)> complete) {
        const int64_t id = nextId++;
        Pending p;
        p.method = method;
        p.complete = std::move(complete);
        if (timeoutMs.has_value() && timeoutMs.value() > 0) {
            p.timer = std::make_unique<net::steady_timer>(ioc);
            p.timer->expires_after(std::chrono::milliseconds(timeoutMs.value()));
            p.timer->async_wait([this, id](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                onRequestTimeout(id);
            });
        }
        pending.emplace(id, std::move(p));
        pendingCount.store(pending.size());

        JSONRPCRequest req(id, method, params);
        LOG_INFO("[{}] -> {} (#{})", cfg.id, method, id);
        enqueueFrame(req.Serialize());
    }

    void onRequestTimeout(int64_t id) {
        auto it = pending.find(id);
        if (it == pending.end()) {
            return;
        }
        Pending p = std::move(it->second);
        pending.erase(it);
        pendingCount.store(pending.size());
        LOG_WARN("[{}] request timeout: {} (#{})", cfg.id, p.method, id);
        p.complete(makeError(ErrorCode::RequestTimeout, "request timeout: " + p.method), JSONValue());
    }

    void failAllPending(ErrorCode code, const std::string& why) {
        if (pending.empty()) {
            return;
        }
        auto drained = std::move(pending);
        pending.clear();
        pendingCount.store(0);
        LOG_INFO("[{}] failing {} pending request(s): {}", cfg.id, drained.size(), why);
        for (auto& [id, p] : drained) {
            if (p.timer) {
                p.timer->cancel();
            }
            p.complete(makeError(code, why + " (" + p.method + ")"), JSONValue());
        }
    }

    static std::optional<int64_t> numericId(const JSONValue& envelope) {
        const JSONValue* id = envelope.find("id");
        if (!id) {
            return std::nullopt;
        }
        if (std::holds_alternative<int64_t>(id->value)) {
            return std::get<int64_t>(id->value);
        }
        if (std::holds_alternative<std::string>(id->value)) {
            const auto& s = std::get<std::string>(id->value);
            try {
                std::size_t used = 0;
                long long v = std::stoll(s, &used);
                if (used == s.size()) {
                    return static_cast<int64_t>(v);
                }
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    void dispatch(const JSONValue& msg) {
        if (ClassifyMessage(msg) == MessageKind::Response) {
            if (auto id = numericId(msg)) {
                auto it = pending.find(*id);
                if (it != pending.end()) {
                    Pending p = std::move(it->second);
                    pending.erase(it);
                    pendingCount.store(pending.size());
                    if (p.timer) {
                        p.timer->cancel();
                    }
                    if (const JSONValue* err = msg.find("error")) {
                        auto peer = errors::mcpErrorFromErrorValue(*err);
                        if (!peer) {
                            peer = errors::McpError{JSONRPCErrorCodes::InternalError, SerializeJSON(*err), std::nullopt,
                                                    errors::ErrorCategory::JsonRpcInternal};
                        }
                        LOG_INFO("[{}] <- response #{} {} ERROR {}", cfg.id, *id, p.method, peer->code);
                        const std::string what = p.method + ": " + peer->message;
                        p.complete(std::make_exception_ptr(TransportError(ErrorCode::RequestRejected, what, *peer)), JSONValue());
                    } else {
                        LOG_INFO("[{}] <- response #{} {} OK", cfg.id, *id, p.method);
                        const JSONValue* result = msg.find("result");
                        p.complete(nullptr, result ? *result : JSONValue());
                    }
                    return;
                }
            }
        }
        ++unsolicited;
        if (debugIO) {
            LOG_INFO("[{}] <- unsolicited message: {}", cfg.id, SerializeJSON(msg));
        } else {
            LOG_DEBUG("[{}] <- unsolicited message: {}", cfg.id, SerializeJSON(msg));
        }
    }

    // Awaitable request used by the handshake; completes on the io thread.
    net::awaitable<JSONValue> coRequest(const std::string& method, JSONValue params, uint64_t timeoutMs) {
        struct Outcome {
            explicit Outcome(net::io_context& io) : signal(io) {}
            net::steady_timer signal;
            bool done{false};
            std::exception_ptr error;
            JSONValue value;
        };
        auto outcome = std::make_shared<Outcome>(ioc);
        outcome->signal.expires_at(net::steady_timer::time_point::max());
        registerRequest(method, params, timeoutMs, [outcome](std::exception_ptr ep, JSONValue v) {
            outcome->done = true;
            outcome->error = ep;
            outcome->value = std::move(v);
            outcome->signal.cancel();
        });
        while (!outcome->done) {
            boost::system::error_code ec;
            co_await outcome->signal.async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        if (outcome->error) {
            std::rethrow_exception(outcome->error);
        }
        co_return outcome->value;
    }

    //////////////////////////////////////////// lifecycle ////////////////////////////////////////////

    void throwIfAborted() {
        if (stopRequested) {
            throw TransportError(ErrorCode::Stopped, "[" + cfg.id + "] stopped during startup");
        }
        if (childExited) {
            throw TransportError(ErrorCode::ProcessExited, "[" + cfg.id + "] process exited during startup");
        }
    }

    net::awaitable<void> coSleep(std::chrono::milliseconds d) {
        waitTimer = std::make_shared<net::steady_timer>(ioc);
        auto t = waitTimer;
        t->expires_after(d);
        boost::system::error_code ec;
        co_await t->async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    net::awaitable<JSONValue> coHandshakeOnce() {
        try {
            co_return co_await coRequest(Methods::Initialize,
                                         MakeInitializeParams(Implementation(HOST_NAME, HOST_VERSION)),
                                         cfg.initTimeoutMs);
        } catch (const TransportError& e) {
            if (e.code() == ErrorCode::RequestTimeout) {
                throw TransportError(ErrorCode::HandshakeTimeout,
                                     fmt::format("[{}] initialize timed out after {} ms", cfg.id, cfg.initTimeoutMs));
            }
            if (e.code() == ErrorCode::RequestRejected && e.peer()) {
                throw TransportError(ErrorCode::HandshakeRejected,
                                     fmt::format("[{}] initialize rejected: {}", cfg.id, e.peer()->message), *e.peer());
            }
            throw;
        }
    }

    net::awaitable<void> coStart() {
        // Stop() may run between co_spawn and the first resumption of this coroutine.
        if (stopRequested) {
            throw TransportError(ErrorCode::Stopped, "[" + cfg.id + "] stopped before spawn");
        }
        spawn();

        if (cfg.skipInitialize) {
            co_await coSleep(SkipInitializeSettle);
            throwIfAborted();
            std::lock_guard<std::mutex> lk(capsMutex);
            caps = ServerCapabilities::ToolsOnly();
            co_return;
        }

        if (!readyMarkerSeen) {
            const uint64_t waitMs = std::min(cfg.postSpawnDelayMs, ReadinessCeilingMs);
            co_await coSleep(std::chrono::milliseconds(waitMs));
        }
        throwIfAborted();

        JSONValue result;
        std::exception_ptr firstFailure;
        try {
            result = co_await coHandshakeOnce();
        } catch (const std::exception&) {
            firstFailure = std::current_exception();
        }
        if (firstFailure) {
            // Only a server that announced readiness gets a second handshake attempt.
            if (!readyMarkerSeen || stopRequested || childExited) {
                std::rethrow_exception(firstFailure);
            }
            LOG_WARN("[{}] initialize failed after readiness marker; retrying once", cfg.id);
            co_await coSleep(HandshakeRetryDelay);
            throwIfAborted();
            result = co_await coHandshakeOnce();
        }
        throwIfAborted();

        {
            std::lock_guard<std::mutex> lk(capsMutex);
            caps = ParseServerCapabilities(result);
        }
        JSONRPCNotification initialized(Methods::Initialized);
        enqueueFrame(initialized.Serialize());
    }

    void beginStart(bool supervised) {
        startInProgress = true;
        stopRequested = false;
        setState(supervised ? TransportState::Restarting : TransportState::Starting);
        net::co_spawn(ioc, coStart(), [this, supervised](std::exception_ptr ep) {
            startInProgress = false;
            waitTimer.reset();
            auto waiters = std::move(startWaiters);
            startWaiters.clear();
            if (!ep) {
                if (supervised) {
                    restarts.fetch_add(1);
                }
                LOG_INFO("[{}] connected{}", cfg.id, supervised ? " (restarted)" : "");
                setState(TransportState::Connected);
                for (auto& w : waiters) {
                    w.set_value();
                }
                return;
            }

            std::string why = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                why = e.what();
            }
            LOG_ERROR("[{}] start failed: {}", cfg.id, why);
            failAllPending(ErrorCode::ProcessExited, "start failed");
            if (!stopRequested) {
                terminateChildNow();
                if (supervised && cfg.autoRestart) {
                    setState(TransportState::Restarting);
                    scheduleRestart();
                } else {
                    setState(TransportState::Exited);
                }
            } else if (pid > 0 && stopWaiters.empty()) {
                // The stop completed before this start spawned; nobody is reaping the child.
                terminateChildNow();
            }
            for (auto& w : waiters) {
                w.set_exception(ep);
            }
        });
    }

    void scheduleRestart() {
        if (restartScheduled) {
            return;
        }
        restartScheduled = true;
        const uint64_t delay = std::min(cfg.restartBackoffMs, MaxRestartBackoffMs);
        LOG_WARN("[{}] restarting in {} ms", cfg.id, delay);
        if (!restartTimer) {
            restartTimer = std::make_unique<net::steady_timer>(ioc);
        }
        restartTimer->expires_after(std::chrono::milliseconds(delay));
        restartTimer->async_wait([this](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted || !restartScheduled) {
                return;
            }
            restartScheduled = false;
            if (stopRequested || startInProgress) {
                return;
            }
            beginStart(true);
        });
    }

    void cancelRestart() {
        restartScheduled = false;
        if (restartTimer) {
            restartTimer->cancel();
        }
    }

    void requestStart(std::promise<void> waiter) {
        if (state.load() == TransportState::Connected && pid > 0) {
            waiter.set_value();
            return;
        }
        startWaiters.push_back(std::move(waiter));
        if (startInProgress) {
            return;
        }
        cancelRestart();
        try {
            beginStart(false);
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] start could not be scheduled: {}", cfg.id, e.what());
            auto waiters = std::move(startWaiters);
            startWaiters.clear();
            for (auto& w : waiters) {
                w.set_exception(std::current_exception());
            }
        }
    }

    void requestStop(std::promise<void> waiter) {
        stopRequested = true;
        cancelRestart();
        failAllPending(ErrorCode::Stopped, "stopped");
        if (waitTimer) {
            waitTimer->cancel();
        }
        if (pid <= 0) {
            setState(TransportState::Stopped);
            waiter.set_value();
            return;
        }
        stopWaiters.push_back(std::move(waiter));
        if (stopWaiters.size() > 1) {
            return;
        }
        expectExit = true;
        const pid_t target = pid;
        LOG_INFO("[{}] stopping process {}", cfg.id, target);
        ::kill(target, SIGTERM);
        if (!killTimer) {
            killTimer = std::make_unique<net::steady_timer>(ioc);
        }
        killTimer->expires_after(StopGracePeriod);
        killTimer->async_wait([this, target](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted || target != pid) {
                return;
            }
            LOG_WARN("[{}] process {} ignored SIGTERM; sending SIGKILL", cfg.id, target);
            ::kill(target, SIGKILL);
        });
        startReaper();
    }

    void finishStop() {
        setState(TransportState::Stopped);
        auto waiters = std::move(stopWaiters);
        stopWaiters.clear();
        for (auto& w : waiters) {
            w.set_value();
        }
    }

    void shutdownNow() {
        stopRequested = true;
        cancelRestart();
        failAllPending(ErrorCode::Stopped, "transport destroyed");
        if (waitTimer) {
            waitTimer->cancel();
        }
        if (killTimer) {
            killTimer->cancel();
        }
        terminateChildNow();
        auto starting = std::move(startWaiters);
        startWaiters.clear();
        for (auto& w : starting) {
            w.set_exception(std::make_exception_ptr(TransportError(ErrorCode::Stopped, "[" + cfg.id + "] transport destroyed")));
        }
        auto waiters = std::move(stopWaiters);
        stopWaiters.clear();
        for (auto& w : waiters) {
            w.set_value();
        }
    }
};

ProcessTransport::ProcessTransport(ServerConfig cfg) : pImpl(std::make_unique<Impl>(std::move(cfg))) { FUNC_SCOPE(); }
ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    if (pImpl && pImpl->ioThread.joinable() && pImpl->onIoThread()) {
        // Destroyed from a state handler: the loop cannot be joined from inside itself, so the
        // child is reaped now and the io thread frees the Impl once the running handler returns.
        Impl* impl = pImpl.get();
        LOG_DEBUG("[{}] transport destroyed from its own io thread", impl->cfg.id);
        impl->shutdownNow();
        impl->workGuard.reset();
        impl->ioc.stop();
        impl->orphan = std::move(pImpl);
    }
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> waiter;
    auto fut = waiter.get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), w = std::move(waiter)]() mutable {
        impl->requestStart(std::move(w));
    });
    return fut;
}

std::future<void> ProcessTransport::Stop() {
    FUNC_SCOPE();
    std::promise<void> waiter;
    auto fut = waiter.get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), w = std::move(waiter)]() mutable {
        impl->requestStop(std::move(w));
    });
    return fut;
}

std::future<JSONValue> ProcessTransport::SendRequest(const std::string& method,
                                                     std::optional<JSONValue> params,
                                                     std::optional<uint64_t> timeoutMs) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<JSONValue>>();
    auto fut = promise->get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), promise, method, params = std::move(params), timeoutMs]() {
        if (impl->pid <= 0 || !impl->childIn) {
            promise->set_exception(makeError(ErrorCode::NotConnected,
                                             "[" + impl->cfg.id + "] not connected (" + method + ")"));
            return;
        }
        impl->registerRequest(method, params, timeoutMs, [promise](std::exception_ptr ep, JSONValue v) {
            if (ep) {
                promise->set_exception(ep);
            } else {
                promise->set_value(std::move(v));
            }
        });
    });
    return fut;
}

void ProcessTransport::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    net::post(pImpl->ioc, [impl = pImpl.get(), method, params = std::move(params)]() {
        if (impl->pid <= 0) {
            LOG_DEBUG("[{}] dropping notification {}: not running", impl->cfg.id, method);
            return;
        }
        JSONRPCNotification note(method, params);
        impl->enqueueFrame(note.Serialize());
    });
}

TransportState ProcessTransport::GetState() const { return pImpl->state.load(); }
int ProcessTransport::GetPid() const { return pImpl->pidAtomic.load(); }

ServerCapabilities ProcessTransport::GetServerCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->capsMutex);
    return pImpl->caps;
}

std::size_t ProcessTransport::PendingCount() const { return pImpl->pendingCount.load(); }
uint32_t ProcessTransport::RestartCount() const { return pImpl->restarts.load(); }
const ServerConfig& ProcessTransport::GetConfig() const { return pImpl->cfg; }

void ProcessTransport::SetStateHandler(StateHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->stateHandler = std::move(handler);
}

void ProcessTransportTestHooks::injectStdout(ProcessTransport& t, const std::string& bytes) {
    auto* impl = t.pImpl.get();
    impl->runOnIo([impl, &bytes]() { impl->handleStdoutBytes(bytes.data(), bytes.size()); });
}

std::vector<int64_t> ProcessTransportTestHooks::pendingIds(ProcessTransport& t) {
    auto* impl = t.pImpl.get();
    std::vector<int64_t> ids;
    impl->runOnIo([impl, &ids]() {
        for (const auto& kv : impl->pending) {
            ids.push_back(kv.first);
        }
    });
    return ids;
}

std::size_t ProcessTransportTestHooks::stderrPartialSize(ProcessTransport& t) {
    auto* impl = t.pImpl.get();
    std::size_t n = 0;
    impl->runOnIo([impl, &n]() { n = impl->stderrLine.size(); });
    return n;
}

uint64_t ProcessTransportTestHooks::unsolicitedCount(ProcessTransport& t) {
    auto* impl = t.pImpl.get();
    uint64_t n = 0;
    impl->runOnIo([impl, &n]() { n = impl->unsolicited; });
    return n;
}

} // namespace mcphost
