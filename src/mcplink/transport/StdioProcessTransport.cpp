//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioProcessTransport.cpp
// Purpose: Transport that spawns a provider process and speaks JSON-RPC over its stdin/stdout
//==========================================================================================================

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcplink/transport/MessageFramer.h"
#include "mcplink/transport/MessageRouter.h"
#include "mcplink/transport/PendingRequests.h"
#include "mcplink/transport/StdioProcessTransport.hpp"

extern char** environ;

namespace mcplink {
namespace transport {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);

std::future<void> readyVoid() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

// Symbolic errno names in the form tool providers' users search for.
std::string errnoName(int err) {
    switch (err) {
        case ENOENT: return "ENOENT";
        case EACCES: return "EACCES";
        case EPERM: return "EPERM";
        case ENOEXEC: return "ENOEXEC";
        case ENOTDIR: return "ENOTDIR";
        case ENOMEM: return "ENOMEM";
        case E2BIG: return "E2BIG";
        case ELOOP: return "ELOOP";
        default: return "errno " + std::to_string(err);
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq != std::string::npos) {
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

std::vector<char*> pointersTo(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

class StdioProcessTransport::Impl {
public:
    TransportConfig config;
    std::string sessionId;
    std::atomic<bool> connected{false};
    pid_t childPid{-1};
    int childStdin{-1};
    int childStdout{-1};
    int wakeFd{-1};

    std::mutex handlerMutex;
    RouterHandlers handlers;

    std::mutex writeMutex;
    std::unique_ptr<IMessageFramer> framer;
    std::unique_ptr<IMessageRouter> router{MakeDefaultMessageRouter()};
    PendingRequests pending;
    std::atomic<unsigned int> requestCounter{0u};

    std::jthread readerThread;
    std::jthread timeoutThread;
    std::mutex lifecycleMutex;

    explicit Impl(const TransportConfig& cfg) : config(cfg), framer(MakeFramer(cfg.framing)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
    }

    RouterHandlers snapshotHandlers() {
        std::lock_guard<std::mutex> lock(handlerMutex);
        return handlers;
    }

    void reportError(const std::string& msg) {
        auto h = snapshotHandlers();
        if (h.errorHandler) {
            h.errorHandler(msg);
        }
    }

    ////////////////////////////////////////// Process lifecycle //////////////////////////////////////////
    bool spawn() {
        if (config.command.empty()) {
            reportError("spawn: no command configured");
            return false;
        }
        int toChild[2] = {-1, -1};
        int fromChild[2] = {-1, -1};
        int execStatus[2] = {-1, -1};
        if (::pipe2(toChild, O_CLOEXEC) != 0 || ::pipe2(fromChild, O_CLOEXEC) != 0 ||
            ::pipe2(execStatus, O_CLOEXEC) != 0) {
            const int err = errno;
            for (int* fds : {toChild, fromChild, execStatus}) {
                closeFd(fds[0]);
                closeFd(fds[1]);
            }
            reportError("spawn " + config.command + " " + errnoName(err) + ": " + std::strerror(err));
            return false;
        }

        std::vector<std::string> argvStrings;
        argvStrings.push_back(config.command);
        argvStrings.insert(argvStrings.end(), config.args.begin(), config.args.end());
        std::vector<std::string> envStrings = buildEnvironment(config.env);
        std::vector<char*> argv = pointersTo(argvStrings);
        std::vector<char*> envp = pointersTo(envStrings);
        const bool quiet = config.quiet;

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            for (int* fds : {toChild, fromChild, execStatus}) {
                closeFd(fds[0]);
                closeFd(fds[1]);
            }
            reportError("spawn " + config.command + " " + errnoName(err) + ": " + std::strerror(err));
            return false;
        }
        if (pid == 0) {
            // Child: async-signal-safe calls only.
            ::dup2(toChild[0], STDIN_FILENO);
            ::dup2(fromChild[1], STDOUT_FILENO);
            if (quiet) {
                int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
                if (devnull >= 0) {
                    ::dup2(devnull, STDERR_FILENO);
                    if (devnull != STDERR_FILENO) {
                        ::close(devnull);
                    }
                }
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t ignored = ::write(execStatus[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(toChild[0]);
        closeFd(fromChild[1]);
        closeFd(execStatus[1]);

        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(execStatus[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(execStatus[0]);

        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            closeFd(toChild[1]);
            closeFd(fromChild[0]);
            reportError("spawn " + config.command + " " + errnoName(childErr) + ": " + std::strerror(childErr));
            return false;
        }

        childPid = pid;
        childStdin = toChild[1];
        childStdout = fromChild[0];
        wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeFd < 0) {
            LOG_WARN("StdioProcessTransport: eventfd failed (errno={}); shutdown relies on poll timeout", errno);
        }
        LOG_INFO("Spawned provider process '{}' (pid {})", config.command, static_cast<int>(pid));
        return true;
    }

    void terminateChild() {
        if (childPid <= 0) {
            return;
        }
        int status = 0;
        if (::waitpid(childPid, &status, WNOHANG) == 0) {
            ::kill(childPid, SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
            while (::waitpid(childPid, &status, WNOHANG) == 0) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    LOG_WARN("Provider process {} ignored SIGTERM; killing", static_cast<int>(childPid));
                    ::kill(childPid, SIGKILL);
                    ::waitpid(childPid, &status, 0);
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        childPid = -1;
    }

    // Transition to disconnected because the child went away. The error handler hears about it before
    // any pending request is failed.
    void onChildGone(const std::string& reason) {
        if (!connected.exchange(false)) {
            return;
        }
        LOG_WARN("StdioProcessTransport {}: {}", sessionId, reason);
        reportError(reason);
        pending.FailAll(reason);
    }

    ////////////////////////////////////////// I/O threads //////////////////////////////////////////
    void startThreads() {
        readerThread = std::jthread([this](std::stop_token st) { readLoop(st); });
        timeoutThread = std::jthread([this](std::stop_token st) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock<std::mutex> lock(m);
            while (!st.stop_requested()) {
                cv.wait_for(lock, st, std::chrono::milliseconds(50), [] { return false; });
                pending.ExpireOverdue();
            }
        });
    }

    void readLoop(std::stop_token st) {
        std::array<char, 8192> chunk{};
        std::string buffer;
        while (!st.stop_requested()) {
            pollfd pfds[2];
            pfds[0] = pollfd{childStdout, POLLIN, 0};
            pfds[1] = pollfd{wakeFd, POLLIN, 0};
            const nfds_t count = wakeFd >= 0 ? 2 : 1;
            int rc = ::poll(pfds, count, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                onChildGone(std::string("poll failed: ") + std::strerror(errno));
                return;
            }
            if (rc == 0) {
                continue;
            }
            if (count == 2 && (pfds[1].revents & POLLIN)) {
                return;
            }
            if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(childStdout, chunk.data(), chunk.size());
            if (n > 0) {
                buffer.append(chunk.data(), static_cast<std::size_t>(n));
                while (auto payload = framer->tryDecode(buffer)) {
                    handleInbound(*payload);
                }
            } else if (n == 0) {
                onChildGone("Provider process exited (EOF on stdout)");
                return;
            } else if (errno != EINTR && errno != EAGAIN) {
                onChildGone(std::string("read error: ") + std::strerror(errno));
                return;
            }
        }
    }

    void handleInbound(const std::string& payload) {
        LOG_DEBUG("StdioProcessTransport {} received: {}", sessionId, payload);
        auto h = snapshotHandlers();
        auto reply = router->route(payload, h, [this](JSONRPCResponse&& resp) {
            if (!pending.Resolve(std::move(resp))) {
                LOG_DEBUG("StdioProcessTransport {}: response for unknown or expired id", sessionId);
            }
        });
        if (reply.has_value()) {
            writeFrame(*reply);
        }
    }

    bool writeFrame(const std::string& payload) {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (childStdin < 0) {
            return false;
        }
        const std::string frame = framer->encode(payload);
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(childStdin, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                LOG_ERROR("StdioProcessTransport {}: write failed: {}", sessionId, std::strerror(errno));
                return false;
            }
        }
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        connected = false;
        if (wakeFd >= 0) {
            uint64_t one = 1;
            ssize_t ignored = ::write(wakeFd, &one, sizeof(one));
            (void)ignored;
        }
        for (std::jthread* t : {&readerThread, &timeoutThread}) {
            if (!t->joinable()) {
                continue;
            }
            t->request_stop();
            if (t->get_id() == std::this_thread::get_id()) {
                t->detach();
            } else {
                t->join();
            }
        }
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            closeFd(childStdin);
        }
        terminateChild();
        closeFd(childStdout);
        closeFd(wakeFd);
        pending.FailAll("Transport closed");
    }
};

StdioProcessTransport::StdioProcessTransport(const TransportConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    FUNC_SCOPE();
}

StdioProcessTransport::~StdioProcessTransport() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

std::future<void> StdioProcessTransport::Start() {
    FUNC_SCOPE();
    ignoreSigpipeOnce();
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycleMutex);
    if (pImpl->connected) {
        return readyVoid();
    }
    if (pImpl->spawn()) {
        pImpl->connected = true;
        pImpl->startThreads();
    }
    return readyVoid();
}

std::future<void> StdioProcessTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing StdioProcessTransport {}", pImpl->sessionId);
    pImpl->shutdown();
    return readyVoid();
}

bool StdioProcessTransport::IsConnected() const { return pImpl->connected; }

std::string StdioProcessTransport::GetSessionId() const { return pImpl->sessionId; }

std::optional<int> StdioProcessTransport::GetProcessId() const {
    if (pImpl->childPid > 0) {
        return static_cast<int>(pImpl->childPid);
    }
    return std::nullopt;
}

std::future<std::unique_ptr<JSONRPCResponse>> StdioProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::string key = JSONRPCIdToString(request->id);
    if (key.empty()) {
        key = "req-" + std::to_string(++pImpl->requestCounter);
        request->id = key;
    }
    auto fut = pImpl->pending.Add(key, std::chrono::milliseconds(pImpl->config.requestTimeoutMs));
    if (!pImpl->connected) {
        pImpl->pending.Fail(key, "Transport not connected");
    } else if (!pImpl->writeFrame(request->Serialize())) {
        pImpl->pending.Fail(key, "Failed to write request to provider process");
    }
    return fut;
}

std::future<void> StdioProcessTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->connected || !pImpl->writeFrame(notification->Serialize())) {
        pImpl->reportError("Failed to send notification " + notification->method);
    }
    return readyVoid();
}

void StdioProcessTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void StdioProcessTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

void StdioProcessTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

} // namespace transport
} // namespace mcplink
