//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-process transport pair used to script providers in tests and embedding
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "mcplink/transport/InMemoryTransport.hpp"
#include "mcplink/transport/MessageRouter.h"
#include "mcplink/transport/PendingRequests.h"

namespace mcplink {
namespace transport {

namespace {
std::future<void> readyVoid() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}
} // namespace

class InMemoryTransport::Impl : public std::enable_shared_from_this<InMemoryTransport::Impl> {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    std::weak_ptr<Impl> peer;

    std::mutex handlerMutex;
    RouterHandlers handlers;

    std::mutex queueMutex;
    std::condition_variable_any queueCv;
    std::deque<std::string> inbox;
    std::jthread pump;

    PendingRequests pending;
    std::atomic<uint64_t> requestTimeoutMs{0};
    std::atomic<unsigned int> requestCounter{0u};
    std::unique_ptr<IMessageRouter> router{MakeDefaultMessageRouter()};

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() { stop(); }

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

    void start() {
        connected = true;
        pump = std::jthread([this](std::stop_token st) { drain(st); });
    }

    void stop() {
        connected = false;
        if (pump.joinable()) {
            pump.request_stop();
            queueCv.notify_all();
            if (pump.get_id() != std::this_thread::get_id()) {
                pump.join();
            } else {
                pump.detach();
            }
        }
    }

    void drain(std::stop_token st) {
        while (!st.stop_requested()) {
            std::string message;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                if (!queueCv.wait(lock, st, [this] { return !inbox.empty(); })) {
                    return;
                }
                message = std::move(inbox.front());
                inbox.pop_front();
            }
            dispatch(message);
        }
    }

    void dispatch(const std::string& message) {
        LOG_DEBUG("InMemoryTransport {} received: {}", sessionId, message);
        if (router->classify(message) == IMessageRouter::MessageKind::Request) {
            std::weak_ptr<Impl> weakSelf = weak_from_this();
            std::thread([weakSelf, message]() {
                if (auto self = weakSelf.lock()) {
                    self->handleInbound(message);
                }
            }).detach();
            return;
        }
        handleInbound(message);
    }

    void handleInbound(const std::string& message) {
        auto h = snapshotHandlers();
        auto reply = router->route(message, h, [this](JSONRPCResponse&& resp) {
            if (!pending.Resolve(std::move(resp))) {
                LOG_DEBUG("InMemoryTransport {}: response for unknown id", sessionId);
            }
        });
        if (reply.has_value()) {
            sendToPeer(*reply);
        }
    }

    void enqueue(std::string message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            inbox.push_back(std::move(message));
        }
        queueCv.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        auto other = peer.lock();
        if (!connected || !other || !other->connected.load()) {
            LOG_WARN("InMemoryTransport {}: peer not connected; dropping message", sessionId);
            return false;
        }
        other->enqueue(message);
        return true;
    }

    // Called on the surviving side when the other end closes or is destroyed.
    void onPeerGone() {
        if (!connected.exchange(false)) {
            return;
        }
        LOG_INFO("InMemoryTransport {}: peer disconnected", sessionId);
        reportError("Peer disconnected");
        pending.FailAll("Peer disconnected");
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    if (pImpl->connected) {
        Close();
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto client = std::make_unique<InMemoryTransport>();
    auto server = std::make_unique<InMemoryTransport>();
    client->pImpl->peer = server->pImpl;
    server->pImpl->peer = client->pImpl;
    return std::make_pair(std::move(client), std::move(server));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    if (!pImpl->connected) {
        LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
        pImpl->start();
    }
    return readyVoid();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->stop();
    pImpl->pending.FailAll("Transport closed");
    if (auto other = pImpl->peer.lock()) {
        other->onPeerGone();
    }
    return readyVoid();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }

std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::string key = JSONRPCIdToString(request->id);
    if (key.empty()) {
        key = "mem-req-" + std::to_string(++pImpl->requestCounter);
        request->id = key;
    }
    auto fut = pImpl->pending.Add(key, std::chrono::milliseconds(pImpl->requestTimeoutMs.load()));
    if (!pImpl->sendToPeer(request->Serialize())) {
        pImpl->pending.Fail(key, "Peer not connected");
    } else if (pImpl->requestTimeoutMs.load() > 0) {
        // Deadline enforcement without a dedicated timer thread.
        std::weak_ptr<Impl> weakImpl = pImpl;
        const auto timeout = std::chrono::milliseconds(pImpl->requestTimeoutMs.load());
        std::thread([weakImpl, timeout]() {
            std::this_thread::sleep_for(timeout);
            if (auto impl = weakImpl.lock()) {
                impl->pending.ExpireOverdue();
            }
        }).detach();
    }
    return fut;
}

std::future<void> InMemoryTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->sendToPeer(notification->Serialize())) {
        pImpl->reportError("Peer not connected");
    }
    return readyVoid();
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->requestTimeoutMs = timeoutMs;
}

} // namespace transport
} // namespace mcplink
