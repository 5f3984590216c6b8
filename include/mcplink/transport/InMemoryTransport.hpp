//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport pair used to script providers in tests and embedding
//==========================================================================================================
#pragma once

#include <memory>
#include <utility>

#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

//==========================================================================================================
// InMemoryTransport
// Purpose: Delivers serialized messages to a paired instance through a queue drained by a worker thread.
// Notes:
//   Closing either side disconnects both: the peer's pending requests fail with "Peer disconnected" and
//   its error handler is told, which is how a provider crash looks to the client side.
//   Inbound requests are handled on their own threads so a slow handler does not stall notifications.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Returns:
    //   (client, server) where sending on one delivers to the other. Either may be destroyed first.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Deadline applied to each SendRequest; zero (the default) waits indefinitely.
    void SetRequestTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace mcplink
