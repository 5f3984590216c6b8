//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioProcessTransport.hpp
// Purpose: Transport that spawns a provider process and speaks JSON-RPC over its stdin/stdout
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>

#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

//==========================================================================================================
// StdioProcessTransport
// Purpose: POSIX child-process transport. The child's stdin/stdout carry frames (ndjson or Content-Length);
//          stderr is inherited, or discarded when config.quiet is set.
// Notes:
//   - Start() spawns the child. A failed exec is reported as "spawn <command> ENOENT: ..." (errno name
//     plus strerror) through the error handler, and IsConnected() stays false.
//   - EOF on the child's stdout disconnects the transport and fails pending requests.
//   - Close() closes the child's stdin, then SIGTERM, then SIGKILL after a grace period.
//==========================================================================================================
class StdioProcessTransport : public ITransport {
public:
    explicit StdioProcessTransport(const TransportConfig& config);
    ~StdioProcessTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Child pid while running.
    std::optional<int> GetProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace mcplink
