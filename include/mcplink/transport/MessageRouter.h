//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.h
// Purpose: Classification and dispatch of inbound JSON-RPC messages for client transports
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IMessageRouter {
public:
    virtual ~IMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Looks only at top-level members: result/error => Response, method+id => Request, method => Notification.
    virtual MessageKind classify(const std::string& json) = 0;

    //========================================================================================================
    // route
    // Purpose: Dispatches one message. Responses go to resolve, notifications and requests to handlers.
    // Returns:
    //   The serialized reply for a request (MethodNotFound when no request handler is set), else nullopt.
    //========================================================================================================
    virtual std::optional<std::string> route(const std::string& json, const RouterHandlers& handlers,
                                             const ResponseResolver& resolve) = 0;
};

std::unique_ptr<IMessageRouter> MakeDefaultMessageRouter();

} // namespace transport
} // namespace mcplink
