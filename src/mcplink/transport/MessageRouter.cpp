//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.cpp
// Purpose: Default classification and dispatch of inbound JSON-RPC messages
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcplink/transport/MessageRouter.h"

namespace mcplink {
namespace transport {

namespace {

IMessageRouter::MessageKind kindOf(const JSONValue& doc) {
    if (!doc.isObject()) {
        return IMessageRouter::MessageKind::Unknown;
    }
    if (FindMember(doc, "result") != nullptr || FindMember(doc, "error") != nullptr) {
        return IMessageRouter::MessageKind::Response;
    }
    if (GetStringMember(doc, "method").has_value()) {
        return FindMember(doc, "id") != nullptr ? IMessageRouter::MessageKind::Request
                                                : IMessageRouter::MessageKind::Notification;
    }
    return IMessageRouter::MessageKind::Unknown;
}

std::string replyFor(const JSONRPCRequest& request, const RouterHandlers& handlers) {
    if (!handlers.requestHandler) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                   "Method not found: " + request.method)->Serialize();
    }
    try {
        auto resp = handlers.requestHandler(request);
        if (!resp) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                       "Null response from handler")->Serialize();
        }
        resp->id = request.id;
        return resp->Serialize();
    } catch (const std::exception& e) {
        LOG_ERROR("Request handler for {} threw: {}", request.method, e.what());
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what())->Serialize();
    }
}

class MessageRouter : public IMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        auto doc = TryParseJSON(json);
        return doc.has_value() ? kindOf(*doc) : MessageKind::Unknown;
    }

    std::optional<std::string> route(const std::string& json, const RouterHandlers& handlers,
                                     const ResponseResolver& resolve) override {
        switch (classify(json)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(json)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.Deserialize(json)) {
                    return replyFor(request, handlers);
                }
                break;
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(json)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }
        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};

} // namespace

std::unique_ptr<IMessageRouter> MakeDefaultMessageRouter() {
    return std::make_unique<MessageRouter>();
}

} // namespace transport
} // namespace mcplink
