//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Client-side transport abstraction towards a tool provider, plus transport configuration
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace transport {

///////////////////////////////////////// Configuration ///////////////////////////////////////////
enum class TransportType {
    Stdio,
    Http,
    Sse,
    StreamableHttp
};

// Wire framing on a stdio pipe.
enum class FramingMode {
    Ndjson,
    ContentLength
};

// "stdio" / "http" / "sse" / "streamable_http"
const char* toString(TransportType type);
std::optional<TransportType> transportTypeFromString(const std::string& s);
// "ndjson" / "content-length"
const char* toString(FramingMode mode);
std::optional<FramingMode> framingModeFromString(const std::string& s);

//==========================================================================================================
// TransportConfig
// Purpose: Everything a factory needs to open a channel to one provider.
// Notes:
//   command/args/env apply to stdio; url/headers to the HTTP family.
//   requestTimeoutMs bounds a single request; 0 disables the transport-level deadline.
//==========================================================================================================
struct TransportConfig {
    TransportType type{TransportType::Stdio};
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;
    std::map<std::string, std::string> headers;
    FramingMode framing{FramingMode::Ndjson};
    bool quiet{false};
    uint64_t requestTimeoutMs{60000};
};

//==========================================================================================================
// ITransport
// Purpose: One session with one provider. Futures never carry exceptions: transport failures come back
//          as JSON-RPC error responses (InternalError) and are also reported to the error handler.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the channel (spawns the child, starts the I/O thread, ...).
    // Returns:
    //   A future that completes once the transport can send. IsConnected() tells whether it succeeded.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the channel. Pending requests complete with a "Transport closed" error response.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic identifier such as "stdio-4821".
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a request and returns a future for the matching response. An empty string id is replaced by a
    // transport-generated one.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    virtual std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound handlers ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Requests initiated by the provider (e.g. ping). The returned response is sent back.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Creates a transport for a configuration. Returns nullptr for a type it cannot serve.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;
    virtual std::unique_ptr<ITransport> CreateTransport(const TransportConfig& config) = 0;
};

//==========================================================================================================
// DefaultTransportFactory
// Purpose: stdio -> StdioProcessTransport; http, sse and streamable_http -> HTTPTransport.
//==========================================================================================================
class DefaultTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const TransportConfig& config) override;
};

} // namespace transport
} // namespace mcplink
