//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: HTTP/HTTPS JSON-RPC client transport for remote tool providers (Boost.Beast, TLS 1.3)
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

//==========================================================================================================
// HttpUrl
// Purpose: Parsed http(s)://host[:port][/target]. The port defaults to 80/443 and the target to "/".
//==========================================================================================================
struct HttpUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Returns nullopt for a missing host or a scheme other than http/https.
std::optional<HttpUrl> ParseHttpUrl(const std::string& url);

// Resolves the URL announced by a legacy SSE "endpoint" event against the stream URL. Absolute paths and
// relative references are accepted; a URL naming another scheme, host or port yields nullopt.
std::optional<HttpUrl> ResolveEndpointUrl(const HttpUrl& base, const std::string& endpoint);

//==========================================================================================================
// SseEvent / SseEventParser
// Purpose: Incremental text/event-stream parser. Feed() accepts arbitrary chunks and returns the events
//          completed by a blank line; data: lines are joined by '\n'.
// Notes:
//   - An event without an event: field is named "message".
//   - Comments, id: and retry: fields are ignored; events without data are not dispatched.
//==========================================================================================================
struct SseEvent {
    std::string event;
    std::string data;
};

class SseEventParser {
public:
    std::vector<SseEvent> Feed(const std::string& chunk);
    // Ends the stream; returns the unterminated last event, if any.
    std::optional<SseEvent> Finish();

private:
    void takeLine(std::string line, std::vector<SseEvent>& out);

    std::string partial;
    std::string event;
    std::string data;
    bool haveData{false};
};

// Returns the data of every event in a complete text/event-stream body.
std::vector<std::string> ParseSseDataEvents(const std::string& body);

//==========================================================================================================
// HTTPTransport
// Purpose: Every message is one POST of the serialized JSON. The reply body is JSON or an event stream;
//          each payload found is routed (responses resolve pending requests, notifications reach the
//          notification handler).
// Notes:
//   - http and streamable_http POST to the configured URL.
//   - sse is the legacy two-channel flow: Start() opens a GET event stream on the configured URL and
//     completes once the provider announces its POST URL in an "endpoint" event. Messages then go to
//     that URL and "message" events on the stream carry the replies, bounded by requestTimeoutMs.
//     The stream ending fails every pending request.
//   - A status >= 400 fails the request with "HTTP <status> <reason>".
//   - An Mcp-Session-Id response header is echoed on later requests.
//   - HTTPS is TLS 1.3 only, verifying the peer against the system trust store.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    explicit HTTPTransport(const TransportConfig& config);
    ~HTTPTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace mcplink
