//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC client transport for remote tool providers (Boost.Beast, TLS 1.3)
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <limits>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcplink/transport/HTTPTransport.hpp"
#include "mcplink/transport/MessageRouter.h"
#include "mcplink/transport/PendingRequests.h"

namespace mcplink {
namespace transport {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kConnectTimeout = std::chrono::milliseconds(10000);
constexpr auto kExpiryTick = std::chrono::milliseconds(50);
constexpr const char* kSessionHeader = "Mcp-Session-Id";

std::string lowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimAscii(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

std::string describeFailure(const std::string& prefix, std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const boost::system::system_error& e) {
        return prefix + ": " + e.code().message();
    } catch (const std::exception& e) {
        return prefix + ": " + e.what();
    }
    return prefix;
}

std::future<void> readyVoid() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

struct HttpReply {
    unsigned int status{0};
    std::string reason;
    std::string contentType;
    std::string sessionId;
    std::string body;
};

} // namespace

////////////////////////////////////////// URL and SSE helpers //////////////////////////////////////////
std::optional<HttpUrl> ParseHttpUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    HttpUrl out;
    out.scheme = lowerAscii(url.substr(0, schemeEnd));
    if (out.scheme != "http" && out.scheme != "https") {
        return std::nullopt;
    }
    std::string rest = url.substr(schemeEnd + 3);
    const auto slash = rest.find_first_of("/?");
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (!out.target.empty() && out.target.front() == '?') {
        out.target = "/" + out.target;
    }
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            out.port = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            out.port = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    if (out.host.empty()) {
        return std::nullopt;
    }
    if (out.port.empty()) {
        out.port = out.scheme == "https" ? "443" : "80";
    }
    if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return out;
}

std::optional<HttpUrl> ResolveEndpointUrl(const HttpUrl& base, const std::string& endpoint) {
    if (endpoint.empty() || endpoint.rfind("//", 0) == 0) {
        return std::nullopt;
    }
    if (endpoint.find("://") != std::string::npos) {
        auto absolute = ParseHttpUrl(endpoint);
        if (!absolute.has_value() || absolute->scheme != base.scheme ||
            lowerAscii(absolute->host) != lowerAscii(base.host) || absolute->port != base.port) {
            return std::nullopt;
        }
        return absolute;
    }
    HttpUrl out = base;
    const std::string path = base.target.substr(0, base.target.find('?'));
    if (endpoint.front() == '/') {
        out.target = endpoint;
    } else if (endpoint.front() == '?') {
        out.target = path + endpoint;
    } else {
        out.target = path.substr(0, path.rfind('/') + 1) + endpoint;
    }
    return out;
}

std::vector<SseEvent> SseEventParser::Feed(const std::string& chunk) {
    std::vector<SseEvent> out;
    partial += chunk;
    std::size_t pos = 0;
    for (auto eol = partial.find('\n'); eol != std::string::npos; eol = partial.find('\n', pos)) {
        takeLine(partial.substr(pos, eol - pos), out);
        pos = eol + 1;
    }
    partial.erase(0, pos);
    return out;
}

std::optional<SseEvent> SseEventParser::Finish() {
    std::vector<SseEvent> out;
    if (!partial.empty()) {
        takeLine(std::exchange(partial, std::string()), out);
    }
    takeLine(std::string(), out);
    if (out.empty()) {
        return std::nullopt;
    }
    return out.front();
}

void SseEventParser::takeLine(std::string line, std::vector<SseEvent>& out) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        if (haveData) {
            out.push_back(SseEvent{event.empty() ? std::string("message") : event, data});
        }
        event.clear();
        data.clear();
        haveData = false;
        return;
    }
    if (line.front() == ':') {
        return;
    }
    const auto colon = line.find(':');
    const std::string field = line.substr(0, colon);
    std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.erase(0, 1);
    }
    if (field == "data") {
        if (haveData) {
            data.push_back('\n');
        }
        data += value;
        haveData = true;
    } else if (field == "event") {
        event = value;
    }
}

std::vector<std::string> ParseSseDataEvents(const std::string& body) {
    SseEventParser parser;
    std::vector<std::string> out;
    for (auto& ev : parser.Feed(body)) {
        out.push_back(std::move(ev.data));
    }
    if (auto last = parser.Finish()) {
        out.push_back(std::move(last->data));
    }
    return out;
}

////////////////////////////////////////// Impl //////////////////////////////////////////
class HTTPTransport::Impl {
public:
    TransportConfig config;
    std::optional<HttpUrl> url;
    std::string sessionId;
    std::atomic<bool> connected{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<ssl::context> sslCtx;

    std::mutex handlerMutex;
    RouterHandlers handlers;
    std::unique_ptr<IMessageRouter> router{MakeDefaultMessageRouter()};
    PendingRequests pending;
    std::atomic<unsigned int> requestCounter{0u};

    std::mutex sessionMutex;
    std::string mcpSessionId;
    std::string postTarget;

    // Legacy SSE: the GET stream is open and its endpoint event has arrived.
    const bool legacySse;
    std::atomic<bool> endpointAnnounced{false};

    explicit Impl(const TransportConfig& cfg)
        : config(cfg), url(ParseHttpUrl(cfg.url)), legacySse(cfg.type == TransportType::Sse) {
        if (url.has_value()) {
            postTarget = url->target;
        }
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "http-" + std::to_string(dis(gen));
        if (url.has_value() && url->scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            boost::system::error_code ec;
            sslCtx->set_default_verify_paths(ec);
            if (ec) {
                LOG_WARN("HTTPS: default CA paths unavailable: {}", ec.message());
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    ~Impl() { stopIo(); }

    void stopIo() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
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

    http::request<http::string_body> buildRequest(const std::string& payload) {
        std::lock_guard<std::mutex> lock(sessionMutex);
        http::request<http::string_body> req{http::verb::post, postTarget, 11};
        req.set(http::field::host, url->host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::connection, "close");
        for (const auto& [name, value] : config.headers) {
            req.set(name, value);
        }
        if (!mcpSessionId.empty()) {
            req.set(kSessionHeader, mcpSessionId);
        }
        req.body() = payload;
        req.prepare_payload();
        return req;
    }

    static HttpReply toReply(http::response<http::string_body>& res) {
        HttpReply reply;
        reply.status = res.result_int();
        reply.reason = std::string(res.reason());
        reply.contentType = lowerAscii(std::string(res[http::field::content_type]));
        reply.sessionId = std::string(res[kSessionHeader]);
        reply.body = std::move(res.body());
        return reply;
    }

    std::chrono::milliseconds readTimeout() const {
        return config.requestTimeoutMs > 0 ? std::chrono::milliseconds(config.requestTimeoutMs)
                                           : std::chrono::milliseconds(std::chrono::hours(24));
    }

    // Coroutine: POST payload, return the reply. Network errors propagate as exceptions.
    net::awaitable<HttpReply> coPost(const std::string payload) {
        auto req = buildRequest(payload);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto endpoints = co_await resolver.async_resolve(url->host, url->port, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI host {}", url->host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url->host.c_str());
            boost::beast::get_lowest_layer(stream).expires_after(kConnectTimeout);
            co_await boost::beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            boost::beast::get_lowest_layer(stream).expires_after(readTimeout());
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(kConnectTimeout);
            co_await stream.async_connect(endpoints, net::use_awaitable);
            stream.expires_after(readTimeout());
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toReply(res);
    }

    // Routes every JSON-RPC payload in a successful reply.
    void deliver(const HttpReply& reply) {
        if (!reply.sessionId.empty()) {
            std::lock_guard<std::mutex> lock(sessionMutex);
            mcpSessionId = reply.sessionId;
        }
        std::vector<std::string> payloads;
        if (reply.contentType.find("text/event-stream") != std::string::npos) {
            payloads = ParseSseDataEvents(reply.body);
        } else if (!reply.body.empty()) {
            payloads.push_back(reply.body);
        }
        for (const auto& payload : payloads) {
            routePayload(payload);
        }
    }

    void routePayload(const std::string& payload) {
        auto answer = router->route(payload, snapshotHandlers(), [this](JSONRPCResponse&& resp) {
            if (!pending.Resolve(std::move(resp))) {
                LOG_DEBUG("HTTPTransport {}: response for unknown id", sessionId);
            }
        });
        if (answer.has_value()) {
            // Provider-initiated request: answer it with a fresh POST.
            post(*answer, [](std::exception_ptr, HttpReply) {});
        }
    }

    ////////////////////////////////////////// Legacy SSE stream //////////////////////////////////////////
    http::request<http::empty_body> buildStreamRequest() {
        http::request<http::empty_body> req{http::verb::get, url->target, 11};
        req.set(http::field::host, url->host);
        req.set(http::field::accept, "text/event-stream");
        req.set(http::field::cache_control, "no-cache");
        for (const auto& [name, value] : config.headers) {
            req.set(name, value);
        }
        return req;
    }

    void onStreamEvent(const SseEvent& ev, const std::shared_ptr<std::promise<void>>& ready) {
        if (ev.event == "endpoint") {
            const std::string announced = trimAscii(ev.data);
            auto target = ResolveEndpointUrl(*url, announced);
            if (!target.has_value()) {
                throw std::runtime_error("endpoint '" + announced + "' is not on " + url->scheme + "://" +
                                         url->host + ":" + url->port);
            }
            {
                std::lock_guard<std::mutex> lock(sessionMutex);
                postTarget = target->target;
            }
            if (!endpointAnnounced.exchange(true)) {
                LOG_INFO("HTTPTransport {}: SSE endpoint {}", sessionId, target->target);
                connected = true;
                ready->set_value();
            }
            return;
        }
        if (ev.event != "message") {
            LOG_DEBUG("HTTPTransport {}: ignoring SSE event '{}'", sessionId, ev.event);
            return;
        }
        routePayload(ev.data);
    }

    // Writes the GET, then feeds the body to the SSE parser until the provider ends the stream.
    template <typename Stream>
    net::awaitable<void> pumpEventStream(Stream& stream, std::shared_ptr<std::promise<void>> ready) {
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(readTimeout());
        auto req = buildStreamRequest();
        co_await http::async_write(stream, req, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        const unsigned int status = parser.get().result_int();
        if (status >= 400) {
            throw std::runtime_error("HTTP " + std::to_string(status) + " " + std::string(parser.get().reason()));
        }
        const std::string contentType = lowerAscii(std::string(parser.get()[http::field::content_type]));
        if (contentType.find("text/event-stream") == std::string::npos) {
            throw std::runtime_error("unexpected content type '" + contentType + "'");
        }

        SseEventParser events;
        std::array<char, 4096> chunk{};
        bool unbounded = false;
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            boost::system::error_code ec;
            co_await http::async_read_some(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            const std::size_t got = chunk.size() - parser.get().body().size;
            for (const auto& ev : events.Feed(std::string(chunk.data(), got))) {
                onStreamEvent(ev, ready);
            }
            if (!unbounded && endpointAnnounced) {
                lowest.expires_never();
                unbounded = true;
            }
        }
        if (auto last = events.Finish()) {
            onStreamEvent(*last, ready);
        }
        if (!endpointAnnounced) {
            throw std::runtime_error("stream closed before the endpoint event");
        }
    }

    net::awaitable<void> coEventStream(std::shared_ptr<std::promise<void>> ready) {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto endpoints = co_await resolver.async_resolve(url->host, url->port, net::use_awaitable);
        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI host {}", url->host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url->host.c_str());
            boost::beast::get_lowest_layer(stream).expires_after(kConnectTimeout);
            co_await boost::beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await pumpEventStream(stream, ready);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(kConnectTimeout);
            co_await stream.async_connect(endpoints, net::use_awaitable);
            co_await pumpEventStream(stream, ready);
        }
    }

    // The stream carries every reply, so its end is the end of the session.
    void onStreamEnded(std::exception_ptr eptr, const std::shared_ptr<std::promise<void>>& ready) {
        const std::string what = eptr ? describeFailure("SSE stream failed", eptr) : std::string("SSE stream closed");
        LOG_WARN("HTTPTransport {}: {}", sessionId, what);
        connected = false;
        const bool wasAnnounced = endpointAnnounced.exchange(false);
        reportError(what);
        pending.FailAll(what);
        if (!wasAnnounced) {
            ready->set_value();
        }
    }

    // Enforces requestTimeoutMs on replies that arrive over the stream.
    net::awaitable<void> coExpireOverdue() {
        net::steady_timer timer(co_await net::this_coro::executor);
        for (;;) {
            timer.expires_after(kExpiryTick);
            co_await timer.async_wait(net::use_awaitable);
            pending.ExpireOverdue();
        }
    }

    template <typename Handler>
    void post(const std::string& payload, Handler&& onDone) {
        net::co_spawn(ioc, coPost(payload), std::forward<Handler>(onDone));
    }
};

////////////////////////////////////////// HTTPTransport //////////////////////////////////////////
HTTPTransport::HTTPTransport(const TransportConfig& config) : pImpl(std::make_unique<Impl>(config)) {
    FUNC_SCOPE();
}

HTTPTransport::~HTTPTransport() {
    FUNC_SCOPE();
    pImpl->stopIo();
    pImpl->pending.FailAll("Transport closed");
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->connected) {
        return readyVoid();
    }
    if (!pImpl->url.has_value()) {
        pImpl->reportError("Invalid provider URL: '" + pImpl->config.url + "'");
        return readyVoid();
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(pImpl->ioc));
    pImpl->ioc.restart();
    pImpl->ioThread = std::thread([impl = pImpl.get()]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport io loop terminated: {}", e.what());
            impl->reportError(e.what());
        }
    });
    LOG_INFO("HTTPTransport {} targeting {}://{}:{}{}", pImpl->sessionId, pImpl->url->scheme, pImpl->url->host,
             pImpl->url->port, pImpl->url->target);
    if (!pImpl->legacySse) {
        pImpl->connected = true;
        return readyVoid();
    }

    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    Impl* impl = pImpl.get();
    net::co_spawn(pImpl->ioc, pImpl->coEventStream(ready),
                  [impl, ready](std::exception_ptr eptr) { impl->onStreamEnded(eptr, ready); });
    net::co_spawn(pImpl->ioc, pImpl->coExpireOverdue(), net::detached);
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->endpointAnnounced = false;
    pImpl->stopIo();
    pImpl->pending.FailAll("Transport closed");
    return readyVoid();
}

bool HTTPTransport::IsConnected() const { return pImpl->connected; }

std::string HTTPTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::string key = JSONRPCIdToString(request->id);
    if (key.empty()) {
        key = "http-req-" + std::to_string(++pImpl->requestCounter);
        request->id = key;
    }
    // Over a POST reply the socket deadline bounds the exchange; stream replies need a table deadline.
    const auto deadline = pImpl->legacySse ? std::chrono::milliseconds(pImpl->config.requestTimeoutMs)
                                           : std::chrono::milliseconds(0);
    auto fut = pImpl->pending.Add(key, deadline);
    if (!pImpl->connected) {
        pImpl->pending.Fail(key, "Transport not connected");
        return fut;
    }

    Impl* impl = pImpl.get();
    pImpl->post(request->Serialize(), [impl, key](std::exception_ptr eptr, HttpReply reply) {
        if (eptr) {
            const std::string what = describeFailure("HTTP request failed", eptr);
            LOG_WARN("HTTPTransport {}: {}", impl->sessionId, what);
            impl->pending.Fail(key, what);
            impl->reportError(what);
            return;
        }
        if (reply.status >= 400) {
            const std::string what = "HTTP " + std::to_string(reply.status) + " " + reply.reason;
            impl->pending.Fail(key, what);
            impl->reportError(what);
            return;
        }
        impl->deliver(reply);
        if (impl->legacySse) {
            return;
        }
        if (impl->pending.Fail(key, "No JSON-RPC response in HTTP reply")) {
            LOG_WARN("HTTPTransport {}: reply for {} carried no response", impl->sessionId, key);
        }
    });
    return fut;
}

std::future<void> HTTPTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!pImpl->connected) {
        done->set_value();
        return fut;
    }
    Impl* impl = pImpl.get();
    const std::string method = notification->method;
    pImpl->post(notification->Serialize(), [impl, done, method](std::exception_ptr eptr, HttpReply reply) {
        if (eptr) {
            impl->reportError("HTTP notification " + method + " failed");
        } else if (reply.status >= 400) {
            impl->reportError("HTTP " + std::to_string(reply.status) + " " + reply.reason);
        } else {
            impl->deliver(reply);
        }
        done->set_value();
    });
    return fut;
}

void HTTPTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void HTTPTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

} // namespace transport
} // namespace mcplink
