//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_process_transport.cpp
// Purpose: Child-process transport tests driven by small /bin/sh providers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>

#include "mcplink/transport/StdioProcessTransport.hpp"

using namespace mcplink;
using namespace mcplink::transport;

namespace {
TransportConfig shellProvider(const std::string& script) {
    TransportConfig cfg;
    cfg.type = TransportType::Stdio;
    cfg.command = "/bin/sh";
    cfg.args = {"-c", script};
    cfg.quiet = true;
    return cfg;
}

struct ErrorSink {
    std::mutex m;
    std::string last;
    void set(const std::string& e) {
        std::lock_guard<std::mutex> lock(m);
        last = e;
    }
    std::string get() {
        std::lock_guard<std::mutex> lock(m);
        return last;
    }
};
} // namespace

TEST(StdioProcessTransport, MissingExecutableReportsSpawnError) {
    TransportConfig cfg;
    cfg.command = "/nonexistent/definitely-not-a-provider";
    StdioProcessTransport transport(cfg);
    ErrorSink errors;
    transport.SetErrorHandler([&errors](const std::string& e) { errors.set(e); });

    transport.Start().get();
    EXPECT_FALSE(transport.IsConnected());
    EXPECT_FALSE(transport.GetProcessId().has_value());
    const std::string err = errors.get();
    EXPECT_NE(err.find("spawn /nonexistent/definitely-not-a-provider"), std::string::npos);
    EXPECT_NE(err.find("ENOENT"), std::string::npos);

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("x"), "tools/list"));
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->error, "message").value_or(""), "Transport not connected");
}

TEST(StdioProcessTransport, EchoesResponseOverNdjson) {
    StdioProcessTransport transport(shellProvider(
        "read line; printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":\"abc\",\"result\":{\"ok\":true}}'; sleep 5"));
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());
    EXPECT_TRUE(transport.GetProcessId().has_value());
    EXPECT_EQ(transport.GetSessionId().rfind("stdio-", 0), 0u);

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("abc"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetBoolMember(*resp->result, "ok").value_or(false), true);

    transport.Close().get();
    EXPECT_FALSE(transport.IsConnected());
}

TEST(StdioProcessTransport, ContentLengthFramingIsHonored) {
    const std::string body = R"({"jsonrpc":"2.0","id":"cl","result":{}})";
    auto cfg = shellProvider("sleep 0.2; printf 'Content-Length: " + std::to_string(body.size()) +
                             "\\r\\n\\r\\n%s' '" + body + "'; sleep 5");
    cfg.framing = FramingMode::ContentLength;
    StdioProcessTransport transport(cfg);
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("cl"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(fut.get()->IsError());
}

TEST(StdioProcessTransport, ChildExitDisconnectsAndFailsPending) {
    StdioProcessTransport transport(shellProvider("read line; exit 0"));
    ErrorSink errors;
    transport.SetErrorHandler([&errors](const std::string& e) { errors.set(e); });
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("gone"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->error, "message").value_or(""), "Provider process exited (EOF on stdout)");
    EXPECT_FALSE(transport.IsConnected());
    EXPECT_EQ(errors.get(), "Provider process exited (EOF on stdout)");
}

TEST(StdioProcessTransport, RequestTimesOutWhenProviderIsSilent) {
    auto cfg = shellProvider("sleep 5");
    cfg.requestTimeoutMs = 100;
    StdioProcessTransport transport(cfg);
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("t"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->error, "message").value_or(""), "Request timeout");
}

TEST(StdioProcessTransport, EnvironmentOverridesReachChild) {
    auto cfg = shellProvider(
        "read line; printf '{\"jsonrpc\":\"2.0\",\"id\":\"env\",\"result\":{\"v\":\"%s\"}}\\n' \"$MCPLINK_TEST_VALUE\"; "
        "sleep 5");
    cfg.env["MCPLINK_TEST_VALUE"] = "from-config";
    StdioProcessTransport transport(cfg);
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("env"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->result, "v").value_or(""), "from-config");
}

TEST(StdioProcessTransport, QuietChildKeepsOnlyStderrOnDevNull) {
    StdioProcessTransport transport(shellProvider(
        R"(read line; n=$(for f in /proc/$$/fd/*; do readlink "$f"; done | grep -c '^/dev/null$'); )"
        R"(printf '{"jsonrpc":"2.0","id":"fd","result":{"n":"%s"}}\n' "$n"; sleep 5)"));
    transport.Start().get();
    ASSERT_TRUE(transport.IsConnected());

    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(std::string("fd"), "tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->result, "n").value_or(""), "1");
}
