//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport request routing, disconnect and timeout tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/transport/InMemoryTransport.hpp"

using namespace mcplink;
using namespace mcplink::transport;

namespace {
std::unique_ptr<JSONRPCRequest> makeRequest(const std::string& method) {
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = method;
    req->params.emplace(JSONValue::Object{});
    return req;
}
} // namespace

TEST(InMemoryTransport, RequestResponseRoutes) {
    auto [client, server] = InMemoryTransport::CreatePair();

    server->SetRequestHandler([](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        JSONValue::Object obj;
        SetMember(obj, "echo", JSONValue(req.method));
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(obj));
    });
    client->Start().get();
    server->Start().get();

    auto fut = client->SendRequest(makeRequest("test/echo"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->result, "echo").value_or(""), "test/echo");
    EXPECT_EQ(JSONRPCIdToString(resp->id).rfind("mem-req-", 0), 0u);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, RequestWithoutHandlerIsMethodNotFound) {
    auto [client, server] = InMemoryTransport::CreatePair();
    client->Start().get();
    server->Start().get();

    auto fut = client->SendRequest(makeRequest("tools/list"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetIntMember(*resp->error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);
}

TEST(InMemoryTransport, NotificationsAreDelivered) {
    auto [client, server] = InMemoryTransport::CreatePair();
    std::promise<std::string> received;
    auto got = received.get_future();
    client->SetNotificationHandler([&received](std::unique_ptr<JSONRPCNotification> n) {
        received.set_value(n->method);
    });
    client->Start().get();
    server->Start().get();

    server->SendNotification(std::make_unique<JSONRPCNotification>("notifications/tools/list_changed")).get();
    ASSERT_EQ(got.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(got.get(), "notifications/tools/list_changed");
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    auto [client, server] = InMemoryTransport::CreatePair();
    std::mutex m;
    std::string lastError;
    client->SetErrorHandler([&](const std::string& e) {
        std::lock_guard<std::mutex> lock(m);
        lastError = e;
    });
    client->Start().get();
    server->Start().get();

    server->Close().get();
    EXPECT_FALSE(client->IsConnected());
    {
        std::lock_guard<std::mutex> lock(m);
        EXPECT_EQ(lastError, "Peer disconnected");
    }

    auto fut = client->SendRequest(makeRequest("test/any"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetIntMember(*resp->error, "code").value_or(0), JSONRPCErrorCodes::InternalError);
}

TEST(InMemoryTransport, PendingRequestsFailWhenPeerCloses) {
    auto [client, server] = InMemoryTransport::CreatePair();
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFut = release.get_future().share();
    server->SetRequestHandler([&entered, releaseFut](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        entered.set_value();
        releaseFut.wait();
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(true));
    });
    client->Start().get();
    server->Start().get();

    auto fut = client->SendRequest(makeRequest("slow"));
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    server->Close().get();

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->error, "message").value_or(""), "Peer disconnected");
    release.set_value();
}

TEST(InMemoryTransport, RequestTimeoutProducesErrorResponse) {
    auto [client, server] = InMemoryTransport::CreatePair();
    auto release = std::make_shared<std::promise<void>>();
    auto releaseFut = release->get_future().share();
    server->SetRequestHandler([releaseFut](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        releaseFut.wait_for(std::chrono::seconds(2));
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(true));
    });
    client->SetRequestTimeoutMs(50);
    client->Start().get();
    server->Start().get();

    auto fut = client->SendRequest(makeRequest("never"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetStringMember(*resp->error, "message").value_or(""), "Request timeout");
    release->set_value();
}

TEST(InMemoryTransport, ConcurrentRequestsResolveIndependently) {
    auto [client, server] = InMemoryTransport::CreatePair();
    server->SetRequestHandler([](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(req.method));
    });
    client->Start().get();
    server->Start().get();

    std::vector<std::future<std::unique_ptr<JSONRPCResponse>>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(client->SendRequest(makeRequest("m" + std::to_string(i))));
    }
    for (int i = 0; i < 16; ++i) {
        ASSERT_EQ(futures[i].wait_for(std::chrono::seconds(2)), std::future_status::ready);
        auto resp = futures[i].get();
        ASSERT_TRUE(resp->result.has_value());
        EXPECT_EQ(std::get<std::string>(resp->result->value), "m" + std::to_string(i));
    }
}
