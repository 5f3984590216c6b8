//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_manager.cpp
// Purpose: ProviderManager lifecycle against a scripted in-memory provider
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/provider/ProviderManager.h"
#include "mcplink/reconnect/ReconnectionManager.h"
#include "mcplink/registry/ToolRegistry.h"
#include "mcplink/transport/InMemoryTransport.hpp"

using namespace mcplink;
using namespace mcplink::provider;
using mcplink::transport::InMemoryTransport;

namespace {

JSONValue toolJSON(const std::string& name, const std::string& outputSchema = std::string()) {
    std::string text = R"({"name":")" + name + R"(","description":"","inputSchema":{"type":"object"})";
    if (!outputSchema.empty()) {
        text += R"(,"outputSchema":)" + outputSchema;
    }
    text += "}";
    return ParseJSON(text);
}

JSONValue textContent(const std::string& text) {
    JSONValue::Object item;
    SetMember(item, "type", JSONValue("text"));
    SetMember(item, "text", JSONValue(text));
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object result;
    SetMember(result, "content", JSONValue(std::move(content)));
    return JSONValue(std::move(result));
}

//==========================================================================================================
// FakeProviderFactory
// Purpose: Hands the manager the client end of an InMemoryTransport pair and answers initialize,
//          tools/list (two pages), tools/call, resources and prompts on the provider end. A transport
//          whose command is "slow" takes 400 ms for every tools/call.
//==========================================================================================================
class FakeProviderFactory : public transport::ITransportFactory {
public:
    std::atomic<int> initFailures{0};
    std::atomic<bool> failToolsList{false};
    std::atomic<bool> extraTool{false};
    std::atomic<int> transportsCreated{0};
    std::atomic<int> echoDelayMs{0};
    std::atomic<bool> echoProgress{false};

    std::unique_ptr<transport::ITransport> CreateTransport(const transport::TransportConfig& config) override {
        auto [client, server] = InMemoryTransport::CreatePair();
        const bool slow = config.command == "slow";
        InMemoryTransport* provider = server.get();
        server->SetRequestHandler([this, provider, slow](const JSONRPCRequest& req) {
            ++inFlight;
            auto resp = handle(req, *provider, slow);
            --inFlight;
            return resp;
        });
        server->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            std::lock_guard<std::mutex> lock(m);
            received.push_back(std::move(n));
        });
        server->Start().get();
        {
            std::lock_guard<std::mutex> lock(m);
            servers.push_back(std::move(server));
        }
        ++transportsCreated;
        return std::move(client);
    }

    // Simulates the provider going away.
    void CloseLatest() {
        std::lock_guard<std::mutex> lock(m);
        if (!servers.empty()) {
            servers.back()->Close().get();
        }
    }

    void NotifyToolsChanged() {
        std::lock_guard<std::mutex> lock(m);
        servers.back()->SendNotification(
            std::make_unique<JSONRPCNotification>(Methods::ToolListChanged)).get();
    }

    // params of the first notifications/cancelled the providers received.
    std::optional<JSONValue> Cancelled() {
        std::lock_guard<std::mutex> lock(m);
        for (const auto& n : received) {
            if (n->method == Methods::Cancelled && n->params.has_value()) {
                return DeepCopyJSON(*n->params);
            }
        }
        return std::nullopt;
    }

    ~FakeProviderFactory() override {
        // Delayed handlers run on their own threads; let them finish first.
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (inFlight.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::lock_guard<std::mutex> lock(m);
        for (auto& s : servers) {
            s->Close().get();
        }
    }

private:
    std::unique_ptr<JSONRPCResponse> handle(const JSONRPCRequest& req, InMemoryTransport& provider, bool slow) {
        if (req.method == Methods::Initialize) {
            if (initFailures > 0) {
                --initFailures;
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "boom");
            }
            return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(R"({"protocolVersion":"2025-06-18",
                "capabilities":{"tools":{"listChanged":true}},"serverInfo":{"name":"fake","version":"1.0"}})"));
        }
        if (req.method == Methods::ListTools) {
            if (failToolsList) {
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "tools unavailable");
            }
            const bool secondPage = req.params.has_value() && GetStringMember(*req.params, "cursor").has_value();
            JSONValue::Array tools;
            JSONValue::Object result;
            if (!secondPage) {
                tools.push_back(std::make_shared<JSONValue>(toolJSON("echo")));
                SetMember(result, "nextCursor", JSONValue("page-2"));
            } else {
                tools.push_back(std::make_shared<JSONValue>(toolJSON("add")));
                tools.push_back(std::make_shared<JSONValue>(toolJSON(
                    "report", R"({"type":"object","properties":{"count":{"type":"number"}},"required":["count"]})")));
                if (extraTool) {
                    tools.push_back(std::make_shared<JSONValue>(toolJSON("extra")));
                }
            }
            SetMember(result, "tools", JSONValue(std::move(tools)));
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue(std::move(result)));
        }
        if (req.method == Methods::CallTool) {
            const std::string name = GetStringMember(*req.params, "name").value_or("");
            const JSONValue* args = FindMember(*req.params, "arguments");
            if (name == "add" && args != nullptr) {
                const int64_t sum = GetIntMember(*args, "a").value_or(0) + GetIntMember(*args, "b").value_or(0);
                return std::make_unique<JSONRPCResponse>(req.id, textContent(std::to_string(sum)));
            }
            if (name == "report") {
                return std::make_unique<JSONRPCResponse>(req.id, textContent(R"({"count":"many"})"));
            }
            if (slow) {
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
            }
            if (echoDelayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(echoDelayMs.load()));
            }
            if (echoProgress) {
                const JSONValue* meta = FindMember(*req.params, "_meta");
                const JSONValue* token = meta != nullptr ? FindMember(*meta, "progressToken") : nullptr;
                if (token != nullptr) {
                    JSONValue::Object progress;
                    SetMember(progress, "progressToken", DeepCopyJSON(*token));
                    SetMember(progress, "progress", JSONValue(int64_t(1)));
                    SetMember(progress, "total", JSONValue(2.0));
                    SetMember(progress, "message", JSONValue("halfway"));
                    provider.SendNotification(
                        std::make_unique<JSONRPCNotification>(Methods::Progress, JSONValue(std::move(progress)))).get();
                }
            }
            return std::make_unique<JSONRPCResponse>(req.id, textContent("echo"));
        }
        if (req.method == Methods::ListResources) {
            const bool secondPage = req.params.has_value() && GetStringMember(*req.params, "cursor").has_value();
            if (!secondPage) {
                return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(R"({"resources":[
                    {"uri":"file:///readme","name":"readme","mimeType":"text/plain"}],"nextCursor":"r2"})"));
            }
            return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(R"({"resources":[
                {"uri":"file:///notes"},{"name":"no-uri"}]})"));
        }
        if (req.method == Methods::ReadResource) {
            if (GetStringMember(*req.params, "uri").value_or("") != "file:///readme") {
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::ResourceNotFound, "Resource not found");
            }
            return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(R"({"contents":[
                {"uri":"file:///readme","mimeType":"text/plain","text":"hello"}]})"));
        }
        if (req.method == Methods::ListPrompts) {
            return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(R"({"prompts":[
                {"name":"review","description":"Review code",
                 "arguments":[{"name":"file","description":"File to review","required":true}]}]})"));
        }
        if (req.method == Methods::GetPrompt) {
            if (GetStringMember(*req.params, "name").value_or("") != "review") {
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::PromptNotFound, "Prompt not found");
            }
            const JSONValue* args = FindMember(*req.params, "arguments");
            const std::size_t argCount = args != nullptr && args->isObject()
                                             ? std::get<JSONValue::Object>(args->value).size() : 0;
            const std::string file = args != nullptr ? GetStringMember(*args, "file").value_or("?") : "?";
            JSONValue::Object text;
            SetMember(text, "type", JSONValue("text"));
            SetMember(text, "text", JSONValue("Review " + file + " (" + std::to_string(argCount) + " args)"));
            JSONValue::Object message;
            SetMember(message, "role", JSONValue("user"));
            SetMember(message, "content", JSONValue(std::move(text)));
            JSONValue::Array messages;
            messages.push_back(std::make_shared<JSONValue>(std::move(message)));
            JSONValue::Object result;
            SetMember(result, "description", JSONValue("Review code"));
            SetMember(result, "messages", JSONValue(std::move(messages)));
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue(std::move(result)));
        }
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found");
    }

    std::mutex m;
    std::vector<std::unique_ptr<InMemoryTransport>> servers;
    std::vector<std::unique_ptr<JSONRPCNotification>> received;
    std::atomic<int> inFlight{0};
};

class EventLog {
public:
    void operator()(const ProviderEvent& ev) {
        std::lock_guard<std::mutex> lk(mtx);
        events.push_back(ev);
        cv.notify_all();
    }

    bool waitFor(ProviderEventType type, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(mtx);
        return cv.wait_for(lk, timeout, [&] {
            for (const auto& e : events) {
                if (e.type == type) return true;
            }
            return false;
        });
    }

    std::optional<ProviderEvent> first(ProviderEventType type) {
        std::lock_guard<std::mutex> lk(mtx);
        for (const auto& e : events) {
            if (e.type == type) return e;
        }
        return std::nullopt;
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<ProviderEvent> events;
};

bool eventually(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

ProviderConfig fakeConfig(const std::string& name = "fake") {
    ProviderConfig cfg;
    cfg.name = name;
    cfg.transport.type = transport::TransportType::Stdio;
    cfg.transport.command = "unused";
    cfg.timeoutMs = 2000;
    cfg.initTimeoutMs = 2000;
    return cfg;
}

reconnect::ReconnectionStrategy fastRetries() {
    reconnect::ReconnectionStrategy s;
    s.maxRetries = 3;
    s.baseDelayMs = 10;
    s.maxDelayMs = 50;
    s.jitter = false;
    return s;
}

class ProviderManagerTest : public ::testing::Test {
protected:
    ProviderManagerOptions opts(bool reconnect) {
        ProviderManagerOptions o;
        o.reconnectEnabled = reconnect;
        o.healthChecksEnabled = false;
        o.clientInfo = Implementation("mcplink-tests", "0.0.1");
        return o;
    }

    std::unique_ptr<ProviderManager> makeManager(bool reconnect) {
        auto pm = std::make_unique<ProviderManager>(tools, factory, reconnection, opts(reconnect));
        pm->Subscribe([this](const ProviderEvent& ev) { log(ev); });
        return pm;
    }

    std::shared_ptr<FakeProviderFactory> factory = std::make_shared<FakeProviderFactory>();
    registry::ToolRegistry tools;
    reconnect::ReconnectionManager reconnection{fastRetries()};
    EventLog log;
};

} // namespace

TEST_F(ProviderManagerTest, ConnectRegistersQualifiedToolsAcrossPages) {
    auto pm = makeManager(false);
    auto r = pm->AddServer(fakeConfig()).get();
    ASSERT_TRUE(r.success) << r.error;

    EXPECT_TRUE(tools.HasTool("mcp__fake__echo"));
    EXPECT_TRUE(tools.HasTool("mcp__fake__add"));
    EXPECT_TRUE(tools.HasTool("mcp__fake__report"));
    EXPECT_EQ(pm->GetServerTools("fake").size(), 3u);
    EXPECT_EQ(tools.GetToolNamesBySource(registry::ToolSource::Provider).size(), 3u);

    auto def = tools.GetTool("mcp__fake__echo");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->definition.description, "Tool from fake server");

    auto status = pm->GetServerStatus("fake");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, ConnectionStatus::Connected);
    EXPECT_EQ(status->transportType, "stdio");
    EXPECT_EQ(status->toolCount, 3u);
    EXPECT_GT(status->connectedAtMs, 0);
    ASSERT_EQ(pm->GetServers().size(), 1u);

    auto added = log.first(ProviderEventType::ServerAdded);
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(added->toolCount, 3u);
    EXPECT_STREQ(added->name(), "server-added");

    // Connecting an already connected provider is a no-op.
    EXPECT_TRUE(pm->AddServer(fakeConfig()).get().success);
    EXPECT_EQ(factory->transportsCreated.load(), 1);
}

TEST_F(ProviderManagerTest, RegistryExecutesProviderTool) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    registry::ToolExecutionContext ctx;
    ctx.source = registry::ToolSource::Provider;
    auto fut = tools.ExecuteTool("mcp__fake__add", ParseJSON(R"({"a":2,"b":3})"), ctx);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto result = fut.get();
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output.value_or(""), "5");
    ASSERT_TRUE(result.data.has_value());
    EXPECT_NE(FindMember(*result.data, "content"), nullptr);
}

TEST_F(ProviderManagerTest, OutputSchemaMismatchIsReported) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    auto outcome = pm->CallTool("mcp__fake__report", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(outcome.success) << outcome.error;
    ASSERT_TRUE(outcome.schemaValidation.has_value());
    EXPECT_EQ(outcome.schemaValidation->status, validation::SchemaValidationStatus::Invalid);
    EXPECT_FALSE(outcome.schemaValidation->errors.empty());

    auto ev = log.first(ProviderEventType::SchemaValidationFailed);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->toolName, "mcp__fake__report");
    EXPECT_EQ(ev->serverName, "fake");

    auto unchecked = pm->CallTool("mcp__fake__report", JSONValue(JSONValue::Object{}), false).get();
    EXPECT_TRUE(unchecked.success);
    EXPECT_FALSE(unchecked.schemaValidation.has_value());
}

TEST_F(ProviderManagerTest, UnknownToolFails) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);
    auto outcome = pm->CallTool("mcp__fake__missing", JSONValue(JSONValue::Object{})).get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "Tool mcp__fake__missing not found");
}

TEST_F(ProviderManagerTest, RemoveUnregistersTools) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    auto r = pm->RemoveServer("fake").get();
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_FALSE(tools.HasTool("mcp__fake__echo"));
    EXPECT_FALSE(pm->GetServerStatus("fake").has_value());
    EXPECT_TRUE(pm->GetServers().empty());
    EXPECT_TRUE(log.waitFor(ProviderEventType::ServerRemoved));

    auto again = pm->RemoveServer("fake").get();
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.error, "Server fake not found");
}

TEST_F(ProviderManagerTest, FailedConnectIsRetriedUntilConnected) {
    factory->initFailures = 1;
    auto pm = makeManager(true);

    auto r = pm->AddServer(fakeConfig()).get();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("Initialization failed: boom"), std::string::npos) << r.error;
    auto failed = log.first(ProviderEventType::ServerError);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->serverName, "fake");

    ASSERT_TRUE(eventually([&] { return !pm->GetServers().empty(); }));
    EXPECT_TRUE(tools.HasTool("mcp__fake__echo"));
    auto status = pm->GetServerStatus("fake");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, ConnectionStatus::Connected);
    EXPECT_EQ(status->lastError.value_or(""), r.error);
    EXPECT_TRUE(eventually([&] { return !reconnection.IsReconnecting("fake"); }));
}

TEST_F(ProviderManagerTest, LostConnectionMarksProviderFailed) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    factory->CloseLatest();
    ASSERT_TRUE(eventually([&] {
        auto s = pm->GetServerStatus("fake");
        return s.has_value() && s->status == ConnectionStatus::Failed;
    }));
    EXPECT_FALSE(tools.HasTool("mcp__fake__echo"));
    ASSERT_TRUE(log.waitFor(ProviderEventType::ServerError));
    EXPECT_EQ(log.first(ProviderEventType::ServerError)->error, "Peer disconnected");

    auto summary = pm->GetConnectionSummary();
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.connected, 0u);
    EXPECT_EQ(summary.total, 1u);
}

TEST_F(ProviderManagerTest, HealthCheckFailureUnregistersTools) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);
    EXPECT_TRUE(pm->HealthCheck("fake").get().success);

    factory->failToolsList = true;
    auto r = pm->HealthCheck("fake").get();
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("tools unavailable"), std::string::npos) << r.error;
    ASSERT_TRUE(log.waitFor(ProviderEventType::ServerUnhealthy));
    EXPECT_FALSE(tools.HasTool("mcp__fake__add"));
    EXPECT_EQ(pm->GetServerStatus("fake")->status, ConnectionStatus::Failed);

    auto notConnected = pm->HealthCheck("fake").get();
    EXPECT_FALSE(notConnected.success);
    EXPECT_EQ(notConnected.error, "Server fake not connected");
}

TEST_F(ProviderManagerTest, ToolListChangedRefreshesRegistrations) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);
    EXPECT_FALSE(tools.HasTool("mcp__fake__extra"));

    factory->extraTool = true;
    factory->NotifyToolsChanged();
    EXPECT_TRUE(eventually([&] { return tools.HasTool("mcp__fake__extra"); }));
    EXPECT_EQ(pm->GetServerTools("fake").size(), 4u);
}

TEST_F(ProviderManagerTest, InvalidNameAndDisposedManagerAreRejected) {
    auto pm = makeManager(false);
    auto bad = pm->AddServer(fakeConfig("bad name")).get();
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.error, "Invalid server name: \"bad name\"");

    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);
    pm->Dispose();
    EXPECT_FALSE(tools.HasTool("mcp__fake__echo"));
    EXPECT_TRUE(pm->GetAllServerStatuses().empty());

    auto late = pm->AddServer(fakeConfig("other")).get();
    EXPECT_FALSE(late.success);
    EXPECT_EQ(late.error, "Provider manager is disposed");
    EXPECT_EQ(pm->CallTool("mcp__fake__echo", JSONValue(JSONValue::Object{})).get().error,
              "Provider manager is disposed");
}

TEST(ProviderManagerNames, QualifiedToolName) {
    EXPECT_EQ(ProviderManager::QualifiedToolName("files", "read"), "mcp__files__read");
}

TEST_F(ProviderManagerTest, CheckAllServersChecksEveryConnectedProvider) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig("one")).get().success);
    ASSERT_TRUE(pm->AddServer(fakeConfig("two")).get().success);
    EXPECT_EQ(pm->GetConnectionSummary().connected, 2u);

    factory->failToolsList = true;
    pm->CheckAllServers();
    auto summary = pm->GetConnectionSummary();
    EXPECT_EQ(summary.connected, 0u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_TRUE(tools.GetToolNamesBySource(registry::ToolSource::Provider).empty());
}

TEST_F(ProviderManagerTest, ShutdownRemovesEveryProvider) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig("one")).get().success);
    ASSERT_TRUE(pm->AddServer(fakeConfig("two")).get().success);

    auto r = pm->Shutdown().get();
    EXPECT_TRUE(r.success) << r.error;
    EXPECT_TRUE(pm->GetAllServerStatuses().empty());
    EXPECT_FALSE(tools.HasTool("mcp__one__echo"));
    EXPECT_FALSE(tools.HasTool("mcp__two__echo"));
}

TEST_F(ProviderManagerTest, SlowProviderDoesNotDelayOtherProvider) {
    auto pm = makeManager(false);
    auto slowCfg = fakeConfig("slow");
    slowCfg.transport.command = "slow";
    slowCfg.timeoutMs = 10000;
    ASSERT_TRUE(pm->AddServer(slowCfg).get().success);
    ASSERT_TRUE(pm->AddServer(fakeConfig("fast")).get().success);

    std::vector<std::future<ToolCallOutcome>> busy;
    for (int i = 0; i < 4; ++i) {
        busy.push_back(pm->CallTool("mcp__slow__echo", JSONValue(JSONValue::Object{})));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto start = std::chrono::steady_clock::now();
    auto fast = pm->CallTool("mcp__fast__add", ParseJSON(R"({"a":1,"b":2})")).get();
    EXPECT_TRUE(pm->HealthCheck("fast").get().success);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ASSERT_TRUE(fast.success) << fast.error;
    EXPECT_EQ(fast.result->content.size(), 1u);
    EXPECT_LT(elapsed.count(), 300) << "fast provider answered after " << elapsed.count() << " ms";

    for (auto& f : busy) {
        auto outcome = f.get();
        EXPECT_TRUE(outcome.success) << outcome.error;
    }
}

TEST_F(ProviderManagerTest, TimedOutCallIsCancelledAtProvider) {
    auto pm = makeManager(false);
    auto cfg = fakeConfig();
    cfg.timeoutMs = 100;
    ASSERT_TRUE(pm->AddServer(cfg).get().success);

    factory->echoDelayMs = 400;
    auto outcome = pm->CallTool("mcp__fake__echo", JSONValue(JSONValue::Object{})).get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "Tool call to mcp__fake__echo timed out after 100 ms");

    ASSERT_TRUE(eventually([&] { return factory->Cancelled().has_value(); }));
    JSONValue cancelled = *factory->Cancelled();
    EXPECT_EQ(GetStringMember(cancelled, "requestId").value_or("").rfind("pm-", 0), 0u);
    EXPECT_NE(GetStringMember(cancelled, "reason").value_or("").find("tools/call timed out"), std::string::npos);
    EXPECT_EQ(pm->GetServerStatus("fake")->status, ConnectionStatus::Connected);
}

TEST_F(ProviderManagerTest, ProgressNotificationsReachObservers) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    factory->echoProgress = true;
    auto outcome = pm->CallTool("mcp__fake__echo", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(outcome.success) << outcome.error;
    ASSERT_TRUE(log.waitFor(ProviderEventType::ToolProgress));
    auto ev = *log.first(ProviderEventType::ToolProgress);
    EXPECT_STREQ(ev.name(), "tool-progress");
    EXPECT_EQ(ev.serverName, "fake");
    EXPECT_EQ(ev.toolName, "mcp__fake__echo");
    EXPECT_DOUBLE_EQ(ev.progress, 1.0);
    ASSERT_TRUE(ev.total.has_value());
    EXPECT_DOUBLE_EQ(*ev.total, 2.0);
    EXPECT_EQ(ev.message, "halfway");
}

TEST_F(ProviderManagerTest, ListsAndReadsResources) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    auto listed = pm->ListResources("fake").get();
    ASSERT_TRUE(listed.success) << listed.error;
    ASSERT_EQ(listed.value.size(), 2u);
    EXPECT_EQ(listed.value[0].uri, "file:///readme");
    EXPECT_EQ(listed.value[0].name, "readme");
    EXPECT_EQ(listed.value[0].mimeType.value_or(""), "text/plain");
    EXPECT_EQ(listed.value[1].name, "file:///notes");

    auto read = pm->ReadResource("fake", "file:///readme").get();
    ASSERT_TRUE(read.success) << read.error;
    ASSERT_EQ(read.value.contents.size(), 1u);
    EXPECT_EQ(GetStringMember(read.value.contents[0], "text").value_or(""), "hello");

    auto missing = pm->ReadResource("fake", "file:///nope").get();
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.error.find("resources/read failed: Resource not found"), std::string::npos) << missing.error;

    EXPECT_EQ(pm->ListResources("ghost").get().error, "Server ghost not found");
}

TEST_F(ProviderManagerTest, ListsAndRendersPrompts) {
    auto pm = makeManager(false);
    ASSERT_TRUE(pm->AddServer(fakeConfig()).get().success);

    auto prompts = pm->ListPrompts("fake").get();
    ASSERT_TRUE(prompts.success) << prompts.error;
    ASSERT_EQ(prompts.value.size(), 1u);
    EXPECT_EQ(prompts.value[0].name, "review");
    ASSERT_EQ(prompts.value[0].arguments.size(), 1u);
    EXPECT_EQ(prompts.value[0].arguments[0].name, "file");
    EXPECT_TRUE(prompts.value[0].arguments[0].required);

    auto got = pm->GetPrompt("fake", "review", ParseJSON(R"({"file":"main.cpp","depth":3})")).get();
    ASSERT_TRUE(got.success) << got.error;
    EXPECT_EQ(got.value.description.value_or(""), "Review code");
    ASSERT_EQ(got.value.messages.size(), 1u);
    const JSONValue* content = FindMember(got.value.messages[0], "content");
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(GetStringMember(*content, "text").value_or(""), "Review main.cpp (1 args)");

    auto unknown = pm->GetPrompt("fake", "deploy", JSONValue(JSONValue::Object{})).get();
    EXPECT_FALSE(unknown.success);
    EXPECT_NE(unknown.error.find("Prompt not found"), std::string::npos);

    ASSERT_TRUE(pm->RemoveServer("fake").get().success);
    EXPECT_EQ(pm->ListPrompts("fake").get().error, "Server fake not found");
}
