//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderManager.cpp
// Purpose: Connects tool providers, registers their tools, detects failures and drives reconnection
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/errors/ErrorRemediation.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/invariants/Invariants.h"
#include "mcplink/provider/ProviderManager.h"
#include "mcplink/sync/KeyedMutex.h"
#include "mcplink/version.h"

namespace mcplink {
namespace provider {

namespace net = boost::asio;

namespace {

constexpr uint64_t kDefaultHealthCheckIntervalMs = 60000;
constexpr int kMaxPages = 100;
constexpr auto kCloseWait = std::chrono::seconds(5);
constexpr auto kCancelFlushWait = std::chrono::milliseconds(500);

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

template <typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

std::string joinText(const std::vector<JSONValue>& content) {
    std::string out;
    for (const auto& item : content) {
        if (GetStringMember(item, "type").value_or("") != "text") {
            continue;
        }
        if (auto text = GetStringMember(item, "text")) {
            if (!out.empty()) {
                out += "\n";
            }
            out += *text;
        }
    }
    return out;
}

JSONValue validationToJSON(const validation::SchemaValidationResult& v) {
    JSONValue::Object obj;
    SetMember(obj, "status", JSONValue(validation::toString(v.status)));
    JSONValue::Array errs;
    for (const auto& e : v.errors) {
        errs.push_back(std::make_shared<JSONValue>(e));
    }
    SetMember(obj, "errors", JSONValue(std::move(errs)));
    return JSONValue(std::move(obj));
}

// Adapts a provider tool call into the registry's result shape.
registry::ToolExecutionResult toExecutionResult(const ToolCallOutcome& outcome) {
    registry::ToolExecutionResult out;
    if (!outcome.success || !outcome.result.has_value()) {
        out.success = false;
        out.error = outcome.error.empty() ? std::string("Tool call failed") : outcome.error;
        return out;
    }
    const CallToolResult& r = *outcome.result;
    const std::string text = joinText(r.content);

    JSONValue::Object data;
    JSONValue::Array content;
    for (const auto& item : r.content) {
        content.push_back(std::make_shared<JSONValue>(DeepCopyJSON(item)));
    }
    SetMember(data, "content", JSONValue(std::move(content)));
    if (r.structuredContent.has_value()) {
        SetMember(data, "structuredContent", DeepCopyJSON(*r.structuredContent));
    }
    SetMember(data, "isError", JSONValue(r.isError));
    if (outcome.schemaValidation.has_value()) {
        SetMember(data, "schemaValidation", validationToJSON(*outcome.schemaValidation));
    }
    out.data = JSONValue(std::move(data));
    out.output = text;
    if (r.isError) {
        out.success = false;
        out.error = text.empty() ? std::string("Tool reported an error") : text;
    } else {
        out.success = true;
    }
    return out;
}

std::optional<double> numberMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (m == nullptr) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(m->value)) {
        return static_cast<double>(std::get<int64_t>(m->value));
    }
    if (std::holds_alternative<double>(m->value)) {
        return std::get<double>(m->value);
    }
    return std::nullopt;
}

bool isTransportTimeout(const JSONRPCResponse& resp) {
    return resp.error.has_value() && GetStringMember(*resp.error, "message").value_or("") == "Request timeout";
}

std::string notFound(const std::string& serverName) {
    return "Server " + serverName + " not found";
}

// Records the most recent transport error seen while a connection is being established.
class ErrorSlot {
public:
    void Set(const std::string& e) {
        std::lock_guard<std::mutex> lock(m);
        error = e;
    }
    std::optional<std::string> Get() const {
        std::lock_guard<std::mutex> lock(m);
        return error;
    }

private:
    mutable std::mutex m;
    std::optional<std::string> error;
};

} // namespace

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Idle: return "idle";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Disconnecting: return "disconnecting";
        case ConnectionStatus::Failed:
        default: return "failed";
    }
}

const char* ProviderEvent::name() const {
    switch (type) {
        case ProviderEventType::ServerAdded: return "server-added";
        case ProviderEventType::ServerRemoved: return "server-removed";
        case ProviderEventType::ServerError: return "server-error";
        case ProviderEventType::ServerUnhealthy: return "server-unhealthy";
        case ProviderEventType::ToolProgress: return "tool-progress";
        case ProviderEventType::SchemaValidationFailed:
        default: return "schema-validation-failed";
    }
}

//////////////////////////////////////////// Impl ////////////////////////////////////////////
class ProviderManager::Impl : public std::enable_shared_from_this<Impl> {
public:
    struct ServerEntry {
        ProviderConfig config;
        ConnectionStatus status{ConnectionStatus::Idle};
        std::shared_ptr<transport::ITransport> transport;
        std::map<std::string, Tool> tools;  // registered name -> provider's tool
        std::optional<std::string> lastError;
        int64_t lastErrorAtMs{0};
        int64_t connectedAtMs{0};
        uint64_t generation{0};
    };

    registry::ToolRegistry& toolRegistry;
    std::shared_ptr<transport::ITransportFactory> factory;
    reconnect::ReconnectionManager& reconnection;
    ProviderManagerOptions options;
    Implementation clientInfo;
    uint64_t healthIntervalMs{kDefaultHealthCheckIntervalMs};

    sync::KeyedMutex serverLocks;
    validation::OutputSchemaValidator validator;
    net::thread_pool pool;
    std::mutex poolMutex;
    bool poolOpen{true};
    std::map<std::string, std::shared_ptr<net::thread_pool>> lanes;  // one single-threaded worker per provider

    mutable std::mutex stateMutex;
    std::map<std::string, ServerEntry> servers;
    std::map<std::string, std::string> toolOwners;  // registered tool name -> server
    std::map<std::string, std::string> progressTokens;  // in-flight tools/call id -> registered tool name
    std::atomic<uint64_t> requestCounter{0};

    std::mutex observerMutex;
    std::map<uint64_t, Observer> observers;
    uint64_t nextObserverId{1};

    std::atomic<bool> disposed{false};
    std::atomic<bool> healthCheckInFlight{false};
    std::mutex healthMutex;
    std::condition_variable_any healthCv;
    std::jthread healthThread;

    Impl(registry::ToolRegistry& reg, std::shared_ptr<transport::ITransportFactory> f,
         reconnect::ReconnectionManager& rm, const ProviderManagerOptions& opts)
        : toolRegistry(reg), factory(std::move(f)), reconnection(rm), options(opts),
          clientInfo(opts.clientInfo.value_or(clientImplementation())),
          pool(opts.workerThreads > 0 ? opts.workerThreads : 1) {
        healthIntervalMs = options.healthCheckIntervalMs > 0
                               ? options.healthCheckIntervalMs
                               : GetEnvUInt64OrDefault("MCPLINK_HEALTH_CHECK_INTERVAL_MS", kDefaultHealthCheckIntervalMs);
        if (healthIntervalMs == 0) {
            healthIntervalMs = kDefaultHealthCheckIntervalMs;
        }
    }

    void startHealthChecks() {
        if (!options.healthChecksEnabled) {
            return;
        }
        healthThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(healthMutex);
            while (!st.stop_requested()) {
                healthCv.wait_for(lock, st, std::chrono::milliseconds(healthIntervalMs), [] { return false; });
                if (st.stop_requested()) {
                    break;
                }
                lock.unlock();
                checkAll();
                lock.lock();
            }
        });
    }

    void stopHealthChecks() {
        if (!healthThread.joinable()) {
            return;
        }
        healthThread.request_stop();
        healthCv.notify_all();
        if (healthThread.get_id() == std::this_thread::get_id()) {
            healthThread.detach();
        } else {
            healthThread.join();
        }
    }

    ////////////////////////////////////////// Worker pool //////////////////////////////////////////
    // Caller holds poolMutex. Work for one provider runs on its own thread, in submission order.
    net::thread_pool& laneLocked(const std::string& name) {
        if (name.empty()) {
            return pool;
        }
        auto& lane = lanes[name];
        if (!lane) {
            lane = std::make_shared<net::thread_pool>(1);
        }
        return *lane;
    }

    // Runs fn on the provider's lane ("" selects the shared pool), or inline once the pools are closed.
    template <typename Fn>
    auto submit(const std::string& lane, Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(poolMutex);
            if (poolOpen) {
                net::post(laneLocked(lane), [task]() { (*task)(); });
                return fut;
            }
        }
        (*task)();
        return fut;
    }

    // Internal follow-up work for one provider; dropped when the manager is already gone.
    template <typename Fn>
    void postTo(const std::string& lane, Fn fn) {
        std::weak_ptr<Impl> weak = weak_from_this();
        std::lock_guard<std::mutex> lock(poolMutex);
        if (!poolOpen) {
            return;
        }
        net::post(laneLocked(lane), [weak, fn = std::move(fn)]() mutable {
            if (auto self = weak.lock()) {
                fn(*self);
            }
        });
    }

    void closePool() {
        std::map<std::string, std::shared_ptr<net::thread_pool>> closing;
        {
            std::lock_guard<std::mutex> lock(poolMutex);
            poolOpen = false;
            closing.swap(lanes);
        }
        for (auto& kv : closing) {
            kv.second->join();
        }
        pool.join();
    }

    std::string serverOfTool(const std::string& toolName) const {
        std::lock_guard<std::mutex> lock(stateMutex);
        auto it = toolOwners.find(toolName);
        return it == toolOwners.end() ? std::string() : it->second;
    }

    ////////////////////////////////////////// Events //////////////////////////////////////////
    void emit(const ProviderEvent& ev) {
        std::vector<Observer> copy;
        {
            std::lock_guard<std::mutex> lock(observerMutex);
            copy.reserve(observers.size());
            for (const auto& kv : observers) {
                copy.push_back(kv.second);
            }
        }
        for (const auto& obs : copy) {
            try {
                obs(ev);
            } catch (const std::exception& e) {
                LOG_WARN("ProviderManager: observer threw on {}: {}", ev.name(), e.what());
            }
        }
    }

    void emitAll(const std::vector<ProviderEvent>& events) {
        for (const auto& ev : events) {
            emit(ev);
        }
    }

    ////////////////////////////////////////// Helpers //////////////////////////////////////////
    static void closeTransport(const std::shared_ptr<transport::ITransport>& t) {
        if (!t) {
            return;
        }
        auto done = t->Close();
        if (done.wait_for(kCloseWait) != std::future_status::ready) {
            LOG_WARN("ProviderManager: transport close did not complete within {} s",
                     std::chrono::duration_cast<std::chrono::seconds>(kCloseWait).count());
        }
    }

    void unregisterTools(const std::vector<std::string>& names) {
        for (const auto& n : names) {
            toolRegistry.UnregisterTool(n);
        }
    }

    // Caller holds stateMutex.
    std::vector<std::string> detachToolsLocked(ServerEntry& entry) {
        std::vector<std::string> names;
        for (const auto& kv : entry.tools) {
            names.push_back(kv.first);
            auto owner = toolOwners.find(kv.first);
            if (owner != toolOwners.end() && owner->second == entry.config.name) {
                toolOwners.erase(owner);
            }
        }
        entry.tools.clear();
        return names;
    }

    void installHandlers(const std::shared_ptr<transport::ITransport>& t, const std::string& name, uint64_t gen,
                         const std::shared_ptr<ErrorSlot>& slot) {
        std::weak_ptr<Impl> weak = weak_from_this();
        t->SetErrorHandler([weak, name, gen, slot](const std::string& error) {
            slot->Set(error);
            if (auto self = weak.lock()) {
                self->onTransportError(name, gen, error);
            }
        });
        t->SetRequestHandler([](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
            if (req.method == Methods::Ping) {
                return std::make_unique<JSONRPCResponse>(req.id, JSONValue(JSONValue::Object{}));
            }
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        });
        t->SetNotificationHandler([weak, name, gen](std::unique_ptr<JSONRPCNotification> n) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (n->method == Methods::ToolListChanged) {
                self->postTo(name, [name, gen](Impl& impl) { impl.refreshTools(name, gen); });
            } else if (n->method == Methods::Progress) {
                self->onProgress(name, *n);
            } else {
                LOG_DEBUG("Provider '{}' sent {}", name, n->method);
            }
        });
    }

    // notifications/progress for a tools/call this manager sent with a progressToken.
    void onProgress(const std::string& name, const JSONRPCNotification& n) {
        if (!n.params.has_value()) {
            return;
        }
        const JSONValue* token = FindMember(*n.params, "progressToken");
        if (token == nullptr) {
            return;
        }
        std::string key;
        if (token->isString()) {
            key = std::get<std::string>(token->value);
        } else if (std::holds_alternative<int64_t>(token->value)) {
            key = std::to_string(std::get<int64_t>(token->value));
        }
        ProviderEvent ev;
        ev.type = ProviderEventType::ToolProgress;
        ev.serverName = name;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = progressTokens.find(key);
            if (it == progressTokens.end()) {
                LOG_DEBUG("Provider '{}': progress for unknown token '{}'", name, key);
                return;
            }
            ev.toolName = it->second;
        }
        ev.progress = numberMember(*n.params, "progress").value_or(0.0);
        ev.total = numberMember(*n.params, "total");
        ev.message = GetStringMember(*n.params, "message").value_or("");
        emit(ev);
    }

    void onTransportError(const std::string& name, uint64_t gen, const std::string& error) {
        if (disposed) {
            return;
        }
        std::shared_ptr<transport::ITransport> t;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = servers.find(name);
            if (it == servers.end() || it->second.generation != gen ||
                it->second.status != ConnectionStatus::Connected) {
                return;
            }
            t = it->second.transport;
        }
        if (t && t->IsConnected()) {
            LOG_WARN("Provider '{}' reported: {}", name, error);
            return;
        }
        postTo(name, [name, gen, error](Impl& impl) { impl.handleConnectionLost(name, gen, error); });
    }

    ////////////////////////////////////////// Requests //////////////////////////////////////////
    struct Exchange {
        std::unique_ptr<JSONRPCResponse> response;
        bool timedOut{false};
    };

    std::string nextRequestId() { return "pm-" + std::to_string(++requestCounter); }

    void cancelRequest(transport::ITransport& t, const std::string& id, const std::string& reason) {
        JSONValue::Object params;
        SetMember(params, "requestId", JSONValue(id));
        SetMember(params, "reason", JSONValue(reason));
        auto sent = t.SendNotification(
            std::make_unique<JSONRPCNotification>(Methods::Cancelled, JSONValue(std::move(params))));
        if (sent.wait_for(kCancelFlushWait) != std::future_status::ready) {
            LOG_DEBUG("notifications/cancelled for {} was not flushed in time", id);
        }
    }

    // Sends one request and waits up to timeoutMs. When the wait or the transport deadline runs out the
    // provider is told with notifications/cancelled.
    Exchange exchange(transport::ITransport& t, const std::string& id, const char* method,
                      std::optional<JSONValue> params, uint64_t timeoutMs) {
        Exchange ex;
        auto fut = t.SendRequest(std::make_unique<JSONRPCRequest>(id, method, std::move(params)));
        if (fut.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
            ex.timedOut = true;
            cancelRequest(t, id, std::string(method) + " timed out after " + std::to_string(timeoutMs) + " ms");
            return ex;
        }
        ex.response = fut.get();
        if (ex.response && isTransportTimeout(*ex.response)) {
            cancelRequest(t, id, std::string(method) + " timed out");
        }
        return ex;
    }

    // One request whose result object is copied into result; returns the error text on failure.
    std::optional<std::string> requestResult(transport::ITransport& t, const char* method,
                                             std::optional<JSONValue> params, uint64_t timeoutMs,
                                             JSONValue& result) {
        Exchange ex = exchange(t, nextRequestId(), method, std::move(params), timeoutMs);
        if (ex.timedOut) {
            return std::string(method) + " timed out after " + std::to_string(timeoutMs) + " ms";
        }
        if (!ex.response) {
            return std::string(method) + " failed: empty response";
        }
        if (ex.response->IsError()) {
            return std::string(method) + " failed: " + errors::describeResponseError(*ex.response);
        }
        if (!ex.response->result.has_value()) {
            return std::string(method) + " failed: missing result";
        }
        result = std::move(*ex.response->result);
        return std::nullopt;
    }

    // Follows nextCursor until the provider stops paging; onPage consumes one result and returns its cursor.
    std::optional<std::string> pageThrough(transport::ITransport& t, const char* method, uint64_t timeoutMs,
                                           const std::string& name,
                                           const std::function<std::optional<std::string>(const JSONValue&)>& onPage) {
        std::optional<std::string> cursor;
        for (int page = 0; page < kMaxPages; ++page) {
            std::optional<JSONValue> params;
            if (cursor.has_value()) {
                JSONValue::Object p;
                SetMember(p, "cursor", JSONValue(*cursor));
                params = JSONValue(std::move(p));
            }
            JSONValue result;
            if (auto err = requestResult(t, method, std::move(params), timeoutMs, result)) {
                return err;
            }
            cursor = onPage(result);
            if (!cursor.has_value() || cursor->empty()) {
                return std::nullopt;
            }
        }
        LOG_WARN("Provider '{}': {} paging stopped after {} pages", name, method, kMaxPages);
        return std::nullopt;
    }

    ////////////////////////////////////////// Handshake //////////////////////////////////////////
    std::optional<std::string> initialize(transport::ITransport& t, const ProviderConfig& config) {
        JSONValue::Object info;
        SetMember(info, "name", JSONValue(clientInfo.name));
        SetMember(info, "version", JSONValue(clientInfo.version));
        JSONValue::Object params;
        SetMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
        SetMember(params, "capabilities", JSONValue(JSONValue::Object{}));
        SetMember(params, "clientInfo", JSONValue(std::move(info)));

        Exchange ex = exchange(t, nextRequestId(), Methods::Initialize, JSONValue(std::move(params)),
                               config.initTimeoutMs);
        if (ex.timedOut) {
            return "Initialization timed out after " + std::to_string(config.initTimeoutMs) + " ms";
        }
        auto resp = std::move(ex.response);
        if (!resp) {
            return std::string("Initialization failed: empty response");
        }
        if (resp->IsError()) {
            return "Initialization failed: " + errors::describeResponseError(*resp);
        }
        if (!resp->result.has_value() || !resp->result->isObject()) {
            return std::string("Initialization failed: malformed result");
        }
        std::string serverName = "unknown";
        if (const JSONValue* serverInfo = FindMember(*resp->result, "serverInfo")) {
            serverName = GetStringMember(*serverInfo, "name").value_or(serverName);
        }
        LOG_INFO("Provider '{}' initialized (server {}, protocol {})", config.name, serverName,
                 GetStringMember(*resp->result, "protocolVersion").value_or("?"));

        auto note = t.SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
        if (note.wait_for(std::chrono::milliseconds(config.initTimeoutMs)) != std::future_status::ready) {
            LOG_WARN("Provider '{}': notifications/initialized was not flushed in time", config.name);
        }
        return std::nullopt;
    }

    std::optional<std::string> listTools(transport::ITransport& t, uint64_t timeoutMs, std::vector<Tool>& out,
                                         const std::string& name) {
        return pageThrough(t, Methods::ListTools, timeoutMs, name, [&out](const JSONValue& result) {
            ToolsListResult listed = ParseToolsListResult(result);
            for (auto& tool : listed.tools) {
                out.push_back(std::move(tool));
            }
            return listed.nextCursor;
        });
    }

    registry::ToolExecutor makeExecutor(const std::string& qualified) {
        std::weak_ptr<Impl> weak = weak_from_this();
        return [weak, qualified](const JSONValue& args,
                                 const registry::ToolExecutionContext&) -> std::future<registry::ToolExecutionResult> {
            auto self = weak.lock();
            if (!self) {
                registry::ToolExecutionResult gone;
                gone.error = "Provider manager is no longer available";
                return readyFuture(std::move(gone));
            }
            return self->submit(self->serverOfTool(qualified), [self, qualified, args]() {
                return toExecutionResult(self->callTool(qualified, args, true));
            });
        };
    }

    // Registers the tools under their qualified names; returns the ones that were accepted.
    std::map<std::string, Tool> registerTools(const std::string& name, std::vector<Tool>& tools) {
        std::map<std::string, Tool> registered;
        for (auto& tool : tools) {
            const std::string qualified = ProviderManager::QualifiedToolName(name, tool.name);
            registry::ToolDefinition def;
            def.name = qualified;
            def.description = tool.description.empty() ? "Tool from " + name + " server" : tool.description;
            def.inputSchema = tool.inputSchema.isObject() ? DeepCopyJSON(tool.inputSchema)
                                                          : JSONValue(JSONValue::Object{});
            if (tool.outputSchema.has_value()) {
                def.outputSchema = DeepCopyJSON(*tool.outputSchema);
            }
            registry::ToolRegistrationOptions opts;
            opts.allowOverwrite = true;
            opts.tags = {"mcp", name};
            try {
                toolRegistry.RegisterTool(registry::ToolSource::Provider, def, makeExecutor(qualified), opts);
                registered[qualified] = std::move(tool);
            } catch (const registry::ToolRegistrationError& e) {
                LOG_WARN("Provider '{}': skipping tool '{}': {}", name, qualified, e.what());
            }
        }
        return registered;
    }

    ////////////////////////////////////////// Connect //////////////////////////////////////////
    ProviderResult connect(const ProviderConfig& config, bool fromReconnect) {
        FUNC_SCOPE();
        if (disposed) {
            return {false, "Provider manager is disposed"};
        }
        if (!invariants::IsValidServerName(config.name)) {
            return {false, "Invalid server name: \"" + config.name + "\""};
        }

        std::vector<ProviderEvent> events;
        bool retry = false;
        bool connected = false;
        ProviderResult result;
        {
            auto handle = serverLocks.Acquire(config.name, "connect:" + config.name);
            result = connectLocked(config, fromReconnect, events, retry, connected);
        }
        if (connected && !fromReconnect) {
            auto state = reconnection.GetState(config.name);
            if (state.has_value() && state->status == reconnect::ReconnectionStatus::Exhausted) {
                reconnection.CancelReconnection(config.name);
            }
        }
        emitAll(events);
        if (retry && !fromReconnect) {
            scheduleReconnection(config);
        }
        return result;
    }

    // Caller holds the provider's keyed lock.
    ProviderResult connectLocked(const ProviderConfig& config, bool fromReconnect, std::vector<ProviderEvent>& events,
                                 bool& retry, bool& connected) {
        if (fromReconnect && !reconnection.GetState(config.name).has_value()) {
            return {false, "Reconnection cancelled"};
        }
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            ServerEntry& entry = servers[config.name];
            if (entry.status == ConnectionStatus::Connected) {
                connected = true;
                return {true, ""};
            }
            entry.config = config;
            entry.status = ConnectionStatus::Connecting;
            gen = ++entry.generation;
        }
        LOG_INFO("Connecting to provider '{}' over {}", config.name, transport::toString(config.transport.type));

        std::shared_ptr<transport::ITransport> t(factory->CreateTransport(config.transport));
        if (!t) {
            return failConnect(config, gen, nullptr,
                               std::string("No transport available for type ") +
                                   transport::toString(config.transport.type),
                               events, retry);
        }
        auto slot = std::make_shared<ErrorSlot>();
        installHandlers(t, config.name, gen, slot);

        auto started = t->Start();
        if (started.wait_for(std::chrono::milliseconds(config.initTimeoutMs)) != std::future_status::ready) {
            return failConnect(config, gen, t,
                               "Transport start timed out after " + std::to_string(config.initTimeoutMs) + " ms",
                               events, retry);
        }
        if (!t->IsConnected()) {
            return failConnect(config, gen, t, slot->Get().value_or("Transport failed to start"), events, retry);
        }
        if (auto err = initialize(*t, config)) {
            return failConnect(config, gen, t, *err, events, retry);
        }
        std::vector<Tool> tools;
        if (auto err = listTools(*t, config.timeoutMs, tools, config.name)) {
            return failConnect(config, gen, t, *err, events, retry);
        }

        std::map<std::string, Tool> registered = registerTools(config.name, tools);
        const std::size_t count = registered.size();
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            ServerEntry& entry = servers[config.name];
            for (const auto& kv : registered) {
                toolOwners[kv.first] = config.name;
            }
            entry.tools = std::move(registered);
            entry.transport = t;
            entry.status = ConnectionStatus::Connected;
            entry.connectedAtMs = nowEpochMs();
        }
        LOG_INFO("Provider '{}' connected with {} tools", config.name, count);
        connected = true;

        ProviderEvent ev;
        ev.type = ProviderEventType::ServerAdded;
        ev.serverName = config.name;
        ev.toolCount = count;
        events.push_back(std::move(ev));
        return {true, ""};
    }

    ProviderResult failConnect(const ProviderConfig& config, uint64_t gen,
                               const std::shared_ptr<transport::ITransport>& t, const std::string& error,
                               std::vector<ProviderEvent>& events, bool& retry) {
        closeTransport(t);
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = servers.find(config.name);
            if (it != servers.end() && it->second.generation == gen) {
                it->second.status = ConnectionStatus::Failed;
                it->second.lastError = error;
                it->second.lastErrorAtMs = nowEpochMs();
                it->second.transport.reset();
            }
        }
        LOG_ERROR("{}", errors::FormatConnectionError(config.name, error, std::nullopt,
                                                      std::string(transport::toString(config.transport.type))));
        ProviderEvent ev;
        ev.type = ProviderEventType::ServerError;
        ev.serverName = config.name;
        ev.error = error;
        events.push_back(std::move(ev));
        retry = options.reconnectEnabled && !disposed;
        return {false, error};
    }

    void scheduleReconnection(const ProviderConfig& config) {
        if (!options.reconnectEnabled || disposed) {
            return;
        }
        std::weak_ptr<Impl> weak = weak_from_this();
        const std::string name = config.name;
        auto state = reconnection.ScheduleReconnection(
            name, ToJSON(config), [weak, name](const JSONValue& cfgJson) -> std::future<void> {
                auto self = weak.lock();
                if (!self || self->disposed) {
                    throw std::runtime_error("Provider manager is disposed");
                }
                ProviderConfig cfg = ParseProviderConfig(name, cfgJson);
                return self->submit(cfg.name, [self, cfg]() {
                    ProviderResult r = self->connect(cfg, true);
                    if (!r.success) {
                        throw std::runtime_error(r.error);
                    }
                });
            });
        LOG_DEBUG("Provider '{}': reconnection {} (attempts so far {})", name, reconnect::toString(state.status),
                  state.attempts);
    }

    ////////////////////////////////////////// Failure handling //////////////////////////////////////////
    // Caller holds the provider's keyed lock. Returns the config when the provider was marked failed.
    std::optional<ProviderConfig> markFailedLocked(const std::string& name, uint64_t gen, const std::string& error,
                                                   ProviderEventType type, std::vector<ProviderEvent>& events) {
        std::shared_ptr<transport::ITransport> t;
        std::vector<std::string> toolNames;
        ProviderConfig config;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = servers.find(name);
            if (it == servers.end() || it->second.generation != gen ||
                it->second.status != ConnectionStatus::Connected) {
                return std::nullopt;
            }
            ServerEntry& entry = it->second;
            entry.status = ConnectionStatus::Failed;
            entry.lastError = error;
            entry.lastErrorAtMs = nowEpochMs();
            t = std::move(entry.transport);
            toolNames = detachToolsLocked(entry);
            config = entry.config;
        }
        unregisterTools(toolNames);
        closeTransport(t);
        LOG_ERROR("{}", errors::FormatConnectionError(name, error, std::nullopt,
                                                      std::string(transport::toString(config.transport.type))));
        ProviderEvent ev;
        ev.type = type;
        ev.serverName = name;
        ev.error = error;
        events.push_back(std::move(ev));
        return config;
    }

    void handleConnectionLost(const std::string& name, uint64_t gen, const std::string& error) {
        std::vector<ProviderEvent> events;
        std::optional<ProviderConfig> failed;
        {
            auto handle = serverLocks.Acquire(name, "connection-lost:" + name);
            failed = markFailedLocked(name, gen, error, ProviderEventType::ServerError, events);
        }
        emitAll(events);
        if (failed.has_value()) {
            scheduleReconnection(*failed);
        }
    }

    // Re-lists the tools after notifications/tools/list_changed.
    void refreshTools(const std::string& name, uint64_t gen) {
        if (disposed) {
            return;
        }
        auto handle = serverLocks.Acquire(name, "refresh:" + name);
        std::shared_ptr<transport::ITransport> t;
        uint64_t timeoutMs = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = servers.find(name);
            if (it == servers.end() || it->second.generation != gen ||
                it->second.status != ConnectionStatus::Connected) {
                return;
            }
            t = it->second.transport;
            timeoutMs = it->second.config.timeoutMs;
        }
        std::vector<Tool> tools;
        if (auto err = listTools(*t, timeoutMs, tools, name)) {
            LOG_WARN("Provider '{}': tool refresh failed: {}", name, *err);
            return;
        }
        std::map<std::string, Tool> registered = registerTools(name, tools);
        std::vector<std::string> stale;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto it = servers.find(name);
            if (it == servers.end()) {
                return;
            }
            for (const auto& kv : it->second.tools) {
                if (registered.find(kv.first) == registered.end()) {
                    stale.push_back(kv.first);
                    toolOwners.erase(kv.first);
                }
            }
            for (const auto& kv : registered) {
                toolOwners[kv.first] = name;
            }
            it->second.tools = std::move(registered);
        }
        unregisterTools(stale);
        LOG_INFO("Provider '{}': tool list refreshed", name);
    }

    ////////////////////////////////////////// Remove //////////////////////////////////////////
    ProviderResult remove(const std::string& name) {
        FUNC_SCOPE();
        if (disposed) {
            return {false, "Provider manager is disposed"};
        }
        reconnection.CancelReconnection(name);

        std::vector<std::string> toolNames;
        std::shared_ptr<transport::ITransport> t;
        {
            auto handle = serverLocks.Acquire(name, "remove:" + name);
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                auto it = servers.find(name);
                if (it == servers.end()) {
                    return {false, notFound(name)};
                }
                ServerEntry& entry = it->second;
                if (entry.status == ConnectionStatus::Connecting) {
                    return {false, "Server " + name + " is still connecting"};
                }
                if (entry.status == ConnectionStatus::Disconnecting) {
                    return {false, "Server " + name + " is already disconnecting"};
                }
                entry.status = ConnectionStatus::Disconnecting;
                t = std::move(entry.transport);
                toolNames = detachToolsLocked(entry);
            }
            unregisterTools(toolNames);
            closeTransport(t);
            std::lock_guard<std::mutex> lock(stateMutex);
            servers.erase(name);
        }
        LOG_INFO("Provider '{}' removed ({} tools unregistered)", name, toolNames.size());
        ProviderEvent ev;
        ev.type = ProviderEventType::ServerRemoved;
        ev.serverName = name;
        emit(ev);
        return {true, ""};
    }

    ProviderResult shutdown() {
        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            for (const auto& kv : servers) {
                names.push_back(kv.first);
            }
        }
        std::string failures;
        for (const auto& name : names) {
            ProviderResult r = remove(name);
            if (!r.success) {
                if (!failures.empty()) {
                    failures += "; ";
                }
                failures += "Failed to remove " + name + ": " + r.error;
            }
        }
        return {failures.empty(), failures};
    }

    ////////////////////////////////////////// Tool calls //////////////////////////////////////////
    ToolCallOutcome callTool(const std::string& toolName, const JSONValue& args, bool validateOutput) {
        ToolCallOutcome outcome;
        if (disposed) {
            outcome.error = "Provider manager is disposed";
            return outcome;
        }
        std::string server;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            auto owner = toolOwners.find(toolName);
            if (owner == toolOwners.end()) {
                outcome.error = "Tool " + toolName + " not found";
                return outcome;
            }
            server = owner->second;
        }

        std::vector<ProviderEvent> events;
        std::optional<std::string> lostError;
        uint64_t gen = 0;
        {
            auto handle = serverLocks.Acquire(server, "call:" + toolName);
            std::shared_ptr<transport::ITransport> t;
            Tool tool;
            uint64_t timeoutMs = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                auto it = servers.find(server);
                if (it == servers.end()) {
                    outcome.error = notFound(server);
                    return outcome;
                }
                if (it->second.status != ConnectionStatus::Connected) {
                    outcome.error = "Server " + server + " not connected (status: " + toString(it->second.status) + ")";
                    return outcome;
                }
                auto toolIt = it->second.tools.find(toolName);
                if (toolIt == it->second.tools.end()) {
                    outcome.error = "Tool " + toolName + " not found";
                    return outcome;
                }
                t = it->second.transport;
                tool = toolIt->second;
                timeoutMs = it->second.config.timeoutMs;
                gen = it->second.generation;
            }

            const std::string requestId = nextRequestId();
            JSONValue::Object meta;
            SetMember(meta, "progressToken", JSONValue(requestId));
            JSONValue::Object params;
            SetMember(params, "name", JSONValue(tool.name));
            SetMember(params, "arguments", args.isObject() ? DeepCopyJSON(args) : JSONValue(JSONValue::Object{}));
            SetMember(params, "_meta", JSONValue(std::move(meta)));
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                progressTokens[requestId] = toolName;
            }
            Exchange ex = exchange(*t, requestId, Methods::CallTool, JSONValue(std::move(params)), timeoutMs);
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                progressTokens.erase(requestId);
            }
            if (ex.timedOut) {
                outcome.error = "Tool call to " + toolName + " timed out after " + std::to_string(timeoutMs) + " ms";
                return outcome;
            }
            auto resp = std::move(ex.response);
            if (!resp) {
                outcome.error = "Empty response from " + server;
                return outcome;
            }
            if (resp->IsError()) {
                const std::string described = errors::describeResponseError(*resp);
                if (!t->IsConnected()) {
                    outcome.error = "Server " + server +
                                    " was disconnected during tool execution. Original error: " + described;
                    lostError = described;
                } else {
                    outcome.error = described;
                }
            } else {
                std::optional<CallToolResult> parsed;
                if (resp->result.has_value()) {
                    parsed = ParseCallToolResult(*resp->result);
                }
                if (!parsed.has_value()) {
                    outcome.error = "Malformed tools/call result from " + server;
                } else {
                    outcome.success = true;
                    if (validateOutput && tool.outputSchema.has_value() && !parsed->isError) {
                        auto v = validator.ValidateContent(tool.outputSchema, parsed->content);
                        if (v.status == validation::SchemaValidationStatus::Invalid) {
                            LOG_WARN("Tool {} output failed schema validation ({} errors)", toolName, v.errors.size());
                            ProviderEvent ev;
                            ev.type = ProviderEventType::SchemaValidationFailed;
                            ev.serverName = server;
                            ev.toolName = toolName;
                            ev.errors = v.errors;
                            events.push_back(std::move(ev));
                        }
                        outcome.schemaValidation = std::move(v);
                    }
                    outcome.result = std::move(parsed);
                }
            }
        }
        emitAll(events);
        if (lostError.has_value()) {
            const std::string err = *lostError;
            postTo(server, [server, gen, err](Impl& impl) { impl.handleConnectionLost(server, gen, err); });
        }
        return outcome;
    }

    ////////////////////////////////////////// Resources and prompts //////////////////////////////////////////
    // Runs fn against a connected provider under its keyed lock. fn fills value and returns the error text
    // on failure.
    template <typename T>
    QueryOutcome<T> query(const std::string& name, const char* label,
                          const std::function<std::optional<std::string>(transport::ITransport&, uint64_t, T&)>& fn) {
        QueryOutcome<T> out;
        if (disposed) {
            out.error = "Provider manager is disposed";
            return out;
        }
        std::optional<std::string> lostError;
        uint64_t gen = 0;
        {
            auto handle = serverLocks.Acquire(name, std::string(label) + ":" + name);
            std::shared_ptr<transport::ITransport> t;
            uint64_t timeoutMs = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                auto it = servers.find(name);
                if (it == servers.end()) {
                    out.error = notFound(name);
                    return out;
                }
                if (it->second.status != ConnectionStatus::Connected || !it->second.transport) {
                    out.error = "Server " + name + " not connected";
                    return out;
                }
                t = it->second.transport;
                timeoutMs = it->second.config.timeoutMs;
                gen = it->second.generation;
            }
            if (auto err = fn(*t, timeoutMs, out.value)) {
                out.error = *err;
                if (!t->IsConnected()) {
                    lostError = *err;
                }
            } else {
                out.success = true;
            }
        }
        if (lostError.has_value()) {
            const std::string err = *lostError;
            postTo(name, [name, gen, err](Impl& impl) { impl.handleConnectionLost(name, gen, err); });
        }
        return out;
    }

    QueryOutcome<std::vector<Resource>> listResources(const std::string& name) {
        return query<std::vector<Resource>>(
            name, "list-resources",
            [this, &name](transport::ITransport& t, uint64_t timeoutMs, std::vector<Resource>& out) {
                return pageThrough(t, Methods::ListResources, timeoutMs, name, [&out](const JSONValue& result) {
                    ResourcesListResult listed = ParseResourcesListResult(result);
                    for (auto& r : listed.resources) {
                        out.push_back(std::move(r));
                    }
                    return listed.nextCursor;
                });
            });
    }

    QueryOutcome<ReadResourceResult> readResource(const std::string& name, const std::string& uri) {
        return query<ReadResourceResult>(
            name, "read-resource",
            [this, &name, &uri](transport::ITransport& t, uint64_t timeoutMs,
                                ReadResourceResult& out) -> std::optional<std::string> {
                JSONValue::Object params;
                SetMember(params, "uri", JSONValue(uri));
                JSONValue result;
                if (auto err = requestResult(t, Methods::ReadResource, JSONValue(std::move(params)), timeoutMs, result)) {
                    return err;
                }
                auto parsed = ParseReadResourceResult(result);
                if (!parsed.has_value()) {
                    return "Malformed resources/read result from " + name;
                }
                out = std::move(*parsed);
                return std::nullopt;
            });
    }

    QueryOutcome<std::vector<Prompt>> listPrompts(const std::string& name) {
        return query<std::vector<Prompt>>(
            name, "list-prompts",
            [this, &name](transport::ITransport& t, uint64_t timeoutMs, std::vector<Prompt>& out) {
                return pageThrough(t, Methods::ListPrompts, timeoutMs, name, [&out](const JSONValue& result) {
                    PromptsListResult listed = ParsePromptsListResult(result);
                    for (auto& p : listed.prompts) {
                        out.push_back(std::move(p));
                    }
                    return listed.nextCursor;
                });
            });
    }

    QueryOutcome<GetPromptResult> getPrompt(const std::string& name, const std::string& promptName,
                                            const JSONValue& arguments) {
        return query<GetPromptResult>(
            name, "get-prompt",
            [this, &name, &promptName, &arguments](transport::ITransport& t, uint64_t timeoutMs,
                                                   GetPromptResult& out) -> std::optional<std::string> {
                JSONValue::Object args;
                if (arguments.isObject()) {
                    for (const auto& [key, value] : std::get<JSONValue::Object>(arguments.value)) {
                        if (value && value->isString()) {
                            SetMember(args, key, DeepCopyJSON(*value));
                        }
                    }
                }
                JSONValue::Object params;
                SetMember(params, "name", JSONValue(promptName));
                SetMember(params, "arguments", JSONValue(std::move(args)));
                JSONValue result;
                if (auto err = requestResult(t, Methods::GetPrompt, JSONValue(std::move(params)), timeoutMs, result)) {
                    return err;
                }
                auto parsed = ParseGetPromptResult(result);
                if (!parsed.has_value()) {
                    return "Malformed prompts/get result from " + name;
                }
                out = std::move(*parsed);
                return std::nullopt;
            });
    }

    ////////////////////////////////////////// Health //////////////////////////////////////////
    ProviderResult healthCheck(const std::string& name) {
        if (disposed) {
            return {false, "Provider manager is disposed"};
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (servers.find(name) == servers.end()) {
                return {false, notFound(name)};
            }
        }
        std::vector<ProviderEvent> events;
        std::optional<ProviderConfig> failed;
        std::string error;
        {
            auto handle = serverLocks.Acquire(name, "health:" + name);
            std::shared_ptr<transport::ITransport> t;
            uint64_t timeoutMs = 0;
            uint64_t gen = 0;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                auto it = servers.find(name);
                if (it == servers.end()) {
                    return {false, notFound(name)};
                }
                if (it->second.status != ConnectionStatus::Connected || !it->second.transport) {
                    return {false, "Server " + name + " not connected"};
                }
                t = it->second.transport;
                timeoutMs = it->second.config.timeoutMs;
                gen = it->second.generation;
            }
            Exchange ex = exchange(*t, nextRequestId(), Methods::ListTools, std::nullopt, timeoutMs);
            if (ex.timedOut) {
                error = "Health check timed out after " + std::to_string(timeoutMs) + " ms";
            } else {
                auto resp = std::move(ex.response);
                if (!resp) {
                    error = "Health check failed: empty response";
                } else if (resp->IsError()) {
                    error = "Health check failed: " + errors::describeResponseError(*resp);
                }
            }
            if (error.empty()) {
                return {true, ""};
            }
            failed = markFailedLocked(name, gen, error, ProviderEventType::ServerUnhealthy, events);
        }
        emitAll(events);
        if (failed.has_value()) {
            scheduleReconnection(*failed);
        }
        return {false, error};
    }

    void checkAll() {
        if (disposed || healthCheckInFlight.exchange(true)) {
            return;
        }
        std::vector<std::string> names = connectedNames();
        std::vector<std::future<ProviderResult>> pending;
        pending.reserve(names.size());
        auto self = shared_from_this();
        for (const auto& name : names) {
            pending.push_back(submit(name, [self, name]() { return self->healthCheck(name); }));
        }
        for (std::size_t i = 0; i < pending.size(); ++i) {
            ProviderResult r = pending[i].get();
            if (!r.success) {
                LOG_WARN("Provider '{}' is unhealthy: {}", names[i], r.error);
            }
        }
        healthCheckInFlight = false;
    }

    ////////////////////////////////////////// Status //////////////////////////////////////////
    std::vector<std::string> connectedNames() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        std::vector<std::string> out;
        for (const auto& kv : servers) {
            if (kv.second.status == ConnectionStatus::Connected) {
                out.push_back(kv.first);
            }
        }
        return out;
    }

    static ServerStatus statusOf(const ServerEntry& entry) {
        ServerStatus s;
        s.name = entry.config.name;
        s.status = entry.status;
        s.transportType = transport::toString(entry.config.transport.type);
        s.toolCount = entry.tools.size();
        s.connectedAtMs = entry.connectedAtMs;
        s.lastError = entry.lastError;
        s.lastErrorAtMs = entry.lastErrorAtMs;
        return s;
    }

    void dispose() {
        if (disposed.exchange(true)) {
            return;
        }
        stopHealthChecks();
        std::vector<std::string> names;
        std::vector<std::string> toolNames;
        std::vector<std::shared_ptr<transport::ITransport>> transports;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            for (auto& kv : servers) {
                names.push_back(kv.first);
                if (kv.second.transport) {
                    transports.push_back(std::move(kv.second.transport));
                }
                for (const auto& tool : kv.second.tools) {
                    toolNames.push_back(tool.first);
                }
            }
            servers.clear();
            toolOwners.clear();
        }
        for (const auto& name : names) {
            reconnection.CancelReconnection(name);
        }
        unregisterTools(toolNames);
        for (const auto& t : transports) {
            closeTransport(t);
        }
        LOG_INFO("ProviderManager disposed ({} providers closed)", names.size());
    }
};

//////////////////////////////////////////// ProviderManager ////////////////////////////////////////////
ProviderManager::ProviderManager(registry::ToolRegistry& registry,
                                 std::shared_ptr<transport::ITransportFactory> factory,
                                 reconnect::ReconnectionManager& reconnection, const ProviderManagerOptions& options)
    : pImpl(std::make_shared<Impl>(registry, std::move(factory), reconnection, options)) {
    pImpl->startHealthChecks();
}

ProviderManager::~ProviderManager() {
    pImpl->dispose();
    pImpl->closePool();
}

std::future<ProviderResult> ProviderManager::AddServer(const ProviderConfig& config) {
    auto impl = pImpl;
    // Invalid names are answered here so no worker is created for them.
    const std::string lane = invariants::IsValidServerName(config.name) ? config.name : std::string();
    return impl->submit(lane, [impl, config]() { return impl->connect(config, false); });
}

std::future<ProviderResult> ProviderManager::RemoveServer(const std::string& serverName) {
    auto impl = pImpl;
    return impl->submit(serverName, [impl, serverName]() { return impl->remove(serverName); });
}

std::future<ProviderResult> ProviderManager::Shutdown() {
    auto impl = pImpl;
    return impl->submit(std::string(), [impl]() { return impl->shutdown(); });
}

std::future<ToolCallOutcome> ProviderManager::CallTool(const std::string& toolName, const JSONValue& args,
                                                       bool validateOutput) {
    auto impl = pImpl;
    JSONValue copy = DeepCopyJSON(args);
    return impl->submit(impl->serverOfTool(toolName), [impl, toolName, copy, validateOutput]() {
        return impl->callTool(toolName, copy, validateOutput);
    });
}

std::vector<std::string> ProviderManager::GetServerTools(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    std::vector<std::string> out;
    auto it = pImpl->servers.find(serverName);
    if (it != pImpl->servers.end()) {
        for (const auto& kv : it->second.tools) {
            out.push_back(kv.first);
        }
    }
    return out;
}

std::string ProviderManager::QualifiedToolName(const std::string& serverName, const std::string& toolName) {
    return "mcp__" + serverName + "__" + toolName;
}

std::future<QueryOutcome<std::vector<Resource>>> ProviderManager::ListResources(const std::string& serverName) {
    auto impl = pImpl;
    return impl->submit(serverName, [impl, serverName]() { return impl->listResources(serverName); });
}

std::future<QueryOutcome<ReadResourceResult>> ProviderManager::ReadResource(const std::string& serverName,
                                                                            const std::string& uri) {
    auto impl = pImpl;
    return impl->submit(serverName, [impl, serverName, uri]() { return impl->readResource(serverName, uri); });
}

std::future<QueryOutcome<std::vector<Prompt>>> ProviderManager::ListPrompts(const std::string& serverName) {
    auto impl = pImpl;
    return impl->submit(serverName, [impl, serverName]() { return impl->listPrompts(serverName); });
}

std::future<QueryOutcome<GetPromptResult>> ProviderManager::GetPrompt(const std::string& serverName,
                                                                      const std::string& promptName,
                                                                      const JSONValue& arguments) {
    auto impl = pImpl;
    JSONValue copy = DeepCopyJSON(arguments);
    return impl->submit(serverName, [impl, serverName, promptName, copy]() {
        return impl->getPrompt(serverName, promptName, copy);
    });
}

std::future<ProviderResult> ProviderManager::HealthCheck(const std::string& serverName) {
    auto impl = pImpl;
    return impl->submit(serverName, [impl, serverName]() { return impl->healthCheck(serverName); });
}

void ProviderManager::CheckAllServers() {
    pImpl->checkAll();
}

std::vector<std::string> ProviderManager::GetServers() const {
    return pImpl->connectedNames();
}

std::optional<ServerStatus> ProviderManager::GetServerStatus(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    auto it = pImpl->servers.find(serverName);
    if (it == pImpl->servers.end()) {
        return std::nullopt;
    }
    return Impl::statusOf(it->second);
}

std::vector<ServerStatus> ProviderManager::GetAllServerStatuses() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    std::vector<ServerStatus> out;
    out.reserve(pImpl->servers.size());
    for (const auto& kv : pImpl->servers) {
        out.push_back(Impl::statusOf(kv.second));
    }
    return out;
}

ConnectionSummary ProviderManager::GetConnectionSummary() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    ConnectionSummary s;
    for (const auto& kv : pImpl->servers) {
        switch (kv.second.status) {
            case ConnectionStatus::Connected: ++s.connected; break;
            case ConnectionStatus::Failed: ++s.failed; break;
            case ConnectionStatus::Connecting: ++s.connecting; break;
            default: break;
        }
        ++s.total;
    }
    return s;
}

uint64_t ProviderManager::Subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    const uint64_t id = pImpl->nextObserverId++;
    pImpl->observers[id] = std::move(observer);
    return id;
}

void ProviderManager::Unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    pImpl->observers.erase(id);
}

void ProviderManager::Dispose() {
    pImpl->dispose();
}

} // namespace provider
} // namespace mcplink
