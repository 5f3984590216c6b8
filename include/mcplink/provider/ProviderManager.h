//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderManager.h
// Purpose: Connects tool providers, registers their tools, detects failures and drives reconnection
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/Protocol.h"
#include "mcplink/provider/ProviderConfig.h"
#include "mcplink/reconnect/ReconnectionManager.h"
#include "mcplink/registry/ToolRegistry.h"
#include "mcplink/transport/Transport.h"
#include "mcplink/validation/OutputSchemaValidator.h"

namespace mcplink {
namespace provider {

///////////////////////////////////////// Status ///////////////////////////////////////////
enum class ConnectionStatus {
    Idle,
    Connecting,
    Connected,
    Disconnecting,
    Failed
};

// "idle" / "connecting" / "connected" / "disconnecting" / "failed"
const char* toString(ConnectionStatus status);

struct ServerStatus {
    std::string name;
    ConnectionStatus status{ConnectionStatus::Idle};
    std::string transportType;
    std::size_t toolCount{0};
    int64_t connectedAtMs{0};
    std::optional<std::string> lastError;
    int64_t lastErrorAtMs{0};
};

struct ConnectionSummary {
    std::size_t connected{0};
    std::size_t failed{0};
    std::size_t connecting{0};
    std::size_t total{0};
};

// Outcome of a connection-level operation; error is empty on success.
struct ProviderResult {
    bool success{false};
    std::string error;
};

//==========================================================================================================
// ToolCallOutcome
// Purpose: Result of ProviderManager::CallTool.
// Fields:
//   result: The provider's tools/call result when the call completed at the protocol level (it may still
//           carry isError = true).
//   schemaValidation: Set when the tool declared an outputSchema and validation was requested.
//==========================================================================================================
struct ToolCallOutcome {
    bool success{false};
    std::string error;
    std::optional<CallToolResult> result;
    std::optional<validation::SchemaValidationResult> schemaValidation;
};

///////////////////////////////////////// Events ///////////////////////////////////////////
enum class ProviderEventType {
    ServerAdded,
    ServerRemoved,
    ServerError,
    ServerUnhealthy,
    SchemaValidationFailed,
    ToolProgress
};

//==========================================================================================================
// ProviderEvent
// Purpose: Observer payload. Fields beyond serverName depend on the type:
//   ServerAdded:            toolCount
//   ServerError:            error
//   ServerUnhealthy:        error
//   SchemaValidationFailed: toolName, errors
//   ToolProgress:           toolName, progress, total, message (from notifications/progress)
//==========================================================================================================
struct ProviderEvent {
    ProviderEventType type{ProviderEventType::ServerAdded};
    std::string serverName;
    std::size_t toolCount{0};
    std::string toolName;
    std::string error;
    std::vector<std::string> errors;
    double progress{0.0};
    std::optional<double> total;
    std::string message;

    // "server-added", "server-removed", "server-error", "server-unhealthy", "schema-validation-failed",
    // "tool-progress"
    const char* name() const;
};

// Result of a resources or prompts query against one provider; value is meaningful only on success.
template <typename T>
struct QueryOutcome {
    bool success{false};
    std::string error;
    T value{};
};

struct ProviderManagerOptions {
    bool reconnectEnabled{true};
    bool healthChecksEnabled{true};
    // 0 selects MCPLINK_HEALTH_CHECK_INTERVAL_MS, or 60000 when that is unset.
    uint64_t healthCheckIntervalMs{0};
    // Defaults to clientImplementation().
    std::optional<Implementation> clientInfo;
    // Threads for manager-wide work such as Shutdown. Every provider also gets one worker of its own.
    std::size_t workerThreads{2};
};

//==========================================================================================================
// ProviderManager
// Purpose: Owns the connection to every configured provider. Provider tools are registered in the
//          injected ToolRegistry as "mcp__<server>__<tool>" with source Provider, so the agent calls
//          them through ToolRegistry::ExecuteTool like any other tool.
// Notes:
//   - Connect, remove, health check, tool call and resource/prompt queries for one provider are serialized
//     by a KeyedMutex entry named after the provider, and run on that provider's own worker thread. A
//     provider that is slow to answer only delays its own queue.
//   - A request that times out is followed by notifications/cancelled carrying its id.
//   - A failed connect, a lost connection or a failed health check marks the provider failed, removes
//     its tools and schedules a reconnection through the injected ReconnectionManager (when enabled).
//     A successful reconnection registers the tools again.
//   - Public operations return futures completed on an internal worker pool. They never carry
//     exceptions.
//==========================================================================================================
class ProviderManager {
public:
    using Observer = std::function<void(const ProviderEvent&)>;

    ProviderManager(registry::ToolRegistry& registry, std::shared_ptr<transport::ITransportFactory> factory,
                    reconnect::ReconnectionManager& reconnection,
                    const ProviderManagerOptions& options = ProviderManagerOptions());
    ~ProviderManager();
    ProviderManager(const ProviderManager&) = delete;
    ProviderManager& operator=(const ProviderManager&) = delete;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // AddServer
    // Purpose: Creates the transport, performs initialize / notifications/initialized, lists the tools
    //          (following nextCursor) and registers them.
    // Returns:
    //   success when connected (immediately when already connected). On failure the provider is left in
    //   Failed with the error recorded, a server-error event is emitted, the remediation text is logged and
    //   a reconnection is scheduled.
    //==========================================================================================================
    std::future<ProviderResult> AddServer(const ProviderConfig& config);

    // Unregisters the provider's tools, cancels its reconnection and closes its transport.
    std::future<ProviderResult> RemoveServer(const std::string& serverName);

    // Removes every provider; the error lists the providers that could not be removed.
    std::future<ProviderResult> Shutdown();

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // CallTool
    // Purpose: Sends tools/call for a registered provider tool, bounded by the provider's timeoutMs.
    // Args:
    //   toolName: Registered name, "mcp__<server>__<tool>".
    //   args: Arguments object; anything else is sent as {}.
    //   validateOutput: Check the text content against the tool's outputSchema when it has one.
    //==========================================================================================================
    std::future<ToolCallOutcome> CallTool(const std::string& toolName, const JSONValue& args,
                                          bool validateOutput = true);

    // Registered names of the tools a provider currently contributes.
    std::vector<std::string> GetServerTools(const std::string& serverName) const;

    static std::string QualifiedToolName(const std::string& serverName, const std::string& toolName);

    /////////////////////////////////////////// Resources and prompts ///////////////////////////////////////////
    // resources/list, following nextCursor.
    std::future<QueryOutcome<std::vector<Resource>>> ListResources(const std::string& serverName);

    std::future<QueryOutcome<ReadResourceResult>> ReadResource(const std::string& serverName, const std::string& uri);

    // prompts/list, following nextCursor.
    std::future<QueryOutcome<std::vector<Prompt>>> ListPrompts(const std::string& serverName);

    //==========================================================================================================
    // GetPrompt
    // Purpose: prompts/get for one prompt.
    // Args:
    //   arguments: Object of string values; anything else is omitted from the request.
    //==========================================================================================================
    std::future<QueryOutcome<GetPromptResult>> GetPrompt(const std::string& serverName, const std::string& promptName,
                                                         const JSONValue& arguments);

    /////////////////////////////////////////// Health ///////////////////////////////////////////
    //==========================================================================================================
    // HealthCheck
    // Purpose: Checks a connected provider with a tools/list request.
    // Returns:
    //   success = healthy. A provider that is not connected is unhealthy without a request. A failed check
    //   emits server-unhealthy, marks the provider failed, closes it and schedules reconnection.
    //==========================================================================================================
    std::future<ProviderResult> HealthCheck(const std::string& serverName);

    // Runs HealthCheck for every connected provider and waits for all of them.
    void CheckAllServers();

    /////////////////////////////////////////// Status ///////////////////////////////////////////
    // Names of connected providers.
    std::vector<std::string> GetServers() const;
    std::optional<ServerStatus> GetServerStatus(const std::string& serverName) const;
    std::vector<ServerStatus> GetAllServerStatuses() const;
    ConnectionSummary GetConnectionSummary() const;

    uint64_t Subscribe(Observer observer);
    void Unsubscribe(uint64_t id);

    //==========================================================================================================
    // Dispose
    // Purpose: Stops health checks, cancels this manager's reconnections, closes every transport and
    //          unregisters every provider tool. Later operations fail with "Provider manager is disposed".
    //==========================================================================================================
    void Dispose();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace provider
} // namespace mcplink
