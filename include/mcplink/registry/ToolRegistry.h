//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Unified registry of callable tools from every origin, with deep isolation of stored data
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace registry {

///////////////////////////////////////// Types ///////////////////////////////////////////
enum class ToolSource {
    Primary,
    Plugin,
    Provider
};

// "primary" / "plugin" / "provider"
const char* toString(ToolSource source);
std::optional<ToolSource> toolSourceFromString(const std::string& s);

//==========================================================================================================
// ToolDefinition
// Purpose: What the agent sees of a tool. inputSchema is a JSON Schema object.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::optional<JSONValue> outputSchema;
};

// Deep copy; the result shares no JSON nodes with def.
ToolDefinition CopyToolDefinition(const ToolDefinition& def);
// {name, description, inputSchema, outputSchema?}
JSONValue ToolDefinitionToJSON(const ToolDefinition& def);

struct ToolExecutionContext {
    ToolSource source{ToolSource::Primary};
    std::optional<std::string> agentId;
    std::optional<std::string> sessionId;
    std::optional<JSONValue> metadata;
};

struct ToolExecutionResult {
    bool success{false};
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::optional<JSONValue> data;
};

using ToolExecutor = std::function<std::future<ToolExecutionResult>(const JSONValue& args,
                                                                    const ToolExecutionContext& context)>;

struct ToolRegistrationOptions {
    bool allowOverwrite{false};
    std::vector<std::string> tags;
};

struct RegisteredTool {
    ToolDefinition definition;
    ToolExecutor executor;
    ToolSource source{ToolSource::Primary};
    int64_t registeredAt{0};  // ms since epoch
    std::vector<std::string> tags;
};

struct ToolRegistryStats {
    std::size_t totalTools{0};
    std::map<std::string, std::size_t> bySource;
    std::map<std::string, std::size_t> byTag;
};

// Duplicate or malformed registration.
class ToolRegistrationError : public std::runtime_error {
public:
    explicit ToolRegistrationError(const std::string& message) : std::runtime_error(message) {}
};

//==========================================================================================================
// ToolRegistry
// Purpose: At most one tool per name. Definitions are deep-copied on the way in and on the way out, so
//          neither a caller's input nor a returned copy can alter registry state.
// Notes:
//   Thread-safe. Readers share the lock; executors run outside it.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // RegisterTool
    // Purpose: Stores a deep copy of definition. With allowOverwrite an existing tool is replaced and moves
    //          to the new source in the same critical section.
    // Throws:
    //   ToolRegistrationError for an empty name, a null executor, or a duplicate without allowOverwrite.
    //==========================================================================================================
    void RegisterTool(ToolSource source, const ToolDefinition& definition, ToolExecutor executor,
                      const ToolRegistrationOptions& options = ToolRegistrationOptions());

    // Removes the tool and its source index entry. Returns whether anything was removed.
    bool UnregisterTool(const std::string& name);

    std::optional<RegisteredTool> GetTool(const std::string& name) const;
    bool HasTool(const std::string& name) const;
    std::vector<ToolDefinition> GetAllToolDefinitions() const;
    std::vector<ToolDefinition> GetToolDefinitionsBySource(ToolSource source) const;
    std::vector<ToolDefinition> GetToolDefinitionsByTag(const std::string& tag) const;
    std::vector<std::string> GetToolNames() const;
    std::vector<std::string> GetToolNamesBySource(ToolSource source) const;

    //==========================================================================================================
    // ExecuteTool
    // Purpose: Runs the registered executor on deep copies of args and context. Never throws; the future
    //          never holds an exception.
    // Returns:
    //   The executor's result, or {success:false} with:
    //     "Tool '<name>' not found in registry" when absent,
    //     what() and data {errorName, errorMessage} for std::exception failures,
    //     "Unknown execution error" for anything else.
    //==========================================================================================================
    std::future<ToolExecutionResult> ExecuteTool(const std::string& name, const JSONValue& args,
                                                 const ToolExecutionContext& context);

    // Everything, or only the tools registered by source.
    void Clear(std::optional<ToolSource> source = std::nullopt);

    ToolRegistryStats GetStats() const;
    // {"tools":[{name, definition, source, registeredAt, tags}], "stats":{totalTools, bySource, byTag}}
    JSONValue ExportDefinitions() const;

    // Process-wide instance for the composition root; components take a ToolRegistry& instead.
    static ToolRegistry& Default();
    // Clears and destroys the default instance; references obtained earlier become invalid.
    static void ResetDefault();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

///////////////////////////////////////// Batch registration ///////////////////////////////////////////
struct ToolRegistrationItem {
    ToolDefinition definition;
    ToolExecutor executor;
    ToolRegistrationOptions options;
};

struct ToolRegistrationFailure {
    std::string name;
    std::string error;
};

struct BatchRegistrationResult {
    std::vector<std::string> registered;
    std::vector<ToolRegistrationFailure> errors;
};

//==========================================================================================================
// RegisterTools
// Purpose: Registers each item in order; a failing item is recorded and the rest still proceed.
//==========================================================================================================
BatchRegistrationResult RegisterTools(ToolRegistry& registry, ToolSource source,
                                      const std::vector<ToolRegistrationItem>& items);

} // namespace registry
} // namespace mcplink
