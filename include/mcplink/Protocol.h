//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol structures used when talking to providers (tools, resources, prompts), plus method names
//==========================================================================================================

#pragma once

#include "mcplink/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcplink {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version sent in initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Client identification sent in initialize
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: One entry of a provider's tools/list result.
// Fields:
//   inputSchema: JSON Schema for arguments.
//   outputSchema: Optional JSON Schema for structured output (MCP 2025-06-18).
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::optional<JSONValue> outputSchema;
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    std::optional<JSONValue> structuredContent;
    bool isError = false;
};

struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

//==========================================================================================================
// ParseToolsListResult
// Purpose: Extracts tools from a tools/list result object. Entries without a string name are skipped.
//==========================================================================================================
ToolsListResult ParseToolsListResult(const JSONValue& result);

//==========================================================================================================
// ParseCallToolResult
// Purpose: Extracts content/isError/structuredContent from a tools/call result object.
// Returns:
//   std::nullopt when result is not an object or content is not an array.
//==========================================================================================================
std::optional<CallToolResult> ParseCallToolResult(const JSONValue& result);

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct ResourcesListResult {
    std::vector<Resource> resources;
    std::optional<std::string> nextCursor;
};

// contents holds the provider's { uri, mimeType?, text | blob } items unchanged.
struct ReadResourceResult {
    std::vector<JSONValue> contents;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

struct PromptsListResult {
    std::vector<Prompt> prompts;
    std::optional<std::string> nextCursor;
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<JSONValue> messages;  // { role, content } objects
};

// Entries without a uri (resources) or name (prompts) are skipped.
ResourcesListResult ParseResourcesListResult(const JSONValue& result);
PromptsListResult ParsePromptsListResult(const JSONValue& result);

// std::nullopt when contents (resources/read) or messages (prompts/get) is not an array.
std::optional<ReadResourceResult> ParseReadResourceResult(const JSONValue& result);
std::optional<GetPromptResult> ParseGetPromptResult(const JSONValue& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcplink
