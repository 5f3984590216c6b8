//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Parsing of provider tools, resources and prompts results
//==========================================================================================================

#include "mcplink/Protocol.h"
#include "logging/Logger.h"

namespace mcplink {

ToolsListResult ParseToolsListResult(const JSONValue& result) {
    FUNC_SCOPE();
    ToolsListResult out;
    const JSONValue* tools = FindMember(result, "tools");
    if (tools == nullptr || !tools->isArray()) {
        return out;
    }
    for (const auto& entry : std::get<JSONValue::Array>(tools->value)) {
        if (!entry) {
            continue;
        }
        auto name = GetStringMember(*entry, "name");
        if (!name.has_value() || name->empty()) {
            LOG_WARN("tools/list entry without a name skipped");
            continue;
        }
        Tool t;
        t.name = *name;
        t.description = GetStringMember(*entry, "description").value_or(std::string());
        if (const JSONValue* in = FindMember(*entry, "inputSchema")) {
            t.inputSchema = DeepCopyJSON(*in);
        } else {
            t.inputSchema = JSONValue(JSONValue::Object{});
        }
        if (const JSONValue* outSchema = FindMember(*entry, "outputSchema")) {
            t.outputSchema = DeepCopyJSON(*outSchema);
        }
        out.tools.push_back(std::move(t));
    }
    out.nextCursor = GetStringMember(result, "nextCursor");
    return out;
}

std::optional<CallToolResult> ParseCallToolResult(const JSONValue& result) {
    FUNC_SCOPE();
    const JSONValue* content = FindMember(result, "content");
    if (content == nullptr || !content->isArray()) {
        return std::nullopt;
    }
    CallToolResult out;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (item) {
            out.content.push_back(DeepCopyJSON(*item));
        }
    }
    out.isError = GetBoolMember(result, "isError").value_or(false);
    if (const JSONValue* sc = FindMember(result, "structuredContent")) {
        out.structuredContent = DeepCopyJSON(*sc);
    }
    return out;
}

namespace {
// Copies the array member key of result; false when it is missing or not an array.
bool copyArray(const JSONValue& result, const char* key, std::vector<JSONValue>& out) {
    const JSONValue* arr = FindMember(result, key);
    if (arr == nullptr || !arr->isArray()) {
        return false;
    }
    for (const auto& item : std::get<JSONValue::Array>(arr->value)) {
        if (item) {
            out.push_back(DeepCopyJSON(*item));
        }
    }
    return true;
}
} // namespace

ResourcesListResult ParseResourcesListResult(const JSONValue& result) {
    FUNC_SCOPE();
    ResourcesListResult out;
    const JSONValue* resources = FindMember(result, "resources");
    if (resources != nullptr && resources->isArray()) {
        for (const auto& entry : std::get<JSONValue::Array>(resources->value)) {
            if (!entry) {
                continue;
            }
            auto uri = GetStringMember(*entry, "uri");
            if (!uri.has_value() || uri->empty()) {
                LOG_WARN("resources/list entry without a uri skipped");
                continue;
            }
            Resource r;
            r.uri = *uri;
            r.name = GetStringMember(*entry, "name").value_or(*uri);
            r.description = GetStringMember(*entry, "description");
            r.mimeType = GetStringMember(*entry, "mimeType");
            out.resources.push_back(std::move(r));
        }
    }
    out.nextCursor = GetStringMember(result, "nextCursor");
    return out;
}

PromptsListResult ParsePromptsListResult(const JSONValue& result) {
    FUNC_SCOPE();
    PromptsListResult out;
    const JSONValue* prompts = FindMember(result, "prompts");
    if (prompts != nullptr && prompts->isArray()) {
        for (const auto& entry : std::get<JSONValue::Array>(prompts->value)) {
            if (!entry) {
                continue;
            }
            auto name = GetStringMember(*entry, "name");
            if (!name.has_value() || name->empty()) {
                LOG_WARN("prompts/list entry without a name skipped");
                continue;
            }
            Prompt p;
            p.name = *name;
            p.description = GetStringMember(*entry, "description");
            const JSONValue* args = FindMember(*entry, "arguments");
            if (args != nullptr && args->isArray()) {
                for (const auto& a : std::get<JSONValue::Array>(args->value)) {
                    if (!a) {
                        continue;
                    }
                    auto argName = GetStringMember(*a, "name");
                    if (!argName.has_value()) {
                        continue;
                    }
                    PromptArgument pa;
                    pa.name = *argName;
                    pa.description = GetStringMember(*a, "description");
                    pa.required = GetBoolMember(*a, "required").value_or(false);
                    p.arguments.push_back(std::move(pa));
                }
            }
            out.prompts.push_back(std::move(p));
        }
    }
    out.nextCursor = GetStringMember(result, "nextCursor");
    return out;
}

std::optional<ReadResourceResult> ParseReadResourceResult(const JSONValue& result) {
    ReadResourceResult out;
    if (!copyArray(result, "contents", out.contents)) {
        return std::nullopt;
    }
    return out;
}

std::optional<GetPromptResult> ParseGetPromptResult(const JSONValue& result) {
    GetPromptResult out;
    if (!copyArray(result, "messages", out.messages)) {
        return std::nullopt;
    }
    out.description = GetStringMember(result, "description");
    return out;
}

} // namespace mcplink
