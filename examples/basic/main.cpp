//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Basic example: version, a local tool in the registry and a serialized section
//==========================================================================================================

#include <future>
#include <iostream>

#include "logging/Logger.h"
#include "mcplink/registry/ToolRegistry.h"
#include "mcplink/sync/KeyedMutex.h"
#include "mcplink/version.h"

using namespace mcplink;

int main() {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);

    auto v = getVersionString();
    std::cout << "mcplink version: " << v << std::endl;
    LOG_INFO("Starting basic example... Version: {}", v);

    registry::ToolRegistry tools;
    registry::ToolDefinition def;
    def.name = "greet";
    def.description = "Says hello";
    def.inputSchema = ParseJSON(R"({"type":"object","properties":{"who":{"type":"string"}}})");
    tools.RegisterTool(registry::ToolSource::Primary, def,
                       [](const JSONValue& args, const registry::ToolExecutionContext&) {
                           std::promise<registry::ToolExecutionResult> p;
                           registry::ToolExecutionResult r;
                           r.success = true;
                           r.output = "hello " + GetStringMember(args, "who").value_or("world");
                           p.set_value(std::move(r));
                           return p.get_future();
                       });

    sync::KeyedMutex locks;
    auto result = locks.RunExclusive("greet", [&tools]() {
        return tools.ExecuteTool("greet", ParseJSON(R"({"who":"mcplink"})"), registry::ToolExecutionContext()).get();
    });
    if (!result.success) {
        LOG_ERROR("greet failed: {}", result.error.value_or("unknown"));
        return 1;
    }
    std::cout << result.output.value_or("") << std::endl;

    auto stats = tools.GetStats();
    LOG_DEBUG("Registry holds {} tools", stats.totalTools);
    return 0;
}
