//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Connects the providers listed in a config file, prints their tools and optionally calls one
// Usage:
//   mcplink_providers <config.json> [--server=<name>] [--call=<tool>] [--args=<json>] [--log-level=<lvl>]
//==========================================================================================================

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcplink/errors/ErrorRemediation.h"
#include "mcplink/provider/ProviderConfig.h"
#include "mcplink/provider/ProviderManager.h"
#include "mcplink/reconnect/ReconnectionManager.h"
#include "mcplink/registry/ToolRegistry.h"
#include "mcplink/transport/Transport.h"
#include "mcplink/version.h"

using namespace mcplink;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   The value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (argc < 2) {
        std::cerr << "usage: " << argv[0]
                  << " <config.json> [--server=<name>] [--call=<tool>] [--args=<json>] [--log-level=<lvl>]"
                  << std::endl;
        return 2;
    }
    if (auto lvl = getArgValue(argc, argv, "--log-level")) {
        Logger::setLogLevel(Logger::levelFromString(*lvl));
    }
    LOG_INFO("mcplink {} provider example", getVersionString());

    std::vector<provider::ProviderConfig> configs;
    try {
        configs = provider::LoadProviderConfigFile(argv[1]);
    } catch (const provider::ProviderConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    const auto only = getArgValue(argc, argv, "--server");

    registry::ToolRegistry tools;
    reconnect::ReconnectionManager reconnection;
    provider::ProviderManagerOptions options;
    options.healthChecksEnabled = false;
    options.reconnectEnabled = false;
    provider::ProviderManager manager(tools, std::make_shared<transport::DefaultTransportFactory>(), reconnection,
                                      options);
    manager.Subscribe([](const provider::ProviderEvent& ev) {
        LOG_DEBUG("event {} for {}", ev.name(), ev.serverName);
    });

    int failures = 0;
    for (const auto& cfg : configs) {
        if (only.has_value() && cfg.name != *only) {
            continue;
        }
        auto r = manager.AddServer(cfg).get();
        if (!r.success) {
            ++failures;
            std::cerr << errors::FormatConnectionError(cfg.name, r.error, std::nullopt,
                                                       std::string(transport::toString(cfg.transport.type)))
                      << std::endl;
            continue;
        }
        std::cout << cfg.name << " (" << transport::toString(cfg.transport.type) << ")" << std::endl;
        for (const auto& name : manager.GetServerTools(cfg.name)) {
            auto tool = tools.GetTool(name);
            std::cout << "  " << name;
            if (tool.has_value() && !tool->definition.description.empty()) {
                std::cout << ": " << tool->definition.description;
            }
            std::cout << std::endl;
        }
    }

    if (auto toolName = getArgValue(argc, argv, "--call")) {
        JSONValue args(JSONValue::Object{});
        if (auto raw = getArgValue(argc, argv, "--args")) {
            auto parsed = TryParseJSON(*raw);
            if (!parsed.has_value()) {
                std::cerr << "Invalid --args JSON: " << *raw << std::endl;
                manager.Shutdown().get();
                return 1;
            }
            args = *parsed;
        }
        registry::ToolExecutionContext ctx;
        ctx.source = registry::ToolSource::Provider;
        auto result = tools.ExecuteTool(*toolName, args, ctx).get();
        if (result.success) {
            std::cout << result.output.value_or("") << std::endl;
        } else {
            std::cerr << "Tool failed: " << result.error.value_or("unknown error") << std::endl;
            ++failures;
        }
    }

    auto summary = manager.GetConnectionSummary();
    LOG_INFO("{} connected, {} failed", summary.connected, summary.failed);
    auto done = manager.Shutdown().get();
    if (!done.success) {
        LOG_WARN("Shutdown: {}", done.error);
    }
    return failures == 0 ? 0 : 1;
}
