//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_config.cpp
// Purpose: Provider configuration parsing, legacy normalization and validation errors
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "mcplink/provider/ProviderConfig.h"

using namespace mcplink;
using namespace mcplink::provider;
using mcplink::transport::FramingMode;
using mcplink::transport::TransportType;

TEST(ProviderConfig, ModernStdioConfig) {
    auto cfg = ParseProviderConfig("files", ParseJSON(R"({
        "transport":{"type":"stdio","command":"node","args":["server.js","--root","/tmp"],
                     "env":{"DEBUG":"1"},"framing":"content-length"},
        "timeoutMs":1500, "initTimeoutMs":90000, "quiet":true})"));
    EXPECT_EQ(cfg.name, "files");
    EXPECT_FALSE(cfg.legacy);
    EXPECT_EQ(cfg.transport.type, TransportType::Stdio);
    EXPECT_EQ(cfg.transport.command, "node");
    ASSERT_EQ(cfg.transport.args.size(), 3u);
    EXPECT_EQ(cfg.transport.args[2], "/tmp");
    EXPECT_EQ(cfg.transport.env.at("DEBUG"), "1");
    EXPECT_EQ(cfg.transport.framing, FramingMode::ContentLength);
    EXPECT_EQ(cfg.timeoutMs, 1500u);
    EXPECT_EQ(cfg.initTimeoutMs, 90000u);
    EXPECT_TRUE(cfg.quiet);
    EXPECT_TRUE(cfg.transport.quiet);
    EXPECT_EQ(cfg.transport.requestTimeoutMs, 1500u);
}

TEST(ProviderConfig, LegacyConfigIsNormalizedToStdio) {
    auto cfg = ParseProviderConfig("legacy_srv", ParseJSON(R"({"command":"python","args":["-m","srv"],"timeout":2000})"));
    EXPECT_TRUE(cfg.legacy);
    EXPECT_EQ(cfg.transport.type, TransportType::Stdio);
    EXPECT_EQ(cfg.transport.command, "python");
    ASSERT_EQ(cfg.transport.args.size(), 2u);
    EXPECT_EQ(cfg.transport.framing, FramingMode::Ndjson);
    EXPECT_EQ(cfg.timeoutMs, 2000u);
}

TEST(ProviderConfig, HttpFamilyRequiresUrl) {
    auto cfg = ParseProviderConfig("remote", ParseJSON(R"({
        "transport":{"type":"streamable_http","url":"https://mcp.example.com/mcp",
                     "headers":{"Authorization":"Bearer abc"}}})"));
    EXPECT_EQ(cfg.transport.type, TransportType::StreamableHttp);
    EXPECT_EQ(cfg.transport.url, "https://mcp.example.com/mcp");
    EXPECT_EQ(cfg.transport.headers.at("Authorization"), "Bearer abc");

    EXPECT_THROW(ParseProviderConfig("remote", ParseJSON(R"({"transport":{"type":"sse"}})")), ProviderConfigError);
}

TEST(ProviderConfig, DefaultsFollowEnvironment) {
    ::unsetenv("MCPLINK_REQUEST_TIMEOUT_MS");
    auto a = ParseProviderConfig("s", ParseJSON(R"({"command":"x"})"));
    EXPECT_EQ(a.timeoutMs, kDefaultProviderTimeoutMs);
    EXPECT_EQ(a.initTimeoutMs, kDefaultProviderTimeoutMs);

    ::setenv("MCPLINK_REQUEST_TIMEOUT_MS", "2500", 1);
    auto b = ParseProviderConfig("s", ParseJSON(R"({"command":"x"})"));
    EXPECT_EQ(b.timeoutMs, 2500u);
    ::unsetenv("MCPLINK_REQUEST_TIMEOUT_MS");
}

TEST(ProviderConfig, RejectsInvalidConfigs) {
    auto expectError = [](const std::string& name, const std::string& json, const std::string& fragment) {
        try {
            ParseProviderConfig(name, ParseJSON(json));
            ADD_FAILURE() << "expected ProviderConfigError for " << json;
        } catch (const ProviderConfigError& e) {
            EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
            EXPECT_EQ(std::string(e.what()).find("Context:"), std::string::npos);
        }
    };
    expectError("bad name!", R"({"command":"x"})", "Invalid server name");
    expectError("both", R"({"command":"x","transport":{"type":"stdio","command":"y"}})", "modern format");
    expectError("neither", R"({"timeoutMs":5})", "legacy format");
    expectError("ws", R"({"transport":{"type":"websocket","url":"ws://x"}})", "unsupported transport type");
    expectError("args", R"({"command":"x","args":"not-an-array"})", "args must be an array");
    expectError("timeout", R"({"command":"x","timeoutMs":0})", "must be positive");
    expectError("framing", R"({"transport":{"type":"stdio","command":"x","framing":"lsp"}})", "framing");
    expectError("quiet", R"({"command":"x","quiet":"yes"})", "quiet must be a boolean");
}

TEST(ProviderConfig, DocumentFormsAndDuplicates) {
    auto fromObject = ParseProviderConfigs(ParseJSON(R"({"mcpServers":{
        "zeta":{"command":"z"},
        "alpha":{"transport":{"type":"http","url":"http://localhost:8080/mcp"}}}})"));
    ASSERT_EQ(fromObject.size(), 2u);
    EXPECT_EQ(fromObject[0].name, "alpha");
    EXPECT_EQ(fromObject[1].name, "zeta");

    auto fromArray = ParseProviderConfigs(ParseJSON(R"([{"name":"b","command":"b"},{"name":"a","command":"a"}])"));
    ASSERT_EQ(fromArray.size(), 2u);
    EXPECT_EQ(fromArray[0].name, "b");

    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"([{"name":"a","command":"a"},{"name":"a","command":"b"}])")),
                 ProviderConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"servers":{}})")), ProviderConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"([{"command":"a"}])")), ProviderConfigError);
}

TEST(ProviderConfig, ToJSONParsesBackToSameConfig) {
    auto original = ParseProviderConfig("srv", ParseJSON(R"({"command":"run","args":["a"],"env":{"K":"V"},"quiet":true})"));
    JSONValue json = ToJSON(original);
    EXPECT_EQ(GetStringMember(json, "name").value_or(""), "srv");
    auto again = ParseProviderConfig("srv", json);
    EXPECT_FALSE(again.legacy);
    EXPECT_EQ(again.transport.command, original.transport.command);
    EXPECT_EQ(again.transport.args, original.transport.args);
    EXPECT_EQ(again.transport.env, original.transport.env);
    EXPECT_EQ(again.timeoutMs, original.timeoutMs);
    EXPECT_EQ(again.quiet, original.quiet);
}

TEST(ProviderConfig, LoadFileReportsJsonErrors) {
    const std::string path = ::testing::TempDir() + "mcplink_provider_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"mcpServers":{"ok":{"command":"true"}}})";
    }
    auto configs = LoadProviderConfigFile(path);
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].name, "ok");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(LoadProviderConfigFile(path), ProviderConfigError);
    std::remove(path.c_str());
    EXPECT_THROW(LoadProviderConfigFile(path), ProviderConfigError);
}
