//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_error_remediation.cpp
// Purpose: GoogleTests for connection error pattern matching, hints and formatted reports
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcplink/errors/ErrorRemediation.h"

using namespace mcplink::errors;

TEST(ErrorRemediation, MatchesMessageCaseInsensitively) {
    auto r = MatchErrorPattern("spawn foo ENOENT");
    ASSERT_TRUE(r.has_value());
    // enoent precedes spawn in the table
    EXPECT_EQ(r->pattern, "enoent");
    EXPECT_EQ(r->title, "Command not found");
    EXPECT_EQ(r->category, RemediationCategory::Process);
}

TEST(ErrorRemediation, MatchesCode) {
    auto r = MatchErrorPattern("socket hang up", std::string("ECONNRESET"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->title, "Connection reset");
    EXPECT_EQ(r->category, RemediationCategory::Network);
}

TEST(ErrorRemediation, HttpStatusAndProtocolPatterns) {
    auto auth = MatchErrorPattern("HTTP 401 Unauthorized");
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->category, RemediationCategory::Auth);
    ASSERT_TRUE(auth->command.has_value());

    auto unavailable = MatchErrorPattern("HTTP 503 Service Unavailable");
    ASSERT_TRUE(unavailable.has_value());
    EXPECT_EQ(unavailable->title, "Service unavailable");

    auto init = MatchErrorPattern("MCP Initialization Failed: timeout");
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ(init->category, RemediationCategory::Protocol);

    auto tls = MatchErrorPattern("CERT_HAS_EXPIRED");
    ASSERT_TRUE(tls.has_value());
    EXPECT_EQ(tls->category, RemediationCategory::Tls);
}

TEST(ErrorRemediation, StatusCodesMatchWholeNumbersOnly) {
    EXPECT_FALSE(MatchErrorPattern("Request timed out after 5000 ms").has_value());
    EXPECT_FALSE(MatchErrorPattern("retrying in 4010ms").has_value());
    EXPECT_FALSE(MatchErrorPattern("listener on port 15003 closed").has_value());
    EXPECT_FALSE(MatchErrorPattern("odd", std::string("E5020")).has_value());

    auto server = MatchErrorPattern("status=500");
    ASSERT_TRUE(server.has_value());
    EXPECT_EQ(server->title, "Server error");
    auto auth = MatchErrorPattern("bad response (401)");
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->category, RemediationCategory::Auth);
}

TEST(ErrorRemediation, NoMatch) {
    EXPECT_FALSE(MatchErrorPattern("something odd happened").has_value());
}

TEST(ErrorRemediation, TransportHints) {
    auto stdioHints = GetTransportHints(std::string("stdio"));
    ASSERT_FALSE(stdioHints.empty());
    EXPECT_NE(stdioHints[0].find("stdio"), std::string::npos);
    auto httpHints = GetTransportHints(std::string("streamable_http"));
    EXPECT_NE(httpHints[0].find("HTTP"), std::string::npos);
    EXPECT_EQ(GetTransportHints(std::string("sse")), httpHints);
    auto general = GetTransportHints(std::nullopt);
    EXPECT_FALSE(general.empty());
    EXPECT_NE(general, stdioHints);
}

TEST(ErrorRemediation, EnvVarHintsOnlyForCredentials) {
    EXPECT_FALSE(GetEnvVarHints("Missing API_KEY").empty());
    EXPECT_FALSE(GetEnvVarHints("invalid token").empty());
    EXPECT_FALSE(GetEnvVarHints("client secret rejected").empty());
    EXPECT_TRUE(GetEnvVarHints("connection refused").empty());
}

TEST(ErrorRemediation, RemediateFallsBackToTransportHints) {
    auto r = Remediate("weird failure", std::nullopt, std::string("stdio"));
    EXPECT_FALSE(r.matched);
    EXPECT_EQ(r.category, RemediationCategory::General);
    EXPECT_EQ(r.hints, GetTransportHints(std::string("stdio")));
    EXPECT_FALSE(r.command.has_value());
}

TEST(ErrorRemediation, RemediateAppendsEnvHints) {
    auto r = Remediate("HTTP 401: bad token");
    EXPECT_TRUE(r.matched);
    auto base = MatchErrorPattern("HTTP 401: bad token");
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(r.hints.size(), base->hints.size() + GetEnvVarHints("token").size());
}

TEST(ErrorRemediation, FormatConnectionError) {
    std::string text = FormatConnectionError("github", "connect ECONNREFUSED 127.0.0.1:3000");
    EXPECT_EQ(text.rfind("MCP Server Connection Failed: github\n", 0), 0u);
    EXPECT_NE(text.find("Error: connect ECONNREFUSED 127.0.0.1:3000\n"), std::string::npos);
    EXPECT_NE(text.find("Connection refused\n"), std::string::npos);
    EXPECT_NE(text.find("  1. The provider is not running or not listening\n"), std::string::npos);
    EXPECT_NE(text.find("Try: lsof -i :<port>\n"), std::string::npos);
}

TEST(ErrorRemediation, CategoryNames) {
    EXPECT_STREQ(toString(RemediationCategory::Tls), "tls");
    EXPECT_STREQ(toString(RemediationCategory::General), "general");
}
