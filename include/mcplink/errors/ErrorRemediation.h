//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorRemediation.h
// Purpose: Maps provider connection failures to human-actionable titles, hints and commands
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mcplink {
namespace errors {

enum class RemediationCategory {
    Process,
    Network,
    Tls,
    Auth,
    Server,
    Protocol,
    General
};

const char* toString(RemediationCategory category);

//==========================================================================================================
// Remediation
// Purpose: One entry of the remediation table.
// Fields:
//   pattern: Lower-case substring matched against the error message or code.
//   command: Optional diagnostic command suggested to the user.
//==========================================================================================================
struct Remediation {
    std::string pattern;
    std::string title;
    std::vector<std::string> hints;
    std::optional<std::string> command;
    RemediationCategory category{RemediationCategory::General};
};

struct RemediationResult {
    std::string title;
    std::vector<std::string> hints;
    std::optional<std::string> command;
    RemediationCategory category{RemediationCategory::General};
    bool matched{false};
};

// Table in match order: process codes, network codes, TLS, HTTP status, protocol messages.
const std::vector<Remediation>& RemediationTable();

//==========================================================================================================
// MatchErrorPattern
// Purpose: First table entry whose pattern occurs (case-insensitively) in the message or in the code.
// Returns:
//   std::nullopt when nothing matches.
//==========================================================================================================
std::optional<Remediation> MatchErrorPattern(const std::string& errorMessage,
                                             const std::optional<std::string>& code = std::nullopt);

// Hints for "stdio", for "http"/"sse"/"streamable_http", or general hints for anything else.
std::vector<std::string> GetTransportHints(const std::optional<std::string>& transportType);

// Non-empty only when the message mentions api_key, token or secret.
std::vector<std::string> GetEnvVarHints(const std::string& errorMessage);

//==========================================================================================================
// Remediate
// Purpose: Pattern hints when a pattern matches, otherwise transport hints; env-var hints appended.
//==========================================================================================================
RemediationResult Remediate(const std::string& errorMessage,
                            const std::optional<std::string>& code = std::nullopt,
                            const std::optional<std::string>& transportType = std::nullopt);

//==========================================================================================================
// FormatConnectionError
// Purpose: Multi-line report for logs and the console:
//   MCP Server Connection Failed: <name>
//   Error: <message>
//   <title>
//     1. <hint>
//   Try: <command>
//==========================================================================================================
std::string FormatConnectionError(const std::string& serverName, const std::string& errorMessage,
                                  const std::optional<std::string>& code = std::nullopt,
                                  const std::optional<std::string>& transportType = std::nullopt);

} // namespace errors
} // namespace mcplink
