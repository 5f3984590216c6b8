//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorRemediation.cpp
// Purpose: Maps provider connection failures to human-actionable titles, hints and commands
//==========================================================================================================

#include "mcplink/errors/ErrorRemediation.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mcplink {
namespace errors {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Remediation entry(std::string pattern, std::string title, std::vector<std::string> hints,
                  std::optional<std::string> command, RemediationCategory category) {
    Remediation r;
    r.pattern = std::move(pattern);
    r.title = std::move(title);
    r.hints = std::move(hints);
    r.command = std::move(command);
    r.category = category;
    return r;
}

std::vector<Remediation> buildTable() {
    using C = RemediationCategory;
    std::vector<Remediation> t;

    ////// Process //////
    t.push_back(entry("enoent", "Command not found",
        {"The provider command is not installed or not in PATH",
         "Install the provider package or use an absolute path to the binary",
         "Verify installation: which <command> or command -v <command>"},
        std::string("echo $PATH"), C::Process));
    t.push_back(entry("eacces", "Permission denied",
        {"The command or file lacks execute permissions",
         "Fix permissions: chmod +x <file>",
         "Avoid running providers with sudo; fix ownership of the install prefix instead"},
        std::string("ls -l <command>"), C::Process));
    t.push_back(entry("spawn", "Failed to spawn process",
        {"The command could not be started",
         "Verify the command path is correct",
         "Check if the binary is compatible with your system",
         "Try running the command directly in a terminal"},
        std::nullopt, C::Process));

    ////// Network //////
    t.push_back(entry("econnrefused", "Connection refused",
        {"The provider is not running or not listening",
         "Start the provider first, then retry",
         "Check if the port is correct",
         "Verify no firewall is blocking the connection"},
        std::string("lsof -i :<port>"), C::Network));
    t.push_back(entry("enotfound", "Host not found",
        {"The hostname could not be resolved",
         "Check if the URL is spelled correctly",
         "Verify your network connection",
         "Try using an IP address instead of the hostname"},
        std::string("nslookup <hostname>"), C::Network));
    t.push_back(entry("econnreset", "Connection reset",
        {"The provider closed the connection unexpectedly",
         "The provider may have crashed or restarted",
         "Check provider logs for errors",
         "Retry the connection"},
        std::nullopt, C::Network));
    t.push_back(entry("etimedout", "Connection timed out",
        {"The provider took too long to respond",
         "Check if the provider is overloaded",
         "Verify network connectivity",
         "Increase timeoutMs in the provider configuration if needed"},
        std::nullopt, C::Network));
    t.push_back(entry("esockettimedout", "Socket timed out",
        {"The connection was established but no response was received",
         "The provider may be hanging or processing slowly",
         "For stdio: ensure the command has proper args (not an interactive REPL)",
         "Check if the provider speaks a compatible MCP protocol version"},
        std::nullopt, C::Network));

    ////// TLS //////
    t.push_back(entry("cert_", "SSL Certificate error",
        {"The provider's TLS certificate is invalid or expired",
         "For production: ensure a valid certificate is installed",
         "Check the certificate chain: openssl s_client -connect <host>:443"},
        std::nullopt, C::Tls));
    t.push_back(entry("unable_to_verify", "SSL verification failed",
        {"Cannot verify the provider's TLS certificate",
         "The certificate may be self-signed",
         "CA certificates on this machine may need to be updated"},
        std::nullopt, C::Tls));

    ////// HTTP status //////
    t.push_back(entry("401", "Authentication failed",
        {"The API key or token is invalid or expired",
         "Check the env or headers block of the provider configuration",
         "Regenerate the API key at the provider dashboard if it expired",
         "Check the environment variable is set: echo $<VAR_NAME>"},
        std::string("mcplink_providers <config.json> --server <server-name>"), C::Auth));
    t.push_back(entry("403", "Access forbidden",
        {"You don't have permission to access this resource",
         "Check if your API key has the required scopes or permissions",
         "Regenerate the token with the correct permissions if needed"},
        std::string("mcplink_providers <config.json> --server <server-name>"), C::Auth));
    t.push_back(entry("500", "Server error",
        {"The provider encountered an internal error",
         "Check provider logs for details",
         "Try again later",
         "Report the issue to the provider maintainer"},
        std::nullopt, C::Server));
    t.push_back(entry("502", "Bad gateway",
        {"The provider received an invalid response from upstream",
         "The upstream service may be down",
         "Try again later"},
        std::nullopt, C::Server));
    t.push_back(entry("503", "Service unavailable",
        {"The provider is temporarily unavailable",
         "It may be overloaded or under maintenance",
         "Wait a few minutes and retry"},
        std::nullopt, C::Server));

    ////// Protocol //////
    t.push_back(entry("initialization failed", "MCP initialization failed",
        {"The provider failed to initialize properly",
         "Check if all required environment variables are set",
         "Run the provider command by hand and inspect its stderr"},
        std::string("mcplink_providers <config.json> --server <server-name>"), C::Protocol));
    t.push_back(entry("protocol error", "MCP protocol error",
        {"Invalid message format or unsupported protocol version",
         "This may be a compatibility issue with the provider",
         "Check the framing setting (ndjson or content-length) of a stdio provider",
         "Check for provider updates or use a different provider version"},
        std::nullopt, C::Protocol));
    t.push_back(entry("tool not found", "MCP tool not found",
        {"The requested tool is not available on the provider",
         "List the provider's tools to check the exact name",
         "The provider may need to be reconnected"},
        std::nullopt, C::Protocol));
    return t;
}

} // namespace

const char* toString(RemediationCategory category) {
    switch (category) {
        case RemediationCategory::Process: return "process";
        case RemediationCategory::Network: return "network";
        case RemediationCategory::Tls: return "tls";
        case RemediationCategory::Auth: return "auth";
        case RemediationCategory::Server: return "server";
        case RemediationCategory::Protocol: return "protocol";
        case RemediationCategory::General:
        default: return "general";
    }
}

const std::vector<Remediation>& RemediationTable() {
    static const std::vector<Remediation> table = buildTable();
    return table;
}

namespace {
bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Status-code patterns ("500") only match as a whole number, so "after 5000 ms" is not a server error.
bool containsPattern(const std::string& text, const std::string& pattern) {
    if (!isDigits(pattern)) {
        return text.find(pattern) != std::string::npos;
    }
    for (auto pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1)) {
        const bool leftOk = pos == 0 || std::isalnum(static_cast<unsigned char>(text[pos - 1])) == 0;
        const std::size_t end = pos + pattern.size();
        const bool rightOk = end == text.size() || std::isalnum(static_cast<unsigned char>(text[end])) == 0;
        if (leftOk && rightOk) {
            return true;
        }
    }
    return false;
}
} // namespace

std::optional<Remediation> MatchErrorPattern(const std::string& errorMessage, const std::optional<std::string>& code) {
    const std::string message = toLower(errorMessage);
    const std::string lowerCode = code.has_value() ? toLower(*code) : std::string();
    for (const auto& r : RemediationTable()) {
        if (containsPattern(message, r.pattern) || (!lowerCode.empty() && containsPattern(lowerCode, r.pattern))) {
            return r;
        }
    }
    return std::nullopt;
}

std::vector<std::string> GetTransportHints(const std::optional<std::string>& transportType) {
    if (transportType.has_value() && *transportType == "stdio") {
        return {
            "For stdio transport: verify the command is installed: which <command>",
            "Ensure args include a script or package (not just the runtime)",
            "Commands like \"node\" or \"python\" without args start a REPL and hang"
        };
    }
    if (transportType.has_value() &&
        (*transportType == "http" || *transportType == "sse" || *transportType == "streamable_http")) {
        return {
            "For HTTP/SSE transport: verify the provider is running: curl <url>",
            "Check the URL is reachable from your network",
            "Verify the TLS certificate if using HTTPS",
            "Check the authentication headers are correct"
        };
    }
    return {
        "Check the provider logs for more details",
        "Verify all required environment variables are set",
        "Re-run with MCPLINK_LOG_LEVEL=debug to trace the JSON-RPC exchange"
    };
}

std::vector<std::string> GetEnvVarHints(const std::string& errorMessage) {
    const std::string message = toLower(errorMessage);
    if (message.find("api_key") != std::string::npos || message.find("token") != std::string::npos ||
        message.find("secret") != std::string::npos) {
        return {
            "Set the variable in your shell: export VAR_NAME=value",
            "Or add it to the env block of the provider configuration",
            "Verify: echo $VAR_NAME"
        };
    }
    return {};
}

RemediationResult Remediate(const std::string& errorMessage, const std::optional<std::string>& code,
                            const std::optional<std::string>& transportType) {
    RemediationResult out;
    if (auto match = MatchErrorPattern(errorMessage, code)) {
        out.title = match->title;
        out.hints = match->hints;
        out.command = match->command;
        out.category = match->category;
        out.matched = true;
    } else {
        out.title = "Unrecognized connection error";
        out.hints = GetTransportHints(transportType);
        out.category = RemediationCategory::General;
    }
    for (auto& h : GetEnvVarHints(errorMessage)) {
        out.hints.push_back(std::move(h));
    }
    return out;
}

std::string FormatConnectionError(const std::string& serverName, const std::string& errorMessage,
                                  const std::optional<std::string>& code,
                                  const std::optional<std::string>& transportType) {
    RemediationResult r = Remediate(errorMessage, code, transportType);
    std::ostringstream oss;
    oss << "MCP Server Connection Failed: " << serverName << "\n";
    oss << "Error: " << errorMessage << "\n";
    oss << "\n" << r.title << "\n";
    for (std::size_t i = 0; i < r.hints.size(); ++i) {
        oss << "  " << (i + 1) << ". " << r.hints[i] << "\n";
    }
    if (r.command.has_value()) {
        oss << "Try: " << *r.command << "\n";
    }
    return oss.str();
}

} // namespace errors
} // namespace mcplink
