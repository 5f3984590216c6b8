//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderConfig.h
// Purpose: Tool provider configuration: JSON parsing, legacy normalization and validation
//==========================================================================================================

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace provider {

// Applied when a config sets neither timeoutMs nor initTimeoutMs; MCPLINK_REQUEST_TIMEOUT_MS overrides it.
constexpr uint64_t kDefaultProviderTimeoutMs = 60000;

//==========================================================================================================
// ProviderConfig
// Purpose: Everything needed to connect one provider.
// Fields:
//   transport: Always populated. A legacy config (top-level command/args/env, no transport) is normalized
//              to a stdio transport and flagged with legacy = true.
//   timeoutMs: Bound on each tools/call and tools/list request; also the transport's request deadline.
//   initTimeoutMs: Bound on the initialize handshake.
//==========================================================================================================
struct ProviderConfig {
    std::string name;
    transport::TransportConfig transport;
    uint64_t timeoutMs{kDefaultProviderTimeoutMs};
    uint64_t initTimeoutMs{kDefaultProviderTimeoutMs};
    bool quiet{false};
    bool legacy{false};
};

// Malformed or inconsistent provider configuration.
class ProviderConfigError : public std::runtime_error {
public:
    explicit ProviderConfigError(const std::string& message) : std::runtime_error(message) {}
};

// kDefaultProviderTimeoutMs unless MCPLINK_REQUEST_TIMEOUT_MS holds a positive integer.
uint64_t DefaultProviderTimeoutMs();

//==========================================================================================================
// ParseProviderConfig
// Purpose: Builds a ProviderConfig from one server entry.
// Args:
//   name: Provider name; must satisfy invariants::IsValidServerName.
//   json: {transport:{type, command, args, env, url, headers, framing}, timeoutMs?, initTimeoutMs?,
//          quiet?} or the legacy {command, args?, env?, ...}. "timeout"/"initTimeout" are accepted as
//          aliases of the millisecond fields.
// Throws:
//   ProviderConfigError describing the first problem found.
//==========================================================================================================
ProviderConfig ParseProviderConfig(const std::string& name, const JSONValue& json);

//==========================================================================================================
// ParseProviderConfigs
// Purpose: Parses a whole document: {"mcpServers": {"<name>": {...}}} or an array of {name, ...}.
// Returns:
//   Configs ordered by name for the object form, in document order for the array form.
// Throws:
//   ProviderConfigError for an unrecognized document, a bad entry or a repeated name.
//==========================================================================================================
std::vector<ProviderConfig> ParseProviderConfigs(const JSONValue& document);

// Reads and parses a configuration file. Throws ProviderConfigError for I/O and JSON errors too.
std::vector<ProviderConfig> LoadProviderConfigFile(const std::string& path);

// Modern-form JSON including "name". Parsing it back yields the same config, with legacy cleared.
JSONValue ToJSON(const ProviderConfig& config);

} // namespace provider
} // namespace mcplink
