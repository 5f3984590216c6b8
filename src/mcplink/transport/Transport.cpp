//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Transport configuration names and the default transport factory
//==========================================================================================================

#include "logging/Logger.h"
#include "mcplink/transport/HTTPTransport.hpp"
#include "mcplink/transport/StdioProcessTransport.hpp"
#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

const char* toString(TransportType type) {
    switch (type) {
        case TransportType::Stdio: return "stdio";
        case TransportType::Http: return "http";
        case TransportType::Sse: return "sse";
        case TransportType::StreamableHttp: return "streamable_http";
    }
    return "stdio";
}

std::optional<TransportType> transportTypeFromString(const std::string& s) {
    for (TransportType t : {TransportType::Stdio, TransportType::Http, TransportType::Sse,
                            TransportType::StreamableHttp}) {
        if (s == toString(t)) {
            return t;
        }
    }
    return std::nullopt;
}

const char* toString(FramingMode mode) {
    return mode == FramingMode::ContentLength ? "content-length" : "ndjson";
}

std::optional<FramingMode> framingModeFromString(const std::string& s) {
    if (s == "ndjson") return FramingMode::Ndjson;
    if (s == "content-length") return FramingMode::ContentLength;
    return std::nullopt;
}

std::unique_ptr<ITransport> DefaultTransportFactory::CreateTransport(const TransportConfig& config) {
    FUNC_SCOPE();
    switch (config.type) {
        case TransportType::Stdio:
            return std::make_unique<StdioProcessTransport>(config);
        case TransportType::Http:
        case TransportType::Sse:
        case TransportType::StreamableHttp:
            return std::make_unique<HTTPTransport>(config);
    }
    LOG_ERROR("No transport for type {}", static_cast<int>(config.type));
    return nullptr;
}

} // namespace transport
} // namespace mcplink
