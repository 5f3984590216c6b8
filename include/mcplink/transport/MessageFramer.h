//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFramer.h
// Purpose: Byte-stream framing for JSON-RPC over a provider's stdio pipe
//========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcplink/transport/Transport.h"

namespace mcplink {
namespace transport {

//========================================================================================================
// IMessageFramer
// Purpose: Turns payloads into frames and extracts complete payloads from an accumulating read buffer.
//========================================================================================================
class IMessageFramer {
public:
    virtual ~IMessageFramer() = default;

    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };

    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // set when status == Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the buffer front (frame or bad header)
    };

    virtual std::string encode(const std::string& payload) = 0;

    // Inspects buffer without modifying it.
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;

    //========================================================================================================
    // tryDecode
    // Purpose: Pops the next payload from buffer. Malformed frames are dropped so the stream can resync.
    // Returns:
    //   The payload, or nullopt when more bytes are needed.
    //========================================================================================================
    std::optional<std::string> tryDecode(std::string& buffer);
};

// "Content-Length: N\r\n\r\n<payload>"
std::unique_ptr<IMessageFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);
// One JSON document per '\n'-terminated line; blank lines are skipped and a trailing '\r' is stripped.
std::unique_ptr<IMessageFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);
std::unique_ptr<IMessageFramer> MakeFramer(FramingMode mode);

} // namespace transport
} // namespace mcplink
