//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFramer.cpp
// Purpose: Content-Length and newline-delimited framers for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include "logging/Logger.h"
#include "mcplink/transport/MessageFramer.h"

namespace mcplink {
namespace transport {

std::optional<std::string> IMessageFramer::tryDecode(std::string& buffer) {
    while (true) {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Incomplete) {
            return std::nullopt;
        }
        const std::size_t drop = std::min(r.bytesConsumed, buffer.size());
        buffer.erase(0, drop);
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        if (drop == 0) {
            // Nothing to skip; wait for more input rather than spin.
            return std::nullopt;
        }
    }
}

namespace {

std::string lowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimAscii(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

////////////////////////////////////////// Content-Length //////////////////////////////////////////
class ContentLengthFramer : public IMessageFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        static const std::string kSep = "\r\n\r\n";
        const std::size_t headerEnd = buffer.find(kSep);
        if (headerEnd == std::string::npos) {
            return {DecodeStatus::Incomplete, std::nullopt, 0};
        }
        const std::size_t bodyStart = headerEnd + kSep.size();

        std::optional<std::size_t> length;
        std::size_t pos = 0;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            const auto colon = line.find(':');
            if (colon == std::string::npos || lowerAscii(trimAscii(line.substr(0, colon))) != "content-length") {
                continue;
            }
            const std::string value = trimAscii(line.substr(colon + 1));
            unsigned long long parsed = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return {DecodeStatus::InvalidHeader, std::nullopt, bodyStart};
            }
            if (parsed > maxContentLength) {
                LOG_WARN("Content-Length {} exceeds limit {}", parsed, maxContentLength);
                return {DecodeStatus::BodyTooLarge, std::nullopt, bodyStart};
            }
            length = static_cast<std::size_t>(parsed);
        }

        if (!length.has_value()) {
            LOG_WARN("Frame without Content-Length header");
            return {DecodeStatus::InvalidHeader, std::nullopt, bodyStart};
        }
        if (buffer.size() < bodyStart + *length) {
            return {DecodeStatus::Incomplete, std::nullopt, 0};
        }
        return {DecodeStatus::Ok, buffer.substr(bodyStart, *length), bodyStart + *length};
    }

private:
    std::size_t maxContentLength;
};

////////////////////////////////////////// Newline-delimited //////////////////////////////////////////
class NewlineFramer : public IMessageFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = payload;
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            const std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Unterminated line exceeds limit {}", maxLineLength);
                    return {DecodeStatus::BodyTooLarge, std::nullopt, buffer.size()};
                }
                return {DecodeStatus::Incomplete, std::nullopt, 0};
            }
            std::string line = buffer.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (trimAscii(line).empty()) {
                start = nl + 1;
                continue;
            }
            if (line.size() > maxLineLength) {
                return {DecodeStatus::BodyTooLarge, std::nullopt, nl + 1};
            }
            return {DecodeStatus::Ok, std::move(line), nl + 1};
        }
    }

private:
    std::size_t maxLineLength;
};

} // namespace

std::unique_ptr<IMessageFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IMessageFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IMessageFramer> MakeFramer(FramingMode mode) {
    if (mode == FramingMode::ContentLength) {
        return MakeContentLengthFramer();
    }
    return MakeNewlineFramer();
}

} // namespace transport
} // namespace mcplink
