//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_framer.cpp
// Purpose: Tests for the Content-Length and newline-delimited framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcplink/transport/MessageFramer.h"

using namespace mcplink::transport;

TEST(ContentLengthFramer, EncodeProducesHeader) {
    auto framer = MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramer, DecodesAtSizeLimit) {
    auto framer = MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 4\r\n\r\nabcd";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IMessageFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(*ex.payload, "abcd");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramer, OversizedBodyIsDroppedByTryDecode) {
    auto framer = MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcdeContent-Length: 2\r\n\r\n{}";
    EXPECT_EQ(framer->tryDecodeEx(buffer).status, IMessageFramer::DecodeStatus::BodyTooLarge);
    // Resync drops the oversized header; its leftover body spoils the next header, which is dropped too.
    auto first = framer->tryDecode(buffer);
    EXPECT_FALSE(first.has_value());
}

TEST(ContentLengthFramer, InvalidLengthIsReported) {
    auto framer = MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: abc\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IMessageFramer::DecodeStatus::InvalidHeader);
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramer, MissingHeaderAndIncompleteInput) {
    auto framer = MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->tryDecodeEx("Content-Type: x\r\n\r\n{}").status, IMessageFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("Content-Leng").status, IMessageFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: 10\r\n\r\n{}").status, IMessageFramer::DecodeStatus::Incomplete);
}

TEST(ContentLengthFramer, HeaderNameIsCaseInsensitiveAndFramesChain) {
    auto framer = MakeContentLengthFramer(1024);
    std::string buffer = "content-length: 2\r\n\r\n{}" + framer->encode("[1]");
    auto a = framer->tryDecode(buffer);
    auto b = framer->tryDecode(buffer);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "{}");
    EXPECT_EQ(*b, "[1]");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramer, SplitsLinesAndStripsCarriageReturn) {
    auto framer = MakeNewlineFramer();
    EXPECT_EQ(framer->encode("{\"a\":1}"), "{\"a\":1}\n");
    std::string buffer = "{\"a\":1}\r\n\n{\"b\":2}\n{\"c\"";
    auto a = framer->tryDecode(buffer);
    auto b = framer->tryDecode(buffer);
    auto c = framer->tryDecode(buffer);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "{\"a\":1}");
    EXPECT_EQ(*b, "{\"b\":2}");
    EXPECT_FALSE(c.has_value());
    EXPECT_EQ(buffer, "{\"c\"");
}

TEST(NewlineFramer, OverlongUnterminatedLineIsDiscarded) {
    auto framer = MakeNewlineFramer(8);
    std::string buffer(32, 'x');
    EXPECT_EQ(framer->tryDecodeEx(buffer).status, IMessageFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_TRUE(buffer.empty());
}

TEST(MessageFramer, FactorySelectsByMode) {
    EXPECT_EQ(MakeFramer(FramingMode::Ndjson)->encode("x"), "x\n");
    EXPECT_EQ(MakeFramer(FramingMode::ContentLength)->encode("x"), "Content-Length: 1\r\n\r\nx");
}
