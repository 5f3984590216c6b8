//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

TEST(Errors, CategoryMapping) {
    using mcplink::errors::ErrorCategory;
    using mcplink::errors::errorCategoryFromCode;
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, TypedErrorFromResponse) {
    JSONValue::Object data;
    SetMember(data, "field", JSONValue("name"));
    auto resp = CreateErrorResponse(std::string("7"), JSONRPCErrorCodes::InvalidParams, "bad name", JSONValue(data));

    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(err->message, "bad name");
    EXPECT_EQ(err->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(GetStringMember(*err->data, "field").value_or(""), "name");
    EXPECT_EQ(errors::describeResponseError(*resp), "bad name (code -32602)");

    JSONValue round = errors::makeErrorValue(*err);
    EXPECT_TRUE(JSONEquals(round, *resp->error));
}

TEST(Errors, SuccessAndMalformedResponses) {
    JSONRPCResponse ok(std::string("1"), JSONValue(true));
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());

    JSONRPCResponse malformed(std::string("2"), JSONValue("oops"), true);
    EXPECT_FALSE(errors::mcpErrorFromResponse(malformed).has_value());
    EXPECT_EQ(errors::describeResponseError(malformed), "Malformed error response");
}
