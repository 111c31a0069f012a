//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

TEST(Errors, CategoryMapping) {
    using mcphost::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, McpErrorFromWellFormedObject) {
    JSONValue obj = ParseJSON(R"({"code":-32602,"message":"bad args","data":{"field":"x"}})");
    auto e = errors::mcpErrorFromErrorValue(obj);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(e->message, "bad args");
    ASSERT_TRUE(e->data.has_value());
    EXPECT_TRUE(e->data->isObject());
    EXPECT_EQ(e->category, errors::ErrorCategory::JsonRpcInvalidParams);
}

TEST(Errors, McpErrorToleratesLooseShapes) {
    auto noCode = errors::mcpErrorFromErrorValue(ParseJSON(R"({"message":"boom"})"));
    ASSERT_TRUE(noCode.has_value());
    EXPECT_EQ(noCode->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(noCode->message, "boom");

    auto noMessage = errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":7})"));
    ASSERT_TRUE(noMessage.has_value());
    EXPECT_EQ(noMessage->code, 7);
    EXPECT_EQ(noMessage->message, "{\"code\":7}");

    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON("\"just text\"")).has_value());
}

TEST(Errors, FromResponseAndBack) {
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.FromValue(ParseJSON(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32003,"message":"no tool"}})")));
    auto e = errors::mcpErrorFromResponse(resp);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->category, errors::ErrorCategory::McpToolNotFound);

    JSONValue back = errors::makeErrorValue(*e);
    EXPECT_EQ(std::get<int64_t>(back.find("code")->value), -32003);
    EXPECT_EQ(std::get<std::string>(back.find("message")->value), "no tool");
}

TEST(Errors, TransportErrorCarriesCodeAndPeer) {
    errors::McpError peer;
    peer.code = -1;
    peer.message = "denied";
    errors::TransportError err(errors::ErrorCode::RequestRejected, "tools/call: denied", peer);
    EXPECT_EQ(err.code(), errors::ErrorCode::RequestRejected);
    ASSERT_TRUE(err.peer().has_value());
    EXPECT_EQ(err.peer()->message, "denied");
    EXPECT_STREQ(err.what(), "tools/call: denied");
    EXPECT_STREQ(errors::errorCodeName(err.code()), "RequestRejected");
}

TEST(Errors, ErrorCodeOfExceptionPtr) {
    auto ep = std::make_exception_ptr(errors::TransportError(errors::ErrorCode::NotConnected, "x"));
    ASSERT_TRUE(errors::errorCodeOf(ep).has_value());
    EXPECT_EQ(errors::errorCodeOf(ep).value(), errors::ErrorCode::NotConnected);
    EXPECT_FALSE(errors::errorCodeOf(std::make_exception_ptr(std::runtime_error("plain"))).has_value());
    EXPECT_FALSE(errors::errorCodeOf(nullptr).has_value());
}
