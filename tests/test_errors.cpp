//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>

#include "mcphub/JSONRPCTypes.h"
#include "mcphub/errors/Errors.h"

using namespace mcphub;
using mcphub::errors::ErrorCategory;

TEST(Errors, CategoryMapping) {
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, HubCodesMapToTaxonomy) {
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::SpawnFailed), ErrorCategory::SpawnFailure);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ProtocolError), ErrorCategory::Protocol);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RequestTimeout), ErrorCategory::Timeout);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::WriteFailed), ErrorCategory::WriteFailure);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ConnectionClosed), ErrorCategory::ConnectionClosed);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ConnectionNotReady), ErrorCategory::ConnectionNotReady);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolUnavailable), ErrorCategory::ToolUnavailable);
    EXPECT_STREQ(errors::categoryName(ErrorCategory::Timeout), "timeout");
}

TEST(Errors, ErrorValueRoundTripKeepsData) {
    JSONValue::Object dataObj;
    dataObj["detail"] = std::make_shared<JSONValue>(std::string("x"));
    auto err = errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad", JSONValue(dataObj));
    auto parsed = errors::mcpErrorFromErrorValue(errors::makeErrorValue(err));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, "bad");
    EXPECT_EQ(parsed->category, ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetStringMember(*parsed->data, "detail").value_or(""), "x");
}

TEST(Errors, ErrorObjectWithoutCodeIsRejected) {
    JSONValue::Object o;
    o["message"] = std::make_shared<JSONValue>(std::string("no code"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(o)).has_value());
}

TEST(Errors, MalformedErrorInResponseBecomesInternal) {
    JSONRPCResponse resp(static_cast<int64_t>(5), JSONValue(std::string("oops")), true);
    auto err = errors::mcpErrorFromResponse(resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InternalError);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_TRUE(err->data->isString());
}

TEST(Errors, SuccessResponseHasNoError) {
    JSONRPCResponse resp(static_cast<int64_t>(5), JSONValue(JSONValue::Object{}));
    EXPECT_FALSE(errors::mcpErrorFromResponse(resp).has_value());
}

TEST(Errors, MakeErrorResponseCarriesIdAndCode) {
    auto resp = errors::makeErrorResponse(std::string("abc"),
                                          errors::makeError(JSONRPCErrorCodes::RequestTimeout, "Request timed out"));
    ASSERT_TRUE(resp);
    EXPECT_TRUE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resp->id), "abc");
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->category, ErrorCategory::Timeout);
}

TEST(Errors, McpExceptionTravelsThroughFuture) {
    std::promise<int> p;
    auto f = p.get_future();
    p.set_exception(std::make_exception_ptr(errors::McpException(JSONRPCErrorCodes::ConnectionClosed, "closed")));
    try {
        (void)f.get();
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectionClosed);
        EXPECT_EQ(e.category(), ErrorCategory::ConnectionClosed);
        EXPECT_STREQ(e.what(), "closed");
    }
}
