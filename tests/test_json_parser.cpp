//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Tests for the JSON value model, parser/serializer and JSON-RPC message validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "mcphub/JSONRPCTypes.h"

using namespace mcphub;

TEST(JsonParser, ParsesNestedDocument) {
    JSONValue v = ParseJSON(" {\"a\": [1, 2.5, true, null, \"x\"], \"b\": {\"c\": -7}} ");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_TRUE(std::get<bool>(arr[2]->value));
    EXPECT_TRUE(arr[3]->isNull());
    EXPECT_EQ(std::get<std::string>(arr[4]->value), "x");
    EXPECT_EQ(GetIntMember(*FindMember(v, "b"), "c").value_or(0), -7);
}

TEST(JsonParser, SerializeSortsObjectKeys) {
    JSONValue v = ParseJSON("{\"zeta\":1,\"alpha\":{\"y\":2,\"b\":3},\"mid\":[]}");
    EXPECT_EQ(SerializeJSON(v), "{\"alpha\":{\"b\":3,\"y\":2},\"mid\":[],\"zeta\":1}");
}

TEST(JsonParser, DecodesUnicodeEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON("\"caf\\u00e9 \\ud83d\\ude00\"");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonParser, EscapesControlCharactersOnOutput) {
    JSONValue v(std::string("a\"b\\c\n\x01"));
    EXPECT_EQ(SerializeJSON(v), "\"a\\\"b\\\\c\\n\\u0001\"");
}

TEST(JsonParser, RejectsMalformedInput) {
    for (const char* bad : {"", "{", "[1,]", "{\"a\" 1}", "\"unterminated", "tru", "1.", "-", "{} x", "\"\\q\""}) {
        EXPECT_THROW(ParseJSON(bad), std::runtime_error) << bad;
    }
}

TEST(JsonParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);

    std::string ok(100, '[');
    ok += std::string(100, ']');
    EXPECT_NO_THROW(ParseJSON(ok));
}

TEST(JsonParser, IntegerBeyondInt64BecomesDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
    JSONValue small = ParseJSON("9007199254740993");
    EXPECT_EQ(std::get<int64_t>(small.value), 9007199254740993LL);
}

TEST(JsonParser, NonFiniteDoubleSerializesAsNull) {
    EXPECT_EQ(SerializeJSON(JSONValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(SerializeJSON(JSONValue(std::nan(""))), "null");
}

TEST(JsonParser, MemberHelpersAreTypeChecked) {
    JSONValue v = ParseJSON("{\"s\":\"text\",\"i\":3,\"b\":false}");
    EXPECT_EQ(GetStringMember(v, "s").value_or(""), "text");
    EXPECT_FALSE(GetStringMember(v, "i").has_value());
    EXPECT_EQ(GetIntMember(v, "i").value_or(0), 3);
    EXPECT_FALSE(GetIntMember(v, "s").has_value());
    EXPECT_EQ(GetBoolMember(v, "b"), std::optional<bool>(false));
    EXPECT_EQ(FindMember(v, "missing"), nullptr);
    EXPECT_EQ(FindMember(JSONValue(static_cast<int64_t>(1)), "s"), nullptr);
}

TEST(JsonRpcMessages, RequestRoundTrip) {
    JSONRPCRequest req(static_cast<int64_t>(42), "tools/call", ParseJSON("{\"name\":\"echo\"}"));
    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(req.Serialize()));
    EXPECT_EQ(std::get<int64_t>(parsed.id), 42);
    EXPECT_EQ(parsed.method, "tools/call");
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(GetStringMember(*parsed.params, "name").value_or(""), "echo");
}

TEST(JsonRpcMessages, RequestRequiresMethodAndId) {
    JSONRPCRequest r;
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"method\":\"x\"}"));
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1}"));
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"\"}"));
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":[1],\"method\":\"x\"}"));
    EXPECT_FALSE(r.Deserialize("not json"));
}

TEST(JsonRpcMessages, ResponseNeedsResultOrError) {
    JSONRPCResponse r;
    EXPECT_FALSE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1}"));
    EXPECT_TRUE(r.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":null}"));
    EXPECT_FALSE(r.IsError());
}

TEST(JsonRpcMessages, NotificationMustNotCarryId) {
    JSONRPCNotification n;
    EXPECT_TRUE(n.Deserialize("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}"));
    EXPECT_EQ(n.method, "notifications/message");
    JSONRPCNotification withId;
    EXPECT_FALSE(withId.Deserialize("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"x\"}"));
}

TEST(JsonRpcMessages, IdToString) {
    EXPECT_EQ(JSONRPCIdToString(JSONRPCId{static_cast<int64_t>(7)}), "7");
    EXPECT_EQ(JSONRPCIdToString(JSONRPCId{std::string("abc")}), "abc");
}
