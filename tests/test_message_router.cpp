//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter classification and dispatch
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphub/JsonRpcMessageRouter.h"
#include "mcphub/JSONRPCTypes.h"

namespace mcphub {

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();

    JSONRPCRequest req; req.id = std::string("id-1"); req.method = std::string("ping");
    EXPECT_EQ(router->classify(req.Serialize()), IJsonRpcMessageRouter::MessageKind::Request);

    JSONRPCResponse resp; resp.id = std::string("id-1"); resp.result = JSONValue(static_cast<int64_t>(123));
    EXPECT_EQ(router->classify(resp.Serialize()), IJsonRpcMessageRouter::MessageKind::Response);

    JSONRPCNotification note{"notifications/message", std::nullopt};
    EXPECT_EQ(router->classify(note.Serialize()), IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyInvalidJsonIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(std::string("{")), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(std::string("[1,2]")), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ClassifyIdWithoutMethodIsResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(std::string("{\"jsonrpc\":\"2.0\",\"id\":7}")),
              IJsonRpcMessageRouter::MessageKind::Response);
}

TEST(Router, ClassifyNestedKeysIgnored) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(std::string("{\"jsonrpc\":\"2.0\",\"method\":\"m\",\"params\":{\"id\":\"x\",\"result\":{}}}")),
              IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyUnknownWhenNoKeys) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(std::string("{\"jsonrpc\":\"2.0\"}")), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, RouteResponseResolvesWithResultAndError) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    std::vector<JSONRPCResponse> resolved;
    auto resolve = [&](JSONRPCResponse&& r) { resolved.push_back(std::move(r)); };

    EXPECT_FALSE(router->route("{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":{\"ok\":true}}", handlers, resolve).has_value());
    EXPECT_FALSE(router->route("{\"jsonrpc\":\"2.0\",\"id\":4,\"error\":{\"code\":-32602,\"message\":\"bad\"}}",
                               handlers, resolve).has_value());
    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(resolved[0].id), 3);
    EXPECT_FALSE(resolved[0].IsError());
    EXPECT_EQ(std::get<int64_t>(resolved[1].id), 4);
    EXPECT_TRUE(resolved[1].IsError());
}

TEST(Router, MalformedBodiesAreDropped) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    int resolvedCount = 0;
    auto resolve = [&](JSONRPCResponse&&) { ++resolvedCount; };
    EXPECT_FALSE(router->route("{", handlers, resolve).has_value());
    EXPECT_FALSE(router->route("{\"jsonrpc\":\"2.0\",\"id\":9}", handlers, resolve).has_value());
    EXPECT_FALSE(router->route("{\"jsonrpc\":\"2.0\"}", handlers, resolve).has_value());
    EXPECT_EQ(resolvedCount, 0);
}

TEST(Router, DefaultRequestHandlerAnswersPing) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route("{\"jsonrpc\":\"2.0\",\"id\":\"srv-1\",\"method\":\"ping\"}", handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_FALSE(parsed.IsError());
    EXPECT_EQ(std::get<std::string>(parsed.id), "srv-1");
    ASSERT_TRUE(parsed.result.has_value());
    EXPECT_TRUE(parsed.result->isObject());
}

TEST(Router, DefaultRequestHandlerRejectsOtherMethods) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"sampling/createMessage\"}", handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    ASSERT_TRUE(parsed.IsError());
    EXPECT_EQ(GetIntMember(*parsed.error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);
}

TEST(Router, RouteRequestHandlerThrowsReturnsErrorResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req; req.id = std::string("t-1"); req.method = std::string("boom");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        throw std::runtime_error("handler threw");
    };
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(req.Serialize(), handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_EQ(std::get<std::string>(parsed.id), "t-1");
}

TEST(Router, RouteRequestNullIdPreservedInResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req; req.id = nullptr; req.method = std::string("noop");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest& r) -> std::unique_ptr<JSONRPCResponse> {
        return std::make_unique<JSONRPCResponse>(r.id, JSONValue(static_cast<int64_t>(1)));
    };
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(req.Serialize(), handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(parsed.id));
}

TEST(Router, RouteNotificationDispatches) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCNotification note{"notifications/progress", std::nullopt};
    std::string method;
    RouterHandlers handlers{};
    handlers.notificationHandler = [&](std::unique_ptr<JSONRPCNotification> n) { method = n->method; };
    auto resolve = [](JSONRPCResponse&&) {};
    EXPECT_FALSE(router->route(note.Serialize(), handlers, resolve).has_value());
    EXPECT_EQ(method, "notifications/progress");
}

} // namespace mcphub
