//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and dispatch of decoded JSON-RPC bodies received from a tool server
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcphub/JSONRPCTypes.h"
#include "mcphub/Transport.h"

namespace mcphub {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;           // optional; a default handler answers ping
    ITransport::NotificationHandler notificationHandler; // optional
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a parsed message by its top-level keys:
    //   result/error present, or id without method -> Response
    //   method with id -> Request; method without id -> Notification
    virtual MessageKind classify(const JSONValue& message) = 0;

    // Convenience overload that parses first; malformed JSON classifies as Unknown.
    virtual MessageKind classify(const std::string& json) = 0;

    // Routes one decoded body. Returns the serialized reply for peer requests; std::nullopt otherwise.
    // Malformed or unclassifiable bodies are logged and dropped.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcphub
