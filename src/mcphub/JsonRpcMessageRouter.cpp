//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message classification and routing
//========================================================================================================

#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcphub/JsonRpcMessageRouter.h"
#include "mcphub/JSONRPCTypes.h"
#include "mcphub/Protocol.h"

namespace mcphub {

namespace {

std::unique_ptr<JSONRPCResponse> defaultRequestReply(const JSONRPCRequest& request) {
    if (request.method == Methods::Ping) {
        return std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
    }
    LOG_DEBUG("Peer request '{}' is not supported; replying MethodNotFound", request.method);
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                               "Method not found: " + request.method);
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        const bool hasMethod = FindMember(message, "method") != nullptr;
        const bool hasId = FindMember(message, "id") != nullptr;
        if (FindMember(message, "result") != nullptr || FindMember(message, "error") != nullptr) {
            return MessageKind::Response;
        }
        if (hasMethod) {
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        if (hasId) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    MessageKind classify(const std::string& json) override {
        try {
            return classify(ParseJSON(json));
        } catch (const std::runtime_error& e) {
            LOG_DEBUG("Router: classify failed: {}", e.what());
            return MessageKind::Unknown;
        }
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue message;
        try {
            message = ParseJSON(json);
        } catch (const std::runtime_error& e) {
            LOG_WARN("Router: dropping malformed JSON ({}): {}", e.what(), Logger::preview(json));
            return std::nullopt;
        }

        switch (classify(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromValue(message)) {
                    LOG_WARN("Router: dropping invalid response: {}", Logger::preview(json));
                    return std::nullopt;
                }
                resolve(std::move(response));
                return std::nullopt;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(message)) {
                    LOG_WARN("Router: dropping invalid request: {}", Logger::preview(json));
                    return std::nullopt;
                }
                std::unique_ptr<JSONRPCResponse> resp;
                try {
                    resp = handlers.requestHandler ? handlers.requestHandler(request) : defaultRequestReply(request);
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                auto notification = std::make_unique<JSONRPCNotification>();
                if (!notification->FromValue(message)) {
                    LOG_WARN("Router: dropping invalid notification: {}", Logger::preview(json));
                    return std::nullopt;
                }
                if (handlers.notificationHandler) {
                    handlers.notificationHandler(std::move(notification));
                }
                return std::nullopt;
            }
            case MessageKind::Unknown:
                break;
        }
        LOG_WARN("Router: unrecognized JSON-RPC message: {}", Logger::preview(json));
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcphub
