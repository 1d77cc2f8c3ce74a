//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Connection state machine, readiness probe and coroutine-based MCP operations
//==========================================================================================================

#include "mcphub/Connection.h"

#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include "logging/Logger.h"
#include "mcphub/async/Coroutine.h"
#include "mcphub/version.h"

namespace mcphub {

using ResponsePtr = std::unique_ptr<JSONRPCResponse>;

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle: return "idle";
        case ConnectionState::Initializing: return "initializing";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Error: return "error";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

namespace {

//==========================================================================================================
// unwrapResult
// Purpose: Turns a response into its result value.
// Throws:
//   errors::McpException carrying the server's (or the transport's local) error.
//==========================================================================================================
JSONValue unwrapResult(const ResponsePtr& response, const std::string& serverId, const std::string& method) {
    if (!response) {
        throw errors::McpException(JSONRPCErrorCodes::InternalError, "Empty response for " + method);
    }
    if (auto err = errors::mcpErrorFromResponse(*response)) {
        LOG_DEBUG("[{}] {} failed: {} ({})", serverId, method, err->message, err->code);
        throw errors::McpException(std::move(err.value()));
    }
    if (!response->result.has_value()) {
        throw errors::McpException(JSONRPCErrorCodes::InternalError, "Response without result for " + method);
    }
    return response->result.value();
}

// Coroutine bodies only use their own parameters after suspension; the Connection may be gone by then.
template <typename R, typename Parse>
async::Task<R> coCall(std::future<ResponsePtr> fut, std::string serverId, std::string method, Parse parse) {
    auto response = co_await async::awaitFuture(std::move(fut));
    co_return parse(unwrapResult(response, serverId, method));
}

std::future<ResponsePtr> failedResponse(const errors::McpError& err) {
    std::promise<ResponsePtr> p;
    p.set_exception(std::make_exception_ptr(errors::McpException(err)));
    return p.get_future();
}

JSONValue::Object object() { return JSONValue::Object{}; }

} // namespace

class Connection::Impl : public std::enable_shared_from_this<Connection::Impl> {
public:
    std::string serverId;
    ConnectionOptions options;
    mutable std::mutex stateMutex;
    ConnectionState state{ConnectionState::Idle};
    std::optional<errors::McpError> lastError;

    std::mutex listenerMutex;
    uint64_t nextListenerId{1};
    std::map<uint64_t, std::pair<std::string, NotificationListener>> notificationListeners;
    std::map<uint64_t, StateListener> stateListeners;

    // Declared last so it is destroyed (and its reader joined) before the members above.
    std::unique_ptr<ITransport> transport;

    Impl(std::string id, std::unique_ptr<ITransport> t, ConnectionOptions opts)
        : serverId(std::move(id)), options(std::move(opts)), transport(std::move(t)) {
        if (options.clientInfo.name.empty()) {
            options.clientInfo = getClientInfo();
        }
    }

    void attachHandlers() {
        std::weak_ptr<Impl> weak = weak_from_this();
        transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            if (n) {
                dispatchNotification(*n);
            }
        });
        transport->SetErrorHandler([this, weak](const errors::McpError& err) {
            onTransportError(err, weak);
        });
    }

    ConnectionState currentState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    void notifyState(ConnectionState from, ConnectionState to) {
        if (from == to) {
            return;
        }
        LOG_INFO("[{}] state {} -> {}", serverId, ToString(from), ToString(to));
        std::vector<StateListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            for (const auto& kv : stateListeners) {
                listeners.push_back(kv.second);
            }
        }
        for (auto& l : listeners) {
            l(from, to);
        }
    }

    void setState(ConnectionState to) {
        ConnectionState from;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            from = state;
            state = to;
        }
        notifyState(from, to);
    }

    void recordError(const errors::McpError& err) {
        std::lock_guard<std::mutex> lock(stateMutex);
        lastError = err;
    }

    void dispatchNotification(const JSONRPCNotification& n) {
        LOG_INFO("[{}] notification {}", serverId, n.method);
        std::vector<NotificationListener> matching;
        {
            std::lock_guard<std::mutex> lock(listenerMutex);
            for (const auto& kv : notificationListeners) {
                if (kv.second.first.empty() || kv.second.first == n.method) {
                    matching.push_back(kv.second.second);
                }
            }
        }
        for (auto& l : matching) {
            l(n);
        }
    }

    void onTransportError(const errors::McpError& err, const std::weak_ptr<Impl>& weak) {
        recordError(err);
        if (err.category == errors::ErrorCategory::Protocol) {
            ConnectionState from;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                from = state;
                if (state == ConnectionState::Ready) {
                    state = ConnectionState::Error;
                }
            }
            if (from != ConnectionState::Ready) {
                // Initialize() sees the failed probe and closes on its own
                LOG_WARN("[{}] protocol error while {}: {}", serverId, ToString(from), err.message);
                return;
            }
            LOG_ERROR("[{}] protocol error: {}; closing connection", serverId, err.message);
            notifyState(from, ConnectionState::Error);
            // This runs on the transport reader thread, which Close() joins
            std::thread([weak]() {
                if (auto self = weak.lock()) {
                    self->transport->Close().wait();
                }
            }).detach();
            return;
        }
        if (err.category == errors::ErrorCategory::ConnectionClosed) {
            LOG_WARN("[{}] {}", serverId, err.message);
            ConnectionState from;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                from = state;
                // Initialize() owns the outcome while it runs; a recorded Error is kept
                if (state == ConnectionState::Ready || state == ConnectionState::Idle) {
                    state = ConnectionState::Disconnected;
                }
            }
            if (from == ConnectionState::Ready || from == ConnectionState::Idle) {
                notifyState(from, ConnectionState::Disconnected);
            }
            return;
        }
        LOG_WARN("[{}] transport error ({}): {}", serverId, errors::categoryName(err.category), err.message);
    }

    std::future<ResponsePtr> send(const std::string& method, std::optional<JSONValue> params) {
        if (currentState() != ConnectionState::Ready || !transport->IsConnected()) {
            return failedResponse(errors::makeError(JSONRPCErrorCodes::ConnectionNotReady,
                fmt::format("Server '{}' is not ready (state: {})", serverId, ToString(currentState()))));
        }
        return transport->SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId{}, method, std::move(params)));
    }

    JSONValue handshakeParams() const {
        JSONValue::Object clientInfo;
        clientInfo["name"] = std::make_shared<JSONValue>(options.clientInfo.name);
        clientInfo["version"] = std::make_shared<JSONValue>(options.clientInfo.version);
        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        params["capabilities"] = std::make_shared<JSONValue>(object());
        params["clientInfo"] = std::make_shared<JSONValue>(std::move(clientInfo));
        return JSONValue{std::move(params)};
    }

    //======================================================================================================
    // coInitialize
    // Purpose: Start transport, optional handshake, readiness probe. self keeps Impl alive across awaits.
    //======================================================================================================
    static async::Task<void> coInitialize(std::shared_ptr<Impl> self) {
        std::optional<errors::McpError> failure;
        const std::string& id = self->serverId;

        try {
            if (!self->transport->IsConnected()) {
                auto started = self->transport->Start();
                co_await async::awaitFuture(std::move(started));
            }
        } catch (const errors::McpException& e) {
            failure = e.error();
        } catch (const std::exception& e) {
            failure = errors::makeError(JSONRPCErrorCodes::SpawnFailed, e.what());
        }

        if (!failure.has_value() && self->options.handshake) {
            LOG_INFO("[{}] initialize handshake", id);
            auto fut = self->transport->SendRequest(std::make_unique<JSONRPCRequest>(
                JSONRPCId{}, Methods::Initialize, self->handshakeParams()));
            try {
                auto response = co_await async::awaitFuture(std::move(fut));
                (void)unwrapResult(response, id, Methods::Initialize);
            } catch (const errors::McpException& e) {
                failure = e.error();
            }
            if (!failure.has_value()) {
                auto sent = self->transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
                try {
                    co_await async::awaitFuture(std::move(sent));
                } catch (const errors::McpException& e) {
                    failure = e.error();
                }
            }
        }

        if (!failure.has_value()) {
            LOG_DEBUG("[{}] readiness probe {}", id, self->options.probeMethod);
            auto fut = self->transport->SendRequest(std::make_unique<JSONRPCRequest>(
                JSONRPCId{}, self->options.probeMethod, self->options.probeParams));
            try {
                auto response = co_await async::awaitFuture(std::move(fut));
                (void)unwrapResult(response, id, self->options.probeMethod);
            } catch (const errors::McpException& e) {
                failure = e.error();
            }
        }

        if (!failure.has_value() && !self->transport->IsConnected()) {
            failure = errors::makeError(JSONRPCErrorCodes::ConnectionClosed,
                                        "Server process went away during initialization");
        }

        if (!failure.has_value()) {
            self->setState(ConnectionState::Ready);
            co_return;
        }

        LOG_ERROR("[{}] initialization failed ({}): {}", id, errors::categoryName(failure->category), failure->message);
        self->recordError(failure.value());
        self->setState(ConnectionState::Error);
        co_await async::awaitFuture(self->transport->Close());
        throw errors::McpException(failure.value());
    }
};

Connection::Connection(std::string serverId, std::unique_ptr<ITransport> transport, ConnectionOptions options)
    : pImpl(std::make_shared<Impl>(std::move(serverId), std::move(transport), std::move(options))) {
    FUNC_SCOPE();
    pImpl->attachHandlers();
}

Connection::~Connection() {
    FUNC_SCOPE();
    pImpl->transport->Close().wait();
}

std::future<void> Connection::Initialize() {
    FUNC_SCOPE();
    ConnectionState from;
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        from = pImpl->state;
        if (from == ConnectionState::Ready) {
            std::promise<void> p;
            p.set_value();
            return p.get_future();
        }
        if (from == ConnectionState::Initializing) {
            std::promise<void> p;
            p.set_exception(std::make_exception_ptr(errors::McpException(
                JSONRPCErrorCodes::ConnectionNotReady, "Initialization already in progress for " + pImpl->serverId)));
            return p.get_future();
        }
        pImpl->state = ConnectionState::Initializing;
    }
    pImpl->notifyState(from, ConnectionState::Initializing);
    return Impl::coInitialize(pImpl).toFuture();
}

bool Connection::IsReady() const {
    return pImpl->currentState() == ConnectionState::Ready && pImpl->transport->IsConnected();
}

ConnectionState Connection::State() const {
    return pImpl->currentState();
}

const std::string& Connection::ServerId() const {
    return pImpl->serverId;
}

std::string Connection::GetSessionId() const {
    return pImpl->transport->GetSessionId();
}

std::optional<errors::McpError> Connection::LastError() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->lastError;
}

std::future<std::vector<Tool>> Connection::ListTools() {
    FUNC_SCOPE();
    auto fut = pImpl->send(Methods::ListTools, std::nullopt);
    return coCall<std::vector<Tool>>(std::move(fut), pImpl->serverId, Methods::ListTools, &ParseToolsListResult).toFuture();
}

std::future<CallToolResult> Connection::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("[{}] calling tool {}", pImpl->serverId, name);
    auto fut = pImpl->send(Methods::CallTool, JSONValue{std::move(params)});
    return coCall<CallToolResult>(std::move(fut), pImpl->serverId, Methods::CallTool, &ParseCallToolResult).toFuture();
}

std::future<std::vector<Resource>> Connection::ListResources() {
    FUNC_SCOPE();
    auto fut = pImpl->send(Methods::ListResources, std::nullopt);
    return coCall<std::vector<Resource>>(std::move(fut), pImpl->serverId, Methods::ListResources, &ParseResourcesListResult).toFuture();
}

std::future<ReadResourceResult> Connection::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["uri"] = std::make_shared<JSONValue>(uri);
    auto fut = pImpl->send(Methods::ReadResource, JSONValue{std::move(params)});
    return coCall<ReadResourceResult>(std::move(fut), pImpl->serverId, Methods::ReadResource, &ParseReadResourceResult).toFuture();
}

std::future<std::vector<Prompt>> Connection::ListPrompts() {
    FUNC_SCOPE();
    auto fut = pImpl->send(Methods::ListPrompts, std::nullopt);
    return coCall<std::vector<Prompt>>(std::move(fut), pImpl->serverId, Methods::ListPrompts, &ParsePromptsListResult).toFuture();
}

std::future<GetPromptResult> Connection::GetPrompt(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    auto fut = pImpl->send(Methods::GetPrompt, JSONValue{std::move(params)});
    return coCall<GetPromptResult>(std::move(fut), pImpl->serverId, Methods::GetPrompt, &ParseGetPromptResult).toFuture();
}

std::future<void> Connection::Close() {
    FUNC_SCOPE();
    pImpl->transport->Close().wait();
    pImpl->setState(ConnectionState::Disconnected);
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

uint64_t Connection::AddNotificationListener(const std::string& method, NotificationListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    const uint64_t id = pImpl->nextListenerId++;
    pImpl->notificationListeners.emplace(id, std::make_pair(method, std::move(listener)));
    return id;
}

void Connection::RemoveNotificationListener(uint64_t listenerId) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->notificationListeners.erase(listenerId);
}

uint64_t Connection::AddStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    const uint64_t id = pImpl->nextListenerId++;
    pImpl->stateListeners.emplace(id, std::move(listener));
    return id;
}

void Connection::RemoveStateListener(uint64_t listenerId) {
    std::lock_guard<std::mutex> lock(pImpl->listenerMutex);
    pImpl->stateListeners.erase(listenerId);
}

} // namespace mcphub
