//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Readiness state machine and MCP operations for one tool server
//==========================================================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphub/JSONRPCTypes.h"
#include "mcphub/Protocol.h"
#include "mcphub/Transport.h"
#include "mcphub/errors/Errors.h"

namespace mcphub {

enum class ConnectionState {
    Idle,
    Initializing,
    Ready,
    Error,
    Disconnected
};

const char* ToString(ConnectionState state);

//==========================================================================================================
// ConnectionOptions
// Purpose: Readiness probe and handshake settings (normally taken from the ServerDescriptor).
//==========================================================================================================
struct ConnectionOptions {
    std::string probeMethod{"tools/list"};
    std::optional<JSONValue> probeParams;
    bool handshake{false};
    Implementation clientInfo;
};

//==========================================================================================================
// Connection
// Purpose: Wraps one transport with the idle -> initializing -> ready lifecycle.
// Notes:
//   - Initialize() is accepted from Idle, Disconnected and Error; it (re)starts the transport, runs the
//     optional MCP handshake, then the readiness probe. Failure leaves the state at Error and terminates
//     the server process.
//   - A protocol error while Ready moves to Error and closes the transport in the background.
//   - Process exit or channel loss moves to Disconnected from any state.
//   - Operations fail with ConnectionNotReady unless IsReady(); errors reported by the server surface as
//     errors::McpException with the server's code, message and data.
//==========================================================================================================
class Connection {
public:
    using NotificationListener = std::function<void(const JSONRPCNotification&)>;
    using StateListener = std::function<void(ConnectionState from, ConnectionState to)>;

    Connection(std::string serverId, std::unique_ptr<ITransport> transport,
               ConnectionOptions options = ConnectionOptions{});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //======================================================================================================
    // Initialize
    // Returns:
    //   Future completing when the connection is Ready; carries errors::McpException on failure.
    //======================================================================================================
    std::future<void> Initialize();

    bool IsReady() const;
    ConnectionState State() const;
    const std::string& ServerId() const;
    std::string GetSessionId() const;

    // Last connection-level failure (spawn, probe, protocol, exit), if any.
    std::optional<errors::McpError> LastError() const;

    ////////////////////////////////////////// Operations //////////////////////////////////////////
    std::future<std::vector<Tool>> ListTools();
    std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments);
    std::future<std::vector<Resource>> ListResources();
    std::future<ReadResourceResult> ReadResource(const std::string& uri);
    std::future<std::vector<Prompt>> ListPrompts();
    std::future<GetPromptResult> GetPrompt(const std::string& name, const JSONValue& arguments);

    //======================================================================================================
    // Close
    // Purpose: Fails pending calls with "Client connection closed", terminates the process and moves to
    //          Disconnected.
    //======================================================================================================
    std::future<void> Close();

    ////////////////////////////////////////// Listeners //////////////////////////////////////////
    // method "" receives every notification. Listeners run on the transport reader thread.
    uint64_t AddNotificationListener(const std::string& method, NotificationListener listener);
    void RemoveNotificationListener(uint64_t listenerId);
    uint64_t AddStateListener(StateListener listener);
    void RemoveStateListener(uint64_t listenerId);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphub
