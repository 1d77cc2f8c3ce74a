//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport interface between a Connection and one tool server process
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mcphub {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;
struct ServerDescriptor;
struct TransportLimits;
namespace errors { struct McpError; }

//==========================================================================================================
// ITransport
// Purpose: Request/response channel to a single peer. Every pending request is settled exactly once,
//          with either the peer's response or a locally synthesized error response.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop (for child-process transports this spawns the process).
    // Returns:
    //   A future that completes when the transport is running, or carries the spawn failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport, fails pending requests and releases resources.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected (peer alive and writable).
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Request to send; its id is assigned by the transport.
    // Returns:
    //   Future resolving to the response. Local failures (timeout, write failure, close) are encoded
    //   as error responses carrying the hub error codes.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the frame has been written; carries an exception on write failure.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Answers requests initiated by the peer; the returned response is written back.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler for connection-level failures.
    // Args:
    //   handler: Receives a typed error; category Protocol for framing/parse failures and
    //            ConnectionClosed when the peer exits or the channel breaks.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const errors::McpError& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Creates the transport for one server descriptor. Tests substitute their own factory.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    virtual std::unique_ptr<ITransport> CreateTransport(const ServerDescriptor& server,
                                                        const TransportLimits& limits) = 0;
};

} // namespace mcphub
