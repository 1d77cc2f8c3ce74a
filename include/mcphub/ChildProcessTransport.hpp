//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcessTransport.hpp
// Purpose: Transport that spawns a tool server and speaks framed JSON-RPC over its stdio pipes
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "mcphub/Config.h"
#include "mcphub/Transport.h"

namespace mcphub {

//==========================================================================================================
// ChildProcessTransport
// Purpose: One transport per server process. Start() spawns the process; a reader thread decodes
//          Content-Length frames from its stdout and forwards stderr lines to the log.
// Notes:
//   - Requests are correlated by integer id; responses may arrive in any order.
//   - On process exit or stdout EOF every pending request fails with ConnectionClosed and the
//     error handler receives a ConnectionClosed error.
//   - On a framing error (bad header, oversize body) every pending request fails with
//     ProtocolError and the error handler receives a Protocol error; the reader stops.
//   - Start() after the process has gone away spawns a fresh process.
//   - Close() may be called from a handler; the reader thread is joined later by Start(), Close()
//     or the destructor on another thread. Start() from a handler fails.
//==========================================================================================================
class ChildProcessTransport : public ITransport {
public:
    explicit ChildProcessTransport(ServerDescriptor server, TransportLimits limits = TransportLimits{});
    ~ChildProcessTransport() override;
    ChildProcessTransport(const ChildProcessTransport&) = delete;
    ChildProcessTransport& operator=(const ChildProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;
    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure maximum time to wait for a single request/response pair (0 disables).
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout while the child's stdin pipe is full.
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

    // Applies to frames decoded after the next Start().
    void SetMaxContentLength(std::size_t maxBytes);

    const std::string& ServerId() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
    friend struct ChildProcessTransportTestHooks;
};

//==========================================================================================================
// ChildProcessTransportFactory
// Purpose: Default factory used by the ToolRegistry.
//==========================================================================================================
class ChildProcessTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const ServerDescriptor& server,
                                                const TransportLimits& limits) override;
};

struct ChildProcessTransportTestHooks {
    // Pushes bytes through the decode path exactly as if they had been read from the child's stdout.
    static void feedBytes(ChildProcessTransport& t, const std::string& bytes);
    static std::size_t pendingCount(const ChildProcessTransport& t);
};

} // namespace mcphub
