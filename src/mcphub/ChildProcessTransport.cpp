//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcessTransport.cpp
// Purpose: Framed JSON-RPC over a spawned child's stdio (epoll reader, bounded writes)
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcphub/ChildProcessTransport.hpp"
#include "mcphub/ContentFramer.h"
#include "mcphub/JSONRPCTypes.h"
#include "mcphub/JsonRpcMessageRouter.h"
#include "mcphub/ProcessSupervisor.h"
#include "mcphub/RequestCorrelator.h"
#include "mcphub/errors/Errors.h"

namespace mcphub {

namespace {
constexpr std::size_t MaxStderrLine = 64 * 1024;

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

std::future<void> failedFuture(const errors::McpError& err) {
    std::promise<void> p;
    p.set_exception(std::make_exception_ptr(errors::McpException(err)));
    return p.get_future();
}
} // namespace

class ChildProcessTransport::Impl : public std::enable_shared_from_this<ChildProcessTransport::Impl> {
public:
    ServerDescriptor server;
    TransportLimits limits;
    std::string sessionId;
    mutable std::mutex stateMutex;   // guards supervisor pointer, sessionId
    std::mutex lifecycleMutex;       // serializes Start/Close
    std::mutex writeMutex;           // one frame on the pipe at a time
    std::shared_ptr<ProcessSupervisor> supervisor;
    RequestCorrelator correlator;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    FrameBuffer frameBuffer;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};
    std::thread readerThread;
    std::chrono::milliseconds writeTimeout;
    int wakeEventFd{-1};

    Impl(ServerDescriptor s, TransportLimits l)
        : server(std::move(s)),
          limits(l),
          correlator(server.id, l.requestTimeout),
          router(MakeDefaultJsonRpcMessageRouter()),
          frameBuffer(l.maxContentLength, l.headerScanLimit),
          writeTimeout(l.writeTimeout) {
        sessionId = server.id;
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("[{}] failed to create eventfd (errno={} msg={})", server.id, errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    std::shared_ptr<ProcessSupervisor> proc() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return supervisor;
    }

    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("[{}] eventfd write failed (errno={} msg={})", server.id, errno, ::strerror(errno));
        }
    }

    void reportError(int code, const std::string& message) {
        if (errorHandler) {
            errorHandler(errors::makeError(code, message));
        }
    }

    //======================================================================================================
    // writeFrame
    // Purpose: Writes one framed payload to the child's stdin, waiting for pipe space up to writeTimeout.
    // Returns:
    //   std::nullopt on success; a description of the failure otherwise.
    //======================================================================================================
    std::optional<std::string> writeFrame(const std::string& payload) {
        auto p = proc();
        if (!p) {
            return std::string("process not started");
        }
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
        std::lock_guard<std::mutex> lock(writeMutex);
        const int fd = p->StdinFd();
        if (fd < 0) {
            return std::string("stdin is closed");
        }
        const auto deadline = std::chrono::steady_clock::now() + writeTimeout;
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    LOG_ERROR("[{}] write timeout ({} ms)", server.id, static_cast<long long>(writeTimeout.count()));
                    return fmt::format("write timed out after {}ms", static_cast<long long>(writeTimeout.count()));
                }
                pollfd pfd{fd, POLLOUT, 0};
                int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (rc < 0 && errno != EINTR) {
                    return fmt::format("poll failed: {}", ::strerror(errno));
                }
                if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP)) != 0) {
                    return std::string("stdin pipe closed by peer");
                }
                continue;
            }
            LOG_ERROR("[{}] write error (errno={} msg={})", server.id, errno, ::strerror(errno));
            return fmt::format("write failed: {}", ::strerror(errno));
        }
        return std::nullopt;
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("[{}] <- {}", server.id, Logger::preview(message));
        RouterHandlers handlers{requestHandler, notificationHandler};
        auto reply = router->route(message, handlers, [this](JSONRPCResponse&& response) {
            (void)correlator.Resolve(std::move(response));
        });
        if (reply.has_value()) {
            auto err = writeFrame(reply.value());
            if (err.has_value()) {
                LOG_WARN("[{}] failed to answer peer request: {}", server.id, err.value());
            }
        }
    }

    // Returns false when the stream hit a framing error.
    bool handleChunk(const char* data, std::size_t len) {
        std::vector<std::string> bodies;
        auto status = frameBuffer.append(std::string_view(data, len), bodies);
        for (const auto& body : bodies) {
            if (stopping.load()) {
                return true;
            }
            processMessage(body);
        }
        if (status != IContentFramer::DecodeStatus::Ok && !stopping.load()) {
            const std::string message = fmt::format("Protocol error: {}", DecodeStatusName(status));
            LOG_ERROR("[{}] {}; failing pending requests", server.id, message);
            connected = false;
            correlator.FailAll(JSONRPCErrorCodes::ProtocolError, message);
            reportError(JSONRPCErrorCodes::ProtocolError, message);
            return false;
        }
        return true;
    }

    void flushStderrLine(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            LOG_INFO("[{} stderr] {}", server.id, line);
        }
        line.clear();
    }

    void handleStderr(const char* data, std::size_t len, std::string& line) {
        for (std::size_t i = 0; i < len; ++i) {
            if (data[i] == '\n') {
                flushStderrLine(line);
            } else {
                line.push_back(data[i]);
                if (line.size() >= MaxStderrLine) {
                    flushStderrLine(line);
                }
            }
        }
    }

    enum class ReadResult { Data, Drained, Eof, Error };

    // Reads everything currently available; invokes sink for each chunk.
    template <typename Sink>
    ReadResult drainFd(int fd, Sink&& sink) {
        std::array<char, 8192> tmp{};
        bool any = false;
        while (true) {
            ssize_t n = ::read(fd, tmp.data(), tmp.size());
            if (n > 0) {
                any = true;
                if (!sink(tmp.data(), static_cast<std::size_t>(n))) {
                    return ReadResult::Error;
                }
                continue;
            }
            if (n == 0) {
                return ReadResult::Eof;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return any ? ReadResult::Data : ReadResult::Drained;
            }
            LOG_ERROR("[{}] read error (errno={} msg={})", server.id, errno, ::strerror(errno));
            return ReadResult::Eof;
        }
    }

    // The thread owns a reference to Impl, so a handler may close or drop the transport.
    void startReader(std::shared_ptr<ProcessSupervisor> p) {
        readerThread = std::thread([self = shared_from_this(), p]() {
            self->readerLoop(p);
        });
    }

    bool onReaderThread() const {
        return readerThread.joinable() && readerThread.get_id() == std::this_thread::get_id();
    }

    void readerLoop(const std::shared_ptr<ProcessSupervisor>& p) {
        constexpr int waitTimeoutMs = 100;
        const int outFd = p->StdoutFd();
        const int errFd = p->StderrFd();
        std::string stderrLine;
        bool stdoutOpen = true;
        bool stderrOpen = errFd >= 0;
        bool protocolFailure = false;

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("[{}] epoll_create1 failed (errno={} msg={})", server.id, errno, ::strerror(errno));
        } else {
            epoll_event evOut{}; evOut.events = EPOLLIN | EPOLLRDHUP; evOut.data.fd = outFd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, outFd, &evOut);
            if (stderrOpen) {
                epoll_event evErr{}; evErr.events = EPOLLIN | EPOLLRDHUP; evErr.data.fd = errFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, errFd, &evErr);
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }
        }

        auto onStdout = [this](const char* d, std::size_t n) { return handleChunk(d, n); };
        auto onStderr = [this, &stderrLine](const char* d, std::size_t n) { handleStderr(d, n, stderrLine); return true; };

        while (!stopping.load() && stdoutOpen && !protocolFailure) {
            if (ep >= 0) {
                epoll_event events[3];
                int rc = ::epoll_wait(ep, events, 3, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("[{}] epoll_wait failed (errno={} msg={})", server.id, errno, ::strerror(errno));
                    break;
                }
                for (int i = 0; i < rc && !stopping.load(); ++i) {
                    const int fd = events[i].data.fd;
                    if (fd == wakeEventFd) {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    } else if (fd == outFd && stdoutOpen) {
                        auto res = drainFd(outFd, onStdout);
                        if (res == ReadResult::Error) {
                            protocolFailure = true;
                        } else if (res == ReadResult::Eof) {
                            stdoutOpen = false;
                        }
                    } else if (fd == errFd && stderrOpen) {
                        if (drainFd(errFd, onStderr) == ReadResult::Eof) {
                            stderrOpen = false;
                            (void)::epoll_ctl(ep, EPOLL_CTL_DEL, errFd, nullptr);
                        }
                    }
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(waitTimeoutMs));
                auto res = drainFd(outFd, onStdout);
                if (res == ReadResult::Error) {
                    protocolFailure = true;
                } else if (res == ReadResult::Eof) {
                    stdoutOpen = false;
                }
                if (stderrOpen && drainFd(errFd, onStderr) == ReadResult::Eof) {
                    stderrOpen = false;
                }
            }
            if (stdoutOpen && !protocolFailure && p->PollExit().has_value()) {
                // Pick up whatever the child wrote before exiting
                auto res = drainFd(outFd, onStdout);
                if (res == ReadResult::Error) {
                    protocolFailure = true;
                }
                stdoutOpen = false;
            }
        }
        if (stderrOpen) {
            (void)drainFd(errFd, onStderr);
        }
        flushStderrLine(stderrLine);
        if (ep >= 0) {
            ::close(ep);
        }

        if (!stopping.load() && !protocolFailure) {
            connected = false;
            auto status = p->PollExit();
            const std::string message = status.has_value()
                ? fmt::format("Connection closed: server process {}", status->describe())
                : std::string("Connection closed: server closed its stdout");
            LOG_WARN("[{}] {}", server.id, message);
            correlator.FailAll(JSONRPCErrorCodes::ConnectionClosed, message);
            reportError(JSONRPCErrorCodes::ConnectionClosed, message);
        }
    }

    // From the reader thread itself the join is left to the next Start/Close or the destructor;
    // the loop exits once the current handler returns because stopping is set.
    void joinReader() {
        if (!readerThread.joinable() || onReaderThread()) {
            return;
        }
        readerThread.join();
    }
};

ChildProcessTransport::ChildProcessTransport(ServerDescriptor server, TransportLimits limits)
    : pImpl(std::make_shared<Impl>(std::move(server), limits)) {
    FUNC_SCOPE();
}

ChildProcessTransport::~ChildProcessTransport() {
    FUNC_SCOPE();
    pImpl->stopping = true;
    pImpl->connected = false;
    pImpl->wakeReader();
    if (pImpl->onReaderThread()) {
        // Destroyed from one of its own handlers; the reader holds Impl until it returns
        pImpl->readerThread.detach();
    } else {
        pImpl->joinReader();
    }
    pImpl->correlator.FailAll(JSONRPCErrorCodes::ConnectionClosed, "Client connection closed");
    if (auto p = pImpl->proc()) {
        p->Terminate(pImpl->limits.shutdownGrace);
    }
}

std::future<void> ChildProcessTransport::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycleMutex);
    if (pImpl->connected.load()) {
        return readyFuture();
    }
    if (pImpl->onReaderThread()) {
        return failedFuture(errors::makeError(JSONRPCErrorCodes::InternalError,
                                              "Start() cannot run on the transport's own reader thread"));
    }
    // A previous run may have ended on its own (process exit or protocol error)
    pImpl->stopping = true;
    pImpl->wakeReader();
    pImpl->joinReader();
    if (auto old = pImpl->proc()) {
        old->Terminate(pImpl->limits.shutdownGrace);
    }

    const auto& server = pImpl->server;
    LOG_INFO("[{}] starting: {}", server.id, server.command);
    auto p = std::make_shared<ProcessSupervisor>(server.id);
    try {
        p->Spawn(ProcessSpec{server.command, server.args, server.env, server.workingDirectory});
    } catch (const errors::McpException& e) {
        return failedFuture(e.error());
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->supervisor = p;
        pImpl->sessionId = fmt::format("{}-{}", server.id, static_cast<int>(p->Pid()));
    }
    pImpl->frameBuffer = FrameBuffer(pImpl->limits.maxContentLength, pImpl->limits.headerScanLimit);
    pImpl->stopping = false;
    pImpl->connected = true;
    pImpl->startReader(p);
    return readyFuture();
}

std::future<void> ChildProcessTransport::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycleMutex);
    LOG_INFO("[{}] closing transport", pImpl->server.id);
    pImpl->stopping = true;
    pImpl->connected = false;
    pImpl->wakeReader();
    pImpl->joinReader();
    pImpl->correlator.FailAll(JSONRPCErrorCodes::ConnectionClosed, "Client connection closed");
    if (auto p = pImpl->proc()) {
        ExitStatus st = p->Terminate(pImpl->limits.shutdownGrace);
        LOG_DEBUG("[{}] process {}", pImpl->server.id, st.describe());
    }
    return readyFuture();
}

bool ChildProcessTransport::IsConnected() const {
    if (!pImpl->connected.load()) {
        return false;
    }
    auto p = pImpl->proc();
    return p && p->StdinFd() >= 0 && p->IsRunning();
}

std::string ChildProcessTransport::GetSessionId() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> ChildProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    if (!IsConnected()) {
        LOG_DEBUG("[{}] SendRequest({}) while disconnected", pImpl->server.id, request->method);
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed,
                                              "Transport not connected"));
        return promise.get_future();
    }
    auto reg = pImpl->correlator.Register(request->method);
    request->id = reg.id;
    const std::string payload = request->Serialize();
    LOG_DEBUG("[{}] -> [{}] {} ({} bytes)", pImpl->server.id, reg.id, request->method, payload.size());
    auto err = pImpl->writeFrame(payload);
    if (err.has_value()) {
        pImpl->correlator.Fail(reg.id, JSONRPCErrorCodes::WriteFailed, "Write failed: " + err.value());
    }
    return std::move(reg.future);
}

std::future<void> ChildProcessTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!IsConnected()) {
        return failedFuture(errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Transport not connected"));
    }
    const std::string payload = notification->Serialize();
    LOG_DEBUG("[{}] -> notification {} ({} bytes)", pImpl->server.id, notification->method, payload.size());
    auto err = pImpl->writeFrame(payload);
    if (err.has_value()) {
        return failedFuture(errors::makeError(JSONRPCErrorCodes::WriteFailed, "Write failed: " + err.value()));
    }
    return readyFuture();
}

void ChildProcessTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void ChildProcessTransport::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void ChildProcessTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

void ChildProcessTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->correlator.SetDefaultTimeout(std::chrono::milliseconds(timeoutMs));
}

void ChildProcessTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    pImpl->writeTimeout = std::chrono::milliseconds(timeoutMs);
}

void ChildProcessTransport::SetMaxContentLength(std::size_t maxBytes) {
    pImpl->limits.maxContentLength = maxBytes;
}

const std::string& ChildProcessTransport::ServerId() const {
    return pImpl->server.id;
}

std::unique_ptr<ITransport> ChildProcessTransportFactory::CreateTransport(const ServerDescriptor& server,
                                                                         const TransportLimits& limits) {
    return std::make_unique<ChildProcessTransport>(server, limits);
}

void ChildProcessTransportTestHooks::feedBytes(ChildProcessTransport& t, const std::string& bytes) {
    (void)t.pImpl->handleChunk(bytes.data(), bytes.size());
}

std::size_t ChildProcessTransportTestHooks::pendingCount(const ChildProcessTransport& t) {
    return t.pImpl->correlator.PendingCount();
}

} // namespace mcphub
