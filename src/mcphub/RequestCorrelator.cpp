//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Pending-request table, settlement and timeout sweep
//==========================================================================================================

#include "mcphub/RequestCorrelator.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"

namespace mcphub {

namespace {
using Clock = std::chrono::steady_clock;

struct PendingRequest {
    int64_t id{0};
    std::string method;
    Clock::time_point start;
    std::optional<Clock::time_point> deadline;
    std::chrono::milliseconds timeout{0};
    std::promise<RequestCorrelator::ResponsePtr> promise;
};

long long elapsedMs(Clock::time_point start) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}
} // namespace

class RequestCorrelator::Impl {
public:
    std::string label;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::unordered_map<int64_t, PendingRequest> pending;
    // deadline -> id, ordered so the sweep waits for the earliest
    std::multimap<Clock::time_point, int64_t> deadlines;
    int64_t nextId{1};
    std::chrono::milliseconds defaultTimeout;
    std::jthread sweeper;

    Impl(std::string l, std::chrono::milliseconds timeout)
        : label(std::move(l)), defaultTimeout(timeout) {
        sweeper = std::jthread([this](std::stop_token st) { sweepLoop(st); });
    }

    ~Impl() {
        sweeper.request_stop();
        cv.notify_all();
        if (sweeper.joinable()) {
            sweeper.join();
        }
    }

    // Caller holds the lock. Removes the entry (and its deadline) and hands it back.
    std::optional<PendingRequest> take(int64_t id) {
        auto it = pending.find(id);
        if (it == pending.end()) {
            return std::nullopt;
        }
        PendingRequest req = std::move(it->second);
        pending.erase(it);
        if (req.deadline.has_value()) {
            auto range = deadlines.equal_range(req.deadline.value());
            for (auto d = range.first; d != range.second; ++d) {
                if (d->second == id) {
                    deadlines.erase(d);
                    break;
                }
            }
        }
        return req;
    }

    void settleWithError(PendingRequest& req, int code, const std::string& message) {
        LOG_DEBUG("{}Request [{}] {} failed after {} ms: {}", label, req.id, req.method, elapsedMs(req.start), message);
        req.promise.set_value(CreateErrorResponse(JSONRPCId{req.id}, code, message));
    }

    void sweepLoop(std::stop_token st) {
        std::unique_lock<std::mutex> lock(mutex);
        while (!st.stop_requested()) {
            if (deadlines.empty()) {
                cv.wait(lock, st, [this] { return !deadlines.empty(); });
                continue;
            }
            const auto earliest = deadlines.begin()->first;
            if (Clock::now() < earliest) {
                // Wakes early when a sooner deadline is registered or on stop
                cv.wait_until(lock, st, earliest, [this, earliest] {
                    return !deadlines.empty() && deadlines.begin()->first < earliest;
                });
                continue;
            }
            std::vector<PendingRequest> expired;
            const auto now = Clock::now();
            while (!deadlines.empty() && deadlines.begin()->first <= now) {
                int64_t id = deadlines.begin()->second;
                auto req = take(id);
                if (req.has_value()) {
                    expired.push_back(std::move(req.value()));
                }
            }
            lock.unlock();
            for (auto& req : expired) {
                const auto limit = static_cast<long long>(req.timeout.count());
                LOG_WARN("{}Request [{}] {} timed out after {} ms", label, req.id, req.method, elapsedMs(req.start));
                req.promise.set_value(CreateErrorResponse(JSONRPCId{req.id}, JSONRPCErrorCodes::RequestTimeout,
                                                          fmt::format("Request timed out after {}ms", limit)));
            }
            lock.lock();
        }
    }
};

RequestCorrelator::RequestCorrelator(std::string label, std::chrono::milliseconds defaultTimeout)
    : pImpl(std::make_unique<Impl>(label.empty() ? std::string() : "[" + label + "] ", defaultTimeout)) {}

RequestCorrelator::~RequestCorrelator() {
    FailAll(JSONRPCErrorCodes::ConnectionClosed, "Client connection closed");
}

RequestCorrelator::Registration RequestCorrelator::Register(const std::string& method,
                                                            std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    PendingRequest req;
    req.method = method;
    req.start = Clock::now();
    std::future<ResponsePtr> fut = req.promise.get_future();
    int64_t id = 0;
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        id = pImpl->nextId++;
        req.id = id;
        const auto effective = timeout.value_or(pImpl->defaultTimeout);
        if (effective.count() > 0) {
            req.deadline = req.start + effective;
            req.timeout = effective;
            notify = pImpl->deadlines.empty() || req.deadline.value() < pImpl->deadlines.begin()->first;
            pImpl->deadlines.emplace(req.deadline.value(), id);
        }
        pImpl->pending.emplace(id, std::move(req));
    }
    if (notify) {
        pImpl->cv.notify_all();
    }
    return Registration{id, std::move(fut)};
}

bool RequestCorrelator::Resolve(JSONRPCResponse&& response) {
    FUNC_SCOPE();
    if (!std::holds_alternative<int64_t>(response.id)) {
        LOG_WARN("{}Discarding response with non-integer id {}", pImpl->label, JSONRPCIdToString(response.id));
        return false;
    }
    const int64_t id = std::get<int64_t>(response.id);
    std::optional<PendingRequest> req;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        req = pImpl->take(id);
    }
    if (!req.has_value()) {
        LOG_WARN("{}Discarding response for unknown or settled request id {}", pImpl->label, id);
        return false;
    }
    LOG_DEBUG("{}Received response for [{}] {} ({} ms)", pImpl->label, id, req->method, elapsedMs(req->start));
    req->promise.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
    return true;
}

bool RequestCorrelator::Fail(int64_t id, int code, const std::string& message) {
    std::optional<PendingRequest> req;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        req = pImpl->take(id);
    }
    if (!req.has_value()) {
        return false;
    }
    pImpl->settleWithError(req.value(), code, message);
    return true;
}

std::size_t RequestCorrelator::FailAll(int code, const std::string& message) {
    std::unordered_map<int64_t, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        drained.swap(pImpl->pending);
        pImpl->deadlines.clear();
    }
    if (!drained.empty()) {
        LOG_INFO("{}Failing {} pending request(s): {}", pImpl->label, drained.size(), message);
    }
    for (auto& [id, req] : drained) {
        pImpl->settleWithError(req, code, message);
    }
    return drained.size();
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.size();
}

void RequestCorrelator::SetDefaultTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->defaultTimeout = timeout;
}

std::chrono::milliseconds RequestCorrelator::DefaultTimeout() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->defaultTimeout;
}

} // namespace mcphub
