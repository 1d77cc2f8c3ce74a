//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_correlator.cpp
// Purpose: Tests for id allocation, out-of-order settlement, timeouts and exactly-once delivery
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "mcphub/RequestCorrelator.h"
#include "mcphub/errors/Errors.h"

using namespace mcphub;
using namespace std::chrono_literals;

namespace {

JSONRPCResponse resultFor(int64_t id, int64_t value) {
    return JSONRPCResponse(id, JSONValue(value));
}

int errorCode(const JSONRPCResponse& r) {
    auto err = errors::mcpErrorFromResponse(r);
    return err ? err->code : 0;
}

} // namespace

TEST(RequestCorrelator, IdsAreMonotonicFromOne) {
    RequestCorrelator c("test");
    auto a = c.Register("ping");
    auto b = c.Register("ping");
    auto d = c.Register("ping");
    EXPECT_EQ(a.id, 1);
    EXPECT_EQ(b.id, 2);
    EXPECT_EQ(d.id, 3);
    EXPECT_EQ(c.PendingCount(), 3u);
}

TEST(RequestCorrelator, OutOfOrderResponsesReachTheirOwnWaiters) {
    RequestCorrelator c("test");
    auto first = c.Register("tools/call");
    auto second = c.Register("tools/call");

    EXPECT_TRUE(c.Resolve(resultFor(second.id, 200)));
    EXPECT_TRUE(c.Resolve(resultFor(first.id, 100)));

    auto r1 = first.future.get();
    auto r2 = second.future.get();
    ASSERT_TRUE(r1 && r1->result.has_value());
    ASSERT_TRUE(r2 && r2->result.has_value());
    EXPECT_EQ(std::get<int64_t>(r1->result->value), 100);
    EXPECT_EQ(std::get<int64_t>(r2->result->value), 200);
    EXPECT_EQ(c.PendingCount(), 0u);
}

TEST(RequestCorrelator, DuplicateResponseIsDiscarded) {
    RequestCorrelator c("test");
    auto reg = c.Register("ping");
    EXPECT_TRUE(c.Resolve(resultFor(reg.id, 1)));
    EXPECT_FALSE(c.Resolve(resultFor(reg.id, 2)));
    auto r = reg.future.get();
    EXPECT_EQ(std::get<int64_t>(r->result->value), 1);
}

TEST(RequestCorrelator, UnknownAndNonIntegerIdsAreDiscarded) {
    RequestCorrelator c("test");
    auto reg = c.Register("ping");
    EXPECT_FALSE(c.Resolve(resultFor(999, 1)));
    EXPECT_FALSE(c.Resolve(JSONRPCResponse(std::string("1"), JSONValue(static_cast<int64_t>(1)))));
    EXPECT_EQ(c.PendingCount(), 1u);
    EXPECT_EQ(reg.future.wait_for(0ms), std::future_status::timeout);
}

TEST(RequestCorrelator, TimeoutSettlesOnlyThatRequest) {
    RequestCorrelator c("test", 5000ms);
    auto fast = c.Register("tools/call", 50ms);
    auto slow = c.Register("tools/call");

    ASSERT_EQ(fast.future.wait_for(2s), std::future_status::ready);
    auto r = fast.future.get();
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->IsError());
    EXPECT_EQ(errorCode(*r), JSONRPCErrorCodes::RequestTimeout);
    auto err = errors::mcpErrorFromResponse(*r);
    EXPECT_EQ(err->message, "Request timed out after 50ms");

    EXPECT_EQ(c.PendingCount(), 1u);
    EXPECT_EQ(slow.future.wait_for(0ms), std::future_status::timeout);
    EXPECT_TRUE(c.Resolve(resultFor(slow.id, 7)));
}

TEST(RequestCorrelator, LateResponseAfterTimeoutIsUnknown) {
    RequestCorrelator c("test");
    auto reg = c.Register("tools/call", 30ms);
    ASSERT_EQ(reg.future.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(reg.future.get()->IsError());
    EXPECT_FALSE(c.Resolve(resultFor(reg.id, 1)));
    EXPECT_EQ(c.PendingCount(), 0u);
}

TEST(RequestCorrelator, ZeroTimeoutDisablesDeadline) {
    RequestCorrelator c("test", 20ms);
    auto reg = c.Register("tools/call", 0ms);
    EXPECT_EQ(reg.future.wait_for(150ms), std::future_status::timeout);
    EXPECT_TRUE(c.Resolve(resultFor(reg.id, 1)));
}

TEST(RequestCorrelator, FailSettlesOnce) {
    RequestCorrelator c("test");
    auto reg = c.Register("tools/call");
    EXPECT_TRUE(c.Fail(reg.id, JSONRPCErrorCodes::WriteFailed, "Write failed: broken pipe"));
    EXPECT_FALSE(c.Fail(reg.id, JSONRPCErrorCodes::WriteFailed, "again"));
    EXPECT_FALSE(c.Resolve(resultFor(reg.id, 1)));
    EXPECT_EQ(errorCode(*reg.future.get()), JSONRPCErrorCodes::WriteFailed);
}

TEST(RequestCorrelator, FailAllRejectsEveryPendingRequest) {
    RequestCorrelator c("test");
    std::vector<RequestCorrelator::Registration> regs;
    for (int i = 0; i < 5; ++i) {
        regs.push_back(c.Register("tools/call"));
    }
    EXPECT_EQ(c.FailAll(JSONRPCErrorCodes::ConnectionClosed, "Connection closed"), 5u);
    EXPECT_EQ(c.PendingCount(), 0u);
    for (auto& reg : regs) {
        EXPECT_EQ(errorCode(*reg.future.get()), JSONRPCErrorCodes::ConnectionClosed);
    }
    EXPECT_EQ(c.FailAll(JSONRPCErrorCodes::ConnectionClosed, "again"), 0u);
}

TEST(RequestCorrelator, DestructorFailsOutstandingRequests) {
    std::future<RequestCorrelator::ResponsePtr> fut;
    {
        RequestCorrelator c("test");
        fut = c.Register("tools/call").future;
    }
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(errorCode(*fut.get()), JSONRPCErrorCodes::ConnectionClosed);
}

TEST(RequestCorrelator, ConcurrentResolveAndTimeoutSettleExactlyOnce) {
    RequestCorrelator c("test");
    constexpr int kRequests = 200;
    std::vector<RequestCorrelator::Registration> regs;
    for (int i = 0; i < kRequests; ++i) {
        regs.push_back(c.Register("tools/call", std::chrono::milliseconds(1 + (i % 5))));
    }
    std::atomic<int> resolvedByPeer{0};
    std::thread resolver([&]() {
        for (int i = kRequests - 1; i >= 0; --i) {
            if (c.Resolve(resultFor(regs[i].id, i))) {
                ++resolvedByPeer;
            }
        }
    });
    resolver.join();

    int fromPeer = 0;
    int timedOut = 0;
    for (int i = 0; i < kRequests; ++i) {
        ASSERT_EQ(regs[i].future.wait_for(2s), std::future_status::ready);
        auto r = regs[i].future.get();
        if (r->IsError()) {
            EXPECT_EQ(errorCode(*r), JSONRPCErrorCodes::RequestTimeout);
            ++timedOut;
        } else {
            EXPECT_EQ(std::get<int64_t>(r->result->value), i);
            ++fromPeer;
        }
    }
    EXPECT_EQ(fromPeer, resolvedByPeer.load());
    EXPECT_EQ(fromPeer + timedOut, kRequests);
    EXPECT_EQ(c.PendingCount(), 0u);
}
