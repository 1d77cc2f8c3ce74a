//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Pending-request table pairing outgoing requests with responses, with deadline sweeping
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcphub/JSONRPCTypes.h"

namespace mcphub {

//==========================================================================================================
// RequestCorrelator
// Purpose: Allocates request ids and settles each registered request exactly once: with the matching
//          response, a local failure, or a timeout.
// Notes:
//   - Ids are monotonically increasing integers starting at 1 and never reused.
//   - Responses for unknown or already-settled ids are logged and discarded.
//   - A background sweep thread settles expired requests with
//     "Request timed out after <N>ms" (JSONRPCErrorCodes::RequestTimeout).
//   - Promises are always settled outside the internal lock.
//==========================================================================================================
class RequestCorrelator {
public:
    using ResponsePtr = std::unique_ptr<JSONRPCResponse>;

    struct Registration {
        int64_t id;
        std::future<ResponsePtr> future;
    };

    explicit RequestCorrelator(std::string label = "",
                               std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(12000));
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //======================================================================================================
    // Register
    // Purpose: Records a pending request and arms its deadline.
    // Args:
    //   method: Method name (for logs and timing).
    //   timeout: Overrides the default timeout for this request when set; zero disables the deadline.
    // Returns:
    //   The allocated id and the future the caller waits on.
    //======================================================================================================
    Registration Register(const std::string& method,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //======================================================================================================
    // Resolve
    // Purpose: Settles the pending request matching response.id.
    // Returns:
    //   true when a pending request was settled; false for unknown, late or non-integer ids.
    //======================================================================================================
    bool Resolve(JSONRPCResponse&& response);

    // Settles one pending request with a local error; returns false when it was already settled.
    bool Fail(int64_t id, int code, const std::string& message);

    // Settles every pending request with the same local error; returns how many were settled.
    std::size_t FailAll(int code, const std::string& message);

    std::size_t PendingCount() const;
    void SetDefaultTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds DefaultTimeout() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub
