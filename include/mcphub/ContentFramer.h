//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Content-Length message framing and the stateful reassembly buffer used on server stdout
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

constexpr std::size_t DefaultMaxContentLength = 10 * 1024 * 1024;
constexpr std::size_t DefaultHeaderScanLimit = 16 * 1024;

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,   // missing, negative or non-numeric Content-Length
        BodyTooLarge,    // declared length above the configured cap
        HeaderTooLarge   // no header terminator within the scan bound
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // full frame bytes on Ok; bytes to discard on errors
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

const char* DecodeStatusName(IContentFramer::DecodeStatus status);

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = DefaultMaxContentLength,
                                                        std::size_t headerScanLimit = DefaultHeaderScanLimit);

//========================================================================================================
// FrameBuffer
// Purpose: Accumulates raw bytes and slices out complete message bodies.
// Notes:
//   - The buffer only ever holds an incomplete frame (or bytes preceding the next header).
//   - Messages split across chunks, or several messages in one chunk, decode identically.
//   - On any framing error the buffer is cleared; the stream cannot be resynchronized.
//========================================================================================================
class FrameBuffer {
public:
    explicit FrameBuffer(std::size_t maxContentLength = DefaultMaxContentLength,
                         std::size_t headerScanLimit = DefaultHeaderScanLimit);

    //====================================================================================================
    // append
    // Purpose: Appends a chunk and extracts every complete body now available.
    // Args:
    //   chunk: Newly read bytes.
    //   out: Receives complete bodies in arrival order.
    // Returns:
    //   Ok when no framing error occurred (including when the tail is still incomplete);
    //   otherwise the failing status.
    //====================================================================================================
    IContentFramer::DecodeStatus append(std::string_view chunk, std::vector<std::string>& out);

    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }
    void clear() { buffer.clear(); }

private:
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
};

} // namespace mcphub
