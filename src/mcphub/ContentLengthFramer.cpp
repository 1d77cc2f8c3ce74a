//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length framer and FrameBuffer reassembly loop
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphub/ContentFramer.h"

namespace mcphub {

namespace {

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

class ContentLengthFramer : public IContentFramer {
public:
    ContentLengthFramer(std::size_t maxLen, std::size_t scanLimit)
        : maxContentLength(maxLen), headerScanLimit(scanLimit) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            if (buffer.size() > headerScanLimit) {
                LOG_WARN("No header terminator within {} bytes (buffered={})", headerScanLimit, buffer.size());
                return { DecodeStatus::HeaderTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();
        if (headerEnd > headerScanLimit) {
            LOG_WARN("Header block of {} bytes exceeds scan limit {}", headerEnd, headerScanLimit);
            return { DecodeStatus::HeaderTooLarge, std::nullopt, headerAndSep };
        }

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                break;
            }
            std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string name = trim(line.substr(0, colon));
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
            if (name != "content-length") {
                continue;
            }
            std::string value = trim(line.substr(colon + 1));
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
                LOG_WARN("Invalid Content-Length header: '{}'", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
            // Cap checked per digit
            std::size_t v = 0;
            for (char c : value) {
                v = v * 10u + static_cast<std::size_t>(c - '0');
                if (v > maxContentLength) {
                    LOG_WARN("Content-Length {} exceeds limits (max={})", value, maxContentLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                }
            }
            contentLength = v;
            haveLength = true;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
    std::size_t headerScanLimit;
};
} // namespace

const char* DecodeStatusName(IContentFramer::DecodeStatus status) {
    switch (status) {
        case IContentFramer::DecodeStatus::Ok: return "ok";
        case IContentFramer::DecodeStatus::Incomplete: return "incomplete";
        case IContentFramer::DecodeStatus::InvalidHeader: return "invalid header";
        case IContentFramer::DecodeStatus::BodyTooLarge: return "body too large";
        case IContentFramer::DecodeStatus::HeaderTooLarge: return "header too large";
    }
    return "unknown";
}

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength, std::size_t headerScanLimit) {
    return std::make_unique<ContentLengthFramer>(maxContentLength, headerScanLimit);
}

FrameBuffer::FrameBuffer(std::size_t maxContentLength, std::size_t headerScanLimit)
    : framer(MakeContentLengthFramer(maxContentLength, headerScanLimit)) {}

IContentFramer::DecodeStatus FrameBuffer::append(std::string_view chunk, std::vector<std::string>& out) {
    buffer.append(chunk.data(), chunk.size());
    while (!buffer.empty()) {
        auto r = framer->tryDecodeEx(buffer);
        switch (r.status) {
            case IContentFramer::DecodeStatus::Ok:
                buffer.erase(0, r.bytesConsumed);
                out.push_back(std::move(r.payload.value()));
                break;
            case IContentFramer::DecodeStatus::Incomplete:
                return IContentFramer::DecodeStatus::Ok;
            default:
                buffer.clear();
                return r.status;
        }
    }
    return IContentFramer::DecodeStatus::Ok;
}

} // namespace mcphub
