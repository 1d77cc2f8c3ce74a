//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, hub failure taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphub/JSONRPCTypes.h"

namespace mcphub {
namespace errors {

// Categorization of JSON-RPC/MCP error codes and of failures raised locally by the hub.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    SpawnFailure,
    Protocol,
    Timeout,
    WriteFailure,
    ConnectionClosed,
    ConnectionNotReady,
    ToolUnavailable,
    Unknown
};

// Typed error representation used across the hub.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP/local numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard, MCP-specific or local hub code).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        case JSONRPCErrorCodes::SpawnFailed: return ErrorCategory::SpawnFailure;
        case JSONRPCErrorCodes::ProtocolError: return ErrorCategory::Protocol;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::WriteFailed: return ErrorCategory::WriteFailure;
        case JSONRPCErrorCodes::ConnectionClosed: return ErrorCategory::ConnectionClosed;
        case JSONRPCErrorCodes::ConnectionNotReady: return ErrorCategory::ConnectionNotReady;
        case JSONRPCErrorCodes::ToolUnavailable: return ErrorCategory::ToolUnavailable;
        default: return ErrorCategory::Unknown;
    }
}

// Short label for log lines.
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "parse";
        case ErrorCategory::JsonRpcInvalidRequest: return "invalid-request";
        case ErrorCategory::JsonRpcMethodNotFound: return "method-not-found";
        case ErrorCategory::JsonRpcInvalidParams: return "invalid-params";
        case ErrorCategory::JsonRpcInternal: return "internal";
        case ErrorCategory::McpResourceNotFound: return "resource-not-found";
        case ErrorCategory::McpToolNotFound: return "tool-not-found";
        case ErrorCategory::McpPromptNotFound: return "prompt-not-found";
        case ErrorCategory::SpawnFailure: return "spawn-failure";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::WriteFailure: return "write-failure";
        case ErrorCategory::ConnectionClosed: return "connection-closed";
        case ErrorCategory::ConnectionNotReady: return "connection-not-ready";
        case ErrorCategory::ToolUnavailable: return "tool-unavailable";
        case ErrorCategory::Unknown: break;
    }
    return "unknown";
}

// Builds an McpError whose category is derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// McpException
// Purpose: Carries a typed McpError through std::future and coroutine boundaries.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    McpException(int code, const std::string& message)
        : McpException(makeError(code, message)) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }
    ErrorCategory category() const noexcept { return error_.category; }

private:
    McpError error_;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeError(static_cast<int>(code.value()), std::move(message.value()), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error. Malformed error objects map to an
// InternalError carrying the raw payload as data.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    auto parsed = mcpErrorFromErrorValue(response.error.value());
    if (parsed.has_value()) {
        return parsed;
    }
    return makeError(JSONRPCErrorCodes::InternalError, "Malformed error object in response", response.error);
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcphub
