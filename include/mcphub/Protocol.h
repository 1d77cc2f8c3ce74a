//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP data structures, method names and result parsers used when talking to tool servers
//==========================================================================================================

#pragma once

#include "mcphub/JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version announced in the optional initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool as advertised by a server in tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // raw JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
}

///////////////////////////////////////// Result parsing ///////////////////////////////////////////
//==========================================================================================================
// Result parsers
// Purpose: Convert the "result" member of a response into typed structures.
// Notes:
//   Entries missing required members are skipped (tools without a name, resources without a uri);
//   a result that is not an object yields an empty list.
//==========================================================================================================
std::vector<Tool> ParseToolsListResult(const JSONValue& result);
std::vector<Resource> ParseResourcesListResult(const JSONValue& result);
std::vector<Prompt> ParsePromptsListResult(const JSONValue& result);
CallToolResult ParseCallToolResult(const JSONValue& result);
ReadResourceResult ParseReadResourceResult(const JSONValue& result);
GetPromptResult ParseGetPromptResult(const JSONValue& result);

} // namespace mcphub
