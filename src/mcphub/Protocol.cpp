//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Typed parsing of MCP list/call/read/get results
//==========================================================================================================

#include "mcphub/Protocol.h"

#include "logging/Logger.h"

namespace mcphub {

namespace {

const JSONValue::Array* arrayMember(const JSONValue& result, const char* key) {
    const JSONValue* v = FindMember(result, key);
    if (v == nullptr || !v->isArray()) {
        return nullptr;
    }
    return &std::get<JSONValue::Array>(v->value);
}

std::vector<JSONValue> copyItems(const JSONValue::Array* items) {
    std::vector<JSONValue> out;
    if (items == nullptr) {
        return out;
    }
    out.reserve(items->size());
    for (const auto& item : *items) {
        if (item) {
            out.push_back(*item);
        }
    }
    return out;
}

} // namespace

std::vector<Tool> ParseToolsListResult(const JSONValue& result) {
    FUNC_SCOPE();
    std::vector<Tool> tools;
    const JSONValue::Array* items = arrayMember(result, "tools");
    if (items == nullptr) {
        LOG_WARN("tools/list result has no 'tools' array");
        return tools;
    }
    for (const auto& item : *items) {
        if (!item || !item->isObject()) {
            continue;
        }
        Tool tool;
        tool.name = GetStringMember(*item, "name").value_or("");
        tool.description = GetStringMember(*item, "description").value_or("");
        if (const JSONValue* schema = FindMember(*item, "inputSchema")) {
            tool.inputSchema = *schema;
        }
        // Nameless tools are kept here; the registry decides what to do with them
        tools.push_back(std::move(tool));
    }
    return tools;
}

std::vector<Resource> ParseResourcesListResult(const JSONValue& result) {
    FUNC_SCOPE();
    std::vector<Resource> resources;
    const JSONValue::Array* items = arrayMember(result, "resources");
    if (items == nullptr) {
        return resources;
    }
    for (const auto& item : *items) {
        if (!item) {
            continue;
        }
        auto uri = GetStringMember(*item, "uri");
        if (!uri.has_value()) {
            continue;
        }
        Resource r;
        r.uri = std::move(uri.value());
        r.name = GetStringMember(*item, "name").value_or("");
        r.description = GetStringMember(*item, "description");
        r.mimeType = GetStringMember(*item, "mimeType");
        resources.push_back(std::move(r));
    }
    return resources;
}

std::vector<Prompt> ParsePromptsListResult(const JSONValue& result) {
    FUNC_SCOPE();
    std::vector<Prompt> prompts;
    const JSONValue::Array* items = arrayMember(result, "prompts");
    if (items == nullptr) {
        return prompts;
    }
    for (const auto& item : *items) {
        if (!item) {
            continue;
        }
        auto name = GetStringMember(*item, "name");
        if (!name.has_value()) {
            continue;
        }
        Prompt p;
        p.name = std::move(name.value());
        p.description = GetStringMember(*item, "description").value_or("");
        if (const JSONValue* args = FindMember(*item, "arguments")) {
            p.arguments = *args;
        }
        prompts.push_back(std::move(p));
    }
    return prompts;
}

CallToolResult ParseCallToolResult(const JSONValue& result) {
    CallToolResult out;
    out.content = copyItems(arrayMember(result, "content"));
    out.isError = GetBoolMember(result, "isError").value_or(false);
    return out;
}

ReadResourceResult ParseReadResourceResult(const JSONValue& result) {
    ReadResourceResult out;
    out.contents = copyItems(arrayMember(result, "contents"));
    return out;
}

GetPromptResult ParseGetPromptResult(const JSONValue& result) {
    GetPromptResult out;
    out.description = GetStringMember(result, "description").value_or("");
    out.messages = copyItems(arrayMember(result, "messages"));
    return out;
}

} // namespace mcphub
