//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Multi-server registry: parallel startup, tool discovery, ownership and invocation dispatch
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphub/Config.h"
#include "mcphub/Connection.h"
#include "mcphub/JSONRPCTypes.h"
#include "mcphub/SchemaCleaner.h"
#include "mcphub/Transport.h"
#include "mcphub/errors/Errors.h"

namespace mcphub {

//==========================================================================================================
// ToolCatalogEntry
// Purpose: One discovered tool as exposed to the orchestration layer.
// Fields:
//   parameters: Cleaned input schema; absent when the raw schema did not clean into an object.
//==========================================================================================================
struct ToolCatalogEntry {
    std::string name;
    std::string description;
    std::string serverId;
    std::optional<schema::SchemaNode> parameters;
};

// { name, description, server, parameters? }
JSONValue ToJSON(const ToolCatalogEntry& entry);
JSONValue CatalogToJSON(const std::vector<ToolCatalogEntry>& catalog);

//==========================================================================================================
// ToolInvocationResult
// Purpose: Uniform envelope returned by InvokeTool.
// Fields:
//   response: { content: <text> } | { success: true } on success, { error: <message> } on failure.
//   error: Typed failure (ToolUnavailable, timeout, peer error, ...) when success is false.
//==========================================================================================================
struct ToolInvocationResult {
    std::string name;
    bool success{false};
    JSONValue response;
    std::optional<errors::McpError> error;
};

class ToolRegistry {
public:
    // A null factory selects ChildProcessTransportFactory.
    explicit ToolRegistry(std::shared_ptr<ITransportFactory> factory = nullptr);
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //======================================================================================================
    // Init
    // Purpose: Creates one Connection per enabled server and initializes them in parallel. Failures are
    //          logged and isolated; a server whose process never spawned gets no Connection.
    // Returns:
    //   Number of Connections that reached Ready.
    //======================================================================================================
    std::size_t Init(const RegistryConfig& config);

    //======================================================================================================
    // DiscoverTools
    // Purpose: Lists tools on every Ready Connection in parallel and swaps in a fresh catalog and
    //          ownership map. Duplicate names resolve to the later server (configuration order).
    // Returns:
    //   Number of tools in the new catalog.
    //======================================================================================================
    std::size_t DiscoverTools();

    std::vector<ToolCatalogEntry> GetCatalog() const;
    std::optional<std::string> GetToolOwner(const std::string& toolName) const;
    std::shared_ptr<Connection> GetConnection(const std::string& serverId) const;
    std::vector<std::string> GetServerIds() const;

    //======================================================================================================
    // InvokeTool
    // Purpose: Dispatches a call to the owning server and normalizes the result. Never throws.
    //======================================================================================================
    ToolInvocationResult InvokeTool(const std::string& toolName, const JSONValue& arguments);

    // Closes every Connection in parallel and clears ownership. Idempotent.
    void Shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub
