//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Multi-server registry implementation
//==========================================================================================================

#include "mcphub/ToolRegistry.h"

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "mcphub/ChildProcessTransport.hpp"

namespace mcphub {

namespace {

// Runs every job concurrently, one worker per job, and waits for all of them.
void runParallel(std::vector<std::function<void()>>& jobs) {
    if (jobs.empty()) {
        return;
    }
    boost::asio::thread_pool pool(jobs.size());
    for (auto& job : jobs) {
        boost::asio::post(pool, std::move(job));
    }
    pool.join();
}

JSONValue object(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& [key, value] : members) {
        o[key] = std::make_shared<JSONValue>(value);
    }
    return JSONValue(std::move(o));
}

// First content part of type "text" with a string payload.
std::optional<std::string> firstText(const std::vector<JSONValue>& content) {
    for (const auto& part : content) {
        auto type = GetStringMember(part, "type");
        auto text = GetStringMember(part, "text");
        if (type && *type == "text" && text) {
            return text;
        }
    }
    return std::nullopt;
}

ToolInvocationResult failure(const std::string& name, errors::McpError err, const std::string& envelopeMessage) {
    ToolInvocationResult r;
    r.name = name;
    r.success = false;
    r.response = object({{"error", JSONValue(envelopeMessage)}});
    r.error = std::move(err);
    return r;
}

} // namespace

JSONValue ToJSON(const ToolCatalogEntry& entry) {
    JSONValue::Object o;
    o["name"] = std::make_shared<JSONValue>(entry.name);
    o["description"] = std::make_shared<JSONValue>(entry.description);
    o["server"] = std::make_shared<JSONValue>(entry.serverId);
    if (entry.parameters.has_value()) {
        o["parameters"] = std::make_shared<JSONValue>(schema::ToJSON(entry.parameters.value()));
    }
    return JSONValue(std::move(o));
}

JSONValue CatalogToJSON(const std::vector<ToolCatalogEntry>& catalog) {
    JSONValue::Array arr;
    arr.reserve(catalog.size());
    for (const auto& entry : catalog) {
        arr.push_back(std::make_shared<JSONValue>(ToJSON(entry)));
    }
    return JSONValue(std::move(arr));
}

//==========================================================================================================
// ToolRegistry::Impl
//==========================================================================================================
class ToolRegistry::Impl {
public:
    struct Snapshot {
        std::vector<ToolCatalogEntry> catalog;
        std::unordered_map<std::string, std::string> owners;
    };

    std::shared_ptr<ITransportFactory> factory;

    mutable std::mutex mutex;
    // Configuration order; discovery merges in this order.
    std::vector<std::string> order;
    std::map<std::string, std::shared_ptr<Connection>> connections;
    std::shared_ptr<const Snapshot> snapshot{std::make_shared<Snapshot>()};

    std::vector<std::pair<std::string, std::shared_ptr<Connection>>> orderedConnections() const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::pair<std::string, std::shared_ptr<Connection>>> out;
        for (const auto& id : order) {
            auto it = connections.find(id);
            if (it != connections.end()) {
                out.emplace_back(id, it->second);
            }
        }
        return out;
    }

    std::shared_ptr<const Snapshot> currentSnapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return snapshot;
    }
};

ToolRegistry::ToolRegistry(std::shared_ptr<ITransportFactory> factory)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->factory = factory ? std::move(factory) : std::make_shared<ChildProcessTransportFactory>();
}

ToolRegistry::~ToolRegistry() {
    Shutdown();
}

std::size_t ToolRegistry::Init(const RegistryConfig& config) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->connections.empty()) {
            LOG_WARN("ToolRegistry::Init called while servers are running; shutting them down first");
        }
    }
    Shutdown();

    std::vector<std::pair<std::string, std::shared_ptr<Connection>>> created;
    for (const auto& server : config.servers) {
        if (!server.enabled) {
            LOG_INFO("Server '{}' is disabled; skipping", server.id);
            continue;
        }
        const bool duplicate = std::any_of(created.begin(), created.end(),
                                           [&server](const auto& entry) { return entry.first == server.id; });
        if (duplicate) {
            LOG_WARN("Duplicate server id '{}' ignored", server.id);
            continue;
        }
        std::unique_ptr<ITransport> transport;
        try {
            transport = pImpl->factory->CreateTransport(server, config.LimitsFor(server));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to create transport for '{}': {}", server.id, e.what());
            continue;
        }
        ConnectionOptions options;
        options.probeMethod = server.probeMethod;
        options.probeParams = server.probeParams;
        options.handshake = server.handshake;
        created.emplace_back(server.id, std::make_shared<Connection>(server.id, std::move(transport), options));
    }

    LOG_INFO("Starting {} tool server(s)", created.size());
    std::vector<std::function<void()>> jobs;
    for (const auto& [id, conn] : created) {
        jobs.emplace_back([serverId = id, conn = conn]() {
            try {
                conn->Initialize().get();
                LOG_INFO("Server '{}' is ready (session {})", serverId, conn->GetSessionId());
            } catch (const errors::McpException& e) {
                LOG_ERROR("Server '{}' failed to initialize: [{}] {}", serverId,
                          errors::categoryName(e.category()), e.what());
            } catch (const std::exception& e) {
                LOG_ERROR("Server '{}' failed to initialize: {}", serverId, e.what());
            }
        });
    }
    runParallel(jobs);

    std::size_t ready = 0;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (auto& [id, conn] : created) {
        auto err = conn->LastError();
        if (!conn->IsReady() && err && err->category == errors::ErrorCategory::SpawnFailure) {
            LOG_WARN("Server '{}' never started; no connection kept", id);
            continue;
        }
        if (conn->IsReady()) {
            ++ready;
        }
        pImpl->order.push_back(id);
        pImpl->connections.emplace(id, std::move(conn));
    }
    LOG_INFO("{} of {} tool server(s) ready", ready, created.size());
    return ready;
}

std::size_t ToolRegistry::DiscoverTools() {
    FUNC_SCOPE();
    auto all = pImpl->orderedConnections();
    std::vector<std::pair<std::string, std::shared_ptr<Connection>>> active;
    for (auto& entry : all) {
        if (entry.second->IsReady()) {
            active.push_back(std::move(entry));
        } else {
            LOG_INFO("Server '{}' is {}; skipping tool discovery", entry.first, ToString(entry.second->State()));
        }
    }
    if (active.empty()) {
        LOG_WARN("No ready servers for tool discovery");
    }

    std::vector<std::optional<std::vector<Tool>>> results(active.size());
    std::vector<std::function<void()>> jobs;
    for (std::size_t i = 0; i < active.size(); ++i) {
        jobs.emplace_back([&results, &active, i]() {
            const auto& [serverId, conn] = active[i];
            try {
                results[i] = conn->ListTools().get();
                LOG_INFO("Received {} tool(s) from '{}'", results[i]->size(), serverId);
            } catch (const std::exception& e) {
                LOG_ERROR("Error listing tools from '{}': {}", serverId, e.what());
            }
        });
    }
    runParallel(jobs);

    auto next = std::make_shared<Impl::Snapshot>();
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < active.size(); ++i) {
        if (!results[i].has_value()) {
            continue;
        }
        const std::string& serverId = active[i].first;
        for (const auto& tool : results[i].value()) {
            if (tool.name.empty()) {
                LOG_WARN("[{}] Skipping tool with missing name", serverId);
                continue;
            }
            ToolCatalogEntry entry;
            entry.name = tool.name;
            entry.description = tool.description;
            entry.serverId = serverId;
            entry.parameters = schema::CleanToolParameters(tool.inputSchema);

            auto it = index.find(tool.name);
            if (it != index.end()) {
                LOG_WARN("Duplicate tool name '{}': '{}' overrides '{}'", tool.name, serverId,
                         next->catalog[it->second].serverId);
                next->catalog[it->second] = std::move(entry);
            } else {
                index.emplace(tool.name, next->catalog.size());
                next->catalog.push_back(std::move(entry));
            }
            next->owners[tool.name] = serverId;
        }
    }

    const std::size_t count = next->catalog.size();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->snapshot = std::move(next);
    }
    LOG_INFO("Tool discovery complete: {} tool(s) from {} server(s)", count, active.size());
    return count;
}

std::vector<ToolCatalogEntry> ToolRegistry::GetCatalog() const {
    return pImpl->currentSnapshot()->catalog;
}

std::optional<std::string> ToolRegistry::GetToolOwner(const std::string& toolName) const {
    auto snap = pImpl->currentSnapshot();
    auto it = snap->owners.find(toolName);
    if (it == snap->owners.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<Connection> ToolRegistry::GetConnection(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->connections.find(serverId);
    return it == pImpl->connections.end() ? nullptr : it->second;
}

std::vector<std::string> ToolRegistry::GetServerIds() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->order;
}

ToolInvocationResult ToolRegistry::InvokeTool(const std::string& toolName, const JSONValue& arguments) {
    FUNC_SCOPE();
    auto owner = GetToolOwner(toolName);
    if (!owner.has_value()) {
        const std::string msg = "Tool '" + toolName + "' not found. It might be unavailable or discovery failed.";
        LOG_ERROR("{}", msg);
        return failure(toolName, errors::makeError(JSONRPCErrorCodes::ToolUnavailable, msg), msg);
    }
    auto conn = GetConnection(owner.value());
    if (!conn || !conn->IsReady()) {
        const std::string msg = "Server '" + owner.value() + "' for tool '" + toolName + "' is not available";
        LOG_ERROR("{}", msg);
        return failure(toolName, errors::makeError(JSONRPCErrorCodes::ToolUnavailable, msg), msg);
    }

    const JSONValue args = arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments;
    LOG_INFO("Executing tool '{}' on '{}' args={}", toolName, owner.value(), Logger::preview(SerializeJSON(args)));
    try {
        CallToolResult result = conn->CallTool(toolName, args).get();
        auto text = firstText(result.content);

        if (result.isError) {
            std::string msg = text.value_or(result.content.empty() ? std::string("Tool reported an error")
                                                                   : SerializeJSON(result.content.front()));
            LOG_WARN("Tool '{}' reported an error: {}", toolName, Logger::preview(msg));
            return failure(toolName, errors::makeError(JSONRPCErrorCodes::InternalError, msg), msg);
        }

        ToolInvocationResult r;
        r.name = toolName;
        r.success = true;
        if (text.has_value()) {
            r.response = object({{"content", JSONValue(text.value())}});
        } else if (!result.content.empty()) {
            LOG_WARN("Tool '{}' result has no text part; serializing first part", toolName);
            r.response = object({{"content", JSONValue(SerializeJSON(result.content.front()))}});
        } else {
            LOG_WARN("Tool '{}' result has no content; returning empty success", toolName);
            r.response = object({{"success", JSONValue(true)}});
        }
        LOG_INFO("Tool '{}' executed successfully", toolName);
        return r;
    } catch (const errors::McpException& e) {
        LOG_ERROR("Error calling tool '{}' on '{}': {}", toolName, owner.value(), e.what());
        return failure(toolName, e.error(), "Failed to execute tool '" + toolName + "': " + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Error calling tool '{}' on '{}': {}", toolName, owner.value(), e.what());
        return failure(toolName, errors::makeError(JSONRPCErrorCodes::InternalError, e.what()),
                       "Failed to execute tool '" + toolName + "': " + e.what());
    }
}

void ToolRegistry::Shutdown() {
    std::map<std::string, std::shared_ptr<Connection>> closing;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        closing.swap(pImpl->connections);
        pImpl->order.clear();
        pImpl->snapshot = std::make_shared<Impl::Snapshot>();
    }
    if (closing.empty()) {
        return;
    }
    LOG_INFO("Shutting down {} tool server(s)", closing.size());
    std::vector<std::function<void()>> jobs;
    for (const auto& [id, conn] : closing) {
        jobs.emplace_back([serverId = id, conn = conn]() {
            try {
                conn->Close().get();
                LOG_INFO("Server '{}' closed", serverId);
            } catch (const std::exception& e) {
                LOG_ERROR("Error closing server '{}': {}", serverId, e.what());
            }
        });
    }
    runParallel(jobs);
}

} // namespace mcphub
