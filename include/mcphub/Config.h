//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server descriptors, registry configuration and the environment/file loaders
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcphub/JSONRPCTypes.h"

namespace mcphub {

//==========================================================================================================
// ServerDescriptor
// Purpose: Static description of one tool server process. Immutable once loaded.
// Fields:
//   id: Unique server identifier used in logs, catalog ownership and session ids.
//   command/args: Executable (resolved through PATH) and its arguments.
//   env: Variables layered over the parent environment; entries here win.
//   enabled: Disabled servers are skipped by the registry.
//   workingDirectory: Optional cwd for the child.
//   probeMethod/probeParams: Readiness probe request issued during Initialize().
//   handshake: When true, the MCP initialize/initialized exchange runs before the probe.
//   requestTimeout: Per-server override of RegistryConfig::requestTimeout.
//==========================================================================================================
struct ServerDescriptor {
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
    std::optional<std::string> workingDirectory;
    std::string probeMethod{"tools/list"};
    std::optional<JSONValue> probeParams;
    bool handshake{false};
    std::optional<std::chrono::milliseconds> requestTimeout;
};

//==========================================================================================================
// TransportLimits
// Purpose: Per-connection limits handed to a transport factory.
//==========================================================================================================
struct TransportLimits {
    std::chrono::milliseconds requestTimeout{12000};
    std::size_t maxContentLength{10 * 1024 * 1024};
    std::size_t headerScanLimit{16 * 1024};
    std::chrono::milliseconds shutdownGrace{2000};
    std::chrono::milliseconds writeTimeout{5000};
};

//==========================================================================================================
// RegistryConfig
// Purpose: Everything the ToolRegistry needs at Init().
//==========================================================================================================
struct RegistryConfig {
    std::vector<ServerDescriptor> servers;
    std::chrono::milliseconds requestTimeout{12000};
    std::size_t maxContentLength{10 * 1024 * 1024};
    std::size_t headerScanLimit{16 * 1024};
    std::chrono::milliseconds shutdownGrace{2000};

    // Resolves the effective limits for one server (per-server timeout wins).
    TransportLimits LimitsFor(const ServerDescriptor& server) const;
};

//==========================================================================================================
// LoadRegistryConfigFromEnv
// Purpose: Builds the preset server list (filesystem, memory, chroma) from environment variables and
//          applies the MCPHUB_* limit overrides.
//==========================================================================================================
RegistryConfig LoadRegistryConfigFromEnv();

//==========================================================================================================
// LoadRegistryConfigFromFile
// Purpose: Reads a JSON configuration document.
// Args:
//   path: File path of the document.
// Returns:
//   Parsed RegistryConfig (presets from the "server" block followed by explicit "servers").
// Throws:
//   std::invalid_argument when the file cannot be read or has the wrong shape.
//==========================================================================================================
RegistryConfig LoadRegistryConfigFromFile(const std::string& path);

// Same as LoadRegistryConfigFromFile but from an in-memory document.
RegistryConfig LoadRegistryConfigFromJSON(const std::string& document);

//==========================================================================================================
// ValidateRegistryConfig
// Purpose: Collects human-readable problems; an empty vector means the config is usable.
//==========================================================================================================
std::vector<std::string> ValidateRegistryConfig(const RegistryConfig& config);

} // namespace mcphub
