//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/mcphub_cli/main.cpp
// Purpose: Starts the configured tool servers, prints the merged tool catalog and optionally calls one tool
//==========================================================================================================

#include <cstring>
#include <iostream>
#include <string>

#include "logging/Logger.h"
#include "mcphub/Config.h"
#include "mcphub/ToolRegistry.h"
#include "mcphub/version.h"

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config=<file.json>] [--call=<tool> [--args=<json>]]\n"
              << "Without --config the server list comes from FILESYSTEM_TARGET_DIRECTORIES,\n"
              << "ENABLE_MEMORY_SERVER, ENABLE_CHROMA_SERVER and CHROMA_PATH.\n";
}

bool takeValue(const char* arg, const char* prefix, std::string& out) {
    const std::size_t n = std::strlen(prefix);
    if (std::strncmp(arg, prefix, n) != 0) {
        return false;
    }
    out = arg + n;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace mcphub;
    Logger::configureFromEnvironment();

    std::string configPath;
    std::string callName;
    std::string callArgs = "{}";
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (takeValue(argv[i], "--config=", configPath) || takeValue(argv[i], "--call=", callName) ||
            takeValue(argv[i], "--args=", callArgs)) {
            continue;
        }
        std::cerr << "Unknown argument: " << argv[i] << "\n";
        usage(argv[0]);
        return 2;
    }

    LOG_INFO("mcphub {} starting", getVersionString());

    RegistryConfig config;
    try {
        config = configPath.empty() ? LoadRegistryConfigFromEnv() : LoadRegistryConfigFromFile(configPath);
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        return 2;
    }
    const auto problems = ValidateRegistryConfig(config);
    for (const auto& p : problems) {
        LOG_WARN("Configuration: {}", p);
    }

    JSONValue arguments;
    if (!callName.empty()) {
        try {
            arguments = ParseJSON(callArgs);
        } catch (const std::exception& e) {
            LOG_ERROR("--args is not valid JSON: {}", e.what());
            return 2;
        }
    }

    ToolRegistry registry;
    registry.Init(config);
    registry.DiscoverTools();
    std::cout << SerializeJSON(CatalogToJSON(registry.GetCatalog())) << std::endl;

    int rc = 0;
    if (!callName.empty()) {
        ToolInvocationResult result = registry.InvokeTool(callName, arguments);
        std::cout << SerializeJSON(result.response) << std::endl;
        rc = result.success ? 0 : 1;
    }

    registry.Shutdown();
    return rc;
}
