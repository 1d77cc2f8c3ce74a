//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Registry configuration loaders (environment presets and JSON documents) and validation
//==========================================================================================================

#include "mcphub/Config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace mcphub {

namespace {

constexpr const char* kFilesystemId = "filesystem";
constexpr const char* kMemoryId = "memory";
constexpr const char* kChromaId = "chroma";
constexpr const char* kFilesystemPackage = "@modelcontextprotocol/server-filesystem";
constexpr const char* kMemoryPackage = "@modelcontextprotocol/server-memory";
constexpr const char* kDefaultChromaPath = "./chroma_db";
constexpr const char* kDefaultChromaCollection = "chat_memory";

struct PresetSettings {
    std::vector<std::string> filesystemDirectories;
    bool enableMemory{false};
    bool enableChroma{true};
    std::string chromaPath{kDefaultChromaPath};
    std::string chromaCollection{kDefaultChromaCollection};
};

std::string absolutePath(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    return std::filesystem::absolute(std::filesystem::path(path)).lexically_normal().string();
}

void appendPresets(const PresetSettings& presets, std::vector<ServerDescriptor>& out) {
    if (!presets.filesystemDirectories.empty()) {
        ServerDescriptor fs;
        fs.id = kFilesystemId;
        fs.command = "npx";
        fs.args = {"-y", kFilesystemPackage};
        for (const auto& dir : presets.filesystemDirectories) {
            fs.args.push_back(absolutePath(dir));
        }
        out.push_back(std::move(fs));
    } else {
        LOG_INFO("Skipping '{}' server: no target directories configured", kFilesystemId);
    }

    if (presets.enableMemory) {
        ServerDescriptor mem;
        mem.id = kMemoryId;
        mem.command = "npx";
        mem.args = {"-y", kMemoryPackage};
        mem.env["MEMORY_FILE_PATH"] = absolutePath("memory.json");
        out.push_back(std::move(mem));
    } else {
        LOG_INFO("Skipping '{}' server: memory server disabled", kMemoryId);
    }

    if (presets.enableChroma) {
        ServerDescriptor chroma;
        chroma.id = kChromaId;
        chroma.command = "uvx";
        chroma.args = {"chroma-mcp", "--client-type", "persistent", "--data-dir", absolutePath(presets.chromaPath)};
        chroma.env["CHROMA_COLLECTION_NAME"] = presets.chromaCollection;
        out.push_back(std::move(chroma));
    } else {
        LOG_INFO("Skipping '{}' server: chroma server disabled", kChromaId);
    }
}

void applyEnvOverrides(RegistryConfig& config) {
    config.requestTimeout = std::chrono::milliseconds(
        GetEnvUintOrDefault("MCPHUB_REQUEST_TIMEOUT_MS", static_cast<uint64_t>(config.requestTimeout.count())));
    const auto maxBytes = GetEnvUintOrDefault("MCPHUB_MAX_MESSAGE_BYTES", config.maxContentLength);
    if (maxBytes == 0) {
        LOG_WARN("Ignoring MCPHUB_MAX_MESSAGE_BYTES=0; keeping {} bytes", config.maxContentLength);
    } else {
        config.maxContentLength = static_cast<std::size_t>(maxBytes);
    }
    config.shutdownGrace = std::chrono::milliseconds(
        GetEnvUintOrDefault("MCPHUB_SHUTDOWN_GRACE_MS", static_cast<uint64_t>(config.shutdownGrace.count())));
}

[[noreturn]] void fail(const std::string& what) {
    throw std::invalid_argument("Invalid configuration: " + what);
}

const JSONValue* objectMember(const JSONValue& obj, const std::string& key, const std::string& path) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return nullptr;
    }
    if (!v->isObject()) {
        fail(path + " must be an object");
    }
    return v;
}

std::optional<std::string> stringMember(const JSONValue& obj, const std::string& key, const std::string& path) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return std::nullopt;
    }
    if (!v->isString()) {
        fail(path + " must be a string");
    }
    return std::get<std::string>(v->value);
}

std::optional<bool> boolMember(const JSONValue& obj, const std::string& key, const std::string& path) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return std::nullopt;
    }
    if (!std::holds_alternative<bool>(v->value)) {
        fail(path + " must be a boolean");
    }
    return std::get<bool>(v->value);
}

std::optional<uint64_t> uintMember(const JSONValue& obj, const std::string& key, const std::string& path) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(v->value) || std::get<int64_t>(v->value) < 0) {
        fail(path + " must be a non-negative integer");
    }
    return static_cast<uint64_t>(std::get<int64_t>(v->value));
}

std::vector<std::string> stringArrayMember(const JSONValue& obj, const std::string& key, const std::string& path) {
    std::vector<std::string> out;
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return out;
    }
    if (!v->isArray()) {
        fail(path + " must be an array of strings");
    }
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (!item || !item->isString()) {
            fail(path + " must be an array of strings");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

ServerDescriptor parseServer(const JSONValue& node, std::size_t index) {
    const std::string path = "servers[" + std::to_string(index) + "]";
    if (!node.isObject()) {
        fail(path + " must be an object");
    }
    ServerDescriptor d;
    auto id = stringMember(node, "id", path + ".id");
    if (!id.has_value() || id->empty()) {
        fail(path + ".id is required");
    }
    d.id = *id;
    auto command = stringMember(node, "command", path + ".command");
    if (!command.has_value()) {
        fail(path + ".command is required");
    }
    d.command = *command;
    d.args = stringArrayMember(node, "args", path + ".args");
    if (const JSONValue* env = objectMember(node, "env", path + ".env")) {
        for (const auto& [name, value] : std::get<JSONValue::Object>(env->value)) {
            if (!value || !value->isString()) {
                fail(path + ".env." + name + " must be a string");
            }
            d.env[name] = std::get<std::string>(value->value);
        }
    }
    d.enabled = boolMember(node, "enabled", path + ".enabled").value_or(true);
    if (auto cwd = stringMember(node, "workingDirectory", path + ".workingDirectory")) {
        d.workingDirectory = *cwd;
    }
    if (auto probe = stringMember(node, "probeMethod", path + ".probeMethod")) {
        d.probeMethod = *probe;
    }
    if (const JSONValue* params = FindMember(node, "probeParams")) {
        if (!params->isNull()) {
            d.probeParams = *params;
        }
    }
    d.handshake = boolMember(node, "handshake", path + ".handshake").value_or(false);
    if (auto timeout = uintMember(node, "requestTimeoutMs", path + ".requestTimeoutMs")) {
        d.requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(*timeout));
    }
    return d;
}

PresetSettings parsePresets(const JSONValue& root) {
    PresetSettings presets;
    const JSONValue* server = objectMember(root, "server", "server");
    if (server == nullptr) {
        // An explicit document without the preset block starts with no presets at all.
        presets.enableChroma = false;
        return presets;
    }
    if (const JSONValue* fs = objectMember(*server, "filesystem", "server.filesystem")) {
        presets.filesystemDirectories =
            stringArrayMember(*fs, "target_directories", "server.filesystem.target_directories");
    }
    if (const JSONValue* mem = objectMember(*server, "memory", "server.memory")) {
        presets.enableMemory =
            boolMember(*mem, "enable_memory_server", "server.memory.enable_memory_server").value_or(false);
    }
    if (const JSONValue* chroma = objectMember(*server, "chroma", "server.chroma")) {
        presets.enableChroma =
            boolMember(*chroma, "enable_chroma_server", "server.chroma.enable_chroma_server").value_or(true);
        if (auto p = stringMember(*chroma, "path", "server.chroma.path")) {
            presets.chromaPath = *p;
        }
        if (auto c = stringMember(*chroma, "collection_name", "server.chroma.collection_name")) {
            presets.chromaCollection = *c;
        }
    }
    return presets;
}

void logSummary(const RegistryConfig& config) {
    LOG_INFO("Registry configuration: {} server(s), request timeout {}ms, max message {} bytes, shutdown grace {}ms",
             config.servers.size(), config.requestTimeout.count(), config.maxContentLength,
             config.shutdownGrace.count());
    for (const auto& s : config.servers) {
        LOG_DEBUG("  [{}] {} ({} args, enabled={})", s.id, s.command, s.args.size(), s.enabled);
    }
}

} // namespace

TransportLimits RegistryConfig::LimitsFor(const ServerDescriptor& server) const {
    TransportLimits limits;
    limits.requestTimeout = server.requestTimeout.value_or(requestTimeout);
    limits.maxContentLength = maxContentLength;
    limits.headerScanLimit = headerScanLimit;
    limits.shutdownGrace = shutdownGrace;
    return limits;
}

RegistryConfig LoadRegistryConfigFromEnv() {
    FUNC_SCOPE();
    PresetSettings presets;
    presets.filesystemDirectories = SplitList(GetEnvOrDefault("FILESYSTEM_TARGET_DIRECTORIES", ""));
    presets.enableMemory = GetEnvBoolOrDefault("ENABLE_MEMORY_SERVER", false);
    presets.enableChroma = GetEnvBoolOrDefault("ENABLE_CHROMA_SERVER", true);
    presets.chromaPath = GetEnvOrDefault("CHROMA_PATH", kDefaultChromaPath);
    presets.chromaCollection = GetEnvOrDefault("CHROMA_COLLECTION_NAME", kDefaultChromaCollection);

    RegistryConfig config;
    appendPresets(presets, config.servers);
    applyEnvOverrides(config);
    logSummary(config);
    return config;
}

RegistryConfig LoadRegistryConfigFromJSON(const std::string& document) {
    FUNC_SCOPE();
    JSONValue root;
    try {
        root = ParseJSON(document);
    } catch (const std::exception& e) {
        fail(std::string("malformed JSON: ") + e.what());
    }
    if (!root.isObject()) {
        fail("document root must be an object");
    }

    RegistryConfig config;
    if (auto v = uintMember(root, "requestTimeoutMs", "requestTimeoutMs")) {
        config.requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(*v));
    }
    if (auto v = uintMember(root, "maxMessageBytes", "maxMessageBytes")) {
        if (*v == 0) {
            fail("maxMessageBytes must be at least 1");
        }
        config.maxContentLength = static_cast<std::size_t>(*v);
    }
    if (auto v = uintMember(root, "shutdownGraceMs", "shutdownGraceMs")) {
        config.shutdownGrace = std::chrono::milliseconds(static_cast<int64_t>(*v));
    }

    appendPresets(parsePresets(root), config.servers);

    if (const JSONValue* servers = FindMember(root, "servers")) {
        if (!servers->isArray()) {
            fail("servers must be an array");
        }
        const auto& arr = std::get<JSONValue::Array>(servers->value);
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (!arr[i]) {
                fail("servers[" + std::to_string(i) + "] must be an object");
            }
            config.servers.push_back(parseServer(*arr[i], i));
        }
    }

    applyEnvOverrides(config);
    logSummary(config);
    return config;
}

RegistryConfig LoadRegistryConfigFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::invalid_argument("Cannot read configuration file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    LOG_INFO("Loading registry configuration from {}", path);
    return LoadRegistryConfigFromJSON(ss.str());
}

std::vector<std::string> ValidateRegistryConfig(const RegistryConfig& config) {
    std::vector<std::string> problems;
    std::set<std::string> seen;
    std::size_t enabled = 0;

    for (const auto& s : config.servers) {
        if (!seen.insert(s.id).second) {
            problems.push_back("Duplicate server id '" + s.id + "'");
        }
        if (!s.enabled) {
            continue;
        }
        ++enabled;
        if (s.command.empty()) {
            problems.push_back("Server '" + s.id + "' has an empty command");
        }
        if (s.id == kFilesystemId) {
            bool afterPackage = false;
            for (const auto& arg : s.args) {
                if (!afterPackage) {
                    afterPackage = (arg == kFilesystemPackage);
                    continue;
                }
                std::error_code ec;
                if (!std::filesystem::is_directory(arg, ec)) {
                    problems.push_back("Filesystem target directory does not exist: " + arg);
                }
            }
        }
        if (s.id == kChromaId) {
            bool hasPath = false;
            for (std::size_t i = 0; i + 1 < s.args.size(); ++i) {
                if (s.args[i] == "--data-dir" && !s.args[i + 1].empty()) {
                    hasPath = true;
                }
            }
            if (!hasPath) {
                problems.push_back("Chroma server is enabled but its data path is empty");
            }
            auto it = s.env.find("CHROMA_COLLECTION_NAME");
            if (it != s.env.end() && it->second.empty()) {
                problems.push_back("Chroma server is enabled but its collection name is empty");
            }
        }
    }
    if (enabled == 0) {
        problems.push_back("No tool servers are enabled");
    }
    if (config.maxContentLength == 0) {
        problems.push_back("Maximum message size is 0; every frame would be rejected");
    }
    return problems;
}

} // namespace mcphub
