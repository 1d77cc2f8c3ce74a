//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/fake_server.cpp
// Purpose: Scripted Content-Length framed tool server used by supervisor/transport/connection/registry tests
//==========================================================================================================
//
// Options:
//   --tools=a,b,c        Tool names advertised by tools/list (default: echo)
//   --nameless           Also advertise one tool without a name
//   --fail-probe         Answer tools/list with a JSON-RPC error
//   --silent-probe       Never answer tools/list
//   --probe-delay-ms=N   Delay the tools/list answer
//   --exit-immediately   Exit before reading anything (exit code from --exit-code, default 1)
//   --stderr=<text>      Print one line to stderr at startup
//
// Tool behaviours (tools/call by name):
//   echo         text = arguments.text, or the serialized arguments
//   delay        sleeps arguments.ms on a worker thread, then answers "delayed <ms>"
//   fail         isError result with text "tool failed"
//   image        one non-text content part
//   empty        no content
//   env          text = value of the environment variable arguments.name
//   cwd          text = current working directory
//   notify       emits notifications/message, then answers "notified"
//   ping-client  issues a ping request to the client and answers "pong" once it is acknowledged
//   peer-error   answers with a JSON-RPC error (-32602)
//   oversize     writes a header declaring a huge body
//   garbage      writes a header block without Content-Length
//   crash        exits with status 3 without answering
//==========================================================================================================

#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "env/EnvVars.h"
#include "mcphub/ContentFramer.h"
#include "mcphub/JSONRPCTypes.h"

using namespace mcphub;

namespace {

struct Options {
    std::vector<std::string> tools{"echo"};
    bool nameless{false};
    bool failProbe{false};
    bool silentProbe{false};
    int probeDelayMs{0};
    bool exitImmediately{false};
    int exitCode{1};
    std::string stderrLine;
};

std::mutex gWriteMutex;
std::unique_ptr<IContentFramer> gFramer = MakeContentLengthFramer();
// Tool call waiting for the client to answer our ping.
std::optional<std::string> gPendingPingCallId;

void writeRaw(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(gWriteMutex);
    std::size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(STDOUT_FILENO, bytes.data() + off, bytes.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::_exit(4);
        }
        off += static_cast<std::size_t>(n);
    }
}

void writeMessage(const std::string& json) {
    writeRaw(gFramer->encode(json));
}

std::string quote(const std::string& s) {
    return SerializeJSON(JSONValue(s));
}

void replyResult(const std::string& idJson, const std::string& resultJson) {
    writeMessage("{\"jsonrpc\":\"2.0\",\"id\":" + idJson + ",\"result\":" + resultJson + "}");
}

void replyError(const std::string& idJson, int code, const std::string& message) {
    writeMessage("{\"jsonrpc\":\"2.0\",\"id\":" + idJson + ",\"error\":{\"code\":" + std::to_string(code) +
                 ",\"message\":" + quote(message) + "}}");
}

std::string textResult(const std::string& text, bool isError = false) {
    return std::string("{\"content\":[{\"type\":\"text\",\"text\":") + quote(text) + "}],\"isError\":" +
           (isError ? "true" : "false") + "}";
}

std::string toolsListResult(const Options& opt) {
    std::string out = "{\"tools\":[";
    bool first = true;
    for (const auto& name : opt.tools) {
        if (!first) {
            out += ",";
        }
        first = false;
        out += "{\"name\":" + quote(name) + ",\"description\":" + quote(name + " tool") +
               ",\"inputSchema\":{\"$schema\":\"http://json-schema.org/draft-07/schema#\",\"type\":\"object\","
               "\"title\":\"Args\",\"additionalProperties\":false,"
               "\"properties\":{\"text\":{\"type\":\"string\",\"title\":\"Text\",\"description\":\"Input\"},"
               "\"ms\":{\"type\":\"integer\"},\"name\":{\"type\":[\"string\",\"null\"]}},"
               "\"required\":[\"text\",\"missing\"]}}";
    }
    if (opt.nameless) {
        out += std::string(first ? "" : ",") + "{\"description\":\"no name\",\"inputSchema\":{\"type\":\"object\"}}";
    }
    out += "]}";
    return out;
}

void handleToolCall(const std::string& idJson, const JSONValue& params) {
    const std::string name = GetStringMember(params, "name").value_or("");
    JSONValue args(JSONValue::Object{});
    if (const JSONValue* a = FindMember(params, "arguments")) {
        args = *a;
    }

    if (name == "echo") {
        auto text = GetStringMember(args, "text");
        replyResult(idJson, textResult(text ? *text : SerializeJSON(args)));
    } else if (name == "delay") {
        const int64_t ms = GetIntMember(args, "ms").value_or(100);
        std::thread([idJson, ms]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            replyResult(idJson, textResult("delayed " + std::to_string(ms)));
        }).detach();
    } else if (name == "fail") {
        replyResult(idJson, textResult("tool failed", true));
    } else if (name == "image") {
        replyResult(idJson, "{\"content\":[{\"type\":\"image\",\"data\":\"aGk=\",\"mimeType\":\"image/png\"}]}");
    } else if (name == "empty") {
        replyResult(idJson, "{\"content\":[]}");
    } else if (name == "env") {
        const std::string var = GetStringMember(args, "name").value_or("");
        replyResult(idJson, textResult(GetEnvOrDefault(var.c_str(), "")));
    } else if (name == "cwd") {
        char buf[4096];
        const char* cwd = ::getcwd(buf, sizeof(buf));
        replyResult(idJson, textResult(cwd ? cwd : ""));
    } else if (name == "notify") {
        writeMessage("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\","
                     "\"params\":{\"level\":\"info\",\"data\":\"hello\"}}");
        replyResult(idJson, textResult("notified"));
    } else if (name == "ping-client") {
        gPendingPingCallId = idJson;
        writeMessage("{\"jsonrpc\":\"2.0\",\"id\":\"srv-1\",\"method\":\"ping\"}");
    } else if (name == "peer-error") {
        replyError(idJson, JSONRPCErrorCodes::InvalidParams, "bad arguments");
    } else if (name == "oversize") {
        writeRaw("Content-Length: 999999999999\r\n\r\n");
    } else if (name == "garbage") {
        writeRaw("Content-Type: text/plain\r\n\r\n{}");
    } else if (name == "crash") {
        ::_exit(3);
    } else {
        replyError(idJson, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name);
    }
}

void handleRequest(const Options& opt, const std::string& idJson, const std::string& method, const JSONValue& params) {
    if (method == "initialize") {
        replyResult(idJson, "{\"protocolVersion\":\"2024-11-05\",\"capabilities\":{\"tools\":{}},"
                            "\"serverInfo\":{\"name\":\"fake\",\"version\":\"1.0\"}}");
    } else if (method == "ping") {
        replyResult(idJson, "{}");
    } else if (method == "tools/list") {
        if (opt.silentProbe) {
            return;
        }
        if (opt.failProbe) {
            replyError(idJson, JSONRPCErrorCodes::InternalError, "probe failed");
            return;
        }
        if (opt.probeDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opt.probeDelayMs));
        }
        replyResult(idJson, toolsListResult(opt));
    } else if (method == "tools/call") {
        handleToolCall(idJson, params);
    } else if (method == "resources/list") {
        replyResult(idJson, "{\"resources\":[{\"uri\":\"mem://a\",\"name\":\"a\",\"mimeType\":\"text/plain\"}]}");
    } else if (method == "resources/read") {
        replyResult(idJson, "{\"contents\":[{\"uri\":\"mem://a\",\"text\":\"alpha\"}]}");
    } else if (method == "prompts/list") {
        replyResult(idJson, "{\"prompts\":[{\"name\":\"greet\",\"description\":\"Greeting\"}]}");
    } else if (method == "prompts/get") {
        replyResult(idJson, "{\"description\":\"Greeting\",\"messages\":[{\"role\":\"user\","
                            "\"content\":{\"type\":\"text\",\"text\":\"hi\"}}]}");
    } else {
        replyError(idJson, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method);
    }
}

void handleMessage(const Options& opt, const std::string& body) {
    JSONValue msg;
    try {
        msg = ParseJSON(body);
    } catch (const std::exception& e) {
        std::cerr << "fake_server: bad json: " << e.what() << std::endl;
        return;
    }
    const JSONValue* id = FindMember(msg, "id");
    auto method = GetStringMember(msg, "method");
    if (method && id != nullptr) {
        JSONValue params;
        if (const JSONValue* p = FindMember(msg, "params")) {
            params = *p;
        }
        handleRequest(opt, SerializeJSON(*id), *method, params);
        return;
    }
    if (method) {
        std::cerr << "fake_server: notification " << *method << std::endl;
        return;
    }
    // Response to our own ping.
    if (id != nullptr && id->isString() && std::get<std::string>(id->value) == "srv-1" && gPendingPingCallId) {
        replyResult(*gPendingPingCallId, textResult("pong"));
        gPendingPingCallId.reset();
    }
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
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string v;
        if (takeValue(argv[i], "--tools=", v)) {
            opt.tools = SplitList(v);
        } else if (std::strcmp(argv[i], "--nameless") == 0) {
            opt.nameless = true;
        } else if (std::strcmp(argv[i], "--fail-probe") == 0) {
            opt.failProbe = true;
        } else if (std::strcmp(argv[i], "--silent-probe") == 0) {
            opt.silentProbe = true;
        } else if (takeValue(argv[i], "--probe-delay-ms=", v)) {
            opt.probeDelayMs = std::atoi(v.c_str());
        } else if (std::strcmp(argv[i], "--exit-immediately") == 0) {
            opt.exitImmediately = true;
        } else if (takeValue(argv[i], "--exit-code=", v)) {
            opt.exitCode = std::atoi(v.c_str());
        } else if (takeValue(argv[i], "--stderr=", v)) {
            opt.stderrLine = v;
        }
    }

    if (!opt.stderrLine.empty()) {
        std::cerr << opt.stderrLine << std::endl;
    }
    if (opt.exitImmediately) {
        return opt.exitCode;
    }

    FrameBuffer frames;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::_exit(5);
        }
        if (n == 0) {
            ::_exit(0);
        }
        std::vector<std::string> bodies;
        if (frames.append(std::string_view(buf, static_cast<std::size_t>(n)), bodies) != IContentFramer::DecodeStatus::Ok) {
            std::cerr << "fake_server: framing error" << std::endl;
            ::_exit(6);
        }
        for (const auto& body : bodies) {
            handleMessage(opt, body);
        }
    }
}
