//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks (stderr by default, stdout on request, optional append-mode file) and level parsing
//==========================================================================================================

#include "logging/Logger.h"

#include <errno.h>

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m";
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl, LogLevel fallback) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO") return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return fallback;
}

void Logger::configureFromEnvironment() {
    const std::string level = GetEnvOrDefault("MCPHUB_LOG_LEVEL", "");
    if (!level.empty()) {
        sLogLevel = levelFromString(level, sLogLevel);
    }
    const std::string file = GetEnvOrDefault("MCPHUB_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << fmt::format("[ERROR] Failed to open log file: {} (errno={})", filePath, errno) << std::endl;
        return;
    }
    sLogFile << "\n=== mcphub log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
}

std::string Logger::preview(std::string_view text) {
    static const std::size_t limit = static_cast<std::size_t>(GetEnvUintOrDefault("MCPHUB_LOG_PREVIEW_LEN", 250));
    if (limit == 0 || text.size() <= limit) {
        return std::string(text);
    }
    // Cut on a UTF-8 character boundary
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return fmt::format("{}...(+{} bytes)", text.substr(0, cut), text.size() - cut);
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Color applies to the level label only, and only on the console sink
    static const bool colorEnabled = GetEnvBoolOrDefault("MCPHUB_LOG_COLOR", false);
    // stdout belongs to the CLI's JSON output unless MCPHUB_LOG_STDOUT=1
    static const bool useStdout = GetEnvBoolOrDefault("MCPHUB_LOG_STDOUT", false);

    const char* base = ::strrchr(file, '/');
    base = base ? base + 1 : file;
    const std::string stamp = timestamp();

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = useStdout ? std::cout : std::cerr;
    if (colorEnabled) {
        console << fmt::format("{} [{}{}\033[0m] {}:{}: {}\n", stamp, labelColor(level), level, base, line, msg);
    } else {
        console << fmt::format("{} [{}] {}:{}: {}\n", stamp, level, base, line, msg);
    }
    console.flush();

    if (sLogFile.is_open()) {
        sLogFile << fmt::format("{} [{}] {}:{}: {}\n", stamp, level, base, line, msg);
        sLogFile.flush();
    }
}

std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    char text[32];
    const std::size_t n = std::strftime(text, sizeof(text), "%Y-%m-%d %H:%M:%S", &buf);
    return fmt::format("{}.{:03}", std::string_view(text, n), static_cast<long long>(ms));
}
