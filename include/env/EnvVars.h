//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read typed environment variables used by the hub configuration.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

//==========================================================================================================
// GetEnvBoolOrDefault
// Purpose: Reads a boolean flag. Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
// Returns:
//   Parsed flag, or defaultValue when unset, empty or unrecognized.
//==========================================================================================================
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    return defaultValue;
}

//==========================================================================================================
// GetEnvUintOrDefault
// Purpose: Reads an unsigned integer; malformed or negative values fall back to defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUintOrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    uint64_t out = 0;
    for (char c : v) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
        out = out * 10u + static_cast<uint64_t>(c - '0');
    }
    return out;
}

//==========================================================================================================
// SplitList
// Purpose: Splits a separator-delimited list (e.g. "a, b,c"), trimming whitespace and dropping empties.
//==========================================================================================================
inline std::vector<std::string> SplitList(const std::string& value, char separator = ',') {
    std::vector<std::string> out;
    std::string item;
    auto flush = [&]() {
        std::size_t b = 0;
        std::size_t e = item.size();
        while (b < e && std::isspace(static_cast<unsigned char>(item[b]))) { ++b; }
        while (e > b && std::isspace(static_cast<unsigned char>(item[e - 1]))) { --e; }
        if (e > b) {
            out.emplace_back(item.substr(b, e - b));
        }
        item.clear();
    };
    for (char c : value) {
        if (c == separator) {
            flush();
        } else {
            item.push_back(c);
        }
    }
    flush();
    return out;
}
