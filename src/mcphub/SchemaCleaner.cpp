//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaCleaner.cpp
// Purpose: Schema conversion and cleanup
//==========================================================================================================

#include "mcphub/SchemaCleaner.h"

#include <algorithm>
#include <cctype>

#include "logging/Logger.h"

namespace mcphub {
namespace schema {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* mapType(const std::string& raw) {
    const std::string t = toLower(raw);
    if (t == "string") return Types::String;
    if (t == "number") return Types::Number;
    if (t == "integer") return Types::Integer;
    if (t == "boolean") return Types::Boolean;
    if (t == "array") return Types::Array;
    if (t == "object") return Types::Object;
    return nullptr;
}

std::string coerceToString(const SchemaNode& node) {
    return std::visit([&node](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else {
            return SerializeJSON(ToJSON(node));
        }
    }, node.value);
}

bool isStringArray(const SchemaNode& node) {
    if (!node.isArray()) {
        return false;
    }
    const auto& arr = std::get<SchemaNode::Array>(node.value);
    return std::all_of(arr.begin(), arr.end(), [](const SchemaNode& n) { return n.isString(); });
}

std::optional<SchemaNode> cleanObject(const SchemaNode::Object& in) {
    SchemaNode::Object out;
    for (const auto& [key, value] : in) {
        if (key == "$schema" || key == "title" || key == "additionalProperties") {
            continue;
        }
        if (key == "type" && value.isString() && std::get<std::string>(value.value) == "null") {
            continue;
        }
        auto cleaned = CleanSchema(value);
        if (cleaned.has_value()) {
            out.emplace(key, std::move(cleaned.value()));
        }
    }

    auto typeIt = out.find("type");
    if (typeIt != out.end() && typeIt->second.isString()) {
        const std::string raw = std::get<std::string>(typeIt->second.value);
        if (const char* mapped = mapType(raw)) {
            typeIt->second = SchemaNode(mapped);
        } else {
            LOG_WARN("Unsupported schema type '{}' found during cleaning; removing type", raw);
            out.erase(typeIt);
        }
    } else if (typeIt == out.end()) {
        auto propsIt = out.find("properties");
        if (propsIt != out.end() && propsIt->second.isObject()) {
            out.emplace("type", SchemaNode(Types::Object));
        }
    }

    typeIt = out.find("type");
    const bool isObjectType = typeIt != out.end() && typeIt->second.isString() &&
                              std::get<std::string>(typeIt->second.value) == Types::Object;
    auto reqIt = out.find("required");
    if (isObjectType && reqIt != out.end()) {
        if (reqIt->second.isArray()) {
            const SchemaNode::Object* props = nullptr;
            auto propsIt = out.find("properties");
            if (propsIt != out.end() && propsIt->second.isObject()) {
                props = &std::get<SchemaNode::Object>(propsIt->second.value);
            }
            SchemaNode::Array kept;
            for (const auto& item : std::get<SchemaNode::Array>(reqIt->second.value)) {
                if (item.isString() && props != nullptr && props->count(std::get<std::string>(item.value)) > 0) {
                    kept.push_back(item);
                }
            }
            if (kept.empty()) {
                out.erase(reqIt);
            } else {
                reqIt->second = SchemaNode(std::move(kept));
            }
        } else {
            out.erase(reqIt);
        }
    }

    auto descIt = out.find("description");
    if (descIt != out.end() && !descIt->second.isString()) {
        descIt->second = SchemaNode(coerceToString(descIt->second));
    }
    auto fmtIt = out.find("format");
    if (fmtIt != out.end() && !fmtIt->second.isString()) {
        out.erase(fmtIt);
    }
    auto nullableIt = out.find("nullable");
    if (nullableIt != out.end() && !nullableIt->second.isBool()) {
        out.erase(nullableIt);
    }
    auto enumIt = out.find("enum");
    if (enumIt != out.end() && !isStringArray(enumIt->second)) {
        out.erase(enumIt);
    }

    if (out.empty()) {
        return std::nullopt;
    }
    return SchemaNode(std::move(out));
}

} // namespace

const SchemaNode* SchemaNode::find(const std::string& key) const {
    if (!isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

bool operator==(const SchemaNode& a, const SchemaNode& b) {
    return a.value == b.value;
}

std::optional<SchemaNode> FromJSON(const JSONValue& value) {
    return std::visit([](const auto& v) -> std::optional<SchemaNode> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            SchemaNode::Array out;
            for (const auto& item : v) {
                if (!item) {
                    continue;
                }
                if (auto n = FromJSON(*item)) {
                    out.push_back(std::move(n.value()));
                }
            }
            return SchemaNode(std::move(out));
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            SchemaNode::Object out;
            for (const auto& [key, item] : v) {
                if (!item) {
                    continue;
                }
                if (auto n = FromJSON(*item)) {
                    out.emplace(key, std::move(n.value()));
                }
            }
            return SchemaNode(std::move(out));
        } else {
            return SchemaNode(v);
        }
    }, value.value);
}

JSONValue ToJSON(const SchemaNode& node) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SchemaNode::Array>) {
            JSONValue::Array out;
            out.reserve(v.size());
            for (const auto& item : v) {
                out.push_back(std::make_shared<JSONValue>(ToJSON(item)));
            }
            return JSONValue(std::move(out));
        } else if constexpr (std::is_same_v<T, SchemaNode::Object>) {
            JSONValue::Object out;
            for (const auto& [key, item] : v) {
                out[key] = std::make_shared<JSONValue>(ToJSON(item));
            }
            return JSONValue(std::move(out));
        } else {
            return JSONValue(v);
        }
    }, node.value);
}

std::optional<SchemaNode> CleanSchema(const SchemaNode& node) {
    if (node.isObject()) {
        return cleanObject(std::get<SchemaNode::Object>(node.value));
    }
    if (node.isArray()) {
        SchemaNode::Array out;
        for (const auto& item : std::get<SchemaNode::Array>(node.value)) {
            if (auto cleaned = CleanSchema(item)) {
                out.push_back(std::move(cleaned.value()));
            }
        }
        if (out.empty()) {
            return std::nullopt;
        }
        return SchemaNode(std::move(out));
    }
    return node;
}

std::optional<SchemaNode> CleanToolParameters(const JSONValue& inputSchema) {
    auto root = FromJSON(inputSchema);
    std::optional<SchemaNode> cleaned;
    if (root.has_value()) {
        cleaned = CleanSchema(root.value());
    }
    if (!cleaned.has_value() || !cleaned->isObject()) {
        LOG_WARN("Root schema did not clean into a valid object");
        return std::nullopt;
    }

    SchemaNode::Object out;
    out.emplace("type", SchemaNode(Types::Object));
    const SchemaNode* props = cleaned->find("properties");
    out.emplace("properties", (props != nullptr && props->isObject()) ? *props : SchemaNode(SchemaNode::Object{}));
    const SchemaNode* desc = cleaned->find("description");
    if (desc != nullptr && desc->isString() && !std::get<std::string>(desc->value).empty()) {
        out.emplace("description", *desc);
    }
    const SchemaNode* req = cleaned->find("required");
    if (req != nullptr) {
        out.emplace("required", *req);
    }
    return SchemaNode(std::move(out));
}

} // namespace schema
} // namespace mcphub
