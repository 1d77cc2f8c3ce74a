//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaCleaner.h
// Purpose: Tagged-variant schema model and the structural cleanup applied to tool input schemas
//==========================================================================================================
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcphub/JSONRPCTypes.h"

namespace mcphub {
namespace schema {

// Type names emitted after cleaning
namespace Types {
    constexpr const char* String = "STRING";
    constexpr const char* Number = "NUMBER";
    constexpr const char* Integer = "INTEGER";
    constexpr const char* Boolean = "BOOLEAN";
    constexpr const char* Array = "ARRAY";
    constexpr const char* Object = "OBJECT";
}

//==========================================================================================================
// SchemaNode
// Purpose: JSON Schema fragment without null: string | integer | number | boolean | array | object.
//==========================================================================================================
struct SchemaNode {
    using Array = std::vector<SchemaNode>;
    using Object = std::map<std::string, SchemaNode>;

    std::variant<std::string, int64_t, double, bool, Array, Object> value;

    SchemaNode() : value(Object{}) {}
    explicit SchemaNode(std::string s) : value(std::move(s)) {}
    explicit SchemaNode(const char* s) : value(std::string(s)) {}
    explicit SchemaNode(int64_t v) : value(v) {}
    explicit SchemaNode(double v) : value(v) {}
    explicit SchemaNode(bool v) : value(v) {}
    explicit SchemaNode(Array a) : value(std::move(a)) {}
    explicit SchemaNode(Object o) : value(std::move(o)) {}

    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    // Member lookup on object nodes; nullptr when absent or not an object.
    const SchemaNode* find(const std::string& key) const;
};

bool operator==(const SchemaNode& a, const SchemaNode& b);

//==========================================================================================================
// FromJSON
// Purpose: Converts a JSONValue, dropping nulls (object members and array items).
// Returns:
//   std::nullopt when the root itself is null.
//==========================================================================================================
std::optional<SchemaNode> FromJSON(const JSONValue& value);

JSONValue ToJSON(const SchemaNode& node);

//==========================================================================================================
// CleanSchema
// Purpose: Recursive structural cleanup:
//   - drops $schema, title and additionalProperties, and type "null";
//   - drops arrays/objects that end up empty;
//   - maps type names (case-insensitive) to STRING/NUMBER/INTEGER/BOOLEAN/ARRAY/OBJECT and removes
//     unsupported ones with a warning; adds OBJECT when properties is present without a type;
//   - prunes required to names of existing properties (removed when empty or not an array);
//   - coerces description to a string; removes non-string format, non-boolean nullable and an enum
//     that is not an array of strings.
// Returns:
//   The cleaned node, or std::nullopt when nothing representable is left.
//==========================================================================================================
std::optional<SchemaNode> CleanSchema(const SchemaNode& node);

//==========================================================================================================
// CleanToolParameters
// Purpose: Cleans a tool's inputSchema into { type: OBJECT, properties, description?, required? }.
// Returns:
//   std::nullopt (with a warning) when the root does not clean into an object.
//==========================================================================================================
std::optional<SchemaNode> CleanToolParameters(const JSONValue& inputSchema);

} // namespace schema
} // namespace mcphub
