//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Json.h
// Purpose: Minimal JSON value, parser and serializer for OAuth metadata and token documents
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcpauth {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// parseJson
// Purpose: Parse a complete JSON document.
// Throws:
//   std::runtime_error on malformed input or trailing garbage.
//==========================================================================================================
JSONValue parseJson(const std::string& text);

//==========================================================================================================
// serializeJson
// Purpose: Compact serialization (object member order is unspecified).
//==========================================================================================================
std::string serializeJson(const JSONValue& value);

// Object member accessors; return std::nullopt when absent or of another type.
std::optional<std::string> jsonGetString(const JSONValue::Object& obj, const std::string& key);
std::optional<int64_t> jsonGetInt(const JSONValue::Object& obj, const std::string& key);
std::optional<std::vector<std::string>> jsonGetStringArray(const JSONValue::Object& obj, const std::string& key);

// Builders used when composing request documents.
std::shared_ptr<JSONValue> jsonString(const std::string& s);
std::shared_ptr<JSONValue> jsonStringArray(const std::vector<std::string>& items);

} // namespace mcpauth
