//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Variant-backed JSON document model with a strict parser, a compact serializer and accessors.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace toolhost {

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
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
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

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document. Surrounding whitespace is allowed; anything else after the
//          value is an error.
// Args:
//   text: Input document.
//   error: Optional out-parameter receiving a short description of the first syntax error.
// Returns:
//   The parsed value, or std::nullopt on any syntax error.
//==========================================================================================================
std::optional<JSONValue> ParseJSON(const std::string& text, std::string* error = nullptr);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization (no insignificant whitespace); keys and strings are escaped.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Member lookup on an object value; nullptr when the value is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& object, const std::string& key);

std::optional<std::string> GetString(const JSONValue& object, const std::string& key);
// Doubles are truncated; values outside the int64 range yield std::nullopt.
std::optional<int64_t> GetInteger(const JSONValue& object, const std::string& key);
std::optional<bool> GetBool(const JSONValue& object, const std::string& key);
const JSONValue::Object* GetObject(const JSONValue& object, const std::string& key);
const JSONValue::Array* GetArray(const JSONValue& object, const std::string& key);

// Builder shorthand: wraps a value into the shared_ptr form used by Array and Object.
template <typename T>
std::shared_ptr<JSONValue> MakeJSON(T&& v) {
    return std::make_shared<JSONValue>(std::forward<T>(v));
}

} // namespace toolhost
