#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBOARD_RPC_REQUEST_H
#define CHAINBOARD_RPC_REQUEST_H

#include "core/error.h"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// JsonValue -- lightweight JSON value
// ---------------------------------------------------------------------------
// A variant of: null, bool, int64_t, double, string, array, object.
// Accessors throw std::runtime_error on type mismatch; callers that handle
// untrusted input check the type first or go through try_parse_json().
// ---------------------------------------------------------------------------

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

class JsonValue {
public:
    using Array  = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

private:
    using Storage = std::variant<NullValue, bool, int64_t, double,
                                 std::string, Array, Object>;
    Storage storage_;

public:
    JsonValue()                        : storage_(NullValue{}) {}
    JsonValue(std::nullptr_t)          : storage_(NullValue{}) {}  // NOLINT
    JsonValue(bool v)                  : storage_(v) {}            // NOLINT
    JsonValue(int v)                   : storage_(static_cast<int64_t>(v)) {} // NOLINT
    JsonValue(int64_t v)               : storage_(v) {}            // NOLINT
    JsonValue(double v)                : storage_(v) {}            // NOLINT
    JsonValue(const char* v)           : storage_(std::string(v)) {} // NOLINT
    JsonValue(std::string v)           : storage_(std::move(v)) {} // NOLINT
    JsonValue(std::string_view v)      : storage_(std::string(v)) {} // NOLINT
    JsonValue(Array v)                 : storage_(std::move(v)) {} // NOLINT
    JsonValue(Object v)                : storage_(std::move(v)) {} // NOLINT

    [[nodiscard]] bool is_null()   const { return std::holds_alternative<NullValue>(storage_); }
    [[nodiscard]] bool is_bool()   const { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] bool is_int()    const { return std::holds_alternative<int64_t>(storage_); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] bool is_array()  const { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(storage_); }

    [[nodiscard]] bool get_bool() const {
        if (auto* p = std::get_if<bool>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a bool");
    }
    [[nodiscard]] int64_t get_int() const {
        if (auto* p = std::get_if<int64_t>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an integer");
    }
    [[nodiscard]] double get_double() const {
        if (auto* p = std::get_if<double>(&storage_)) return *p;
        if (auto* p = std::get_if<int64_t>(&storage_)) return static_cast<double>(*p);
        throw std::runtime_error("JsonValue: not a number");
    }
    [[nodiscard]] const std::string& get_string() const {
        if (auto* p = std::get_if<std::string>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a string");
    }
    [[nodiscard]] const Array& get_array() const {
        if (auto* p = std::get_if<Array>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an array");
    }
    [[nodiscard]] const Object& get_object() const {
        if (auto* p = std::get_if<Object>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an object");
    }

    /// Object member access; creates the member (and the object) if absent.
    JsonValue& operator[](const std::string& key) {
        if (is_null()) storage_ = Object{};
        return std::get<Object>(storage_)[key];
    }

    /// Read-only member access; missing members and non-objects yield null.
    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue null_val;
        if (!is_object()) return null_val;
        const auto& obj = std::get<Object>(storage_);
        auto it = obj.find(key);
        return (it != obj.end()) ? it->second : null_val;
    }

    const JsonValue& operator[](size_t index) const {
        return std::get<Array>(storage_).at(index);
    }

    void push_back(JsonValue val) {
        if (is_null()) storage_ = Array{};
        std::get<Array>(storage_).push_back(std::move(val));
    }

    [[nodiscard]] bool has_key(const std::string& key) const {
        if (!is_object()) return false;
        return std::get<Object>(storage_).count(key) > 0;
    }

    [[nodiscard]] size_t size() const {
        if (is_array())  return std::get<Array>(storage_).size();
        if (is_object()) return std::get<Object>(storage_).size();
        if (is_string()) return std::get<std::string>(storage_).size();
        return 0;
    }

    bool operator==(const JsonValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const JsonValue& other) const { return storage_ != other.storage_; }
};

// ---------------------------------------------------------------------------
// JSON parsing and serialization
// ---------------------------------------------------------------------------

/// Parse a JSON document. Throws std::runtime_error on malformed input.
JsonValue parse_json(std::string_view input);

/// Parse a JSON document, reporting malformed input as PARSE_BAD_FORMAT.
core::Result<JsonValue> try_parse_json(std::string_view input);

/// Serialize compactly (no whitespace). Non-ASCII UTF-8 is written through
/// unescaped; control characters are escaped.
std::string json_serialize(const JsonValue& val);

enum class JsonEscape {
    UTF8,    // non-ASCII bytes written through
    ASCII,   // DEL and non-ASCII as \uXXXX, invalid UTF-8 as \ufffd
};

/// Append @p s to @p out as a quoted JSON string literal.
void append_json_string(std::string& out, std::string_view s,
                        JsonEscape mode = JsonEscape::UTF8);

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 client-side envelopes
// ---------------------------------------------------------------------------

struct RpcRequest {
    std::string method;
    JsonValue   params = JsonValue(JsonValue::Array{});
    int64_t     id = 0;

    [[nodiscard]] JsonValue to_json() const;
    [[nodiscard]] std::string serialize() const { return json_serialize(to_json()); }
};

struct RpcResponse {
    JsonValue result;
    JsonValue error;   // null on success, object on error
    int64_t   id = 0;

    /// Validate and unpack a JSON-RPC 2.0 response object.
    static core::Result<RpcResponse> from_json(const JsonValue& val);

    [[nodiscard]] bool is_error() const { return !error.is_null(); }

    /// "code: message" of the error member.
    [[nodiscard]] std::string error_text() const;
};

} // namespace rpc

#endif // CHAINBOARD_RPC_REQUEST_H
