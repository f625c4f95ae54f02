// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/request.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace rpc {

// ===========================================================================
// JSON Parser
// ===========================================================================

namespace {

constexpr int MAX_DEPTH = 128;

class JsonReader {
public:
    explicit JsonReader(std::string_view input) : input_(input) {}

    JsonValue read_document() {
        JsonValue val = read_value(0);
        skip_ws();
        if (pos_ != input_.size()) {
            fail("trailing characters after document");
        }
        return val;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at offset " +
                                 std::to_string(pos_));
    }

    bool at_end() const { return pos_ >= input_.size(); }

    char next() {
        if (at_end()) fail("unexpected end of input");
        return input_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            char c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (!at_end() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void require(char c) {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    void literal(std::string_view word) {
        if (input_.substr(pos_, word.size()) != word) fail("invalid literal");
        pos_ += word.size();
    }

    JsonValue read_value(int depth) {
        if (depth > MAX_DEPTH) fail("nesting too deep");
        skip_ws();
        if (at_end()) fail("unexpected end of input");

        switch (input_[pos_]) {
            case '"': return JsonValue(read_string());
            case '{': return read_object(depth);
            case '[': return read_array(depth);
            case 't': literal("true");  return JsonValue(true);
            case 'f': literal("false"); return JsonValue(false);
            case 'n': literal("null");  return JsonValue(nullptr);
            default:  return read_number();
        }
    }

    JsonValue read_object(int depth) {
        require('{');
        JsonValue::Object obj;
        if (consume('}')) return JsonValue(std::move(obj));
        do {
            skip_ws();
            if (at_end() || input_[pos_] != '"') fail("expected object key");
            std::string key = read_string();
            require(':');
            obj[std::move(key)] = read_value(depth + 1);
        } while (consume(','));
        require('}');
        return JsonValue(std::move(obj));
    }

    JsonValue read_array(int depth) {
        require('[');
        JsonValue::Array arr;
        if (consume(']')) return JsonValue(std::move(arr));
        do {
            arr.push_back(read_value(depth + 1));
        } while (consume(','));
        require(']');
        return JsonValue(std::move(arr));
    }

    JsonValue read_number() {
        const size_t start = pos_;
        bool fractional = false;
        if (!at_end() && input_[pos_] == '-') ++pos_;
        if (at_end() || input_[pos_] < '0' || input_[pos_] > '9') {
            fail("invalid number");
        }
        while (!at_end()) {
            char c = input_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' ||
                       ((c == '+' || c == '-') && fractional)) {
                fractional = true;
                ++pos_;
            } else {
                break;
            }
        }

        std::string text(input_.substr(start, pos_ - start));
        char* end = nullptr;
        if (!fractional) {
            errno = 0;
            long long v = std::strtoll(text.c_str(), &end, 10);
            if (errno == 0 && end == text.c_str() + text.size()) {
                return JsonValue(static_cast<int64_t>(v));
            }
            // Out of int64 range: fall through to double.
        }
        double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(d)) {
            fail("invalid number");
        }
        return JsonValue(d);
    }

    uint32_t read_hex4() {
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = next();
            cp <<= 4;
            if (c >= '0' && c <= '9')      cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("bad \\u escape");
        }
        return cp;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string read_string() {
        if (next() != '"') fail("expected string");
        std::string out;
        for (;;) {
            char c = next();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (next() != '\\' || next() != 'u') {
                            fail("unpaired surrogate");
                        }
                        uint32_t lo = read_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("bad low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("unknown escape '\\") + esc + "'");
            }
        }
        return out;
    }
};

// ===========================================================================
// JSON Serializer
// ===========================================================================

void append_u16(std::string& out, uint32_t unit) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", unit);
    out += buf;
}

void append_codepoint(std::string& out, uint32_t cp) {
    if (cp >= 0x10000) {
        cp -= 0x10000;
        append_u16(out, 0xD800 + (cp >> 10));
        append_u16(out, 0xDC00 + (cp & 0x3FF));
    } else {
        append_u16(out, cp);
    }
}

// Decode one UTF-8 sequence at s[i]; advances i. Returns U+FFFD for
// invalid or truncated input (consuming one byte).
uint32_t decode_utf8(std::string_view s, size_t& i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    size_t len;
    uint32_t cp;
    uint32_t min;
    if ((b0 & 0xE0) == 0xC0)      { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else { ++i; return 0xFFFD; }

    if (i + len > s.size()) { ++i; return 0xFFFD; }
    for (size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++i;
        return 0xFFFD;
    }
    i += len;
    return cp;
}

void write_value(std::string& out, const JsonValue& val) {
    if (val.is_null()) {
        out += "null";
    } else if (val.is_bool()) {
        out += val.get_bool() ? "true" : "false";
    } else if (val.is_int()) {
        out += std::to_string(val.get_int());
    } else if (val.is_double()) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", val.get_double());
        out += buf;
    } else if (val.is_string()) {
        append_json_string(out, val.get_string());
    } else if (val.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : val.get_array()) {
            if (!first) out += ',';
            first = false;
            write_value(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : val.get_object()) {
            if (!first) out += ',';
            first = false;
            append_json_string(out, key);
            out += ':';
            write_value(out, item);
        }
        out += '}';
    }
}

} // anonymous namespace

void append_json_string(std::string& out, std::string_view s, JsonEscape mode) {
    out += '"';
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (mode == JsonEscape::ASCII && c == 0x7F) {
            append_u16(out, c);
            ++i;
            continue;
        }
        if (mode == JsonEscape::ASCII && c >= 0x80) {
            append_codepoint(out, decode_utf8(s, i));
            continue;
        }
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (c < 0x20) append_u16(out, c);
                else out += static_cast<char>(c);
        }
        ++i;
    }
    out += '"';
}

JsonValue parse_json(std::string_view input) {
    JsonReader reader(input);
    return reader.read_document();
}

core::Result<JsonValue> try_parse_json(std::string_view input) {
    try {
        return parse_json(input);
    } catch (const std::runtime_error& e) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT, e.what());
    }
}

std::string json_serialize(const JsonValue& val) {
    std::string out;
    write_value(out, val);
    return out;
}

// ===========================================================================
// RpcRequest / RpcResponse
// ===========================================================================

JsonValue RpcRequest::to_json() const {
    JsonValue obj;
    obj["jsonrpc"] = "2.0";
    obj["method"]  = method;
    obj["params"]  = params;
    obj["id"]      = id;
    return obj;
}

core::Result<RpcResponse> RpcResponse::from_json(const JsonValue& val) {
    if (!val.is_object()) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "response is not a JSON object");
    }

    RpcResponse resp;
    const JsonValue& id = val["id"];
    if (id.is_int()) resp.id = id.get_int();

    if (val.has_key("error") && !val["error"].is_null()) {
        resp.error = val["error"];
        return resp;
    }
    if (!val.has_key("result")) {
        return core::make_error(core::ErrorCode::RPC_BAD_RESPONSE,
                                "response has neither result nor error");
    }
    resp.result = val["result"];
    return resp;
}

std::string RpcResponse::error_text() const {
    if (error.is_null()) return {};
    if (!error.is_object()) return json_serialize(error);

    std::string text;
    if (error["code"].is_int()) {
        text = std::to_string(error["code"].get_int()) + ": ";
    }
    if (error["message"].is_string()) {
        text += error["message"].get_string();
    } else {
        text += json_serialize(error);
    }
    return text;
}

} // namespace rpc
