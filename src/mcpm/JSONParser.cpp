//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON codec and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cctype>
#include <format>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "mcpm/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpm {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxDepth = 256u;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("expected value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("expected digits after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("expected exponent digits");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double like most JSON libraries do.
                return JSONValue(std::stod(num));
            }
        }
        return JSONValue(std::stod(num));
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > MaxDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > MaxDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' && s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (c == 'f' && s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (c == 'n' && s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (v != v || v == std::numeric_limits<double>::infinity() || v == -std::numeric_limits<double>::infinity()) {
                out += "null";
            } else {
                // Shortest round-trip form; keep a fraction so the value parses back as double.
                std::string d = std::format("{}", v);
                if (d.find_first_of(".eE") == std::string::npos) {
                    d += ".0";
                }
                out += d;
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (v[i]) { serializeInto(out, *v[i]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) { serializeInto(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

std::string serializeId(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else {
            out += "null";
        }
    }, id);
    return out;
}

JSONRPCId idFromValue(const JSONValue* v) {
    if (v == nullptr) {
        return nullptr;
    }
    if (std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return nullptr;
}
} // namespace

////////////////////////////////////////////// Codec //////////////////////////////////////////////

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::string out;
    serializeInto(out, value);
    return out;
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&a.value)) {
        const auto& other = std::get<JSONValue::Array>(b.value);
        if (arr->size() != other.size()) return false;
        for (std::size_t i = 0; i < arr->size(); ++i) {
            const auto& l = (*arr)[i];
            const auto& r = other[i];
            if (!l || !r) {
                if (static_cast<bool>(l) != static_cast<bool>(r)) return false;
                continue;
            }
            if (!(*l == *r)) return false;
        }
        return true;
    }
    if (const auto* obj = std::get_if<JSONValue::Object>(&a.value)) {
        const auto& other = std::get<JSONValue::Object>(b.value);
        if (obj->size() != other.size()) return false;
        for (const auto& [k, v] : *obj) {
            auto it = other.find(k);
            if (it == other.end()) return false;
            if (!v || !it->second) {
                if (static_cast<bool>(v) != static_cast<bool>(it->second)) return false;
                continue;
            }
            if (!(*v == *it->second)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [k, v] : members) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue(std::move(arr));
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&object.value);
    if (!obj) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v || !std::holds_alternative<std::string>(v->value)) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    if (std::holds_alternative<double>(v->value)) {
        return static_cast<int64_t>(std::get<double>(v->value));
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v || !std::holds_alternative<bool>(v->value)) {
        return std::nullopt;
    }
    return std::get<bool>(v->value);
}

void SetMember(JSONValue& object, const std::string& key, JSONValue member) {
    if (!object.isObject()) {
        object.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(object.value)[key] = std::make_shared<JSONValue>(std::move(member));
}

std::string JSONRPCIdToString(const JSONRPCId& id) {
    std::string idStr;
    std::visit([&idStr](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { idStr = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { idStr = std::to_string(v); }
    }, id);
    return idStr;
}

////////////////////////////////////////////// Messages //////////////////////////////////////////////

std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":" + serializeId(id) + ",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        serializeInto(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCRequest::FromValue(const JSONValue& message) {
    auto m = GetStringMember(message, "method");
    if (!m.has_value() || m->empty()) {
        return false;
    }
    method = *m;
    id = idFromValue(FindMember(message, "id"));
    if (const JSONValue* p = FindMember(message, "params")) {
        params = *p;
    }
    return true;
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"id\":" + serializeId(id);
    if (result.has_value()) {
        out += ",\"result\":";
        serializeInto(out, result.value());
    }
    if (error.has_value()) {
        out += ",\"error\":";
        serializeInto(out, error.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCResponse::FromValue(const JSONValue& message) {
    const JSONValue* r = FindMember(message, "result");
    const JSONValue* e = FindMember(message, "error");
    if (!r && !e) {
        return false;
    }
    id = idFromValue(FindMember(message, "id"));
    if (r) result = *r;
    if (e) error = *e;
    return true;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":\"" + jsonrpc + "\",\"method\":";
    appendEscaped(out, method);
    if (params.has_value()) {
        out += ",\"params\":";
        serializeInto(out, params.value());
    }
    out.push_back('}');
    return out;
}

bool JSONRPCNotification::FromValue(const JSONValue& message) {
    auto m = GetStringMember(message, "method");
    if (!m.has_value() || m->empty()) {
        return false;
    }
    method = *m;
    if (const JSONValue* p = FindMember(message, "params")) {
        params = *p;
    }
    return true;
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpm
