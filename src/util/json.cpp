// XMLWITNESS - JSON Values Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/util/json.h"

#include <cstdio>

namespace xmlwitness {
namespace util {

namespace {

const JSONValue kNullValue;
const std::string kEmptyString;

void WriteEscaped(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

} // anonymous namespace

// ============================================================================
// Accessors
// ============================================================================

JSONValue JSONValue::FromStrings(const std::vector<std::string>& values) {
    Array arr;
    arr.reserve(values.size());
    for (const auto& v : values) {
        arr.emplace_back(v);
    }
    return JSONValue(std::move(arr));
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    return type_ == Type::Int ? intValue_ : defaultValue;
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : kEmptyString;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return kNullValue;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? kNullValue : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        *this = JSONValue(Object{});
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return kNullValue;
    return arrayValue_[index];
}

// ============================================================================
// Serialization
// ============================================================================

void JSONValue::Write(std::string& out, bool pretty, int depth) const {
    const std::string childIndent = pretty ? std::string((depth + 1) * 2, ' ') : "";
    const std::string closeIndent = pretty ? std::string(depth * 2, ' ') : "";
    const char* separator = pretty ? ",\n" : ",";

    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += boolValue_ ? "true" : "false";
            break;
        case Type::Int:
            out += std::to_string(intValue_);
            break;
        case Type::String:
            WriteEscaped(out, stringValue_);
            break;
        case Type::Array:
            if (arrayValue_.empty()) {
                out += "[]";
                break;
            }
            out += pretty ? "[\n" : "[";
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) out += separator;
                out += childIndent;
                arrayValue_[i].Write(out, pretty, depth + 1);
            }
            out += pretty ? "\n" + closeIndent + "]" : "]";
            break;
        case Type::Object: {
            if (objectValue_.empty()) {
                out += "{}";
                break;
            }
            out += pretty ? "{\n" : "{";
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) out += separator;
                first = false;
                out += childIndent;
                WriteEscaped(out, key);
                out += pretty ? ": " : ":";
                value.Write(out, pretty, depth + 1);
            }
            out += pretty ? "\n" + closeIndent + "}" : "}";
            break;
        }
    }
}

std::string JSONValue::ToJSON(bool pretty) const {
    std::string out;
    Write(out, pretty, 0);
    return out;
}

} // namespace util
} // namespace xmlwitness
