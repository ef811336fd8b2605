// XMLWITNESS - JSON Values
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Minimal JSON document model used to emit circuit input files.

#ifndef XMLWITNESS_UTIL_JSON_H
#define XMLWITNESS_UTIL_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace xmlwitness {
namespace util {

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, string, array, object.
 * Object members are kept sorted by key.
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    /// Array of strings
    static JSONValue FromStrings(const std::vector<std::string>& values);

    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    int64_t GetInt(int64_t defaultValue = 0) const;
    const std::string& GetString() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;

    /// Serialize; pretty output indents nested containers by two spaces
    std::string ToJSON(bool pretty = false) const;

private:
    void Write(std::string& out, bool pretty, int depth) const;

    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

} // namespace util
} // namespace xmlwitness

#endif // XMLWITNESS_UTIL_JSON_H
