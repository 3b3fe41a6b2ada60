/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Delve {

class JsonValue;

// std::map keeps keys sorted, so saves and settings diff cleanly
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

/**
 * One JSON document node. Numbers are held as double; every integer the
 * simulation stores (ticks, ids, counts) fits in 53 bits.
 */
class JsonValue {
public:
    JsonValue() = default;
    explicit JsonValue(std::nullptr_t) {}
    explicit JsonValue(bool value) : m_data(value) {}
    explicit JsonValue(int value) : m_data(static_cast<double>(value)) {}
    explicit JsonValue(uint64_t value) : m_data(static_cast<double>(value)) {}
    explicit JsonValue(double value) : m_data(value) {}
    explicit JsonValue(const char* value) : m_data(std::string(value)) {}
    explicit JsonValue(std::string value) : m_data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : m_data(std::move(value)) {}
    explicit JsonValue(JsonObject value) : m_data(std::move(value)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(m_data); }
    bool isBool() const { return std::holds_alternative<bool>(m_data); }
    bool isNumber() const { return std::holds_alternative<double>(m_data); }
    bool isString() const { return std::holds_alternative<std::string>(m_data); }
    bool isArray() const { return std::holds_alternative<JsonArray>(m_data); }
    bool isObject() const { return std::holds_alternative<JsonObject>(m_data); }

    // Checked accessors, std::bad_variant_access on a type mismatch
    bool asBool() const { return std::get<bool>(m_data); }
    double asNumber() const { return std::get<double>(m_data); }
    int asInt() const { return static_cast<int>(asNumber()); }
    uint64_t asUInt64() const { return static_cast<uint64_t>(asNumber()); }
    const std::string& asString() const { return std::get<std::string>(m_data); }
    const JsonArray& asArray() const { return std::get<JsonArray>(m_data); }
    const JsonObject& asObject() const { return std::get<JsonObject>(m_data); }
    JsonArray& asArray() { return std::get<JsonArray>(m_data); }
    JsonObject& asObject() { return std::get<JsonObject>(m_data); }

    // Lenient accessors for optional settings
    std::optional<bool> tryAsBool() const;
    std::optional<double> tryAsNumber() const;
    std::optional<int> tryAsInt() const;
    std::optional<std::string> tryAsString() const;
    const JsonArray* tryAsArray() const;
    const JsonObject* tryAsObject() const;

    bool hasKey(const std::string& key) const;

    /**
     * Read access never fails: a missing key, an index past the end or a
     * lookup on the wrong type yields a shared null value, so chains like
     * root["idle"]["weights"]["rest"] can be read without checks.
     */
    const JsonValue& operator[](const std::string& key) const;
    const JsonValue& operator[](size_t index) const;

    // Write access turns this value into an object/array as needed
    JsonValue& operator[](const std::string& key);
    JsonValue& operator[](size_t index);

    // Element count of an array or object, 0 for scalars
    size_t size() const;

    std::string toString() const;
    std::string toPrettyString() const;

    bool operator==(const JsonValue& other) const { return m_data == other.m_data; }

private:
    std::variant<std::monostate, bool, double, std::string, JsonArray, JsonObject> m_data;
};

/**
 * Parses a complete JSON document from text or a file. A failed parse
 * leaves the previous root in place and describes the failure, with line
 * and column, in getLastError().
 */
class JsonReader {
public:
    // Deeper documents are rejected instead of exhausting the stack
    static constexpr int MAX_DEPTH = 128;

    bool loadFromFile(const std::string& path);
    bool parse(const std::string& text);

    const JsonValue& getRoot() const { return m_root; }
    const std::string& getLastError() const { return m_lastError; }

private:
    JsonValue m_root;
    std::string m_lastError;
};

} // namespace Delve

#endif // JSONREADER_HPP
