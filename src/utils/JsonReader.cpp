/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string_view>

namespace Delve {

namespace {

const JsonValue& nullValue() {
    static const JsonValue value;
    return value;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

// Single pass recursive descent over the raw text. The first failure
// records its position and every caller unwinds with false.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view text) : m_text(text) {}

    bool parseDocument(JsonValue& out) {
        if (!parseValue(out, 0)) {
            return false;
        }
        skipWhitespace();
        if (!atEnd()) {
            return fail("unexpected content after the document");
        }
        return true;
    }

    const std::string& error() const { return m_error; }

private:
    bool parseValue(JsonValue& out, int depth) {
        skipWhitespace();
        switch (peek()) {
        case '{':
            return parseObject(out, depth + 1);
        case '[':
            return parseArray(out, depth + 1);
        case '"': {
            std::string text;
            if (!parseString(text)) {
                return false;
            }
            out = JsonValue(std::move(text));
            return true;
        }
        case 't':
            return parseLiteral("true", JsonValue(true), out);
        case 'f':
            return parseLiteral("false", JsonValue(false), out);
        case 'n':
            return parseLiteral("null", JsonValue(), out);
        default:
            break;
        }

        if (peek() == '-' || isDigit(peek())) {
            return parseNumber(out);
        }
        if (atEnd()) {
            return fail("unexpected end of input");
        }
        return fail(std::string("unexpected character '") + peek() + "'");
    }

    bool parseObject(JsonValue& out, int depth) {
        if (!checkDepth(depth)) {
            return false;
        }
        ++m_pos;
        JsonObject members;

        skipWhitespace();
        if (!consume('}')) {
            while (true) {
                skipWhitespace();
                if (peek() != '"') {
                    return fail("expected a quoted key");
                }
                std::string key;
                if (!parseString(key)) {
                    return false;
                }
                skipWhitespace();
                if (!consume(':')) {
                    return fail("expected ':' after key \"" + key + "\"");
                }
                JsonValue member;
                if (!parseValue(member, depth)) {
                    return false;
                }
                // Repeated keys: the last one wins
                members.insert_or_assign(std::move(key), std::move(member));

                skipWhitespace();
                if (consume(',')) {
                    continue;
                }
                if (consume('}')) {
                    break;
                }
                return fail("expected ',' or '}' in object");
            }
        }

        out = JsonValue(std::move(members));
        return true;
    }

    bool parseArray(JsonValue& out, int depth) {
        if (!checkDepth(depth)) {
            return false;
        }
        ++m_pos;
        JsonArray elements;

        skipWhitespace();
        if (!consume(']')) {
            while (true) {
                JsonValue element;
                if (!parseValue(element, depth)) {
                    return false;
                }
                elements.push_back(std::move(element));

                skipWhitespace();
                if (consume(',')) {
                    continue;
                }
                if (consume(']')) {
                    break;
                }
                return fail("expected ',' or ']' in array");
            }
        }

        out = JsonValue(std::move(elements));
        return true;
    }

    bool checkDepth(int depth) {
        if (depth > JsonReader::MAX_DEPTH) {
            return fail("nesting deeper than " + std::to_string(JsonReader::MAX_DEPTH) + " levels");
        }
        return true;
    }

    bool parseString(std::string& out) {
        ++m_pos;
        while (true) {
            if (atEnd()) {
                return fail("unterminated string");
            }
            const char c = m_text[m_pos++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --m_pos;
                return fail("raw control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }

            if (atEnd()) {
                return fail("unterminated escape sequence");
            }
            const char escape = m_text[m_pos++];
            switch (escape) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u':
                if (!parseUnicodeEscape(out)) {
                    return false;
                }
                break;
            default:
                --m_pos;
                return fail(std::string("invalid escape '\\") + escape + "'");
            }
        }
    }

    bool readHex4(uint32_t& out) {
        if (m_text.size() - m_pos < 4) {
            return fail("truncated \\u escape");
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            const int digit = hexValue(m_text[m_pos]);
            if (digit < 0) {
                return fail("invalid hex digit in \\u escape");
            }
            out = (out << 4) | static_cast<uint32_t>(digit);
            ++m_pos;
        }
        return true;
    }

    bool parseUnicodeEscape(std::string& out) {
        uint32_t codepoint = 0;
        if (!readHex4(codepoint)) {
            return false;
        }

        if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
            return fail("unpaired low surrogate");
        }
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
            if (m_text.substr(m_pos, 2) != "\\u") {
                return fail("high surrogate without a low surrogate");
            }
            m_pos += 2;
            uint32_t low = 0;
            if (!readHex4(low)) {
                return false;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
                return fail("high surrogate without a low surrogate");
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        }

        appendUtf8(out, codepoint);
        return true;
    }

    bool parseNumber(JsonValue& out) {
        const size_t start = m_pos;

        consume('-');
        if (consume('0')) {
            // No leading zeros
        } else if (isDigit(peek())) {
            skipDigits();
        } else {
            return fail("expected a digit");
        }

        if (consume('.')) {
            if (!isDigit(peek())) {
                return fail("expected a digit after '.'");
            }
            skipDigits();
        }

        if (peek() == 'e' || peek() == 'E') {
            ++m_pos;
            if (peek() == '+' || peek() == '-') {
                ++m_pos;
            }
            if (!isDigit(peek())) {
                return fail("expected a digit in exponent");
            }
            skipDigits();
        }

        double value = 0.0;
        const char* first = m_text.data() + start;
        const char* last = m_text.data() + m_pos;
        const auto [end, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || end != last) {
            m_pos = start;
            return fail("number out of range");
        }

        out = JsonValue(value);
        return true;
    }

    bool parseLiteral(std::string_view word, JsonValue value, JsonValue& out) {
        if (m_text.substr(m_pos, word.size()) != word) {
            return fail("invalid literal");
        }
        m_pos += word.size();
        out = std::move(value);
        return true;
    }

    void skipWhitespace() {
        while (!atEnd()) {
            const char c = m_text[m_pos];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                return;
            }
            ++m_pos;
        }
    }

    void skipDigits() {
        while (isDigit(peek())) {
            ++m_pos;
        }
    }

    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

    bool consume(char expected) {
        if (peek() != expected || atEnd()) {
            return false;
        }
        ++m_pos;
        return true;
    }

    bool fail(const std::string& message) {
        size_t line = 1;
        size_t column = 1;
        for (size_t i = 0; i < m_pos && i < m_text.size(); ++i) {
            if (m_text[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        m_error = "line " + std::to_string(line) + ", column " + std::to_string(column) +
                  ": " + message;
        return false;
    }

    std::string_view m_text;
    size_t m_pos{0};
    std::string m_error;
};

void writeQuoted(std::string& out, const std::string& text) {
    static constexpr char HEX[] = "0123456789abcdef";

    out += '"';
    for (const char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out += HEX[(c >> 4) & 0xF];
                out += HEX[c & 0xF];
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

// Shortest text that parses back to the same double, so floats widened
// to double restore exactly
void writeNumber(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buffer[32];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    out.append(buffer, result.ptr);
}

void breakLine(std::string& out, int indent, int depth) {
    if (indent > 0) {
        out += '\n';
        out.append(static_cast<size_t>(indent * depth), ' ');
    }
}

void writeValue(std::string& out, const JsonValue& value, int indent, int depth) {
    if (value.isNull()) {
        out += "null";
    } else if (value.isBool()) {
        out += value.asBool() ? "true" : "false";
    } else if (value.isNumber()) {
        writeNumber(out, value.asNumber());
    } else if (value.isString()) {
        writeQuoted(out, value.asString());
    } else if (value.isArray()) {
        const JsonArray& elements = value.asArray();
        out += '[';
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            breakLine(out, indent, depth + 1);
            writeValue(out, elements[i], indent, depth + 1);
        }
        if (!elements.empty()) {
            breakLine(out, indent, depth);
        }
        out += ']';
    } else {
        const JsonObject& members = value.asObject();
        out += '{';
        bool first = true;
        for (const auto& [key, member] : members) {
            if (!first) {
                out += ',';
            }
            first = false;
            breakLine(out, indent, depth + 1);
            writeQuoted(out, key);
            out += indent > 0 ? ": " : ":";
            writeValue(out, member, indent, depth + 1);
        }
        if (!members.empty()) {
            breakLine(out, indent, depth);
        }
        out += '}';
    }
}

} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
    return isBool() ? std::optional<bool>(asBool()) : std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
    return isNumber() ? std::optional<double>(asNumber()) : std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
    return isNumber() ? std::optional<int>(asInt()) : std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
    return isString() ? std::optional<std::string>(asString()) : std::nullopt;
}

const JsonArray* JsonValue::tryAsArray() const {
    return std::get_if<JsonArray>(&m_data);
}

const JsonObject* JsonValue::tryAsObject() const {
    return std::get_if<JsonObject>(&m_data);
}

bool JsonValue::hasKey(const std::string& key) const {
    const JsonObject* members = tryAsObject();
    return members != nullptr && members->count(key) > 0;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (const JsonObject* members = tryAsObject()) {
        const auto it = members->find(key);
        if (it != members->end()) {
            return it->second;
        }
    }
    return nullValue();
}

const JsonValue& JsonValue::operator[](size_t index) const {
    const JsonArray* elements = tryAsArray();
    if (elements == nullptr || index >= elements->size()) {
        return nullValue();
    }
    return (*elements)[index];
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (!isObject()) {
        m_data = JsonObject{};
    }
    return asObject()[key];
}

JsonValue& JsonValue::operator[](size_t index) {
    if (!isArray()) {
        m_data = JsonArray{};
    }
    JsonArray& elements = asArray();
    if (index >= elements.size()) {
        elements.resize(index + 1);
    }
    return elements[index];
}

size_t JsonValue::size() const {
    if (const JsonArray* elements = tryAsArray()) {
        return elements->size();
    }
    if (const JsonObject* members = tryAsObject()) {
        return members->size();
    }
    return 0;
}

std::string JsonValue::toString() const {
    std::string out;
    writeValue(out, *this, 0, 0);
    return out;
}

std::string JsonValue::toPrettyString() const {
    std::string out;
    writeValue(out, *this, 2, 0);
    return out;
}

bool JsonReader::parse(const std::string& text) {
    JsonCursor cursor(text);
    JsonValue root;
    if (!cursor.parseDocument(root)) {
        m_lastError = cursor.error();
        return false;
    }
    m_root = std::move(root);
    m_lastError.clear();
    return true;
}

bool JsonReader::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        m_lastError = "cannot open " + path;
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        m_lastError = "read error in " + path;
        return false;
    }

    if (!parse(contents.str())) {
        m_lastError = path + ": " + m_lastError;
        return false;
    }
    return true;
}

} // namespace Delve
