/**
 * Codeveil - Source Code Veiling Codecs
 *
 * json_parser.hpp - Small JSON reader/writer (header-only, no dependencies)
 *
 * Used for:
 *   - configuration files
 *   - rename tables (object of string -> string, insertion ordered)
 *   - payload arrays and permutation maps embedded in artifacts
 *
 * Objects keep their keys in insertion order so that a serialized table
 * lists entries in the order they were assigned.
 */

#ifndef CODEVEIL_JSON_PARSER_HPP
#define CODEVEIL_JSON_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace codeveil {

enum class JsonType {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

class JsonValue {
public:
    JsonType type = JsonType::Null;

    bool bool_value = false;
    double number_value = 0.0;
    std::string string_value;
    std::vector<JsonValue> array_value;

    // object storage, parallel vectors in insertion order
    std::vector<std::string> object_keys;
    std::vector<JsonValue> object_values;

    JsonValue() : type(JsonType::Null) {}
    JsonValue(bool v) : type(JsonType::Bool), bool_value(v) {}
    JsonValue(int v) : type(JsonType::Number), number_value(v) {}
    JsonValue(double v) : type(JsonType::Number), number_value(v) {}
    JsonValue(const std::string& v) : type(JsonType::String), string_value(v) {}
    JsonValue(const char* v) : type(JsonType::String), string_value(v) {}

    static JsonValue array() {
        JsonValue v;
        v.type = JsonType::Array;
        return v;
    }

    static JsonValue object() {
        JsonValue v;
        v.type = JsonType::Object;
        return v;
    }

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Bool; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool asBool(bool def = false) const {
        return isBool() ? bool_value : def;
    }

    double asDouble(double def = 0.0) const {
        return isNumber() ? number_value : def;
    }

    int asInt(int def = 0) const {
        return isNumber() ? static_cast<int>(number_value) : def;
    }

    std::string asString(const std::string& def = "") const {
        return isString() ? string_value : def;
    }

    size_t size() const {
        if (isArray()) return array_value.size();
        if (isObject()) return object_keys.size();
        return 0;
    }

    const JsonValue& operator[](size_t index) const {
        static const JsonValue null_value;
        if (!isArray() || index >= array_value.size()) {
            return null_value;
        }
        return array_value[index];
    }

    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue null_value;
        if (!isObject()) return null_value;
        for (size_t i = 0; i < object_keys.size(); i++) {
            if (object_keys[i] == key) return object_values[i];
        }
        return null_value;
    }

    bool has(const std::string& key) const {
        if (!isObject()) return false;
        for (const auto& k : object_keys) {
            if (k == key) return true;
        }
        return false;
    }

    // "string_conceal.name_length" style lookup
    const JsonValue& get(const std::string& path) const {
        size_t dot = path.find('.');
        if (dot == std::string::npos) {
            return (*this)[path];
        }
        return (*this)[path.substr(0, dot)].get(path.substr(dot + 1));
    }

    /**
     * Insert or overwrite a key, keeping the original position on overwrite
     */
    void set(const std::string& key, JsonValue value) {
        type = JsonType::Object;
        for (size_t i = 0; i < object_keys.size(); i++) {
            if (object_keys[i] == key) {
                object_values[i] = std::move(value);
                return;
            }
        }
        object_keys.push_back(key);
        object_values.push_back(std::move(value));
    }

    void push(JsonValue value) {
        type = JsonType::Array;
        array_value.push_back(std::move(value));
    }

    std::vector<std::string> asStringArray() const {
        std::vector<std::string> result;
        if (isArray()) {
            for (const auto& item : array_value) {
                if (item.isString()) {
                    result.push_back(item.string_value);
                }
            }
        }
        return result;
    }
};

/**
 * JSON Parser - parses JSON text into JsonValue
 *
 * Throws std::runtime_error with the byte offset on malformed input,
 * including trailing garbage after the top-level value.
 */
class JsonParser {
public:
    static JsonValue parse(const std::string& json) {
        JsonParser parser(json);
        JsonValue value = parser.parseValue();
        parser.skipWhitespace();
        if (parser.pos_ != parser.json_.size()) {
            throw std::runtime_error("Unexpected trailing data at position " +
                                     std::to_string(parser.pos_));
        }
        return value;
    }

    static JsonValue parseFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + path);
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return parse(content);
    }

private:
    std::string json_;
    size_t pos_ = 0;

    explicit JsonParser(const std::string& json) : json_(json) {}

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char get() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < json_.size() &&
               std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            pos_++;
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(what + " at position " + std::to_string(pos_));
    }

    void expect(char c) {
        skipWhitespace();
        if (get() != c) {
            fail(std::string("Expected '") + c + "'");
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        fail("Unexpected character");
    }

    uint32_t parseHex4() {
        if (pos_ + 4 > json_.size()) fail("Truncated unicode escape");
        uint32_t value = 0;
        for (int i = 0; i < 4; i++) {
            char h = json_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("Invalid unicode escape");
        }
        return value;
    }

    static void appendUtf8(std::string& out, uint32_t cp) {
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

    JsonValue parseString() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = get();

            if (c == '"') {
                return JsonValue(result);
            }

            if (c != '\\') {
                result += c;
                continue;
            }

            char escaped = get();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t cp = parseHex4();
                    // surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        json_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        uint32_t low = parseHex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            appendUtf8(result, cp);
                            cp = low;
                        }
                    }
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    fail("Invalid escape sequence");
            }
        }

        fail("Unterminated string");
    }

    JsonValue parseNumber() {
        size_t start = pos_;

        if (peek() == '-') pos_++;
        if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("Invalid number");

        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;

        if (peek() == '.') {
            pos_++;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;
        }

        try {
            return JsonValue(std::stod(json_.substr(start, pos_ - start)));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JsonValue parseBool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return JsonValue(true);
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonValue(false);
        }
        fail("Invalid boolean");
    }

    JsonValue parseNull() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return JsonValue();
        }
        fail("Invalid null");
    }

    JsonValue parseArray() {
        expect('[');
        JsonValue v = JsonValue::array();

        skipWhitespace();
        if (peek() == ']') {
            get();
            return v;
        }

        while (true) {
            v.array_value.push_back(parseValue());
            skipWhitespace();

            if (peek() == ']') {
                get();
                return v;
            }

            expect(',');
        }
    }

    JsonValue parseObject() {
        expect('{');
        JsonValue v = JsonValue::object();

        skipWhitespace();
        if (peek() == '}') {
            get();
            return v;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') fail("Object key must be a string");
            JsonValue key = parseString();

            expect(':');
            v.set(key.string_value, parseValue());

            skipWhitespace();
            if (peek() == '}') {
                get();
                return v;
            }

            expect(',');
        }
    }
};

/**
 * JSON Serializer
 *
 * Compact mode produces the same text as JavaScript's JSON.stringify(v);
 * pretty mode with indent step 2 matches JSON.stringify(v, null, 2).
 */
class JsonSerializer {
public:
    static std::string serialize(const JsonValue& value, bool pretty = true) {
        std::ostringstream oss;
        serializeValue(oss, value, pretty, 0);
        return oss.str();
    }

    static std::string compact(const JsonValue& value) {
        return serialize(value, false);
    }

    static std::string escapeString(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        result += buf;
                    } else {
                        result += c;
                    }
            }
        }
        return result;
    }

private:
    static void serializeNumber(std::ostringstream& oss, double n) {
        if (!std::isfinite(n)) {
            oss << "null";
            return;
        }
        double integral = 0.0;
        if (std::modf(n, &integral) == 0.0 && std::fabs(n) < 9007199254740992.0) {
            oss << static_cast<long long>(n);
        } else {
            std::ostringstream tmp;
            tmp << std::setprecision(17) << n;
            oss << tmp.str();
        }
    }

    static void serializeValue(std::ostringstream& oss, const JsonValue& v,
                               bool pretty, int indent) {
        switch (v.type) {
            case JsonType::Null:
                oss << "null";
                break;
            case JsonType::Bool:
                oss << (v.bool_value ? "true" : "false");
                break;
            case JsonType::Number:
                serializeNumber(oss, v.number_value);
                break;
            case JsonType::String:
                oss << '"' << escapeString(v.string_value) << '"';
                break;
            case JsonType::Array:
                serializeArray(oss, v, pretty, indent);
                break;
            case JsonType::Object:
                serializeObject(oss, v, pretty, indent);
                break;
        }
    }

    static void serializeArray(std::ostringstream& oss, const JsonValue& v,
                               bool pretty, int indent) {
        oss << '[';
        for (size_t i = 0; i < v.array_value.size(); i++) {
            if (i > 0) oss << ',';
            if (pretty) oss << '\n' << std::string(indent + 2, ' ');
            serializeValue(oss, v.array_value[i], pretty, indent + 2);
        }
        if (pretty && !v.array_value.empty()) {
            oss << '\n' << std::string(indent, ' ');
        }
        oss << ']';
    }

    static void serializeObject(std::ostringstream& oss, const JsonValue& v,
                                bool pretty, int indent) {
        oss << '{';
        for (size_t i = 0; i < v.object_keys.size(); i++) {
            if (i > 0) oss << ',';
            if (pretty) oss << '\n' << std::string(indent + 2, ' ');
            oss << '"' << escapeString(v.object_keys[i]) << "\":";
            if (pretty) oss << ' ';
            serializeValue(oss, v.object_values[i], pretty, indent + 2);
        }
        if (pretty && !v.object_keys.empty()) {
            oss << '\n' << std::string(indent, ' ');
        }
        oss << '}';
    }
};

} // namespace codeveil

#endif // CODEVEIL_JSON_PARSER_HPP
