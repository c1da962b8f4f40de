#include "crashrelay/protocol/Json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace crashrelay::protocol::json {

namespace {

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value parse_document() {
        skip_whitespace();
        Value value = parse_value(0);
        skip_whitespace();
        if (!at_end()) {
            fail("Unexpected trailing content in JSON");
        }
        return value;
    }

private:
    static constexpr int kMaxDepth = 64;

    std::string_view text_;
    std::size_t position_{0};

    [[noreturn]] void fail(const std::string& message) const { throw ParseError(message, position_); }

    bool at_end() const { return position_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[position_]; }

    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end()) {
            const char ch = peek();
            if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
                ++position_;
            } else {
                break;
            }
        }
    }

    Value parse_value(int depth) {
        if (depth > kMaxDepth) {
            fail("JSON nesting too deep");
        }
        skip_whitespace();
        if (at_end()) {
            fail("Unexpected end of JSON while parsing value");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object(depth);
        }
        if (ch == '[') {
            return parse_array(depth);
        }
        if (ch == '"') {
            return Value(parse_string());
        }
        if (ch == 't' || ch == 'f') {
            return Value(parse_boolean());
        }
        if (ch == 'n') {
            parse_literal("null");
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        fail("Unexpected token in JSON value");
    }

    Value parse_object(int depth) {
        Value object = Value::make_object();
        get();  // consume '{'
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key in JSON object");
            }

            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                fail("Expected ':' after key in JSON object");
            }

            object.object_value.insert_or_assign(std::move(key), parse_value(depth + 1));

            skip_whitespace();
            if (at_end()) {
                fail("Unexpected end of JSON while parsing object");
            }
            const char ch = get();
            if (ch == '}') {
                break;
            }
            if (ch != ',') {
                fail("Expected ',' or '}' in JSON object");
            }
        }
        return object;
    }

    Value parse_array(int depth) {
        Value array = Value::make_array();
        get();  // consume '['
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }

        while (true) {
            array.array_value.push_back(parse_value(depth + 1));
            skip_whitespace();
            if (at_end()) {
                fail("Unexpected end of JSON while parsing array");
            }
            const char ch = get();
            if (ch == ']') {
                break;
            }
            if (ch != ',') {
                fail("Expected ',' or ']' in JSON array");
            }
        }
        return array;
    }

    std::string parse_string() {
        if (get() != '"') {
            fail("Expected opening quote for JSON string");
        }

        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }

            if (ch == '\\') {
                if (at_end()) {
                    fail("Incomplete escape sequence in JSON string");
                }

                const char esc = get();
                switch (esc) {
                case '"':
                case '\\':
                case '/':
                    result.push_back(esc);
                    break;
                case 'b':
                    result.push_back('\b');
                    break;
                case 'f':
                    result.push_back('\f');
                    break;
                case 'n':
                    result.push_back('\n');
                    break;
                case 'r':
                    result.push_back('\r');
                    break;
                case 't':
                    result.push_back('\t');
                    break;
                case 'u':
                    append_utf8(result, parse_unicode_escape());
                    break;
                default:
                    fail("Unsupported escape sequence in JSON string");
                }
            } else {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    fail("Control characters must be escaped in JSON strings");
                }
                result.push_back(ch);
            }
        }

        fail("Unterminated JSON string literal");
    }

    unsigned int parse_hex4() {
        if (position_ + 4 > text_.size()) {
            fail("Incomplete unicode escape in JSON string");
        }
        unsigned int code_unit = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[position_++];
            code_unit <<= 4;
            if (ch >= '0' && ch <= '9') {
                code_unit += static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                code_unit += 10u + static_cast<unsigned int>(ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                code_unit += 10u + static_cast<unsigned int>(ch - 'A');
            } else {
                fail("Invalid hex digit in unicode escape");
            }
        }
        return code_unit;
    }

    // Stack traces routinely carry non-BMP text once escaped by other SDKs,
    // so surrogate pairs are joined here.
    unsigned int parse_unicode_escape() {
        const unsigned int high = parse_hex4();
        if (high < 0xD800 || high > 0xDBFF) {
            if (high >= 0xDC00 && high <= 0xDFFF) {
                fail("Unpaired low surrogate in JSON string");
            }
            return high;
        }
        if (get() != '\\' || get() != 'u') {
            fail("Unpaired high surrogate in JSON string");
        }
        const unsigned int low = parse_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid low surrogate in JSON string");
        }
        return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
    }

    static void append_utf8(std::string& out, unsigned int code_point) {
        if (code_point <= 0x7F) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    Value parse_number() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        bool is_fractional = false;
        if (peek() == '.') {
            is_fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            is_fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }

        const std::string token(text_.substr(start, position_ - start));
        if (is_fractional) {
            char* end = nullptr;
            const double value = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size() || !std::isfinite(value)) {
                fail("Invalid floating point number in JSON");
            }
            return Value(value);
        }

        std::int64_t int_value{};
        const auto result = std::from_chars(token.data(), token.data() + token.size(), int_value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            fail("Invalid integer number in JSON");
        }
        return Value(int_value);
    }

    bool parse_boolean() {
        if (text_.substr(position_, 4) == "true") {
            position_ += 4;
            return true;
        }
        parse_literal("false");
        return false;
    }

    void parse_literal(std::string_view literal) {
        if (text_.substr(position_, literal.size()) != literal) {
            fail("Invalid literal in JSON");
        }
        position_ += literal.size();
    }
};

// Length of the well-formed UTF-8 sequence starting at `index`, or 0 when the
// bytes there are invalid, overlong, a surrogate or truncated.
std::size_t utf8_sequence_length(std::string_view value, std::size_t index) {
    const auto byte_at = [&](std::size_t i) { return static_cast<unsigned char>(value[i]); };
    const unsigned char lead = byte_at(index);
    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            low = 0xA0;
        } else if (lead == 0xED) {
            high = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            low = 0x90;
        } else if (lead == 0xF4) {
            high = 0x8F;
        }
    } else {
        return 0;
    }
    if (index + length > value.size()) {
        return 0;
    }
    const unsigned char second = byte_at(index + 1);
    if (second < low || second > high) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        const unsigned char next = byte_at(index + i);
        if (next < 0x80 || next > 0xBF) {
            return 0;
        }
    }
    return length;
}

void write_string(std::string& out, std::string_view value) {
    out.push_back('"');
    for (std::size_t index = 0; index < value.size(); ++index) {
        const char ch = value[index];
        switch (ch) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buffer[7];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                out += buffer;
            } else if (static_cast<unsigned char>(ch) < 0x80) {
                out.push_back(ch);
            } else if (const auto length = utf8_sequence_length(value, index); length != 0) {
                out.append(value.substr(index, length));
                index += length - 1;
            } else {
                // Invalid byte: emit U+FFFD and resynchronise on the next byte.
                out += "\\ufffd";
            }
            break;
        }
    }
    out.push_back('"');
}

void write_value(std::string& out, const Value& value) {
    switch (value.type) {
    case ValueType::Null:
        out += "null";
        break;
    case ValueType::Boolean:
        out += value.boolean_value ? "true" : "false";
        break;
    case ValueType::Integer:
        out += std::to_string(value.integer_value);
        break;
    case ValueType::Double: {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.17g", value.double_value);
        out += buffer;
        break;
    }
    case ValueType::String:
        write_string(out, value.string_value);
        break;
    case ValueType::Object: {
        out.push_back('{');
        bool first = true;
        for (const auto& [key, member] : value.object_value) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            write_string(out, key);
            out.push_back(':');
            write_value(out, member);
        }
        out.push_back('}');
        break;
    }
    case ValueType::Array: {
        out.push_back('[');
        bool first = true;
        for (const auto& element : value.array_value) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            write_value(out, element);
        }
        out.push_back(']');
        break;
    }
    }
}

}  // namespace

Value& Value::set(std::string key, Value value) {
    if (type != ValueType::Object) {
        *this = make_object();
    }
    object_value.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

Value& Value::push_back(Value value) {
    if (type != ValueType::Array) {
        *this = make_array();
    }
    array_value.push_back(std::move(value));
    return *this;
}

const Value* Value::find(std::string_view key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

ParseError::ParseError(const std::string& message, std::size_t offset)
    : std::invalid_argument(message + " at offset " + std::to_string(offset)), offset(offset) {}

Value parse(std::string_view text) {
    return Parser(text).parse_document();
}

std::string serialize(const Value& value) {
    std::string out;
    write_value(out, value);
    return out;
}

const Value& require(const Value& object, std::string_view key) {
    if (!object.is_object()) {
        throw std::invalid_argument("expected JSON object");
    }
    const auto* member = object.find(key);
    if (!member) {
        throw std::invalid_argument("missing field '" + std::string(key) + "'");
    }
    return *member;
}

std::string require_string(const Value& object, std::string_view key) {
    const auto& member = require(object, key);
    if (!member.is_string()) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be a string");
    }
    return member.string_value;
}

std::int64_t require_integer(const Value& object, std::string_view key) {
    const auto& member = require(object, key);
    if (!member.is_integer()) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be an integer");
    }
    return member.integer_value;
}

std::optional<std::string> optional_string(const Value& object, std::string_view key) {
    const auto* member = object.find(key);
    if (!member || member->is_null()) {
        return std::nullopt;
    }
    if (!member->is_string()) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be a string");
    }
    return member->string_value;
}

std::optional<std::int64_t> optional_integer(const Value& object, std::string_view key) {
    const auto* member = object.find(key);
    if (!member || member->is_null()) {
        return std::nullopt;
    }
    if (!member->is_integer()) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be an integer");
    }
    return member->integer_value;
}

}  // namespace crashrelay::protocol::json
