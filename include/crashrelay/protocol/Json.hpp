#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace crashrelay::protocol::json {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    static Value make_array() {
        Value value;
        value.type = ValueType::Array;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_number() const { return type == ValueType::Integer || type == ValueType::Double; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    // Inserts or replaces a member, turning the value into an object.
    Value& set(std::string key, Value value);
    Value& push_back(Value value);

    // nullptr when the value is not an object or the key is absent.
    const Value* find(std::string_view key) const;

    const std::map<std::string, Value>& as_object() const;
    const std::vector<Value>& as_array() const;
};

struct ParseError : std::invalid_argument {
    ParseError(const std::string& message, std::size_t offset);

    std::size_t offset;
};

Value parse(std::string_view text);

// Compact form, object members in key order.
std::string serialize(const Value& value);

// Typed accessors used by the wire codecs; they throw std::invalid_argument
// naming the missing or mistyped field.
const Value& require(const Value& object, std::string_view key);
std::string require_string(const Value& object, std::string_view key);
std::int64_t require_integer(const Value& object, std::string_view key);
std::optional<std::string> optional_string(const Value& object, std::string_view key);
std::optional<std::int64_t> optional_integer(const Value& object, std::string_view key);

}  // namespace crashrelay::protocol::json
