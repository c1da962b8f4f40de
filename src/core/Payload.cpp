#include "crashrelay/core/Payload.hpp"

#include <chrono>
#include <stdexcept>

namespace crashrelay {

namespace json = protocol::json;

Payload Payload::now(std::string message, std::optional<std::string> stack) {
    Payload payload;
    payload.message = message.empty() ? "Unknown error" : std::move(message);
    payload.stack = std::move(stack);
    payload.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
#if defined(_WIN32)
    payload.platform = "windows";
#elif defined(__APPLE__)
    payload.platform = "macos";
#elif defined(__linux__)
    payload.platform = "linux";
#endif
    return payload;
}

json::Value Payload::to_json() const {
    auto object = json::Value::make_object();
    object.set("message", json::Value(message));
    object.set("timestamp", json::Value(static_cast<std::int64_t>(timestamp)));
    if (stack) {
        object.set("stack", json::Value(*stack));
    }
    if (environment) {
        object.set("environment", json::Value(*environment));
    }
    if (release) {
        object.set("release", json::Value(*release));
    }
    if (platform) {
        object.set("platform", json::Value(*platform));
    }
    if (!device_info.empty()) {
        auto device = json::Value::make_object();
        for (const auto& [key, value] : device_info) {
            device.set(key, json::Value(value));
        }
        object.set("deviceInfo", std::move(device));
    }
    return object;
}

Payload Payload::from_json(const json::Value& value) {
    Payload payload;
    payload.message = json::require_string(value, "message");
    payload.timestamp = json::require_integer(value, "timestamp");
    payload.stack = json::optional_string(value, "stack");
    payload.environment = json::optional_string(value, "environment");
    payload.release = json::optional_string(value, "release");
    payload.platform = json::optional_string(value, "platform");
    if (const auto* device = value.find("deviceInfo"); device && !device->is_null()) {
        if (!device->is_object()) {
            throw std::invalid_argument("field 'deviceInfo' must be an object");
        }
        for (const auto& [key, entry] : device->as_object()) {
            if (entry.is_string()) {
                payload.device_info.emplace(key, entry.string_value);
            } else {
                payload.device_info.emplace(key, json::serialize(entry));
            }
        }
    }
    return payload;
}

std::string stack_preview(const std::optional<std::string>& stack, std::size_t max_lines) {
    if (!stack || max_lines == 0) {
        return {};
    }
    std::size_t position = 0;
    std::size_t lines = 0;
    while (lines < max_lines) {
        const auto newline = stack->find('\n', position);
        if (newline == std::string::npos) {
            return *stack;
        }
        ++lines;
        position = newline + 1;
    }
    return stack->substr(0, position - 1);
}

}  // namespace crashrelay
