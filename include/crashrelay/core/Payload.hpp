#pragma once

#include "crashrelay/protocol/Json.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace crashrelay {

struct Payload {
    std::string message;
    std::optional<std::string> stack;
    // Milliseconds since the Unix epoch.
    std::int64_t timestamp{0};
    std::optional<std::string> environment;
    std::optional<std::string> release;
    std::optional<std::string> platform;
    std::map<std::string, std::string> device_info;

    static Payload now(std::string message, std::optional<std::string> stack = std::nullopt);

    protocol::json::Value to_json() const;
    static Payload from_json(const protocol::json::Value& value);
};

// First `max_lines` lines of a stack trace, for confirmation prompts.
std::string stack_preview(const std::optional<std::string>& stack, std::size_t max_lines = 3);

}  // namespace crashrelay
