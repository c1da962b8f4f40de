#include "crashrelay/logging/StructuredLogger.hpp"

#include "crashrelay/protocol/Json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace crashrelay::logging {

namespace json = protocol::json;

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || severity(level) < severity(min_level_)) {
        return;
    }

    auto line = json::Value::make_object();
    line.set("ts", json::Value(format_timestamp()));
    line.set("level", json::Value(level_to_string(level)));
    line.set("event", json::Value(std::string(event)));
    if (!fields.empty()) {
        auto members = json::Value::make_object();
        for (auto& [key, value] : fields) {
            members.set(std::move(key), json::Value(std::move(value)));
        }
        line.set("fields", std::move(members));
    }

    std::ostream& out = sink_ != nullptr ? *sink_ : std::clog;
    out << json::serialize(line) << '\n';
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_min_level(Level level) {
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

StructuredLogger::Level StructuredLogger::min_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return min_level_;
}

void StructuredLogger::set_sink(std::ostream* sink) {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

int StructuredLogger::severity(Level level) noexcept {
    return static_cast<int>(level);
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace crashrelay::logging
