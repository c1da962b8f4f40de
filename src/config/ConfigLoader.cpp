#include "crashrelay/config/ConfigLoader.hpp"

#include "crashrelay/protocol/Json.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace crashrelay::config {

namespace {

namespace json = protocol::json;
using json::Value;

std::optional<std::string> get_string(const Value& root, std::string_view key) {
    const Value* node = root.find(key);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config key " + std::string(key));
}

std::optional<bool> get_bool(const Value& root, std::string_view key) {
    const Value* node = root.find(key);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config key " + std::string(key));
}

std::optional<std::int64_t> get_int64(const Value& root, std::string_view key) {
    const Value* node = root.find(key);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->type == json::ValueType::Double) {
        const double value = node->double_value;
        const double rounded = std::floor(value + 0.5);
        if (std::abs(value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config key " + std::string(key));
}

std::size_t positive_size(std::string_view key, std::int64_t value) {
    if (value <= 0) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

std::chrono::milliseconds non_negative_ms(std::string_view key, std::int64_t value) {
    if (value < 0) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be non-negative");
    }
    return std::chrono::milliseconds(value);
}

void apply_document(const Value& root, Config& config) {
    if (const Value* channels = root.find("channels"); channels && !channels->is_null()) {
        if (!channels->is_array()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected array at config key channels");
        }
        std::vector<std::string> urls;
        for (const auto& entry : channels->as_array()) {
            if (!entry.is_string()) {
                throw ConfigError("E_CONFIG_TYPE", "channels must contain only strings");
            }
            urls.push_back(entry.string_value);
        }
        config.channels = std::move(urls);
    }

    if (auto value = get_int64(root, "direct_size_threshold")) {
        config.direct_size_threshold = positive_size("direct_size_threshold", *value);
    }
    if (auto value = get_int64(root, "max_chunk_size")) {
        config.max_chunk_size = positive_size("max_chunk_size", *value);
    }
    if (auto value = get_int64(root, "compression_threshold")) {
        if (*value < 0) {
            throw ConfigError("E_CONFIG_VALUE", "compression_threshold must be non-negative");
        }
        config.compression_threshold = static_cast<std::size_t>(*value);
    }

    if (auto value = get_int64(root, "rate_limit_ms")) {
        config.default_rate_interval = non_negative_ms("rate_limit_ms", *value);
    }
    if (const Value* limits = root.find("rate_limits"); limits && !limits->is_null()) {
        if (!limits->is_object()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected object at config key rate_limits",
                              "Map each channel URL to an interval in milliseconds");
        }
        for (const auto& [url, entry] : limits->as_object()) {
            if (!entry.is_integer()) {
                throw ConfigError("E_CONFIG_TYPE", "rate_limits." + url + " must be an integer");
            }
            config.rate_intervals[url] = non_negative_ms("rate_limits." + url, entry.integer_value);
        }
    }

    if (auto value = get_int64(root, "verify_delay_ms")) {
        config.verify_delay = non_negative_ms("verify_delay_ms", *value);
    }
    if (auto value = get_int64(root, "query_timeout_ms")) {
        config.query_timeout = non_negative_ms("query_timeout_ms", *value);
    }
    if (auto value = get_int64(root, "publish_timeout_ms")) {
        config.publish_timeout = non_negative_ms("publish_timeout_ms", *value);
    }
    if (auto value = get_int64(root, "fanout_timeout_ms")) {
        config.fanout_timeout = non_negative_ms("fanout_timeout_ms", *value);
    }
    if (auto value = get_int64(root, "fanout_max_parallel")) {
        config.fanout_max_parallel = positive_size("fanout_max_parallel", *value);
    }
    if (auto value = get_int64(root, "worker_threads")) {
        config.worker_threads = positive_size("worker_threads", *value);
    }
    if (auto value = get_bool(root, "redundant_direct_delivery")) {
        config.redundant_direct_delivery = *value;
    }
    if (auto value = get_string(root, "environment")) {
        config.environment = *value;
    }
    if (auto value = get_string(root, "release")) {
        config.release = *value;
    }
}

}  // namespace

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    if (!code.empty()) {
        formatted = "[" + code + "] " + message;
    } else {
        formatted = message;
    }
}

Config load_config_file(const std::filesystem::path& path, Config base) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str(), std::move(base));
}

Config parse_config(std::string_view text, Config base) {
    Value document;
    try {
        document = json::parse(text);
    } catch (const json::ParseError& ex) {
        throw ConfigError("E_CONFIG_PARSE", ex.what());
    }
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }

    apply_document(document, base);
    validate_config(base);
    return base;
}

void validate_config(const Config& config) {
    if (config.channels.empty()) {
        throw ConfigError("E_CONFIG_VALUE", "At least one channel is required",
                          "Add relay URLs to the channels array");
    }
    for (const auto& channel : config.channels) {
        if (channel.empty()) {
            throw ConfigError("E_CONFIG_VALUE", "Channel URLs must not be empty");
        }
    }
    if (config.direct_size_threshold == 0) {
        throw ConfigError("E_CONFIG_VALUE", "direct_size_threshold must be positive");
    }
    if (config.max_chunk_size == 0) {
        throw ConfigError("E_CONFIG_VALUE", "max_chunk_size must be positive");
    }
    if (config.worker_threads == 0) {
        throw ConfigError("E_CONFIG_VALUE", "worker_threads must be positive");
    }
    if (config.fanout_max_parallel == 0) {
        throw ConfigError("E_CONFIG_VALUE", "fanout_max_parallel must be positive");
    }
}

std::string describe_config(const Config& config) {
    auto document = Value::make_object();

    auto channels = Value::make_array();
    for (const auto& channel : config.channels) {
        channels.push_back(Value(channel));
    }
    document.set("channels", std::move(channels));

    const auto integer = [](auto value) { return Value(static_cast<std::int64_t>(value)); };
    document.set("direct_size_threshold", integer(config.direct_size_threshold));
    document.set("max_chunk_size", integer(config.max_chunk_size));
    document.set("compression_threshold", integer(config.compression_threshold));
    document.set("rate_limit_ms", integer(config.default_rate_interval.count()));

    auto limits = Value::make_object();
    for (const auto& [url, interval] : config.rate_intervals) {
        limits.set(url, integer(interval.count()));
    }
    document.set("rate_limits", std::move(limits));

    document.set("verify_delay_ms", integer(config.verify_delay.count()));
    document.set("query_timeout_ms", integer(config.query_timeout.count()));
    document.set("publish_timeout_ms", integer(config.publish_timeout.count()));
    document.set("fanout_timeout_ms", integer(config.fanout_timeout.count()));
    document.set("fanout_max_parallel", integer(config.fanout_max_parallel));
    document.set("worker_threads", integer(config.worker_threads));
    document.set("redundant_direct_delivery", Value(config.redundant_direct_delivery));
    if (config.environment) {
        document.set("environment", Value(*config.environment));
    }
    if (config.release) {
        document.set("release", Value(*config.release));
    }
    return json::serialize(document);
}

}  // namespace crashrelay::config
