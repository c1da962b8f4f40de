#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crashrelay {

inline const std::vector<std::string>& default_channels() {
    static const std::vector<std::string> channels{
        "wss://relay.damus.io",
        "wss://relay.primal.net",
        "wss://nos.lol",
    };
    return channels;
}

struct Config {
    std::vector<std::string> channels{default_channels()};

    std::size_t direct_size_threshold{50u * 1024u};
    std::size_t max_chunk_size{48u * 1024u};
    std::size_t compression_threshold{1024u};

    // strfry + noteguard default: 8 posts per minute.
    std::chrono::milliseconds default_rate_interval{7500};
    std::unordered_map<std::string, std::chrono::milliseconds> rate_intervals{
        {"wss://relay.damus.io", std::chrono::milliseconds(7500)},
        {"wss://relay.primal.net", std::chrono::milliseconds(7500)},
        {"wss://nos.lol", std::chrono::milliseconds(7500)},
    };

    std::chrono::milliseconds verify_delay{500};
    std::chrono::milliseconds query_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds publish_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds fanout_timeout{std::chrono::seconds(10)};
    std::size_t fanout_max_parallel{8};

    std::size_t worker_threads{1};
    bool redundant_direct_delivery{false};
    std::chrono::seconds timestamp_jitter{std::chrono::hours(48)};

    std::optional<std::string> environment{};
    std::optional<std::string> release{};

    std::chrono::milliseconds rate_interval_for(const std::string& channel) const {
        const auto it = rate_intervals.find(channel);
        return it == rate_intervals.end() ? default_rate_interval : it->second;
    }
};

}  // namespace crashrelay
